#pragma once

#include "pngstash/byte_reader.h"
#include "pngstash/png_status.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file png_signature.h
 * \brief PNG file signature constant, reader and validator.
 */

namespace pngstash {

static constexpr uint32_t kPngSignatureSize = 8;

/// `\x89PNG\r\n\x1A\n`: high-bit byte, text marker, CRLF, EOF and LF sentinels.
static constexpr std::array<std::byte, kPngSignatureSize> kPngSignature = {
    std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
    std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
    std::byte { 0x1A }, std::byte { 0x0A },
};

/// Reads the 8 signature bytes from \p reader. Returns \ref PngStatus::IoError on a short read.
PngStatus
read_png_signature(ByteReader& reader,
                   std::array<std::byte, kPngSignatureSize>* out) noexcept;

/**
 * \brief Returns true only when \p bytes is exactly the 8-byte PNG signature.
 *
 * Every byte position is compared; a span of any other length is rejected.
 */
bool
validate_png_signature(std::span<const std::byte> bytes) noexcept;

}  // namespace pngstash
