#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file png_crc.h
 * \brief CRC-32 used to authenticate PNG chunks.
 *
 * ISO-HDLC CRC-32 (reflected polynomial 0xEDB88320, initial value 0xFFFFFFFF,
 * final complement), computed with zlib's `crc32`.
 */

namespace pngstash {

/// CRC of the empty input. Use as the seed for \ref png_crc_update.
static constexpr uint32_t kPngCrcInit = 0;

/**
 * \brief Continues a running CRC over \p bytes.
 *
 * Conditioning is applied inside each call, so
 * `png_crc_update(png_crc_update(kPngCrcInit, a), b)` equals the CRC of `a ++ b`.
 */
uint32_t
png_crc_update(uint32_t crc, std::span<const std::byte> bytes) noexcept;

/// CRC over the 4 raw type bytes followed by \p data. The length field is not covered.
uint32_t
png_chunk_crc(std::span<const std::byte, 4> type_bytes,
              std::span<const std::byte> data) noexcept;

/// Same as above with the type given as a big-endian FourCC.
uint32_t
png_chunk_crc(uint32_t type, std::span<const std::byte> data) noexcept;

}  // namespace pngstash
