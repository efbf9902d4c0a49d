#pragma once

#include <cstdint>

/**
 * \file png_status.h
 * \brief Status codes shared by the PNG codec and payload operations.
 */

namespace pngstash {

/// Result status for every pngstash operation.
enum class PngStatus : uint8_t {
    Ok,
    /// Output buffer was too small; the result's `needed` reports required size.
    OutputTruncated,
    /// The input ended before a field could be read, or the output sink is unusable.
    IoError,
    /// Signature mismatch, missing terminal chunk or an impossible field value.
    FormatError,
    /// A chunk's stored CRC does not match its type+data (strict decode only).
    CrcMismatch,
    /// No payload chunk was found where the lookup strategy expected one.
    MarkerNotFound,
    /// Embedding needs an image with a recorded insertion point.
    EmbedWithoutAnchor,
    /// The requested chunk type is not a valid ancillary PNG chunk type.
    InvalidChunkType,
    /// Resource limits were exceeded.
    LimitExceeded,
};

/// Returns a stable snake_case name for \p status (e.g. "crc_mismatch").
const char*
png_status_name(PngStatus status) noexcept;

}  // namespace pngstash
