#include "pngstash/png_status.h"

namespace pngstash {

const char*
png_status_name(PngStatus status) noexcept
{
    switch (status) {
    case PngStatus::Ok: return "ok";
    case PngStatus::OutputTruncated: return "output_truncated";
    case PngStatus::IoError: return "io_error";
    case PngStatus::FormatError: return "format_error";
    case PngStatus::CrcMismatch: return "crc_mismatch";
    case PngStatus::MarkerNotFound: return "marker_not_found";
    case PngStatus::EmbedWithoutAnchor: return "embed_without_anchor";
    case PngStatus::InvalidChunkType: return "invalid_chunk_type";
    case PngStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace pngstash
