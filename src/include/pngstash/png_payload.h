#pragma once

#include "pngstash/png_chunk.h"
#include "pngstash/png_status.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file png_payload.h
 * \brief Embeds an opaque payload as an ancillary chunk and recovers it.
 */

namespace pngstash {

/**
 * \brief Builds a payload chunk of type \p type around a copy of \p payload.
 *
 * `length` and `crc` are computed from \p payload. \p type must be a valid
 * ancillary chunk type (\ref PngStatus::InvalidChunkType otherwise); payloads
 * longer than \ref kPngMaxChunkLength are \ref PngStatus::LimitExceeded.
 */
PngStatus
build_payload_chunk(std::span<const std::byte> payload, uint32_t type,
                    PngChunk* out) noexcept;

/// Options for \ref embed_payload.
struct PngEmbedOptions final {
    uint32_t chunk_type = kPngStashChunkType;
};

struct PngEmbedResult final {
    PngStatus status = PngStatus::Ok;
    /// Index of the inserted payload chunk.
    uint32_t chunk_index = 0;
};

/**
 * \brief Inserts a payload chunk right before the terminal `IEND` chunk.
 *
 * The resulting sequence is every chunk up to and including the insertion
 * point, the payload chunk, then `IEND`. Chunks that followed `IEND` are
 * dropped. On success the insertion point names the new payload chunk.
 *
 * Existing payload chunks are kept; call \ref remove_payload_chunks first to
 * replace rather than stack them.
 *
 * Fails with \ref PngStatus::EmbedWithoutAnchor when \p image has no
 * insertion point or the chunk after it is not `IEND`.
 */
PngEmbedResult
embed_payload(PngImage* image, std::span<const std::byte> payload,
              const PngEmbedOptions& options) noexcept;

/// How \ref extract_payload locates the payload chunk.
enum class PayloadLookup : uint8_t {
    /// Only the chunk at \ref PngImage::insertion_index.
    Index,
    /// The last chunk carrying the payload type.
    Scan,
    /// \ref Index first, \ref Scan when the indexed chunk does not match.
    IndexThenScan,
};

/// Options for \ref extract_payload.
struct PngExtractOptions final {
    uint32_t chunk_type  = kPngStashChunkType;
    PayloadLookup lookup = PayloadLookup::IndexThenScan;
};

struct PngExtractResult final {
    PngStatus status     = PngStatus::Ok;
    uint32_t chunk_index = 0;
    uint64_t written     = 0;
    uint64_t needed      = 0;
};

/// Locates the payload chunk. Returns \ref PngStatus::MarkerNotFound when there is none.
PngStatus
find_payload_chunk(const PngImage& image, const PngExtractOptions& options,
                   uint32_t* chunk_index) noexcept;

/**
 * \brief Copies the payload bytes into \p out, unmodified.
 *
 * When \p out is too small, the prefix that fits is written and the status is
 * \ref PngStatus::OutputTruncated with `needed` set.
 */
PngExtractResult
extract_payload(const PngImage& image, std::span<std::byte> out,
                const PngExtractOptions& options) noexcept;

/// Replaces the content of \p out with the payload bytes.
PngExtractResult
extract_payload(const PngImage& image, std::vector<std::byte>* out,
                const PngExtractOptions& options) noexcept;

/**
 * \brief Erases every chunk of type \p chunk_type.
 *
 * The insertion point is re-derived from the position of `IEND`. Returns the
 * number of chunks removed.
 */
uint32_t
remove_payload_chunks(PngImage* image, uint32_t chunk_type) noexcept;

}  // namespace pngstash
