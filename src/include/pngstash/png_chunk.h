#pragma once

#include "pngstash/byte_reader.h"
#include "pngstash/png_signature.h"
#include "pngstash/png_status.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file png_chunk.h
 * \brief PNG chunk model plus the chunk stream decoder and encoder.
 */

namespace pngstash {

/// Packs four ASCII characters into a big-endian FourCC integer.
static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

static constexpr uint32_t kPngChunkIhdr = fourcc('I', 'H', 'D', 'R');
static constexpr uint32_t kPngChunkIend = fourcc('I', 'E', 'N', 'D');

/// Chunk type that carries embedded payloads. Ancillary, so decoders skip it.
static constexpr uint32_t kPngStashChunkType = fourcc('p', 'U', 'N', 'K');

/// Largest length a PNG chunk may declare (2^31 - 1).
static constexpr uint32_t kPngMaxChunkLength = 0x7FFFFFFFU;

/// Bytes of framing per chunk: length, type and crc fields.
static constexpr uint32_t kPngChunkOverhead = 12;

/// One `length | type | data | crc` record.
struct PngChunk final {
    uint32_t length = 0;
    uint32_t type   = 0;
    std::vector<std::byte> data;
    uint32_t crc = 0;
};

/**
 * \brief Signature plus the ordered chunk sequence of one PNG stream.
 *
 * The insertion point is the slot immediately before the terminal `IEND`
 * chunk. It is present only once a terminal chunk was decoded or appended;
 * `insertion_index` is then the index of the chunk preceding `IEND` (-1 when
 * `IEND` is the first chunk). After an embed it names the inserted payload.
 */
struct PngImage final {
    std::array<std::byte, kPngSignatureSize> signature = kPngSignature;
    std::vector<PngChunk> chunks;

    bool has_insertion_point = false;
    int64_t insertion_index  = -1;
};

/// True when bit 5 of the first type byte is set (lowercase: ancillary).
static constexpr bool
png_chunk_is_ancillary(uint32_t type) noexcept
{
    return ((type >> 24) & 0x20U) != 0U;
}

/// True when bit 5 of the second type byte is set (lowercase: private).
static constexpr bool
png_chunk_is_private(uint32_t type) noexcept
{
    return ((type >> 16) & 0x20U) != 0U;
}

/// True when bit 5 of the fourth type byte is set (lowercase: safe to copy).
static constexpr bool
png_chunk_is_safe_to_copy(uint32_t type) noexcept
{
    return (type & 0x20U) != 0U;
}

/// True when all four bytes are ASCII letters and the reserved (third) byte is uppercase.
bool
png_chunk_type_is_valid(uint32_t type) noexcept;

/**
 * \brief Resource limits applied while decoding.
 *
 * A limit of 0 means unlimited. The defaults accept any well-formed PNG;
 * callers handling untrusted input set caps (see \ref kPngUntrustedMaxChunks
 * and \ref kPngUntrustedMaxTotalBytes).
 */
struct PngDecodeLimits final {
    uint32_t max_chunks      = 0;
    uint32_t max_chunk_bytes = kPngMaxChunkLength;
    uint64_t max_total_bytes = 0;
};

/// Suggested caps for untrusted input, used by the pngstash tool.
static constexpr uint32_t kPngUntrustedMaxChunks     = 1U << 16;
static constexpr uint64_t kPngUntrustedMaxTotalBytes = 256ULL * 1024ULL
                                                       * 1024ULL;

/// Options for \ref decode_png and \ref decode_png_chunks.
struct PngDecodeOptions final {
    /// If true, recompute every chunk CRC and stop at the first mismatch.
    bool verify_crc = false;
    PngDecodeLimits limits;
};

struct PngDecodeResult final {
    PngStatus status = PngStatus::Ok;
    /// Chunks decoded (on failure: chunks fully read before the failing one).
    uint32_t chunks = 0;
    /// Stream offset reached when decoding stopped.
    uint64_t consumed = 0;
    /// Index of the chunk being read when decoding failed.
    uint32_t chunk_index = 0;
    /// Stored and recomputed CRC for \ref PngStatus::CrcMismatch.
    uint32_t stored_crc   = 0;
    uint32_t computed_crc = 0;
};

/**
 * \brief Decodes chunks from \p reader until the terminal `IEND` chunk.
 *
 * The reader must be positioned just past the signature. Short reads are
 * \ref PngStatus::IoError; a stream that ends on a chunk boundary without
 * `IEND` is \ref PngStatus::FormatError. Chunks after `IEND` are not read.
 *
 * The chunks and insertion point of \p out are replaced; on failure \p out
 * holds no chunks. The signature field is not touched.
 */
PngDecodeResult
decode_png_chunks(ByteReader& reader, PngImage* out,
                  const PngDecodeOptions& options) noexcept;

/**
 * \brief Reads and validates the signature, then calls \ref decode_png_chunks.
 *
 * A signature mismatch is \ref PngStatus::FormatError and no chunk is read.
 */
PngDecodeResult
decode_png(std::span<const std::byte> bytes, PngImage* out,
           const PngDecodeOptions& options) noexcept;

struct PngEncodeResult final {
    PngStatus status = PngStatus::Ok;
    uint64_t written = 0;
    uint64_t needed  = 0;
};

/// Returns the serialized size of \p image in bytes.
uint64_t
measure_png(const PngImage& image) noexcept;

/**
 * \brief Serializes \p image into \p out.
 *
 * Fields are written exactly as stored: lengths and CRCs are not recomputed.
 * When \p out is too small nothing is written and the result reports
 * \ref PngStatus::OutputTruncated with the required size.
 */
PngEncodeResult
encode_png(const PngImage& image, std::span<std::byte> out) noexcept;

/// Appends the serialized image to \p out. A null sink is \ref PngStatus::IoError.
PngEncodeResult
encode_png(const PngImage& image, std::vector<std::byte>* out) noexcept;

/**
 * \brief Appends a chunk with computed length and CRC.
 *
 * Appending `IEND` records the insertion point. Appending after the terminal
 * chunk is \ref PngStatus::FormatError.
 */
PngStatus
append_png_chunk(PngImage* image, uint32_t type,
                 std::span<const std::byte> data) noexcept;

/// True when the stored length and CRC match the chunk's type and data.
bool
verify_png_chunk(const PngChunk& chunk) noexcept;

/// Verifies every chunk. On failure reports the first bad index in \p bad_index.
bool
verify_png_image(const PngImage& image, uint32_t* bad_index) noexcept;

}  // namespace pngstash
