#include "pngstash/png_chunk.h"

#include "pngstash/png_crc.h"

#include <cstring>
#include <utility>

namespace pngstash {
namespace {

    static bool is_ascii_letter(uint32_t c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }


    static void store_u32be(std::byte* dst, uint32_t v) noexcept
    {
        dst[0] = std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) };
        dst[1] = std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) };
        dst[2] = std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) };
        dst[3] = std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) };
    }


    static void reset_chunks(PngImage* image) noexcept
    {
        image->chunks.clear();
        image->has_insertion_point = false;
        image->insertion_index     = -1;
    }


    static PngDecodeResult fail(PngImage* out, PngDecodeResult res,
                                PngStatus status,
                                const ByteReader& reader) noexcept
    {
        reset_chunks(out);
        res.status   = status;
        res.consumed = reader.offset();
        return res;
    }

}  // namespace


bool
png_chunk_type_is_valid(uint32_t type) noexcept
{
    for (uint32_t shift = 0; shift < 32; shift += 8) {
        if (!is_ascii_letter((type >> shift) & 0xFFU)) {
            return false;
        }
    }
    // Reserved bit (third byte) must be zero: uppercase.
    return ((type >> 8) & 0x20U) == 0U;
}


PngDecodeResult
decode_png_chunks(ByteReader& reader, PngImage* out,
                  const PngDecodeOptions& options) noexcept
{
    PngDecodeResult res;
    if (!out) {
        res.status = PngStatus::IoError;
        return res;
    }
    reset_chunks(out);

    const PngDecodeLimits& limits = options.limits;
    uint64_t total_bytes          = 0;
    uint32_t index                = 0;

    for (;;) {
        res.chunk_index = index;
        if (reader.at_end()) {
            // Clean chunk boundary but no IEND: truncated container.
            return fail(out, res, PngStatus::FormatError, reader);
        }
        if (limits.max_chunks != 0U && index >= limits.max_chunks) {
            return fail(out, res, PngStatus::LimitExceeded, reader);
        }

        PngChunk chunk;
        if (!reader.read_u32be(&chunk.length)
            || !reader.read_u32be(&chunk.type)) {
            return fail(out, res, PngStatus::IoError, reader);
        }
        if (chunk.length > kPngMaxChunkLength) {
            return fail(out, res, PngStatus::FormatError, reader);
        }
        total_bytes += kPngChunkOverhead + static_cast<uint64_t>(chunk.length);
        if ((limits.max_chunk_bytes != 0U
             && chunk.length > limits.max_chunk_bytes)
            || (limits.max_total_bytes != 0U
                && total_bytes > limits.max_total_bytes)) {
            return fail(out, res, PngStatus::LimitExceeded, reader);
        }

        std::span<const std::byte> data;
        if (!reader.read_view(chunk.length, &data)
            || !reader.read_u32be(&chunk.crc)) {
            return fail(out, res, PngStatus::IoError, reader);
        }

        if (options.verify_crc) {
            const uint32_t computed = png_chunk_crc(chunk.type, data);
            if (computed != chunk.crc) {
                res.stored_crc   = chunk.crc;
                res.computed_crc = computed;
                return fail(out, res, PngStatus::CrcMismatch, reader);
            }
        }

        chunk.data.assign(data.begin(), data.end());
        const bool terminal = (chunk.type == kPngChunkIend);
        out->chunks.push_back(std::move(chunk));
        res.chunks = index + 1U;

        if (terminal) {
            out->has_insertion_point = true;
            out->insertion_index     = static_cast<int64_t>(index) - 1;
            res.consumed             = reader.offset();
            return res;
        }
        index += 1;
    }
}


PngDecodeResult
decode_png(std::span<const std::byte> bytes, PngImage* out,
           const PngDecodeOptions& options) noexcept
{
    PngDecodeResult res;
    if (!out) {
        res.status = PngStatus::IoError;
        return res;
    }

    ByteReader reader(bytes);
    std::array<std::byte, kPngSignatureSize> sig {};
    const PngStatus sig_status = read_png_signature(reader, &sig);
    if (sig_status != PngStatus::Ok) {
        return fail(out, res, sig_status, reader);
    }
    if (!validate_png_signature(sig)) {
        return fail(out, res, PngStatus::FormatError, reader);
    }

    res = decode_png_chunks(reader, out, options);
    if (res.status == PngStatus::Ok) {
        out->signature = sig;
    }
    return res;
}


uint64_t
measure_png(const PngImage& image) noexcept
{
    uint64_t size = kPngSignatureSize;
    for (const PngChunk& chunk : image.chunks) {
        size += kPngChunkOverhead + static_cast<uint64_t>(chunk.data.size());
    }
    return size;
}


PngEncodeResult
encode_png(const PngImage& image, std::span<std::byte> out) noexcept
{
    PngEncodeResult res;
    res.needed = measure_png(image);
    if (res.needed > static_cast<uint64_t>(out.size())) {
        res.status = PngStatus::OutputTruncated;
        return res;
    }

    std::byte* p = out.data();
    std::memcpy(p, image.signature.data(), kPngSignatureSize);
    p += kPngSignatureSize;
    for (const PngChunk& chunk : image.chunks) {
        store_u32be(p + 0, chunk.length);
        store_u32be(p + 4, chunk.type);
        p += 8;
        if (!chunk.data.empty()) {
            std::memcpy(p, chunk.data.data(), chunk.data.size());
            p += chunk.data.size();
        }
        store_u32be(p, chunk.crc);
        p += 4;
    }
    res.written = res.needed;
    return res;
}


PngEncodeResult
encode_png(const PngImage& image, std::vector<std::byte>* out) noexcept
{
    PngEncodeResult res;
    if (!out) {
        res.status = PngStatus::IoError;
        return res;
    }

    const size_t base = out->size();
    out->resize(base + static_cast<size_t>(measure_png(image)));
    res = encode_png(image, std::span<std::byte>(out->data() + base,
                                                 out->size() - base));
    if (res.status != PngStatus::Ok) {
        out->resize(base);
    }
    return res;
}


PngStatus
append_png_chunk(PngImage* image, uint32_t type,
                 std::span<const std::byte> data) noexcept
{
    if (!image) {
        return PngStatus::IoError;
    }
    if (!image->chunks.empty() && image->chunks.back().type == kPngChunkIend) {
        return PngStatus::FormatError;
    }
    if (data.size() > kPngMaxChunkLength) {
        return PngStatus::LimitExceeded;
    }

    PngChunk chunk;
    chunk.length = static_cast<uint32_t>(data.size());
    chunk.type   = type;
    chunk.data.assign(data.begin(), data.end());
    chunk.crc = png_chunk_crc(type, data);
    image->chunks.push_back(std::move(chunk));

    if (type == kPngChunkIend) {
        image->has_insertion_point = true;
        image->insertion_index = static_cast<int64_t>(image->chunks.size()) - 2;
    }
    return PngStatus::Ok;
}


bool
verify_png_chunk(const PngChunk& chunk) noexcept
{
    if (static_cast<uint64_t>(chunk.length)
        != static_cast<uint64_t>(chunk.data.size())) {
        return false;
    }
    return png_chunk_crc(chunk.type, chunk.data) == chunk.crc;
}


bool
verify_png_image(const PngImage& image, uint32_t* bad_index) noexcept
{
    for (size_t i = 0; i < image.chunks.size(); ++i) {
        if (!verify_png_chunk(image.chunks[i])) {
            if (bad_index) {
                *bad_index = static_cast<uint32_t>(i);
            }
            return false;
        }
    }
    return true;
}

}  // namespace pngstash
