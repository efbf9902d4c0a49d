#include "pngstash/png_payload.h"

#include "pngstash/png_crc.h"

#include <algorithm>
#include <cstring>
#include <utility>

namespace pngstash {
namespace {

    static bool index_lookup(const PngImage& image, uint32_t chunk_type,
                             uint32_t* chunk_index) noexcept
    {
        if (!image.has_insertion_point || image.insertion_index < 0) {
            return false;
        }
        const uint64_t i = static_cast<uint64_t>(image.insertion_index);
        if (i >= image.chunks.size() || image.chunks[i].type != chunk_type) {
            return false;
        }
        *chunk_index = static_cast<uint32_t>(i);
        return true;
    }


    static bool scan_lookup(const PngImage& image, uint32_t chunk_type,
                            uint32_t* chunk_index) noexcept
    {
        for (size_t i = image.chunks.size(); i > 0; --i) {
            if (image.chunks[i - 1].type == chunk_type) {
                *chunk_index = static_cast<uint32_t>(i - 1);
                return true;
            }
        }
        return false;
    }

}  // namespace


PngStatus
build_payload_chunk(std::span<const std::byte> payload, uint32_t type,
                    PngChunk* out) noexcept
{
    if (!out) {
        return PngStatus::IoError;
    }
    if (!png_chunk_type_is_valid(type) || !png_chunk_is_ancillary(type)) {
        return PngStatus::InvalidChunkType;
    }
    if (payload.size() > kPngMaxChunkLength) {
        return PngStatus::LimitExceeded;
    }

    PngChunk chunk;
    chunk.length = static_cast<uint32_t>(payload.size());
    chunk.type   = type;
    chunk.data.assign(payload.begin(), payload.end());
    chunk.crc = png_chunk_crc(type, payload);
    *out      = std::move(chunk);
    return PngStatus::Ok;
}


PngEmbedResult
embed_payload(PngImage* image, std::span<const std::byte> payload,
              const PngEmbedOptions& options) noexcept
{
    PngEmbedResult res;
    if (!image) {
        res.status = PngStatus::IoError;
        return res;
    }
    if (!image->has_insertion_point || image->insertion_index < -1) {
        res.status = PngStatus::EmbedWithoutAnchor;
        return res;
    }
    const uint64_t terminal = static_cast<uint64_t>(image->insertion_index + 1);
    if (terminal >= image->chunks.size()
        || image->chunks[terminal].type != kPngChunkIend) {
        res.status = PngStatus::EmbedWithoutAnchor;
        return res;
    }

    PngChunk chunk;
    res.status = build_payload_chunk(payload, options.chunk_type, &chunk);
    if (res.status != PngStatus::Ok) {
        return res;
    }

    image->chunks.resize(static_cast<size_t>(terminal) + 1U);
    image->chunks.insert(image->chunks.begin()
                             + static_cast<std::ptrdiff_t>(terminal),
                         std::move(chunk));
    image->insertion_index = static_cast<int64_t>(terminal);
    res.chunk_index        = static_cast<uint32_t>(terminal);
    return res;
}


PngStatus
find_payload_chunk(const PngImage& image, const PngExtractOptions& options,
                   uint32_t* chunk_index) noexcept
{
    uint32_t found = 0;
    bool ok        = false;
    switch (options.lookup) {
    case PayloadLookup::Index:
        ok = index_lookup(image, options.chunk_type, &found);
        break;
    case PayloadLookup::Scan:
        ok = scan_lookup(image, options.chunk_type, &found);
        break;
    case PayloadLookup::IndexThenScan:
        ok = index_lookup(image, options.chunk_type, &found)
             || scan_lookup(image, options.chunk_type, &found);
        break;
    }
    if (!ok) {
        return PngStatus::MarkerNotFound;
    }
    if (chunk_index) {
        *chunk_index = found;
    }
    return PngStatus::Ok;
}


PngExtractResult
extract_payload(const PngImage& image, std::span<std::byte> out,
                const PngExtractOptions& options) noexcept
{
    PngExtractResult res;
    res.status = find_payload_chunk(image, options, &res.chunk_index);
    if (res.status != PngStatus::Ok) {
        return res;
    }

    const std::vector<std::byte>& data = image.chunks[res.chunk_index].data;
    res.needed     = static_cast<uint64_t>(data.size());
    const size_t n = std::min(data.size(), out.size());
    if (n != 0U) {
        std::memcpy(out.data(), data.data(), n);
    }
    res.written = static_cast<uint64_t>(n);
    if (res.written < res.needed) {
        res.status = PngStatus::OutputTruncated;
    }
    return res;
}


PngExtractResult
extract_payload(const PngImage& image, std::vector<std::byte>* out,
                const PngExtractOptions& options) noexcept
{
    PngExtractResult res;
    if (!out) {
        res.status = PngStatus::IoError;
        return res;
    }
    res.status = find_payload_chunk(image, options, &res.chunk_index);
    if (res.status != PngStatus::Ok) {
        return res;
    }

    const std::vector<std::byte>& data = image.chunks[res.chunk_index].data;
    out->assign(data.begin(), data.end());
    res.needed  = static_cast<uint64_t>(data.size());
    res.written = res.needed;
    return res;
}


uint32_t
remove_payload_chunks(PngImage* image, uint32_t chunk_type) noexcept
{
    if (!image) {
        return 0;
    }
    std::vector<PngChunk>& chunks = image->chunks;
    const size_t before           = chunks.size();
    chunks.erase(std::remove_if(chunks.begin(), chunks.end(),
                                [chunk_type](const PngChunk& c) {
                                    return c.type == chunk_type;
                                }),
                 chunks.end());

    image->has_insertion_point = false;
    image->insertion_index     = -1;
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].type == kPngChunkIend) {
            image->has_insertion_point = true;
            image->insertion_index     = static_cast<int64_t>(i) - 1;
            break;
        }
    }
    return static_cast<uint32_t>(before - chunks.size());
}

}  // namespace pngstash
