#include "pngstash/png_chunk.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

namespace pngstash {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


static void
verify_image(const PngDecodeResult& res, const PngImage& image,
             bool strict) noexcept
{
    if (res.status != PngStatus::Ok) {
        if (!image.chunks.empty() || image.has_insertion_point) {
            fuzz_trap();
        }
        return;
    }
    if (image.chunks.empty() || image.chunks.back().type != kPngChunkIend) {
        fuzz_trap();
    }
    if (!image.has_insertion_point
        || image.insertion_index
               != static_cast<int64_t>(image.chunks.size()) - 2) {
        fuzz_trap();
    }
    for (const PngChunk& chunk : image.chunks) {
        if (chunk.length != chunk.data.size()) {
            fuzz_trap();
        }
        if (strict && !verify_png_chunk(chunk)) {
            fuzz_trap();
        }
    }
}

}  // namespace pngstash

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace pngstash;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    PngDecodeOptions opts;
    opts.limits.max_total_bytes = 16U * 1024U * 1024U;

    PngImage image;
    PngDecodeResult res = decode_png(bytes, &image, opts);
    verify_image(res, image, false);

    opts.verify_crc = true;
    res             = decode_png(bytes, &image, opts);
    verify_image(res, image, true);
    return 0;
}
