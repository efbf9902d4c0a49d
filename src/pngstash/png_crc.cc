#include "pngstash/png_crc.h"

#include <array>
#include <zlib.h>

namespace pngstash {

uint32_t
png_crc_update(uint32_t crc, std::span<const std::byte> bytes) noexcept
{
    // zlib takes uInt lengths; feed large inputs in slices.
    static constexpr uint64_t kMaxSlice = 0x40000000ULL;

    uLong c             = static_cast<uLong>(crc);
    uint64_t off        = 0;
    const uint64_t size = static_cast<uint64_t>(bytes.size());
    while (off < size) {
        const uint64_t n = (size - off < kMaxSlice) ? (size - off) : kMaxSlice;
        c = ::crc32(c,
                    reinterpret_cast<const Bytef*>(
                        bytes.data() + static_cast<size_t>(off)),
                    static_cast<uInt>(n));
        off += n;
    }
    return static_cast<uint32_t>(c);
}


uint32_t
png_chunk_crc(std::span<const std::byte, 4> type_bytes,
              std::span<const std::byte> data) noexcept
{
    const uint32_t crc = png_crc_update(kPngCrcInit, type_bytes);
    return png_crc_update(crc, data);
}


uint32_t
png_chunk_crc(uint32_t type, std::span<const std::byte> data) noexcept
{
    const std::array<std::byte, 4> type_bytes = {
        std::byte { static_cast<uint8_t>((type >> 24) & 0xFF) },
        std::byte { static_cast<uint8_t>((type >> 16) & 0xFF) },
        std::byte { static_cast<uint8_t>((type >> 8) & 0xFF) },
        std::byte { static_cast<uint8_t>((type >> 0) & 0xFF) },
    };
    return png_chunk_crc(std::span<const std::byte, 4>(type_bytes), data);
}

}  // namespace pngstash
