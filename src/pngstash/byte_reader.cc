#include "pngstash/byte_reader.h"

#include <cstring>

namespace pngstash {

ByteReader::ByteReader(std::span<const std::byte> bytes) noexcept
    : bytes_(bytes)
{
}


bool
ByteReader::read(std::span<std::byte> out) noexcept
{
    std::span<const std::byte> view;
    if (!read_view(static_cast<uint64_t>(out.size()), &view)) {
        return false;
    }
    if (!view.empty()) {
        std::memcpy(out.data(), view.data(), view.size());
    }
    return true;
}


bool
ByteReader::read_view(uint64_t size, std::span<const std::byte>* out) noexcept
{
    if (size > remaining()) {
        return false;
    }
    if (out) {
        *out = bytes_.subspan(static_cast<size_t>(offset_),
                              static_cast<size_t>(size));
    }
    offset_ += size;
    return true;
}


bool
ByteReader::read_u32be(uint32_t* out) noexcept
{
    std::span<const std::byte> view;
    if (!read_view(4, &view)) {
        return false;
    }
    const uint32_t v = (static_cast<uint32_t>(view[0]) << 24)
                       | (static_cast<uint32_t>(view[1]) << 16)
                       | (static_cast<uint32_t>(view[2]) << 8)
                       | (static_cast<uint32_t>(view[3]) << 0);
    if (out) {
        *out = v;
    }
    return true;
}


uint64_t
ByteReader::offset() const noexcept
{
    return offset_;
}


uint64_t
ByteReader::remaining() const noexcept
{
    return static_cast<uint64_t>(bytes_.size()) - offset_;
}


bool
ByteReader::at_end() const noexcept
{
    return remaining() == 0U;
}

}  // namespace pngstash
