#include "pngstash/console_format.h"

#include "pngstash/png_chunk.h"

#include <cstdio>

namespace pngstash {
namespace {

    static uint32_t clamp_count(size_t size, uint32_t max_bytes) noexcept
    {
        return (max_bytes == 0U || size < max_bytes)
                   ? static_cast<uint32_t>(size)
                   : max_bytes;
    }


    static void append_escaped_byte(unsigned char c, std::string* out) noexcept
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned>(c));
        out->append(buf);
    }

}  // namespace


bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool dangerous   = false;
    const uint32_t n = clamp_count(s.size(), max_bytes);

    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        switch (c) {
        case '\\':
        case '"':
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        case '\n': out->append("\\n"); break;
        case '\r': out->append("\\r"); break;
        case '\t': out->append("\\t"); break;
        default:
            if (c >= 0x20U && c < 0x7FU) {
                out->push_back(static_cast<char>(c));
                continue;
            }
            append_escaped_byte(c, out);
            break;
        }
        dangerous = true;
    }
    if (n < s.size()) {
        out->append("...");
        dangerous = true;
    }
    return dangerous;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept
{
    static constexpr char kDigits[] = "0123456789ABCDEF";

    const uint32_t n = clamp_count(bytes.size(), max_bytes);
    out->reserve(out->size() + static_cast<size_t>(n) * 2U);
    for (uint32_t i = 0; i < n; ++i) {
        const uint8_t v = static_cast<uint8_t>(bytes[i]);
        out->push_back(kDigits[v >> 4]);
        out->push_back(kDigits[v & 0x0FU]);
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}


void
append_chunk_type(uint32_t type, std::string* out) noexcept
{
    for (int shift = 24; shift >= 0; shift -= 8) {
        const unsigned char c = static_cast<unsigned char>((type >> shift)
                                                           & 0xFFU);
        const bool letter = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        if (letter) {
            out->push_back(static_cast<char>(c));
        } else {
            append_escaped_byte(c, out);
        }
    }
}


void
append_chunk_properties(uint32_t type, std::string* out) noexcept
{
    out->append(png_chunk_is_ancillary(type) ? "ancillary" : "critical");
    out->append(png_chunk_is_private(type) ? ",private" : ",public");
    out->append(png_chunk_is_safe_to_copy(type) ? ",safe" : ",unsafe");
}


bool
parse_chunk_type(std::string_view s, uint32_t* out) noexcept
{
    if (s.size() != 4U) {
        return false;
    }
    const uint32_t type = fourcc(s[0], s[1], s[2], s[3]);
    if (!png_chunk_type_is_valid(type)) {
        return false;
    }
    if (out) {
        *out = type;
    }
    return true;
}

}  // namespace pngstash
