#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace pngstash {

// Appends an ASCII-only, terminal-safe representation of `s` into `out`.
//
// Control bytes and non-ASCII become `\xNN`; `\n`, `\r`, `\t` are escaped.
// Truncates to `max_bytes` bytes (0 = unlimited) and appends "...".
//
// Returns true when any escaping or truncation occurred.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Appends uppercase hex bytes into `out` (no "0x" prefix), truncated like above.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept;

// Appends the four characters of a chunk type. Bytes that are not ASCII
// letters are written as `\xNN` so corrupt types stay readable.
void
append_chunk_type(uint32_t type, std::string* out) noexcept;

// Appends "critical|ancillary,public|private,unsafe|safe" for `type`.
void
append_chunk_properties(uint32_t type, std::string* out) noexcept;

// Parses a 4-letter chunk type such as "pUNK". Returns false for any other input.
bool
parse_chunk_type(std::string_view s, uint32_t* out) noexcept;

}  // namespace pngstash
