#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file byte_reader.h
 * \brief Forward-only byte stream over caller-owned bytes.
 */

namespace pngstash {

/**
 * \brief Sequential reader used by the signature and chunk decoders.
 *
 * Reads are all-or-nothing: a read that cannot be satisfied in full consumes
 * nothing and returns false, so callers can report the offset of the field
 * that was cut short.
 *
 * \note The reader does not own the bytes; they must outlive it.
 */
class ByteReader final {
public:
    ByteReader() noexcept = default;
    explicit ByteReader(std::span<const std::byte> bytes) noexcept;

    /// Copies exactly `out.size()` bytes into \p out.
    bool read(std::span<std::byte> out) noexcept;
    /// Returns a view of the next \p size bytes and advances past them.
    bool read_view(uint64_t size, std::span<const std::byte>* out) noexcept;
    /// Reads an unsigned 32-bit big-endian integer.
    bool read_u32be(uint32_t* out) noexcept;

    uint64_t offset() const noexcept;
    uint64_t remaining() const noexcept;
    bool at_end() const noexcept;

private:
    std::span<const std::byte> bytes_;
    uint64_t offset_ = 0;
};

}  // namespace pngstash
