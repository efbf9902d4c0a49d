#include "pngstash/png_signature.h"

#include <cstring>

namespace pngstash {

PngStatus
read_png_signature(ByteReader& reader,
                   std::array<std::byte, kPngSignatureSize>* out) noexcept
{
    std::array<std::byte, kPngSignatureSize> sig {};
    if (!reader.read(sig)) {
        return PngStatus::IoError;
    }
    if (out) {
        *out = sig;
    }
    return PngStatus::Ok;
}


bool
validate_png_signature(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() != kPngSignatureSize) {
        return false;
    }
    return std::memcmp(bytes.data(), kPngSignature.data(), kPngSignatureSize)
           == 0;
}

}  // namespace pngstash
