#include "pngstash/byte_reader.h"
#include "pngstash/png_signature.h"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <vector>

namespace pngstash {
namespace {

    TEST(PngSignature, AcceptsExactSignature)
    {
        EXPECT_TRUE(validate_png_signature(kPngSignature));
    }


    TEST(PngSignature, RejectsAllZero)
    {
        const std::array<std::byte, kPngSignatureSize> zeros {};
        EXPECT_FALSE(validate_png_signature(zeros));
    }


    TEST(PngSignature, EveryBytePositionMatters)
    {
        for (size_t i = 0; i < kPngSignatureSize; ++i) {
            std::array<std::byte, kPngSignatureSize> sig = kPngSignature;
            sig[i] ^= std::byte { 0x01 };
            EXPECT_FALSE(validate_png_signature(sig)) << "byte " << i;
        }
    }


    TEST(PngSignature, RejectsPngSubstringWithWrongSentinels)
    {
        // "PNG" at bytes 1..3 alone is not enough.
        const std::array<std::byte, kPngSignatureSize> sig = {
            std::byte { 0x00 }, std::byte { 'P' },  std::byte { 'N' },
            std::byte { 'G' },  std::byte { 0x0A }, std::byte { 0x0D },
            std::byte { 0x1A }, std::byte { 0x0A },
        };
        EXPECT_FALSE(validate_png_signature(sig));
    }


    TEST(PngSignature, RejectsWrongLength)
    {
        EXPECT_FALSE(validate_png_signature(
            std::span<const std::byte>(kPngSignature.data(), 7)));

        std::vector<std::byte> longer(kPngSignature.begin(),
                                      kPngSignature.end());
        longer.push_back(std::byte { 0x00 });
        EXPECT_FALSE(validate_png_signature(longer));
        EXPECT_FALSE(validate_png_signature({}));
    }


    TEST(PngSignature, ReadSignatureConsumesEightBytes)
    {
        std::vector<std::byte> bytes(kPngSignature.begin(),
                                     kPngSignature.end());
        bytes.push_back(std::byte { 0xAB });

        ByteReader reader(bytes);
        std::array<std::byte, kPngSignatureSize> sig {};
        ASSERT_EQ(read_png_signature(reader, &sig), PngStatus::Ok);
        EXPECT_EQ(sig, kPngSignature);
        EXPECT_EQ(reader.offset(), 8U);
        EXPECT_EQ(reader.remaining(), 1U);
    }


    TEST(PngSignature, ShortReadIsIoError)
    {
        const std::span<const std::byte> partial(kPngSignature.data(), 5);
        ByteReader reader(partial);
        std::array<std::byte, kPngSignatureSize> sig {};
        EXPECT_EQ(read_png_signature(reader, &sig), PngStatus::IoError);
        // A failed read consumes nothing.
        EXPECT_EQ(reader.offset(), 0U);
    }

}  // namespace
}  // namespace pngstash
