#include "pngstash/build_info.h"
#include "pngstash/console_format.h"
#include "pngstash/png_chunk.h"

#include <gtest/gtest.h>
#include <zlib.h>

#include <array>
#include <string>
#include <string_view>

namespace pngstash {
namespace {

    TEST(ConsoleFormat, PrintableAsciiPassesThrough)
    {
        std::string out;
        EXPECT_FALSE(append_console_escaped_ascii("hello world", 0, &out));
        EXPECT_EQ(out, "hello world");
    }


    TEST(ConsoleFormat, EscapesControlAndHighBytes)
    {
        std::string out;
        const std::string_view s("a\nb\t\x01\xFF\"\\", 8);
        EXPECT_TRUE(append_console_escaped_ascii(s, 0, &out));
        EXPECT_EQ(out, "a\\nb\\t\\x01\\xFF\\\"\\\\");
    }


    TEST(ConsoleFormat, TruncatesEscapedText)
    {
        std::string out;
        EXPECT_TRUE(append_console_escaped_ascii("abcdef", 3, &out));
        EXPECT_EQ(out, "abc...");
    }


    TEST(ConsoleFormat, HexBytesUppercaseAndTruncated)
    {
        const std::array<std::byte, 4> bytes = { std::byte { 0x00 },
                                                 std::byte { 0xAB },
                                                 std::byte { 0x7F },
                                                 std::byte { 0x10 } };
        std::string full;
        append_hex_bytes(bytes, 0, &full);
        EXPECT_EQ(full, "00AB7F10");

        std::string cut;
        append_hex_bytes(bytes, 2, &cut);
        EXPECT_EQ(cut, "00AB...");
    }


    TEST(ConsoleFormat, ChunkTypeRendering)
    {
        std::string out;
        append_chunk_type(kPngStashChunkType, &out);
        EXPECT_EQ(out, "pUNK");

        std::string bad;
        append_chunk_type(fourcc('a', '1', 'b', '\n'), &bad);
        EXPECT_EQ(bad, "a\\x31b\\x0A");
    }


    TEST(ConsoleFormat, ChunkProperties)
    {
        std::string ihdr;
        append_chunk_properties(kPngChunkIhdr, &ihdr);
        EXPECT_EQ(ihdr, "critical,public,unsafe");

        std::string stash;
        append_chunk_properties(kPngStashChunkType, &stash);
        EXPECT_EQ(stash, "ancillary,public,unsafe");

        std::string text;
        append_chunk_properties(fourcc('t', 'E', 'X', 't'), &text);
        EXPECT_EQ(text, "ancillary,public,safe");

        std::string priv;
        append_chunk_properties(fourcc('p', 'r', 'I', 'v'), &priv);
        EXPECT_EQ(priv, "ancillary,private,safe");
    }


    TEST(ConsoleFormat, ParseChunkType)
    {
        uint32_t type = 0;
        ASSERT_TRUE(parse_chunk_type("pUNK", &type));
        EXPECT_EQ(type, kPngStashChunkType);

        ASSERT_TRUE(parse_chunk_type("stSh", &type));
        EXPECT_EQ(type, fourcc('s', 't', 'S', 'h'));

        type = 0;
        EXPECT_FALSE(parse_chunk_type("pUN", &type));
        EXPECT_FALSE(parse_chunk_type("pUNKK", &type));
        EXPECT_FALSE(parse_chunk_type("pU1K", &type));
        EXPECT_FALSE(parse_chunk_type("", &type));
        EXPECT_EQ(type, 0U);
    }


    TEST(BuildInfo, HeaderLines)
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        EXPECT_EQ(line1.rfind("pngstash v", 0), 0U);
        EXPECT_NE(line1.find("[zlib "), std::string::npos);
        EXPECT_EQ(line2.rfind("built with ", 0), 0U);

        const BuildInfo& bi = build_info();
        EXPECT_FALSE(bi.version.empty());
        EXPECT_FALSE(bi.zlib_header_version.empty());
        EXPECT_EQ(bi.zlib_header_version, std::string_view(ZLIB_VERSION));
        EXPECT_NE(bi.linkage_static, bi.linkage_shared);
    }

}  // namespace
}  // namespace pngstash
