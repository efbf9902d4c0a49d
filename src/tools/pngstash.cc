#include "pngstash/build_info.h"
#include "pngstash/console_format.h"
#include "pngstash/png_chunk.h"
#include "pngstash/png_payload.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pngstash {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <png>\n"
            "\n"
            "Hides a message or file inside a PNG as an ancillary chunk, or\n"
            "recovers it.\n"
            "\n"
            "  %s --encode --to <out.png> (--message <text> | --file <path>) <png>\n"
            "  %s --decode (--to <path> | --dump) <png>\n"
            "  %s --list <png>\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print pngstash build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --png <path>           Input PNG (alternative to the positional argument)\n"
            "  --encode               Embed a payload before the IEND chunk\n"
            "  --decode               Extract the embedded payload\n"
            "  --list                 Print the chunk table\n"
            "  --message <text>       Payload text for --encode\n"
            "  --file <path>          Payload file for --encode\n"
            "  --to <path>            Output file\n"
            "  --dump                 Print the extracted payload to stdout\n"
            "  --strict               Verify every chunk CRC while decoding\n"
            "  --scan                 Locate the payload by chunk type only\n"
            "  --chunk-type XXXX      Payload chunk type (default: pUNK)\n"
            "  --force                Overwrite existing output files\n"
            "  --max-file-bytes N     Refuse inputs larger than N bytes (default: 0=unlimited)\n",
            argv0 ? argv0 : "pngstash", argv0 ? argv0 : "pngstash",
            argv0 ? argv0 : "pngstash", argv0 ? argv0 : "pngstash");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    enum class ReadFileStatus : uint8_t {
        Ok,
        OpenFailed,
        StatFailed,
        TooLarge,
        ReadFailed,
    };


    static const char* read_file_status_name(ReadFileStatus status) noexcept
    {
        switch (status) {
        case ReadFileStatus::Ok: return "ok";
        case ReadFileStatus::OpenFailed: return "open_failed";
        case ReadFileStatus::StatFailed: return "stat_failed";
        case ReadFileStatus::TooLarge: return "too_large";
        case ReadFileStatus::ReadFailed: return "read_failed";
        }
        return "unknown";
    }


    static ReadFileStatus read_file_bytes(const char* path,
                                          uint64_t max_file_bytes,
                                          std::vector<std::byte>* out)
    {
        std::FILE* f = std::fopen(path, "rb");
        if (!f) {
            return ReadFileStatus::OpenFailed;
        }
        if (std::fseek(f, 0, SEEK_END) != 0) {
            std::fclose(f);
            return ReadFileStatus::StatFailed;
        }
        const long size_long = std::ftell(f);
        if (size_long < 0 || std::fseek(f, 0, SEEK_SET) != 0) {
            std::fclose(f);
            return ReadFileStatus::StatFailed;
        }
        const uint64_t size = static_cast<uint64_t>(size_long);
        if (max_file_bytes != 0U && size > max_file_bytes) {
            std::fclose(f);
            return ReadFileStatus::TooLarge;
        }

        out->resize(static_cast<size_t>(size));
        size_t got = 0;
        if (!out->empty()) {
            got = std::fread(out->data(), 1, out->size(), f);
        }
        std::fclose(f);
        if (got != out->size()) {
            out->clear();
            return ReadFileStatus::ReadFailed;
        }
        return ReadFileStatus::Ok;
    }


    static bool file_exists(const std::string& path)
    {
        std::FILE* f = std::fopen(path.c_str(), "rb");
        if (!f) {
            return false;
        }
        std::fclose(f);
        return true;
    }


    static bool write_file_bytes(const std::string& path,
                                 std::span<const std::byte> bytes)
    {
        std::FILE* f = std::fopen(path.c_str(), "wb");
        if (!f) {
            return false;
        }
        size_t written = 0;
        if (!bytes.empty()) {
            written = std::fwrite(bytes.data(), 1, bytes.size(), f);
        }
        const bool closed = std::fclose(f) == 0;
        return closed && written == bytes.size();
    }


    static void print_decode_failure(const char* path,
                                     const PngDecodeResult& res)
    {
        if (res.status == PngStatus::CrcMismatch) {
            std::fprintf(stderr,
                         "pngstash: %s: %s chunk=%u stored=0x%08X "
                         "computed=0x%08X\n",
                         path, png_status_name(res.status), res.chunk_index,
                         res.stored_crc, res.computed_crc);
            return;
        }
        std::fprintf(stderr, "pngstash: %s: %s chunk=%u offset=%llu\n", path,
                     png_status_name(res.status), res.chunk_index,
                     static_cast<unsigned long long>(res.consumed));
    }


    static void print_chunk_table(const char* path, const PngImage& image)
    {
        std::printf("== %s\n", path);
        for (size_t i = 0; i < image.chunks.size(); ++i) {
            const PngChunk& chunk = image.chunks[i];
            std::string type;
            append_chunk_type(chunk.type, &type);
            std::string props;
            append_chunk_properties(chunk.type, &props);
            std::printf("  [%zu] type=%s length=%u crc=0x%08X %s crc_ok=%u\n",
                        i, type.c_str(), chunk.length, chunk.crc,
                        props.c_str(), verify_png_chunk(chunk) ? 1U : 0U);
        }
        if (image.has_insertion_point) {
            std::printf("  insertion_index=%lld\n",
                        static_cast<long long>(image.insertion_index));
        } else {
            std::printf("  insertion_index=none\n");
        }
    }

}  // namespace
}  // namespace pngstash


int
main(int argc, char** argv)
{
    using namespace pngstash;

    bool show_build_info = true;
    bool do_encode       = false;
    bool do_decode       = false;
    bool do_list         = false;
    bool dump            = false;
    bool force           = false;
    bool have_message    = false;
    std::string png_path;
    std::string message;
    std::string payload_path;
    std::string out_path;
    uint64_t max_file_bytes = 0;

    PngDecodeOptions decode_options;
    decode_options.limits.max_chunks      = kPngUntrustedMaxChunks;
    decode_options.limits.max_total_bytes = kPngUntrustedMaxTotalBytes;
    PngEmbedOptions embed_options;
    PngExtractOptions extract_options;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        const bool has_value = i + 1 < argc;
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            continue;
        }
        if (std::strcmp(arg, "--encode") == 0) {
            do_encode = true;
            continue;
        }
        if (std::strcmp(arg, "--decode") == 0) {
            do_decode = true;
            continue;
        }
        if (std::strcmp(arg, "--list") == 0) {
            do_list = true;
            continue;
        }
        if (std::strcmp(arg, "--dump") == 0) {
            dump = true;
            continue;
        }
        if (std::strcmp(arg, "--strict") == 0) {
            decode_options.verify_crc = true;
            continue;
        }
        if (std::strcmp(arg, "--scan") == 0) {
            extract_options.lookup = PayloadLookup::Scan;
            continue;
        }
        if (std::strcmp(arg, "--force") == 0) {
            force = true;
            continue;
        }
        if (std::strcmp(arg, "--png") == 0 && has_value) {
            png_path = argv[++i];
            continue;
        }
        if (std::strcmp(arg, "--message") == 0 && has_value) {
            message      = argv[++i];
            have_message = true;
            continue;
        }
        if (std::strcmp(arg, "--file") == 0 && has_value) {
            payload_path = argv[++i];
            continue;
        }
        if (std::strcmp(arg, "--to") == 0 && has_value) {
            out_path = argv[++i];
            continue;
        }
        if (std::strcmp(arg, "--chunk-type") == 0 && has_value) {
            uint32_t type = 0;
            if (!parse_chunk_type(argv[i + 1], &type)
                || !png_chunk_is_ancillary(type)) {
                std::fprintf(stderr, "invalid --chunk-type value\n");
                return 2;
            }
            embed_options.chunk_type   = type;
            extract_options.chunk_type = type;
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && has_value) {
            if (!parse_u64_arg(argv[i + 1], &max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "pngstash: unknown option %s\n", arg);
            usage(argv[0]);
            return 2;
        }
        if (!png_path.empty()) {
            std::fprintf(stderr, "pngstash: more than one input given\n");
            return 2;
        }
        png_path = arg;
    }

    if (png_path.empty()) {
        std::fprintf(stderr, "pngstash: no image specified\n");
        usage(argv[0]);
        return 2;
    }
    if (do_encode && do_decode) {
        std::fprintf(stderr,
                     "pngstash: --encode and --decode cannot be combined\n");
        usage(argv[0]);
        return 2;
    }
    const bool encode_ready = do_encode && !out_path.empty()
                              && (have_message || !payload_path.empty());
    const bool decode_ready = do_decode && (!out_path.empty() || dump);
    if (!encode_ready && !decode_ready && !do_list) {
        usage(argv[0]);
        return 2;
    }

    if (show_build_info) {
        print_build_info_header();
    }

    const char* path = png_path.c_str();
    std::vector<std::byte> file_bytes;
    const ReadFileStatus read_status = read_file_bytes(path, max_file_bytes,
                                                       &file_bytes);
    if (read_status != ReadFileStatus::Ok) {
        std::fprintf(stderr, "pngstash: %s: %s\n", path,
                     read_file_status_name(read_status));
        return 1;
    }

    PngImage image;
    const PngDecodeResult decoded = decode_png(file_bytes, &image,
                                               decode_options);
    if (decoded.status != PngStatus::Ok) {
        print_decode_failure(path, decoded);
        return 1;
    }

    if (do_list) {
        print_chunk_table(path, image);
    }

    if (encode_ready) {
        std::vector<std::byte> payload;
        if (have_message) {
            const std::span<const std::byte> text(
                reinterpret_cast<const std::byte*>(message.data()),
                message.size());
            payload.assign(text.begin(), text.end());
        } else {
            const ReadFileStatus st = read_file_bytes(payload_path.c_str(), 0,
                                                      &payload);
            if (st != ReadFileStatus::Ok) {
                std::fprintf(stderr, "pngstash: %s: %s\n",
                             payload_path.c_str(), read_file_status_name(st));
                return 1;
            }
        }

        const PngEmbedResult embedded = embed_payload(&image, payload,
                                                      embed_options);
        if (embedded.status != PngStatus::Ok) {
            std::fprintf(stderr, "pngstash: %s: embed=%s\n", path,
                         png_status_name(embedded.status));
            return 1;
        }

        std::vector<std::byte> out;
        const PngEncodeResult encoded = encode_png(image, &out);
        if (encoded.status != PngStatus::Ok) {
            std::fprintf(stderr, "pngstash: %s: encode=%s\n", path,
                         png_status_name(encoded.status));
            return 1;
        }
        if (!force && file_exists(out_path)) {
            std::fprintf(stderr, "pngstash: exists: %s (use --force)\n",
                         out_path.c_str());
            return 1;
        }
        if (!write_file_bytes(out_path, out)) {
            std::fprintf(stderr, "pngstash: write failed: %s\n",
                         out_path.c_str());
            return 1;
        }
        std::printf("[+] %s written (chunk=%u payload=%zu bytes)\n",
                    out_path.c_str(), embedded.chunk_index, payload.size());
        return 0;
    }

    if (decode_ready) {
        std::vector<std::byte> payload;
        const PngExtractResult extracted = extract_payload(image, &payload,
                                                           extract_options);
        if (extracted.status != PngStatus::Ok) {
            std::fprintf(stderr, "pngstash: %s: extract=%s\n", path,
                         png_status_name(extracted.status));
            return 1;
        }

        if (!out_path.empty()) {
            if (!force && file_exists(out_path)) {
                std::fprintf(stderr, "pngstash: exists: %s (use --force)\n",
                             out_path.c_str());
                return 1;
            }
            if (!write_file_bytes(out_path, payload)) {
                std::fprintf(stderr, "pngstash: write failed: %s\n",
                             out_path.c_str());
                return 1;
            }
            std::printf("[+] %s written\n", out_path.c_str());
        }
        if (dump) {
            const std::string_view text(
                reinterpret_cast<const char*>(payload.data()), payload.size());
            std::string escaped;
            (void)append_console_escaped_ascii(text, 0, &escaped);
            std::printf("DATA:\n %s\n", escaped.c_str());
        }
    }

    return 0;
}
