#include "pngstash/build_info.h"
#include "pngstash/png_chunk.h"
#include "pngstash/png_crc.h"
#include "pngstash/png_payload.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace pngstash {
namespace {

    static std::span<const std::byte> py_bytes_span(const nb::bytes& data)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.data()), data.size());
    }


    static nb::bytes to_py_bytes(std::span<const std::byte> bytes)
    {
        return nb::bytes(reinterpret_cast<const char*>(bytes.data()),
                         bytes.size());
    }


    [[noreturn]] static void raise_status(const char* what, PngStatus status)
    {
        std::string msg(what);
        msg.append(": ");
        msg.append(png_status_name(status));
        throw std::runtime_error(msg);
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static PngImage decode_py(nb::bytes data, bool verify_crc,
                              uint64_t max_total_bytes)
    {
        PngDecodeOptions options;
        options.verify_crc             = verify_crc;
        options.limits.max_total_bytes = max_total_bytes;

        const std::span<const std::byte> bytes = py_bytes_span(data);
        PngImage image;
        PngDecodeResult res;
        {
            nb::gil_scoped_release gil_release;
            res = decode_png(bytes, &image, options);
        }
        if (res.status != PngStatus::Ok) {
            raise_status("PNG decode failed", res.status);
        }
        return image;
    }


    static nb::bytes encode_py(const PngImage& image)
    {
        std::vector<std::byte> out;
        PngEncodeResult res;
        {
            nb::gil_scoped_release gil_release;
            res = encode_png(image, &out);
        }
        if (res.status != PngStatus::Ok) {
            raise_status("PNG encode failed", res.status);
        }
        return to_py_bytes(out);
    }


    static uint32_t embed_py(PngImage& image, nb::bytes payload,
                             uint32_t chunk_type)
    {
        PngEmbedOptions options;
        options.chunk_type       = chunk_type;
        const PngEmbedResult res = embed_payload(&image,
                                                 py_bytes_span(payload),
                                                 options);
        if (res.status != PngStatus::Ok) {
            raise_status("embed failed", res.status);
        }
        return res.chunk_index;
    }


    static nb::bytes extract_py(const PngImage& image, uint32_t chunk_type,
                                PayloadLookup lookup)
    {
        PngExtractOptions options;
        options.chunk_type = chunk_type;
        options.lookup     = lookup;

        std::vector<std::byte> out;
        const PngExtractResult res = extract_payload(image, &out, options);
        if (res.status != PngStatus::Ok) {
            raise_status("extract failed", res.status);
        }
        return to_py_bytes(out);
    }


    static uint32_t fourcc_py(std::string_view s)
    {
        if (s.size() != 4U) {
            throw std::invalid_argument("chunk type must be 4 characters");
        }
        return fourcc(s[0], s[1], s[2], s[3]);
    }

}  // namespace
}  // namespace pngstash


NB_MODULE(_pngstash, m)
{
    using namespace pngstash;

    m.doc() = "pngstash: embed and recover payload chunks in PNG streams";

    nb::enum_<PngStatus>(m, "PngStatus")
        .value("Ok", PngStatus::Ok)
        .value("OutputTruncated", PngStatus::OutputTruncated)
        .value("IoError", PngStatus::IoError)
        .value("FormatError", PngStatus::FormatError)
        .value("CrcMismatch", PngStatus::CrcMismatch)
        .value("MarkerNotFound", PngStatus::MarkerNotFound)
        .value("EmbedWithoutAnchor", PngStatus::EmbedWithoutAnchor)
        .value("InvalidChunkType", PngStatus::InvalidChunkType)
        .value("LimitExceeded", PngStatus::LimitExceeded);

    nb::enum_<PayloadLookup>(m, "PayloadLookup")
        .value("Index", PayloadLookup::Index)
        .value("Scan", PayloadLookup::Scan)
        .value("IndexThenScan", PayloadLookup::IndexThenScan);

    nb::class_<PngChunk>(m, "PngChunk")
        .def_ro("length", &PngChunk::length)
        .def_ro("type", &PngChunk::type)
        .def_ro("crc", &PngChunk::crc)
        .def_prop_ro("data",
                     [](const PngChunk& c) { return to_py_bytes(c.data); });

    nb::class_<PngImage>(m, "PngImage")
        .def(nb::init<>())
        .def_prop_ro("chunks",
                     [](const PngImage& img) { return img.chunks; })
        .def_ro("has_insertion_point", &PngImage::has_insertion_point)
        .def_ro("insertion_index", &PngImage::insertion_index)
        .def("append_chunk",
             [](PngImage& img, uint32_t type, nb::bytes data) {
                 const PngStatus st = append_png_chunk(&img, type,
                                                       py_bytes_span(data));
                 if (st != PngStatus::Ok) {
                     raise_status("append failed", st);
                 }
             },
             "type"_a, "data"_a)
        .def("remove_payloads",
             [](PngImage& img, uint32_t type) {
                 return remove_payload_chunks(&img, type);
             },
             "chunk_type"_a = kPngStashChunkType);

    m.attr("STASH_CHUNK_TYPE") = kPngStashChunkType;

    m.def("fourcc", &fourcc_py, "text"_a);
    m.def("info", &info_lines);
    m.def("decode", &decode_py, "data"_a, "verify_crc"_a = false,
          "max_total_bytes"_a = kPngUntrustedMaxTotalBytes);
    m.def("encode", &encode_py, "image"_a);
    m.def("embed", &embed_py, "image"_a, "payload"_a,
          "chunk_type"_a = kPngStashChunkType);
    m.def("extract", &extract_py, "image"_a,
          "chunk_type"_a = kPngStashChunkType,
          "lookup"_a     = PayloadLookup::IndexThenScan);
    m.def("chunk_crc",
          [](uint32_t type, nb::bytes data) {
              return png_chunk_crc(type, py_bytes_span(data));
          },
          "type"_a, "data"_a);
}
