#include "pngstash/build_info.h"

#include "pngstash/build_info_generated.h"

#include <string>
#include <zlib.h>

namespace pngstash {
namespace {

    static constexpr bool linkage_static() noexcept
    {
#if defined(PNGSTASH_BUILD_LINKAGE_STATIC) && PNGSTASH_BUILD_LINKAGE_STATIC
        return true;
#else
        return false;
#endif
    }

    static constexpr bool linkage_shared() noexcept
    {
#if defined(PNGSTASH_BUILD_LINKAGE_SHARED) && PNGSTASH_BUILD_LINKAGE_SHARED
        return true;
#else
        return false;
#endif
    }

    static BuildInfo make_build_info() noexcept
    {
        BuildInfo bi;
        bi.version              = PNGSTASH_BUILDINFO_VERSION;
        bi.build_timestamp_utc  = PNGSTASH_BUILDINFO_BUILD_TIMESTAMP_UTC;
        bi.build_type           = PNGSTASH_BUILDINFO_BUILD_TYPE;
        bi.cmake_generator      = PNGSTASH_BUILDINFO_CMAKE_GENERATOR;
        bi.system_name          = PNGSTASH_BUILDINFO_SYSTEM_NAME;
        bi.system_processor     = PNGSTASH_BUILDINFO_SYSTEM_PROCESSOR;
        bi.cxx_compiler_id      = PNGSTASH_BUILDINFO_CXX_COMPILER_ID;
        bi.cxx_compiler_version = PNGSTASH_BUILDINFO_CXX_COMPILER_VERSION;
        bi.cxx_compiler         = PNGSTASH_BUILDINFO_CXX_COMPILER;
        bi.linkage_static       = linkage_static();
        bi.linkage_shared       = linkage_shared();
        bi.zlib_header_version  = ZLIB_VERSION;
        const char* runtime     = zlibVersion();
        bi.zlib_runtime_version = runtime ? runtime : "";
        return bi;
    }


    static const char* linkage_string(const BuildInfo& bi) noexcept
    {
        if (bi.linkage_static) {
            return "static";
        }
        if (bi.linkage_shared) {
            return "shared";
        }
        return "unknown";
    }


    static void append_sv(std::string* out, std::string_view s) noexcept
    {
        if (!out) {
            return;
        }
        out->append(s.data(), s.size());
    }

}  // namespace


const BuildInfo&
build_info() noexcept
{
    static const BuildInfo kBuildInfo = make_build_info();
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->reserve(128);
        line1->append("pngstash v");
        append_sv(line1, bi.version);
        line1->append(" ");
        append_sv(line1, bi.build_type);
        line1->append(" [zlib ");
        append_sv(line1, bi.zlib_runtime_version.empty()
                             ? bi.zlib_header_version
                             : bi.zlib_runtime_version);
        line1->append("] ");
        line1->append(linkage_string(bi));
    }

    if (line2) {
        line2->clear();
        line2->reserve(160);
        line2->append("built with ");
        append_sv(line2, bi.cxx_compiler_id);
        line2->append("-");
        append_sv(line2, bi.cxx_compiler_version);
        line2->append(" for ");
        append_sv(line2, bi.system_name);
        line2->append("/");
        append_sv(line2, bi.system_processor);

        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            append_sv(line2, bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace pngstash
