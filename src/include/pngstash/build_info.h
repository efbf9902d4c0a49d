#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how pngstash was built.
 */

namespace pngstash {

/**
 * \brief pngstash build information.
 *
 * Values are compiled into the binary at build time, except
 * \ref zlib_runtime_version which is queried from the linked zlib.
 */
struct BuildInfo final {
    /// pngstash version string (e.g. "0.2.0").
    std::string_view version;

    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;

    /// Build type string (e.g. "Release", "Debug", "multi-config").
    std::string_view build_type;

    /// CMake generator used to configure the build (e.g. "Ninja").
    std::string_view cmake_generator;

    /// Target platform and CPU architecture.
    std::string_view system_name;
    std::string_view system_processor;

    /// Compiler ID, version and executable path.
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;
    std::string_view cxx_compiler;

    /// True if this binary was built from the static library target.
    bool linkage_static = false;
    /// True if this binary was built from the shared library target.
    bool linkage_shared = false;

    /// zlib headers the CRC engine was compiled against.
    std::string_view zlib_header_version;
    /// zlib library loaded at runtime.
    std::string_view zlib_runtime_version;
};

/// Returns build information for the linked pngstash library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `pngstash vX.Y.Z <build_type> [zlib X.Y.Z] <linkage>`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Convenience overload for the linked pngstash library build.
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace pngstash
