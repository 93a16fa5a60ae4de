#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Version and toolchain stamp printed by cbordump and the Python
 * module.
 */

namespace opencbor {

/// How the opencbor library target was linked into this binary.
enum class LibraryLinkage : uint8_t {
    Unknown,
    Static,
    Shared,
};

/// Values baked in by CMake at configure time.
struct BuildInfo final {
    std::string_view version;
    /// ISO-8601 UTC, empty when OPENCBOR_BUILDINFO_TIMESTAMP was off.
    std::string_view timestamp_utc;
    /// CMAKE_BUILD_TYPE, "multi-config" or "unspecified".
    std::string_view build_type;
    /// `<compiler id>-<compiler version>`, e.g. "GNU-13.2.0".
    std::string_view compiler;
    /// `<system>/<processor>`, e.g. "Linux/x86_64".
    std::string_view platform;
    LibraryLinkage linkage = LibraryLinkage::Unknown;
};

const BuildInfo&
build_info() noexcept;

/// Returns "static", "shared" or "unknown".
const char*
library_linkage_name(LibraryLinkage linkage) noexcept;

/**
 * \brief Formats the two-line banner for \p info.
 *
 * - `OpenCbor v<version> <build_type> <linkage>`
 * - `built with <compiler> for <platform>`, plus ` (<timestamp>)` when set
 *
 * Either output may be null.
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2);

}  // namespace opencbor
