#include "opencbor/build_info.h"

#include "opencbor/build_info_generated.h"

#include <string>

namespace opencbor {
namespace {

    static constexpr LibraryLinkage kLinkage =
#if defined(OPENCBOR_BUILD_LINKAGE_SHARED) && OPENCBOR_BUILD_LINKAGE_SHARED
        LibraryLinkage::Shared;
#elif defined(OPENCBOR_BUILD_LINKAGE_STATIC) && OPENCBOR_BUILD_LINKAGE_STATIC
        LibraryLinkage::Static;
#else
        LibraryLinkage::Unknown;
#endif

    static constexpr BuildInfo kBuildInfo = {
        OPENCBOR_VERSION_STRING,
        OPENCBOR_BUILDINFO_TIMESTAMP_UTC,
        OPENCBOR_BUILDINFO_BUILD_TYPE,
        OPENCBOR_BUILDINFO_COMPILER,
        OPENCBOR_BUILDINFO_PLATFORM,
        kLinkage,
    };

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


const char*
library_linkage_name(LibraryLinkage linkage) noexcept
{
    switch (linkage) {
    case LibraryLinkage::Static: return "static";
    case LibraryLinkage::Shared: return "shared";
    case LibraryLinkage::Unknown: break;
    }
    return "unknown";
}


void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2)
{
    if (line1) {
        *line1 = "OpenCbor v";
        line1->append(info.version);
        line1->push_back(' ');
        line1->append(info.build_type);
        line1->push_back(' ');
        line1->append(library_linkage_name(info.linkage));
    }
    if (line2) {
        *line2 = "built with ";
        line2->append(info.compiler);
        line2->append(" for ");
        line2->append(info.platform);
        if (!info.timestamp_utc.empty()) {
            line2->append(" (");
            line2->append(info.timestamp_utc);
            line2->push_back(')');
        }
    }
}

}  // namespace opencbor
