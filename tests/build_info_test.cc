#include "opencbor/build_info.h"

#include <gtest/gtest.h>

#include <string>

namespace opencbor {

TEST(BuildInfo, FormatsBannerLines)
{
    BuildInfo bi;
    bi.version    = "1.2.3";
    bi.build_type = "Release";
    bi.compiler   = "GNU-13.2.0";
    bi.platform   = "Linux/x86_64";
    bi.linkage    = LibraryLinkage::Static;

    std::string line1;
    std::string line2;
    format_build_info_lines(bi, &line1, &line2);
    EXPECT_EQ(line1, "OpenCbor v1.2.3 Release static");
    EXPECT_EQ(line2, "built with GNU-13.2.0 for Linux/x86_64");

    bi.timestamp_utc = "2024-01-02T03:04:05Z";
    format_build_info_lines(bi, nullptr, &line2);
    EXPECT_EQ(line2,
              "built with GNU-13.2.0 for Linux/x86_64 (2024-01-02T03:04:05Z)");
}


TEST(BuildInfo, LinkageNames)
{
    EXPECT_STREQ(library_linkage_name(LibraryLinkage::Static), "static");
    EXPECT_STREQ(library_linkage_name(LibraryLinkage::Shared), "shared");
    EXPECT_STREQ(library_linkage_name(LibraryLinkage::Unknown), "unknown");
}


TEST(BuildInfo, LinkedLibraryIsStamped)
{
    const BuildInfo& bi = build_info();
    EXPECT_FALSE(bi.version.empty());
    EXPECT_NE(bi.linkage, LibraryLinkage::Unknown);

    std::string line1;
    format_build_info_lines(bi, &line1, nullptr);
    EXPECT_EQ(line1.rfind("OpenCbor v", 0), 0U);
}

}  // namespace opencbor
