#include <gtest/gtest.h>
#include "version.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "test_support.hpp"

namespace {
    const std::string MIRROR = "https://go.example/dl/";
}

class VersionTest : public ::testing::Test {
protected:
    FakeDownloader downloader;

    void SetUp() override {
        init_localization();
    }
};

TEST(VersionCompareTest, Comparisons) {
    EXPECT_TRUE(version_compare("1.20.1", "1.20.12"));
    EXPECT_TRUE(version_compare("1.9.0", "1.10.0"));
    EXPECT_FALSE(version_compare("1.21.0", "1.20.12"));
    EXPECT_FALSE(version_compare("1.20.12", "1.20.12")); // strictly less
    EXPECT_TRUE(version_compare("1.20", "1.20.1"));
}

TEST_F(VersionTest, ValidateAcceptsThreeComponents) {
    ReleaseVersion v = validate_version("1.20.12");
    EXPECT_EQ(v.major, 1u);
    EXPECT_EQ(v.minor, 20u);
    EXPECT_EQ(v.patch, 12u);
    EXPECT_EQ(v.str(), "1.20.12");
}

TEST_F(VersionTest, ValidateRejectsOtherShapes) {
    for (const std::string bad : {"1.20", "1.20.12.1", "v1.20.12", "1.20.x", "", " 1.20.12", "1.21rc1", "1..2"}) {
        try {
            validate_version(bad);
            FAIL() << "accepted '" << bad << "'";
        } catch (const GosetupException& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidVersionFormat) << bad;
        }
    }
}

TEST_F(VersionTest, ValidateRejectsOverflowingComponent) {
    EXPECT_THROW(validate_version("1.99999999999999999999.0"), GosetupException);
}

TEST_F(VersionTest, ArtifactFilename) {
    EXPECT_EQ(artifact_filename(validate_version("1.20.12"), "linux-amd64"), "go1.20.12.linux-amd64.tar.gz");
    EXPECT_EQ(artifact_filename(validate_version("1.21.0"), "darwin-arm64"), "go1.21.0.darwin-arm64.tar.gz");
}

TEST_F(VersionTest, ResolveLatestPicksNewestForPlatform) {
    downloader.pages[MIRROR] = index_page({
        {"go1.9.7.linux-amd64.tar.gz", std::string(64, 'a')},
        {"go1.20.12.linux-amd64.tar.gz", std::string(64, 'b')},
        {"go1.10.8.linux-amd64.tar.gz", std::string(64, 'c')},
        {"go1.22.0.linux-arm64.tar.gz", std::string(64, 'd')},
        {"go1.22.0.linux-amd64.msi", std::string(64, 'e')},
    });

    VersionResolver resolver(downloader, MIRROR, "linux-amd64");
    EXPECT_EQ(resolver.resolve_latest().str(), "1.20.12");
}

TEST_F(VersionTest, ResolveLatestWithoutMatchFails) {
    downloader.pages[MIRROR] = index_page({{"go1.22.0.darwin-arm64.tar.gz", std::string(64, 'a')}});

    VersionResolver resolver(downloader, MIRROR, "linux-amd64");
    try {
        resolver.resolve_latest();
        FAIL() << "expected ResolutionError";
    } catch (const GosetupException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ResolutionError);
    }
}

TEST_F(VersionTest, ResolveLatestFetchFailure) {
    VersionResolver resolver(downloader, MIRROR, "linux-amd64");
    try {
        resolver.resolve_latest();
        FAIL() << "expected ResolutionError";
    } catch (const GosetupException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ResolutionError);
    }
}

TEST_F(VersionTest, PromptOrDefault) {
    const ReleaseVersion latest = validate_version("1.20.12");
    EXPECT_EQ(VersionResolver::prompt_or_default(latest, std::nullopt), "1.20.12");
    EXPECT_EQ(VersionResolver::prompt_or_default(latest, std::string("")), "1.20.12");
    EXPECT_EQ(VersionResolver::prompt_or_default(latest, std::string("   \t")), "1.20.12");
    EXPECT_EQ(VersionResolver::prompt_or_default(latest, std::string(" 1.19.3\n")), "1.19.3");
    // Not validated here.
    EXPECT_EQ(VersionResolver::prompt_or_default(latest, std::string("abc")), "abc");
}

TEST_F(VersionTest, ValidateRejectsComponentWiderThanUnsigned) {
    try {
        validate_version("1.4294967296.0");
        FAIL() << "expected InvalidVersionFormat";
    } catch (const GosetupException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidVersionFormat);
    }
    EXPECT_EQ(validate_version("1.4294967295.0").minor, 4294967295u);
}

TEST_F(VersionTest, ResolveLatestSkipsOversizedEntries) {
    downloader.pages[MIRROR] = index_page({
        {"go1.20.12.linux-amd64.tar.gz", std::string(64, 'a')},
        {"go99999999999999999999.0.0.linux-amd64.tar.gz", std::string(64, 'b')},
        {"go1.4294967296.0.linux-amd64.tar.gz", std::string(64, 'c')},
    });

    VersionResolver resolver(downloader, MIRROR, "linux-amd64");
    EXPECT_EQ(resolver.resolve_latest().str(), "1.20.12");
}

TEST_F(VersionTest, ResolveLatestWithOnlyOversizedEntriesFails) {
    downloader.pages[MIRROR] = index_page({{"go99999999999999999999.0.0.linux-amd64.tar.gz", std::string(64, 'b')}});

    VersionResolver resolver(downloader, MIRROR, "linux-amd64");
    try {
        resolver.resolve_latest();
        FAIL() << "expected ResolutionError";
    } catch (const GosetupException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ResolutionError);
    }
}
