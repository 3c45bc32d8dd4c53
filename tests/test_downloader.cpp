#include <gtest/gtest.h>
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "test_support.hpp"

#include <curl/curl.h>

#include <filesystem>

namespace fs = std::filesystem;

class DownloaderTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;
    CurlDownloader downloader{false};

    static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    static void TearDownTestSuite() { curl_global_cleanup(); }

    void SetUp() override {
        init_localization();
        suite_work_dir = fs::absolute("tmp_downloader_test");
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        fs::create_directories(suite_work_dir);
    }

    void TearDown() override {
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }

    std::string file_url(const fs::path& p) const {
        return "file://" + p.string();
    }
};

TEST_F(DownloaderTest, DownloadFile) {
    const fs::path src = suite_work_dir / "source.bin";
    const fs::path dst = suite_work_dir / "copy.bin";
    std::string payload(100000, 'g');
    payload += "end";
    write_file(src, payload);

    downloader.download_file(file_url(src), dst);
    EXPECT_EQ(read_file(dst), payload);
}

TEST_F(DownloaderTest, FetchText) {
    const fs::path src = suite_work_dir / "index.html";
    write_file(src, "<html>go1.20.12</html>\n");
    EXPECT_EQ(downloader.fetch_text(file_url(src)), "<html>go1.20.12</html>\n");
}

TEST_F(DownloaderTest, FailedDownloadLeavesNoPartialFile) {
    const fs::path dst = suite_work_dir / "copy.bin";
    try {
        downloader.download_file(file_url(suite_work_dir / "missing.bin"), dst);
        FAIL() << "expected DownloadError";
    } catch (const GosetupException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DownloadError);
    }
    EXPECT_FALSE(fs::exists(dst));
}

TEST_F(DownloaderTest, UnwritableDestination) {
    const fs::path src = suite_work_dir / "source.bin";
    write_file(src, "data");
    EXPECT_THROW(downloader.download_file(file_url(src), suite_work_dir / "no" / "such" / "dir" / "f"), GosetupException);
}

TEST_F(DownloaderTest, FetchTextFailure) {
    EXPECT_THROW(downloader.fetch_text(file_url(suite_work_dir / "missing.html")), GosetupException);
}

TEST_F(DownloaderTest, TransportSupportsHttps) {
    EXPECT_NO_THROW(check_transport_support());
}

TEST_F(DownloaderTest, FailureOnCloseRemovesOutput) {
    if (!fs::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    const fs::path src = suite_work_dir / "source.bin";
    write_file(src, "data");
    // Small enough to stay buffered until close, which then hits ENOSPC.
    const fs::path dst = suite_work_dir / "full";
    fs::create_symlink("/dev/full", dst);

    try {
        downloader.download_file(file_url(src), dst);
        FAIL() << "expected DownloadError";
    } catch (const GosetupException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DownloadError);
    }
    EXPECT_FALSE(fs::exists(fs::symlink_status(dst)));
    EXPECT_TRUE(fs::exists("/dev/full"));
}
