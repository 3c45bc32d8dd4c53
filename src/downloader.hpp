#pragma once

#include <filesystem>
#include <string>

// Network transport used by the installer. Implementations throw
// GosetupException(ErrorKind::DownloadError) on any failure.
class Downloader {
public:
    virtual ~Downloader() = default;

    virtual void download_file(const std::string& url, const std::filesystem::path& output_path) = 0;
    virtual std::string fetch_text(const std::string& url) = 0;
};

class CurlDownloader : public Downloader {
public:
    explicit CurlDownloader(bool show_progress = true) : show_progress_(show_progress) {}

    void download_file(const std::string& url, const std::filesystem::path& output_path) override;
    std::string fetch_text(const std::string& url) override;

private:
    bool show_progress_;
};

// Throws DependencyMissing when the linked libcurl cannot speak HTTPS.
void check_transport_support();
