#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

size_t write_data_cpp(void* ptr, size_t size, size_t nmemb, void* stream) {
    std::ostream* out = static_cast<std::ostream*>(stream);
    size_t bytes = size * nmemb;
    out->write(static_cast<char*>(ptr), static_cast<std::streamsize>(bytes));
    return out->good() ? bytes : 0;
}

int progress_callback([[maybe_unused]] void* clientp, curl_off_t dltotal, curl_off_t dlnow, [[maybe_unused]] curl_off_t ultotal, [[maybe_unused]] curl_off_t ulnow) {
    if (dltotal <= 0) {
        return 0;
    }
    double percentage = static_cast<double>(dlnow) / static_cast<double>(dltotal) * 100.0;
    log_progress(get_string("info.downloading"), percentage);
    return 0;
}

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

void perform(const std::string& url, std::ostream& out, bool show_progress) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw GosetupException(ErrorKind::DownloadError, string_format("error.download_failed", url));
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_data_cpp);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);

    if (show_progress) {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (show_progress && isatty(STDOUT_FILENO)) {
        std::cout << std::endl;
    }

    if (res != CURLE_OK) {
        throw GosetupException(ErrorKind::DownloadError,
            string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }
}

} // anonymous namespace

void CurlDownloader::download_file(const std::string& url, const fs::path& output_path) {
    {
        std::ofstream ofile(output_path, std::ios::binary);
        if (!ofile) {
            throw GosetupException(ErrorKind::DownloadError, string_format("error.create_file_failed", output_path.string()));
        }
        try {
            perform(url, ofile, show_progress_);
        } catch (const GosetupException&) {
            ofile.close();
            std::error_code ec;
            fs::remove(output_path, ec);
            throw;
        }
        ofile.close();
        if (!ofile) {
            std::error_code ec;
            fs::remove(output_path, ec);
            throw GosetupException(ErrorKind::DownloadError, string_format("error.write_file_failed", output_path.string()));
        }
    }
}

std::string CurlDownloader::fetch_text(const std::string& url) {
    std::ostringstream out;
    perform(url, out, false);
    return out.str();
}

void check_transport_support() {
    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    if (info && info->protocols) {
        for (const char* const* proto = info->protocols; *proto; ++proto) {
            if (std::strcmp(*proto, "https") == 0) {
                return;
            }
        }
    }
    throw GosetupException(ErrorKind::DependencyMissing, get_string("error.https_unsupported"));
}
