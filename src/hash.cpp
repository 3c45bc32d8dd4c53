#include "hash.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

void throw_openssl(const char* key) {
    throw GosetupException(ErrorKind::ChecksumMismatch, get_string(key));
}

} // anonymous namespace

std::string calculate_sha256(const fs::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw GosetupException(ErrorKind::ChecksumMismatch, string_format("error.open_file_failed", file_path.string()));
    }

    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw_openssl("error.openssl_ctx_failed");
    }

    if (EVP_DigestInit_ex(md_ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw_openssl("error.openssl_init_failed");
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(md_ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            throw_openssl("error.openssl_update_failed");
        }
        if (file.eof()) break;
    }
    if (file.bad()) {
        throw GosetupException(ErrorKind::ChecksumMismatch, string_format("error.read_file_failed", file_path.string()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(md_ctx.get(), hash, &hash_len) != 1) {
        throw_openssl("error.openssl_final_failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::optional<std::string> find_checksum_in_index(std::string_view page, std::string_view filename) {
    static const std::regex hex_token(R"((?:^|[^0-9a-fA-F])([0-9a-fA-F]{64})(?![0-9a-fA-F]))");

    if (filename.empty()) return std::nullopt;

    size_t pos = page.find(filename);
    while (pos != std::string_view::npos) {
        size_t end = pos + filename.size();
        for (size_t lines = 0; end < page.size() && lines <= CHECKSUM_WINDOW_LINES; ++lines) {
            size_t nl = page.find('\n', end);
            end = (nl == std::string_view::npos) ? page.size() : nl + 1;
        }

        const std::string window(page.substr(pos + filename.size(), end - pos - filename.size()));
        std::smatch match;
        if (std::regex_search(window, match, hex_token)) {
            return to_lower(match[1].str());
        }
        pos = page.find(filename, pos + filename.size());
    }
    return std::nullopt;
}

bool checksums_equal(std::string_view a, std::string_view b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

ChecksumVerifier::ChecksumVerifier(Downloader& downloader, std::string index_url)
    : downloader_(downloader), index_url_(std::move(index_url)) {}

std::string ChecksumVerifier::fetch_expected(const std::string& filename) {
    std::string page;
    try {
        page = downloader_.fetch_text(index_url_);
    } catch (const GosetupException& e) {
        throw GosetupException(ErrorKind::ChecksumFetchError,
            string_format("error.checksum_page_failed", index_url_) + ": " + e.what());
    }

    auto checksum = find_checksum_in_index(page, filename);
    if (!checksum) {
        throw GosetupException(ErrorKind::ChecksumFetchError, string_format("error.checksum_not_found", filename));
    }
    return *checksum;
}

void ChecksumVerifier::verify(const fs::path& file_path, const std::string& expected) {
    log_info(get_string("info.computing_checksum"));
    const std::string actual = calculate_sha256(file_path);
    if (!checksums_equal(actual, expected)) {
        throw GosetupException(ErrorKind::ChecksumMismatch,
            string_format("error.checksum_mismatch", file_path.filename().string(), expected, actual));
    }
}
