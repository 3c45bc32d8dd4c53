#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

class Downloader;

// Number of lines after the filename's line searched for its checksum.
inline constexpr size_t CHECKSUM_WINDOW_LINES = 5;

// Calculates the lowercase hex SHA256 of a file.
// Throws GosetupException(ChecksumMismatch) if the file cannot be read.
std::string calculate_sha256(const std::filesystem::path& file_path);

// Finds the first standalone 64-hex-digit token following `filename` in an
// index page, looking at the rest of the filename's line and the next
// CHECKSUM_WINDOW_LINES lines. Returned lowercase.
std::optional<std::string> find_checksum_in_index(std::string_view page, std::string_view filename);

bool checksums_equal(std::string_view a, std::string_view b);

class ChecksumVerifier {
public:
    ChecksumVerifier(Downloader& downloader, std::string index_url);

    // Always fetches the index again; never reuses an earlier page.
    std::string fetch_expected(const std::string& filename);
    void verify(const std::filesystem::path& file_path, const std::string& expected);

private:
    Downloader& downloader_;
    std::string index_url_;
};
