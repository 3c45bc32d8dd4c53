#pragma once

#include <optional>
#include <string>

class Downloader;

struct ReleaseVersion {
    unsigned major = 0;
    unsigned minor = 0;
    unsigned patch = 0;
    std::string text;

    const std::string& str() const { return text; }
    bool operator==(const ReleaseVersion& other) const { return text == other.text; }
};

// Throws GosetupException(InvalidVersionFormat) unless `version` is X.Y.Z.
ReleaseVersion validate_version(const std::string& version);

// Strict less-than over dot separated numeric components.
bool version_compare(const std::string& v1_str, const std::string& v2_str);

// go<version>.<platform>.tar.gz
std::string artifact_filename(const ReleaseVersion& version, const std::string& platform);

class VersionResolver {
public:
    VersionResolver(Downloader& downloader, std::string index_url, std::string platform);

    ReleaseVersion resolve_latest();
    static std::string prompt_or_default(const ReleaseVersion& latest, const std::optional<std::string>& user_input);

private:
    Downloader& downloader_;
    std::string index_url_;
    std::string platform_;
};
