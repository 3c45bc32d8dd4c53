#include "version.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <regex>
#include <vector>

ReleaseVersion validate_version(const std::string& version) {
    static const std::regex version_regex(R"(^(\d+)\.(\d+)\.(\d+)$)");
    std::smatch match;
    if (!std::regex_match(version, match, version_regex)) {
        throw GosetupException(ErrorKind::InvalidVersionFormat, string_format("error.invalid_version_format", version));
    }

    unsigned components[3];
    for (size_t i = 0; i < 3; ++i) {
        unsigned long value = 0;
        try {
            value = std::stoul(match[i + 1].str());
        } catch (const std::out_of_range&) {
            throw GosetupException(ErrorKind::InvalidVersionFormat, string_format("error.invalid_version_format", version));
        }
        if (value > std::numeric_limits<unsigned>::max()) {
            throw GosetupException(ErrorKind::InvalidVersionFormat, string_format("error.invalid_version_format", version));
        }
        components[i] = static_cast<unsigned>(value);
    }

    ReleaseVersion result;
    result.major = components[0];
    result.minor = components[1];
    result.patch = components[2];
    result.text = version;
    return result;
}

bool version_compare(const std::string& v1_str, const std::string& v2_str) {
    std::regex re_dot("[.]");
    std::vector<std::string> p1{std::sregex_token_iterator(v1_str.begin(), v1_str.end(), re_dot, -1), std::sregex_token_iterator()};
    std::vector<std::string> p2{std::sregex_token_iterator(v2_str.begin(), v2_str.end(), re_dot, -1), std::sregex_token_iterator()};

    size_t len = std::max(p1.size(), p2.size());
    for (size_t i = 0; i < len; ++i) {
        unsigned long n1 = (i < p1.size() && !p1[i].empty()) ? std::stoul(p1[i]) : 0;
        unsigned long n2 = (i < p2.size() && !p2[i].empty()) ? std::stoul(p2[i]) : 0;
        if (n1 < n2) return true;
        if (n1 > n2) return false;
    }
    return false; // equal
}

std::string artifact_filename(const ReleaseVersion& version, const std::string& platform) {
    return std::string(DISTRIBUTION_NAME) + version.str() + "." + platform + ".tar.gz";
}

VersionResolver::VersionResolver(Downloader& downloader, std::string index_url, std::string platform)
    : downloader_(downloader), index_url_(std::move(index_url)), platform_(std::move(platform)) {}

ReleaseVersion VersionResolver::resolve_latest() {
    std::string page;
    try {
        page = downloader_.fetch_text(index_url_);
    } catch (const GosetupException& e) {
        throw GosetupException(ErrorKind::ResolutionError,
            string_format("error.fetch_latest_failed", index_url_) + ": " + e.what());
    }

    std::string escaped_platform = std::regex_replace(platform_, std::regex(R"([.^$|()\[\]{}*+?\\-])"), R"(\$&)");
    const std::regex artifact_regex(std::string(DISTRIBUTION_NAME) + R"(([0-9]+\.[0-9]+\.[0-9]+)\.)" + escaped_platform + R"(\.tar\.gz)");

    std::optional<ReleaseVersion> latest;
    for (auto it = std::sregex_iterator(page.begin(), page.end(), artifact_regex); it != std::sregex_iterator(); ++it) {
        ReleaseVersion candidate;
        try {
            candidate = validate_version((*it)[1].str());
        } catch (const GosetupException&) {
            log_warning(string_format("warning.skipping_release", (*it)[0].str()));
            continue;
        }
        if (!latest || version_compare(latest->str(), candidate.str())) {
            latest = std::move(candidate);
        }
    }

    if (!latest) {
        throw GosetupException(ErrorKind::ResolutionError, string_format("error.no_matching_release", platform_));
    }
    return *latest;
}

std::string VersionResolver::prompt_or_default(const ReleaseVersion& latest, const std::optional<std::string>& user_input) {
    if (!user_input) {
        return latest.str();
    }
    std::string selected = trim(*user_input);
    return selected.empty() ? latest.str() : selected;
}
