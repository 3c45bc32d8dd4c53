#include "localization.hpp"
#include "utils.hpp"

#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_map>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX - 1);
        if (count != -1) {
            result[count] = '\0';
            return fs::path(result).parent_path();
        }
        return fs::current_path();
    }

    bool load_strings(const std::string& lang, const fs::path& base_dir) {
        std::ifstream file(base_dir / (lang + ".txt"));
        if (!file.is_open()) {
            if (lang != "en") {
                log_warning("Could not open localization file for " + lang + ", falling back to English.");
                return load_strings("en", base_dir);
            }
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
        return true;
    }
}

void init_localization() {
    if (!translations.empty()) return;

    const char* lang_env = std::getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).starts_with("zh")) {
        lang = "zh";
    }

    const fs::path exec_dir = get_executable_dir();
    for (const fs::path& candidate : {exec_dir / ".." / "l10n", exec_dir / "l10n", fs::path(GOSETUP_L10N_DIR)}) {
        if (fs::is_directory(candidate) && load_strings(lang, candidate)) {
            return;
        }
    }
    log_warning("No localization files found; messages will show their keys.");
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
