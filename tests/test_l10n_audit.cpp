#include <gtest/gtest.h>
#include "localization.hpp"

#include <filesystem>
#include <fstream>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class L10nIntegrityTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }

    std::set<std::string> extract_keys_from_source(const fs::path& src_dir) {
        std::set<std::string> keys;
        // Any string literal shaped like a message key counts, including
        // keys passed around as arguments before being looked up.
        std::regex key_regex("\"((?:error|info|warning|prompt|help)\\.[a-z0-9_]+)\"");

        for (auto const& dir_entry : fs::recursive_directory_iterator(src_dir)) {
            if (dir_entry.is_regular_file() && (dir_entry.path().extension() == ".cpp" || dir_entry.path().extension() == ".hpp")) {
                std::ifstream f(dir_entry.path());
                std::string line;
                while (std::getline(f, line)) {
                    if (line.starts_with("#include")) continue;  // "prompt.hpp" looks like a key
                    for (auto i = std::sregex_iterator(line.begin(), line.end(), key_regex); i != std::sregex_iterator(); ++i) {
                        keys.insert((*i)[1].str());
                    }
                }
            }
        }
        return keys;
    }

    std::set<std::string> keys_in_file(const fs::path& file) {
        std::set<std::string> keys;
        std::ifstream f(file);
        std::string line;
        while (std::getline(f, line)) {
            if (line.empty() || line[0] == '#') continue;
            size_t pos = line.find('=');
            if (pos != std::string::npos) keys.insert(line.substr(0, pos));
        }
        return keys;
    }
};

TEST_F(L10nIntegrityTest, AllSourceKeysExistInTranslations) {
    const fs::path project_root = GOSETUP_SOURCE_DIR;
    auto source_keys = extract_keys_from_source(project_root / "src");
    ASSERT_FALSE(source_keys.empty());

    std::vector<std::string> missing_keys;
    for (const auto& key : source_keys) {
        const std::string& val = get_string(key);
        if (val.find("[MISSING_STRING:") != std::string::npos) {
            missing_keys.push_back(key);
        }
    }

    std::string error_msg = "The following keys are missing in localization files: ";
    for (const auto& k : missing_keys) error_msg += k + ", ";

    EXPECT_TRUE(missing_keys.empty()) << error_msg;
}

TEST_F(L10nIntegrityTest, TranslationsShareKeys) {
    const fs::path l10n_dir = fs::path(GOSETUP_SOURCE_DIR) / "l10n";
    const auto en = keys_in_file(l10n_dir / "en.txt");
    const auto zh = keys_in_file(l10n_dir / "zh.txt");
    ASSERT_FALSE(en.empty());
    EXPECT_EQ(en, zh);
}

TEST_F(L10nIntegrityTest, BuildTreeCopiesMatchSources) {
    // Tests run from the build directory.
    const fs::path build_l10n = fs::current_path() / "l10n";
    const fs::path source_l10n = fs::path(GOSETUP_SOURCE_DIR) / "l10n";
    for (const char* name : {"en.txt", "zh.txt"}) {
        std::ifstream built(build_l10n / name), source(source_l10n / name);
        ASSERT_TRUE(built.is_open()) << name;
        std::string built_text((std::istreambuf_iterator<char>(built)), std::istreambuf_iterator<char>());
        std::string source_text((std::istreambuf_iterator<char>(source)), std::istreambuf_iterator<char>());
        EXPECT_EQ(built_text, source_text) << name;
    }
}
