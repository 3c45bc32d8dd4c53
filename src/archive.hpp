#pragma once

#include <filesystem>
#include <string>

class Extractor {
public:
    virtual ~Extractor() = default;

    // Unpacks archive_path into output_dir. When top_level is non-empty every
    // entry must live under that directory. Throws ExtractError.
    virtual void extract(const std::filesystem::path& archive_path,
                         const std::filesystem::path& output_dir,
                         const std::string& top_level) = 0;
};

class LibarchiveExtractor : public Extractor {
public:
    void extract(const std::filesystem::path& archive_path,
                 const std::filesystem::path& output_dir,
                 const std::string& top_level) override;
};
