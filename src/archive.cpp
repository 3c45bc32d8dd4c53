#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>

namespace fs = std::filesystem;

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

void warn(struct archive* a) {
    const char* err = archive_error_string(a);
    log_warning(err ? err : get_string("error.unknown"));
}

[[noreturn]] void fail(const fs::path& archive_path, struct archive* a, const char* fallback_key) {
    const char* err = archive_error_string(a);
    throw GosetupException(ErrorKind::ExtractError,
        string_format("error.extract_failed", archive_path.string()) + ": " + (err ? err : get_string(fallback_key)));
}

} // anonymous namespace

void LibarchiveExtractor::extract(const fs::path& archive_path, const fs::path& output_dir, const std::string& top_level) {
    ArchiveReadHandle a(archive_read_new());
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    ArchiveWriteHandle ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(),
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT |
        ARCHIVE_EXTRACT_UNLINK
    );

    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        fail(archive_path, a.get(), "error.unknown");
    }

    struct archive_entry* entry;
    long long count = 0;
    while (true) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                fail(archive_path, a.get(), "error.fatal_read");
            }
            warn(a.get());
        }

        const char* current_path = archive_entry_pathname(entry);
        if (!current_path) continue;

        fs::path relative = fs::path(current_path).lexically_normal();
        if (relative == "." || relative.empty()) continue;

        if (!top_level.empty() && *relative.begin() != top_level) {
            throw GosetupException(ErrorKind::ExtractError,
                string_format("error.unexpected_archive_entry", std::string(current_path), top_level));
        }

        fs::path dest_path;
        try {
            dest_path = validate_path(relative, output_dir);
        } catch (const GosetupException&) {
            throw GosetupException(ErrorKind::ExtractError, string_format("error.malicious_path_in_archive", std::string(current_path)));
        }
        archive_entry_set_pathname(entry, dest_path.c_str());

        const char* hardlink = archive_entry_hardlink(entry);
        if (hardlink) {
            try {
                fs::path link_dest = validate_path(fs::path(hardlink).lexically_normal(), output_dir);
                archive_entry_set_hardlink(entry, link_dest.c_str());
            } catch (const GosetupException&) {
                throw GosetupException(ErrorKind::ExtractError, string_format("error.malicious_path_in_archive", std::string(hardlink)));
            }
        }

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                fail(archive_path, ext.get(), "error.fatal_write");
            }
            warn(ext.get());
        } else if (archive_entry_size(entry) > 0) {
            const void* buff;
            size_t size;
            la_int64_t offset;
            while (true) {
                r = archive_read_data_block(a.get(), &buff, &size, &offset);
                if (r == ARCHIVE_EOF) break;
                if (r < ARCHIVE_OK) {
                    if (r < ARCHIVE_WARN) {
                        fail(archive_path, a.get(), "error.data_block_read");
                    }
                    warn(a.get());
                    break;
                }
                if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_OK) {
                    fail(archive_path, ext.get(), "error.data_block_write");
                }
            }
        }

        if (archive_write_finish_entry(ext.get()) < ARCHIVE_WARN) {
            fail(archive_path, ext.get(), "error.fatal_write");
        }

        if (++count % 1000 == 0) {
            log_info(string_format("info.extracting", count));
        }
    }

    log_info(string_format("info.extract_complete", count));
}
