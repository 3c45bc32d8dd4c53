#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    void check_tty() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_tty();

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }

    // Signal-safe cleanup registry: plain arrays only, no allocation in the handler.
    constexpr size_t MAX_CLEANUP_PATHS = 8;
    char cleanup_paths[MAX_CLEANUP_PATHS][PATH_MAX];
    volatile sig_atomic_t cleanup_count = 0;
    bool handlers_installed = false;

    void exit_signal_handler(int sig) {
        for (sig_atomic_t i = cleanup_count; i > 0; --i) {
            const char* p = cleanup_paths[i - 1];
            if (unlink(p) != 0) {
                rmdir(p);
            }
        }
        std::signal(sig, SIG_DFL);
        std::raise(sig);
    }
}

void log_info(std::string_view msg) {
    log_internal(INFO_PREFIX, COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(WARNING_PREFIX, COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(ERROR_PREFIX, COLOR_RED, msg, std::cerr);
}

void log_progress(const std::string& msg, double percentage, int bar_width) {
    std::lock_guard<std::mutex> lock(log_mutex);
    check_tty();
    if (!is_stdout_tty) {
        return;
    }

    int pos = static_cast<int>(bar_width * percentage / 100.0);

    std::cout << "\r" << COLOR_GREEN << INFO_PREFIX << COLOR_WHITE << msg << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "#";
        else if (i == pos) std::cout << ">";
        else std::cout << "-";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << percentage << "%" << COLOR_RESET << std::flush;
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw GosetupException(ErrorKind::DirectoryCreateError,
                string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    } else if (!fs::is_directory(path)) {
        throw GosetupException(ErrorKind::DirectoryCreateError, string_format("error.path_not_dir", path.string()));
    }
}

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw GosetupException(ErrorKind::ConfigError, string_format("error.open_file_failed", path.string()));
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
        throw GosetupException(ErrorKind::ExtractError, string_format("error.path_not_relative", path.string()));
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw GosetupException(ErrorKind::ExtractError, string_format("error.path_traversal", path.string()));
        }
    }
    return root / normalized;
}

std::string trim(std::string_view s) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return std::string(s);
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

CommandResult run_command(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) return result;

    int pipe_fds[2];
    if (pipe(pipe_fds) != 0) {
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        return result;
    }

    if (pid == 0) {
        close(pipe_fds[0]);
        dup2(pipe_fds[1], STDOUT_FILENO);
        close(pipe_fds[1]);
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }

        std::vector<char*> c_args;
        for (const auto& arg : argv) c_args.push_back(const_cast<char*>(arg.c_str()));
        c_args.push_back(nullptr);

        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    close(pipe_fds[1]);
    std::array<char, 4096> buffer;
    while (true) {
        ssize_t n = read(pipe_fds[0], buffer.data(), buffer.size());
        if (n > 0) {
            result.output.append(buffer.data(), static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }
    close(pipe_fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) return result;
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

fs::path find_in_path(std::string_view program) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) return {};

    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / program;
        if (access(candidate.c_str(), X_OK) == 0 && fs::is_regular_file(candidate)) {
            return candidate;
        }
    }
    return {};
}

void install_exit_handlers() {
    if (handlers_installed) return;
    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGQUIT}) {
        std::signal(sig, exit_signal_handler);
    }
    handlers_installed = true;
}

void register_cleanup_path(const fs::path& path) {
    const std::string& s = path.native();
    if (static_cast<size_t>(cleanup_count) >= MAX_CLEANUP_PATHS || s.size() >= PATH_MAX) {
        log_warning(string_format("warning.cleanup_not_registered", s));
        return;
    }
    std::memcpy(cleanup_paths[cleanup_count], s.c_str(), s.size() + 1);
    cleanup_count = cleanup_count + 1;
}

void unregister_cleanup_path(const fs::path& path) {
    const std::string& s = path.native();
    for (sig_atomic_t i = 0; i < cleanup_count; ++i) {
        if (s == cleanup_paths[i]) {
            for (sig_atomic_t j = i; j + 1 < cleanup_count; ++j) {
                std::memcpy(cleanup_paths[j], cleanup_paths[j + 1], PATH_MAX);
            }
            cleanup_count = cleanup_count - 1;
            return;
        }
    }
}

ScratchWorkspace::ScratchWorkspace(const fs::path& parent) {
    ensure_dir_exists(parent);
    std::string tmpl = (parent / "gosetup.XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        throw GosetupException(ErrorKind::DirectoryCreateError,
            string_format("error.create_dir_failed", tmpl) + ": " + std::strerror(errno));
    }
    path_ = fs::path(buf.data());
    register_cleanup_path(path_);
}

ScratchWorkspace::~ScratchWorkspace() {
    remove();
}

void ScratchWorkspace::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log_warning(string_format("warning.remove_failed", path_.string(), ec.message()));
    }
    unregister_cleanup_path(path_);
    path_.clear();
}
