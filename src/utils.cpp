#include "utils.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace {
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

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

    void stage_entry(const fs::path& src, const fs::path& staged, LinkMode mode) {
        std::error_code ec;
        if (mode == LinkMode::SYMLINK) {
            fs::create_symlink(src, staged, ec);
        } else if (fs::is_symlink(src)) {
            fs::copy_symlink(src, staged, ec);
        } else {
            fs::copy_file(src, staged, ec);
        }
        if (ec) {
            throw FilesystemError(string_format("error.stage_failed", src.string(), staged.string(), ec.message()), src.string());
        }
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

StagingDir::StagingDir(const fs::path& parent, std::string_view prefix) {
    ensure_dir_exists(parent);
    std::string tmpl = (parent / (std::string(prefix) + "XXXXXX")).string();
    if (mkdtemp(tmpl.data()) == nullptr) {
        throw FilesystemError(string_format("error.create_dir_failed", tmpl) + ": " + strerror(errno), parent.string());
    }
    path_ = tmpl;
}

StagingDir::~StagingDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw FilesystemError(string_format("error.create_dir_failed", path.string()) + ": " + ec.message(), path.string());
        }
    }
    else if (!fs::is_directory(path)) {
        throw FilesystemError(string_format("error.path_not_dir", path.string()), path.string());
    }
}

std::vector<fs::path> ensure_parent_dirs(const fs::path& path) {
    fs::path parent = path.parent_path();
    std::vector<fs::path> to_create;
    while (!parent.empty() && !fs::exists(parent)) {
        to_create.push_back(parent);
        if (parent == parent.parent_path()) break;
        parent = parent.parent_path();
    }
    if (!parent.empty() && fs::exists(parent) && !fs::is_directory(parent)) {
        throw FilesystemError(string_format("error.path_not_dir", parent.string()), parent.string());
    }

    std::ranges::reverse(to_create);
    for (const auto& dir : to_create) {
        if (::mkdir(dir.c_str(), S_IRWXU) != 0 && errno != EEXIST) {
            throw FilesystemError(string_format("error.create_dir_failed", dir.string()) + ": " + strerror(errno), dir.string());
        }
    }
    return to_create;
}

void replace_atomically(const fs::path& src, const fs::path& dst, LinkMode mode) {
    const std::string staged_name = (mode == LinkMode::SYMLINK) ? "symlink" : "cp";
    {
        StagingDir staging(STAGING_DIR);
        const fs::path staged = staging.path() / staged_name;
        stage_entry(src, staged, mode);
        if (::rename(staged.c_str(), dst.c_str()) == 0) {
            return;
        }
        if (errno != EXDEV) {
            throw FilesystemError(string_format("error.rename_failed", staged.string(), dst.string(), strerror(errno)), dst.string());
        }
    }

    // The staging directory is on another device; stage beside the destination instead.
    StagingDir staging(dst.parent_path(), ".dotsync-stage.");
    const fs::path staged = staging.path() / staged_name;
    stage_entry(src, staged, mode);
    if (::rename(staged.c_str(), dst.c_str()) != 0) {
        throw FilesystemError(string_format("error.rename_failed", staged.string(), dst.string(), strerror(errno)), dst.string());
    }
}

bool is_same_file(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    if (!fs::exists(a, ec) || !fs::exists(b, ec)) {
        return false;
    }
    const bool same = fs::equivalent(a, b, ec);
    return !ec && same;
}

std::optional<fs::path> find_executable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0) return fs::absolute(name);
        return std::nullopt;
    }

    const char* path_env = getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        const fs::path candidate = fs::path(dir) / name;
        if (access(candidate.c_str(), X_OK) == 0 && !fs::is_directory(candidate)) {
            return fs::absolute(candidate);
        }
    }
    return std::nullopt;
}

std::string to_upper(std::string_view value) {
    std::string result(value);
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::toupper(c); });
    return result;
}
