#pragma once

#include "exception.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

enum class LinkMode {
    SYMLINK,
    COPY
};

// A private directory created with mkdtemp(3) under `parent` and removed
// with everything in it on destruction.
class StagingDir {
public:
    explicit StagingDir(const fs::path& parent, std::string_view prefix = "stage.");
    ~StagingDir();
    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
// Creates the missing ancestors of `path` top-down with owner-only permissions.
// Returns the directories that were created, outermost first.
std::vector<fs::path> ensure_parent_dirs(const fs::path& path);
// Replaces `dst` with a symlink to, or a copy of, `src` through a single rename(2).
void replace_atomically(const fs::path& src, const fs::path& dst, LinkMode mode);
bool is_same_file(const fs::path& a, const fs::path& b);

std::optional<fs::path> find_executable(const std::string& name);
std::string to_upper(std::string_view value);
