#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/utsname.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

fs::path REPOSITORY_DIR = DOTSYNC_REPOSITORY_DIR;
fs::path L10N_DIR = DOTSYNC_L10N_DIR;

// Derived paths
fs::path STAGING_DIR = fs::path(DOTSYNC_REPOSITORY_DIR) / "tmp";

void set_repository_path(const std::string& repository_path) {
    REPOSITORY_DIR = fs::absolute(repository_path).lexically_normal();
    // Drop the trailing separator so "/repo/" and "/repo" compare equal
    if (!REPOSITORY_DIR.has_filename() && REPOSITORY_DIR.has_relative_path()) {
        REPOSITORY_DIR = REPOSITORY_DIR.parent_path();
    }

    STAGING_DIR = REPOSITORY_DIR / "tmp";
}

void init_filesystem() {
    ensure_dir_exists(REPOSITORY_DIR);
    ensure_dir_exists(STAGING_DIR);
}

namespace {
    std::optional<OperatingSystem> g_os_override;
    UndefinedVariablePolicy g_undefined_variable_policy = UndefinedVariablePolicy::EXPAND_EMPTY;

    std::string to_lower(std::string value) {
        std::ranges::transform(value, value.begin(), [](unsigned char c) { return std::tolower(c); });
        return value;
    }
}

OperatingSystem parse_operating_system(const std::string& name) {
    const std::string lowered = to_lower(name);
    if (lowered == "linux") return OperatingSystem::LINUX;
    if (lowered == "darwin") return OperatingSystem::DARWIN;
    if (lowered == "windows") return OperatingSystem::WINDOWS;
    // uname(2) under MSYS2 / Cygwin
    if (lowered.starts_with("mingw") || lowered.starts_with("msys") || lowered.starts_with("cygwin")) {
        return OperatingSystem::WINDOWS;
    }
    throw DotsyncException(string_format("error.unsupported_os", name));
}

std::string operating_system_name(OperatingSystem os) {
    switch (os) {
        case OperatingSystem::LINUX:
            return "linux";
        case OperatingSystem::DARWIN:
            return "darwin";
        case OperatingSystem::WINDOWS:
            return "windows";
    }
    return "unknown";
}

void set_operating_system(const std::string& name) {
    if (name.empty()) {
        g_os_override.reset();
        return;
    }
    g_os_override = parse_operating_system(name);
}

OperatingSystem get_operating_system() {
    if (g_os_override) {
        return *g_os_override;
    }

    struct utsname buf;
    if (uname(&buf) != 0) {
        throw DotsyncException(get_string("error.get_os_failed"));
    }
    return parse_operating_system(buf.sysname);
}

void set_undefined_variable_policy(UndefinedVariablePolicy policy) {
    g_undefined_variable_policy = policy;
}

UndefinedVariablePolicy get_undefined_variable_policy() {
    return g_undefined_variable_policy;
}
