#pragma once

#include <string>
#include <filesystem>

enum class OperatingSystem {
    LINUX,
    DARWIN,
    WINDOWS
};

// What to do with a $VAR / %VAR% reference whose variable is not set
enum class UndefinedVariablePolicy {
    EXPAND_EMPTY,
    KEEP,
    FAIL
};

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path REPOSITORY_DIR;
extern std::filesystem::path L10N_DIR;

// Derived paths
extern std::filesystem::path STAGING_DIR;

// Functions
void set_repository_path(const std::string& repository_path);
void init_filesystem();

void set_operating_system(const std::string& name); // Empty string restores detection
OperatingSystem get_operating_system();
OperatingSystem parse_operating_system(const std::string& name);
std::string operating_system_name(OperatingSystem os);

void set_undefined_variable_policy(UndefinedVariablePolicy policy);
UndefinedVariablePolicy get_undefined_variable_policy();
