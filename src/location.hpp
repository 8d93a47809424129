#pragma once

#include "config.hpp"

#include <filesystem>
#include <optional>
#include <string>

// One file or directory mapped between the repository and its place on each OS.
// Whether it is a file or a directory is decided by what exists in the repository.
class Location {
public:
    explicit Location(std::string repo,
                      std::optional<std::string> linux_path = std::nullopt,
                      std::optional<std::string> darwin_path = std::nullopt,
                      std::optional<std::string> windows_path = std::nullopt);

    const std::string& repo() const { return repo_; }
    const std::optional<std::string>& path_template(OperatingSystem os) const;
    bool applies_to(OperatingSystem os) const;

    std::filesystem::path inside_repository() const;
    // nullopt when the location has no path on `os`
    std::optional<std::filesystem::path> outside_repository(OperatingSystem os) const;

private:
    std::string repo_;
    std::optional<std::string> linux_path_;
    std::optional<std::string> darwin_path_;
    std::optional<std::string> windows_path_;
};

// Expands $VAR, ${VAR} and %VAR% references from the current environment.
std::string expand_environment(const std::string& text, UndefinedVariablePolicy policy);
