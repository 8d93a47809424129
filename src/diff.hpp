#pragma once

#include <filesystem>
#include <string>

// Zero-context unified diff of `from` against `to`, produced by the system diff(1).
// A file that does not exist reads as empty. Returns "" when there is no difference.
std::string diff_files(const std::filesystem::path& from, const std::filesystem::path& to);
