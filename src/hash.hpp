#pragma once

#include <array>
#include <filesystem>
#include <string>

using Sha256Digest = std::array<unsigned char, 32>;

// Streams a file through SHA256.
// Throws DotsyncException if the file cannot be read.
Sha256Digest sha256_digest(const std::filesystem::path& file_path);

// Lowercase hex form of sha256_digest
std::string calculate_sha256(const std::filesystem::path& file_path);

// True when both regular files hold the same bytes. Sizes are compared before
// anything is hashed.
bool same_content(const std::filesystem::path& a, const std::filesystem::path& b);
