#pragma once

#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Picks the catalog language from LC_ALL, LC_MESSAGES and LANG, then loads it
// from the build tree or the installed l10n directory.
void init_localization();

// Merges `<base_dir>/<lang>.txt` into the catalog. Returns false when the file
// cannot be opened.
bool load_strings(const std::string& lang, const std::filesystem::path& base_dir);

// "key=value" with \n, \t and \\ escapes in the value. Blank lines, '#'
// comments and lines without a key yield nullopt.
std::optional<std::pair<std::string, std::string>> parse_catalog_line(std::string_view line);

// "en" or "zh" for a locale string such as "zh_CN.UTF-8"
std::string language_for_locale(std::string_view locale);

const std::string& get_string(const std::string& key);

// Looks up `key` in the catalog and formats it with std::format
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return std::vformat(get_string(key), std::make_format_args(args...));
    } catch (const std::format_error& e) {
        return "Dotsync Formatting Error [key: " + key + "]: " + e.what();
    }
}
