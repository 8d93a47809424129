#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;

    std::string_view trim(std::string_view text) {
        const auto first = text.find_first_not_of(" \t\r");
        if (first == std::string_view::npos) return {};
        const auto last = text.find_last_not_of(" \t\r");
        return text.substr(first, last - first + 1);
    }

    std::string unescape(std::string_view value) {
        std::string out;
        out.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            if (value[i] != '\\' || i + 1 == value.size()) {
                out += value[i];
                continue;
            }
            switch (value[++i]) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case '\\': out += '\\'; break;
                default: out += '\\'; out += value[i]; break;
            }
        }
        return out;
    }

    // <prefix>/bin/dotsync finds <prefix>/l10n, which is also where a build
    // directory inside the source tree lands
    std::vector<fs::path> catalog_dirs() {
        std::vector<fs::path> dirs;
        std::error_code ec;
        const fs::path exe = fs::read_symlink("/proc/self/exe", ec);
        if (!ec) {
            dirs.push_back(exe.parent_path().parent_path() / "l10n");
        }
        dirs.push_back(L10N_DIR);
        return dirs;
    }
}

std::optional<std::pair<std::string, std::string>> parse_catalog_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    const std::string_view content = trim(line);
    if (content.empty() || content.front() == '#') return std::nullopt;

    const auto pos = line.find('=');
    if (pos == std::string_view::npos) return std::nullopt;
    const std::string_view key = trim(line.substr(0, pos));
    if (key.empty()) return std::nullopt;
    return std::make_pair(std::string(key), unescape(line.substr(pos + 1)));
}

std::string language_for_locale(std::string_view locale) {
    return locale.starts_with("zh") ? "zh" : "en";
}

bool load_strings(const std::string& lang, const fs::path& base_dir) {
    std::ifstream file(base_dir / (lang + ".txt"));
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (auto entry = parse_catalog_line(line)) {
            translations.insert_or_assign(std::move(entry->first), std::move(entry->second));
        }
    }
    return true;
}

void init_localization() {
    std::string lang = "en";
    for (const char* variable : {"LC_ALL", "LC_MESSAGES", "LANG"}) {
        const char* value = getenv(variable);
        if (value && *value) {
            lang = language_for_locale(value);
            break;
        }
    }

    for (const auto& dir : catalog_dirs()) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;
        if (load_strings(lang, dir)) return;
        if (lang != "en" && load_strings("en", dir)) {
            log_warning("No " + lang + " message catalog in " + dir.string() + ", using English.");
            return;
        }
    }
    log_warning("No message catalog found, messages are shown by key.");
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
