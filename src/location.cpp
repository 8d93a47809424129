#include "location.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <cctype>
#include <cstdlib>
#include <string_view>

namespace fs = std::filesystem;

namespace {

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_name(std::string_view s) {
    if (s.empty() || !is_name_start(s.front())) return false;
    for (char c : s) {
        if (!is_name_char(c)) return false;
    }
    return true;
}

void append_variable(std::string& out, const std::string& name, std::string_view reference,
                     const std::string& text, UndefinedVariablePolicy policy) {
    if (const char* value = std::getenv(name.c_str())) {
        out += value;
        return;
    }
    switch (policy) {
        case UndefinedVariablePolicy::EXPAND_EMPTY:
            break;
        case UndefinedVariablePolicy::KEEP:
            out += reference;
            break;
        case UndefinedVariablePolicy::FAIL:
            throw DotsyncException(string_format("error.undefined_variable", name, text));
    }
}

} // anonymous namespace

Location::Location(std::string repo, std::optional<std::string> linux_path,
                   std::optional<std::string> darwin_path, std::optional<std::string> windows_path)
    : repo_(std::move(repo)), linux_path_(std::move(linux_path)),
      darwin_path_(std::move(darwin_path)), windows_path_(std::move(windows_path)) {
    if (repo_.empty()) {
        throw DotsyncException(get_string("error.empty_location"));
    }
}

const std::optional<std::string>& Location::path_template(OperatingSystem os) const {
    switch (os) {
        case OperatingSystem::DARWIN:
            return darwin_path_;
        case OperatingSystem::WINDOWS:
            return windows_path_;
        case OperatingSystem::LINUX:
        default:
            return linux_path_;
    }
}

bool Location::applies_to(OperatingSystem os) const {
    const auto& tmpl = path_template(os);
    return tmpl.has_value() && !tmpl->empty();
}

fs::path Location::inside_repository() const {
    return REPOSITORY_DIR / repo_;
}

std::optional<fs::path> Location::outside_repository(OperatingSystem os) const {
    if (!applies_to(os)) {
        return std::nullopt;
    }
    const std::string expanded = expand_environment(*path_template(os), get_undefined_variable_policy());
    if (expanded.empty()) {
        return std::nullopt;
    }
    return fs::path(expanded);
}

std::string expand_environment(const std::string& text, UndefinedVariablePolicy policy) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];

        if (c == '$' && i + 1 < text.size() && text[i + 1] == '{') {
            const size_t close = text.find('}', i + 2);
            if (close != std::string::npos && is_name(std::string_view(text).substr(i + 2, close - i - 2))) {
                append_variable(out, text.substr(i + 2, close - i - 2),
                                std::string_view(text).substr(i, close - i + 1), text, policy);
                i = close + 1;
                continue;
            }
        } else if (c == '$' && i + 1 < text.size() && is_name_start(text[i + 1])) {
            size_t end = i + 1;
            while (end < text.size() && is_name_char(text[end])) ++end;
            append_variable(out, text.substr(i + 1, end - i - 1),
                            std::string_view(text).substr(i, end - i), text, policy);
            i = end;
            continue;
        } else if (c == '%') {
            const size_t close = text.find('%', i + 1);
            if (close != std::string::npos && is_name(std::string_view(text).substr(i + 1, close - i - 1))) {
                append_variable(out, text.substr(i + 1, close - i - 1),
                                std::string_view(text).substr(i, close - i + 1), text, policy);
                i = close + 1;
                continue;
            }
        }

        out += c;
        ++i;
    }
    return out;
}
