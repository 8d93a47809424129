#include "category.hpp"

#include "dependency.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <unordered_set>

Command::Command(std::vector<std::string> args) : args_(std::move(args)) {
    if (args_.empty()) {
        throw DotsyncException(get_string("error.empty_command"));
    }
}

std::optional<std::vector<std::string>> Command::on_current_platform() const {
    auto executable = find_executable(args_.front());
    if (!executable) {
        return std::nullopt;
    }
    std::vector<std::string> resolved = args_;
    resolved.front() = executable->string();
    return resolved;
}

bool CategoryDescriptor::is_disabled(OperatingSystem os) const {
    return std::ranges::none_of(locations, [os](const Location& location) { return location.applies_to(os); });
}

Category::Category(std::string name, CategoryDescriptor descriptor)
    : name_(to_upper(name)), descriptor_(std::move(descriptor)) {
    if (name_.empty()) {
        throw DotsyncException(get_string("error.empty_category_name"));
    }
    for (auto& prerequisite : descriptor_.prerequisites) {
        prerequisite = to_upper(prerequisite);
    }
}

CategoryRegistry::CategoryRegistry(std::vector<Category> categories) : categories_(std::move(categories)) {
    for (size_t i = 0; i < categories_.size(); ++i) {
        if (!by_name_.emplace(categories_[i].name(), i).second) {
            throw DotsyncException(string_format("error.duplicate_category", categories_[i].name()));
        }
    }
    for (const auto& category : categories_) {
        for (const auto& prerequisite : category.descriptor().prerequisites) {
            if (!by_name_.contains(prerequisite)) {
                throw UnknownCategoryError(string_format("error.unknown_prerequisite", category.name(), prerequisite));
            }
        }
    }
}

size_t CategoryRegistry::index_of(const Category& category) const {
    return static_cast<size_t>(&category - categories_.data());
}

const Category& CategoryRegistry::lookup(std::string_view name) const {
    auto it = by_name_.find(to_upper(name));
    if (it == by_name_.end()) {
        throw UnknownCategoryError(string_format("error.unknown_category", std::string(name)));
    }
    return categories_[it->second];
}

std::vector<const Category*> CategoryRegistry::expand(const std::vector<std::string>& names) const {
    std::vector<const Category*> result;
    if (names.empty()) {
        for (const auto& category : categories_) result.push_back(&category);
        return result;
    }

    std::unordered_set<const Category*> seen;
    for (const auto& name : names) {
        const Category* category = &lookup(name);
        if (seen.insert(category).second) result.push_back(category);
    }
    return result;
}

std::vector<const Category*> CategoryRegistry::topological_order(const std::vector<std::string>& names) const {
    return ::topological_order(*this, collect_dependency_graph(*this, names));
}

CategoryRegistry default_registry() {
    const auto home = [](const std::string& file) { return "$HOME/" + file; };
    const auto everywhere = [&](const std::string& repo, const std::string& file) {
        return Location(repo, home(file), home(file), home(file));
    };
    const auto unix_only = [&](const std::string& repo, const std::string& file) {
        return Location(repo, home(file), home(file));
    };

    std::vector<Category> categories;

    categories.emplace_back("BASH", CategoryDescriptor{
        .prerequisites = {"SH"},
        .locations = {
            everywhere("bash/bash_profile", ".bash_profile"),
            everywhere("bash/bashrc", ".bashrc"),
        },
    });

    // https://docs.brew.sh/Manpage#bundle-subcommand
    categories.emplace_back("BREW", CategoryDescriptor{
        .locations = {everywhere("brew/Brewfile", ".Brewfile")},
        .after_install = {Command({"brew", "bundle", "upgrade", "--global"})},
    });

    categories.emplace_back("GIT", CategoryDescriptor{
        .locations = {everywhere("git/config", ".gitconfig")},
    });

    categories.emplace_back("SH", CategoryDescriptor{
        .locations = {
            everywhere("sh/inputrc", ".inputrc"),
            everywhere("sh/profile", ".profile"),
        },
    });

    // https://code.visualstudio.com/docs/getstarted/settings#_settings-file-locations
    categories.emplace_back("VSCODE", CategoryDescriptor{
        .locations = {
            Location("vscode/", "$HOME/.config/Code/", "$HOME/Library/Application Support/Code/", "%APPDATA%/Code/"),
        },
        .after_install = {Command({
            "code",
            "--install-extension", "ms-python.python",
            "--install-extension", "rust-lang.rust",
            "--install-extension", "vscjava.vscode-java-pack",
            "--install-extension", "vscodevim.vim",
        })},
    });

    // https://wiki.archlinux.org/title/Zsh#Startup/Shutdown_files
    categories.emplace_back("ZSH", CategoryDescriptor{
        .prerequisites = {"SH"},
        .before_install = {Command({
            "curl", "--silent", "--show-error",
            "https://raw.githubusercontent.com/grml/grml-etc-core/master/etc/zsh/zshrc",
            "--output", (REPOSITORY_DIR / "zsh/zshrc").string(),
        })},
        .locations = {
            unix_only("zsh/zshenv", ".zshenv"),
            unix_only("zsh/zshrc.pre", ".zshrc.pre"),
            unix_only("zsh/zshrc", ".zshrc"),
            unix_only("zsh/zshrc.local", ".zshrc.local"),
        },
    });

    return CategoryRegistry(std::move(categories));
}
