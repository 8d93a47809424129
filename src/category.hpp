#pragma once

#include "config.hpp"
#include "location.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// A hook invocation. args[0] is a logical program name looked up on PATH when run.
class Command {
public:
    explicit Command(std::vector<std::string> args);

    const std::vector<std::string>& args() const { return args_; }
    // args with args[0] replaced by its absolute path, or nullopt if it is not on PATH
    std::optional<std::vector<std::string>> on_current_platform() const;

private:
    std::vector<std::string> args_;
};

struct CategoryDescriptor {
    std::vector<std::string> prerequisites;
    std::vector<Command> before_install;
    std::vector<Location> locations;
    std::vector<Command> after_install;

    // True when no location has a path on `os`
    bool is_disabled(OperatingSystem os) const;
};

class Category {
public:
    Category(std::string name, CategoryDescriptor descriptor);

    const std::string& name() const { return name_; }
    const CategoryDescriptor& descriptor() const { return descriptor_; }
    bool is_disabled(OperatingSystem os) const { return descriptor_.is_disabled(os); }

private:
    std::string name_;
    CategoryDescriptor descriptor_;
};

// The closed set of categories. Built once and only read afterwards.
class CategoryRegistry {
public:
    explicit CategoryRegistry(std::vector<Category> categories);

    const std::vector<Category>& all() const { return categories_; }
    // Declaration position, used to break ordering ties
    size_t index_of(const Category& category) const;

    // Case-insensitive; throws UnknownCategoryError
    const Category& lookup(std::string_view name) const;
    // An empty request means every category
    std::vector<const Category*> expand(const std::vector<std::string>& names) const;
    // Requested categories plus their transitive prerequisites, prerequisites first
    std::vector<const Category*> topological_order(const std::vector<std::string>& names) const;

private:
    std::vector<Category> categories_;
    std::unordered_map<std::string, size_t> by_name_;
};

// BASH, BREW, GIT, SH, VSCODE and ZSH, with repository paths under REPOSITORY_DIR
CategoryRegistry default_registry();
