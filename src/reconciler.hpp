#pragma once

#include "category.hpp"
#include "config.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <filesystem>
#include <string>
#include <vector>

enum class SyncDirection {
    TO_SYSTEM,
    TO_REPOSITORY
};

struct ReconcileOptions {
    bool dry_run = false;
    // How install and restore place files; backup always copies
    LinkMode mode = LinkMode::SYMLINK;
    OperatingSystem os = OperatingSystem::LINUX;
};

struct PathPair {
    std::filesystem::path source;
    std::filesystem::path destination;
};

struct FileDiff {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::string text;
};

struct RunSummary {
    std::vector<std::string> categories; // enabled categories, in processing order
    std::vector<std::string> actions;    // every planned hook and file action, in order
    size_t applied = 0;
    size_t unchanged = 0;                // already the same file, or an identical copy
    size_t skipped = 0;                  // source missing
    std::vector<FileDiff> diffs;
};

// Source -> destination pairs for one location. The source side decides the
// shape: a single pair for a file, one pair per regular file (sorted by
// relative path) for a directory, none when the location has no path on `os`.
std::vector<PathPair> expand_location(const Location& location, OperatingSystem os,
                                      SyncDirection direction = SyncDirection::TO_SYSTEM);

class Reconciler {
public:
    Reconciler(const CategoryRegistry& registry, CommandRunner& runner, ReconcileOptions options);

    // Repository -> OS with before/after hooks
    RunSummary install(const std::vector<std::string>& names);
    // Repository -> OS, no hooks
    RunSummary restore(const std::vector<std::string>& names);
    // OS -> repository by copy, no hooks
    RunSummary backup(const std::vector<std::string>& names);
    // Prints the differences between repository and OS files
    RunSummary diff(const std::vector<std::string>& names);

private:
    RunSummary reconcile(const std::vector<std::string>& names, SyncDirection direction, LinkMode mode, bool with_hooks);
    std::vector<const Category*> enabled_categories(const std::vector<std::string>& names, bool announce_disabled) const;
    void run_commands(const std::vector<Command>& commands, RunSummary& summary);
    void materialize(const PathPair& pair, LinkMode mode, RunSummary& summary);

    const CategoryRegistry& registry_;
    CommandRunner& runner_;
    ReconcileOptions options_;
};
