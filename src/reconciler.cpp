#include "reconciler.hpp"

#include "diff.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace fs = std::filesystem;

namespace {

void print_header(const Category& category) {
    std::cout << "\n" << category.name() << "\n" << std::string(category.name().size(), '=') << std::endl;
}

std::string describe_command(const std::vector<std::string>& args) {
    std::string text = "run(";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) text += ", ";
        text += "'" + args[i] + "'";
    }
    return text + ")";
}

std::string describe_pair(const PathPair& pair, LinkMode mode) {
    const std::string operation = (mode == LinkMode::SYMLINK) ? "symlink" : "cp";
    return operation + "(src='" + pair.source.string() + "', dst='" + pair.destination.string() + "')";
}

// A regular destination file (not a link) already holding the source bytes
bool is_identical_copy(const PathPair& pair) {
    std::error_code ec;
    if (!fs::is_regular_file(fs::symlink_status(pair.destination, ec))) return false;
    if (!fs::is_regular_file(fs::status(pair.source, ec))) return false;
    return same_content(pair.source, pair.destination);
}

bool entry_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

} // anonymous namespace

std::vector<PathPair> expand_location(const Location& location, OperatingSystem os, SyncDirection direction) {
    const auto outside = location.outside_repository(os);
    if (!outside) {
        return {};
    }
    fs::path source = location.inside_repository();
    fs::path destination = *outside;
    if (direction == SyncDirection::TO_REPOSITORY) {
        std::swap(source, destination);
    }
    if (!fs::is_directory(source)) {
        return {{source, destination}};
    }
    if (!source.has_filename()) {
        source = source.parent_path(); // "vscode/" -> "vscode"
    }

    std::vector<fs::path> files;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(source)) {
            if (entry.is_regular_file()) {
                files.push_back(entry.path().lexically_relative(source));
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw FilesystemError(string_format("error.walk_failed", source.string(), e.what()), source.string());
    }
    std::sort(files.begin(), files.end());

    std::vector<PathPair> pairs;
    pairs.reserve(files.size());
    for (const auto& relative : files) {
        pairs.push_back({source / relative, destination / relative});
    }
    return pairs;
}

Reconciler::Reconciler(const CategoryRegistry& registry, CommandRunner& runner, ReconcileOptions options)
    : registry_(registry), runner_(runner), options_(options) {}

RunSummary Reconciler::install(const std::vector<std::string>& names) {
    return reconcile(names, SyncDirection::TO_SYSTEM, options_.mode, true);
}

RunSummary Reconciler::restore(const std::vector<std::string>& names) {
    return reconcile(names, SyncDirection::TO_SYSTEM, options_.mode, false);
}

RunSummary Reconciler::backup(const std::vector<std::string>& names) {
    return reconcile(names, SyncDirection::TO_REPOSITORY, LinkMode::COPY, false);
}

RunSummary Reconciler::diff(const std::vector<std::string>& names) {
    RunSummary summary;
    for (const Category* category : enabled_categories(names, false)) {
        summary.categories.push_back(category->name());
        bool header_printed = false;

        for (const auto& location : category->descriptor().locations) {
            for (const auto& pair : expand_location(location, options_.os)) {
                std::string text = diff_files(pair.source, pair.destination);
                if (text.empty()) continue;

                if (!header_printed) {
                    print_header(*category);
                    header_printed = true;
                }
                std::cout << "\n" << text << std::flush;
                summary.diffs.push_back({pair.source, pair.destination, std::move(text)});
            }
        }
    }
    return summary;
}

std::vector<const Category*> Reconciler::enabled_categories(const std::vector<std::string>& names,
                                                           bool announce_disabled) const {
    std::vector<const Category*> enabled;
    for (const Category* category : registry_.topological_order(names)) {
        if (category->is_disabled(options_.os)) {
            if (announce_disabled) log_info(string_format("info.category_disabled", category->name(), operating_system_name(options_.os)));
            continue;
        }
        enabled.push_back(category);
    }
    return enabled;
}

RunSummary Reconciler::reconcile(const std::vector<std::string>& names, SyncDirection direction, LinkMode mode, bool with_hooks) {
    RunSummary summary;
    if (options_.dry_run) {
        log_info(get_string("info.dry_run"));
    }

    for (const Category* category : enabled_categories(names, true)) {
        summary.categories.push_back(category->name());
        print_header(*category);

        const auto& descriptor = category->descriptor();
        if (with_hooks) run_commands(descriptor.before_install, summary);

        for (const auto& location : descriptor.locations) {
            for (const auto& pair : expand_location(location, options_.os, direction)) {
                materialize(pair, mode, summary);
            }
        }

        if (with_hooks) run_commands(descriptor.after_install, summary);
    }
    return summary;
}

void Reconciler::run_commands(const std::vector<Command>& commands, RunSummary& summary) {
    for (const auto& command : commands) {
        const auto args = command.on_current_platform();
        const std::string action = describe_command(args ? *args : command.args());
        log_info(action);
        summary.actions.push_back(action);

        if (!args) {
            if (!options_.dry_run) {
                throw HookExecutionError(string_format("error.executable_not_found", command.args().front()), "");
            }
            log_warning(string_format("warning.executable_not_found", command.args().front()));
            continue;
        }
        if (options_.dry_run) continue;

        const std::string output = runner_.run(*args);
        if (!output.empty()) {
            std::cout << output << std::flush;
        }
        ++summary.applied;
    }
}

void Reconciler::materialize(const PathPair& pair, LinkMode mode, RunSummary& summary) {
    const std::string action = describe_pair(pair, mode);
    log_info(action);
    summary.actions.push_back(action);

    if (!entry_exists(pair.source)) {
        log_warning(string_format("warning.source_missing", pair.source.string()));
        ++summary.skipped;
        return;
    }
    if (is_same_file(pair.source, pair.destination)) {
        log_info(string_format("info.same_file", pair.destination.string()));
        ++summary.unchanged;
        return;
    }
    if (mode == LinkMode::COPY && is_identical_copy(pair)) {
        log_info(string_format("info.identical_content", pair.destination.string()));
        ++summary.unchanged;
        return;
    }
    if (options_.dry_run) return;

    for (const auto& dir : ensure_parent_dirs(pair.destination)) {
        log_info(string_format("info.created_dir", dir.string()));
    }
    replace_atomically(pair.source, pair.destination, mode);
    ++summary.applied;
}
