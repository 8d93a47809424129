#include "category.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "process.hpp"
#include "reconciler.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.install_desc") << std::endl;
    std::cerr << get_string("info.backup_desc") << std::endl;
    std::cerr << get_string("info.restore_desc") << std::endl;
    std::cerr << get_string("info.diff_desc") << std::endl;
    std::cerr << get_string("info.list_desc") << std::endl;
}

void list_categories(const CategoryRegistry& registry, const std::vector<std::string>& names, OperatingSystem os) {
    for (const Category* category : registry.topological_order(names)) {
        std::string line = category->name();
        const auto& prerequisites = category->descriptor().prerequisites;
        if (!prerequisites.empty()) {
            line += " <-";
            for (const auto& prerequisite : prerequisites) line += " " + prerequisite;
        }
        if (category->is_disabled(os)) {
            line += " " + string_format("info.disabled_on", operating_system_name(os));
        }
        std::cout << line << std::endl;
    }
}

void print_summary(const RunSummary& summary, bool dry_run) {
    if (dry_run) {
        log_info(string_format("info.dry_run_summary", summary.actions.size()));
        return;
    }
    log_info(string_format("info.summary", summary.applied, summary.unchanged, summary.skipped));
}

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("n,dry-run", get_string("help.dry_run"), cxxopts::value<bool>()->default_value("false"))
            ("cp", get_string("help.cp"), cxxopts::value<bool>()->default_value("false"))
            ("symlink", get_string("help.symlink"), cxxopts::value<bool>()->default_value("false"))
            ("repository", get_string("help.repository"), cxxopts::value<std::string>())
            ("os", get_string("help.os"), cxxopts::value<std::string>())
            ("strict-env", get_string("help.strict_env"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>())
            ("categories", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "categories"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        if (result.count("repository")) {
            set_repository_path(result["repository"].as<std::string>());
        } else if (const char* env_repository = std::getenv("DOTSYNC_REPOSITORY")) {
            set_repository_path(env_repository);
        }

        if (result.count("os")) {
            set_operating_system(result["os"].as<std::string>());
        }

        if (result["strict-env"].as<bool>()) {
            set_undefined_variable_policy(UndefinedVariablePolicy::FAIL);
        }

        std::vector<std::string> categories;
        if (result.count("categories")) {
            categories = result["categories"].as<std::vector<std::string>>();
        }

        const std::string& command = result["command"].as<std::string>();
        const CategoryRegistry registry = default_registry();

        ReconcileOptions reconcile_options;
        reconcile_options.dry_run = result["dry-run"].as<bool>();
        reconcile_options.os = get_operating_system();

        if (command == "list") {
            list_categories(registry, categories, reconcile_options.os);
            return 0;
        }

        if (!reconcile_options.dry_run && command != "diff") {
            init_filesystem();
        }

        ProcessRunner runner;
        RunSummary summary;

        if (command == "install") {
            reconcile_options.mode = result["cp"].as<bool>() ? LinkMode::COPY : LinkMode::SYMLINK;
            summary = Reconciler(registry, runner, reconcile_options).install(categories);
        } else if (command == "restore") {
            reconcile_options.mode = result["symlink"].as<bool>() ? LinkMode::SYMLINK : LinkMode::COPY;
            summary = Reconciler(registry, runner, reconcile_options).restore(categories);
        } else if (command == "backup") {
            summary = Reconciler(registry, runner, reconcile_options).backup(categories);
        } else if (command == "diff") {
            summary = Reconciler(registry, runner, reconcile_options).diff(categories);
            return 0;
        } else {
            print_usage(options);
            return 1;
        }

        print_summary(summary, reconcile_options.dry_run);

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const HookExecutionError& e) {
        log_error(string_format("error.dotsync_error", e.what()));
        if (!e.output().empty()) {
            std::cerr << e.output() << std::flush;
        }
        return 1;
    } catch (const DotsyncException& e) {
        log_error(string_format("error.dotsync_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
