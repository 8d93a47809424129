#include "diff.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "process.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {
    const fs::path EMPTY_INPUT = "/dev/null";
}

std::string diff_files(const fs::path& from, const fs::path& to) {
    const bool from_exists = fs::is_regular_file(from);
    const bool to_exists = fs::is_regular_file(to);

    if (!from_exists && !to_exists) {
        return "";
    }

    const auto diff_tool = find_executable("diff");
    if (!diff_tool) {
        throw DotsyncException(get_string("error.diff_not_found"));
    }

    const ExecResult result = exec_command({
        diff_tool->string(), "-U0",
        "--label", from.string(),
        "--label", to.string(),
        (from_exists ? from : EMPTY_INPUT).string(),
        (to_exists ? to : EMPTY_INPUT).string(),
    });

    // diff(1): 0 same, 1 different, anything else is trouble
    switch (result.exit_code) {
        case 0:
            return "";
        case 1:
            return result.output;
        default:
            throw DotsyncException(string_format("error.diff_failed", from.string(), to.string(), result.output));
    }
}
