#include "process.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

ExecResult exec_command(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw DotsyncException(get_string("error.empty_command"));
    }

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        throw DotsyncException(string_format("error.pipe_failed", strerror(errno)));
    }

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw DotsyncException(string_format("error.fork_failed", strerror(err)));
    }

    if (pid == 0) {
        close(out_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);

        std::vector<char*> c_args;
        for (const auto& arg : args) c_args.push_back(const_cast<char*>(arg.c_str()));
        c_args.push_back(nullptr);

        execv(c_args[0], c_args.data());
        _exit(127);
    }

    close(out_pipe[1]);

    ExecResult result{-1, ""};
    char buf[4096];
    while (true) {
        ssize_t n = read(out_pipe[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }
    close(out_pipe[0]);

    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw DotsyncException(string_format("error.wait_failed", strerror(errno)));
        }
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

std::string ProcessRunner::run(const std::vector<std::string>& args) {
    ExecResult result = exec_command(args);
    if (result.exit_code != 0) {
        throw HookExecutionError(string_format("error.hook_failed", args.front(), std::to_string(result.exit_code)), result.output);
    }
    return result.output;
}
