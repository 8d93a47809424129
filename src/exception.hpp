#pragma once

#include <stdexcept>
#include <string>
#include <utility>

class DotsyncException : public std::runtime_error {
public:
    explicit DotsyncException(const std::string& message)
        : std::runtime_error(message) {}
};

// A category name that is not part of the registry.
class UnknownCategoryError : public DotsyncException {
public:
    explicit UnknownCategoryError(const std::string& message)
        : DotsyncException(message) {}
};

// The prerequisite graph of the category table contains a cycle.
class CyclicDependencyError : public DotsyncException {
public:
    explicit CyclicDependencyError(const std::string& message)
        : DotsyncException(message) {}
};

// A before/after command could not be resolved or exited non-zero.
class HookExecutionError : public DotsyncException {
public:
    HookExecutionError(const std::string& message, std::string output)
        : DotsyncException(message), output_(std::move(output)) {}

    const std::string& output() const { return output_; }

private:
    std::string output_;
};

class FilesystemError : public DotsyncException {
public:
    FilesystemError(const std::string& message, std::string path)
        : DotsyncException(message), path_(std::move(path)) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
