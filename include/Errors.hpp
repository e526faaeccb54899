#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace ordo {
    // Base of every error the engine reports at the invocation boundary.
    class OrdoError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // The dependency graph reachable from the target is not acyclic.
    class CycleError : public OrdoError {
    public:
        explicit CycleError(std::vector<std::string> cycle);

        // Names along the cycle, first name repeated at the end.
        [[nodiscard]] const std::vector<std::string> &cycle() const { return path; }

    private:
        std::vector<std::string> path;
    };

    // A referenced task or file cannot be resolved.
    class UnknownPrerequisiteError : public OrdoError {
    public:
        UnknownPrerequisiteError(std::string ref, std::string owner);

        [[nodiscard]] const std::string &reference() const { return ref_; }

        // Empty when the reference is the requested target itself.
        [[nodiscard]] const std::string &owner() const { return owner_; }

    private:
        std::string ref_;
        std::string owner_;
    };

    // A child process could not be launched or exited non-zero.
    class ActionFailure : public OrdoError {
    public:
        ActionFailure(std::string task, std::string command, int status, const std::string &what);

        [[nodiscard]] const std::string &task() const { return task_; }

        [[nodiscard]] const std::string &command() const { return command_; }

        [[nodiscard]] int status() const { return status_; }

    private:
        std::string task_;
        std::string command_;
        int status_;
    };
} // namespace ordo
