#pragma once
#include "ActionRunner.hpp"
#include "TaskRegistry.hpp"
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace ordo {
    struct MakeOptions {
        std::filesystem::path directory; // actions run here, relative files resolve here (empty = cwd)
        bool dry_run = false;            // print what would run, run nothing
        bool silent = false;             // do not echo commands
        bool verbose = false;            // also report up-to-date tasks
        bool color = false;
        EnvOverrides env;                // applied to every action, under the task's own overrides
    };

    struct BuildResult {
        int exit_code = 0;
        std::vector<std::string> ran; // tasks whose action ran (or would run, in a dry run), in order
        std::string failed_task;      // empty unless an action failed

        [[nodiscard]] bool ok() const { return exit_code == 0; }
    };

    // Resolves a target and runs the stale part of its plan, one action at a time.
    // Resolution errors abort before any action runs; the first failing action stops the plan.
    class Make {
    public:
        static constexpr int resolution_failure = 2;

        static BuildResult build(const TaskRegistry &registry, const std::string &target,
                                 const MakeOptions &options, std::ostream &log, const ActionRunner &runner);

        // Child output goes to std::cout / std::cerr.
        static BuildResult build(const TaskRegistry &registry, const std::string &target,
                                 const MakeOptions &options, std::ostream &log);

    private:
        static void run_action(const Task &task, const MakeOptions &options, std::ostream &log,
                               const ActionRunner &runner);
    };
} // namespace ordo
