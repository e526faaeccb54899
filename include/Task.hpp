#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ordo {
    // How a prerequisite reference is resolved.
    enum class PrereqKind {
        Auto, // registered task if any, else existing file, else unknown
        Task, // must name a registered task
        File  // file input, a missing file only makes the owner stale
    };

    struct Prerequisite {
        std::string ref;
        PrereqKind kind = PrereqKind::Auto;

        static Prerequisite task(std::string name) { return {std::move(name), PrereqKind::Task}; }

        static Prerequisite file(std::string path) { return {std::move(path), PrereqKind::File}; }

        // Implicit so that bare strings can be listed in a task declaration.
        Prerequisite(const char *r) : ref(r) {}
        Prerequisite(std::string r, const PrereqKind k = PrereqKind::Auto) : ref(std::move(r)), kind(k) {}
    };

    // One line of a recipe: an argument vector run as a child process.
    struct Command {
        std::vector<std::string> argv;
        bool silent = false; // not echoed before running

        // Wraps a shell line into `/bin/sh -c <line>`.
        static Command shell(const std::string &line, bool silent = false);

        [[nodiscard]] std::string display() const;
    };

    struct Action {
        std::vector<Command> commands;
        std::map<std::string, std::string> env; // overrides merged over the ambient environment
    };

    struct Task {
        std::string name;
        std::vector<Prerequisite> prerequisites;
        bool phony = false;
        std::optional<Action> action;
        std::optional<std::string> doc;
        std::optional<std::filesystem::path> output;

        [[nodiscard]] bool has_action() const { return action.has_value() && !action->commands.empty(); }

        // Designated output artifact: explicit output, else the task name. Phony tasks have none.
        [[nodiscard]] std::optional<std::filesystem::path> output_path() const;
    };

    // Anchors a relative path under root; absolute paths and an empty root pass through.
    std::filesystem::path anchor_path(const std::filesystem::path &root, const std::filesystem::path &p);
} // namespace ordo
