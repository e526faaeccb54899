#pragma once
#include "TaskRegistry.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace ordo {
    // A task of the plan together with its resolved prerequisites.
    struct PlannedTask {
        const Task *task = nullptr;
        std::vector<const Task *> upstream;         // planned prerequisite tasks, declared order
        std::vector<std::filesystem::path> inputs;  // file prerequisites, as declared
    };

    struct Plan {
        std::string target;
        std::vector<PlannedTask> steps;

        [[nodiscard]] std::vector<std::string> names() const;
    };

    /**
     * @brief Expands a target into a topologically ordered, deduplicated plan.
     *
     * Depth-first, prerequisites before the task itself (post-order), declared
     * order as tie-break. File prerequisites are leaves and never appear in the
     * plan. A task without an action that ends up with no task prerequisites is
     * transparent: it gets no step and hands its file inputs to its dependents.
     */
    class DependencyResolver {
    public:
        /**
         * @param registry Tasks to resolve against; must outlive every returned Plan.
         * @param root Directory that relative file references are resolved against (empty = cwd).
         */
        explicit DependencyResolver(const TaskRegistry &registry, std::filesystem::path root = {});

        /**
         * @brief Resolve the plan for a target.
         * @throws CycleError when a task is reachable from itself.
         * @throws UnknownPrerequisiteError for a reference that is neither a task nor an existing file.
         */
        [[nodiscard]] Plan resolve(const std::string &target) const;

    private:
        const TaskRegistry &registry;
        std::filesystem::path root;
    };
} // namespace ordo
