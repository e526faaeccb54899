#pragma once
#include "DependencyResolver.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>

namespace ordo {
    /**
     * @brief Decides whether a planned task's action must run.
     *
     * One evaluator lives for one invocation: it remembers which tasks were
     * updated so staleness propagates forward along the plan.
     *
     * Rules, in order:
     * - phony tasks always run;
     * - tasks without an action never run themselves;
     * - otherwise the task runs when its output is missing, when a file input is
     *   missing or strictly newer than the output, when the output of an upstream
     *   task is newer than its own, or when an upstream task was updated.
     *
     * A task is "updated" when its non-phony action ran, or when it has no
     * action and one of its upstream tasks was updated. Phony runs do not
     * propagate.
     */
    class StalenessEvaluator {
    public:
        explicit StalenessEvaluator(std::filesystem::path root = {});

        [[nodiscard]] bool must_run(const PlannedTask &step) const;

        /**
         * @brief Record the outcome of a step so that its dependents see it.
         * @param ran true when the step's action ran (or would have, in a dry run).
         */
        void record(const PlannedTask &step, bool ran);

        [[nodiscard]] bool updated(const std::string &name) const { return updated_tasks.contains(name); }

    private:
        [[nodiscard]] std::optional<std::filesystem::file_time_type> mtime(const std::filesystem::path &p) const;

        std::filesystem::path root;
        std::unordered_set<std::string> updated_tasks;
    };
} // namespace ordo
