#pragma once
#include "Task.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace ordo {
    /**
     * @brief Holds every declared task, keyed by name, in declaration order.
     *
     * Built once per invocation and read-only afterward.
     */
    class TaskRegistry {
    public:
        /**
         * @brief Insert a task, or replace the task with the same name.
         * A replaced task keeps the position of its first declaration.
         * @throws std::invalid_argument when the name is empty.
         */
        void define(Task task);

        /**
         * @brief Find a task by name.
         * @return The task, or nullptr when no task has that name.
         */
        [[nodiscard]] const Task *lookup(const std::string &name) const;

        [[nodiscard]] bool contains(const std::string &name) const { return index.contains(name); }

        /// Every task in declaration order.
        [[nodiscard]] const std::vector<Task> &all() const { return tasks; }

        [[nodiscard]] std::size_t size() const { return tasks.size(); }

        /**
         * @brief Target used when an invocation names none.
         * @return The explicitly set default, else the first declared task, else an empty string.
         */
        [[nodiscard]] std::string default_target() const;

        void set_default_target(std::string name) { default_name = std::move(name); }

    private:
        std::vector<Task> tasks;
        std::unordered_map<std::string, std::size_t> index;
        std::string default_name;
    };
} // namespace ordo
