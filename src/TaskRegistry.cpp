#include "../include/TaskRegistry.hpp"
#include "../include/I18n.hpp"
#include <stdexcept>

using namespace ordo;

void TaskRegistry::define(Task task) {
    if (task.name.empty()) throw std::invalid_argument(_("Task name must not be empty"));
    if (const auto it = index.find(task.name); it != index.end()) {
        tasks[it->second] = std::move(task);
        return;
    }
    index.emplace(task.name, tasks.size());
    tasks.push_back(std::move(task));
}

const Task *TaskRegistry::lookup(const std::string &name) const {
    const auto it = index.find(name);
    if (it == index.end()) return nullptr;
    return &tasks[it->second];
}

std::string TaskRegistry::default_target() const {
    if (!default_name.empty()) return default_name;
    if (tasks.empty()) return {};
    return tasks.front().name;
}
