#include "../include/DependencyResolver.hpp"
#include "../include/Errors.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

using namespace ordo;
namespace fs = std::filesystem;

std::vector<std::string> Plan::names() const {
    std::vector<std::string> out;
    out.reserve(steps.size());
    for (const auto &step: steps) out.push_back(step.task->name);
    return out;
}

namespace {
    // Unreadable or overlong paths count as absent.
    bool file_exists(const fs::path &root, const std::string &ref) {
        std::error_code ec;
        return fs::exists(anchor_path(root, ref), ec) && !ec;
    }

    // State of one depth-first walk.
    class Walker {
    public:
        Walker(const TaskRegistry &r, const fs::path &root, Plan &plan) : registry(r), root(root), plan(plan) {
        }

        void visit(const Task &task) {
            in_progress.insert(task.name);
            stack.push_back(task.name);

            PlannedTask step;
            step.task = &task;
            for (const auto &[ref, kind]: task.prerequisites) {
                if (kind == PrereqKind::File) {
                    add_input(step, ref);
                    continue;
                }
                const Task *dep = registry.lookup(ref);
                if (dep == nullptr) {
                    if (kind == PrereqKind::Auto && file_exists(root, ref)) {
                        add_input(step, ref);
                        continue;
                    }
                    throw UnknownPrerequisiteError(ref, task.name);
                }
                if (in_progress.contains(dep->name)) throw CycleError(cycle_from(dep->name));
                if (!completed.contains(dep->name)) visit(*dep);

                if (const auto t = transparent.find(dep->name); t != transparent.end()) {
                    for (const auto &p: t->second) add_input(step, p);
                } else if (std::ranges::find(step.upstream, dep) == step.upstream.end()) {
                    step.upstream.push_back(dep);
                }
            }

            stack.pop_back();
            in_progress.erase(task.name);
            completed.insert(task.name);

            if (!task.has_action() && step.upstream.empty()) {
                transparent.emplace(task.name, std::move(step.inputs));
            } else {
                plan.steps.push_back(std::move(step));
            }
        }

    private:
        static void add_input(PlannedTask &step, const fs::path &p) {
            if (std::ranges::find(step.inputs, p) == step.inputs.end()) step.inputs.push_back(p);
        }

        [[nodiscard]] std::vector<std::string> cycle_from(const std::string &name) const {
            const auto start = std::ranges::find(stack, name);
            std::vector<std::string> cycle(start, stack.end());
            cycle.push_back(name);
            return cycle;
        }

        const TaskRegistry &registry;
        const fs::path &root;
        Plan &plan;
        std::vector<std::string> stack;
        std::unordered_set<std::string> in_progress;
        std::unordered_set<std::string> completed;
        std::unordered_map<std::string, std::vector<fs::path> > transparent;
    };
} // namespace

DependencyResolver::DependencyResolver(const TaskRegistry &registry, fs::path root)
    : registry(registry), root(std::move(root)) {
}

Plan DependencyResolver::resolve(const std::string &target) const {
    Plan plan;
    plan.target = target;
    const Task *task = registry.lookup(target);
    if (task == nullptr) {
        // An existing file with no rule is already satisfied.
        if (!target.empty() && file_exists(root, target)) return plan;
        throw UnknownPrerequisiteError(target, "");
    }
    Walker walker(registry, root, plan);
    walker.visit(*task);
    return plan;
}
