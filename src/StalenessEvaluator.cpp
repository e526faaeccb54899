#include "../include/StalenessEvaluator.hpp"
#include <algorithm>
#include <system_error>

using namespace ordo;
namespace fs = std::filesystem;

StalenessEvaluator::StalenessEvaluator(fs::path root) : root(std::move(root)) {
}

std::optional<fs::file_time_type> StalenessEvaluator::mtime(const fs::path &p) const {
    std::error_code ec;
    const auto t = fs::last_write_time(anchor_path(root, p), ec);
    if (ec) return std::nullopt;
    return t;
}

bool StalenessEvaluator::must_run(const PlannedTask &step) const {
    const Task &task = *step.task;
    if (task.phony) return true;
    if (!task.has_action()) return false;

    const auto out = task.output_path();
    const auto out_time = out ? mtime(*out) : std::nullopt;
    if (!out_time) return true;

    for (const Task *up: step.upstream) {
        if (updated(up->name)) return true;
        if (const auto up_out = up->output_path()) {
            if (const auto t = mtime(*up_out); t && *t > *out_time) return true;
        }
    }
    for (const auto &input: step.inputs) {
        const auto t = mtime(input);
        if (!t || *t > *out_time) return true;
    }
    return false;
}

void StalenessEvaluator::record(const PlannedTask &step, const bool ran) {
    const Task &task = *step.task;
    bool is_updated;
    if (task.has_action()) {
        is_updated = ran && !task.phony;
    } else {
        is_updated = std::ranges::any_of(step.upstream, [this](const Task *up) { return updated(up->name); });
    }
    if (is_updated) updated_tasks.insert(task.name);
}
