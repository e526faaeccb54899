#include "../include/Errors.hpp"
#include "../include/I18n.hpp"
#include <string>
#include <utility>

using namespace ordo;

static std::string join_cycle(const std::vector<std::string> &cycle) {
    std::string out;
    for (const auto &name: cycle) {
        if (!out.empty()) out += " -> ";
        out += name;
    }
    return out;
}

CycleError::CycleError(std::vector<std::string> cycle)
    : OrdoError(fill(_("Circular dependency: %s"), {join_cycle(cycle)})), path(std::move(cycle)) {
}

UnknownPrerequisiteError::UnknownPrerequisiteError(std::string ref, std::string owner)
    : OrdoError(owner.empty()
                    ? fill(_("No rule to make target '%s'"), {ref})
                    : fill(_("No rule to make target '%s', needed by '%s'"), {ref, owner})),
      ref_(std::move(ref)), owner_(std::move(owner)) {
}

ActionFailure::ActionFailure(std::string task, std::string command, const int status, const std::string &what)
    : OrdoError(what), task_(std::move(task)), command_(std::move(command)), status_(status) {
}
