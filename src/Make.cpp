#include "../include/Make.hpp"
#include "../include/DependencyResolver.hpp"
#include "../include/Errors.hpp"
#include "../include/I18n.hpp"
#include "../include/StalenessEvaluator.hpp"
#include "../include/Status.hpp"
#include <iostream>
#include <string>

using namespace ordo;
using namespace std;

void Make::run_action(const Task &task, const MakeOptions &options, ostream &log, const ActionRunner &runner) {
    const Status status(log, options.color, options.verbose);

    // Task overrides win over invocation-wide ones.
    EnvOverrides env = options.env;
    for (const auto &[key, value]: task.action->env) env[key] = value;

    for (const auto &cmd: task.action->commands) {
        const string line = cmd.display();
        if (options.dry_run || (!cmd.silent && !options.silent)) status.echo(line);
        if (options.dry_run) continue;

        int rc;
        try {
            rc = runner.run(cmd, env, options.directory);
        } catch (const ActionFailure &e) {
            throw ActionFailure(task.name, line, e.status(), ordo::fill(_("Task '%s': %s"), {task.name, e.what()}));
        }
        if (rc != 0) {
            throw ActionFailure(task.name, line, rc,
                                ordo::fill(_("Task '%s' failed: '%s' exited with status %s"),
                                     {task.name, line, to_string(rc)}));
        }
    }
}

BuildResult Make::build(const TaskRegistry &registry, const string &target, const MakeOptions &options,
                        ostream &log, const ActionRunner &runner) {
    const Status status(log, options.color, options.verbose);
    BuildResult result;

    Plan plan;
    try {
        plan = DependencyResolver(registry, options.directory).resolve(target);
    } catch (const OrdoError &e) {
        status.fail(e.what());
        result.exit_code = resolution_failure;
        return result;
    }

    StalenessEvaluator evaluator(options.directory);
    for (const auto &step: plan.steps) {
        const Task &task = *step.task;
        if (!evaluator.must_run(step) || !task.has_action()) {
            if (task.has_action()) status.note(ordo::fill(_("'%s' is up to date"), {task.name}));
            evaluator.record(step, false);
            continue;
        }
        try {
            run_action(task, options, log, runner);
        } catch (const ActionFailure &e) {
            status.fail(e.what());
            result.exit_code = e.status();
            result.failed_task = task.name;
            return result;
        }
        evaluator.record(step, true);
        result.ran.push_back(task.name);
        if (!options.dry_run) status.ok(task.name);
    }

    if (result.ran.empty()) {
        status.ok(ordo::fill(_("Nothing to be done for '%s'"), {target}));
    }
    return result;
}

BuildResult Make::build(const TaskRegistry &registry, const string &target, const MakeOptions &options,
                        ostream &log) {
    const ActionRunner runner(cout, cerr);
    return build(registry, target, options, log, runner);
}
