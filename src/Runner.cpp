#include "../include/Runner.hpp"
#include "../include/Errors.hpp"
#include "../include/Resolver.hpp"
#include "../include/Status.hpp"
#include <algorithm>
#include <iostream>
#include <ranges>

using namespace rnr;
using namespace std;

Runner::Runner(TaskRegistry &registry, Spawner &spawner, OutputSink &sink, const RunOptions &options,
               ostream &log)
    : registry(registry), spawner(spawner), sink(sink), options(options), log(log),
      builder(PlanBuilder::ambient_environment()) {
}

Plan Runner::plan(const string &task_name) {
    Resolver resolver(registry);
    const ResolvedNode tree = resolver.resolve(task_name, registry.root().dir);
    return builder.build(tree);
}

void Runner::print_plan(const string &task_name, ostream &os) {
    rnr::print_plan(plan(task_name), os);
}

ExecutionResult Runner::execute(const string &task_name) {
    const Plan p = plan(task_name);
    if (!options.quiet) {
        print_status(log, string(_("Running task")) + " '" + task_name + "' (" + to_string(p.leaf_count()) + " " +
                          _("command(s)") + ")", "..");
    }
    ExecutorOptions exec_options;
    exec_options.policy = options.continue_on_error ? FailurePolicy::Continue : FailurePolicy::FailFast;
    exec_options.echo = !options.quiet;
    Executor executor(spawner, sink, exec_options);
    ExecutionResult result = executor.execute(p);
    report(result);
    return result;
}

int Runner::run(const string &task_name) {
    return execute(task_name).exit_code;
}

void Runner::report(const ExecutionResult &result) const {
    if (options.quiet) return;
    for (const ExecutionResult *leaf: failed_leaves(result)) {
        string msg = leaf->label + ": " + leaf->command;
        if (!leaf->error.empty()) msg += " (" + leaf->error + ")";
        else msg += " (" + string(_("exit code")) + " " + to_string(leaf->exit_code) + ")";
        print_status(log, msg, "!!", true);
    }
    if (result.ok()) print_status(log, string(_("Task completed successfully")) + ": " + result.label, "ok");
    else print_status(log, string(_("Task failed")) + ": " + result.label, "!!", true);
}

vector<pair<string, string> > Runner::list_tasks() const {
    return registry.list_tasks();
}

void Runner::print_task_list(ostream &os) const {
    const auto tasks = list_tasks();
    os << "\n" << _("Available tasks:") << "\n\n";
    if (tasks.empty()) {
        os << "  " << _("No tasks defined in rnr.yaml") << "\n";
        return;
    }
    size_t width = 0;
    for (const auto &name: tasks | views::keys) width = max(width, name.size());
    for (const auto &[name, description]: tasks) {
        os << "  " << name;
        if (!description.empty()) os << string(width - name.size() + 2, ' ') << description;
        os << "\n";
    }
    os << endl;
}

int rnr::exit_status(const int code) {
    if (code == 0) return 0;
    if (code < 0 || code > 255) return 1;
    return code;
}
