#include "../include/Options.hpp"
#include "../include/Errors.hpp"
#include "../include/Plan.hpp"
#include <cctype>
#include <ostream>
#include <stdexcept>

using namespace rnr;

static bool is_truthy(const std::string &v) {
    if (v.empty()) return false;
    std::string s;
    s.reserve(v.size());
    for (const char c: v) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return !(s == "0" || s == "false" || s == "no" || s == "off");
}

static OutputMode output_mode(const std::string &v) {
    const auto mode = parse_output_mode(v);
    if (!mode) throw std::invalid_argument(std::string(_("invalid output mode: ")) + v);
    return *mode;
}

void rnr::apply_environment(RunOptions &opts, const EnvMap &env) {
    if (const auto it = env.find("RNR_CONTINUE_ON_ERROR"); it != env.end()) {
        opts.continue_on_error = is_truthy(it->second);
    }
    if (const auto it = env.find("RNR_OUTPUT"); it != env.end() && !it->second.empty()) {
        opts.output = output_mode(it->second);
    }
    if (const auto it = env.find("RNR_SHELL"); it != env.end() && !it->second.empty()) {
        opts.shell = it->second;
    }
    if (const auto it = env.find("RNR_FILE"); it != env.end() && !it->second.empty()) {
        opts.task_file = it->second;
    }
}

void rnr::apply_arguments(RunOptions &opts, const int argc, const char *const *argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](const std::string &flag) -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(flag + _(" expects a value"));
            return argv[++i];
        };
        if (arg == "-l" || arg == "--list") opts.list = true;
        else if (arg == "-k" || arg == "--continue") opts.continue_on_error = true;
        else if (arg == "-n" || arg == "--dry-run") opts.dry_run = true;
        else if (arg == "-q" || arg == "--quiet") opts.quiet = true;
        else if (arg == "-h" || arg == "--help") opts.help = true;
        else if (arg == "-V" || arg == "--version") opts.version = true;
        else if (arg == "-f" || arg == "--file") opts.task_file = value(arg);
        else if (arg.starts_with("--file=")) opts.task_file = arg.substr(7);
        else if (arg == "--output") opts.output = output_mode(value(arg));
        else if (arg.starts_with("--output=")) opts.output = output_mode(arg.substr(9));
        else if (arg == "--shell") opts.shell = value(arg);
        else if (arg.starts_with("-") && arg.size() > 1) {
            throw std::invalid_argument(std::string(_("unknown option: ")) + arg);
        } else {
            if (opts.task) throw std::invalid_argument(std::string(_("only one task may be given: ")) + arg);
            opts.task = arg;
        }
    }
}

RunOptions rnr::load_options(const int argc, const char *const *argv) {
    RunOptions opts;
    apply_environment(opts, PlanBuilder::ambient_environment());
    apply_arguments(opts, argc, argv);
    return opts;
}

void rnr::print_usage(std::ostream &os) {
    os << _("Usage: rnr [options] [TASK]") << "\n\n"
       << _("Runs TASK from the nearest rnr.yaml. Without a task, lists the available tasks.") << "\n\n"
       << "  -l, --list             " << _("list tasks declared in rnr.yaml") << "\n"
       << "  -k, --continue         " << _("keep running steps after a failure") << "\n"
       << "  -n, --dry-run          " << _("print the resolved plan without running it") << "\n"
       << "  -q, --quiet            " << _("no status or command echo lines") << "\n"
       << "  -f, --file <path>      " << _("use this task file instead of searching") << "\n"
       << "      --output=<mode>    " << _("parallel output: stream, prefix (default), buffer") << "\n"
       << "      --shell <path>     " << _("command interpreter (default /bin/sh)") << "\n"
       << "  -V, --version          " << _("print version") << "\n"
       << "  -h, --help             " << _("show this help") << "\n";
}
