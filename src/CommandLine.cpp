#include "../include/CommandLine.hpp"
#include "../include/HelpCatalog.hpp"
#include "../include/I18n.hpp"
#include "../include/Status.hpp"
#include "../include/Taskfile.hpp"
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#ifndef ORDO_VERSION
#define ORDO_VERSION "0.1.0"
#endif

using namespace ordo;
using namespace std;

bool CommandLine::is_assignment(const string &arg) {
    const auto eq = arg.find('=');
    if (eq == string::npos || eq == 0) return false;
    if (isdigit(static_cast<unsigned char>(arg[0]))) return false;
    for (size_t i = 0; i < eq; ++i) {
        const auto c = static_cast<unsigned char>(arg[i]);
        if (!isalnum(c) && c != '_') return false;
    }
    return true;
}

Invocation CommandLine::parse(const vector<string> &args) {
    Invocation inv;
    for (size_t i = 0; i < args.size(); ++i) {
        const string &arg = args[i];
        if (arg == "-C" || arg == "--directory") {
            if (i + 1 >= args.size()) throw invalid_argument(string(_("Option requires an argument: ")) + arg);
            inv.options.directory = args[++i];
        } else if (arg.starts_with("--directory=")) {
            inv.options.directory = arg.substr(string("--directory=").size());
        } else if (arg == "-n" || arg == "--dry-run") {
            inv.options.dry_run = true;
        } else if (arg == "-s" || arg == "--silent") {
            inv.options.silent = true;
        } else if (arg == "-v" || arg == "--verbose") {
            inv.options.verbose = true;
        } else if (arg == "-l" || arg == "--list") {
            inv.help = true;
        } else if (arg == "-h" || arg == "--help") {
            inv.usage = true;
        } else if (arg == "-V" || arg == "--version") {
            inv.version = true;
        } else if (arg.size() > 1 && arg.front() == '-') {
            throw invalid_argument(string(_("Unknown option: ")) + arg);
        } else if (is_assignment(arg)) {
            const auto eq = arg.find('=');
            inv.options.env[arg.substr(0, eq)] = arg.substr(eq + 1);
        } else if (arg == "help") {
            inv.help = true;
        } else {
            if (inv.target) throw invalid_argument(string(_("Only one target may be given, got: ")) + *inv.target + ", " + arg);
            inv.target = arg;
        }
    }
    return inv;
}

void CommandLine::print_usage(ostream &os) {
    os << _("Usage: ordo [options] [NAME=VALUE...] [target]") << '\n'
       << _("  -C, --directory DIR  run in DIR") << '\n'
       << _("  -n, --dry-run        print the commands that would run") << '\n'
       << _("  -s, --silent         do not echo commands") << '\n'
       << _("  -v, --verbose        report up-to-date tasks too") << '\n'
       << _("  -l, --list, help     list documented tasks") << '\n'
       << _("  -V, --version        print the version") << '\n'
       << _("  -h, --help           print this help") << '\n'
       << _("  NAME=VALUE           set an environment variable for every action") << '\n';
}

bool CommandLine::env_flag(const char *name) {
    const char *v = getenv(name);
    return v != nullptr && *v != '\0' && string(v) != "0";
}

int CommandLine::execute(const vector<string> &args, ostream &out, ostream &err) {
    Invocation inv;
    try {
        inv = parse(args);
    } catch (const invalid_argument &e) {
        err << "ordo: " << e.what() << endl;
        print_usage(err);
        return Make::resolution_failure;
    }
    if (inv.usage) {
        print_usage(out);
        return 0;
    }
    if (inv.version) {
        out << "ordo " << ORDO_VERSION << endl;
        return 0;
    }
    // Escape sequences only reach a real terminal.
    inv.options.color = &out == &cout && Status::color_wanted();
    inv.options.verbose = inv.options.verbose || env_flag("ORDO_VERBOSE");

    TaskRegistry registry;
    Taskfile::declare(registry, inv.options.directory);

    if (inv.help) {
        HelpCatalog(registry).render(out, inv.options.color);
        return 0;
    }

    const string target = inv.target.value_or(registry.default_target());
    const ActionRunner runner(out, err);
    return Make::build(registry, target, inv.options, out, runner).exit_code;
}
