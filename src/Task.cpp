#include "../include/Task.hpp"
#include <string>

using namespace ordo;

Command Command::shell(const std::string &line, const bool silent) {
    Command c;
    c.argv = {"/bin/sh", "-c", line};
    c.silent = silent;
    return c;
}

std::string Command::display() const {
    // Shell lines print as the line itself, like make echoes a recipe.
    if (argv.size() == 3 && argv[0] == "/bin/sh" && argv[1] == "-c") return argv[2];
    std::string out;
    for (const auto &a: argv) {
        if (!out.empty()) out += ' ';
        if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos) {
            out += '\'' + a + '\'';
        } else {
            out += a;
        }
    }
    return out;
}

std::optional<std::filesystem::path> Task::output_path() const {
    if (phony || !has_action()) return std::nullopt;
    if (output) return *output;
    return std::filesystem::path(name);
}

std::filesystem::path ordo::anchor_path(const std::filesystem::path &root, const std::filesystem::path &p) {
    if (root.empty() || p.is_absolute()) return p;
    return root / p;
}
