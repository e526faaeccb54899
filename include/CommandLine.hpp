#pragma once
#include "Make.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace ordo {
    struct Invocation {
        std::optional<std::string> target; // unset: the registry's default target
        MakeOptions options;
        bool help = false;    // print the task catalog
        bool version = false;
        bool usage = false;   // print option summary
    };

    class CommandLine {
    public:
        /**
         * @brief Parse `ordo [options] [NAME=VALUE...] [target]`.
         * @param args Arguments without the program name.
         * @throws std::invalid_argument on an unknown option, a missing option
         * value or more than one target.
         */
        static Invocation parse(const std::vector<std::string> &args);

        static void print_usage(std::ostream &os);

        /**
         * @brief Run a whole invocation against the built-in Taskfile.
         * @param args Arguments without the program name.
         * @param out Catalog, status lines and child stdout.
         * @param err Usage errors and child stderr.
         * @return The process exit code: 0 for help and version, 2 for usage
         * and resolution errors, otherwise the build's exit code.
         */
        static int execute(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);

    private:
        static bool is_assignment(const std::string &arg);

        static bool env_flag(const char *name);
    };
} // namespace ordo
