#pragma once
#include "Task.hpp"
#include <filesystem>
#include <iosfwd>
#include <map>
#include <string>
#include <sys/types.h>
#include <vector>

namespace ordo {
    using EnvOverrides = std::map<std::string, std::string>;

    /**
     * @brief A running child process with its stdout/stderr connected to pipes.
     *
     * Owns the pid and both read ends. The destructor closes the pipes and
     * reaps the child if wait() was never reached, so no zombie is left behind
     * on any exit path.
     */
    class ChildProcess {
    public:
        /**
         * @brief fork + execvpe the argument vector.
         * @param argv Program and arguments; the program is searched in PATH.
         * @param env Overrides merged over the ambient environment, overrides winning.
         * @param cwd Working directory of the child (empty = inherit).
         * @throws ActionFailure when the pipes or the fork cannot be created.
         * @note A program that cannot be executed makes the child exit with 127.
         */
        static ChildProcess spawn(const std::vector<std::string> &argv, const EnvOverrides &env,
                                  const std::filesystem::path &cwd);

        ChildProcess(ChildProcess &&other) noexcept;

        ChildProcess(const ChildProcess &) = delete;

        ChildProcess &operator=(const ChildProcess &) = delete;

        ChildProcess &operator=(ChildProcess &&) = delete;

        ~ChildProcess();

        /**
         * @brief Forward the child's output as it arrives, then reap it.
         * @return Exit code, or 128 + signal number when the child was killed.
         */
        int forward_and_wait(std::ostream &out, std::ostream &err);

        [[nodiscard]] pid_t id() const { return pid; }

        // Builds the "KEY=VALUE" block handed to the child.
        static std::vector<std::string> merged_environment(const EnvOverrides &env);

    private:
        ChildProcess(pid_t pid, int out_fd, int err_fd) : pid(pid), out_fd(out_fd), err_fd(err_fd) {}

        int wait();

        void close_pipes();

        pid_t pid = -1;
        int out_fd = -1;
        int err_fd = -1;
        bool reaped = false;
    };

    // Runs commands one at a time, streaming their output live to the given sinks.
    class ActionRunner {
    public:
        explicit ActionRunner(std::ostream &out, std::ostream &err);

        ActionRunner();

        /**
         * @brief Run a single command and block until it exits.
         * @return The child's exit status.
         * @throws ActionFailure when the process cannot be launched.
         */
        [[nodiscard]] int run(const Command &command, const EnvOverrides &env,
                              const std::filesystem::path &cwd) const;

    private:
        std::ostream &out;
        std::ostream &err;
    };
} // namespace ordo
