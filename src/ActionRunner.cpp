#include "../include/ActionRunner.hpp"
#include "../include/Errors.hpp"
#include "../include/I18n.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char **environ;

using namespace ordo;
using namespace std;

static string sys_error(const string &what) {
    return what + ": " + strerror(errno);
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Child side after fork: report through the (redirected) stderr and leave without unwinding.
[[noreturn]] static void child_fail(const char *what, const string &arg) {
    const string msg = string("ordo: ") + what + " '" + arg + "': " + strerror(errno) + "\n";
    const ssize_t ignored = write(STDERR_FILENO, msg.data(), msg.size());
    (void) ignored;
    _exit(127);
}

vector<string> ChildProcess::merged_environment(const EnvOverrides &env) {
    vector<string> out;
    for (char **e = environ; e != nullptr && *e != nullptr; ++e) {
        const string entry(*e);
        const auto pos = entry.find('=');
        if (pos != string::npos && env.contains(entry.substr(0, pos))) continue;
        out.push_back(entry);
    }
    for (const auto &[key, value]: env) out.push_back(key + "=" + value);
    return out;
}

ChildProcess ChildProcess::spawn(const vector<string> &argv, const EnvOverrides &env,
                                 const filesystem::path &cwd) {
    if (argv.empty() || argv.front().empty()) {
        throw ActionFailure("", "", 127, _("Empty command"));
    }
    string line;
    for (const auto &a: argv) line += (line.empty() ? "" : " ") + a;

    // Everything the child needs is prepared before fork.
    vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &a: argv) args.push_back(const_cast<char *>(a.c_str()));
    args.push_back(nullptr);

    const vector<string> env_block = merged_environment(env);
    vector<char *> envp;
    envp.reserve(env_block.size() + 1);
    for (const auto &e: env_block) envp.push_back(const_cast<char *>(e.c_str()));
    envp.push_back(nullptr);

    const string dir = cwd.string();

    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw ActionFailure("", line, 127, sys_error(_("failed to create pipe")));
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        const string msg = sys_error(_("failed to create pipe"));
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw ActionFailure("", line, 127, msg);
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const string msg = sys_error(_("failed to fork cmd"));
        for (const int fd: {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
        throw ActionFailure("", line, 127, msg);
    }
    if (pid == 0) {
        // dup2 clears O_CLOEXEC on the targets; the originals close on exec.
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        if (!dir.empty() && chdir(dir.c_str()) != 0) child_fail("cannot change directory to", dir);
        execvpe(args[0], args.data(), envp.data());
        child_fail("cannot execute", argv.front());
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    return {pid, out_pipe[0], err_pipe[0]};
}

ChildProcess::ChildProcess(ChildProcess &&other) noexcept
    : pid(other.pid), out_fd(other.out_fd), err_fd(other.err_fd), reaped(other.reaped) {
    other.pid = -1;
    other.out_fd = -1;
    other.err_fd = -1;
    other.reaped = true;
}

ChildProcess::~ChildProcess() {
    close_pipes();
    if (pid > 0 && !reaped) {
        while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
        }
    }
}

void ChildProcess::close_pipes() {
    close_fd(out_fd);
    close_fd(err_fd);
}

int ChildProcess::forward_and_wait(ostream &out, ostream &err) {
    pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    ostream *sinks[2] = {&out, &err};
    char buf[4096];
    int open_count = 2;
    while (open_count > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            throw ActionFailure("", "", 127, sys_error(_("failed to poll child output")));
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            const ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->write(buf, n);
                sinks[i]->flush();
                continue;
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
            // EOF or error: stop watching this stream (poll ignores negative fds).
            fds[i].fd = -1;
            --open_count;
        }
    }
    close_pipes();
    return wait();
}

int ChildProcess::wait() {
    int status = 0;
    pid_t r;
    while ((r = waitpid(pid, &status, 0)) < 0 && errno == EINTR) {
    }
    reaped = true;
    if (r < 0) throw ActionFailure("", "", 127, sys_error(_("failed to wait pid")));
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 127;
}

ActionRunner::ActionRunner(ostream &out, ostream &err) : out(out), err(err) {
}

ActionRunner::ActionRunner() : ActionRunner(std::cout, std::cerr) {
}

int ActionRunner::run(const Command &command, const EnvOverrides &env, const filesystem::path &cwd) const {
    ChildProcess child = ChildProcess::spawn(command.argv, env, cwd);
    return child.forward_and_wait(out, err);
}
