#pragma once
#include <iosfwd>
#include <string>

namespace ordo {
    // OpenRC style status printing: " * message ...... [ ok ]".
    class Status {
    public:
        explicit Status(std::ostream &log, bool color = true, bool verbose = false);

        void ok(const std::string &msg) const { print(msg, "ok", false); }

        void fail(const std::string &msg) const { print(msg, "!!", true); }

        // Printed only in verbose mode.
        void note(const std::string &msg) const;

        // A recipe line as it is about to run, printed as-is.
        void echo(const std::string &line) const;

        [[nodiscard]] bool verbose() const { return verbose_; }

        [[nodiscard]] std::ostream &stream() const { return log; }

        // Terminal width of stdout, 80 when it is not a terminal.
        static int terminal_width();

        // true when stdout is a terminal and NO_COLOR is unset.
        static bool color_wanted();

    private:
        void print(const std::string &msg, const std::string &status, bool error) const;

        std::ostream &log;
        bool color;
        bool verbose_;
    };
} // namespace ordo
