#include "../include/Status.hpp"
#include <cstdlib>
#include <ostream>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

using namespace ordo;
using namespace std;

Status::Status(ostream &log, const bool color, const bool verbose) : log(log), color(color), verbose_(verbose) {
}

int Status::terminal_width() {
    winsize w{};
    int term_width = 80;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        term_width = w.ws_col;
    }
    return term_width;
}

bool Status::color_wanted() {
    const char *no_color = std::getenv("NO_COLOR");
    if (no_color != nullptr && *no_color != '\0') return false;
    return isatty(STDOUT_FILENO) == 1;
}

void Status::print(const string &msg, const string &status, const bool error) const {
    const int term_width = terminal_width();

    // Colors: Stars (Green), Brackets (White), Status (Green/Red)
    string star = "*";
    string open = "[";
    string close = "]";
    string status_text = status;
    if (color) {
        star = "\033[32m*\033[0m";
        open = "\033[37m[\033[0m";
        close = "\033[37m]\033[0m";
        status_text = error ? "\033[31;1m" + status + "\033[0m" : "\033[32;1m" + status + "\033[0m";
    }
    const string status_block = " " + open + " " + status_text + " " + close;
    const int msg_display_len = 3 + static_cast<int>(msg.length());
    int padding = term_width - msg_display_len - 7;
    if (padding < 1) padding = 1;

    log << " " << star << " " << msg << string(static_cast<size_t>(padding), ' ') << status_block << endl;
}

void Status::note(const string &msg) const {
    if (!verbose_) return;
    log << " " << (color ? "\033[33m*\033[0m" : "*") << " " << msg << endl;
}

void Status::echo(const string &line) const {
    log << line << endl;
}
