#include "../include/Status.hpp"
#include <iostream>
#include <sys/ioctl.h>
#include <unistd.h>

using namespace std;

static int terminal_fd(const ostream &log) {
    if (&log == &cout) return STDOUT_FILENO;
    if (&log == &cerr || &log == &clog) return STDERR_FILENO;
    return -1;
}

void rnr::print_status(ostream &log, const string &msg, const string &status, const bool error) {
    const int fd = terminal_fd(log);
    const bool tty = fd >= 0 && isatty(fd);
    int term_width = 80;
    if (winsize w{}; tty && ioctl(fd, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        term_width = w.ws_col;
    }

    // Colors: Stars (Green), Brackets (White), Status (Green/Red)
    const string star = tty ? "\033[32m*\033[0m" : "*";
    const string open = tty ? "\033[37m[\033[0m" : "[";
    const string close = tty ? "\033[37m]\033[0m" : "]";
    const string status_text = !tty ? status : error ? "\033[31;1m" + status + "\033[0m" : "\033[32;1m" + status + "\033[0m";
    const string status_block = " " + open + " " + status_text + " " + close;
    const int msg_display_len = 3 + static_cast<int>(msg.length());
    int padding = term_width - msg_display_len - 5 - static_cast<int>(status.length());
    if (padding < 1) padding = 1;

    log << " " << star << " " << msg << string(static_cast<size_t>(padding), ' ') << status_block << endl;
}
