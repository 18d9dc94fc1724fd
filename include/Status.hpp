#pragma once
#include <iosfwd>
#include <string>

namespace rnr {
    // OpenRC style status line: " * msg ...... [ ok ]", padded to the terminal
    // width. Colors are only used when `log` is std::cout/std::cerr on a tty.
    void print_status(std::ostream &log, const std::string &msg, const std::string &status, bool error = false);
} // namespace rnr
