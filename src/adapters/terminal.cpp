#include "terminal.hpp"
#include <cstdio>
#include <sys/ioctl.h>
#include <unistd.h>

namespace mlprogress::adapters::terminal {

auto stderr_width() -> std::optional<std::size_t> {
    struct winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return static_cast<std::size_t>(w.ws_col);
    }
    return std::nullopt;
}

auto stderr_is_terminal() -> bool {
    return isatty(STDERR_FILENO) != 0;
}

void write_stderr(std::string_view text) {
    if (!stderr_is_terminal()) return;
    std::fwrite(text.data(), 1, text.size(), stderr);
    std::fflush(stderr);
}

} // namespace mlprogress::adapters::terminal
