#include "terminal.hpp"

#include <cerrno>
#include <csignal>
#include <ctime>
#include <system_error>
#include <sys/ioctl.h>
#include <unistd.h>

#include "ansi.hpp"

namespace
{
volatile std::sig_atomic_t receivedSignal = 0;

void onStopSignal(int signo)
{
    receivedSignal = signo;
}
} // namespace

Viewport getTerminalSize(const Viewport &fallback)
{
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0)
        return fallback;

    if (w.ws_col == 0 || w.ws_row == 0)
        return fallback;

    return {static_cast<int>(w.ws_col), static_cast<int>(w.ws_row)};
}

TerminalGuard::TerminalGuard(std::ostream &out) : out(out), active(true)
{
    this->out << ANSI_CURSOR_HIDE << std::flush;
}

TerminalGuard::~TerminalGuard()
{
    release();
}

void TerminalGuard::release()
{
    if (!active)
        return;
    active = false;

    // A write interrupted by a stop signal leaves the stream failed
    out.clear();
    out << ANSI_CURSOR_SHOW << ANSI_RESET << std::flush;
}

bool installStopHandlers()
{
    struct sigaction action = {};
    action.sa_handler = onStopSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART; // nanosleep still returns EINTR, writes resume

    const int signals[] = {SIGINT, SIGTERM, SIGHUP};
    for (int signo : signals)
    {
        if (sigaction(signo, &action, nullptr) != 0)
            return false;
    }
    return true;
}

int pendingSignal()
{
    return receivedSignal;
}

void waitForNextFrame(std::chrono::milliseconds delay)
{
    if (delay.count() <= 0)
        return;

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(delay);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(delay - seconds);

    struct timespec request;
    request.tv_sec = static_cast<time_t>(seconds.count());
    request.tv_nsec = static_cast<long>(nanos.count());

    // EINTR means a stop signal came in; the caller checks for it next
    if (nanosleep(&request, nullptr) != 0 && errno != EINTR)
        throw std::system_error(errno, std::generic_category(), "nanosleep");
}
