#pragma once

#include <chrono>
#include <ostream>

#include "demo_config.hpp"

// Current size of the terminal behind stdout, or `fallback` if stdout is not
// a terminal or reports a zero dimension
Viewport getTerminalSize(const Viewport &fallback);

// Hides the cursor for its lifetime. Showing the cursor and resetting the text
// style happen exactly once, on release() or destruction, whichever is first,
// even if an earlier write left the stream failed.
class TerminalGuard
{
public:
    explicit TerminalGuard(std::ostream &out);
    ~TerminalGuard();

    TerminalGuard(const TerminalGuard &) = delete;
    TerminalGuard &operator=(const TerminalGuard &) = delete;

    void release();

private:
    std::ostream &out;
    bool active;
};

// Routes SIGINT, SIGTERM and SIGHUP to a flag read by pendingSignal().
// Returns false and leaves errno set if sigaction fails.
bool installStopHandlers();

// Last stop signal received, 0 while none
int pendingSignal();

// Sleeps for `delay`, returning early if a signal arrives.
// Throws std::system_error if nanosleep fails for any other reason.
void waitForNextFrame(std::chrono::milliseconds delay);
