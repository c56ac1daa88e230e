#pragma once

#include <chrono>
#include <functional>
#include <ostream>

#include "demo_config.hpp"
#include "frame.hpp"

enum class StopReason
{
    Interrupted,  // SIGINT
    Terminated,   // any other stop signal
    OutputClosed
};

// Everything the loop needs from the outside world
struct AnimationHooks
{
    std::function<Viewport()> queryViewport;
    std::function<int()> pendingSignal;
    std::function<void(std::chrono::milliseconds)> wait;
};

struct AnimationResult
{
    StopReason reason;
    AnimationState state;
    long framesDrawn;
};

// Hooks bound to the real terminal, signal flag and clock
AnimationHooks terminalHooks(const DemoConfig &config);

StopReason stopReasonFor(int signo);

// Draw, advance, wait, until a stop signal is pending or `out` goes bad.
// The stop check sits at the top of each iteration, right after the wait.
AnimationResult runAnimation(const DemoConfig &config, std::ostream &out, const AnimationHooks &hooks);

// runAnimation wrapped in a TerminalGuard, printing the farewell on SIGINT.
// Returns the process exit code.
int runDemo(const DemoConfig &config, std::ostream &out, const AnimationHooks &hooks);
