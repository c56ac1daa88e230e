#include "animation.hpp"

#include <csignal>

#include "terminal.hpp"

AnimationHooks terminalHooks(const DemoConfig &config)
{
    AnimationHooks hooks;
    Viewport fallback = config.fallbackViewport;
    hooks.queryViewport = [fallback]()
    { return getTerminalSize(fallback); };
    hooks.pendingSignal = &pendingSignal;
    hooks.wait = &waitForNextFrame;
    return hooks;
}

StopReason stopReasonFor(int signo)
{
    return signo == SIGINT ? StopReason::Interrupted : StopReason::Terminated;
}

AnimationResult runAnimation(const DemoConfig &config, std::ostream &out, const AnimationHooks &hooks)
{
    AnimationResult result{StopReason::Terminated, AnimationState{}, 0};

    while (true)
    {
        int signo = hooks.pendingSignal();
        if (signo != 0)
        {
            result.reason = stopReasonFor(signo);
            return result;
        }

        Viewport viewport = hooks.queryViewport();

        // One write per frame so the terminal never shows half a frame
        out << renderFrame(config, result.state, viewport) << std::flush;
        if (!out)
        {
            // A stop signal may have cut the write short; that is a stop, not a closed terminal
            signo = hooks.pendingSignal();
            if (signo != 0)
            {
                out.clear();
                result.reason = stopReasonFor(signo);
                return result;
            }
            result.reason = StopReason::OutputClosed;
            return result;
        }
        ++result.framesDrawn;

        result.state = advanceState(result.state, config);

        hooks.wait(config.frameDelay);
    }
}

int runDemo(const DemoConfig &config, std::ostream &out, const AnimationHooks &hooks)
{
    TerminalGuard guard(out);

    AnimationResult result = runAnimation(config, out, hooks);

    if (result.reason == StopReason::Interrupted)
        out << config.farewell;

    guard.release();
    return 0;
}
