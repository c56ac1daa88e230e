#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <pthread.h>
#include <sstream>
#include <thread>

#include "ansi.hpp"
#include "terminal.hpp"

TEST(TerminalGuardTest, HidesOnConstructionRestoresOnDestruction)
{
    std::ostringstream out;
    {
        TerminalGuard guard(out);
        EXPECT_EQ(out.str(), ANSI_CURSOR_HIDE);
    }
    EXPECT_EQ(out.str(), std::string(ANSI_CURSOR_HIDE) + ANSI_CURSOR_SHOW + ANSI_RESET);
}

TEST(TerminalGuardTest, ReleaseRestoresExactlyOnce)
{
    std::ostringstream out;
    {
        TerminalGuard guard(out);
        out << "frame";
        guard.release();
        guard.release();
    }
    EXPECT_EQ(out.str(), std::string(ANSI_CURSOR_HIDE) + "frame" + ANSI_CURSOR_SHOW + ANSI_RESET);
}

TEST(TerminalGuardTest, RestoresAfterStreamFailed)
{
    std::ostringstream out;
    {
        TerminalGuard guard(out);
        out.setstate(std::ios::badbit);
    }
    EXPECT_EQ(out.str(), std::string(ANSI_CURSOR_HIDE) + ANSI_CURSOR_SHOW + ANSI_RESET);
}

TEST(GetTerminalSizeTest, AlwaysReturnsUsableSize)
{
    // Under ctest stdout is usually a pipe, so this is normally the fallback
    Viewport viewport = getTerminalSize({123, 45});
    EXPECT_GT(viewport.width, 0);
    EXPECT_GT(viewport.height, 0);
}

TEST(StopHandlersTest, SignalSetsPendingFlag)
{
    ASSERT_TRUE(installStopHandlers());

    std::raise(SIGHUP);
    EXPECT_EQ(pendingSignal(), SIGHUP);

    std::raise(SIGINT);
    EXPECT_EQ(pendingSignal(), SIGINT);
}

TEST(WaitForNextFrameTest, SleepsForDelay)
{
    auto start = std::chrono::steady_clock::now();
    waitForNextFrame(std::chrono::milliseconds(20));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(19));
}

TEST(WaitForNextFrameTest, NonPositiveDelayReturnsImmediately)
{
    auto start = std::chrono::steady_clock::now();
    waitForNextFrame(std::chrono::milliseconds(0));
    waitForNextFrame(std::chrono::milliseconds(-5));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(50));
}

TEST(WaitForNextFrameTest, StopSignalCutsWaitShort)
{
    ASSERT_TRUE(installStopHandlers());

    pthread_t sleeper = pthread_self();
    std::thread sender([sleeper]()
                       {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        pthread_kill(sleeper, SIGHUP); });

    auto start = std::chrono::steady_clock::now();
    waitForNextFrame(std::chrono::milliseconds(1000));
    auto elapsed = std::chrono::steady_clock::now() - start;
    sender.join();

    EXPECT_LT(elapsed, std::chrono::milliseconds(500));
    EXPECT_EQ(pendingSignal(), SIGHUP);
}
