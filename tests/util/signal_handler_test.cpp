#include "walrus/util/signal_handler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

namespace walrus::util::test {

class SignalHandlerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        SignalHandler::reset();
        SignalHandler::install();
    }

    void TearDown() override {
        SignalHandler::reset();
    }
};

TEST_F(SignalHandlerTest, InitiallyNotShutdown) {
    EXPECT_FALSE(SignalHandler::should_shutdown());
}

TEST_F(SignalHandlerTest, RequestShutdown) {
    SignalHandler::request_shutdown();
    EXPECT_TRUE(SignalHandler::should_shutdown());
}

TEST_F(SignalHandlerTest, HandlesSIGINT) {
    std::thread waiter([] { SignalHandler::wait_for_shutdown(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(SignalHandler::should_shutdown());

    std::raise(SIGINT);

    waiter.join();
    EXPECT_TRUE(SignalHandler::should_shutdown());
}

TEST_F(SignalHandlerTest, HandlesSIGTERM) {
    std::thread waiter([] { SignalHandler::wait_for_shutdown(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(SignalHandler::should_shutdown());

    std::raise(SIGTERM);

    waiter.join();
    EXPECT_TRUE(SignalHandler::should_shutdown());
}

TEST_F(SignalHandlerTest, WaitReturnsAtOnceWhenAlreadyRequested) {
    SignalHandler::request_shutdown();

    auto start = std::chrono::steady_clock::now();
    SignalHandler::wait_for_shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

TEST_F(SignalHandlerTest, RequestFromAnotherThreadWakesWaiter) {
    std::atomic<bool> woke{false};
    std::thread waiter([&woke] {
        SignalHandler::wait_for_shutdown();
        woke = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(woke.load());

    SignalHandler::request_shutdown();
    waiter.join();
    EXPECT_TRUE(woke.load());
}

// mirrors walrus-server's main loop: a signal or a failed server ends the wait
TEST_F(SignalHandlerTest, PollLoopEndsOnSignalOrOwnerCondition) {
    std::atomic<bool> server_failed{false};
    auto wait_loop = [&server_failed] {
        while (!SignalHandler::should_shutdown() && !server_failed) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    };

    std::thread by_failure(wait_loop);
    server_failed = true;
    by_failure.join();
    EXPECT_FALSE(SignalHandler::should_shutdown());

    server_failed = false;
    std::thread by_signal(wait_loop);
    std::raise(SIGTERM);
    by_signal.join();
    EXPECT_TRUE(SignalHandler::should_shutdown());
}

TEST_F(SignalHandlerTest, ResetClearsRequest) {
    SignalHandler::request_shutdown();
    SignalHandler::reset();
    EXPECT_FALSE(SignalHandler::should_shutdown());
}

}  // namespace walrus::util::test
