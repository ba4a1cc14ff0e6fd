#include "walrus/util/signal_handler.hpp"

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>

namespace walrus::util {

std::atomic<bool> SignalHandler::shutdown_requested_{false};

namespace {

std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void on_signal(int signal) {
    (void)signal;
    SignalHandler::request_shutdown();
}

}  // namespace

void SignalHandler::install() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
}

bool SignalHandler::should_shutdown() {
    return shutdown_requested_.load();
}

/*
    note: notify_all() from inside a signal handler is not guaranteed to be safe, so the waiter
    also wakes up periodically and re-checks the flag instead of relying on the notification alone.
*/
void SignalHandler::wait_for_shutdown() {
    std::unique_lock lock(shutdown_mutex);
    while (!shutdown_requested_.load()) {
        shutdown_cv.wait_for(lock, std::chrono::milliseconds(100));
    }
}

void SignalHandler::request_shutdown() {
    shutdown_requested_.store(true);
    shutdown_cv.notify_all();
}

void SignalHandler::reset() {
    shutdown_requested_.store(false);
}

}  // namespace walrus::util
