#ifndef WALRUS_UTIL_CLOCK_HPP
#define WALRUS_UTIL_CLOCK_HPP

#include <chrono>
#include <memory>
#include <mutex>

#include "walrus/util/types.hpp"

namespace walrus::util {

class Clock {
   public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
   public:
    [[nodiscard]] TimePoint now() const override {
        return std::chrono::steady_clock::now();
    }
};

/*
    note: the reaper thread reads the clock while a test thread advances it, so unlike a plain
    single threaded mock the current time is guarded by a mutex.
*/
class MockClock : public Clock {
   public:
    [[nodiscard]] TimePoint now() const override {
        std::lock_guard lock(mutex_);
        return current_;
    }

    void set(TimePoint time) {
        std::lock_guard lock(mutex_);
        current_ = time;
    }

    void advance(Duration duration) {
        std::lock_guard lock(mutex_);
        current_ += duration;
    }

   private:
    mutable std::mutex mutex_;
    TimePoint current_ = std::chrono::steady_clock::now();
};

}  // namespace walrus::util

#endif
