#ifndef WALRUS_UTIL_SIGNAL_HANDLER_HPP
#define WALRUS_UTIL_SIGNAL_HANDLER_HPP

#include <atomic>

namespace walrus::util {

class SignalHandler {
   public:
    static void install();
    [[nodiscard]] static bool should_shutdown();
    static void wait_for_shutdown();
    static void request_shutdown();

    // for tests
    static void reset();

   private:
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace walrus::util

#endif
