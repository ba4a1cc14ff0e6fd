#ifndef WALRUS_UTIL_SEMAPHORE_HPP
#define WALRUS_UTIL_SEMAPHORE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

#include "walrus/util/types.hpp"

namespace walrus::util {

// counting semaphore used as a permit pool for bounded concurrency
class Semaphore {
   public:
    /*
        a Permit returns itself to the pool when destroyed. it is move-only so ownership can be
        handed to the thread doing the work, which guarantees the release happens on every exit
        path, including exceptions.
    */
    class Permit {
       public:
        Permit() = default;
        ~Permit();

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;

        [[nodiscard]] bool valid() const noexcept {
            return owner_ != nullptr;
        }

        void release();

       private:
        friend class Semaphore;
        explicit Permit(Semaphore* owner) : owner_(owner) {}

        Semaphore* owner_ = nullptr;
    };

    explicit Semaphore(std::size_t permits);

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    [[nodiscard]] Permit acquire();
    [[nodiscard]] std::optional<Permit> try_acquire_for(Duration timeout);

    [[nodiscard]] std::size_t available() const;

   private:
    void release_one();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t available_;
};

}  // namespace walrus::util

#endif
