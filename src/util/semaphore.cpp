#include "walrus/util/semaphore.hpp"

#include <utility>

namespace walrus::util {

Semaphore::Permit::~Permit() {
    release();
}

Semaphore::Permit::Permit(Permit&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}

Semaphore::Permit& Semaphore::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = std::exchange(other.owner_, nullptr);
    }
    return *this;
}

void Semaphore::Permit::release() {
    if (owner_ != nullptr) {
        std::exchange(owner_, nullptr)->release_one();
    }
}

Semaphore::Semaphore(std::size_t permits) : available_(permits) {}

Semaphore::Permit Semaphore::acquire() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return available_ > 0; });
    --available_;
    return Permit(this);
}

std::optional<Semaphore::Permit> Semaphore::try_acquire_for(Duration timeout) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return available_ > 0; })) {
        return std::nullopt;
    }
    --available_;
    return Permit(this);
}

std::size_t Semaphore::available() const {
    std::lock_guard lock(mutex_);
    return available_;
}

void Semaphore::release_one() {
    {
        std::lock_guard lock(mutex_);
        ++available_;
    }
    cv_.notify_one();
}

}  // namespace walrus::util
