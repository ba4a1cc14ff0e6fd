#ifndef WALRUS_CORE_DB_HPP
#define WALRUS_CORE_DB_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "walrus/core/data.hpp"
#include "walrus/util/clock.hpp"
#include "walrus/util/types.hpp"

namespace walrus::core {

// longest TTL a deadline can be computed for without overflowing the clock (~146 years)
inline constexpr util::Duration kMaxTtl =
    std::chrono::duration_cast<util::Duration>(util::TimePoint::duration::max()) / 2;

struct DbOptions {
    std::shared_ptr<util::Clock> clock = std::make_shared<util::SystemClock>();
};

/*
    handle to the shared key-value store.

    copies are cheap and all refer to the same store (one shared_ptr to the state), so every
    connection thread gets its own Db by value. the state sits behind one mutex; every critical
    section is a bounded map/set update and nothing blocks while holding it.

    a background reaper thread removes keys when their TTL runs out. it sleeps until the earliest
    deadline and is woken early when a set() moves that deadline forward.

    lifetime: the reaper stops when the store is shut down - explicitly through DbGuard, or when
    the last Db handle is destroyed.
*/
class Db {
   public:
    explicit Db(const DbOptions& options = {});

    [[nodiscard]] std::optional<Data> get(std::string_view key) const;

    /*
        insert or overwrite. ttl is relative to now; nullopt means the key never expires.
        throws std::out_of_range for a negative ttl or one above kMaxTtl.
    */
    void set(std::string key, Data value, std::optional<util::Duration> ttl = std::nullopt);

    /*
        append to the list at `key`, creating it if absent. returns the new list length, or 0
        when the key holds a value that is not a list (that value is left untouched).
    */
    [[nodiscard]] uint64_t rpush(std::string key, std::vector<Data> items);

    /*
        drop every key whose deadline has passed. returns the next deadline still pending, if any.
        the reaper calls this; tests driving a MockClock call it directly.
    */
    std::optional<util::TimePoint> purge_expired_keys();

    // entries held right now, including expired ones the reaper has not reached yet
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t pending_expirations() const;

    [[nodiscard]] bool is_shutdown() const;

   private:
    friend class DbGuard;

    // signal the reaper to exit and wait for it. idempotent
    void shutdown_purge_task();

    struct Shared;
    std::shared_ptr<Shared> shared_;
};

/*
    owns the store's lifetime: shutdown() (or the destructor) stops the reaper thread.
    the server's main creates one guard and hands out Db copies from it.
*/
class DbGuard {
   public:
    explicit DbGuard(const DbOptions& options = {});
    ~DbGuard();

    DbGuard(const DbGuard&) = delete;
    DbGuard& operator=(const DbGuard&) = delete;

    [[nodiscard]] Db db() const {
        return db_;
    }

    void shutdown();

   private:
    Db db_;
};

}  // namespace walrus::core

#endif
