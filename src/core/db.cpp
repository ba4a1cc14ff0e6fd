#include "walrus/core/db.hpp"

#include <condition_variable>
#include <iterator>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>

#include "walrus/util/logger.hpp"

namespace walrus::core {

namespace {

struct Entry {
    Data data;
    std::optional<util::TimePoint> expires_at = std::nullopt;
};

}  // namespace

/*
    state shared by every Db handle.

    expirations mirrors the deadlines in entries: each entry with a deadline t has exactly one
    (t, key) member and there are no other members. ordering by (time, key) gives the next key to
    expire at begin() and keeps two keys with the same deadline distinct.
*/
struct Db::Shared {
    explicit Shared(const DbOptions& options) : clock(options.clock) {
        if (!clock) {
            clock = std::make_shared<util::SystemClock>();
        }
        // start last: the reaper reads every other member
        reaper = std::thread(&Shared::run_reaper, this);
    }

    /*
        note: the reaper only holds a raw pointer to Shared, never a shared_ptr. so the last
        handle is always released by some other thread and this destructor can join the reaper
        instead of the reaper trying to join itself.
    */
    ~Shared() {
        stop();
    }

    Shared(const Shared&) = delete;
    Shared& operator=(const Shared&) = delete;

    void stop() {
        {
            std::lock_guard lock(mutex);
            shutdown = true;
            wake_pending = true;
        }
        background_task.notify_one();

        std::lock_guard join_lock(join_mutex);
        if (reaper.joinable()) {
            reaper.join();
        }
    }

    [[nodiscard]] bool is_expired(const Entry& entry, util::TimePoint now) const {
        return entry.expires_at.has_value() && entry.expires_at.value() <= now;
    }

    // caller holds mutex
    void erase_entry(std::unordered_map<std::string, Entry>::iterator it) {
        if (it->second.expires_at.has_value()) {
            expirations.erase({it->second.expires_at.value(), it->first});
        }
        entries.erase(it);
    }

    // caller holds mutex
    std::optional<util::TimePoint> purge_locked(util::TimePoint now) {
        while (!expirations.empty()) {
            auto next = expirations.begin();
            if (next->first > now) {
                // done, this is the instant the reaper sleeps until
                return next->first;
            }
            entries.erase(next->second);
            expirations.erase(next);
        }
        return std::nullopt;
    }

    void run_reaper() {
        std::unique_lock lock(mutex);
        auto woken = [this] { return wake_pending || shutdown; };

        while (!shutdown) {
            // any wake-up issued before this point is covered by the purge below
            wake_pending = false;

            auto next = purge_locked(clock->now());
            if (next.has_value()) {
                // relative wait so the deadline is measured on the injected clock
                background_task.wait_for(lock, next.value() - clock->now(), woken);
            } else {
                background_task.wait(lock, woken);
            }
        }
        lock.unlock();

        WALRUS_LOG_INFO("Purge background task shut down");
    }

    std::shared_ptr<util::Clock> clock;

    mutable std::mutex mutex;
    std::condition_variable background_task;
    std::unordered_map<std::string, Entry> entries;
    std::set<std::pair<util::TimePoint, std::string>> expirations;
    bool shutdown = false;
    // set under mutex by whoever wants the reaper to re-evaluate; survives until the reaper looks
    bool wake_pending = false;

    std::mutex join_mutex;
    std::thread reaper;
};

Db::Db(const DbOptions& options) : shared_(std::make_shared<Shared>(options)) {}

std::optional<Data> Db::get(std::string_view key) const {
    std::lock_guard lock(shared_->mutex);
    auto it = shared_->entries.find(std::string(key));
    if (it == shared_->entries.end()) {
        return std::nullopt;
    }
    // the reaper may not have reached it yet; never hand out a value past its deadline
    if (shared_->is_expired(it->second, shared_->clock->now())) {
        shared_->erase_entry(it);
        return std::nullopt;
    }
    // copy is shallow for bytes - only the refcount moves
    return it->second.data;
}

void Db::set(std::string key, Data value, std::optional<util::Duration> ttl) {
    if (ttl.has_value() && (ttl.value() < util::Duration::zero() || ttl.value() > kMaxTtl)) {
        throw std::out_of_range("ttl out of range: " + std::to_string(ttl.value().count()) + "ms");
    }

    bool notify = false;
    {
        std::lock_guard lock(shared_->mutex);
        auto& state = *shared_;

        std::optional<util::TimePoint> expires_at = std::nullopt;
        if (ttl.has_value()) {
            auto when = state.clock->now() + ttl.value();
            // the reaper only needs to hear about it if this becomes the earliest deadline
            notify = state.expirations.empty() || when < state.expirations.begin()->first;
            expires_at = when;
        }

        auto it = state.entries.find(key);
        if (it != state.entries.end()) {
            // drop the old deadline or the reaper would later delete the new value
            if (it->second.expires_at.has_value()) {
                state.expirations.erase({it->second.expires_at.value(), key});
            }
            it->second = Entry{std::move(value), expires_at};
        } else {
            state.entries.emplace(key, Entry{std::move(value), expires_at});
        }

        if (expires_at.has_value()) {
            state.expirations.emplace(expires_at.value(), std::move(key));
        }
        if (notify) {
            state.wake_pending = true;
        }
    }

    // notify after unlocking so the reaper doesn't wake up straight into a held mutex
    if (notify) {
        shared_->background_task.notify_one();
    }
}

uint64_t Db::rpush(std::string key, std::vector<Data> items) {
    std::lock_guard lock(shared_->mutex);
    auto& state = *shared_;

    auto it = state.entries.find(key);
    if (it != state.entries.end() && state.is_expired(it->second, state.clock->now())) {
        state.erase_entry(it);
        it = state.entries.end();
    }

    if (it == state.entries.end()) {
        uint64_t len = items.size();
        state.entries.emplace(std::move(key), Entry{Data::list(std::move(items)), std::nullopt});
        return len;
    }

    if (!it->second.data.is(DataKind::List)) {
        return 0;
    }

    auto& list = it->second.data.as_list();
    list.insert(list.end(), std::make_move_iterator(items.begin()),
                std::make_move_iterator(items.end()));
    return list.size();
}

std::optional<util::TimePoint> Db::purge_expired_keys() {
    std::lock_guard lock(shared_->mutex);
    if (shared_->shutdown) {
        return std::nullopt;
    }
    return shared_->purge_locked(shared_->clock->now());
}

std::size_t Db::size() const {
    std::lock_guard lock(shared_->mutex);
    return shared_->entries.size();
}

std::size_t Db::pending_expirations() const {
    std::lock_guard lock(shared_->mutex);
    return shared_->expirations.size();
}

bool Db::is_shutdown() const {
    std::lock_guard lock(shared_->mutex);
    return shared_->shutdown;
}

void Db::shutdown_purge_task() {
    shared_->stop();
}

DbGuard::DbGuard(const DbOptions& options) : db_(options) {}

DbGuard::~DbGuard() {
    shutdown();
}

void DbGuard::shutdown() {
    db_.shutdown_purge_task();
}

}  // namespace walrus::core
