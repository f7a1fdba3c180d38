#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace plexus {

/** Handle to one event_stream subscriber. Cancelling is idempotent and takes effect before the next delivery. */
class subscription {
public:
    subscription() = default;

    explicit subscription(std::function<void()> canceller) :
        canceller(std::move(canceller)) {}

    subscription(const subscription&) = delete;
    subscription& operator=(const subscription&) = delete;

    subscription(subscription&& other) noexcept :
        canceller(std::exchange(other.canceller, nullptr)) {}

    subscription& operator=(subscription&& other) noexcept {
        if (this != &other) {
            cancel();
            canceller = std::exchange(other.canceller, nullptr);
        }
        return *this;
    }

    ~subscription() {
        cancel();
    }

    void cancel() {
        if (auto f = std::exchange(canceller, nullptr)) {
            f();
        }
    }

    auto is_active() const -> bool {
        return static_cast<bool>(canceller);
    }

private:
    std::function<void()> canceller;
};

/**
 * Thread-safe broadcast stream.
 *
 * Subscribers are invoked synchronously by publish(), on the publishing thread, outside the internal lock.
 * Once closed, publish() is a no-op, subscribers are dropped, and on_close handlers are invoked once.
 */
template <typename T>
class event_stream {
public:
    using value_type = T;
    using handler_type = std::function<void(const value_type&)>;
    using close_handler_type = std::function<void()>;

    event_stream() :
        state(std::make_shared<shared_state>()) {}

    event_stream(const event_stream&) = delete;
    event_stream& operator=(const event_stream&) = delete;

    ~event_stream() {
        close();
    }

    /** Adds a subscriber. Subscribing to a closed stream yields an inactive subscription. */
    auto subscribe(handler_type handler, close_handler_type on_close = {}) -> subscription {
        auto entry = std::make_shared<subscriber>();
        entry->handler = std::move(handler);
        entry->on_close = std::move(on_close);

        auto lock = std::lock_guard(state->mutex);

        if (state->closed) {
            return {};
        }

        auto id = state->next_id++;
        state->subscribers.push_back({id, entry});

        return subscription([weak_state = std::weak_ptr(state), id, entry] {
            entry->active = false;
            if (auto s = weak_state.lock()) {
                auto lock = std::lock_guard(s->mutex);
                auto& subs = s->subscribers;
                for (auto iter = subs.begin(); iter != subs.end(); ++iter) {
                    if (iter->first == id) {
                        subs.erase(iter);
                        break;
                    }
                }
            }
        });
    }

    void publish(const value_type& value) {
        auto snapshot = std::vector<std::shared_ptr<subscriber>>{};

        {
            auto lock = std::lock_guard(state->mutex);
            if (state->closed) return;
            snapshot.reserve(state->subscribers.size());
            for (const auto& [id, entry] : state->subscribers) {
                snapshot.push_back(entry);
            }
        }

        for (const auto& entry : snapshot) {
            if (entry->active) {
                entry->handler(value);
            }
        }
    }

    void close() {
        auto snapshot = std::vector<std::pair<std::uint64_t, std::shared_ptr<subscriber>>>{};

        {
            auto lock = std::lock_guard(state->mutex);
            if (state->closed) return;
            state->closed = true;
            snapshot.swap(state->subscribers);
        }

        for (const auto& [id, entry] : snapshot) {
            if (entry->active.exchange(false) && entry->on_close) {
                entry->on_close();
            }
        }
    }

    auto is_closed() const -> bool {
        auto lock = std::lock_guard(state->mutex);
        return state->closed;
    }

    auto subscriber_count() const -> std::size_t {
        auto lock = std::lock_guard(state->mutex);
        return state->subscribers.size();
    }

private:
    struct subscriber {
        handler_type handler;
        close_handler_type on_close;
        std::atomic<bool> active{true};
    };

    struct shared_state {
        mutable std::mutex mutex;
        bool closed = false;
        std::uint64_t next_id = 0;
        std::vector<std::pair<std::uint64_t, std::shared_ptr<subscriber>>> subscribers;
    };

    std::shared_ptr<shared_state> state;
};

} // namespace plexus
