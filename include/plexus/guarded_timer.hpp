#pragma once

#include <asio.hpp>

#include <cassert>
#include <cstdint>
#include <memory>
#include <utility>

namespace plexus {

template <typename Handler, typename GuardValue>
auto guarded_timer_invoke(const Handler& handler, asio::error_code ec, const std::shared_ptr<GuardValue>& guard) -> decltype(handler(ec, guard)) {
    return handler(ec, guard);
}

template <typename Handler, typename GuardValue>
auto guarded_timer_invoke(const Handler& handler, asio::error_code ec, [[maybe_unused]] const std::shared_ptr<GuardValue>& guard) -> decltype(handler(ec)) {
    return handler(ec);
}

/**
 * Single-shot steady timer owned by a guard object.
 *
 * The completion handler is dropped when the guard has expired, so it may freely capture the owner by pointer.
 * A completion that was already queued for execution when the timer was cancelled or re-armed is delivered
 * as operation_aborted, which makes cancel() reliable from the owner's point of view.
 * All member functions must be called from the timer's executor.
 */
template <typename GuardValue>
class guarded_timer {
public:
    using guard_value = GuardValue;
    using underlying_timer_type = asio::steady_timer;
    using clock_type = underlying_timer_type::clock_type;
    using duration = underlying_timer_type::duration;
    using time_point = underlying_timer_type::time_point;

    template <typename Executor>
    explicit guarded_timer(const Executor& ex) :
        timer(ex),
        generation(0),
        armed(false) {}

    guarded_timer(const guarded_timer&) = delete;
    guarded_timer& operator=(const guarded_timer&) = delete;

    /** Cancels any pending wait. Returns the number of waits that were cancelled before their completion was queued. */
    auto cancel() -> std::size_t {
        ++generation;
        armed = false;
        return timer.cancel();
    }

    /** Determines whether a wait is pending and has not been cancelled. */
    auto is_armed() const -> bool {
        return armed;
    }

    /** Cancels any pending wait, then waits for the given duration. */
    template <typename WaitHandler>
    void start(const std::weak_ptr<guard_value>& guard, const duration& expiry_time, WaitHandler&& handler) {
        ++generation;
        timer.expires_after(expiry_time);
        async_wait(guard, std::forward<WaitHandler>(handler));
    }

private:
    template <typename WaitHandler>
    void async_wait(const std::weak_ptr<guard_value>& guard, WaitHandler&& handler) {
        assert(guard.lock());

        auto exec = asio::get_associated_executor(handler, timer.get_executor());

        armed = true;

        timer.async_wait(asio::bind_executor(exec, [this, guard, gen = generation, handler = std::forward<WaitHandler>(handler)](asio::error_code ec) {
            auto owner = guard.lock();
            if (!owner) return;

            if (gen != generation) {
                // Superseded by cancel() or a later start(), possibly after this completion was queued.
                ec = asio::error::operation_aborted;
            } else {
                armed = false;
            }

            guarded_timer_invoke(handler, ec, owner);
        }));
    }

    underlying_timer_type timer;
    std::uint64_t generation;
    bool armed;
};

} // namespace plexus
