#pragma once

#include "channel_event.hpp"
#include "config.hpp"
#include "guarded_timer.hpp"
#include "logging.hpp"
#include "message.hpp"

#include <asio.hpp>

#include <atomic>
#include <cassert>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace plexus {

class channel;

/**
 * One outbound message awaiting a status-correlated reply.
 *
 * Pushes are created by a channel and run on that channel's strand. The mutating member functions dispatch to the
 * strand, so they may be called from any thread; when already on the strand they run inline.
 * The accessors for the reference and the received response must be called from the strand.
 *
 * Member functions that need the complete channel type are defined in channel.hpp.
 */
class push : public std::enable_shared_from_this<push> {
public:
    friend channel;

    using duration = config::duration;
    using executor_type = asio::strand<asio::io_context::executor_type>;
    using reply_callback = std::function<void(const push_response&)>;

    push(const std::shared_ptr<channel>& owner, channel_event event, payload_type payload, duration timeout);

    push(const push&) = delete;
    push(push&&) = delete;

    auto get_event() const -> const channel_event& {
        return event;
    }

    auto get_payload() const -> const payload_type& {
        return payload;
    }

    auto get_timeout() const -> duration {
        return timeout;
    }

    /** Gets the correlation reference, allocating one from the transport if there is none. */
    auto get_ref() -> const std::string&;

    /** Gets the correlation reference without allocating. Empty if there is none. */
    auto peek_ref() const -> std::string {
        return ref.value_or(std::string{});
    }

    /** The event kind the reply to this push is normalized to. */
    auto get_reply_event() -> channel_event {
        return channel_event::reply_for(get_ref());
    }

    auto is_sent() const -> bool {
        return sent;
    }

    auto has_received() const -> bool {
        return received_flag;
    }

    auto has_received(const std::string& status) const -> bool {
        return received && received->status == status;
    }

    auto is_timer_armed() const -> bool {
        return timer.is_armed();
    }

    /**
     * Resolved by the first response this push receives, or failed if its channel fails it first.
     * The join push is retried across attempts, so its future only settles with an ok response or when the
     * channel closes.
     */
    auto get_future() const -> std::shared_future<push_response> {
        return future;
    }

    /** Binds a callback to a reply status. Replaces any callback previously bound to the same status. */
    void on_reply(std::string status, reply_callback callback) {
        asio::dispatch(strand, [self = shared_from_this(), status = std::move(status), callback = std::move(callback)]() mutable {
            self->receivers[status] = std::move(callback);
        });
    }

    /** Removes every callback bound with on_reply(). */
    void clear_receivers() {
        asio::dispatch(strand, [self = shared_from_this()] {
            self->receivers.clear();
        });
    }

    /** Transmits the message and arms the timeout. */
    void send() {
        asio::dispatch(strand, [self = shared_from_this()] {
            self->send_now();
        });
    }

    /** Discards any previous attempt and sends again with a new timeout. */
    void resend(duration new_timeout) {
        asio::dispatch(strand, [self = shared_from_this(), new_timeout] {
            self->timeout = new_timeout;
            self->reset_now();
            self->send_now();
        });
    }

    /** Delivers a response, either a matching reply or a synthesized one. */
    void trigger(push_response response) {
        asio::dispatch(strand, [self = shared_from_this(), response = std::move(response)] {
            self->trigger_now(response);
        });
    }

    /** Cancels the pending timeout without invoking any callback. */
    void cancel_timeout() {
        asio::dispatch(strand, [self = shared_from_this()] {
            self->timer.cancel();
        });
    }

    /** Cancels the pending timeout and forgets the current attempt, including its reference. */
    void reset() {
        asio::dispatch(strand, [self = shared_from_this()] {
            self->reset_now();
        });
    }

private:
    using response_handler = std::function<void(const push_response&)>;

    void send_now();
    void reset_now();
    void expire();

    /** Sets the owning channel's handler, invoked before the on_reply() callbacks. */
    void bind(response_handler handler) {
        assert(strand.running_in_this_thread());

        internal_handler = std::move(handler);
    }

    void trigger_now(const push_response& response) {
        assert(strand.running_in_this_thread());

        if (received) {
            PLEXUS_LOG_ACTION("push", event, "Ignoring ", response.status, " response, already received ", received->status, ".");
            return;
        }

        PLEXUS_LOG_ACTION("push", event, "Received ", response.status, " response (ref:", peek_ref(), ").");

        timer.cancel();
        received = response;
        received_flag = true;

        if (!completed && (!settle_on_ok_only || response.is_ok())) {
            completed = true;
            promise.set_value(response);
        }

        // Handlers may reset or rebind this push, so invoke copies.
        if (internal_handler) {
            auto handler = internal_handler;
            handler(response);
        }

        auto iter = receivers.find(response.status);

        if (iter != receivers.end()) {
            auto callback = iter->second;
            callback(response);
        }
    }

    /** Fails the pending attempt without invoking any callback. */
    void fail_now(std::error_code ec);

    std::weak_ptr<channel> owner;
    executor_type strand;
    channel_event event;
    payload_type payload;
    duration timeout;
    std::optional<std::string> ref;
    std::map<std::string, reply_callback> receivers;
    response_handler internal_handler;
    std::optional<push_response> received;
    std::atomic<bool> received_flag;
    std::atomic<bool> sent;
    guarded_timer<push> timer;
    bool completed;
    bool settle_on_ok_only;
    std::promise<push_response> promise;
    std::shared_future<push_response> future;
};

} // namespace plexus
