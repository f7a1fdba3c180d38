#pragma once

#include "channel_event.hpp"
#include "config.hpp"
#include "error.hpp"
#include "event_stream.hpp"
#include "guarded_timer.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "push.hpp"
#include "transport.hpp"

#include <asio.hpp>

#include <atomic>
#include <cassert>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace plexus {

enum class channel_state {
    /** Not joined. Initial state, and final state once the channel has been closed. */
    CLOSED,
    /** A join has been sent, awaiting its reply. */
    JOINING,
    /** Joined and functional. */
    JOINED,
    /** The join was rejected, timed out, or the transport failed. A rejoin may be scheduled. */
    ERRORED,
    /** A leave has been requested, awaiting its completion. */
    LEAVING,
};

inline auto to_string(channel_state s) -> const char* {
    switch (s) {
        case channel_state::CLOSED: return "CLOSED";
        case channel_state::JOINING: return "JOINING";
        case channel_state::JOINED: return "JOINED";
        case channel_state::ERRORED: return "ERRORED";
        case channel_state::LEAVING: return "LEAVING";
    }
    return "UNKNOWN";
}

/** What happens to a pending waiter when a new waiter is registered for the same event kind. */
enum class waiter_conflict {
    /** The previous waiter is dropped. Its future reports std::future_errc::broken_promise. */
    REPLACE,
    /** The previous waiter is failed with errc::waiter_superseded. */
    FAIL_PREVIOUS,
};

struct channel_options {
    /** Timeout for the join and for pushes that don't specify one. Defaults to the transport's default timeout. */
    std::optional<config::duration> timeout = std::nullopt;
    waiter_conflict on_waiter_conflict = waiter_conflict::REPLACE;
};

/**
 * One topic multiplexed over a shared transport.
 *
 * Owns the join/leave/rejoin state machine, buffers pushes until joined, and dispatches inbound messages.
 * Every state mutation, timer completion, and transport callback runs on the channel's strand.
 */
class channel : public std::enable_shared_from_this<channel> {
    struct private_tag {};

public:
    friend class plexus::push;

    using duration = config::duration;
    using executor_type = asio::strand<asio::io_context::executor_type>;
    using push_ptr = std::shared_ptr<plexus::push>;

    /** Constructs a channel and subscribes it to the transport's streams. Registration is the transport's job. */
    static auto create(transport& tp, std::string topic, payload_type parameters = {}, channel_options options = {}) -> std::shared_ptr<channel> {
        auto ch = std::make_shared<channel>(private_tag{}, tp, std::move(topic), std::move(parameters), options);
        ch->reference = tp.next_ref();
        ch->join_push = std::make_shared<plexus::push>(ch, channel_event::join(), ch->parameters, ch->get_timeout());
        ch->join_push->settle_on_ok_only = true;
        ch->subscribe_to_transport();
        return ch;
    }

    channel(private_tag, transport& tp, std::string topic, payload_type parameters, const channel_options& options) :
        tp(&tp),
        topic(std::move(topic)),
        parameters(std::move(parameters)),
        logger_name(make_logger_name(this->topic)),
        reference(),
        strand(asio::make_strand(tp.get_io())),
        conflict_policy(options.on_waiter_conflict),
        timeout(options.timeout.value_or(tp.get_default_timeout())),
        state(channel_state::CLOSED),
        joined_once(false),
        terminated(false),
        join_attempt(0),
        rejoin_timer(strand),
        join_push(nullptr),
        push_buffer(),
        waiters(),
        subscriptions(),
        messages() {
            PLEXUS_LOG_ACTION("channel", logger_name, "Channel constructed.");
        }

    channel(const channel&) = delete;
    channel(channel&&) = delete;

    auto get_topic() const -> const std::string& {
        return topic;
    }

    auto get_parameters() const -> const payload_type& {
        return parameters;
    }

    auto get_timeout() const -> duration {
        return timeout;
    }

    void set_timeout(duration t) {
        timeout = t;
    }

    auto get_state() const -> channel_state {
        return state;
    }

    auto is_closed() const -> bool { return state == channel_state::CLOSED; }
    auto is_errored() const -> bool { return state == channel_state::ERRORED; }
    auto is_joined() const -> bool { return state == channel_state::JOINED; }
    auto is_joining() const -> bool { return state == channel_state::JOINING; }
    auto is_leaving() const -> bool { return state == channel_state::LEAVING; }

    /** Determines whether a push would be transmitted immediately instead of buffered. */
    auto can_push() const -> bool {
        return tp->is_connected() && state == channel_state::JOINED;
    }

    /** Gets the reference of the current join attempt, which is the current join epoch. Call from the strand. */
    auto get_join_ref() const -> std::string {
        return join_push->peek_ref();
    }

    /** Unique per channel instance. */
    auto get_reference() const -> const std::string& {
        return reference;
    }

    /** The topic with characters that are awkward in logger names replaced. */
    auto get_logger_name() const -> const std::string& {
        return logger_name;
    }

    auto get_transport() -> transport& {
        return *tp;
    }

    auto get_executor() const -> const executor_type& {
        return strand;
    }

    /** Dispatches a task to the channel's strand. */
    template <typename F>
    void dispatch(F&& f) {
        asio::dispatch(strand, std::forward<F>(f));
    }

    /** Public stream of inbound and derived messages. Closed when the channel closes. */
    auto get_messages() -> event_stream<message>& {
        return messages;
    }

    /** The join push. The same instance is re-armed for every join attempt. */
    auto get_join_push() const -> const push_ptr& {
        return join_push;
    }

    /** Number of pushes waiting for the channel to become joined. Call from the strand. */
    auto get_push_buffer_size() const -> std::size_t {
        return push_buffer.size();
    }

    /** Number of pending reply waiters, including those of in-flight pushes. Call from the strand. */
    auto get_waiter_count() const -> std::size_t {
        return waiters.size();
    }

    /** Determines whether a rejoin is scheduled. Call from the strand. */
    auto has_rejoin_timer() const -> bool {
        return rejoin_timer.is_armed();
    }

    /**
     * Joins the topic. May only be called once per channel.
     *
     * Returns the join push. Its future resolves once a join attempt succeeds, possibly after rejoins, and fails
     * with errc::channel_closed if the channel closes first. Rejected or timed out attempts are reported to its
     * on_reply() callbacks.
     */
    auto join(std::optional<duration> new_timeout = std::nullopt) -> push_ptr {
        if (joined_once.exchange(true)) {
            throw usage_error("tried to join multiple times on channel " + topic);
        }

        dispatch([self = shared_from_this(), new_timeout] {
            if (self->terminated) {
                PLEXUS_LOG_ACTION("channel", self->logger_name, "Ignoring join on a closed channel.");
                return;
            }

            if (new_timeout) {
                self->timeout = *new_timeout;
            }

            self->attempt_join();
        });

        return join_push;
    }

    /** Pushes a custom event. Requires a prior join(). */
    auto push(const std::string& event_name, payload_type payload, std::optional<duration> new_timeout = std::nullopt) -> push_ptr {
        return push_event(channel_event::custom(event_name), std::move(payload), new_timeout);
    }

    /** Pushes an event. Requires a prior join(). Sent immediately if joined, otherwise buffered until joined. */
    auto push_event(channel_event event, payload_type payload, std::optional<duration> new_timeout = std::nullopt) -> push_ptr {
        if (!joined_once) {
            throw usage_error("tried to push " + event.get_name() + " before joining channel " + topic);
        }

        auto p = std::make_shared<plexus::push>(shared_from_this(), std::move(event), std::move(payload), new_timeout.value_or(get_timeout()));

        dispatch([self = shared_from_this(), p] {
            if (self->terminated) {
                PLEXUS_LOG_ACTION("channel", self->logger_name, "Dropping push ", p->get_event(), " on a closed channel.");
                return;
            }

            if (self->can_push()) {
                p->send_now();
            } else {
                PLEXUS_LOG_ACTION("channel", self->logger_name, "Buffering push ", p->get_event(), " until joined.");
                self->push_buffer.push_back(p);
            }
        });

        return p;
    }

    /** Leaves the topic. The channel closes once the leave completes or times out. */
    auto leave(std::optional<duration> new_timeout = std::nullopt) -> push_ptr {
        auto leave_push = std::make_shared<plexus::push>(shared_from_this(), channel_event::leave(), payload_type{}, new_timeout.value_or(get_timeout()));

        dispatch([self = shared_from_this(), leave_push] {
            self->leave_now(leave_push);
        });

        return leave_push;
    }

    /** Tears the channel down and deregisters it from the transport. Idempotent. */
    void close() {
        dispatch([self = shared_from_this()] {
            self->close_now();
        });
    }

    /** Publishes a message on the public stream unless the channel is closed. */
    void trigger(message msg) {
        dispatch([self = shared_from_this(), msg = std::move(msg)] {
            if (!self->messages.is_closed()) {
                self->messages.publish(msg);
            }
        });
    }

    /** Reports a transport failure. Ignored while already ERRORED, LEAVING, or CLOSED. */
    void trigger_error(transport_failure failure) {
        dispatch([self = shared_from_this(), failure = std::move(failure)] {
            self->trigger_error_now(failure);
        });
    }

    /** Waits for the next inbound message of the given kind. */
    auto on_push_reply(channel_event reply_event) -> std::future<message> {
        auto promise = std::make_shared<std::promise<message>>();
        auto result = promise->get_future();

        dispatch([self = shared_from_this(), reply_event = std::move(reply_event), promise] {
            if (self->terminated) {
                promise->set_exception(std::make_exception_ptr(channel_error(make_error_code(errc::channel_closed))));
                return;
            }

            PLEXUS_LOG_ACTION("channel", self->logger_name, "Hooking on reply to ", reply_event, ".");

            self->add_waiter(reply_event, waiter{
                [promise](const message& msg) {
                    promise->set_value(msg);
                },
                [promise](std::error_code ec) {
                    promise->set_exception(std::make_exception_ptr(channel_error(ec)));
                },
            });
        });

        return result;
    }

private:
    struct waiter {
        std::function<void(const message&)> complete;
        std::function<void(std::error_code)> fail;
    };

    static auto make_logger_name(const std::string& topic) -> std::string {
        auto result = topic;
        for (auto& c : result) {
            if (std::char_traits<char>::find(config::logger_name_reserved, std::char_traits<char>::length(config::logger_name_reserved), c)) {
                c = '_';
            }
        }
        return result;
    }

    void subscribe_to_transport() {
        auto weak = weak_from_this();

        subscriptions.push_back(tp->get_topic_stream(topic).subscribe([weak](const message& msg) {
            if (auto self = weak.lock()) {
                asio::post(self->strand, [weak, msg] {
                    if (auto self = weak.lock()) {
                        self->receive(msg);
                    }
                });
            }
        }));

        subscriptions.push_back(tp->get_error_stream().subscribe([weak](const transport_failure&) {
            if (auto self = weak.lock()) {
                asio::post(self->strand, [weak] {
                    if (auto self = weak.lock()) {
                        // Don't try to rejoin over a dead link.
                        self->cancel_rejoin_timer();
                    }
                });
            }
        }));

        subscriptions.push_back(tp->get_open_stream().subscribe([weak](const transport_open&) {
            if (auto self = weak.lock()) {
                asio::post(self->strand, [weak] {
                    if (auto self = weak.lock()) {
                        self->transport_opened();
                    }
                });
            }
        }));
    }

    void transport_opened() {
        assert(strand.running_in_this_thread());

        if (terminated) return;

        cancel_rejoin_timer();

        if (state == channel_state::ERRORED) {
            PLEXUS_LOG_ACTION("channel", logger_name, "Transport reopened while ERRORED. Rejoining.");
            attempt_join();
        }
    }

    void attempt_join() {
        assert(strand.running_in_this_thread());

        if (terminated || !joined_once || state == channel_state::LEAVING) {
            return;
        }

        state = channel_state::JOINING;

        auto attempt = ++join_attempt;

        PLEXUS_LOG_ACTION("channel", logger_name, "Attempting join #", attempt, ". Now JOINING.");

        join_push->bind([weak = weak_from_this(), attempt](const push_response& response) {
            if (auto self = weak.lock()) {
                self->join_responded(attempt, response);
            }
        });

        join_push->resend(get_timeout());
    }

    void join_responded(std::uint64_t attempt, const push_response& response) {
        assert(strand.running_in_this_thread());

        if (attempt != join_attempt) {
            PLEXUS_LOG_ACTION("channel", logger_name, "Ignoring ", response.status, " for superseded join #", attempt, ".");
            return;
        }

        if (response.is_ok()) {
            PLEXUS_LOG_ACTION("channel", logger_name, "Join ok. Now JOINED. Flushing ", push_buffer.size(), " buffered pushes.");

            state = channel_state::JOINED;
            cancel_rejoin_timer();

            auto pending = std::move(push_buffer);
            push_buffer.clear();

            for (const auto& p : pending) {
                p->send_now();
            }
        } else if (response.is_error()) {
            PLEXUS_LOG_ACTION("channel", logger_name, "Join got an error response. Now ERRORED.");

            state = channel_state::ERRORED;

            if (tp->is_connected()) {
                start_rejoin_timer();
            }
        } else if (response.is_timeout()) {
            PLEXUS_LOG_ACTION("channel", logger_name, "Join timed out. Sending leave. Now ERRORED.");

            // Best effort, nobody waits on it.
            auto leave_push = std::make_shared<plexus::push>(shared_from_this(), channel_event::leave(), payload_type{}, get_timeout());
            leave_push->send_now();

            state = channel_state::ERRORED;
            join_push->reset_now();

            if (tp->is_connected()) {
                start_rejoin_timer();
            }
        }
    }

    void leave_now(const push_ptr& leave_push) {
        assert(strand.running_in_this_thread());

        if (terminated) {
            PLEXUS_LOG_ACTION("channel", logger_name, "Leave on a closed channel. Completing immediately.");
            leave_push->trigger_now(push_response::ok());
            return;
        }

        join_push->timer.cancel();
        cancel_rejoin_timer();

        auto was_joined = state == channel_state::JOINED;

        state = channel_state::LEAVING;

        leave_push->bind([weak = weak_from_this()](const push_response& response) {
            if (auto self = weak.lock()) {
                self->leave_completed(response);
            }
        });

        if (!tp->is_connected() || !was_joined) {
            PLEXUS_LOG_ACTION("channel", logger_name, "Leaving without transmitting. Now LEAVING.");
            leave_push->trigger_now(push_response::ok());
        } else {
            PLEXUS_LOG_ACTION("channel", logger_name, "Sending leave. Now LEAVING.");
            leave_push->send_now();
        }
    }

    void leave_completed([[maybe_unused]] const push_response& response) {
        assert(strand.running_in_this_thread());

        PLEXUS_LOG_ACTION("channel", logger_name, "Leave completed with ", response.status, ". Closing.");

        if (!messages.is_closed()) {
            messages.publish(message{topic, channel_event::close(), {{"ok", "leave"}}, std::nullopt, std::nullopt});
        }

        cancel_rejoin_timer();
        close_now();
    }

    void close_now() {
        assert(strand.running_in_this_thread());

        if (terminated) {
            return;
        }

        // Deregistration may drop the transport's reference to us.
        auto self = shared_from_this();

        PLEXUS_LOG_ACTION("channel", logger_name, "Closing. Now CLOSED.");

        terminated = true;
        state = channel_state::CLOSED;

        for (const auto& p : push_buffer) {
            p->fail_now(make_error_code(errc::channel_closed));
        }
        push_buffer.clear();

        for (auto& s : subscriptions) {
            s.cancel();
        }

        join_push->fail_now(make_error_code(errc::channel_closed));
        cancel_rejoin_timer();

        messages.close();

        fail_waiters(make_error_code(errc::channel_closed));

        tp->remove_channel(*this);
    }

    void trigger_error_now(const transport_failure& failure) {
        assert(strand.running_in_this_thread());

        if (terminated || state == channel_state::ERRORED || state == channel_state::LEAVING || state == channel_state::CLOSED) {
            PLEXUS_LOG_ACTION("channel", logger_name, "Ignoring error in state ", to_string(state), ".");
            return;
        }

        PLEXUS_LOG_ACTION("channel", logger_name, "Got error: ", failure.to_error_code().message(), ". Now ERRORED.");

        messages.publish(failure.to_message(topic));

        fail_waiters(failure.to_error_code());

        auto was_joining = state == channel_state::JOINING;

        state = channel_state::ERRORED;

        if (was_joining) {
            join_push->reset_now();
        }

        if (tp->is_connected()) {
            start_rejoin_timer();
        }
    }

    /** Drops stale lifecycle messages from a superseded join attempt. */
    auto is_member(const message& msg) const -> bool {
        if (msg.join_ref && !msg.join_ref->empty() && msg.event.is_status() && *msg.join_ref != get_join_ref()) {
            return false;
        }
        return true;
    }

    void receive(const message& msg) {
        assert(strand.running_in_this_thread());

        if (terminated) return;

        PLEXUS_BEGIN_SECTION(logger_name);

        if (!is_member(msg)) {
            PLEXUS_LOG_ACTION("channel", logger_name, "Dropping ", msg.event, " for stale join_ref ", *msg.join_ref, " (current:", get_join_ref(), ").");
        } else {
            PLEXUS_LOG_MESSAGE("recv", msg);
            messages.publish(msg);
            dispatch_inbound(msg);
        }

        PLEXUS_END_SECTION(logger_name);
    }

    void dispatch_inbound(const message& msg) {
        assert(strand.running_in_this_thread());

        if (msg.event == channel_event::close()) {
            PLEXUS_LOG_ACTION("channel", logger_name, "Close received.");
            cancel_rejoin_timer();
            close_now();
        } else if (msg.event == channel_event::error()) {
            PLEXUS_LOG_ACTION("channel", logger_name, "Error received. Now ERRORED.");

            if (state == channel_state::JOINING) {
                join_push->reset_now();
            }

            state = channel_state::ERRORED;

            if (tp->is_connected()) {
                start_rejoin_timer();
            }
        } else if (msg.event == channel_event::reply()) {
            auto normalized = msg.as_reply_event();

            if (!messages.is_closed()) {
                messages.publish(normalized);
            }

            complete_waiter(normalized);
        }

        complete_waiter(msg);
    }

    void add_waiter(const channel_event& event, waiter w) {
        assert(strand.running_in_this_thread());

        auto iter = waiters.find(event);

        if (iter != waiters.end()) {
            PLEXUS_LOG_ACTION("channel", logger_name, "Removing previous waiter for ", event, ".");

            auto previous = std::move(iter->second);
            waiters.erase(iter);

            if (conflict_policy == waiter_conflict::FAIL_PREVIOUS && previous.fail) {
                previous.fail(make_error_code(errc::waiter_superseded));
            }
        }

        waiters.emplace(event, std::move(w));
    }

    void remove_waiter(const channel_event& event) {
        assert(strand.running_in_this_thread());

        waiters.erase(event);
    }

    void complete_waiter(const message& msg) {
        auto iter = waiters.find(msg.event);

        if (iter == waiters.end()) {
            return;
        }

        PLEXUS_LOG_ACTION("channel", logger_name, "Notifying waiter for ", msg.event, ".");

        // Erase first, completion may register a new waiter for the same kind.
        auto w = std::move(iter->second);
        waiters.erase(iter);

        if (w.complete) {
            w.complete(msg);
        }
    }

    void fail_waiters(std::error_code ec) {
        auto pending = std::move(waiters);
        waiters.clear();

        for (auto& [event, w] : pending) {
            if (w.fail) {
                w.fail(ec);
            }
        }
    }

    void start_rejoin_timer() {
        assert(strand.running_in_this_thread());

        PLEXUS_LOG_ACTION("channel", logger_name, "Scheduling rejoin.");

        rejoin_timer.start(weak_from_this(), get_timeout(), [this](asio::error_code ec) {
            if (ec == asio::error::operation_aborted) {
                return;
            }

            if (tp->is_connected()) {
                PLEXUS_LOG_ACTION("channel", logger_name, "Rejoin timer fired.");
                attempt_join();
            }
        });
    }

    void cancel_rejoin_timer() {
        rejoin_timer.cancel();
    }

    transport* tp;
    const std::string topic;
    const payload_type parameters;
    const std::string logger_name;
    std::string reference;
    executor_type strand;
    waiter_conflict conflict_policy;
    std::atomic<duration> timeout;
    std::atomic<channel_state> state;
    std::atomic<bool> joined_once;
    bool terminated;
    std::uint64_t join_attempt;
    guarded_timer<channel> rejoin_timer;
    push_ptr join_push;
    std::vector<push_ptr> push_buffer;
    std::unordered_map<channel_event, waiter> waiters;
    std::vector<subscription> subscriptions;
    event_stream<message> messages;
};

// push members that need the complete channel type

inline push::push(const std::shared_ptr<channel>& owner, channel_event event, payload_type payload, duration timeout) :
    owner(owner),
    strand(owner->get_executor()),
    event(std::move(event)),
    payload(std::move(payload)),
    timeout(timeout),
    ref(std::nullopt),
    receivers(),
    internal_handler(),
    received(std::nullopt),
    received_flag(false),
    sent(false),
    timer(strand),
    completed(false),
    settle_on_ok_only(false),
    promise(),
    future(promise.get_future().share()) {}

inline auto push::get_ref() -> const std::string& {
    if (!ref) {
        auto ch = owner.lock();
        assert(ch);
        ref = ch->get_transport().next_ref();
    }
    return *ref;
}

inline void push::send_now() {
    assert(strand.running_in_this_thread());

    auto ch = owner.lock();

    if (!ch) return;

    if (has_received(config::status_timeout)) {
        PLEXUS_LOG_ACTION("push", event, "Not sending, already timed out.");
        return;
    }

    auto reply_event = get_reply_event();

    sent = true;

    // The waiter owns the push until it is completed, failed or removed, so callers may drop their handle.
    ch->add_waiter(reply_event, channel::waiter{
        [self = shared_from_this()](const message& msg) {
            self->trigger_now(push_response::from_payload(msg.payload));
        },
        [self = shared_from_this()](std::error_code ec) {
            self->fail_now(ec);
        },
    });

    timer.start(weak_from_this(), timeout, [this](asio::error_code ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }

        PLEXUS_LOG_ACTION("push", event, "Timed out (ref:", peek_ref(), ").");
        expire();
    });

    auto join_ref = ch->get_join_ref();
    auto msg = message{ch->get_topic(), event, payload, *ref, join_ref.empty() ? std::nullopt : std::optional(join_ref)};

    PLEXUS_LOG_MESSAGE("send", msg);

    ch->get_transport().send_message(std::move(msg));
}

inline void push::reset_now() {
    assert(strand.running_in_this_thread());

    timer.cancel();

    if (ref) {
        if (auto ch = owner.lock()) {
            ch->remove_waiter(channel_event::reply_for(*ref));
        }
    }

    ref.reset();
    received.reset();
    received_flag = false;
    sent = false;
}

inline void push::expire() {
    assert(strand.running_in_this_thread());

    if (ref) {
        if (auto ch = owner.lock()) {
            ch->remove_waiter(channel_event::reply_for(*ref));
        }
    }

    trigger_now(push_response::timeout());
}

inline void push::fail_now(std::error_code ec) {
    assert(strand.running_in_this_thread());

    PLEXUS_LOG_ACTION("push", event, "Failed: ", ec.message(), ".");

    timer.cancel();

    if (!completed && (!settle_on_ok_only || ec == make_error_code(errc::channel_closed))) {
        completed = true;
        promise.set_exception(std::make_exception_ptr(channel_error(ec)));
    }
}

} // namespace plexus
