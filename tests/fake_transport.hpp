#pragma once

#include <asio.hpp>
#include <plexus/plexus.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/** Transport that records outbound messages and lets tests inject inbound traffic and connection changes. */
class fake_transport final : public plexus::transport_base {
public:
    using transport_base::deliver;
    using transport_base::notify_close;
    using transport_base::notify_error;
    using transport_base::notify_open;
    using transport_base::set_connected;

    fake_transport(asio::io_context& io, duration default_timeout) :
        transport_base(io, default_timeout) {}

    void send_message(plexus::message msg) override {
        auto lock = std::lock_guard(mutex);
        outbox.push_back(std::move(msg));
    }

    void remove_channel(const plexus::channel& c) override {
        {
            auto lock = std::lock_guard(mutex);
            ++removals[c.get_reference()];
        }
        transport_base::remove_channel(c);
    }

    auto sent() const -> std::vector<plexus::message> {
        auto lock = std::lock_guard(mutex);
        return outbox;
    }

    auto sent_count() const -> std::size_t {
        auto lock = std::lock_guard(mutex);
        return outbox.size();
    }

    auto last_sent() const -> plexus::message {
        auto lock = std::lock_guard(mutex);
        return outbox.back();
    }

    auto removal_count(const plexus::channel& c) const -> int {
        auto lock = std::lock_guard(mutex);
        auto iter = removals.find(c.get_reference());
        return iter == removals.end() ? 0 : iter->second;
    }

    /** Delivers a reply to a previously sent message, echoing its references. */
    void reply(const plexus::message& to, const std::string& status, plexus::payload_type response = {}) {
        response["status"] = status;
        deliver(plexus::message{to.topic, plexus::channel_event::reply(), std::move(response), to.ref, to.join_ref});
    }

private:
    mutable std::mutex mutex;
    std::vector<plexus::message> outbox;
    std::map<std::string, int> removals;
};

/** Owns an io_context and a connected fake transport. Runs the io_context on the test thread. */
struct transport_fixture {
    static constexpr auto timeout = std::chrono::milliseconds{100};

    transport_fixture() :
        io(),
        transport(io, timeout) {
        transport.set_connected(true);
    }

    ~transport_fixture() {
        transport.close_all_channels();
        poll();
    }

    /** Runs every handler that is ready, without waiting on timers. */
    void poll() {
        io.restart();
        io.poll();
    }

    void run_for(std::chrono::milliseconds d) {
        io.restart();
        io.run_for(d);
    }

    /** Joins the channel and answers the join with ok. */
    void join_ok(const std::shared_ptr<plexus::channel>& ch) {
        ch->join();
        poll();
        transport.reply(transport.last_sent(), "ok");
        poll();
    }

    asio::io_context io;
    fake_transport transport;
};

/** Collects everything published on a channel's public stream. */
class stream_recorder {
public:
    explicit stream_recorder(plexus::event_stream<plexus::message>& stream) :
        sub(stream.subscribe([this](const plexus::message& msg) {
            auto lock = std::lock_guard(mutex);
            messages.push_back(msg);
        }, [this] {
            auto lock = std::lock_guard(mutex);
            closed = true;
        })) {}

    auto events() const -> std::vector<std::string> {
        auto lock = std::lock_guard(mutex);
        auto result = std::vector<std::string>{};
        for (const auto& msg : messages) {
            result.push_back(msg.event.get_name());
        }
        return result;
    }

    auto get_messages() const -> std::vector<plexus::message> {
        auto lock = std::lock_guard(mutex);
        return messages;
    }

    auto is_closed() const -> bool {
        auto lock = std::lock_guard(mutex);
        return closed;
    }

private:
    mutable std::mutex mutex;
    std::vector<plexus::message> messages;
    bool closed = false;
    plexus::subscription sub;
};
