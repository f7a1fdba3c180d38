#pragma once

#include "channel.hpp"
#include "config.hpp"
#include "error.hpp"
#include "event_stream.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "transport.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace plexus {

/**
 * Implements the parts of a transport that don't depend on the connection itself.
 *
 * Owns the channel registry, reference allocation, per-topic inbound streams, and lifecycle broadcasts.
 * Derived classes implement send_message() and report connection changes with set_connected(), notify_open(),
 * notify_error() and notify_close(), and inbound messages with deliver().
 */
class transport_base : public transport {
public:
    using channel_ptr = std::shared_ptr<channel>;

    /** Constructs a transport running on the given io_context. */
    explicit transport_base(asio::io_context& io, duration default_timeout = config::default_timeout) :
        io(&io),
        default_timeout(default_timeout),
        connected(false),
        ref_counter(0),
        mutex(),
        topic_streams(),
        channels(),
        error_stream(),
        open_stream() {}

    transport_base(const transport_base&) = delete;
    transport_base(transport_base&&) = delete;

    auto get_io() -> asio::io_context& override {
        return *io;
    }

    auto is_connected() const -> bool override {
        return connected;
    }

    auto get_default_timeout() const -> duration override {
        return default_timeout;
    }

    auto next_ref() -> std::string override {
        return std::to_string(++ref_counter);
    }

    auto get_topic_stream(const std::string& topic) -> event_stream<message>& override {
        auto lock = std::lock_guard(mutex);

        auto& stream = topic_streams[topic];

        if (!stream) {
            stream = std::make_unique<event_stream<message>>();
        }

        return *stream;
    }

    auto get_error_stream() -> event_stream<transport_failure>& override {
        return error_stream;
    }

    auto get_open_stream() -> event_stream<transport_open>& override {
        return open_stream;
    }

    void remove_channel(const channel& c) override {
        auto removed = channel_ptr{};

        {
            auto lock = std::lock_guard(mutex);
            auto iter = std::find_if(channels.begin(), channels.end(), [&](const channel_ptr& ch) {
                return ch.get() == &c;
            });
            if (iter != channels.end()) {
                removed = std::move(*iter);
                channels.erase(iter);
            }
        }

        if (removed) {
            PLEXUS_LOG_ACTION("transport", c.get_reference(), "Removed channel ", c.get_topic(), ".");
        }
    }

    /** Constructs a channel on this transport and registers it until it closes. */
    auto make_channel(std::string topic, payload_type parameters = {}, channel_options options = {}) -> channel_ptr {
        auto ch = channel::create(*this, std::move(topic), std::move(parameters), options);

        PLEXUS_LOG_ACTION("transport", ch->get_reference(), "Added channel ", ch->get_topic(), ".");

        auto lock = std::lock_guard(mutex);
        channels.push_back(ch);

        return ch;
    }

    /** Gets every registered channel, in creation order. */
    auto get_channels() const -> std::vector<channel_ptr> {
        auto lock = std::lock_guard(mutex);
        return channels;
    }

    /** Finds the first registered channel for the given topic. */
    auto find_channel(const std::string& topic) const -> channel_ptr {
        for (const auto& ch : get_channels()) {
            if (ch->get_topic() == topic) {
                return ch;
            }
        }
        return nullptr;
    }

    /** Closes every registered channel. */
    void close_all_channels() {
        for (const auto& ch : get_channels()) {
            ch->close();
        }
    }

protected:
    void set_connected(bool value) {
        connected = value;
    }

    /** Routes an inbound message to the stream of its topic. */
    void deliver(const message& msg) {
        PLEXUS_LOG_MESSAGE("deliver", msg);
        get_topic_stream(msg.topic).publish(msg);
    }

    /** Marks the transport connected and tells every channel. */
    void notify_open() {
        PLEXUS_LOG_ACTION("transport", "-", "Connection opened.");

        connected = true;
        open_stream.publish(transport_open{});
    }

    /** Broadcasts a connection error and reports it to every channel. */
    void notify_error(const transport_failure& failure) {
        PLEXUS_LOG_ACTION("transport", "-", "Connection error: ", failure.reason);

        error_stream.publish(failure);

        for (const auto& ch : get_channels()) {
            ch->trigger_error(failure);
        }
    }

    /** Marks the transport disconnected, broadcasts the close, and reports it to every channel. */
    void notify_close(const transport_failure& failure) {
        PLEXUS_LOG_ACTION("transport", "-", "Connection closed: ", failure.reason);

        connected = false;

        error_stream.publish(failure);

        for (const auto& ch : get_channels()) {
            ch->trigger_error(failure);
        }
    }

private:
    asio::io_context* io;
    duration default_timeout;
    std::atomic<bool> connected;
    std::atomic<std::uint64_t> ref_counter;
    mutable std::mutex mutex;
    std::map<std::string, std::unique_ptr<event_stream<message>>> topic_streams;
    std::vector<channel_ptr> channels;
    event_stream<transport_failure> error_stream;
    event_stream<transport_open> open_stream;
};

} // namespace plexus
