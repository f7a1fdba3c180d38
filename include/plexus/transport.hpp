#pragma once

#include "config.hpp"
#include "error.hpp"
#include "event_stream.hpp"
#include "message.hpp"

#include <asio.hpp>

#include <string>

namespace plexus {

class channel;

/**
 * The shared connection a set of channels is multiplexed over.
 *
 * Stream callbacks may be invoked from any thread; channels re-post them to their own strand.
 * The transport must outlive every channel constructed on it.
 */
class transport {
public:
    using duration = config::duration;

    virtual ~transport() = 0;

    /** Gets the io_context channel strands and timers run on. */
    virtual auto get_io() -> asio::io_context& = 0;

    virtual auto is_connected() const -> bool = 0;

    /** Timeout used by channels that were not given one. */
    virtual auto get_default_timeout() const -> duration = 0;

    /** Allocates a reference that is unique for the lifetime of the transport. */
    virtual auto next_ref() -> std::string = 0;

    /** Inbound messages addressed to the given topic. */
    virtual auto get_topic_stream(const std::string& topic) -> event_stream<message>& = 0;

    /** Connection close and error notifications. */
    virtual auto get_error_stream() -> event_stream<transport_failure>& = 0;

    /** Connection (re)open notifications. */
    virtual auto get_open_stream() -> event_stream<transport_open>& = 0;

    /** Called by a channel when it closes. */
    virtual void remove_channel(const channel& c) = 0;

    /** Transmits a message. Fire-and-forget. */
    virtual void send_message(message msg) = 0;
};

inline transport::~transport() = default;

} // namespace plexus
