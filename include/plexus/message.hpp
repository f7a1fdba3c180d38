#pragma once

#include "channel_event.hpp"
#include "config.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace plexus {

using payload_type = std::map<std::string, std::string>;

/** One inbound or outbound channel message. Routing fields only, the payload is opaque. */
struct message {
    std::string topic;
    channel_event event;
    payload_type payload;
    std::optional<std::string> ref;
    std::optional<std::string> join_ref;

    /** Converts a `reply` message to the per-reference reply kind its push is waiting on. */
    auto as_reply_event() const -> message {
        auto result = *this;
        result.event = channel_event::reply_for(ref.value_or(std::string{}));
        return result;
    }
};

/** Status-tagged reply to a push. */
struct push_response {
    std::string status;
    payload_type response;

    static auto ok() -> push_response { return {config::status_ok, {}}; }
    static auto timeout() -> push_response { return {config::status_timeout, {}}; }

    /** Splits a reply payload into its status entry and the rest. */
    static auto from_payload(const payload_type& payload) -> push_response {
        auto result = push_response{};
        for (const auto& [key, value] : payload) {
            if (key == "status") {
                result.status = value;
            } else {
                result.response.emplace(key, value);
            }
        }
        return result;
    }

    auto is_ok() const -> bool { return status == config::status_ok; }
    auto is_error() const -> bool { return status == config::status_error; }
    auto is_timeout() const -> bool { return status == config::status_timeout; }
};

} // namespace plexus
