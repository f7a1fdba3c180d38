#pragma once

#include "channel_event.hpp"
#include "message.hpp"

#include <asio.hpp>

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace plexus {

/** Error codes reported by channels and pushes. */
enum class errc {
    /** The transport connection was closed. */
    transport_closed = 1,
    /** The transport connection reported an error. */
    transport_error,
    /** The channel was closed before the operation completed. */
    channel_closed,
    /** A newer waiter was registered for the same event kind. */
    waiter_superseded,
};

class error_category final : public std::error_category {
public:
    auto name() const noexcept -> const char* override {
        return "plexus";
    }

    auto message(int val) const -> std::string override {
        switch (static_cast<errc>(val)) {
            case errc::transport_closed:
                return "Transport connection closed";
            case errc::transport_error:
                return "Transport connection error";
            case errc::channel_closed:
                return "Channel closed";
            case errc::waiter_superseded:
                return "Waiter replaced by a newer waiter for the same event";
        }
        return "Unknown plexus error";
    }
};

inline auto plexus_category() -> const std::error_category& {
    static const error_category category;
    return category;
}

inline auto make_error_code(errc e) -> std::error_code {
    return {static_cast<int>(e), plexus_category()};
}

/** Thrown through a waiter's future when the waiter is failed. */
class channel_error : public std::system_error {
public:
    using std::system_error::system_error;
};

/** Thrown synchronously when a channel operation is called out of order. This is a programming error. */
class usage_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/** Lifecycle notification published when the transport (re)opens. */
struct transport_open {};

/** A transport close or error event, as seen by channels. */
struct transport_failure {
    enum class kind {
        CLOSED,
        ERRORED,
    };

    kind what = kind::ERRORED;
    asio::error_code code = {};
    std::string reason = {};

    static auto closed(asio::error_code ec = {}, std::string reason = {}) -> transport_failure {
        return {kind::CLOSED, ec, std::move(reason)};
    }

    static auto errored(asio::error_code ec = {}, std::string reason = {}) -> transport_failure {
        return {kind::ERRORED, ec, std::move(reason)};
    }

    /** The generic message a channel publishes for this failure. */
    auto to_message(const std::string& topic) const -> message {
        return message{topic, channel_event::error(), {}, std::nullopt, std::nullopt};
    }

    auto to_error_code() const -> std::error_code {
        return make_error_code(what == kind::CLOSED ? errc::transport_closed : errc::transport_error);
    }
};

} // namespace plexus

namespace std {

template <>
struct is_error_code_enum<plexus::errc> : std::true_type {};

} // namespace std
