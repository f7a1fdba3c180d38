#pragma once

#include "config.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <utility>

namespace plexus {

/** Kind of a channel message. Either one of the reserved lifecycle kinds, a per-reference reply kind, or a custom name. */
class channel_event {
public:
    channel_event() = default;

    explicit channel_event(std::string name) :
        name(std::move(name)) {}

    static auto join() -> channel_event { return channel_event(config::event_join); }
    static auto leave() -> channel_event { return channel_event(config::event_leave); }
    static auto close() -> channel_event { return channel_event(config::event_close); }
    static auto error() -> channel_event { return channel_event(config::event_error); }
    static auto reply() -> channel_event { return channel_event(config::event_reply); }

    /** The kind an inbound reply to the push with the given reference is normalized to. */
    static auto reply_for(const std::string& ref) -> channel_event {
        return channel_event(config::reply_event_prefix + ref);
    }

    static auto custom(std::string name) -> channel_event {
        return channel_event(std::move(name));
    }

    auto get_name() const -> const std::string& {
        return name;
    }

    /** Determines whether this is one of the reserved lifecycle/status kinds. */
    auto is_status() const -> bool {
        return name == config::event_join
            || name == config::event_leave
            || name == config::event_close
            || name == config::event_error
            || name == config::event_reply;
    }

    auto is_reply_for_ref() const -> bool {
        return name.compare(0, std::char_traits<char>::length(config::reply_event_prefix), config::reply_event_prefix) == 0;
    }

    friend bool operator==(const channel_event& a, const channel_event& b) {
        return a.name == b.name;
    }

    friend bool operator!=(const channel_event& a, const channel_event& b) {
        return a.name != b.name;
    }

    friend bool operator<(const channel_event& a, const channel_event& b) {
        return a.name < b.name;
    }

    friend auto operator<<(std::ostream& os, const channel_event& e) -> std::ostream& {
        return os << e.name;
    }

private:
    std::string name;
};

} // namespace plexus

namespace std {

template <>
struct hash<plexus::channel_event> {
    auto operator()(const plexus::channel_event& e) const noexcept -> std::size_t {
        return std::hash<std::string>{}(e.get_name());
    }
};

} // namespace std
