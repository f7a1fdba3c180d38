#pragma once

#include <chrono>
#include <cstddef>

namespace plexus::config {

using clock_type = std::chrono::steady_clock;
using duration = clock_type::duration;

inline constexpr auto default_timeout = duration(std::chrono::seconds{10});

inline constexpr const char* event_join = "phx_join";
inline constexpr const char* event_leave = "phx_leave";
inline constexpr const char* event_close = "phx_close";
inline constexpr const char* event_error = "phx_error";
inline constexpr const char* event_reply = "phx_reply";

/** Prefix of the per-reference event kind a reply is normalized to. */
inline constexpr const char* reply_event_prefix = "chan_reply_";

/** Characters of a topic that are replaced by '_' in a channel's logger name. */
inline constexpr const char* logger_name_reserved = ":,*&?!@#$%";

inline constexpr const char* status_ok = "ok";
inline constexpr const char* status_error = "error";
inline constexpr const char* status_timeout = "timeout";

} // namespace plexus::config
