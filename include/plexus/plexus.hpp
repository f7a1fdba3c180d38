#pragma once

#include "config.hpp"
#include "logging.hpp"
#include "channel_event.hpp"
#include "message.hpp"
#include "error.hpp"
#include "event_stream.hpp"
#include "guarded_timer.hpp"
#include "transport.hpp"
#include "push.hpp"
#include "channel.hpp"
#include "transport_base.hpp"
