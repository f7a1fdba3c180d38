#pragma once

#ifdef PLEXUS_ENABLE_LOGGING

#include <iostream>

#define PLEXUS_BEGIN_SECTION(NAME)                         \
    ([](auto&& name) {                                     \
        std::clog << "[plexus] >>> " << name << std::endl; \
    }((NAME)))

#define PLEXUS_END_SECTION(NAME)                           \
    ([](auto&& name) {                                     \
        std::clog << "[plexus] <<< " << name << std::endl; \
    }((NAME)))

#define PLEXUS_LOG_ACTION(THING, ID, ...)                               \
    ([](auto&& thing, auto&& id, auto&&... args) {                      \
        std::clog << "[plexus] ACTION (" << thing << ":" << id << ") "; \
        (std::clog << ... << args);                                     \
        std::clog << std::endl;                                         \
    }((THING), (ID), __VA_ARGS__))

#define PLEXUS_LOG_MESSAGE(NOTE, MSG)                                                   \
    ([](auto&& note, auto&& msg) {                                                      \
        std::clog << "[plexus] MESSAGE (" << note << ") " << msg.topic << " "           \
                  << msg.event.get_name() << " ref=" << msg.ref.value_or("-")           \
                  << " join_ref=" << msg.join_ref.value_or("-") << " {";                \
        auto first = true;                                                              \
        for (const auto& [key, value] : msg.payload) {                                  \
            std::clog << (first ? "" : ",") << key << ":" << value;                     \
            first = false;                                                              \
        }                                                                               \
        std::clog << "}" << std::endl;                                                  \
    }((NOTE), (MSG)))

#else
#define PLEXUS_BEGIN_SECTION(NAME) ((void)0)
#define PLEXUS_END_SECTION(NAME) ((void)0)
#define PLEXUS_LOG_ACTION(THING, ID, ...) ((void)0)
#define PLEXUS_LOG_MESSAGE(NOTE, MSG) ((void)0)
#endif
