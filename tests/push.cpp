#include <catch2/catch.hpp>

#include "fake_transport.hpp"

#include <asio.hpp>
#include <plexus/plexus.hpp>

#include <chrono>
#include <future>

using namespace std::chrono_literals;

namespace {

auto is_ready(const std::shared_future<plexus::push_response>& f) -> bool {
    return f.wait_for(0s) == std::future_status::ready;
}

} // namespace

TEST_CASE_METHOD(transport_fixture, "Sending a push transmits it with a fresh reference and the current join epoch", "[push]") {
    auto ch = transport.make_channel("room:1");
    join_ok(ch);

    auto join_ref = transport.sent().front().ref;

    auto p = ch->push("new_msg", {{"body", "hi"}});
    poll();

    auto msg = transport.last_sent();

    REQUIRE(msg.topic == "room:1");
    REQUIRE(msg.event == plexus::channel_event::custom("new_msg"));
    REQUIRE(msg.payload == plexus::payload_type{{"body", "hi"}});
    REQUIRE(msg.ref.has_value());
    REQUIRE(!msg.ref->empty());
    REQUIRE(msg.ref != join_ref);
    REQUIRE(msg.join_ref == join_ref);
    REQUIRE(p->is_sent());
    REQUIRE(!p->has_received());
    REQUIRE(p->is_timer_armed());
}

TEST_CASE_METHOD(transport_fixture, "A reply resolves the push and invokes only the callback for its status", "[push]") {
    auto ch = transport.make_channel("room:1");
    join_ok(ch);

    auto ok_calls = 0;
    auto error_calls = 0;
    auto response = plexus::payload_type{};

    auto p = ch->push("new_msg", {});
    p->on_reply("ok", [&](const plexus::push_response& r) {
        ++ok_calls;
        response = r.response;
    });
    p->on_reply("error", [&](const plexus::push_response&) { ++error_calls; });
    poll();

    transport.reply(transport.last_sent(), "ok", {{"id", "7"}});
    poll();

    REQUIRE(ok_calls == 1);
    REQUIRE(error_calls == 0);
    REQUIRE(response == plexus::payload_type{{"id", "7"}});
    REQUIRE(p->has_received("ok"));
    REQUIRE(!p->is_timer_armed());

    auto f = p->get_future();
    REQUIRE(is_ready(f));
    REQUIRE(f.get().is_ok());
    REQUIRE(f.get().response.at("id") == "7");
}

TEST_CASE_METHOD(transport_fixture, "Binding a status twice keeps only the newest callback", "[push]") {
    auto ch = transport.make_channel("room:1");
    join_ok(ch);

    auto first = 0;
    auto second = 0;

    auto p = ch->push("new_msg", {});
    p->on_reply("ok", [&](const plexus::push_response&) { ++first; });
    p->on_reply("ok", [&](const plexus::push_response&) { ++second; });
    poll();

    transport.reply(transport.last_sent(), "ok");
    poll();

    REQUIRE(first == 0);
    REQUIRE(second == 1);
}

TEST_CASE_METHOD(transport_fixture, "A push without a reply times out and ignores the late reply", "[push]") {
    auto ch = transport.make_channel("room:1");
    join_ok(ch);

    auto timeouts = 0;
    auto oks = 0;

    auto p = ch->push("new_msg", {}, 50ms);
    p->on_reply("timeout", [&](const plexus::push_response&) { ++timeouts; });
    p->on_reply("ok", [&](const plexus::push_response&) { ++oks; });
    poll();

    auto msg = transport.last_sent();

    run_for(30ms);
    REQUIRE(timeouts == 0);

    run_for(100ms);
    REQUIRE(timeouts == 1);
    REQUIRE(p->has_received("timeout"));
    REQUIRE(p->get_future().get().is_timeout());

    transport.reply(msg, "ok");
    poll();

    REQUIRE(oks == 0);
    REQUIRE(timeouts == 1);
}

TEST_CASE_METHOD(transport_fixture, "Resetting a push cancels its timeout without invoking any callback", "[push]") {
    auto ch = transport.make_channel("room:1");
    join_ok(ch);

    auto calls = 0;

    auto p = ch->push("new_msg", {}, 50ms);
    p->on_reply("timeout", [&](const plexus::push_response&) { ++calls; });
    p->on_reply("ok", [&](const plexus::push_response&) { ++calls; });
    poll();

    auto msg = transport.last_sent();

    p->reset();
    poll();

    REQUIRE(!p->is_sent());
    REQUIRE(p->peek_ref().empty());

    run_for(100ms);

    // The reply waiter went away with the reference.
    transport.reply(msg, "ok");
    poll();

    REQUIRE(calls == 0);
    REQUIRE(!is_ready(p->get_future()));
}

TEST_CASE_METHOD(transport_fixture, "Resending a push uses a new reference and ignores replies to the old one", "[push]") {
    auto ch = transport.make_channel("room:1");
    join_ok(ch);

    auto oks = 0;

    auto p = ch->push("new_msg", {});
    p->on_reply("ok", [&](const plexus::push_response&) { ++oks; });
    poll();

    auto first = transport.last_sent();

    p->resend(200ms);
    poll();

    auto second = transport.last_sent();

    REQUIRE(transport.sent_count() == 3);
    REQUIRE(second.ref != first.ref);
    REQUIRE(p->get_timeout() == 200ms);

    transport.reply(first, "ok");
    poll();
    REQUIRE(oks == 0);

    transport.reply(second, "ok");
    poll();
    REQUIRE(oks == 1);
}

TEST_CASE_METHOD(transport_fixture, "A push can be triggered synthetically and only the first response counts", "[push]") {
    auto ch = transport.make_channel("room:1");
    ch->join();

    auto oks = 0;
    auto errors = 0;

    // Buffered, the channel isn't joined yet.
    auto p = ch->push("new_msg", {});
    p->on_reply("ok", [&](const plexus::push_response&) { ++oks; });
    p->on_reply("error", [&](const plexus::push_response&) { ++errors; });

    p->trigger(plexus::push_response{"error", {{"reason", "nope"}}});
    p->trigger(plexus::push_response::ok());
    poll();

    REQUIRE(errors == 1);
    REQUIRE(oks == 0);
    REQUIRE(!p->is_sent());
    REQUIRE(p->get_future().get().response.at("reason") == "nope");
}

TEST_CASE_METHOD(transport_fixture, "Pushes whose handles are dropped still time out and release their waiters", "[push]") {
    auto ch = transport.make_channel("room:1");
    join_ok(ch);

    for (auto i = 0; i < 10; ++i) {
        ch->push("fire", {});
    }
    poll();

    REQUIRE(transport.sent_count() == 11);
    REQUIRE(ch->get_waiter_count() == 10);

    run_for(150ms);

    REQUIRE(ch->get_waiter_count() == 0);
}

TEST_CASE_METHOD(transport_fixture, "A push whose handle is dropped still runs its callbacks on the reply", "[push]") {
    auto ch = transport.make_channel("room:1");
    join_ok(ch);

    auto oks = 0;

    ch->push("new_msg", {})->on_reply("ok", [&](const plexus::push_response&) { ++oks; });
    poll();

    transport.reply(transport.last_sent(), "ok");
    poll();

    REQUIRE(oks == 1);
    REQUIRE(ch->get_waiter_count() == 0);
}

TEST_CASE_METHOD(transport_fixture, "The leave sent after a join timeout releases its waiter when it times out", "[push]") {
    auto ch = transport.make_channel("room:1");

    ch->join(50ms);
    poll();

    transport.set_connected(false);

    // The join times out at 50ms and sends a leave that nobody waits on.
    run_for(75ms);

    REQUIRE(transport.last_sent().event == plexus::channel_event::leave());
    REQUIRE(ch->get_waiter_count() == 1);

    run_for(75ms);

    REQUIRE(ch->get_waiter_count() == 0);
}
