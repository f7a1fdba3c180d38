#include <plexus/plexus.hpp>

#include <asio.hpp>

#include <iostream>
#include <string>

/** Transport that answers itself: acknowledges joins and leaves, and echoes every other push back as a broadcast. */
class loopback_transport final : public plexus::transport_base {
public:
    explicit loopback_transport(asio::io_context& io) :
        transport_base(io) {}

    void connect() {
        asio::post(get_io(), [this] {
            notify_open();
        });
    }

    void send_message(plexus::message msg) override {
        asio::post(get_io(), [this, msg = std::move(msg)] {
            auto reply = msg.payload;
            reply["status"] = plexus::config::status_ok;

            if (!msg.event.is_status()) {
                deliver(plexus::message{msg.topic, plexus::channel_event::custom("echo"), msg.payload, std::nullopt, msg.join_ref});
            }

            deliver(plexus::message{msg.topic, plexus::channel_event::reply(), std::move(reply), msg.ref, msg.join_ref});
        });
    }
};

int main() {
    asio::io_context io;
    auto transport = loopback_transport(io);

    transport.connect();

    auto lobby = transport.make_channel("room:lobby", {{"nickname", "echo"}});

    auto sub = lobby->get_messages().subscribe([&](const plexus::message& msg) {
        if (msg.event == plexus::channel_event::custom("echo")) {
            std::cout << "Echo: " << msg.payload.at("body") << std::endl;
        }
    }, [] {
        std::cout << "Channel closed." << std::endl;
    });

    std::cout << "Joining " << lobby->get_topic() << "..." << std::endl;

    lobby->join()->on_reply(plexus::config::status_ok, [&](const plexus::push_response&) {
        std::cout << "Joined." << std::endl;
    });

    auto shout = lobby->push("shout", {{"body", "hello"}});

    shout->on_reply(plexus::config::status_ok, [&](const plexus::push_response& r) {
        std::cout << "Shout acknowledged: " << r.response.at("body") << std::endl;
        std::cout << "Leaving..." << std::endl;
        lobby->leave();
    });

    shout->on_reply(plexus::config::status_timeout, [&](const plexus::push_response&) {
        std::cout << "Shout timed out." << std::endl;
        lobby->close();
    });

    io.run();
}
