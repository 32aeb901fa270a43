#include "mqtt.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

namespace
{

using testing::ElementsAre;
using testing::Pair;

mosquitto_message message_on(const char *topic, std::string& payload)
{
    mosquitto_message message = {};
    message.topic = const_cast<char *>(topic);
    message.payload = payload.data();
    message.payloadlen = static_cast<int>(payload.size());
    return message;
}

TEST(TestMqttCallback, delivers_payload_without_trailing_terminator)
{
    std::vector<std::pair<std::string, std::string>> received;
    MessageHandler::add_callback([&received](const std::string& topic, const std::string& message) {
        received.emplace_back(topic, message);
    });

    std::string payload("21.5", 5);
    auto message = message_on("bacnet-in/100/analog-value/1/present-value", payload);
    EXPECT_EQ(MessageHandler::call_back_func(nullptr, nullptr, &message), 0);
    MessageHandler::add_callback(nullptr);

    EXPECT_THAT(received, ElementsAre(Pair("bacnet-in/100/analog-value/1/present-value", "21.5")));
}

TEST(TestMqttCallback, cleared_callback_drops_messages_from_other_threads)
{
    int calls = 0;
    MessageHandler::add_callback([&calls](const std::string&, const std::string&) { ++calls; });
    MessageHandler::add_callback(nullptr);

    std::string payload = "1";
    auto message = message_on("bacnet-in/100/binary-value/1/present-value", payload);
    std::thread subscriber([&message] {
        for (int i = 0; i < 100; i++)
        {
            MessageHandler::call_back_func(nullptr, nullptr, &message);
        }
    });
    subscriber.join();

    EXPECT_EQ(calls, 0);
}

}  // namespace
