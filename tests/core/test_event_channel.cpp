#include <catch2/catch_test_macros.hpp>
#include "airmesh/core/event_channel.hpp"
#include <string>
#include <vector>

using namespace airmesh::core;

TEST_CASE("Event channel delivery", "[core][events]") {
    EventChannel<std::string> channel;
    std::vector<std::string> first;
    std::vector<std::string> second;

    auto a = channel.subscribe([&](const std::string& e) { first.push_back(e); });
    channel.subscribe([&](const std::string& e) { second.push_back(e); });
    REQUIRE(channel.subscriber_count() == 2);

    channel.publish("one");
    REQUIRE(first == std::vector<std::string>{"one"});
    REQUIRE(second == std::vector<std::string>{"one"});

    channel.unsubscribe(a);
    channel.publish("two");
    REQUIRE(first.size() == 1);
    REQUIRE(second.size() == 2);

    // Unknown ids are ignored
    channel.unsubscribe(12345);
    REQUIRE(channel.subscriber_count() == 1);
}

TEST_CASE("Event channel handlers may re-enter", "[core][events]") {
    EventChannel<int> channel;
    std::vector<int> seen;
    EventChannel<int>::SubscriptionId self = 0;

    self = channel.subscribe([&](const int& value) {
        seen.push_back(value);
        if (value < 3) {
            channel.publish(value + 1);
        } else {
            channel.unsubscribe(self);
        }
    });

    channel.publish(1);
    REQUIRE(seen == std::vector<int>{1, 2, 3});
    REQUIRE(channel.subscriber_count() == 0);

    channel.publish(10);
    REQUIRE(seen.size() == 3);
}
