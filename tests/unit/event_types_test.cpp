#include "events/event_types.hpp"

#include <gtest/gtest.h>

using namespace hearth::events;

TEST(EventTypesTest, DecodesEveryEventArray) {
    const std::string payload = R"({
        "bool_events": [{"name": "on", "value": true}],
        "u8_events": [{"name": "brightness", "description": "Light level", "value": 200}],
        "i32_events": [{"name": "offset", "value": -12}],
        "f32_events": [],
        "f64_events": null,
        "periodic_f64_events": [
            {"event": {"name": "temperature", "value": 21.5}, "interval": {"secs": 1, "nanos": 500000000}}
        ]
    })";

    Events events;
    std::string error;
    ASSERT_TRUE(parse_events(payload, events, error)) << error;

    ASSERT_EQ(3u, events.events.size());
    EXPECT_EQ("on", events.events[0].name);
    EXPECT_EQ(EventValue{true}, events.events[0].value);
    EXPECT_EQ(EventValue{uint8_t{200}}, events.events[1].value);
    ASSERT_TRUE(events.events[1].description.has_value());
    EXPECT_EQ("Light level", *events.events[1].description);
    EXPECT_EQ(EventValue{int32_t{-12}}, events.events[2].value);

    ASSERT_EQ(1u, events.periodic_events.size());
    EXPECT_EQ("temperature", events.periodic_events[0].event.name);
    EXPECT_EQ(EventValue{21.5}, events.periodic_events[0].event.value);
    EXPECT_EQ(std::chrono::milliseconds(1500), events.periodic_events[0].interval);
    EXPECT_EQ(4u, events.size());
}

TEST(EventTypesTest, RejectsValuesOfTheWrongType) {
    Events events;
    std::string error;

    EXPECT_FALSE(parse_events(R"({"bool_events": [{"name": "on", "value": 1}]})", events, error));
    EXPECT_EQ("event 'on': expected a boolean value", error);

    EXPECT_FALSE(parse_events(R"({"u8_events": [{"name": "level", "value": 256}]})", events, error));
    EXPECT_FALSE(parse_events(R"({"i32_events": [{"name": "x", "value": 4294967296}]})", events, error));
    EXPECT_FALSE(parse_events(R"({"bool_events": [{"value": true}]})", events, error));
    EXPECT_EQ("event missing 'name'", error);
}

TEST(EventTypesTest, RejectsNonObjectPayloads) {
    Events events;
    std::string error;
    EXPECT_FALSE(parse_events("[]", events, error));
    EXPECT_EQ("events must be a JSON object", error);
    EXPECT_FALSE(parse_events("not json", events, error));
    EXPECT_EQ("events payload is not valid JSON", error);
}

TEST(EventTypesTest, EmptyObjectIsAnEmptySnapshot) {
    Events events;
    std::string error;
    ASSERT_TRUE(parse_events("{}", events, error)) << error;
    EXPECT_TRUE(events.empty());
}

TEST(EventTypesTest, EncodedSnapshotDecodesToTheSameEvents) {
    Events events;
    events.events.push_back(Event{"on", std::nullopt, true});
    events.events.push_back(Event{"level", std::string("Brightness"), uint8_t{42}});
    events.periodic_events.push_back(PeriodicEvent{Event{"power", std::nullopt, 3.25}, std::chrono::milliseconds(250)});

    Events decoded;
    std::string error;
    ASSERT_TRUE(decode_events(encode_events(events), decoded, error)) << error;
    EXPECT_EQ(events, decoded);
}

TEST(EventTypesTest, EventsDescriptionRequiresBrokerAndTopic) {
    EventsDescription description;
    std::string error;

    auto json = nlohmann::ordered_json::parse(R"({"topic": "t"})");
    EXPECT_FALSE(decode_events_description(json, description, error));
    EXPECT_EQ("events_description missing 'broker_data'", error);

    json = nlohmann::ordered_json::parse(R"({"broker_data": {"address": "10.0.0.2"}})");
    EXPECT_FALSE(decode_events_description(json, description, error));
    EXPECT_EQ("events_description missing 'topic'", error);

    json = nlohmann::ordered_json::parse(R"({"broker_data": {"address": "10.0.0.2"}, "topic": "home/lamp"})");
    ASSERT_TRUE(decode_events_description(json, description, error)) << error;
    EXPECT_EQ("10.0.0.2", description.broker.address);
    EXPECT_EQ(1883, description.broker.port);
    EXPECT_EQ("home/lamp", description.topic);
    EXPECT_TRUE(description.events.empty());
}

TEST(EventTypesTest, ValueTypeNames) {
    EXPECT_STREQ("bool", event_value_type_name(EventValue{false}));
    EXPECT_STREQ("u8", event_value_type_name(EventValue{uint8_t{1}}));
    EXPECT_STREQ("i32", event_value_type_name(EventValue{int32_t{1}}));
    EXPECT_STREQ("f32", event_value_type_name(EventValue{1.0f}));
    EXPECT_STREQ("f64", event_value_type_name(EventValue{1.0}));
}
