#include "response/response.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "mocks/mock_http_transport.hpp"

using namespace hearth;
using namespace hearth::response;

namespace {

transport::HttpResponse http(int status, std::string body) {
    transport::HttpResponse response;
    response.status = status;
    response.body = std::move(body);
    return response;
}

struct LightState {
    bool on = false;
    uint64_t brightness = 0;
};

void from_json(const nlohmann::json &json, LightState &out) {
    out.on = json.at("on").get<bool>();
    out.brightness = json.at("brightness").get<uint64_t>();
}

constexpr const char *kInfoBody = R"({
    "energy": {
        "energy_efficiencies": [{"savings": -15, "energy_class": "A+++"}],
        "carbon_footprints": [{"decimal_percentage": 40, "energy_class": "C"}],
        "water_use_efficiency": {"gpp": 2.5, "wer": 1.0}
    },
    "economy": {
        "costs": [{"usd": 12, "timespan": "Month"}],
        "roi": [{"years": 3, "energy_class": "B"}]
    }
})";

}  // namespace

TEST(OkResponseTest, AcceptsMarker) {
    OkResponse response(http(200, R"({"action_terminated_correctly": true})"));
    Error error;
    EXPECT_TRUE(response.parse_body(error));
    EXPECT_FALSE(error.is_set());
    EXPECT_EQ(200, response.status());
}

TEST(OkResponseTest, RejectsFalseOrMissingMarker) {
    Error error;
    EXPECT_FALSE(OkResponse(http(200, R"({"action_terminated_correctly": false})")).parse_body(error));
    EXPECT_EQ(ErrorKind::JSON_RESPONSE, error.kind());
    EXPECT_EQ("Ok response: device reported an unsuccessful action", error.description());

    EXPECT_FALSE(OkResponse(http(200, R"({"done": true})")).parse_body(error));
    EXPECT_EQ("Ok response: missing `action_terminated_correctly` marker", error.description());
}

TEST(OkResponseTest, RejectsInvalidJson) {
    Error error;
    EXPECT_FALSE(OkResponse(http(500, "Internal Server Error")).parse_body(error));
    EXPECT_EQ(ErrorKind::JSON_RESPONSE, error.kind());
    EXPECT_NE(error.description().find("status 500"), std::string::npos);
}

TEST(SerialResponseTest, DeserializesIntoCallerType) {
    SerialResponse response(http(200, R"({"on": true, "brightness": 12})"));
    LightState state;
    Error error;
    ASSERT_TRUE(response.parse_body(state, error));
    EXPECT_TRUE(state.on);
    EXPECT_EQ(12u, state.brightness);
}

TEST(SerialResponseTest, ShapeMismatchIsJsonResponseError) {
    SerialResponse response(http(200, R"({"on": "yes"})"));
    LightState state;
    Error error;
    EXPECT_FALSE(response.parse_body(state, error));
    EXPECT_EQ(ErrorKind::JSON_RESPONSE, error.kind());
    EXPECT_EQ(0u, error.description().find("Serial response: "));
}

TEST(SerialResponseTest, RawJsonAccess) {
    SerialResponse response(http(200, R"([1, 2, 3])"));
    nlohmann::json json;
    Error error;
    ASSERT_TRUE(response.parse_body_json(json, error));
    EXPECT_EQ(3u, json.size());
}

TEST(InfoResponseTest, DecodesEnergyAndEconomy) {
    InfoResponse response(http(200, kInfoBody));
    DeviceInfo info;
    Error error;
    ASSERT_TRUE(response.parse_body(info, error));

    ASSERT_EQ(1u, info.energy.energy_efficiencies.size());
    EXPECT_EQ(-15, info.energy.energy_efficiencies[0].savings);
    EXPECT_EQ(EnergyClass::A_PLUS_PLUS_PLUS, info.energy.energy_efficiencies[0].energy_class);
    ASSERT_EQ(1u, info.energy.carbon_footprints.size());
    EXPECT_EQ(EnergyClass::C, info.energy.carbon_footprints[0].energy_class);
    ASSERT_TRUE(info.energy.water_use_efficiency.has_value());
    EXPECT_FLOAT_EQ(2.5f, info.energy.water_use_efficiency->gpp.value());
    EXPECT_FALSE(info.energy.water_use_efficiency->penman_monteith_equation.has_value());

    ASSERT_EQ(1u, info.economy.costs.size());
    EXPECT_EQ(12, info.economy.costs[0].usd);
    EXPECT_EQ(CostTimespan::MONTH, info.economy.costs[0].timespan);
    ASSERT_EQ(1u, info.economy.roi.size());
    EXPECT_EQ(3, info.economy.roi[0].years);
}

TEST(InfoResponseTest, MissingSectionsAreEmpty) {
    InfoResponse response(http(200, "{}"));
    DeviceInfo info;
    Error error;
    ASSERT_TRUE(response.parse_body(info, error));
    EXPECT_TRUE(info.energy.empty());
    EXPECT_TRUE(info.economy.empty());
}

TEST(InfoResponseTest, UnknownEnergyClassFails) {
    InfoResponse response(http(200, R"({"economy": {"roi": [{"years": 1, "energy_class": "Z"}]}})"));
    DeviceInfo info;
    Error error;
    EXPECT_FALSE(response.parse_body(info, error));
    EXPECT_EQ(ErrorKind::JSON_RESPONSE, error.kind());
    EXPECT_NE(error.description().find("unknown energy class 'Z'"), std::string::npos);
}

TEST(InfoResponseTest, EncodedInfoDecodesBack) {
    DeviceInfo info;
    info.energy.energy_efficiencies.push_back({5, EnergyClass::A_PLUS});
    info.economy.costs.push_back({-3, CostTimespan::WEEK});

    const nlohmann::json json = info;
    const auto decoded = json.get<DeviceInfo>();
    ASSERT_EQ(1u, decoded.energy.energy_efficiencies.size());
    EXPECT_EQ(EnergyClass::A_PLUS, decoded.energy.energy_efficiencies[0].energy_class);
    ASSERT_EQ(1u, decoded.economy.costs.size());
    EXPECT_EQ(-3, decoded.economy.costs[0].usd);
    EXPECT_EQ(CostTimespan::WEEK, decoded.economy.costs[0].timespan);
}

namespace {

StreamResponse stream(int status, std::vector<std::string> fragments, std::string failure = {},
                      std::shared_ptr<int> pulled = std::make_shared<int>(0)) {
    transport::HttpResponse head;
    head.status = status;
    return StreamResponse(head, std::make_unique<tests::FragmentBodyStream>(std::move(fragments), std::move(failure),
                                                                            std::move(pulled)));
}

}  // namespace

TEST(StreamResponseTest, SplitsFragmentsToChunkSize) {
    auto response = stream(200, {"abcdefghij", "kl"});
    std::vector<std::string> chunks;
    Error error;
    ASSERT_TRUE(response.for_each_chunk(
        4,
        [&chunks](const char *data, size_t size) {
            chunks.emplace_back(data, size);
            return true;
        },
        error));
    EXPECT_EQ((std::vector<std::string>{"abcd", "efgh", "ij", "kl"}), chunks);
}

TEST(StreamResponseTest, HandlerCanStopEarly) {
    auto pulled = std::make_shared<int>(0);
    auto response = stream(200, {"abc", "def", "ghi"}, {}, pulled);
    int calls = 0;
    Error error;
    ASSERT_TRUE(response.for_each_chunk(
        3,
        [&calls](const char *, size_t) {
            ++calls;
            return false;
        },
        error));
    EXPECT_EQ(1, calls);
    // Later fragments are never pulled from the transport
    EXPECT_EQ(1, *pulled);
}

TEST(StreamResponseTest, BodyCanOnlyBeReadOnce) {
    auto response = stream(200, {"abc"});
    Error error;
    ASSERT_TRUE(response.for_each_chunk(
        8, [](const char *, size_t) { return true; }, error));
    EXPECT_FALSE(response.for_each_chunk(
        8, [](const char *, size_t) { return true; }, error));
    EXPECT_EQ(ErrorKind::STREAM_RESPONSE, error.kind());
    EXPECT_EQ("Stream body was already consumed", error.description());
}

TEST(StreamResponseTest, TransferFailureIsStreamError) {
    auto response = stream(200, {"abc"}, "connection reset");
    std::string received;
    Error error;
    EXPECT_FALSE(response.for_each_chunk(
        8,
        [&received](const char *data, size_t size) {
            received.append(data, size);
            return true;
        },
        error));
    EXPECT_EQ("abc", received);
    EXPECT_EQ(ErrorKind::STREAM_RESPONSE, error.kind());
    EXPECT_EQ("connection reset", error.description());
}

TEST(StreamResponseTest, NonSuccessStatusFails) {
    auto response = stream(404, {"not found"});
    Error error;
    EXPECT_FALSE(response.for_each_chunk(
        4, [](const char *, size_t) { return true; }, error));
    EXPECT_EQ(ErrorKind::STREAM_RESPONSE, error.kind());
    EXPECT_EQ("Stream failed with status 404", error.description());
}

TEST(StreamResponseTest, BufferedBodyFromMakeResponse) {
    Response response = make_response(device::ResponseKind::STREAM, http(200, "buffered"));
    ASSERT_TRUE(std::holds_alternative<StreamResponse>(response));
    std::string received;
    Error error;
    ASSERT_TRUE(std::get<StreamResponse>(response).for_each_chunk(
        3,
        [&received](const char *data, size_t size) {
            received.append(data, size);
            return true;
        },
        error));
    EXPECT_EQ("buffered", received);
}

TEST(ResponseTest, MakeResponseFollowsDeclaredKind) {
    EXPECT_STREQ("Ok", response_type_name(make_response(device::ResponseKind::OK, http(200, ""))));
    EXPECT_STREQ("Serial", response_type_name(make_response(device::ResponseKind::SERIAL, http(200, ""))));
    EXPECT_STREQ("Info", response_type_name(make_response(device::ResponseKind::INFO, http(200, ""))));
    EXPECT_STREQ("Stream", response_type_name(make_response(device::ResponseKind::STREAM, http(200, ""))));

    const Response skipped = SkippedResponse{};
    EXPECT_TRUE(is_skipped(skipped));
    EXPECT_STREQ("Skipped", response_type_name(skipped));
}
