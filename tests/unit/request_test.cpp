#include "device/request.hpp"

#include <gtest/gtest.h>

#include "test_devices.hpp"

using namespace hearth;
using namespace hearth::device;

namespace {

RouteConfig toggle_route() {
    RouteConfig route;
    route.name = "toggle";
    route.path = "/toggle";
    route.hazards = {Hazard::FireHazard, Hazard::ElectricEnergyConsumption};
    route.parameters = {{"brightness", ParameterKind::range_u64(0, 20, 1, 0)},
                        {"label", ParameterKind::chars_sequence("white")}};
    route.rest_kind = RestKind::GET;
    return route;
}

}  // namespace

class RequestTest : public ::testing::Test {
protected:
    Request os_get{tests::kLightAddress, "/light", DeviceEnvironment::OS, toggle_route()};
};

TEST_F(RequestTest, UrlJoinsAddressMainRouteAndPath) {
    EXPECT_EQ("http://192.168.1.10:3000/light/toggle", os_get.url());
    EXPECT_EQ("/toggle", os_get.route());
    EXPECT_EQ(RestKind::GET, os_get.kind());
    EXPECT_TRUE(os_get.has_parameters());
}

TEST_F(RequestTest, OsGetAppendsParametersAsPathSegmentsInSchemaOrder) {
    RequestData data;
    Error error;
    ASSERT_TRUE(os_get.request_data({{"brightness", uint64_t{5}}}, data, error));
    EXPECT_FALSE(error.is_set());
    EXPECT_EQ("http://192.168.1.10:3000/light/toggle/5/white", data.url);
    EXPECT_EQ("5", data.parameters.at("brightness"));
    EXPECT_EQ("white", data.parameters.at("label"));

    const auto http = os_get.to_http_request(data);
    EXPECT_EQ(transport::HttpMethod::GET, http.method);
    EXPECT_EQ(data.url, http.url);
    EXPECT_FALSE(http.json_body.has_value());
}

TEST_F(RequestTest, PlainRequestDataUsesDefaults) {
    const auto data = os_get.plain_request_data();
    EXPECT_EQ("http://192.168.1.10:3000/light/toggle/0/white", data.url);
}

TEST_F(RequestTest, GetOnEsp32KeepsTheBareUrl) {
    Request esp32{tests::kLightAddress, "/light", DeviceEnvironment::ESP32, toggle_route()};
    const auto data = esp32.plain_request_data();
    EXPECT_EQ("http://192.168.1.10:3000/light/toggle", data.url);
    EXPECT_EQ(2u, data.parameters.size());
}

TEST_F(RequestTest, NonGetCarriesParametersAsJsonBody) {
    auto route = toggle_route();
    route.rest_kind = RestKind::PUT;
    Request put{tests::kLightAddress, "/light", DeviceEnvironment::OS, route};

    RequestData data;
    Error error;
    ASSERT_TRUE(put.request_data({{"brightness", uint64_t{7}}}, data, error));
    EXPECT_EQ("http://192.168.1.10:3000/light/toggle", data.url);

    const auto http = put.to_http_request(data);
    EXPECT_EQ(transport::HttpMethod::PUT, http.method);
    ASSERT_TRUE(http.json_body.has_value());
    const auto body = nlohmann::json::parse(*http.json_body);
    EXPECT_EQ("7", body["brightness"].get<std::string>());
    EXPECT_EQ("white", body["label"].get<std::string>());
}

TEST_F(RequestTest, AlwaysAsksForConnectionClose) {
    const auto http = os_get.to_http_request(os_get.plain_request_data());
    ASSERT_EQ(1u, http.headers.size());
    EXPECT_EQ("Connection", http.headers[0].first);
    EXPECT_EQ("close", http.headers[0].second);
}

TEST_F(RequestTest, RejectsUnknownParameter) {
    RequestData data;
    Error error;
    EXPECT_FALSE(os_get.request_data({{"color", std::string("red")}}, data, error));
    ASSERT_TRUE(error.is_set());
    EXPECT_EQ(ErrorKind::INVALID_PARAMETER, error.kind());
    EXPECT_EQ("`color` does not exist", error.description());
}

TEST_F(RequestTest, RejectsTypeMismatch) {
    RequestData data;
    Error error;
    EXPECT_FALSE(os_get.request_data({{"brightness", 0.5}}, data, error));
    ASSERT_TRUE(error.is_set());
    EXPECT_EQ(ErrorKind::INVALID_PARAMETER, error.kind());
    EXPECT_EQ("Found type `f64` for `brightness`, expected type `u64`", error.description());
}

TEST(RequestsTest, CreateRequestsKeysByRoute) {
    DeviceData data;
    std::string error;
    ASSERT_TRUE(parse_device_data(tests::light_descriptor(), data, error)) << error;

    const auto requests = create_requests(data.route_configs, tests::kLightAddress, data.main_route, data.environment);
    EXPECT_EQ(7u, requests.size());
    ASSERT_EQ(1u, requests.count("/on"));
    EXPECT_EQ("http://192.168.1.10:3000/light/on", requests.at("/on").url());
    EXPECT_EQ(ResponseKind::INFO, requests.at("/info").response_kind());
}

TEST(RequestsTest, DuplicateRoutesKeepTheFirst) {
    auto first = toggle_route();
    auto second = toggle_route();
    second.rest_kind = RestKind::DELETE;

    const auto requests = create_requests({first, second}, tests::kLightAddress, "/light", DeviceEnvironment::OS);
    ASSERT_EQ(1u, requests.size());
    EXPECT_EQ(RestKind::GET, requests.at("/toggle").kind());
}

TEST(RequestsTest, RestKindMapsToHttpMethod) {
    EXPECT_EQ(transport::HttpMethod::GET, to_http_method(RestKind::GET));
    EXPECT_EQ(transport::HttpMethod::POST, to_http_method(RestKind::POST));
    EXPECT_EQ(transport::HttpMethod::DELETE, to_http_method(RestKind::DELETE));
}
