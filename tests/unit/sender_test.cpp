#include "control/sender.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mocks/mock_http_transport.hpp"
#include "test_devices.hpp"

using namespace hearth;
using namespace hearth::control;
using ::testing::_;
using ::testing::Field;
using ::testing::StrictMock;

class SenderTest : public ::testing::Test {
protected:
    void SetUp() override { light = std::make_unique<device::Device>(tests::make_light()); }

    std::optional<RequestSender> request(const std::string &route, const policy::Policy &policy) {
        DeviceSender sender(0, *light, policy, transport);
        std::optional<RequestSender> out;
        Error error;
        EXPECT_TRUE(sender.request(route, out, error)) << error;
        return out;
    }

    std::unique_ptr<device::Device> light;
    StrictMock<tests::MockHttpTransport> transport;
};

TEST_F(SenderTest, SendsOkRouteWithoutParameters) {
    EXPECT_CALL(transport, send(Field(&transport::HttpRequest::url, "http://192.168.1.10:3000/light/on"), _, _))
        .WillOnce(tests::RespondWith(200, R"({"action_terminated_correctly": true})"));

    auto sender = request("/on", policy::Policy::init());
    ASSERT_TRUE(sender.has_value());
    EXPECT_FALSE(sender->skip());

    response::Response response;
    Error error;
    ASSERT_TRUE(sender->send(response, error));
    ASSERT_TRUE(std::holds_alternative<response::OkResponse>(response));
    EXPECT_TRUE(std::get<response::OkResponse>(response).parse_body(error));
}

TEST_F(SenderTest, GlobalBlockSkipsWithoutNetworkIo) {
    const policy::Policy policy(Hazards{Hazard::FireHazard});
    EXPECT_CALL(transport, send(_, _, _)).Times(0);

    auto sender = request("/toggle", policy);
    ASSERT_TRUE(sender.has_value());
    EXPECT_TRUE(sender->skip());

    response::Response response = response::OkResponse(transport::HttpResponse{});
    Error error;
    ASSERT_TRUE(sender->send(response, error));
    EXPECT_TRUE(response::is_skipped(response));

    ASSERT_TRUE(sender->send_with_parameters({{"brightness", uint64_t{20}}}, response, error));
    EXPECT_TRUE(response::is_skipped(response));
    EXPECT_FALSE(error.is_set());
}

TEST_F(SenderTest, LocalBlockOnlyAffectsThatDevice) {
    const auto policy = policy::Policy::init().block_device_on_hazards(0, {Hazard::LogEnergyConsumption});

    EXPECT_TRUE(request("/off", policy)->skip());
    EXPECT_FALSE(request("/on", policy)->skip());

    DeviceSender other(1, *light, policy, transport);
    std::optional<RequestSender> out;
    Error error;
    ASSERT_TRUE(other.request("/off", out, error));
    EXPECT_FALSE(out->skip());
    EXPECT_EQ(1u, out->device_id());
}

TEST_F(SenderTest, GlobalAndLocalBlocksOnLight) {
    const auto policy =
        policy::Policy(Hazards{Hazard::LogEnergyConsumption}).block_device_on_hazards(0, {Hazard::FireHazard});
    EXPECT_CALL(transport, send(Field(&transport::HttpRequest::url, "http://192.168.1.10:3000/light/on"), _, _))
        .WillOnce(tests::RespondWith(200, R"({"action_terminated_correctly": true})"));

    response::Response response;
    Error error;
    ASSERT_TRUE(request("/on", policy)->send(response, error));
    EXPECT_TRUE(std::holds_alternative<response::OkResponse>(response));

    ASSERT_TRUE(request("/off", policy)->send(response, error));
    EXPECT_TRUE(response::is_skipped(response));

    ASSERT_TRUE(request("/toggle", policy)->send(response, error));
    EXPECT_TRUE(response::is_skipped(response));

    ASSERT_TRUE(request("/toggle", policy)->send_with_parameters({{"brightness", uint64_t{5}}}, response, error));
    EXPECT_TRUE(response::is_skipped(response));
    EXPECT_FALSE(error.is_set());
}

TEST_F(SenderTest, SendWithParametersAppendsPathSegments) {
    EXPECT_CALL(transport,
                send(Field(&transport::HttpRequest::url, "http://192.168.1.10:3000/light/toggle/7"), _, _))
        .WillOnce(tests::RespondWith(200, R"({"action_terminated_correctly": true})"));

    auto sender = request("/toggle", policy::Policy::init());
    response::Response response;
    Error error;
    ASSERT_TRUE(sender->send_with_parameters({{"brightness", uint64_t{7}}}, response, error));
    EXPECT_STREQ("Ok", response::response_type_name(response));
}

TEST_F(SenderTest, InvalidParameterNeverReachesTheNetwork) {
    EXPECT_CALL(transport, send(_, _, _)).Times(0);

    auto sender = request("/toggle", policy::Policy::init());
    response::Response response;
    Error error;
    EXPECT_FALSE(sender->send_with_parameters({{"brightness", true}}, response, error));
    EXPECT_EQ(ErrorKind::INVALID_PARAMETER, error.kind());
    EXPECT_EQ("Found type `bool` for `brightness`, expected type `u64`", error.description());
}

TEST_F(SenderTest, RouteWithoutParametersFallsBackToPlainSend) {
    EXPECT_CALL(transport, send(Field(&transport::HttpRequest::url, "http://192.168.1.10:3000/light/on"), _, _))
        .WillOnce(tests::RespondWith(200, R"({"action_terminated_correctly": true})"));

    auto sender = request("/on", policy::Policy::init());
    response::Response response;
    Error error;
    EXPECT_TRUE(sender->send_with_parameters({{"ignored", true}}, response, error));
}

TEST_F(SenderTest, ResponseVariantFollowsRouteKind) {
    EXPECT_CALL(transport, send(_, _, _))
        .WillOnce(tests::RespondWith(200, R"({"on": true})"))
        .WillOnce(tests::RespondWith(200, "{}"));
    EXPECT_CALL(transport,
                open_stream(Field(&transport::HttpRequest::url, "http://192.168.1.10:3000/light/stream"), _, _, _))
        .WillOnce(tests::StreamWith(200, {"by", "tes"}));

    response::Response response;
    Error error;
    ASSERT_TRUE(request("/state", policy::Policy::init())->send(response, error));
    EXPECT_TRUE(std::holds_alternative<response::SerialResponse>(response));
    ASSERT_TRUE(request("/info", policy::Policy::init())->send(response, error));
    EXPECT_TRUE(std::holds_alternative<response::InfoResponse>(response));
    ASSERT_TRUE(request("/stream", policy::Policy::init())->send(response, error));
    ASSERT_TRUE(std::holds_alternative<response::StreamResponse>(response));

    std::string received;
    ASSERT_TRUE(std::get<response::StreamResponse>(response).for_each_chunk(
        16,
        [&received](const char *data, size_t size) {
            received.append(data, size);
            return true;
        },
        error));
    EXPECT_EQ("bytes", received);
}

TEST_F(SenderTest, StreamRouteSerializationErrorReadsBody) {
    EXPECT_CALL(transport, open_stream(_, _, _, _))
        .WillOnce(tests::StreamWith(500, {"cannot ", "stream"}, {{"Serialization-Error", "1"}}));

    response::Response response;
    Error error;
    EXPECT_FALSE(request("/stream", policy::Policy::init())->send(response, error));
    EXPECT_EQ(ErrorKind::REQUEST, error.kind());
    EXPECT_EQ("cannot stream", error.description());
}

TEST_F(SenderTest, StreamRouteTransportFailureIsRequestError) {
    EXPECT_CALL(transport, open_stream(_, _, _, _))
        .WillOnce([](const transport::HttpRequest &, transport::HttpResponse &,
                     std::unique_ptr<transport::IBodyStream> &, std::string &error) {
            error = "connection refused";
            return false;
        });

    response::Response response;
    Error error;
    EXPECT_FALSE(request("/stream", policy::Policy::init())->send(response, error));
    EXPECT_EQ(ErrorKind::REQUEST, error.kind());
    EXPECT_EQ("connection refused", error.description());
}

TEST_F(SenderTest, SerializationErrorHeaderIsRequestError) {
    EXPECT_CALL(transport, send(_, _, _))
        .WillOnce(tests::RespondWith(500, "cannot serialize state", {{"Serialization-Error", "1"}}));

    response::Response response;
    Error error;
    EXPECT_FALSE(request("/state", policy::Policy::init())->send(response, error));
    EXPECT_EQ(ErrorKind::REQUEST, error.kind());
    EXPECT_EQ("cannot serialize state", error.description());
}

TEST_F(SenderTest, TransportFailureIsRequestError) {
    EXPECT_CALL(transport, send(_, _, _)).WillOnce(tests::FailWith("Connection refused"));

    response::Response response;
    Error error;
    EXPECT_FALSE(request("/on", policy::Policy::init())->send(response, error));
    EXPECT_EQ(ErrorKind::REQUEST, error.kind());
    EXPECT_EQ("Connection refused", error.description());
}

TEST_F(SenderTest, UnknownRouteIsSenderError) {
    const auto policy = policy::Policy::init();
    DeviceSender sender(0, *light, policy, transport);
    EXPECT_EQ(0u, sender.id());

    std::optional<RequestSender> out;
    Error error;
    EXPECT_FALSE(sender.request("/dim", out, error));
    EXPECT_FALSE(out.has_value());
    EXPECT_EQ(ErrorKind::SENDER, error.kind());
    EXPECT_EQ("Error in retrieving the request with route `/dim`.", error.description());
}
