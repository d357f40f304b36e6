#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "ClientResolver.hpp"
#include "FakeTransport.hpp"
#include "JsonProtocol.hpp"
#include "Transaction.hpp"

using namespace courier;
using courier::testing::FakeTransport;
using courier::testing::JsonResponse;
using courier::testing::MakeTestOptions;

namespace {

std::shared_ptr<const models::ServiceDescription> RestApi() {
    static const char* API = R"({
        "metadata": {"endpointPrefix": "things", "protocol": "rest-json"},
        "operations": {
            "GetThing": {"http": {"method": "GET", "requestUri": "/things/{ThingId}"}},
            "GetObject": {"http": {"method": "GET", "requestUri": "/objects/{Key+}?versions"}},
            "CreateThing": {"http": {"method": "POST", "requestUri": "/things"}}
        }
    })";
    return std::make_shared<const models::ServiceDescription>(
        models::ServiceDescription::FromJson(json::parse(API).as_object()));
}

core::Transaction MakeTransaction(std::shared_ptr<const models::ServiceDescription> api,
                                  const std::string& operation, const char* params) {
    auto options = MakeTestOptions(std::make_shared<FakeTransport>());
    if (api) options.api = std::move(api);
    return core::Transaction(core::ClientResolver::Resolve(std::move(options)),
                             core::Command(operation, json::parse(params).as_object()));
}

}  // namespace

TEST(JsonProtocolTest, SerializesJsonOperation) {
    auto txn = MakeTransaction(nullptr, "GetItem", R"({"TableName":"t","Key":{"id":{"S":"1"}}})");
    network::HttpRequest req = infra::protocols::SerializeJson(txn);

    EXPECT_EQ(req.message.method(), http::verb::post);
    EXPECT_EQ(req.message.target(), "/");
    EXPECT_EQ(req.Url(), "https://dynamodb.us-east-1.amazonaws.com/");
    EXPECT_EQ(req.message[http::field::host], "dynamodb.us-east-1.amazonaws.com");
    EXPECT_EQ(req.message["X-Amz-Target"], "DynamoDB_20120810.GetItem");
    EXPECT_EQ(req.message[http::field::content_type], "application/x-amz-json-1.0");
    EXPECT_EQ(std::string(req.message[http::field::user_agent]),
              std::string(infra::protocols::USER_AGENT));
    EXPECT_FALSE(req.message["amz-sdk-invocation-id"].empty());
    EXPECT_EQ(std::string(req.message[http::field::content_length]),
              std::to_string(req.message.body().size()));
    EXPECT_EQ(json::parse(req.message.body()), json::parse(R"({"TableName":"t","Key":{"id":{"S":"1"}}})"));
}

TEST(JsonProtocolTest, SerializesRestJsonPathAndQuery) {
    auto txn = MakeTransaction(RestApi(), "GetThing", R"({"ThingId":"a b","Limit":5,"Verbose":true})");
    network::HttpRequest req = infra::protocols::SerializeRestJson(txn);

    EXPECT_EQ(req.message.method(), http::verb::get);
    EXPECT_EQ(req.message.target(), "/things/a%20b?Limit=5&Verbose=true");
    EXPECT_TRUE(req.message.body().empty());
}

TEST(JsonProtocolTest, GreedyPlaceholderKeepsSlashes) {
    auto txn = MakeTransaction(RestApi(), "GetObject", R"({"Key":"dir/file.txt","Max":2})");
    network::HttpRequest req = infra::protocols::SerializeRestJson(txn);
    EXPECT_EQ(req.message.target(), "/objects/dir/file.txt?versions&Max=2");
}

TEST(JsonProtocolTest, PlaceholdersEncodeReservedCharacters) {
    auto txn = MakeTransaction(RestApi(), "GetThing", R"({"ThingId":"a/b+c&d=é"})");
    network::HttpRequest req = infra::protocols::SerializeRestJson(txn);
    EXPECT_EQ(std::string(req.message.target()), "/things/a%2Fb%2Bc%26d%3D%C3%A9");

    auto greedy = MakeTransaction(RestApi(), "GetObject", R"({"Key":"dir one/file+1.txt"})");
    req = infra::protocols::SerializeRestJson(greedy);
    EXPECT_EQ(std::string(req.message.target()), "/objects/dir%20one/file%2B1.txt?versions");
}

TEST(JsonProtocolTest, RestJsonBodyForPost) {
    auto txn = MakeTransaction(RestApi(), "CreateThing", R"({"Name":"n"})");
    network::HttpRequest req = infra::protocols::SerializeRestJson(txn);

    EXPECT_EQ(req.message.method(), http::verb::post);
    EXPECT_EQ(req.message.target(), "/things");
    EXPECT_EQ(req.message[http::field::content_type], "application/json");
    EXPECT_EQ(json::parse(req.message.body()), json::parse(R"({"Name":"n"})"));
}

TEST(JsonProtocolTest, MissingUriParameterThrows) {
    auto txn = MakeTransaction(RestApi(), "GetThing", "{}");
    try {
        infra::protocols::SerializeRestJson(txn);
        FAIL() << "expected invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "Missing required URI parameter: ThingId");
    }
}

TEST(JsonProtocolTest, ParsesResultBodies) {
    core::Command command("GetItem", {});
    auto result = infra::protocols::ParseJsonResult(command, JsonResponse(200, R"({"Count":2})"));
    EXPECT_EQ(*result.Get("Count"), json::value(2));

    auto empty = infra::protocols::ParseJsonResult(command, JsonResponse(200, ""));
    EXPECT_TRUE(empty.Data().empty());

    EXPECT_THROW(infra::protocols::ParseJsonResult(command, JsonResponse(200, "[1]")),
                 std::runtime_error);
    EXPECT_THROW(infra::protocols::ParseJsonResult(command, JsonResponse(200, "{")),
                 std::runtime_error);
}

TEST(JsonProtocolTest, ParsesErrorFromBody) {
    auto shape = infra::protocols::ParseJsonError(JsonResponse(
        400,
        R"({"__type":"com.amazonaws.dynamodb.v20120810#ConditionalCheckFailedException","message":"The conditional request failed"})",
        {{"x-amzn-RequestId", "RID"}}));

    ASSERT_TRUE(shape.has_value());
    EXPECT_EQ(shape->code, "ConditionalCheckFailedException");
    EXPECT_EQ(shape->type, "client");
    EXPECT_EQ(shape->message, "The conditional request failed");
    EXPECT_EQ(shape->request_id, "RID");
}

TEST(JsonProtocolTest, ErrorTypeHeaderWins) {
    auto shape = infra::protocols::ParseJsonError(JsonResponse(
        503, R"({"Message":"slow down"})", {{"x-amzn-ErrorType", "ThrottlingException:http://internal"}}));

    ASSERT_TRUE(shape.has_value());
    EXPECT_EQ(shape->code, "ThrottlingException");
    EXPECT_EQ(shape->type, "server");
    EXPECT_EQ(shape->message, "slow down");
}

TEST(JsonProtocolTest, NoCodeMeansNoShape) {
    EXPECT_FALSE(infra::protocols::ParseJsonError(JsonResponse(500, "<html/>")).has_value());
    EXPECT_FALSE(infra::protocols::ParseJsonError(JsonResponse(400, R"({"message":"x"})")).has_value());
}

TEST(JsonProtocolTest, UnknownProtocolHasNoHandlers) {
    EXPECT_THROW(infra::protocols::ForProtocol("query"), std::invalid_argument);
    auto handlers = infra::protocols::ForProtocol("rest-json");
    EXPECT_TRUE(handlers.serializer);
    EXPECT_TRUE(handlers.result_parser);
    EXPECT_TRUE(handlers.error_parser);
}
