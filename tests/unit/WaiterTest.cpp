#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>

#include "Acceptor.hpp"
#include "Client.hpp"
#include "Errors.hpp"
#include "FakeTransport.hpp"
#include "Waiter.hpp"

using namespace courier;
using courier::testing::FakeTransport;
using courier::testing::JsonResponse;
using courier::testing::MakeTestOptions;

namespace {

constexpr const char* PENDING = R"({"Thing":{"Status":"PENDING"}})";
constexpr const char* DONE = R"({"Thing":{"Status":"DONE"}})";

models::AcceptorConfig MakeAcceptor(models::AcceptorState state, models::AcceptorMatcher matcher,
                                    std::string argument, json::value expected) {
    models::AcceptorConfig acceptor;
    acceptor.state = state;
    acceptor.matcher = matcher;
    acceptor.argument = std::move(argument);
    acceptor.expected = std::move(expected);
    return acceptor;
}

}  // namespace

class WaiterTest : public ::testing::Test {
   protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeTransport>();
        client_ = std::make_unique<core::Client>(MakeTestOptions(transport_));
    }

    std::shared_ptr<FakeTransport> transport_;
    std::unique_ptr<core::Client> client_;
};

TEST_F(WaiterTest, SucceedsOnMatchingPath) {
    transport_->QueueJson(200, PENDING);
    transport_->QueueJson(200, DONE);

    json::object params;
    params["Name"] = "thing-1";
    EXPECT_NO_THROW(client_->WaitUntil("ThingReady", params));

    ASSERT_EQ(transport_->SendCount(), 2u);
    EXPECT_EQ(transport_->Sent()[1].message["X-Amz-Target"], "DynamoDB_20120810.DescribeThing");
    EXPECT_EQ(transport_->SentBody(1).at("Name"), json::value("thing-1"));
}

TEST_F(WaiterTest, FailureAcceptorStopsImmediately) {
    transport_->QueueJson(200, R"({"Thing":{"Status":"ERROR"}})");
    try {
        client_->WaitUntil("ThingReady");
        FAIL() << "expected WaiterError";
    } catch (const core::WaiterError& e) {
        EXPECT_EQ(e.Kind(), core::WaiterFailureKind::Failure);
        EXPECT_EQ(e.WaiterName(), "ThingReady");
        EXPECT_EQ(e.Attempts(), 1);
        EXPECT_STREQ(e.what(), "The ThingReady waiter entered a failure state");
    }
    EXPECT_EQ(transport_->SendCount(), 1u);
}

TEST_F(WaiterTest, TimesOutAfterMaxAttempts) {
    transport_->SetFallback(JsonResponse(200, PENDING));
    try {
        client_->WaitUntil("ThingReady");
        FAIL() << "expected WaiterError";
    } catch (const core::WaiterError& e) {
        EXPECT_EQ(e.Kind(), core::WaiterFailureKind::Timeout);
        EXPECT_EQ(e.Attempts(), 3);
        EXPECT_STREQ(e.what(), "The ThingReady waiter failed after attempt #3");
    }
    EXPECT_EQ(transport_->SendCount(), 3u);
}

TEST_F(WaiterTest, OverridesApplyPerCall) {
    transport_->SetFallback(JsonResponse(200, PENDING));
    core::WaiterOverrides overrides;
    overrides.max_attempts = 1;
    overrides.delay = std::chrono::milliseconds(0);

    EXPECT_THROW(client_->WaitUntil("ThingReady", {}, overrides), core::WaiterError);
    EXPECT_EQ(transport_->SendCount(), 1u);
}

TEST_F(WaiterTest, MatchedErrorIsRetried) {
    transport_->QueueJson(400, R"({"__type":"ThingNotFoundException","message":"missing"})");
    transport_->QueueJson(200, DONE);

    EXPECT_NO_THROW(client_->WaitUntil("ThingReady"));
    EXPECT_EQ(transport_->SendCount(), 2u);
}

TEST_F(WaiterTest, UnmatchedErrorIsRethrown) {
    transport_->QueueJson(400, R"({"__type":"AccessDeniedException","message":"no"})");
    try {
        client_->WaitUntil("ThingReady");
        FAIL() << "expected ServiceException";
    } catch (const core::ServiceException& e) {
        EXPECT_EQ(e.ErrorCode(), "AccessDeniedException");
    }
    EXPECT_EQ(transport_->SendCount(), 1u);
}

TEST_F(WaiterTest, UnknownWaiterIsUnsupported) {
    try {
        client_->WaitUntil("ThingGone");
        FAIL() << "expected UnsupportedOperationError";
    } catch (const core::UnsupportedOperationError& e) {
        EXPECT_STREQ(e.what(), "Waiter was not found: ThingGone for Test Service");
    }
    EXPECT_THROW(client_->WaitUntilAsync("ThingGone"), core::UnsupportedOperationError);
    EXPECT_EQ(transport_->SendCount(), 0u);
}

TEST_F(WaiterTest, AsyncWaitSucceeds) {
    transport_->QueueJson(200, PENDING);
    transport_->QueueJson(200, DONE);

    auto future = client_->WaitUntilAsync("ThingReady");
    EXPECT_NO_THROW(future.Wait());
    EXPECT_FALSE(future.Cancel());
    EXPECT_EQ(transport_->SendCount(), 2u);
}

TEST_F(WaiterTest, AsyncWaitCanBeCancelled) {
    transport_->SetFallback(JsonResponse(200, PENDING));
    core::WaiterOverrides overrides;
    overrides.delay = std::chrono::seconds(30);

    auto future = client_->WaitUntilAsync("ThingReady", {}, overrides);
    EXPECT_TRUE(future.Cancel());
    ASSERT_TRUE(future.WaitFor(std::chrono::seconds(5)));

    try {
        future.Wait();
        FAIL() << "expected WaiterError";
    } catch (const core::WaiterError& e) {
        EXPECT_EQ(e.Kind(), core::WaiterFailureKind::Cancelled);
        EXPECT_STREQ(e.what(), "The ThingReady waiter was cancelled");
    }
    EXPECT_LE(transport_->SendCount(), 1u);
}

TEST_F(WaiterTest, StatusAcceptorMatchesErrorResponses) {
    transport_->QueueJson(200, "{}");
    transport_->QueueJson(404, R"({"__type":"ResourceNotFoundException"})");

    models::WaiterConfig config;
    config.operation = "DescribeThing";
    config.delay = std::chrono::milliseconds(0);
    config.max_attempts = 5;
    config.acceptors.push_back(MakeAcceptor(models::AcceptorState::Success,
                                            models::AcceptorMatcher::Status, "", 404));

    const core::Client& client = *client_;
    core::Waiter waiter("ThingGone", config, {},
                        [&client](const std::string& op, const json::object& params) {
                            return client.Execute(op, params);
                        });
    EXPECT_NO_THROW(waiter.Wait());
    EXPECT_EQ(waiter.Attempts(), 2);
}

TEST(WaiterConfigTest, RequiresAtLeastOneAttempt) {
    models::WaiterConfig config;
    config.operation = "DescribeThing";
    config.max_attempts = 0;
    EXPECT_THROW(core::Waiter("W", config, {}, {}), std::invalid_argument);
}

TEST(WaiterConfigTest, StopRequestedBeforeFirstAttempt) {
    models::WaiterConfig config;
    config.operation = "DescribeThing";
    int calls = 0;
    core::Waiter waiter("W", config, {}, [&calls](const std::string&, const json::object&) {
        ++calls;
        return models::Result();
    });

    std::stop_source source;
    source.request_stop();
    EXPECT_THROW(waiter.Wait(source.get_token()), core::WaiterError);
    EXPECT_EQ(calls, 0);
}

TEST(AcceptorTest, PathAllAndPathAny) {
    models::Result result(json::parse(R"({"Tables":[{"S":"ACTIVE"},{"S":"ACTIVE"},{"S":"CREATING"}]})")
                              .as_object());

    auto all = MakeAcceptor(models::AcceptorState::Success, models::AcceptorMatcher::PathAll,
                            "Tables[].S", "ACTIVE");
    auto any = MakeAcceptor(models::AcceptorState::Success, models::AcceptorMatcher::PathAny,
                            "Tables[].S", "CREATING");
    EXPECT_FALSE(core::AcceptorMatches(all, &result, nullptr));
    EXPECT_TRUE(core::AcceptorMatches(any, &result, nullptr));

    models::Result empty(json::parse(R"({"Tables":[]})").as_object());
    EXPECT_FALSE(core::AcceptorMatches(all, &empty, nullptr));
    EXPECT_FALSE(core::AcceptorMatches(any, &empty, nullptr));
}

TEST(AcceptorTest, StatusComparesNumbersAndStrings) {
    models::ResponseMetadata metadata;
    metadata.status_code = 200;
    models::Result result(json::object{}, metadata);

    auto as_int = MakeAcceptor(models::AcceptorState::Success, models::AcceptorMatcher::Status, "",
                               200);
    auto as_text = MakeAcceptor(models::AcceptorState::Success, models::AcceptorMatcher::Status,
                                "", "200");
    auto other = MakeAcceptor(models::AcceptorState::Success, models::AcceptorMatcher::Status, "",
                              404);
    EXPECT_TRUE(core::AcceptorMatches(as_int, &result, nullptr));
    EXPECT_TRUE(core::AcceptorMatches(as_text, &result, nullptr));
    EXPECT_FALSE(core::AcceptorMatches(other, &result, nullptr));

    auto error = MakeAcceptor(models::AcceptorState::Retry, models::AcceptorMatcher::Error, "",
                              "ResourceNotFoundException");
    EXPECT_FALSE(core::AcceptorMatches(error, &result, nullptr));
}
