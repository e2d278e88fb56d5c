#include <memory>
#include <sstream>

#include <gtest/gtest.h>

#include "broker/message_router.hpp"
#include "fake_stream_connection.hpp"

using broker::testing::FakeStreamConnection;

namespace {

class MessageRouterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    observability_ = std::make_shared<broker::Observability>(broker::LogLevel::kDebug, sink_);
    registry_ = std::make_shared<broker::SessionRegistry>();
    registry_->SetObservability(observability_);
    router_ = std::make_unique<broker::MessageRouter>(registry_, observability_);
  }

  std::ostringstream sink_;
  std::shared_ptr<broker::Observability> observability_;
  std::shared_ptr<broker::SessionRegistry> registry_;
  std::unique_ptr<broker::MessageRouter> router_;
};

}  // namespace

TEST_F(MessageRouterTest, NoSessionReturnsNoActiveSession) {
  auto result = router_->Route("alice", {{"text", "hi"}});
  EXPECT_FALSE(result.delivered);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, broker::BrokerError::kNoActiveSession);
  EXPECT_FALSE(result.Retryable());
  EXPECT_EQ(observability_->Snapshot().routes_no_session, 1u);
}

TEST_F(MessageRouterTest, DeliversToRegisteredConnection) {
  auto conn = std::make_shared<FakeStreamConnection>("s1");
  registry_->Register("alice", conn);

  nlohmann::json message{{"jsonrpc", "2.0"}, {"method", "ping"}};
  auto result = router_->Route("alice", message);
  EXPECT_TRUE(result.delivered);
  EXPECT_FALSE(result.error.has_value());
  ASSERT_TRUE(result.session_id.has_value());
  EXPECT_EQ(*result.session_id, "s1");

  auto delivered = conn->Delivered();
  ASSERT_EQ(delivered.size(), 1u);
  EXPECT_EQ(delivered[0]["event"], broker::kMessageEvent);
  EXPECT_EQ(delivered[0]["data"], message);
  EXPECT_EQ(observability_->Snapshot().routes_delivered, 1u);
}

TEST_F(MessageRouterTest, OnlyTargetUserReceives) {
  auto alice = std::make_shared<FakeStreamConnection>("s1");
  auto bob = std::make_shared<FakeStreamConnection>("s2");
  registry_->Register("alice", alice);
  registry_->Register("bob", bob);

  EXPECT_TRUE(router_->Route("bob", "hello").delivered);
  EXPECT_TRUE(alice->Delivered().empty());
  EXPECT_EQ(bob->Delivered().size(), 1u);
}

TEST_F(MessageRouterTest, ClosedHandleReportsDeliveryFailed) {
  auto conn = std::make_shared<FakeStreamConnection>("s1");
  registry_->Register("alice", conn);
  conn->MarkBroken();

  auto result = router_->Route("alice", {{"text", "late"}});
  EXPECT_FALSE(result.delivered);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, broker::BrokerError::kDeliveryFailed);
  EXPECT_TRUE(result.Retryable());
  EXPECT_EQ(observability_->Snapshot().routes_failed, 1u);
}

TEST_F(MessageRouterTest, RouteToSessionUsesSessionIndex) {
  auto conn = std::make_shared<FakeStreamConnection>("abc");
  registry_->Register("alice", conn);

  EXPECT_TRUE(router_->RouteToSession("abc", {{"n", 1}}).delivered);
  auto missing = router_->RouteToSession("zzz", {{"n", 2}});
  EXPECT_EQ(*missing.error, broker::BrokerError::kNoActiveSession);
  EXPECT_EQ(conn->Delivered().size(), 1u);
}

TEST_F(MessageRouterTest, EvictedUserHasNoSession) {
  registry_->Register("alice", std::make_shared<FakeStreamConnection>("s1"));
  registry_->Evict("alice");
  EXPECT_EQ(*router_->Route("alice", "x").error, broker::BrokerError::kNoActiveSession);
}
