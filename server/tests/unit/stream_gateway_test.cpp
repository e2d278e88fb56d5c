#include <memory>
#include <sstream>

#include <gtest/gtest.h>

#include "broker/stream_gateway.hpp"
#include "fake_stream_connection.hpp"

using broker::testing::FakeStreamConnection;

TEST(ExtractTokenTest, QueryOnly) {
  auto result = broker::ExtractToken({std::string("user:a:1"), std::nullopt});
  ASSERT_TRUE(result.token.has_value());
  EXPECT_EQ(*result.token, "user:a:1");
  EXPECT_FALSE(result.error.has_value());
}

TEST(ExtractTokenTest, BearerOnly) {
  auto result = broker::ExtractToken({std::nullopt, std::string("user:a:2")});
  ASSERT_TRUE(result.token.has_value());
  EXPECT_EQ(*result.token, "user:a:2");
}

TEST(ExtractTokenTest, MatchingSourcesAccepted) {
  auto result = broker::ExtractToken({std::string("user:a:3"), std::string("user:a:3")});
  ASSERT_TRUE(result.token.has_value());
  EXPECT_EQ(*result.token, "user:a:3");
}

TEST(ExtractTokenTest, DifferingSourcesConflict) {
  auto result = broker::ExtractToken({std::string("user:a:3"), std::string("user:b:4")});
  EXPECT_FALSE(result.token.has_value());
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, broker::BrokerError::kConflictingToken);
}

TEST(ExtractTokenTest, MissingOrEmptyIsMissingToken) {
  auto none = broker::ExtractToken({std::nullopt, std::nullopt});
  EXPECT_EQ(*none.error, broker::BrokerError::kMissingToken);
  auto empty = broker::ExtractToken({std::string(), std::string()});
  EXPECT_EQ(*empty.error, broker::BrokerError::kMissingToken);
  auto empty_query = broker::ExtractToken({std::string(), std::string("user:a:5")});
  ASSERT_TRUE(empty_query.token.has_value());
  EXPECT_EQ(*empty_query.token, "user:a:5");
}

TEST(ParseBearerTest, RequiresBearerPrefix) {
  EXPECT_EQ(broker::ParseBearer("Bearer user:a:1"), "user:a:1");
  EXPECT_EQ(broker::ParseBearer("Bearer "), "");
  EXPECT_EQ(broker::ParseBearer("Basic abc"), "");
  EXPECT_EQ(broker::ParseBearer("user:a:1"), "");
}

TEST(ParseBearerTest, SchemeIsCaseInsensitiveAndToleratesSpaces) {
  EXPECT_EQ(broker::ParseBearer("bearer user:a:1"), "user:a:1");
  EXPECT_EQ(broker::ParseBearer("BEARER   user:a:1"), "user:a:1");
  EXPECT_EQ(broker::ParseBearer("Bearer user:a:1  "), "user:a:1");
  EXPECT_EQ(broker::ParseBearer("Bearer\tuser:a:1"), "user:a:1");
  EXPECT_EQ(broker::ParseBearer("Bearer"), "");
  EXPECT_EQ(broker::ParseBearer("Bearer    "), "");
  EXPECT_EQ(broker::ParseBearer("Bearerx user:a:1"), "");
}

namespace {

class StreamGatewayTest : public ::testing::Test {
 protected:
  void SetUp() override {
    observability_ = std::make_shared<broker::Observability>(broker::LogLevel::kDebug, sink_);
    broker::TokenStoreConfig cfg;
    cfg.legacy_fallback_enabled = true;
    cfg.fallback_tokens = {{"admin", "user:admin:test123hash"}};
    store_ = std::make_shared<broker::TokenStore>(cfg);
    store_->SetObservability(observability_);
    registry_ = std::make_shared<broker::SessionRegistry>();
    registry_->SetObservability(observability_);
    gateway_ = std::make_unique<broker::StreamGateway>(store_, registry_, observability_);
  }

  std::ostringstream sink_;
  std::shared_ptr<broker::Observability> observability_;
  std::shared_ptr<broker::TokenStore> store_;
  std::shared_ptr<broker::SessionRegistry> registry_;
  std::unique_ptr<broker::StreamGateway> gateway_;
};

}  // namespace

TEST_F(StreamGatewayTest, ValidTokenIsAdmitted) {
  auto record = store_->Issue("alice");
  auto admission = gateway_->Admit({record.token, std::nullopt});
  EXPECT_TRUE(admission.Accepted());
  EXPECT_EQ(admission.state, broker::StreamState::kValidating);
  EXPECT_EQ(*admission.username, "alice");
  EXPECT_EQ(admission.source, broker::ValidationSource::kAuthoritative);
}

TEST_F(StreamGatewayTest, LegacyTokenIsAdmittedWithSource) {
  auto admission = gateway_->Admit({std::nullopt, std::string("user:admin:test123hash")});
  EXPECT_TRUE(admission.Accepted());
  EXPECT_EQ(admission.source, broker::ValidationSource::kLegacyFallback);
}

TEST_F(StreamGatewayTest, RejectionsCarryReason) {
  auto missing = gateway_->Admit({std::nullopt, std::nullopt});
  EXPECT_EQ(missing.state, broker::StreamState::kRejected);
  EXPECT_EQ(*missing.error, broker::BrokerError::kMissingToken);

  auto malformed = gateway_->Admit({std::string("garbage"), std::nullopt});
  EXPECT_EQ(malformed.state, broker::StreamState::kRejected);
  EXPECT_EQ(*malformed.error, broker::BrokerError::kMalformedToken);

  auto unknown = gateway_->Admit({std::string("user:alice:feedface"), std::nullopt});
  EXPECT_EQ(*unknown.error, broker::BrokerError::kInvalidToken);
  EXPECT_FALSE(unknown.Accepted());

  EXPECT_EQ(observability_->Snapshot().streams_rejected, 3u);
  EXPECT_EQ(registry_->ActiveCount(), 0u);
}

TEST_F(StreamGatewayTest, OpenRegistersAndCloseReleases) {
  auto conn = std::make_shared<FakeStreamConnection>("s1");
  EXPECT_EQ(gateway_->Open("alice", conn), broker::StreamState::kOpen);
  EXPECT_EQ(registry_->Lookup("alice")->connection, conn);
  EXPECT_EQ(observability_->Snapshot().streams_opened, 1u);

  EXPECT_EQ(gateway_->Close("alice", conn.get()), broker::StreamState::kClosed);
  EXPECT_FALSE(registry_->Lookup("alice").has_value());
}

TEST_F(StreamGatewayTest, SecondOpenReplacesFirst) {
  auto first = std::make_shared<FakeStreamConnection>("s1");
  auto second = std::make_shared<FakeStreamConnection>("s2");
  gateway_->Open("alice", first);
  gateway_->Open("alice", second);
  EXPECT_FALSE(first->IsOpen());

  // 교체된 연결의 종료 콜백은 새 연결을 건드리지 않는다.
  gateway_->Close("alice", first.get());
  EXPECT_EQ(registry_->Lookup("alice")->connection, second);
}

TEST(StreamStateNameTest, NamesEveryState) {
  EXPECT_EQ(broker::StreamStateName(broker::StreamState::kUnauthenticated), "unauthenticated");
  EXPECT_EQ(broker::StreamStateName(broker::StreamState::kValidating), "validating");
  EXPECT_EQ(broker::StreamStateName(broker::StreamState::kRejected), "rejected");
  EXPECT_EQ(broker::StreamStateName(broker::StreamState::kOpen), "open");
  EXPECT_EQ(broker::StreamStateName(broker::StreamState::kClosed), "closed");
}
