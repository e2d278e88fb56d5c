#include <atomic>
#include <chrono>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "broker/token_codec.hpp"
#include "broker/token_store.hpp"

namespace {

broker::TokenStoreConfig LegacyConfig(bool enabled) {
  broker::TokenStoreConfig cfg;
  cfg.legacy_fallback_enabled = enabled;
  cfg.fallback_tokens = {{"admin", "user:admin:test123hash"}};
  return cfg;
}

}  // namespace

TEST(TokenStoreTest, IssuedTokenValidatesForOwner) {
  broker::TokenStore store(broker::TokenStoreConfig{});
  auto record = store.Issue("alice", "cli");

  auto decoded = broker::TryDecodeToken(record.token);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->username, "alice");
  EXPECT_EQ(decoded->suffix.size(), 32u);
  EXPECT_EQ(record.name, "cli");
  EXPECT_FALSE(record.expires_at.has_value());

  auto result = store.Validate(record.token);
  EXPECT_TRUE(result.valid);
  ASSERT_TRUE(result.username.has_value());
  EXPECT_EQ(*result.username, "alice");
  EXPECT_EQ(result.source, broker::ValidationSource::kAuthoritative);
}

TEST(TokenStoreTest, IssueRejectsInvalidUsername) {
  broker::TokenStore store(broker::TokenStoreConfig{});
  EXPECT_THROW(store.Issue(""), broker::TokenFormatError);
  EXPECT_THROW(store.Issue("a:b"), broker::TokenFormatError);
  EXPECT_EQ(store.Count(), 0u);
}

TEST(TokenStoreTest, IssuedTokensAreUnique) {
  broker::TokenStore store(broker::TokenStoreConfig{});
  std::set<std::string> tokens;
  for (int i = 0; i < 200; ++i) {
    tokens.insert(store.Issue("alice").token);
  }
  EXPECT_EQ(tokens.size(), 200u);
}

TEST(TokenStoreTest, RejectsShortSuffixConfiguration) {
  broker::TokenStoreConfig cfg;
  cfg.suffix_bytes = 8;
  EXPECT_THROW(broker::TokenStore{cfg}, std::invalid_argument);
}

TEST(TokenStoreTest, MalformedTokenIsRejectedWithReason) {
  broker::TokenStore store(LegacyConfig(true));
  auto result = store.Validate("not-a-token");
  EXPECT_FALSE(result.valid);
  ASSERT_TRUE(result.reason.has_value());
  EXPECT_EQ(*result.reason, broker::BrokerError::kMalformedToken);
  EXPECT_FALSE(result.username.has_value());
}

TEST(TokenStoreTest, UnknownWellFormedTokenIsInvalid) {
  broker::TokenStore store(broker::TokenStoreConfig{});
  auto result = store.Validate("user:alice:0123456789abcdef");
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(*result.reason, broker::BrokerError::kInvalidToken);
}

TEST(TokenStoreTest, RevokedTokenNoLongerValidates) {
  broker::TokenStore store(broker::TokenStoreConfig{});
  auto record = store.Issue("alice");
  EXPECT_TRUE(store.Revoke(record.token));
  EXPECT_FALSE(store.Revoke(record.token));
  auto result = store.Validate(record.token);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(*result.reason, broker::BrokerError::kInvalidToken);
}

TEST(TokenStoreTest, LegacyFallbackAcceptsWhenEnabled) {
  broker::TokenStore store(LegacyConfig(true));
  auto result = store.Validate("user:admin:test123hash");
  EXPECT_TRUE(result.valid);
  EXPECT_EQ(*result.username, "admin");
  EXPECT_EQ(result.source, broker::ValidationSource::kLegacyFallback);
}

TEST(TokenStoreTest, LegacyFallbackRejectedWhenDisabled) {
  broker::TokenStore store(LegacyConfig(false));
  auto result = store.Validate("user:admin:test123hash");
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(*result.reason, broker::BrokerError::kInvalidToken);
}

TEST(TokenStoreTest, LegacyFallbackRequiresExactMatchForUser) {
  broker::TokenStore store(LegacyConfig(true));
  EXPECT_FALSE(store.Validate("user:admin:test123has").valid);
  EXPECT_FALSE(store.Validate("user:bob:test123hash").valid);
}

TEST(TokenStoreTest, ExpiredTokenIsRejectedAndPurged) {
  broker::TokenStore store(broker::TokenStoreConfig{});
  auto record = store.Issue("alice", "short", std::chrono::seconds(1));
  ASSERT_TRUE(record.expires_at.has_value());
  EXPECT_TRUE(store.Validate(record.token).valid);

  std::this_thread::sleep_for(std::chrono::milliseconds(1100));
  auto result = store.Validate(record.token);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(*result.reason, broker::BrokerError::kInvalidToken);
  EXPECT_EQ(store.Count(), 0u);
}

TEST(TokenStoreTest, ListForUserReturnsOnlyOwnTokens) {
  broker::TokenStore store(broker::TokenStoreConfig{});
  store.Issue("alice", "one");
  store.Issue("alice", "two");
  store.Issue("bob", "three");

  auto tokens = store.ListForUser("alice");
  ASSERT_EQ(tokens.size(), 2u);
  for (const auto& record : tokens) {
    EXPECT_EQ(record.username, "alice");
  }
  EXPECT_TRUE(store.ListForUser("carol").empty());
}

TEST(TokenStoreTest, ValidateRecordsLastUsedAt) {
  broker::TokenStore store(broker::TokenStoreConfig{});
  auto record = store.Issue("alice");
  EXPECT_FALSE(record.last_used_at.has_value());
  store.Validate(record.token);
  auto tokens = store.ListForUser("alice");
  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_TRUE(tokens[0].last_used_at.has_value());
}

TEST(TokenStoreTest, MetricsCountValidationSources) {
  std::ostringstream sink;
  auto observability = std::make_shared<broker::Observability>(broker::LogLevel::kDebug, sink);
  broker::TokenStore store(LegacyConfig(true));
  store.SetObservability(observability);

  auto record = store.Issue("alice");
  store.Validate(record.token);
  store.Validate("user:admin:test123hash");
  store.Validate("garbage");

  auto snapshot = observability->Snapshot();
  EXPECT_EQ(snapshot.validations_authoritative, 1u);
  EXPECT_EQ(snapshot.validations_legacy, 1u);
  EXPECT_EQ(snapshot.validations_rejected, 1u);
  EXPECT_NE(sink.str().find("legacy_fallback"), std::string::npos);
  EXPECT_EQ(sink.str().find(record.token), std::string::npos);
}

TEST(TokenStoreTest, ConcurrentIssueAndValidate) {
  broker::TokenStore store(broker::TokenStoreConfig{});
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&store, &failures, t]() {
      const std::string username = "user" + std::to_string(t);
      for (int i = 0; i < 50; ++i) {
        auto record = store.Issue(username);
        auto result = store.Validate(record.token);
        if (!result.valid || *result.username != username) {
          failures.fetch_add(1);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(store.Count(), 400u);
}

TEST(TokenStoreTest, TtlOverrideCannotExceedConfiguredTtl) {
  broker::TokenStoreConfig cfg;
  cfg.token_ttl = std::chrono::seconds(3600);
  broker::TokenStore store(cfg);

  auto before = std::chrono::system_clock::now();
  auto record = store.Issue("alice", "long", std::chrono::seconds(86400 * 30));
  ASSERT_TRUE(record.expires_at.has_value());
  EXPECT_LE(*record.expires_at, std::chrono::system_clock::now() + std::chrono::seconds(3600));
  EXPECT_GE(*record.expires_at, before + std::chrono::seconds(3600));

  auto shorter = store.Issue("alice", "short", std::chrono::seconds(60));
  ASSERT_TRUE(shorter.expires_at.has_value());
  EXPECT_LE(*shorter.expires_at, std::chrono::system_clock::now() + std::chrono::seconds(60));
}

TEST(TokenStoreTest, NonPositiveTtlOverrideFallsBackToConfiguredTtl) {
  broker::TokenStoreConfig cfg;
  cfg.token_ttl = std::chrono::seconds(3600);
  broker::TokenStore store(cfg);

  auto before = std::chrono::system_clock::now();
  auto zero = store.Issue("alice", "zero", std::chrono::seconds(0));
  auto negative = store.Issue("alice", "negative", std::chrono::seconds(-1));
  ASSERT_TRUE(zero.expires_at.has_value());
  ASSERT_TRUE(negative.expires_at.has_value());
  EXPECT_GE(*zero.expires_at, before + std::chrono::seconds(3600));
  EXPECT_GE(*negative.expires_at, before + std::chrono::seconds(3600));

  broker::TokenStore unlimited(broker::TokenStoreConfig{});
  EXPECT_FALSE(unlimited.Issue("alice", "zero", std::chrono::seconds(0)).expires_at.has_value());
}

TEST(TokenStoreTest, HugeTtlOverrideIsRejected) {
  broker::TokenStore store(broker::TokenStoreConfig{});
  EXPECT_THROW(store.Issue("alice", "huge", broker::kMaxTokenTtl + std::chrono::seconds(1)), std::invalid_argument);
  EXPECT_THROW(store.Issue("alice", "max", std::chrono::seconds::max()), std::invalid_argument);
  EXPECT_EQ(store.Count(), 0u);

  auto record = store.Issue("alice", "cap", broker::kMaxTokenTtl);
  EXPECT_TRUE(record.expires_at.has_value());
}

TEST(TokenStoreTest, RejectsOutOfRangeConfiguredTtl) {
  broker::TokenStoreConfig too_long;
  too_long.token_ttl = broker::kMaxTokenTtl + std::chrono::seconds(1);
  EXPECT_THROW(broker::TokenStore{too_long}, std::invalid_argument);

  broker::TokenStoreConfig negative;
  negative.token_ttl = std::chrono::seconds(-1);
  EXPECT_THROW(broker::TokenStore{negative}, std::invalid_argument);
}

TEST(TokenStoreTest, IssueKeepsDescription) {
  broker::TokenStore store(broker::TokenStoreConfig{});
  store.Issue("alice", "cli", std::nullopt, "laptop token");
  auto tokens = store.ListForUser("alice");
  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_EQ(tokens[0].description, "laptop token");
}

TEST(TokenStoreTest, RevokeOwnedOnlyRemovesOwnTokens) {
  broker::TokenStore store(broker::TokenStoreConfig{});
  auto alice = store.Issue("alice");

  EXPECT_FALSE(store.RevokeOwned(alice.token, "bob"));
  EXPECT_TRUE(store.Validate(alice.token).valid);

  EXPECT_TRUE(store.RevokeOwned(alice.token, "alice"));
  EXPECT_FALSE(store.Validate(alice.token).valid);
  EXPECT_FALSE(store.RevokeOwned(alice.token, "alice"));
  EXPECT_FALSE(store.RevokeOwned("user:alice:0123456789abcdef", "alice"));
}
