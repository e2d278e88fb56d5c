#include <string>

#include <gtest/gtest.h>

#include "broker/token_codec.hpp"

TEST(TokenCodecTest, EncodeJoinsSchemeUsernameAndSuffix) {
  EXPECT_EQ(broker::EncodeToken("alice", "abc123"), "user:alice:abc123");
}

TEST(TokenCodecTest, DecodeSplitsIntoThreeFields) {
  auto token = broker::DecodeToken("user:bob:deadbeef");
  EXPECT_EQ(token.scheme, "user");
  EXPECT_EQ(token.username, "bob");
  EXPECT_EQ(token.suffix, "deadbeef");
}

TEST(TokenCodecTest, DecodeOfEncodeKeepsFields) {
  for (const std::string name : {"admin", "a", "user.with-dash_1", "한글사용자"}) {
    for (const std::string suffix : {"00ff", "test123hash", "x"}) {
      auto decoded = broker::DecodeToken(broker::EncodeToken(name, suffix));
      EXPECT_EQ(decoded.username, name);
      EXPECT_EQ(decoded.suffix, suffix);
    }
  }
}

TEST(TokenCodecTest, EncodeRejectsInvalidUsername) {
  try {
    broker::EncodeToken("", "abc");
    FAIL() << "empty username accepted";
  } catch (const broker::TokenFormatError& ex) {
    EXPECT_EQ(ex.code, broker::BrokerError::kInvalidUsername);
  }
  try {
    broker::EncodeToken("ali:ce", "abc");
    FAIL() << "username with colon accepted";
  } catch (const broker::TokenFormatError& ex) {
    EXPECT_EQ(ex.code, broker::BrokerError::kInvalidUsername);
  }
}

TEST(TokenCodecTest, EncodeRejectsSuffixWithColon) {
  EXPECT_THROW(broker::EncodeToken("alice", "ab:cd"), broker::TokenFormatError);
  EXPECT_THROW(broker::EncodeToken("alice", ""), broker::TokenFormatError);
}

TEST(TokenCodecTest, DecodeRejectsMalformedShapes) {
  for (const std::string raw : {"", "user", "user:alice", "user::abc", "user:alice:", ":alice:abc",
                                "user:alice:abc:extra", "admin:alice:abc", "nocolons"}) {
    EXPECT_FALSE(broker::TryDecodeToken(raw).has_value()) << raw;
    try {
      broker::DecodeToken(raw);
      FAIL() << "decoded malformed token: " << raw;
    } catch (const broker::TokenFormatError& ex) {
      EXPECT_EQ(ex.code, broker::BrokerError::kMalformedToken);
    }
  }
}

TEST(TokenCodecTest, LegacyShapedTokenDecodes) {
  auto token = broker::TryDecodeToken("user:admin:test123hash");
  ASSERT_TRUE(token.has_value());
  EXPECT_EQ(token->username, "admin");
  EXPECT_EQ(token->suffix, "test123hash");
}
