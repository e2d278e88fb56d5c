/*
 * 설명: 발급 토큰 저장소와 레거시 폴백 테이블을 이용해 토큰을 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_store_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "broker/errors.hpp"
#include "broker/observability.hpp"

namespace broker {

// 발급 수명의 상한. 설정값과 요청값 모두 이 범위를 넘을 수 없다.
inline constexpr std::chrono::seconds kMaxTokenTtl{std::chrono::hours(24 * 365 * 10)};

struct TokenStoreConfig {
  bool legacy_fallback_enabled{false};
  // username -> 기대 토큰 문자열. 시작 시 한 번만 채워진다.
  std::unordered_map<std::string, std::string> fallback_tokens;
  // 0이면 만료 없음.
  std::chrono::seconds token_ttl{0};
  std::size_t suffix_bytes{16};
};

struct IssuedToken {
  std::string token;
  std::string username;
  std::string name;
  std::string description;
  std::chrono::system_clock::time_point issued_at;
  std::optional<std::chrono::system_clock::time_point> expires_at;
  std::optional<std::chrono::system_clock::time_point> last_used_at;
};

struct ValidationResult {
  bool valid{false};
  std::optional<std::string> username;
  std::optional<BrokerError> reason;
  ValidationSource source{ValidationSource::kNone};

  static ValidationResult Accept(std::string username, ValidationSource source) {
    return ValidationResult{true, std::move(username), std::nullopt, source};
  }
  static ValidationResult Reject(BrokerError reason) {
    return ValidationResult{false, std::nullopt, reason, ValidationSource::kNone};
  }
};

class TokenStore {
 public:
  explicit TokenStore(TokenStoreConfig config);

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  ValidationResult Validate(const std::string& token);
  // 잘못된 username이면 TokenFormatError(kInvalidUsername).
  // ttl_override는 설정된 token_ttl보다 길 수 없고, 0 이하이면 무시된다.
  // kMaxTokenTtl을 넘으면 std::invalid_argument.
  IssuedToken Issue(const std::string& username, const std::string& name = "",
                    std::optional<std::chrono::seconds> ttl_override = std::nullopt,
                    const std::string& description = "");
  // 없는 토큰을 폐기해도 오류가 아니다. 실제로 제거했는지만 돌려준다.
  bool Revoke(const std::string& token);
  // username 소유의 토큰만 폐기한다. 남의 토큰과 없는 토큰은 구분하지 않고 false.
  bool RevokeOwned(const std::string& token, const std::string& username);
  std::vector<IssuedToken> ListForUser(const std::string& username);
  std::size_t Count();

  bool LegacyFallbackEnabled() const { return config_.legacy_fallback_enabled; }

 private:
  std::chrono::seconds EffectiveTtl(std::optional<std::chrono::seconds> ttl_override) const;
  void LogRevoke(const std::optional<std::string>& username, bool removed) const;
  std::optional<ValidationResult> CheckAuthoritative(const std::string& token, const std::string& username,
                                                     std::chrono::system_clock::time_point now);
  bool CheckLegacyFallback(const std::string& token, const std::string& username) const;
  void CleanupExpired(std::chrono::system_clock::time_point now);
  void Record(const ValidationResult& result, const std::string& token_username) const;

  const TokenStoreConfig config_;
  std::unordered_map<std::string, IssuedToken> tokens_;
  std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace broker
