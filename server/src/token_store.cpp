/*
 * 설명: 토큰 발급/폐기/검증과 레거시 폴백 조회를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_store_test.cpp
 */
#include "broker/token_store.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include "broker/token_codec.hpp"

namespace broker {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes 실패: 난수를 생성할 수 없습니다");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// 96비트 미만의 엔트로피는 허용하지 않는다.
constexpr std::size_t kMinSuffixBytes = 12;
}  // namespace

TokenStore::TokenStore(TokenStoreConfig config) : config_(std::move(config)) {
  if (config_.suffix_bytes < kMinSuffixBytes) {
    throw std::invalid_argument("suffix_bytes는 12바이트(96비트) 이상이어야 합니다");
  }
  if (config_.token_ttl.count() < 0 || config_.token_ttl > kMaxTokenTtl) {
    throw std::invalid_argument("token_ttl이 허용 범위를 벗어났습니다");
  }
}

ValidationResult TokenStore::Validate(const std::string& token) {
  auto decoded = TryDecodeToken(token);
  if (!decoded) {
    auto result = ValidationResult::Reject(BrokerError::kMalformedToken);
    Record(result, "");
    return result;
  }

  auto now = std::chrono::system_clock::now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto result = CheckAuthoritative(token, decoded->username, now)) {
      Record(*result, decoded->username);
      return *result;
    }
  }

  if (CheckLegacyFallback(token, decoded->username)) {
    auto result = ValidationResult::Accept(decoded->username, ValidationSource::kLegacyFallback);
    Record(result, decoded->username);
    return result;
  }

  auto result = ValidationResult::Reject(BrokerError::kInvalidToken);
  Record(result, decoded->username);
  return result;
}

std::optional<ValidationResult> TokenStore::CheckAuthoritative(const std::string& token, const std::string& username,
                                                               std::chrono::system_clock::time_point now) {
  auto it = tokens_.find(token);
  if (it == tokens_.end()) {
    return std::nullopt;
  }
  if (it->second.expires_at && now > *it->second.expires_at) {
    tokens_.erase(it);
    return std::nullopt;
  }
  // 저장소의 username과 토큰 문자열의 username은 발급 시 동일하게 만들어진다.
  if (it->second.username != username) {
    return std::nullopt;
  }
  it->second.last_used_at = now;
  return ValidationResult::Accept(username, ValidationSource::kAuthoritative);
}

bool TokenStore::CheckLegacyFallback(const std::string& token, const std::string& username) const {
  if (!config_.legacy_fallback_enabled) {
    return false;
  }
  auto it = config_.fallback_tokens.find(username);
  if (it == config_.fallback_tokens.end()) {
    return false;
  }
  return ConstantTimeEquals(it->second, token);
}

std::chrono::seconds TokenStore::EffectiveTtl(std::optional<std::chrono::seconds> ttl_override) const {
  if (!ttl_override || ttl_override->count() <= 0) {
    return config_.token_ttl;
  }
  if (*ttl_override > kMaxTokenTtl) {
    throw std::invalid_argument("ttl이 허용 상한을 넘었습니다");
  }
  if (config_.token_ttl.count() > 0 && *ttl_override > config_.token_ttl) {
    return config_.token_ttl;
  }
  return *ttl_override;
}

IssuedToken TokenStore::Issue(const std::string& username, const std::string& name,
                              std::optional<std::chrono::seconds> ttl_override, const std::string& description) {
  if (!IsValidUsername(username)) {
    throw TokenFormatError(BrokerError::kInvalidUsername, std::string(ErrorMessage(BrokerError::kInvalidUsername)));
  }
  auto now = std::chrono::system_clock::now();
  auto ttl = EffectiveTtl(ttl_override);
  if (ttl.count() > 0 && now > std::chrono::system_clock::time_point::max() - ttl) {
    throw std::invalid_argument("만료 시각을 표현할 수 없습니다");
  }

  IssuedToken record;
  record.username = username;
  record.name = name;
  record.description = description;
  record.issued_at = now;
  if (ttl.count() > 0) {
    record.expires_at = now + ttl;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  CleanupExpired(now);
  do {
    record.token = EncodeToken(username, RandomHex(config_.suffix_bytes));
  } while (tokens_.count(record.token) > 0);
  tokens_.emplace(record.token, record);

  if (observability_) {
    LogContext ctx;
    ctx.name = "token.issue";
    ctx.username = username;
    ctx.detail = {{"name", name}, {"expires", record.expires_at.has_value()}};
    observability_->Log(ctx);
  }
  return record;
}

bool TokenStore::Revoke(const std::string& token) {
  bool removed = false;
  std::optional<std::string> username;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it != tokens_.end()) {
      username = it->second.username;
      tokens_.erase(it);
      removed = true;
    }
  }
  LogRevoke(username, removed);
  return removed;
}

bool TokenStore::RevokeOwned(const std::string& token, const std::string& username) {
  bool removed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it != tokens_.end() && it->second.username == username) {
      tokens_.erase(it);
      removed = true;
    }
  }
  LogRevoke(username, removed);
  return removed;
}

void TokenStore::LogRevoke(const std::optional<std::string>& username, bool removed) const {
  if (!observability_) {
    return;
  }
  LogContext ctx;
  ctx.name = "token.revoke";
  ctx.username = username;
  ctx.detail = {{"removed", removed}};
  observability_->Log(ctx);
}

std::vector<IssuedToken> TokenStore::ListForUser(const std::string& username) {
  auto now = std::chrono::system_clock::now();
  std::vector<IssuedToken> result;
  std::lock_guard<std::mutex> lock(mutex_);
  CleanupExpired(now);
  for (const auto& [token, record] : tokens_) {
    if (record.username == username) {
      result.push_back(record);
    }
  }
  return result;
}

std::size_t TokenStore::Count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return tokens_.size();
}

void TokenStore::CleanupExpired(std::chrono::system_clock::time_point now) {
  for (auto it = tokens_.begin(); it != tokens_.end();) {
    if (it->second.expires_at && now > *it->second.expires_at) {
      it = tokens_.erase(it);
    } else {
      ++it;
    }
  }
}

void TokenStore::Record(const ValidationResult& result, const std::string& token_username) const {
  if (!observability_) {
    return;
  }
  observability_->RecordValidation(result.source);
  LogContext ctx;
  ctx.name = "token.validate";
  if (!token_username.empty()) {
    ctx.username = token_username;
  }
  if (result.source == ValidationSource::kLegacyFallback) {
    // 개발용 탈출구이므로 운영 로그에서 눈에 띄어야 한다.
    ctx.level = LogLevel::kWarn;
    ctx.detail = {{"valid", true}, {"source", "legacy_fallback"}};
  } else if (result.valid) {
    ctx.level = LogLevel::kDebug;
    ctx.detail = {{"valid", true}, {"source", "authoritative"}};
  } else {
    ctx.detail = {{"valid", false}, {"reason", ErrorCode(*result.reason)}};
  }
  observability_->Log(ctx);
}

}  // namespace broker
