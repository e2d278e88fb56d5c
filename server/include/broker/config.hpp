/*
 * 설명: 브로커 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace broker {

struct AppConfig {
  unsigned short port;
  std::string bind_address;
  std::size_t worker_threads;
  std::string auth_service_url;
  bool legacy_fallback_enabled;
  std::unordered_map<std::string, std::string> legacy_fallback_tokens;
  std::size_t token_ttl_seconds;
  std::string test_token_user;
  std::size_t test_token_ttl_seconds;
  std::size_t stream_keepalive_seconds;
  std::size_t stream_idle_timeout_seconds;
  std::size_t stream_queue_limit_messages;
  std::size_t stream_queue_limit_bytes;
  std::vector<std::string> cors_allow_origins;
  std::string log_level;
};

// 값이 올바르지 않으면 std::invalid_argument.
AppConfig LoadConfigFromEnv();

bool ParseBool(std::string_view value);
// "alice=user:alice:abc,bob=user:bob:def" 형식.
std::unordered_map<std::string, std::string> ParseFallbackTokens(std::string_view value);
std::vector<std::string> SplitList(std::string_view value, char delimiter);

}  // namespace broker
