/*
 * 설명: 환경 변수에서 브로커 설정을 한 번 읽어 불변 구조체로 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "broker/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <utility>

namespace broker {

namespace {
std::string Trim(std::string_view value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return "";
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return std::string(value.substr(begin, end - begin + 1));
}

// 초 단위 설정의 상한(10년). 토큰 만료 계산이 넘치지 않는 범위다.
constexpr std::size_t kMaxSeconds = 10ull * 365 * 24 * 60 * 60;
constexpr std::size_t kMaxWorkerThreads = 1024;
constexpr std::size_t kMaxQueueMessages = 1000000;
constexpr std::size_t kMaxQueueBytes = std::size_t{1} << 30;

// 숫자만 허용한다. stoul은 '-'와 앞 공백을 받아들이므로 먼저 걸러낸다.
std::size_t ParseSize(const std::string& key, const std::string& value, std::size_t max_value) {
  const bool digits_only = !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
  if (!digits_only) {
    throw std::invalid_argument(key + " 값이 올바른 정수가 아닙니다: " + value);
  }
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value);
  } catch (const std::exception&) {
    throw std::invalid_argument(key + " 값이 너무 큽니다: " + value);
  }
  if (parsed > max_value) {
    throw std::invalid_argument(key + " 값이 허용 범위를 벗어났습니다: " + value);
  }
  return static_cast<std::size_t>(parsed);
}
}  // namespace

bool ParseBool(std::string_view value) {
  std::string lowered = Trim(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

std::vector<std::string> SplitList(std::string_view value, char delimiter) {
  std::vector<std::string> items;
  std::size_t pos = 0;
  while (pos <= value.size()) {
    auto next = value.find(delimiter, pos);
    auto item = Trim(value.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos));
    if (!item.empty()) {
      items.push_back(std::move(item));
    }
    if (next == std::string_view::npos) {
      break;
    }
    pos = next + 1;
  }
  return items;
}

std::unordered_map<std::string, std::string> ParseFallbackTokens(std::string_view value) {
  std::unordered_map<std::string, std::string> table;
  for (const auto& entry : SplitList(value, ',')) {
    auto eq = entry.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == entry.size()) {
      throw std::invalid_argument("LEGACY_FALLBACK_TOKENS 항목은 user=token 형식이어야 합니다: " + entry);
    }
    table[Trim(entry.substr(0, eq))] = Trim(entry.substr(eq + 1));
  }
  return table;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  const auto default_workers = std::to_string(std::max(1u, std::thread::hardware_concurrency()));

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(ParseSize("SERVER_PORT", get_env("SERVER_PORT", "8000"), 65535));
  cfg.bind_address = get_env("BIND_ADDRESS", "0.0.0.0");
  cfg.worker_threads = std::max<std::size_t>(
      1, ParseSize("WORKER_THREADS", get_env("WORKER_THREADS", default_workers.c_str()), kMaxWorkerThreads));
  cfg.auth_service_url = get_env("AUTH_SERVICE_URL", "http://localhost:8000");
  cfg.legacy_fallback_enabled = ParseBool(get_env("LEGACY_TOKEN_FALLBACK", "false"));
  cfg.legacy_fallback_tokens = ParseFallbackTokens(get_env("LEGACY_FALLBACK_TOKENS", ""));
  cfg.token_ttl_seconds = ParseSize("TOKEN_TTL_SECONDS", get_env("TOKEN_TTL_SECONDS", "0"), kMaxSeconds);
  cfg.test_token_user = get_env("TEST_TOKEN_USER", "admin");
  cfg.test_token_ttl_seconds =
      ParseSize("TEST_TOKEN_TTL_SECONDS", get_env("TEST_TOKEN_TTL_SECONDS", "86400"), kMaxSeconds);
  cfg.stream_keepalive_seconds =
      ParseSize("STREAM_KEEPALIVE_SECONDS", get_env("STREAM_KEEPALIVE_SECONDS", "15"), kMaxSeconds);
  cfg.stream_idle_timeout_seconds =
      ParseSize("STREAM_IDLE_TIMEOUT_SECONDS", get_env("STREAM_IDLE_TIMEOUT_SECONDS", "0"), kMaxSeconds);
  cfg.stream_queue_limit_messages =
      ParseSize("STREAM_QUEUE_LIMIT_MESSAGES", get_env("STREAM_QUEUE_LIMIT_MESSAGES", "64"), kMaxQueueMessages);
  cfg.stream_queue_limit_bytes =
      ParseSize("STREAM_QUEUE_LIMIT_BYTES", get_env("STREAM_QUEUE_LIMIT_BYTES", "1048576"), kMaxQueueBytes);
  cfg.cors_allow_origins = SplitList(get_env("CORS_ALLOW_ORIGINS", "http://localhost:3000,http://localhost:3001"), ',');
  cfg.log_level = get_env("LOG_LEVEL", "info");
  return cfg;
}

}  // namespace broker
