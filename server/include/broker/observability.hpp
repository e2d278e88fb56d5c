/*
 * 설명: 구조화 로그와 브로커 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace broker {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

// 알 수 없는 값은 kInfo로 취급한다.
LogLevel ParseLogLevel(std::string_view value);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> username;
  std::optional<std::string> session_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::optional<int> status;
  nlohmann::json detail{};
};

enum class ValidationSource { kNone, kAuthoritative, kLegacyFallback };

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t streams_active{0};
  std::uint64_t streams_opened{0};
  std::uint64_t streams_rejected{0};
  std::uint64_t validations_authoritative{0};
  std::uint64_t validations_legacy{0};
  std::uint64_t validations_rejected{0};
  std::uint64_t routes_delivered{0};
  std::uint64_t routes_no_session{0};
  std::uint64_t routes_failed{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);
  // 테스트에서 출력 대상을 바꿀 때 사용한다. 스트림 수명은 호출자가 보장한다.
  Observability(LogLevel min_level, std::ostream& out);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetStreamsActive(std::uint64_t count);
  void RecordStreamOpened();
  void RecordStreamRejected();
  void RecordValidation(ValidationSource source);
  void RecordRoute(bool delivered, bool no_session);
  MetricsSnapshot Snapshot() const;
  void Log(const LogContext& ctx) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }

 private:
  LogLevel min_level_;
  std::ostream* out_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> streams_active_{0};
  std::atomic<std::uint64_t> streams_opened_{0};
  std::atomic<std::uint64_t> streams_rejected_{0};
  std::atomic<std::uint64_t> validations_authoritative_{0};
  std::atomic<std::uint64_t> validations_legacy_{0};
  std::atomic<std::uint64_t> validations_rejected_{0};
  std::atomic<std::uint64_t> routes_delivered_{0};
  std::atomic<std::uint64_t> routes_no_session_{0};
  std::atomic<std::uint64_t> routes_failed_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

nlohmann::json ToJson(const MetricsSnapshot& snapshot);

}  // namespace broker
