/*
 * 설명: 구조화 로그와 브로커 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "broker/observability.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace broker {

namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm = *std::gmtime(&itt);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
  return ss.str();
}

// 여러 워커 스레드의 로그 라인이 섞이지 않도록 한다.
std::mutex& LogMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level) : min_level_(min_level), out_(&std::cout) {}

Observability::Observability(LogLevel min_level, std::ostream& out) : min_level_(min_level), out_(&out) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetStreamsActive(std::uint64_t count) { streams_active_.store(count); }

void Observability::RecordStreamOpened() { streams_opened_.fetch_add(1); }

void Observability::RecordStreamRejected() { streams_rejected_.fetch_add(1); }

void Observability::RecordValidation(ValidationSource source) {
  switch (source) {
    case ValidationSource::kAuthoritative:
      validations_authoritative_.fetch_add(1);
      break;
    case ValidationSource::kLegacyFallback:
      validations_legacy_.fetch_add(1);
      break;
    case ValidationSource::kNone:
      validations_rejected_.fetch_add(1);
      break;
  }
}

void Observability::RecordRoute(bool delivered, bool no_session) {
  if (delivered) {
    routes_delivered_.fetch_add(1);
  } else if (no_session) {
    routes_no_session_.fetch_add(1);
  } else {
    routes_failed_.fetch_add(1);
  }
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.streams_active = streams_active_.load();
  snapshot.streams_opened = streams_opened_.load();
  snapshot.streams_rejected = streams_rejected_.load();
  snapshot.validations_authoritative = validations_authoritative_.load();
  snapshot.validations_legacy = validations_legacy_.load();
  snapshot.validations_rejected = validations_rejected_.load();
  snapshot.routes_delivered = routes_delivered_.load();
  snapshot.routes_no_session = routes_no_session_.load();
  snapshot.routes_failed = routes_failed_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["ts"] = CurrentTimestamp();
  log_json["level"] = LogLevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.username) {
    log_json["username"] = *ctx.username;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (ctx.status) {
    log_json["status"] = *ctx.status;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(LogMutex());
  *out_ << log_json.dump() << std::endl;
}

nlohmann::json ToJson(const MetricsSnapshot& snapshot) {
  return {{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
          {"streams",
           {{"active", snapshot.streams_active},
            {"opened", snapshot.streams_opened},
            {"rejected", snapshot.streams_rejected}}},
          {"validations",
           {{"authoritative", snapshot.validations_authoritative},
            {"legacyFallback", snapshot.validations_legacy},
            {"rejected", snapshot.validations_rejected}}},
          {"routes",
           {{"delivered", snapshot.routes_delivered},
            {"noActiveSession", snapshot.routes_no_session},
            {"deliveryFailed", snapshot.routes_failed}}}};
}

}  // namespace broker
