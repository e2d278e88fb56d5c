/*
 * 설명: 대역 외 메시지를 사용자/세션 ID 기준으로 활성 스트림에 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_router_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "broker/errors.hpp"
#include "broker/observability.hpp"
#include "broker/session_registry.hpp"

namespace broker {

inline constexpr const char* kMessageEvent = "message";

struct RouteResult {
  bool delivered{false};
  std::optional<BrokerError> error;
  std::optional<std::string> session_id;

  // kDeliveryFailed만 재시도 대상이다. kNoActiveSession이면 재연결이 필요하다.
  bool Retryable() const { return error == BrokerError::kDeliveryFailed; }
};

class MessageRouter {
 public:
  MessageRouter(std::shared_ptr<SessionRegistry> registry, std::shared_ptr<Observability> observability);

  RouteResult Route(const std::string& username, const nlohmann::json& message);
  RouteResult RouteToSession(const std::string& session_id, const nlohmann::json& message);

 private:
  RouteResult Forward(const std::optional<Session>& session, const std::string& target, const nlohmann::json& message);

  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace broker
