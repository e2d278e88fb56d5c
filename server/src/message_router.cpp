/*
 * 설명: 레지스트리 조회 후 락 없이 스트림에 메시지를 넘기고 결과를 분류한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_router_test.cpp
 */
#include "broker/message_router.hpp"

#include <utility>

namespace broker {

MessageRouter::MessageRouter(std::shared_ptr<SessionRegistry> registry, std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), observability_(std::move(observability)) {}

RouteResult MessageRouter::Route(const std::string& username, const nlohmann::json& message) {
  return Forward(registry_->Lookup(username), username, message);
}

RouteResult MessageRouter::RouteToSession(const std::string& session_id, const nlohmann::json& message) {
  return Forward(registry_->LookupBySessionId(session_id), session_id, message);
}

RouteResult MessageRouter::Forward(const std::optional<Session>& session, const std::string& target,
                                   const nlohmann::json& message) {
  RouteResult result;
  if (!session) {
    result.error = BrokerError::kNoActiveSession;
  } else {
    result.session_id = session->session_id;
    // 조회와 전달 사이에 연결이 닫힐 수 있다. 이 경우 Deliver가 false를 돌려준다.
    if (session->connection->Deliver(kMessageEvent, message)) {
      result.delivered = true;
    } else {
      result.error = BrokerError::kDeliveryFailed;
    }
  }

  if (observability_) {
    observability_->RecordRoute(result.delivered, result.error == BrokerError::kNoActiveSession);
    LogContext ctx;
    ctx.name = "message.route";
    ctx.username = session ? std::optional<std::string>(session->username) : std::nullopt;
    ctx.session_id = result.session_id;
    ctx.level = result.delivered ? LogLevel::kDebug : LogLevel::kInfo;
    ctx.detail = {{"target", target}, {"delivered", result.delivered}};
    if (result.error) {
      ctx.detail["error"] = ErrorCode(*result.error);
    }
    observability_->Log(ctx);
  }
  return result;
}

}  // namespace broker
