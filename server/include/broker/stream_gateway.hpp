/*
 * 설명: 스트림 연결 요청의 토큰 추출/검증과 레지스트리 등록/해제를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/stream_gateway_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "broker/errors.hpp"
#include "broker/observability.hpp"
#include "broker/session_registry.hpp"
#include "broker/stream_connection.hpp"
#include "broker/token_store.hpp"

namespace broker {

enum class StreamState { kUnauthenticated, kValidating, kRejected, kOpen, kClosed };

std::string_view StreamStateName(StreamState state);

struct TokenSources {
  std::optional<std::string> query_token;
  std::optional<std::string> bearer_token;
};

struct TokenExtraction {
  std::optional<std::string> token;
  std::optional<BrokerError> error;
};

// 둘 중 하나만 있으면 그것을 쓴다. 둘 다 있고 같으면 허용, 다르면 kConflictingToken.
TokenExtraction ExtractToken(const TokenSources& sources);

// "Bearer <token>" 형식이 아니면 빈 문자열. 스킴은 대소문자 무시, 앞뒤 공백은 제거.
std::string ParseBearer(std::string_view header_value);

struct Admission {
  StreamState state{StreamState::kUnauthenticated};
  std::optional<std::string> username;
  std::optional<BrokerError> error;
  ValidationSource source{ValidationSource::kNone};

  bool Accepted() const { return state == StreamState::kValidating && username.has_value(); }
};

class StreamGateway {
 public:
  StreamGateway(std::shared_ptr<TokenStore> token_store, std::shared_ptr<SessionRegistry> registry,
                std::shared_ptr<Observability> observability);

  // 검증만 수행한다. 실패하면 state는 kRejected, 성공하면 Open 호출 전까지 kValidating.
  Admission Admit(const TokenSources& sources, const std::string& trace_id = "");
  // 스트림 헤더를 보낸 뒤 호출한다. 반환값은 kOpen.
  StreamState Open(const std::string& username, const std::shared_ptr<StreamConnection>& connection);
  // 연결이 닫히는 중에 호출한다. 소켓 종료 전에 레지스트리에서 먼저 빠진다.
  StreamState Close(const std::string& username, const StreamConnection* connection);

  const std::shared_ptr<SessionRegistry>& Registry() const { return registry_; }

 private:
  std::shared_ptr<TokenStore> token_store_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace broker
