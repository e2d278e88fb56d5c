/*
 * 설명: 스트림 요청을 검증 후 등록하고, 종료 시 레지스트리에서 해제한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/stream_gateway_test.cpp
 */
#include "broker/stream_gateway.hpp"

#include <utility>

#include <boost/beast/core/string.hpp>

namespace broker {

std::string_view StreamStateName(StreamState state) {
  switch (state) {
    case StreamState::kUnauthenticated:
      return "unauthenticated";
    case StreamState::kValidating:
      return "validating";
    case StreamState::kRejected:
      return "rejected";
    case StreamState::kOpen:
      return "open";
    case StreamState::kClosed:
      return "closed";
  }
  return "unknown";
}

TokenExtraction ExtractToken(const TokenSources& sources) {
  auto present = [](const std::optional<std::string>& v) { return v.has_value() && !v->empty(); };
  const bool has_query = present(sources.query_token);
  const bool has_bearer = present(sources.bearer_token);

  TokenExtraction result;
  if (has_query && has_bearer) {
    if (*sources.query_token != *sources.bearer_token) {
      result.error = BrokerError::kConflictingToken;
      return result;
    }
    result.token = sources.query_token;
  } else if (has_query) {
    result.token = sources.query_token;
  } else if (has_bearer) {
    result.token = sources.bearer_token;
  } else {
    result.error = BrokerError::kMissingToken;
  }
  return result;
}

std::string ParseBearer(std::string_view header_value) {
  // 스킴은 대소문자를 구분하지 않고, 스킴 뒤 공백은 여러 개를 허용한다.
  auto is_space = [](char c) { return c == ' ' || c == '\t'; };
  auto space = header_value.find_first_of(" \t");
  if (space == std::string_view::npos) {
    return "";
  }
  if (!boost::beast::iequals(boost::beast::string_view(header_value.data(), space), "bearer")) {
    return "";
  }
  auto token = header_value.substr(space);
  while (!token.empty() && is_space(token.front())) {
    token.remove_prefix(1);
  }
  while (!token.empty() && is_space(token.back())) {
    token.remove_suffix(1);
  }
  return std::string(token);
}

StreamGateway::StreamGateway(std::shared_ptr<TokenStore> token_store, std::shared_ptr<SessionRegistry> registry,
                             std::shared_ptr<Observability> observability)
    : token_store_(std::move(token_store)), registry_(std::move(registry)), observability_(std::move(observability)) {}

Admission StreamGateway::Admit(const TokenSources& sources, const std::string& trace_id) {
  Admission admission;
  auto extraction = ExtractToken(sources);
  if (!extraction.token) {
    admission.state = StreamState::kRejected;
    admission.error = extraction.error;
  } else {
    admission.state = StreamState::kValidating;
    auto validation = token_store_->Validate(*extraction.token);
    if (!validation.valid) {
      admission.state = StreamState::kRejected;
      admission.error = validation.reason;
    } else {
      admission.username = validation.username;
      admission.source = validation.source;
    }
  }

  if (admission.state == StreamState::kRejected && observability_) {
    observability_->RecordStreamRejected();
    LogContext ctx;
    ctx.trace_id = trace_id;
    ctx.name = "stream.rejected";
    ctx.detail = {{"reason", ErrorCode(*admission.error)}};
    observability_->Log(ctx);
  }
  return admission;
}

StreamState StreamGateway::Open(const std::string& username, const std::shared_ptr<StreamConnection>& connection) {
  registry_->Register(username, connection);
  if (observability_) {
    observability_->RecordStreamOpened();
    LogContext ctx;
    ctx.name = "stream.open";
    ctx.username = username;
    ctx.session_id = connection->SessionId();
    observability_->Log(ctx);
  }
  return StreamState::kOpen;
}

StreamState StreamGateway::Close(const std::string& username, const StreamConnection* connection) {
  bool released = registry_->Release(username, connection);
  if (observability_) {
    LogContext ctx;
    ctx.name = "stream.close";
    ctx.username = username;
    ctx.session_id = connection->SessionId();
    ctx.detail = {{"released", released}};
    observability_->Log(ctx);
  }
  return StreamState::kClosed;
}

}  // namespace broker
