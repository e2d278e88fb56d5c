/*
 * 설명: HTTP 요청을 처리하고 헬스/토큰/메시지 엔드포인트와 SSE 스트림 전환을 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp, server/tests/e2e/stream_lifecycle_test.cpp
 */
#include "broker/http_session.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "broker/api_response.hpp"
#include "broker/sse_session.hpp"
#include "broker/token_codec.hpp"

namespace broker {

namespace {
constexpr const char* kServerName = "session-broker";
constexpr const char* kVersion = "v1.0.0";

std::string TokenPreview(const std::string& token) {
  auto pos = token.rfind(':');
  if (pos == std::string::npos) {
    return "...";
  }
  return token.substr(0, std::min(token.size(), pos + 1 + 4)) + "...";
}

nlohmann::json OptionalTime(const std::optional<std::chrono::system_clock::time_point>& tp) {
  return tp ? nlohmann::json(ToIsoString(*tp)) : nlohmann::json(nullptr);
}

nlohmann::json TokenToJson(const IssuedToken& record, bool reveal) {
  return {{"token", reveal ? record.token : TokenPreview(record.token)},
          {"name", record.name},
          {"description", record.description.empty() ? nlohmann::json(nullptr) : nlohmann::json(record.description)},
          {"user", record.username},
          {"issued_at", ToIsoString(record.issued_at)},
          {"expires_at", OptionalTime(record.expires_at)},
          {"last_used_at", OptionalTime(record.last_used_at)}};
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}
}  // namespace

std::string PercentDecode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      int hi = HexValue(value[i + 1]);
      int lo = HexValue(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(value[i] == '+' ? ' ' : value[i]);
  }
  return out;
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(PercentDecode(pair.substr(0, eq)), PercentDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<TokenStore> token_store,
                         std::shared_ptr<SessionRegistry> registry,
                         std::shared_ptr<StreamGateway> gateway,
                         std::shared_ptr<MessageRouter> router,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), token_store_(std::move(token_store)),
      registry_(std::move(registry)), gateway_(std::move(gateway)), router_(std::move(router)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  log_username_.reset();
  if (observability_) {
    observability_->IncrementRequest();
  }

  std::string target_str = std::string(req_.target());
  path_ = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path_ = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }
  auto params = ParseQueryParams(query);
  const auto method = req_.method();

  try {
    if (method == http::verb::options) {
      auto res = MakeResponse(http::status::no_content, nullptr);
      res->set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
      res->set(http::field::access_control_allow_headers, "Authorization, Content-Type");
      return SendResponse(res);
    }
    if (method == http::verb::get && path_ == "/health") {
      return HandleHealth();
    }
    if (method == http::verb::get && path_ == "/metrics") {
      return HandleMetrics();
    }
    if (method == http::verb::get && path_ == "/auth/test-token") {
      return HandleTestToken();
    }
    if (method == http::verb::post && path_ == "/auth/validate") {
      return HandleValidate();
    }
    if (method == http::verb::post && path_ == "/auth/tokens") {
      return HandleIssueToken();
    }
    if (method == http::verb::get && path_ == "/auth/tokens") {
      return HandleListTokens();
    }
    if (method == http::verb::post && path_ == "/auth/revoke") {
      return HandleRevoke();
    }
    if (method == http::verb::post && path_ == "/messages") {
      return HandleMessages(params);
    }
    if (method == http::verb::get && path_ == "/sse") {
      return HandleEventStream(params);
    }
  } catch (const std::exception& ex) {
    if (observability_) {
      LogContext ctx;
      ctx.trace_id = trace_id_;
      ctx.name = "http.exception";
      ctx.level = LogLevel::kError;
      ctx.detail = {{"path", path_}, {"what", ex.what()}};
      observability_->Log(ctx);
    }
    return SendError(http::status::internal_server_error, "internal_error", "요청 처리 중 오류가 발생했습니다");
  }

  SendError(http::status::not_found, "not_found", "지원되지 않는 경로입니다");
}

void HttpSession::HandleHealth() {
  nlohmann::json data{{"status", "healthy"},
                      {"version", kVersion},
                      {"authService", config_.auth_service_url},
                      {"legacyFallback", token_store_->LegacyFallbackEnabled()},
                      {"activeStreams", registry_->ActiveCount()}};
  SendJson(boost::beast::http::status::ok, data);
}

void HttpSession::HandleMetrics() {
  auto data = ToJson(observability_->Snapshot());
  data["tokens"] = {{"issued", token_store_->Count()}};
  data["sessions"] = {{"active", registry_->ActiveCount()}};
  SendJson(boost::beast::http::status::ok, data);
}

void HttpSession::HandleTestToken() {
  auto record = token_store_->Issue(config_.test_token_user, "Test Token for MCP",
                                    std::chrono::seconds(config_.test_token_ttl_seconds),
                                    "Auto-generated test token for MCP development");
  log_username_ = record.username;
  nlohmann::json data = TokenToJson(record, true);
  data["format_info"] = {{"expected_format", "user:username:randomhash"},
                         {"actual_format", record.token},
                         {"format_valid", TryDecodeToken(record.token).has_value()}};
  SendJson(boost::beast::http::status::ok, data);
}

void HttpSession::HandleValidate() {
  std::string token;
  try {
    auto body_json = nlohmann::json::parse(req_.body());
    if (!body_json.contains("token") || !body_json["token"].is_string()) {
      throw std::runtime_error("token required");
    }
    token = body_json["token"].get<std::string>();
  } catch (const std::exception&) {
    return SendError(boost::beast::http::status::bad_request, "bad_request", "token 필드가 있는 JSON 본문이 필요합니다");
  }

  auto result = token_store_->Validate(token);
  if (!result.valid) {
    nlohmann::json data{{"valid", false}, {"error", "Invalid or expired token"}, {"reason", ErrorCode(*result.reason)}};
    return SendJson(boost::beast::http::status::ok, data);
  }
  log_username_ = result.username;
  nlohmann::json data{{"valid", true}, {"username", *result.username}, {"user", {{"username", *result.username}}}};
  SendJson(boost::beast::http::status::ok, data);
}

void HttpSession::HandleIssueToken() {
  bool header_present = false;
  auto username = AuthenticatedUser(header_present);
  if (!username) {
    return SendError(boost::beast::http::status::unauthorized, "unauthorized", "인증이 필요합니다");
  }
  std::string name = "API Token";
  std::string description;
  std::optional<std::chrono::seconds> ttl;
  try {
    if (!req_.body().empty()) {
      auto body_json = nlohmann::json::parse(req_.body());
      if (body_json.contains("name")) {
        if (!body_json["name"].is_string()) {
          throw std::runtime_error("name invalid");
        }
        name = body_json["name"].get<std::string>();
      }
      if (body_json.contains("description")) {
        if (!body_json["description"].is_string()) {
          throw std::runtime_error("description invalid");
        }
        description = body_json["description"].get<std::string>();
      }
      if (body_json.contains("ttlSeconds")) {
        const auto& value = body_json["ttlSeconds"];
        if (!value.is_number_unsigned()) {
          throw std::runtime_error("ttl invalid");
        }
        auto seconds = value.get<std::uint64_t>();
        if (seconds == 0 || seconds > static_cast<std::uint64_t>(kMaxTokenTtl.count())) {
          throw std::runtime_error("ttl out of range");
        }
        ttl = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(seconds));
      }
    }
  } catch (const std::exception&) {
    return SendError(boost::beast::http::status::bad_request, "bad_request",
                     "name, description 또는 ttlSeconds가 올바르지 않습니다");
  }
  auto record = token_store_->Issue(*username, name, ttl, description);
  SendJson(boost::beast::http::status::created, TokenToJson(record, true));
}

void HttpSession::HandleListTokens() {
  bool header_present = false;
  auto username = AuthenticatedUser(header_present);
  if (!username) {
    return SendError(boost::beast::http::status::unauthorized, "unauthorized", "인증이 필요합니다");
  }
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& record : token_store_->ListForUser(*username)) {
    entries.push_back(TokenToJson(record, false));
  }
  SendJson(boost::beast::http::status::ok, {{"user", *username}, {"tokens", entries}});
}

void HttpSession::HandleRevoke() {
  bool header_present = false;
  auto username = AuthenticatedUser(header_present);
  if (!username) {
    return SendError(boost::beast::http::status::unauthorized, "unauthorized", "인증이 필요합니다");
  }
  std::string token;
  try {
    auto body_json = nlohmann::json::parse(req_.body());
    if (!body_json.contains("token") || !body_json["token"].is_string()) {
      throw std::runtime_error("token required");
    }
    token = body_json["token"].get<std::string>();
  } catch (const std::exception&) {
    return SendError(boost::beast::http::status::bad_request, "bad_request", "token 필드가 있는 JSON 본문이 필요합니다");
  }
  // 남의 토큰은 없는 토큰과 같게 응답해 존재 여부를 드러내지 않는다.
  SendJson(boost::beast::http::status::ok, {{"revoked", token_store_->RevokeOwned(token, *username)}});
}

void HttpSession::HandleMessages(const std::unordered_map<std::string, std::string>& params) {
  using boost::beast::http::status;
  nlohmann::json body_json;
  try {
    body_json = req_.body().empty() ? nlohmann::json::object() : nlohmann::json::parse(req_.body());
  } catch (const std::exception&) {
    return SendError(status::bad_request, "bad_request", "JSON 본문이 올바르지 않습니다");
  }

  bool header_present = false;
  auto bearer_user = AuthenticatedUser(header_present);
  if (header_present && !bearer_user) {
    return SendError(status::unauthorized, "invalid_token", ErrorMessage(BrokerError::kInvalidToken));
  }

  RouteResult result;
  auto session_it = params.find("sessionId");
  if (session_it != params.end()) {
    if (bearer_user) {
      auto session = registry_->LookupBySessionId(session_it->second);
      if (session && session->username != *bearer_user) {
        return SendError(status::forbidden, "forbidden", "다른 사용자의 세션에는 보낼 수 없습니다");
      }
    }
    result = router_->RouteToSession(session_it->second, body_json);
  } else {
    std::optional<std::string> username = bearer_user;
    if (!body_json.is_object()) {
      return SendError(status::bad_request, "bad_request", "username과 message 필드가 필요합니다");
    }
    if (body_json.contains("username")) {
      if (!body_json["username"].is_string()) {
        return SendError(status::bad_request, "bad_request", "username은 문자열이어야 합니다");
      }
      auto requested = body_json["username"].get<std::string>();
      if (bearer_user && requested != *bearer_user) {
        return SendError(status::forbidden, "forbidden", "다른 사용자에게는 보낼 수 없습니다");
      }
      username = requested;
    }
    if (!username) {
      return SendError(status::bad_request, "bad_request", "username 또는 sessionId가 필요합니다");
    }
    if (!body_json.contains("message")) {
      return SendError(status::bad_request, "bad_request", "message 필드가 필요합니다");
    }
    log_username_ = username;
    result = router_->Route(*username, body_json["message"]);
  }

  if (result.delivered) {
    return SendJson(status::ok, {{"delivered", true}, {"sessionId", *result.session_id}});
  }
  auto error = *result.error;
  if (error == BrokerError::kNoActiveSession) {
    return SendError(status::not_found, ErrorCode(error), ErrorMessage(error));
  }
  auto envelope = MakeErrorEnvelope(ErrorCode(error), ErrorMessage(error));
  envelope["error"]["detail"] = {{"retryable", result.Retryable()}};
  auto res = MakeResponse(status::service_unavailable, envelope);
  res->set(boost::beast::http::field::retry_after, "1");
  SendResponse(res);
}

void HttpSession::HandleEventStream(const std::unordered_map<std::string, std::string>& params) {
  TokenSources sources;
  auto token_it = params.find("token");
  if (token_it != params.end()) {
    sources.query_token = token_it->second;
  }
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  if (auth_it != req_.end()) {
    sources.bearer_token = ParseBearer(std::string(auth_it->value()));
  }

  auto admission = gateway_->Admit(sources, trace_id_);
  if (!admission.Accepted()) {
    auto error = *admission.error;
    auto status = error == BrokerError::kConflictingToken ? boost::beast::http::status::bad_request
                                                          : boost::beast::http::status::unauthorized;
    auto res = MakeResponse(status, MakeErrorEnvelope(ErrorCode(error), ErrorMessage(error)));
    if (status == boost::beast::http::status::unauthorized) {
      res->set(boost::beast::http::field::www_authenticate, "Bearer");
    }
    return SendResponse(res);
  }

  log_username_ = admission.username;
  LogRequest(200);
  StreamLimits limits;
  limits.max_queue_messages = config_.stream_queue_limit_messages;
  limits.max_queue_bytes = config_.stream_queue_limit_bytes;
  limits.keepalive = std::chrono::seconds(config_.stream_keepalive_seconds);
  limits.idle_timeout = std::chrono::seconds(config_.stream_idle_timeout_seconds);
  std::make_shared<SseSession>(std::move(stream_), req_.version(), *admission.username, gateway_, observability_,
                               limits, AllowedOrigin())
      ->Run();
}

std::shared_ptr<HttpSession::Response> HttpSession::MakeResponse(boost::beast::http::status status,
                                                                 const nlohmann::json& body) const {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->result(status);
  res->set(boost::beast::http::field::server, kServerName);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  if (auto origin = AllowedOrigin()) {
    res->set(boost::beast::http::field::access_control_allow_origin, *origin);
    res->set(boost::beast::http::field::access_control_allow_credentials, "true");
    res->set(boost::beast::http::field::vary, "Origin");
  }
  res->body() = body.is_null() ? std::string{} : body.dump();
  res->content_length(res->body().size());
  return res;
}

void HttpSession::SendJson(boost::beast::http::status status, const nlohmann::json& body) {
  SendResponse(MakeResponse(status, body));
}

void HttpSession::SendError(boost::beast::http::status status, std::string_view code, std::string_view message) {
  SendResponse(MakeResponse(status, MakeErrorEnvelope(code, message)));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  LogRequest(res->result_int());
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::LogRequest(unsigned status) {
  if (!observability_) {
    return;
  }
  if (status >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  LogContext ctx;
  ctx.trace_id = trace_id_;
  ctx.username = log_username_;
  // 쿼리에는 토큰이 실릴 수 있으므로 경로만 남긴다.
  ctx.name = std::string(req_.method_string()) + " " + path_;
  ctx.latency_ms = latency;
  ctx.status = static_cast<int>(status);
  ctx.level = status >= 500 ? LogLevel::kError : LogLevel::kInfo;
  observability_->Log(ctx);
}

std::optional<std::string> HttpSession::AuthenticatedUser(bool& header_present) {
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  header_present = auth_it != req_.end();
  if (!header_present) {
    return std::nullopt;
  }
  auto token = ParseBearer(std::string(auth_it->value()));
  if (token.empty()) {
    return std::nullopt;
  }
  auto result = token_store_->Validate(token);
  if (!result.valid) {
    return std::nullopt;
  }
  log_username_ = result.username;
  return result.username;
}

std::optional<std::string> HttpSession::AllowedOrigin() const {
  auto origin_it = req_.find(boost::beast::http::field::origin);
  if (origin_it == req_.end()) {
    return std::nullopt;
  }
  std::string origin(origin_it->value());
  for (const auto& allowed : config_.cors_allow_origins) {
    if (allowed == "*" || allowed == origin) {
      return origin;
    }
  }
  return std::nullopt;
}

}  // namespace broker
