/*
 * 설명: HTTP 연결을 처리하고 토큰/메시지 엔드포인트와 SSE 스트림 전환을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp, server/tests/e2e/stream_lifecycle_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <nlohmann/json.hpp>

#include "broker/config.hpp"
#include "broker/message_router.hpp"
#include "broker/observability.hpp"
#include "broker/session_registry.hpp"
#include "broker/stream_gateway.hpp"
#include "broker/token_store.hpp"

namespace broker {

// 퍼센트 인코딩을 풀어 key=value 쌍을 만든다. '+'는 공백으로 바꾼다.
std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query);
std::string PercentDecode(const std::string& value);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<TokenStore> token_store,
              std::shared_ptr<SessionRegistry> registry,
              std::shared_ptr<StreamGateway> gateway,
              std::shared_ptr<MessageRouter> router,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleHealth();
  void HandleMetrics();
  void HandleTestToken();
  void HandleValidate();
  void HandleIssueToken();
  void HandleListTokens();
  void HandleRevoke();
  void HandleMessages(const std::unordered_map<std::string, std::string>& params);
  void HandleEventStream(const std::unordered_map<std::string, std::string>& params);
  std::shared_ptr<Response> MakeResponse(boost::beast::http::status status, const nlohmann::json& body) const;
  void SendJson(boost::beast::http::status status, const nlohmann::json& body);
  void SendError(boost::beast::http::status status, std::string_view code, std::string_view message);
  void SendResponse(std::shared_ptr<Response> res);
  void LogRequest(unsigned status);
  std::optional<std::string> AuthenticatedUser(bool& header_present);
  std::optional<std::string> AllowedOrigin() const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<TokenStore> token_store_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<StreamGateway> gateway_;
  std::shared_ptr<MessageRouter> router_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::string path_;
  std::optional<std::string> log_username_;
};

}  // namespace broker
