/*
 * 설명: 인증된 사용자에게 열린 SSE 스트림 하나를 관리한다. 전송 큐, 백프레셔, 킵얼라이브,
 *       유휴 타임아웃, 클라이언트 종료 감지를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp, server/tests/e2e/stream_lifecycle_test.cpp
 */
#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "broker/observability.hpp"
#include "broker/stream_connection.hpp"
#include "broker/stream_gateway.hpp"

namespace broker {

struct StreamLimits {
  std::size_t max_queue_messages{64};
  std::size_t max_queue_bytes{1 << 20};
  // 0이면 비활성.
  std::chrono::seconds keepalive{15};
  std::chrono::seconds idle_timeout{0};
};

class SseSession : public StreamConnection, public std::enable_shared_from_this<SseSession> {
 public:
  SseSession(boost::beast::tcp_stream stream, unsigned http_version, std::string username,
             std::shared_ptr<StreamGateway> gateway, std::shared_ptr<Observability> observability,
             StreamLimits limits, std::optional<std::string> allow_origin);
  ~SseSession() override;

  // 응답 헤더를 보낸 뒤 레지스트리에 등록하고 endpoint/ready 이벤트를 보낸다.
  void Run();

  const std::string& SessionId() const override { return session_id_; }
  bool Deliver(const std::string& event, const nlohmann::json& payload) override;
  void Close() override;
  bool IsOpen() const override;

  StreamState State() const { return state_.load(); }
  const std::string& Username() const { return username_; }

 private:
  void OnHeaderWritten(boost::beast::error_code ec);
  void WatchDisconnect();
  void OnPeerRead(boost::beast::error_code ec);
  void EnqueueFrame(std::string frame);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void ScheduleKeepalive();
  void OnKeepalive(boost::beast::error_code ec);
  void ScheduleIdleCheck(std::chrono::steady_clock::duration wait);
  void OnIdleCheck(boost::beast::error_code ec);
  void BeginClose(const std::string& reason);
  void FinishClose(const std::string& reason);
  std::string BuildFrame(const std::string& event, const nlohmann::json& payload);

  boost::beast::tcp_stream stream_;
  boost::beast::http::response<boost::beast::http::empty_body> res_;
  boost::beast::http::response_serializer<boost::beast::http::empty_body> serializer_;
  std::array<char, 512> peer_read_buffer_{};
  boost::asio::steady_timer keepalive_timer_;
  boost::asio::steady_timer idle_timer_;
  std::string username_;
  std::string session_id_;
  std::shared_ptr<StreamGateway> gateway_;
  std::shared_ptr<Observability> observability_;
  StreamLimits limits_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  std::atomic<bool> closed_{false};
  std::atomic<StreamState> state_{StreamState::kValidating};
  std::atomic<std::uint64_t> next_event_id_{1};
  std::atomic<std::int64_t> last_activity_ns_{0};
};

}  // namespace broker
