/*
 * 설명: SSE 스트림의 헤더 전송, 이벤트 큐 처리, 킵얼라이브/유휴 타임아웃, 종료 처리를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp, server/tests/e2e/stream_lifecycle_test.cpp
 */
#include "broker/sse_session.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include <openssl/rand.h>

#include "broker/api_response.hpp"

namespace broker {

namespace {
std::string BytesToHex(const std::vector<unsigned char>& data) {
  std::ostringstream oss;
  for (unsigned char byte : data) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return oss.str();
}

std::string GenerateSessionId() {
  std::vector<unsigned char> buffer(16);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("RAND_bytes 실패: 세션 ID를 만들 수 없습니다");
  }
  return BytesToHex(buffer);
}

std::int64_t NowNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now().time_since_epoch())
      .count();
}
}  // namespace

SseSession::SseSession(boost::beast::tcp_stream stream, unsigned http_version, std::string username,
                       std::shared_ptr<StreamGateway> gateway, std::shared_ptr<Observability> observability,
                       StreamLimits limits, std::optional<std::string> allow_origin)
    : stream_(std::move(stream)), serializer_(res_), keepalive_timer_(stream_.get_executor()),
      idle_timer_(stream_.get_executor()), username_(std::move(username)), session_id_(GenerateSessionId()),
      gateway_(std::move(gateway)), observability_(std::move(observability)), limits_(limits) {
  res_.version(http_version);
  res_.result(boost::beast::http::status::ok);
  res_.set(boost::beast::http::field::server, "session-broker");
  res_.set(boost::beast::http::field::content_type, "text/event-stream");
  res_.set(boost::beast::http::field::cache_control, "no-cache, no-transform");
  res_.set("X-Accel-Buffering", "no");
  res_.set("Mcp-Session-Id", session_id_);
  if (allow_origin) {
    res_.set(boost::beast::http::field::access_control_allow_origin, *allow_origin);
    res_.set(boost::beast::http::field::access_control_allow_credentials, "true");
  }
  // 본문 길이를 알 수 없으므로 연결 종료가 스트림의 끝이다.
  res_.keep_alive(false);
  last_activity_ns_.store(NowNs());
}

SseSession::~SseSession() = default;

void SseSession::Run() {
  auto self = shared_from_this();
  stream_.expires_never();
  boost::beast::http::async_write_header(
      stream_, serializer_,
      [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnHeaderWritten(ec); });
}

void SseSession::OnHeaderWritten(boost::beast::error_code ec) {
  if (ec) {
    BeginClose("header_write_failed");
    return;
  }
  if (closed_) {
    return;
  }
  state_ = gateway_->Open(username_, shared_from_this());
  if (closed_) {
    // 등록 직전에 닫혔다면 방금 넣은 항목을 되돌린다.
    state_ = gateway_->Close(username_, this);
    return;
  }

  EnqueueFrame(ToSseFrame(SseEvent{"endpoint", "/messages?sessionId=" + session_id_, std::nullopt}));
  EnqueueFrame(BuildFrame("ready", {{"username", username_}, {"sessionId", session_id_}}));
  WatchDisconnect();
  ScheduleKeepalive();
  if (limits_.idle_timeout.count() > 0) {
    ScheduleIdleCheck(limits_.idle_timeout);
  }
}

void SseSession::WatchDisconnect() {
  auto self = shared_from_this();
  stream_.async_read_some(boost::asio::buffer(peer_read_buffer_),
                          [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                            self->OnPeerRead(ec);
                          });
}

void SseSession::OnPeerRead(boost::beast::error_code ec) {
  if (closed_) {
    return;
  }
  if (ec) {
    BeginClose(ec == boost::asio::error::eof ? "client_disconnect" : "read_error");
    return;
  }
  // SSE 클라이언트가 보내는 데이터는 의미가 없으므로 버리고 계속 감시한다.
  WatchDisconnect();
}

bool SseSession::Deliver(const std::string& event, const nlohmann::json& payload) {
  if (closed_) {
    return false;
  }
  last_activity_ns_.store(NowNs());
  auto frame = BuildFrame(event, payload);
  boost::asio::post(stream_.get_executor(),
                    [self = shared_from_this(), frame = std::move(frame)]() mutable {
                      self->EnqueueFrame(std::move(frame));
                    });
  return true;
}

void SseSession::Close() { BeginClose("server_close"); }

bool SseSession::IsOpen() const { return !closed_ && state_ == StreamState::kOpen; }

void SseSession::EnqueueFrame(std::string frame) {
  if (closed_) {
    return;
  }
  const auto frame_size = frame.size();
  if (send_queue_.size() >= limits_.max_queue_messages || queued_bytes_ + frame_size > limits_.max_queue_bytes) {
    BeginClose("backpressure_exceeded");
    return;
  }
  send_queue_.push_back(std::move(frame));
  queued_bytes_ += frame_size;
  if (!writing_) {
    WriteNext();
  }
}

void SseSession::WriteNext() {
  if (send_queue_.empty() || closed_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  boost::asio::async_write(stream_, boost::asio::buffer(send_queue_.front()),
                           [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                             self->OnWrite(ec);
                           });
}

void SseSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (closed_) {
    // 닫히는 동안 진행 중이던 쓰기가 끝났으니 이제 큐를 비워도 된다.
    send_queue_.clear();
    queued_bytes_ = 0;
    return;
  }
  if (ec) {
    BeginClose("write_error");
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void SseSession::ScheduleKeepalive() {
  if (limits_.keepalive.count() <= 0 || closed_) {
    return;
  }
  auto self = shared_from_this();
  keepalive_timer_.expires_after(limits_.keepalive);
  keepalive_timer_.async_wait([self](boost::beast::error_code ec) { self->OnKeepalive(ec); });
}

void SseSession::OnKeepalive(boost::beast::error_code ec) {
  if (ec || closed_) {
    return;
  }
  EnqueueFrame(ToSseComment("keepalive"));
  ScheduleKeepalive();
}

void SseSession::ScheduleIdleCheck(std::chrono::steady_clock::duration wait) {
  auto self = shared_from_this();
  idle_timer_.expires_after(wait);
  idle_timer_.async_wait([self](boost::beast::error_code ec) { self->OnIdleCheck(ec); });
}

void SseSession::OnIdleCheck(boost::beast::error_code ec) {
  if (ec || closed_) {
    return;
  }
  auto idle = std::chrono::nanoseconds(NowNs() - last_activity_ns_.load());
  if (idle >= limits_.idle_timeout) {
    BeginClose("idle_timeout");
    return;
  }
  ScheduleIdleCheck(limits_.idle_timeout - idle);
}

void SseSession::BeginClose(const std::string& reason) {
  if (closed_.exchange(true)) {
    return;
  }
  // 레지스트리 해제가 소켓 종료보다 먼저 끝나야 라우터가 죽은 핸들을 보지 않는다.
  state_ = gateway_->Close(username_, this);
  boost::asio::post(stream_.get_executor(), [self = shared_from_this(), reason]() { self->FinishClose(reason); });
}

void SseSession::FinishClose(const std::string& reason) {
  keepalive_timer_.cancel();
  idle_timer_.cancel();
  boost::beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  stream_.socket().close(ec);
  // 쓰기가 진행 중이면 front 버퍼가 아직 쓰이고 있으므로 OnWrite가 정리한다.
  if (!writing_) {
    send_queue_.clear();
    queued_bytes_ = 0;
  }
  if (observability_) {
    LogContext ctx;
    ctx.name = "stream.closed";
    ctx.username = username_;
    ctx.session_id = session_id_;
    ctx.detail = {{"reason", reason}};
    observability_->Log(ctx);
  }
}

std::string SseSession::BuildFrame(const std::string& event, const nlohmann::json& payload) {
  return ToSseFrame(SseEvent{event, payload.dump(), next_event_id_.fetch_add(1)});
}

}  // namespace broker
