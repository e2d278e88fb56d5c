/*
 * 설명: 사용자별로 하나의 활성 스트림 연결을 보관하고 교체/퇴출을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "broker/observability.hpp"
#include "broker/stream_connection.hpp"

namespace broker {

struct Session {
  std::string username;
  std::string session_id;
  std::shared_ptr<StreamConnection> connection;
  std::chrono::system_clock::time_point established_at;
};

class SessionRegistry {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  // 같은 사용자의 기존 연결은 맵에서 교체된 뒤 락 밖에서 닫힌다.
  void Register(const std::string& username, const std::shared_ptr<StreamConnection>& connection);
  std::optional<Session> Lookup(const std::string& username) const;
  std::optional<Session> LookupBySessionId(const std::string& session_id) const;
  // 있으면 제거하고 연결을 닫는다. 없으면 아무것도 하지 않는다.
  bool Evict(const std::string& username);
  // 연결이 스스로 닫힐 때 호출한다. 현재 등록된 연결이 connection과 같을 때만 제거한다.
  bool Release(const std::string& username, const StreamConnection* connection);
  // 종료 시 모든 연결을 비우고 닫는다. 닫은 연결 수를 돌려준다.
  std::size_t EvictAll();
  std::size_t ActiveCount() const;

 private:
  void EraseLocked(std::unordered_map<std::string, Session>::iterator it);
  void PublishCountLocked() const;

  std::unordered_map<std::string, Session> sessions_;
  std::unordered_map<std::string, std::string> session_index_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace broker
