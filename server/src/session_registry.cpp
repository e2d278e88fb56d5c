/*
 * 설명: 사용자별 스트림 연결을 등록/조회/퇴출하고 활성 연결 수를 게시한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#include "broker/session_registry.hpp"

#include <vector>

namespace broker {

void SessionRegistry::Register(const std::string& username, const std::shared_ptr<StreamConnection>& connection) {
  std::shared_ptr<StreamConnection> replaced;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(username);
    if (it != sessions_.end()) {
      replaced = it->second.connection;
      EraseLocked(it);
    }
    Session session{username, connection->SessionId(), connection, std::chrono::system_clock::now()};
    session_index_[session.session_id] = username;
    sessions_.emplace(username, std::move(session));
    PublishCountLocked();
  }
  if (replaced && replaced != connection) {
    if (observability_) {
      LogContext ctx;
      ctx.name = "session.replace";
      ctx.username = username;
      ctx.session_id = replaced->SessionId();
      ctx.detail = {{"replacedBy", connection->SessionId()}};
      observability_->Log(ctx);
    }
    replaced->Close();
  }
}

std::optional<Session> SessionRegistry::Lookup(const std::string& username) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(username);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Session> SessionRegistry::LookupBySessionId(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto idx = session_index_.find(session_id);
  if (idx == session_index_.end()) {
    return std::nullopt;
  }
  auto it = sessions_.find(idx->second);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool SessionRegistry::Evict(const std::string& username) {
  std::shared_ptr<StreamConnection> evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(username);
    if (it == sessions_.end()) {
      return false;
    }
    evicted = it->second.connection;
    EraseLocked(it);
    PublishCountLocked();
  }
  evicted->Close();
  return true;
}

bool SessionRegistry::Release(const std::string& username, const StreamConnection* connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(username);
  if (it == sessions_.end() || it->second.connection.get() != connection) {
    return false;
  }
  EraseLocked(it);
  PublishCountLocked();
  return true;
}

std::size_t SessionRegistry::EvictAll() {
  std::vector<std::shared_ptr<StreamConnection>> evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    evicted.reserve(sessions_.size());
    for (auto& [username, session] : sessions_) {
      evicted.push_back(session.connection);
    }
    sessions_.clear();
    session_index_.clear();
    PublishCountLocked();
  }
  for (auto& connection : evicted) {
    connection->Close();
  }
  return evicted.size();
}

std::size_t SessionRegistry::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

void SessionRegistry::EraseLocked(std::unordered_map<std::string, Session>::iterator it) {
  session_index_.erase(it->second.session_id);
  sessions_.erase(it);
}

void SessionRegistry::PublishCountLocked() const {
  if (observability_) {
    observability_->SetStreamsActive(sessions_.size());
  }
}

}  // namespace broker
