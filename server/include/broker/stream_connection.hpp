/*
 * 설명: 레지스트리와 라우터가 다루는 서버 푸시 스트림 핸들 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace broker {

class StreamConnection {
 public:
  virtual ~StreamConnection() = default;

  virtual const std::string& SessionId() const = 0;
  // 스레드 안전해야 한다. 이미 닫힌 핸들이면 false를 돌려주고 아무것도 보내지 않는다.
  virtual bool Deliver(const std::string& event, const nlohmann::json& payload) = 0;
  // 멱등. 여러 번 불러도 한 번만 닫힌다.
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;
};

}  // namespace broker
