/*
 * 설명: REST 오류 엔벨로프와 SSE 프레임 직렬화를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_response_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace broker {

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

std::string ToIsoString(std::chrono::system_clock::time_point tp);

struct SseEvent {
  std::string event;
  // 이미 직렬화된 본문. 줄마다 data: 필드 하나가 된다.
  std::string data;
  std::optional<std::uint64_t> id;
};

// "event: <name>\nid: <n>\ndata: <line>\n...\n"
std::string ToSseFrame(const SseEvent& event);
std::string ToSseComment(std::string_view comment);

}  // namespace broker
