/*
 * 설명: JSON 오류 엔벨로프와 SSE 프레임을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_response_test.cpp
 */
#include "broker/api_response.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace broker {

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

std::string ToSseFrame(const SseEvent& event) {
  std::string frame;
  if (!event.event.empty()) {
    frame += "event: " + event.event + "\n";
  }
  if (event.id) {
    frame += "id: " + std::to_string(*event.id) + "\n";
  }
  std::size_t pos = 0;
  while (true) {
    auto eol = event.data.find('\n', pos);
    frame += "data: " + event.data.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos) + "\n";
    if (eol == std::string::npos) {
      break;
    }
    pos = eol + 1;
  }
  frame += "\n";
  return frame;
}

std::string ToSseComment(std::string_view comment) {
  std::string frame = ": ";
  frame.append(comment);
  frame += "\n\n";
  return frame;
}

}  // namespace broker
