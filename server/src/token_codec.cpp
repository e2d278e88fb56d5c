/*
 * 설명: 토큰 문자열을 세 필드로 분해하고 다시 조립한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_codec_test.cpp
 */
#include "broker/token_codec.hpp"

namespace broker {

bool IsValidUsername(std::string_view username) {
  return !username.empty() && username.find(':') == std::string_view::npos;
}

std::string EncodeToken(std::string_view username, std::string_view suffix) {
  if (!IsValidUsername(username)) {
    throw TokenFormatError(BrokerError::kInvalidUsername, std::string(ErrorMessage(BrokerError::kInvalidUsername)));
  }
  if (suffix.empty() || suffix.find(':') != std::string_view::npos) {
    throw TokenFormatError(BrokerError::kMalformedToken, "suffix는 비어 있거나 ':'를 포함할 수 없습니다");
  }
  std::string token;
  token.reserve(kTokenScheme.size() + username.size() + suffix.size() + 2);
  token.append(kTokenScheme);
  token.push_back(':');
  token.append(username);
  token.push_back(':');
  token.append(suffix);
  return token;
}

std::optional<Token> TryDecodeToken(std::string_view token) {
  auto first = token.find(':');
  if (first == std::string_view::npos) {
    return std::nullopt;
  }
  auto second = token.find(':', first + 1);
  if (second == std::string_view::npos) {
    return std::nullopt;
  }
  if (token.find(':', second + 1) != std::string_view::npos) {
    return std::nullopt;
  }
  auto scheme = token.substr(0, first);
  auto username = token.substr(first + 1, second - first - 1);
  auto suffix = token.substr(second + 1);
  if (scheme != kTokenScheme || username.empty() || suffix.empty()) {
    return std::nullopt;
  }
  return Token{std::string(scheme), std::string(username), std::string(suffix)};
}

Token DecodeToken(std::string_view token) {
  auto decoded = TryDecodeToken(token);
  if (!decoded) {
    throw TokenFormatError(BrokerError::kMalformedToken, std::string(ErrorMessage(BrokerError::kMalformedToken)));
  }
  return *decoded;
}

}  // namespace broker
