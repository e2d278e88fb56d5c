/*
 * 설명: 브로커 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#include <exception>
#include <iostream>

#include "broker/app.hpp"

int main() {
  using namespace broker;
  try {
    AppConfig config = LoadConfigFromEnv();
    BrokerApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "브로커 시작 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
