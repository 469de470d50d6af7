/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_http_test.cpp
 */
#include <iostream>

#include "rankboard/app.hpp"

int main() {
  using namespace rankboard;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const ConfigError& ex) {
    std::cerr << "설정 오류: " << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);
  app.Run();
  return 0;
}
