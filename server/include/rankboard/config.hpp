/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/leaderboard_http_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rankboard {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct AppConfig {
  unsigned short port;
  std::string log_level;
  std::size_t worker_threads;
  std::size_t seed_competitors;
  std::size_t score_updates_per_second;
  int score_delta_max;
  std::string cors_allow_origin;
  std::uint64_t random_seed;
};

AppConfig DefaultConfig();
AppConfig LoadConfigFromEnv();

}  // namespace rankboard
