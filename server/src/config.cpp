/*
 * 설명: 환경변수에서 서버 설정을 읽고 숫자 형식을 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "rankboard/config.hpp"

#include <cstdlib>
#include <limits>

#include "rankboard/observability.hpp"

namespace rankboard {
namespace {
unsigned long long ParseUnsigned(const char* key, const std::string& value, unsigned long long max) {
  std::size_t idx = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &idx);
  } catch (const std::exception&) {
    throw ConfigError(std::string(key) + " 값이 숫자가 아닙니다: " + value);
  }
  if (idx != value.size() || value.front() == '-' || parsed > max) {
    throw ConfigError(std::string(key) + " 값이 허용 범위를 벗어났습니다: " + value);
  }
  return parsed;
}
}  // namespace

AppConfig DefaultConfig() {
  AppConfig cfg;
  cfg.port = 8080;
  cfg.log_level = "info";
  cfg.worker_threads = 0;
  cfg.seed_competitors = 1000;
  cfg.score_updates_per_second = 10;
  cfg.score_delta_max = 50;
  cfg.cors_allow_origin = "*";
  cfg.random_seed = 0;
  return cfg;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const std::string& def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : def;
  };

  AppConfig cfg = DefaultConfig();
  cfg.port = static_cast<unsigned short>(
      ParseUnsigned("SERVER_PORT", get_env("SERVER_PORT", "8080"), std::numeric_limits<unsigned short>::max()));
  cfg.log_level = get_env("LOG_LEVEL", cfg.log_level);
  if (!ParseLogLevel(cfg.log_level)) {
    throw ConfigError("LOG_LEVEL 값이 올바르지 않습니다: " + cfg.log_level);
  }
  cfg.worker_threads = static_cast<std::size_t>(ParseUnsigned("WORKER_THREADS", get_env("WORKER_THREADS", "0"), 1024));
  cfg.seed_competitors = static_cast<std::size_t>(
      ParseUnsigned("SEED_COMPETITORS", get_env("SEED_COMPETITORS", "1000"), 10'000'000));
  cfg.score_updates_per_second = static_cast<std::size_t>(
      ParseUnsigned("SCORE_UPDATES_PER_SECOND", get_env("SCORE_UPDATES_PER_SECOND", "10"), 1'000'000));
  cfg.score_delta_max =
      static_cast<int>(ParseUnsigned("SCORE_DELTA_MAX", get_env("SCORE_DELTA_MAX", "50"), 10'000));
  cfg.cors_allow_origin = get_env("CORS_ALLOW_ORIGIN", cfg.cors_allow_origin);
  cfg.random_seed = static_cast<std::uint64_t>(ParseUnsigned(
      "RANDOM_SEED", get_env("RANDOM_SEED", "0"), std::numeric_limits<unsigned long long>::max()));
  return cfg;
}

}  // namespace rankboard
