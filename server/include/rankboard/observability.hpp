/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace rankboard {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view value);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  unsigned status{0};
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t score_updates{0};
  std::uint64_t score_updates_rejected{0};
  std::uint64_t recompute_total{0};
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo) : level_(level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementScoreUpdate();
  void IncrementScoreUpdateRejected();
  void IncrementRecompute();
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= level_; }
  void Log(const LogContext& ctx) const;
  void LogEvent(LogLevel level, std::string_view name, const nlohmann::json& fields = nlohmann::json::object()) const;

 private:
  LogLevel level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> score_updates_{0};
  std::atomic<std::uint64_t> score_updates_rejected_{0};
  std::atomic<std::uint64_t> recompute_total_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace rankboard
