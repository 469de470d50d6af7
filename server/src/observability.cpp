/*
 * 설명: 요청 로그/이벤트 로그를 JSON 한 줄로 출력하고 카운터를 집계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "rankboard/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace rankboard {

std::optional<LogLevel> ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "warn") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementScoreUpdate() { score_updates_.fetch_add(1); }

void Observability::IncrementScoreUpdateRejected() { score_updates_rejected_.fetch_add(1); }

void Observability::IncrementRecompute() { recompute_total_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.score_updates = score_updates_.load();
  snapshot.score_updates_rejected = score_updates_rejected_.load();
  snapshot.recompute_total = recompute_total_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(LogLevel::kInfo)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ToString(LogLevel::kInfo);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["status"] = ctx.status;
  log_json["latencyMs"] = ctx.latency_ms;
  std::cout << log_json.dump() << std::endl;
}

void Observability::LogEvent(LogLevel level, std::string_view name, const nlohmann::json& fields) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json::object();
  log_json["level"] = ToString(level);
  log_json["eventName"] = name;
  auto& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << log_json.dump() << std::endl;
}

}  // namespace rankboard
