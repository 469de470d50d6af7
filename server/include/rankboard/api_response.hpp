/*
 * 설명: 리더보드/검색/통계 응답 본문을 JSON으로 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_response_test.cpp
 */
#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "rankboard/observability.hpp"
#include "rankboard/registry.hpp"

namespace rankboard {

nlohmann::json ToJson(const Competitor& competitor);
nlohmann::json ToJson(const std::vector<Competitor>& competitors);

nlohmann::json MakeLeaderboardBody(const std::vector<Competitor>& users, std::size_t page, std::size_t page_size,
                                   std::size_t total_users);
nlohmann::json MakeSearchBody(const std::vector<Competitor>& results);
nlohmann::json MakeStatsBody(std::size_t total_users);
nlohmann::json MakeMetricsBody(const MetricsSnapshot& snapshot);
nlohmann::json MakeErrorBody(std::string_view message);

}  // namespace rankboard
