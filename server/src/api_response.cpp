/*
 * 설명: 경쟁자 스냅샷을 username/rating/rank 필드의 JSON 응답 본문으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_response_test.cpp
 */
#include "rankboard/api_response.hpp"

namespace rankboard {

nlohmann::json ToJson(const Competitor& competitor) {
  return {{"username", competitor.handle}, {"rating", competitor.score}, {"rank", competitor.rank}};
}

nlohmann::json ToJson(const std::vector<Competitor>& competitors) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& competitor : competitors) {
    list.push_back(ToJson(competitor));
  }
  return list;
}

nlohmann::json MakeLeaderboardBody(const std::vector<Competitor>& users, std::size_t page, std::size_t page_size,
                                   std::size_t total_users) {
  nlohmann::json body;
  body["users"] = ToJson(users);
  body["page"] = page;
  body["pageSize"] = page_size;
  body["totalUsers"] = total_users;
  return body;
}

nlohmann::json MakeSearchBody(const std::vector<Competitor>& results) {
  nlohmann::json body;
  body["results"] = ToJson(results);
  body["count"] = results.size();
  return body;
}

nlohmann::json MakeStatsBody(std::size_t total_users) {
  return {{"totalUsers", total_users}, {"status", "healthy"}};
}

nlohmann::json MakeMetricsBody(const MetricsSnapshot& snapshot) {
  return {{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
          {"scoreUpdates", {{"applied", snapshot.score_updates}, {"rejected", snapshot.score_updates_rejected}}},
          {"recompute", {{"total", snapshot.recompute_total}}}};
}

nlohmann::json MakeErrorBody(std::string_view message) {
  nlohmann::json body;
  body["error"] = message;
  return body;
}

}  // namespace rankboard
