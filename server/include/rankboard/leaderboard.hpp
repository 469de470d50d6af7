/*
 * 설명: 레지스트리와 순위 인덱스를 묶어 동시성 규칙 아래 변경/조회 연산을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_query_test.cpp, server/tests/unit/leaderboard_concurrency_test.cpp,
 *         server/tests/e2e/leaderboard_http_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "rankboard/observability.hpp"
#include "rankboard/ranking_index.hpp"
#include "rankboard/registry.hpp"

namespace rankboard {

class Leaderboard {
 public:
  // 재계산 후 스냅샷 복사 사이에 다시 더러워지면 이 횟수까지 재계산을 반복한다.
  static constexpr int kMaxRecomputePasses = 3;

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  bool AddCompetitor(const std::string& handle, int score, std::string& error_code, std::string& error_message);
  bool UpdateScore(const std::string& handle, int score);

  std::vector<Competitor> GetPage(std::size_t page, std::size_t page_size);
  std::vector<Competitor> Search(std::string_view term);
  std::size_t TotalCount();

  std::optional<Competitor> Find(const std::string& handle);
  std::optional<std::string> Resolve(std::string_view any_case_handle) const;
  std::optional<int> RankForScore(int score);
  std::optional<std::string> HandleAt(std::size_t position) const;
  std::optional<int> ScoreOf(const std::string& handle) const;

  IndexState State() const;

 private:
  void RecomputeIfDirty();

  template <typename Reader>
  auto ReadRanked(Reader&& reader) {
    for (int pass = 1;; ++pass) {
      RecomputeIfDirty();
      std::shared_lock<std::shared_mutex> lock(mutex_);
      if (!index_.IsDirty() || pass >= kMaxRecomputePasses) {
        return reader();
      }
    }
  }

  CompetitorRegistry registry_;
  RankingIndex index_;
  mutable std::shared_mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace rankboard
