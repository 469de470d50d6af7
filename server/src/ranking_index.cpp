/*
 * 설명: (점수 내림차순, 핸들 오름차순) 안정 정렬 후 경쟁 순위(1,1,3)를 부여한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ranking_index_test.cpp
 */
#include "rankboard/ranking_index.hpp"

#include <algorithm>

namespace rankboard {

void RankingIndex::Append(std::size_t position) {
  order_.push_back(position);
  MarkDirty();
}

bool RankingIndex::Recompute(CompetitorRegistry& registry) {
  if (state_ == IndexState::kClean) {
    return false;
  }

  std::stable_sort(order_.begin(), order_.end(), [&registry](std::size_t lhs, std::size_t rhs) {
    const auto& a = registry.At(lhs);
    const auto& b = registry.At(rhs);
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.handle < b.handle;
  });

  first_rank_by_score_.clear();
  int current_rank = 1;
  for (std::size_t i = 0; i < order_.size(); ++i) {
    auto& competitor = registry.At(order_[i]);
    if (i > 0 && registry.At(order_[i - 1]).score != competitor.score) {
      current_rank = static_cast<int>(i) + 1;
    }
    competitor.rank = current_rank;
    first_rank_by_score_.emplace(competitor.score, current_rank);
  }

  state_ = IndexState::kClean;
  return true;
}

std::optional<int> RankingIndex::RankForScore(int score) const {
  auto it = first_rank_by_score_.find(score);
  if (it == first_rank_by_score_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace rankboard
