/*
 * 설명: 레지스트리 레코드 위치에 대한 정렬 뷰와 동점 처리 순위 재계산을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ranking_index_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "rankboard/registry.hpp"

namespace rankboard {

enum class IndexState { kClean, kDirty };

class RankingIndex {
 public:
  void Append(std::size_t position);
  void MarkDirty() { state_ = IndexState::kDirty; }
  bool IsDirty() const { return state_ == IndexState::kDirty; }
  IndexState State() const { return state_; }

  // 깨끗한 상태면 아무것도 하지 않는다. 수행했으면 true.
  bool Recompute(CompetitorRegistry& registry);

  std::optional<int> RankForScore(int score) const;
  const std::vector<std::size_t>& Ordered() const { return order_; }

 private:
  std::vector<std::size_t> order_;
  std::unordered_map<int, int> first_rank_by_score_;
  IndexState state_{IndexState::kDirty};
};

}  // namespace rankboard
