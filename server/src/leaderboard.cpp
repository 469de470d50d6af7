/*
 * 설명: 배타 잠금으로 변경/재계산을, 공유 잠금으로 스냅샷 복사를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_query_test.cpp, server/tests/unit/leaderboard_concurrency_test.cpp
 */
#include "rankboard/leaderboard.hpp"

#include <algorithm>

namespace rankboard {

bool Leaderboard::AddCompetitor(const std::string& handle, int score, std::string& error_code,
                                std::string& error_message) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto position = registry_.Create(handle, score, error_code, error_message);
  if (!position) {
    return false;
  }
  index_.Append(*position);
  return true;
}

bool Leaderboard::UpdateScore(const std::string& handle, int score) {
  bool updated = false;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    updated = registry_.SetScore(handle, score);
    if (updated) {
      index_.MarkDirty();
    }
  }
  if (observability_) {
    if (updated) {
      observability_->IncrementScoreUpdate();
    } else {
      observability_->IncrementScoreUpdateRejected();
    }
  }
  return updated;
}

void Leaderboard::RecomputeIfDirty() {
  bool recomputed = false;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    recomputed = index_.Recompute(registry_);
  }
  if (recomputed && observability_) {
    observability_->IncrementRecompute();
  }
}

std::vector<Competitor> Leaderboard::GetPage(std::size_t page, std::size_t page_size) {
  return ReadRanked([&]() {
    std::vector<Competitor> result;
    const auto& order = index_.Ordered();
    if (page == 0 || page_size == 0 || page - 1 > order.size() / page_size) {
      return result;
    }
    std::size_t start = (page - 1) * page_size;
    if (start >= order.size()) {
      return result;
    }
    std::size_t end = std::min(start + page_size, order.size());
    result.reserve(end - start);
    for (std::size_t i = start; i < end; ++i) {
      result.push_back(registry_.At(order[i]));
    }
    return result;
  });
}

std::vector<Competitor> Leaderboard::Search(std::string_view term) {
  auto folded_term = FoldCase(term);
  return ReadRanked([&]() {
    std::vector<Competitor> result;
    for (auto position : index_.Ordered()) {
      const auto& competitor = registry_.At(position);
      if (FoldCase(competitor.handle).find(folded_term) != std::string::npos) {
        result.push_back(competitor);
      }
    }
    return result;
  });
}

std::size_t Leaderboard::TotalCount() {
  return ReadRanked([&]() { return registry_.Count(); });
}

std::optional<Competitor> Leaderboard::Find(const std::string& handle) {
  return ReadRanked([&]() -> std::optional<Competitor> {
    auto position = registry_.PositionOf(handle);
    if (!position) {
      return std::nullopt;
    }
    return registry_.At(*position);
  });
}

std::optional<std::string> Leaderboard::Resolve(std::string_view any_case_handle) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return registry_.Resolve(any_case_handle);
}

std::optional<int> Leaderboard::RankForScore(int score) {
  return ReadRanked([&]() { return index_.RankForScore(score); });
}

std::optional<std::string> Leaderboard::HandleAt(std::size_t position) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (position >= registry_.Count()) {
    return std::nullopt;
  }
  return registry_.At(position).handle;
}

std::optional<int> Leaderboard::ScoreOf(const std::string& handle) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto position = registry_.PositionOf(handle);
  if (!position) {
    return std::nullopt;
  }
  return registry_.At(*position).score;
}

IndexState Leaderboard::State() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return index_.State();
}

}  // namespace rankboard
