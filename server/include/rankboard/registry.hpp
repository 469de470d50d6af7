/*
 * 설명: 경쟁자 레코드를 단독 소유하고 핸들/대소문자 무시 핸들로 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rankboard {

constexpr int kMinScore = 100;
constexpr int kMaxScore = 5000;

struct Competitor {
  std::string handle;
  int score;
  int rank;
};

int ClampScore(int score);
// ASCII A-Z만 소문자로 바꾼다. 나머지 바이트는 유지한다.
std::string FoldCase(std::string_view value);

// 동기화는 호출자(Leaderboard)가 담당한다.
class CompetitorRegistry {
 public:
  std::optional<std::size_t> Create(const std::string& handle, int score, std::string& error_code,
                                    std::string& error_message);
  bool SetScore(const std::string& handle, int score);

  std::size_t Count() const { return records_.size(); }
  std::optional<std::size_t> PositionOf(const std::string& handle) const;
  std::optional<std::string> Resolve(std::string_view any_case_handle) const;

  const Competitor& At(std::size_t position) const { return records_.at(position); }
  Competitor& At(std::size_t position) { return records_.at(position); }

 private:
  std::vector<Competitor> records_;
  std::unordered_map<std::string, std::size_t> positions_;
  std::unordered_map<std::string, std::string> folded_handles_;
};

}  // namespace rankboard
