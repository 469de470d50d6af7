/*
 * 설명: 경쟁자 레코드 저장, 점수 클램프, 대소문자 무시 인덱스를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/registry_test.cpp
 */
#include "rankboard/registry.hpp"

#include <algorithm>
#include <cctype>

namespace rankboard {

int ClampScore(int score) { return std::clamp(score, kMinScore, kMaxScore); }

std::string FoldCase(std::string_view value) {
  std::string folded(value);
  std::transform(folded.begin(), folded.end(), folded.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return folded;
}

std::optional<std::size_t> CompetitorRegistry::Create(const std::string& handle, int score, std::string& error_code,
                                                      std::string& error_message) {
  if (handle.empty()) {
    error_code = "invalid_handle";
    error_message = "핸들이 비어 있습니다";
    return std::nullopt;
  }
  auto folded = FoldCase(handle);
  if (positions_.count(handle) > 0 || folded_handles_.count(folded) > 0) {
    error_code = "handle_conflict";
    error_message = "이미 등록된 핸들입니다";
    return std::nullopt;
  }

  std::size_t position = records_.size();
  records_.push_back(Competitor{handle, ClampScore(score), 0});
  positions_.emplace(handle, position);
  folded_handles_.emplace(std::move(folded), handle);
  return position;
}

bool CompetitorRegistry::SetScore(const std::string& handle, int score) {
  auto it = positions_.find(handle);
  if (it == positions_.end()) {
    return false;
  }
  records_[it->second].score = ClampScore(score);
  return true;
}

std::optional<std::size_t> CompetitorRegistry::PositionOf(const std::string& handle) const {
  auto it = positions_.find(handle);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> CompetitorRegistry::Resolve(std::string_view any_case_handle) const {
  auto it = folded_handles_.find(FoldCase(any_case_handle));
  if (it == folded_handles_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace rankboard
