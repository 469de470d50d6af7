/*
 * 설명: 이름 목록 조합으로 <이름>_<성><번호> 핸들을 만들고 [100, 5000] 점수로 등록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/seeder_test.cpp
 */
#include "rankboard/seeder.hpp"

#include <array>
#include <string>

namespace rankboard {
namespace {
constexpr std::array<const char*, 30> kFirstNames{
    "rahul", "priya", "amit",  "sneha", "vikram",    "anjali", "rohan", "pooja", "arjun", "neha",
    "karan", "divya", "raj",   "shreya", "aditya",   "kavya",  "siddharth", "riya", "varun", "meera",
    "akash", "tanvi", "dev",   "ishita", "aman",     "nisha",  "harsh", "ananya", "kunal", "sanya"};

constexpr std::array<const char*, 30> kLastNames{
    "kumar",  "sharma",  "patel",    "singh",   "verma",   "gupta",  "reddy",    "mehta",  "joshi",  "nair",
    "burman", "mathur",  "kapoor",   "mishra",  "iyer",    "desai",  "bhat",     "menon",  "rao",    "krishnan",
    "agarwal", "malhotra", "chopra", "sinha",   "pandey",  "chauhan", "ghosh",   "banerjee", "saxena", "trivedi"};

constexpr std::size_t kProgressInterval = 1000;
}  // namespace

std::size_t SeedCompetitors(Leaderboard& leaderboard, std::size_t count, std::mt19937_64& rng,
                            const std::shared_ptr<Observability>& observability) {
  std::uniform_int_distribution<std::size_t> first_dist(0, kFirstNames.size() - 1);
  std::uniform_int_distribution<std::size_t> last_dist(0, kLastNames.size() - 1);
  std::uniform_int_distribution<int> score_dist(kMinScore, kMaxScore);

  if (observability) {
    observability->LogEvent(LogLevel::kInfo, "seed.started", {{"count", count}});
  }

  std::size_t created = 0;
  for (std::size_t i = 0; i < count; ++i) {
    std::string handle = std::string(kFirstNames[first_dist(rng)]) + "_" + kLastNames[last_dist(rng)] +
                         std::to_string(i);
    std::string error_code;
    std::string error_message;
    if (leaderboard.AddCompetitor(handle, score_dist(rng), error_code, error_message)) {
      ++created;
    } else if (observability) {
      observability->LogEvent(LogLevel::kWarn, "seed.rejected",
                              {{"handle", handle}, {"code", error_code}, {"message", error_message}});
    }
    if (observability && (i + 1) % kProgressInterval == 0) {
      observability->LogEvent(LogLevel::kInfo, "seed.progress", {{"seeded", i + 1}});
    }
  }

  if (observability) {
    observability->LogEvent(LogLevel::kInfo, "seed.completed", {{"created", created}});
  }
  return created;
}

}  // namespace rankboard
