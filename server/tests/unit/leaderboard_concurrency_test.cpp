#include <atomic>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "rankboard/leaderboard.hpp"

namespace {

constexpr int kCompetitors = 200;

void Populate(rankboard::Leaderboard& board) {
  for (int i = 0; i < kCompetitors; ++i) {
    std::string code;
    std::string message;
    ASSERT_TRUE(board.AddCompetitor("c" + std::to_string(i), 1000 + (i % 20) * 10, code, message));
  }
}

// 순위 필드는 한 번의 재계산에서만 나오므로 스냅샷의 순위 열은 항상 경쟁 순위 형태여야 한다.
void ExpectCompetitionRankShape(const std::vector<rankboard::Competitor>& page, std::size_t offset) {
  for (std::size_t i = 0; i < page.size(); ++i) {
    EXPECT_GE(page[i].score, rankboard::kMinScore);
    EXPECT_LE(page[i].score, rankboard::kMaxScore);
    if (offset == 0 && i == 0) {
      EXPECT_EQ(page[i].rank, 1);
      continue;
    }
    if (i == 0) {
      continue;
    }
    int position_rank = static_cast<int>(offset + i) + 1;
    EXPECT_TRUE(page[i].rank == page[i - 1].rank || page[i].rank == position_rank)
        << "index " << offset + i << " rank " << page[i].rank;
  }
}

TEST(LeaderboardConcurrencyTest, ConcurrentDistinctUpdatesThenReadSeesPostUpdateRanks) {
  rankboard::Leaderboard board;
  Populate(board);
  board.GetPage(1, 1);

  std::vector<std::thread> writers;
  for (int t = 0; t < 8; ++t) {
    writers.emplace_back([&board, t]() {
      for (int i = t; i < kCompetitors; i += 8) {
        board.UpdateScore("c" + std::to_string(i), 5000 - i);
      }
    });
  }
  for (auto& w : writers) {
    w.join();
  }

  auto page = board.GetPage(1, 100);
  ASSERT_EQ(page.size(), 100u);
  for (std::size_t i = 0; i < page.size(); ++i) {
    EXPECT_EQ(page[i].handle, "c" + std::to_string(i));
    EXPECT_EQ(page[i].score, 5000 - static_cast<int>(i));
    EXPECT_EQ(page[i].rank, static_cast<int>(i) + 1);
  }
}

TEST(LeaderboardConcurrencyTest, ReadersNeverObserveTornRanksDuringWrites) {
  rankboard::Leaderboard board;
  Populate(board);

  std::atomic<bool> stop{false};
  std::thread writer([&]() {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> pick(0, kCompetitors - 1);
    std::uniform_int_distribution<int> delta(-50, 50);
    while (!stop.load()) {
      auto handle = "c" + std::to_string(pick(rng));
      auto score = board.ScoreOf(handle);
      ASSERT_TRUE(score.has_value());
      board.UpdateScore(handle, *score + delta(rng));
    }
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&board, r]() {
      for (int i = 0; i < 200; ++i) {
        std::size_t page = static_cast<std::size_t>((i + r) % 4) + 1;
        auto snapshot = board.GetPage(page, 50);
        EXPECT_EQ(snapshot.size(), 50u);
        ExpectCompetitionRankShape(snapshot, (page - 1) * 50);
        auto found = board.Search("c1");
        for (const auto& c : found) {
          EXPECT_NE(c.handle.find("c1"), std::string::npos);
          EXPECT_GE(c.rank, 1);
        }
      }
    });
  }
  for (auto& r : readers) {
    r.join();
  }
  stop.store(true);
  writer.join();

  auto all = board.GetPage(1, kCompetitors);
  ASSERT_EQ(all.size(), static_cast<std::size_t>(kCompetitors));
  ExpectCompetitionRankShape(all, 0);
  for (std::size_t i = 1; i < all.size(); ++i) {
    EXPECT_GE(all[i - 1].score, all[i].score);
  }
}

}  // namespace
