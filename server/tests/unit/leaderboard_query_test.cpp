#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "rankboard/leaderboard.hpp"

namespace {

void Add(rankboard::Leaderboard& board, const std::string& handle, int score) {
  std::string code;
  std::string message;
  ASSERT_TRUE(board.AddCompetitor(handle, score, code, message)) << code;
}

std::vector<std::string> Handles(const std::vector<rankboard::Competitor>& competitors) {
  std::vector<std::string> handles;
  for (const auto& c : competitors) {
    handles.push_back(c.handle);
  }
  return handles;
}

TEST(LeaderboardQueryTest, PaginationBoundaries) {
  rankboard::Leaderboard board;
  for (int i = 0; i < 15; ++i) {
    Add(board, "p" + std::to_string(100 + i), 1000 + i * 10);
  }

  auto first = board.GetPage(1, 10);
  ASSERT_EQ(first.size(), 10u);
  EXPECT_EQ(first.front().handle, "p114");
  EXPECT_EQ(first.front().rank, 1);

  auto second = board.GetPage(2, 10);
  ASSERT_EQ(second.size(), 5u);
  EXPECT_EQ(second.front().rank, 11);
  EXPECT_EQ(second.back().rank, 15);
  EXPECT_EQ(second.back().handle, "p100");

  EXPECT_TRUE(board.GetPage(5, 10).empty());
  EXPECT_TRUE(board.GetPage(static_cast<std::size_t>(-1), 100).empty());
}

TEST(LeaderboardQueryTest, EmptyBoardReturnsEmptyPage) {
  rankboard::Leaderboard board;
  EXPECT_TRUE(board.GetPage(1, 50).empty());
  EXPECT_EQ(board.TotalCount(), 0u);
}

TEST(LeaderboardQueryTest, SearchIsCaseInsensitiveInRankOrder) {
  rankboard::Leaderboard board;
  Add(board, "raj", 1000);
  Add(board, "rajesh", 2000);
  Add(board, "anita", 3000);

  auto results = board.Search("RAJ");
  EXPECT_EQ(Handles(results), (std::vector<std::string>{"rajesh", "raj"}));
  EXPECT_EQ(results[0].rank, 2);
  EXPECT_EQ(results[1].rank, 3);

  EXPECT_TRUE(board.Search("zzz").empty());
  EXPECT_EQ(board.Search("").size(), 3u);
}

TEST(LeaderboardQueryTest, SearchMatchesExampleOrderWhenTied) {
  rankboard::Leaderboard board;
  Add(board, "raj", 1500);
  Add(board, "rajesh", 1500);
  Add(board, "anita", 1500);

  EXPECT_EQ(Handles(board.Search("RAJ")), (std::vector<std::string>{"raj", "rajesh"}));
}

TEST(LeaderboardQueryTest, UpdateOfUnknownHandleIsNotFound) {
  rankboard::Leaderboard board;
  Add(board, "raj", 1500);
  Add(board, "anita", 2500);

  EXPECT_FALSE(board.UpdateScore("ghost", 1000));
  EXPECT_EQ(board.TotalCount(), 2u);
  EXPECT_EQ(board.ScoreOf("raj"), std::optional<int>(1500));
  EXPECT_EQ(board.ScoreOf("anita"), std::optional<int>(2500));
}

TEST(LeaderboardQueryTest, SnapshotsAreCopies) {
  rankboard::Leaderboard board;
  Add(board, "raj", 1500);
  auto page = board.GetPage(1, 10);
  ASSERT_EQ(page.size(), 1u);

  ASSERT_TRUE(board.UpdateScore("raj", 4000));
  EXPECT_EQ(page[0].score, 1500);
  auto found = board.Find("raj");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->score, 4000);
}

TEST(LeaderboardQueryTest, MutationMarksDirtyAndQueryCleans) {
  rankboard::Leaderboard board;
  EXPECT_EQ(board.State(), rankboard::IndexState::kDirty);
  Add(board, "a", 1000);
  board.GetPage(1, 1);
  EXPECT_EQ(board.State(), rankboard::IndexState::kClean);

  ASSERT_TRUE(board.UpdateScore("a", 1200));
  EXPECT_EQ(board.State(), rankboard::IndexState::kDirty);
  board.TotalCount();
  EXPECT_EQ(board.State(), rankboard::IndexState::kClean);

  EXPECT_FALSE(board.UpdateScore("ghost", 1200));
  EXPECT_EQ(board.State(), rankboard::IndexState::kClean);
}

TEST(LeaderboardQueryTest, FindResolveAndRankForScore) {
  rankboard::Leaderboard board;
  Add(board, "Alpha", 5000);
  Add(board, "beta", 5000);
  Add(board, "gamma", 4990);

  auto gamma = board.Find("gamma");
  ASSERT_TRUE(gamma.has_value());
  EXPECT_EQ(gamma->rank, 3);
  EXPECT_FALSE(board.Find("GAMMA").has_value());
  EXPECT_EQ(board.Resolve("ALPHA"), std::optional<std::string>("Alpha"));
  EXPECT_EQ(board.RankForScore(5000), std::optional<int>(1));
  EXPECT_EQ(board.RankForScore(4990), std::optional<int>(3));
  EXPECT_FALSE(board.RankForScore(1234).has_value());
  EXPECT_EQ(board.HandleAt(1), std::optional<std::string>("beta"));
  EXPECT_FALSE(board.HandleAt(3).has_value());
}

TEST(LeaderboardQueryTest, DuplicateAddIsRejected) {
  rankboard::Leaderboard board;
  Add(board, "raj", 1000);
  std::string code;
  std::string message;
  EXPECT_FALSE(board.AddCompetitor("raj", 4000, code, message));
  EXPECT_EQ(code, "handle_conflict");
  EXPECT_EQ(board.TotalCount(), 1u);
  EXPECT_EQ(board.ScoreOf("raj"), std::optional<int>(1000));
}

}  // namespace
