#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "rankboard/leaderboard.hpp"
#include "rankboard/observability.hpp"

namespace {

TEST(ObservabilityTest, ParsesLogLevels) {
  EXPECT_EQ(rankboard::ParseLogLevel("debug"), rankboard::LogLevel::kDebug);
  EXPECT_EQ(rankboard::ParseLogLevel("warn"), rankboard::LogLevel::kWarn);
  EXPECT_FALSE(rankboard::ParseLogLevel("verbose").has_value());
  EXPECT_EQ(rankboard::ToString(rankboard::LogLevel::kError), "error");
}

TEST(ObservabilityTest, LevelFiltersEvents) {
  rankboard::Observability observability(rankboard::LogLevel::kWarn);
  EXPECT_FALSE(observability.Enabled(rankboard::LogLevel::kInfo));
  EXPECT_TRUE(observability.Enabled(rankboard::LogLevel::kWarn));
  EXPECT_TRUE(observability.Enabled(rankboard::LogLevel::kError));
}

TEST(ObservabilityTest, TraceIdsAreUnique) {
  rankboard::Observability observability;
  EXPECT_NE(observability.NextTraceId(), observability.NextTraceId());
}

TEST(ObservabilityTest, LeaderboardReportsUpdatesAndRecomputes) {
  auto observability = std::make_shared<rankboard::Observability>(rankboard::LogLevel::kError);
  rankboard::Leaderboard board;
  board.SetObservability(observability);
  std::string code;
  std::string message;
  ASSERT_TRUE(board.AddCompetitor("raj", 1000, code, message));

  board.GetPage(1, 10);
  board.GetPage(1, 10);
  EXPECT_EQ(observability->Snapshot().recompute_total, 1u);

  EXPECT_TRUE(board.UpdateScore("raj", 1100));
  EXPECT_TRUE(board.UpdateScore("raj", 1200));
  EXPECT_FALSE(board.UpdateScore("ghost", 1200));
  board.Search("r");

  auto snapshot = observability->Snapshot();
  EXPECT_EQ(snapshot.score_updates, 2u);
  EXPECT_EQ(snapshot.score_updates_rejected, 1u);
  EXPECT_EQ(snapshot.recompute_total, 2u);
}

}  // namespace
