/*
 * 설명: strand 위에서 타이머 틱마다 무작위 경쟁자 점수에 [-delta, +delta] 변화를 적용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/score_simulator_test.cpp
 */
#include "rankboard/score_simulator.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

namespace rankboard {
namespace {
constexpr std::uint64_t kProgressInterval = 100;
}  // namespace

ScoreUpdateSimulator::ScoreUpdateSimulator(boost::asio::io_context& ioc, std::shared_ptr<Leaderboard> leaderboard,
                                           std::shared_ptr<Observability> observability,
                                           std::size_t updates_per_second, int max_delta, std::uint64_t seed)
    : strand_(boost::asio::make_strand(ioc)), timer_(strand_), leaderboard_(std::move(leaderboard)),
      observability_(std::move(observability)), max_delta_(max_delta < 0 ? -max_delta : max_delta), rng_(seed) {
  if (updates_per_second > 0) {
    interval_ = std::chrono::nanoseconds(1'000'000'000LL / static_cast<long long>(updates_per_second));
  }
}

void ScoreUpdateSimulator::Start() {
  if (interval_.count() == 0 || running_.exchange(true)) {
    return;
  }
  if (observability_) {
    observability_->LogEvent(LogLevel::kInfo, "simulator.started",
                             {{"intervalNs", interval_.count()}, {"maxDelta", max_delta_}});
  }
  boost::asio::post(strand_, [self = shared_from_this()]() { self->ScheduleTick(); });
}

void ScoreUpdateSimulator::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  boost::asio::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
}

bool ScoreUpdateSimulator::TickOnce() {
  auto total = leaderboard_->TotalCount();
  if (total == 0) {
    return false;
  }
  std::uniform_int_distribution<std::size_t> pick(0, total - 1);
  auto handle = leaderboard_->HandleAt(pick(rng_));
  if (!handle) {
    return false;
  }
  auto current = leaderboard_->ScoreOf(*handle);
  if (!current) {
    return false;
  }
  std::uniform_int_distribution<int> delta(-max_delta_, max_delta_);
  if (!leaderboard_->UpdateScore(*handle, *current + delta(rng_))) {
    return false;
  }

  auto count = update_count_.fetch_add(1) + 1;
  if (observability_ && count % kProgressInterval == 0) {
    observability_->LogEvent(LogLevel::kInfo, "simulator.progress", {{"updates", count}});
  }
  return true;
}

void ScoreUpdateSimulator::ScheduleTick() {
  if (!running_) {
    return;
  }
  timer_.expires_after(interval_);
  timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code& ec) { self->OnTick(ec); }));
}

void ScoreUpdateSimulator::OnTick(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  TickOnce();
  ScheduleTick();
}

}  // namespace rankboard
