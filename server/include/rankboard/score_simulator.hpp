/*
 * 설명: 주기 타이머로 임의 경쟁자의 점수를 제한된 변화량만큼 갱신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/score_simulator_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "rankboard/leaderboard.hpp"
#include "rankboard/observability.hpp"

namespace rankboard {

class ScoreUpdateSimulator : public std::enable_shared_from_this<ScoreUpdateSimulator> {
 public:
  ScoreUpdateSimulator(boost::asio::io_context& ioc, std::shared_ptr<Leaderboard> leaderboard,
                       std::shared_ptr<Observability> observability, std::size_t updates_per_second, int max_delta,
                       std::uint64_t seed);

  void Start();
  void Stop();
  // 타이머 없이 한 번 갱신한다. 적용되면 true.
  bool TickOnce();

  std::uint64_t UpdateCount() const { return update_count_.load(); }
  bool Running() const { return running_.load(); }

 private:
  void ScheduleTick();
  void OnTick(const boost::system::error_code& ec);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  std::shared_ptr<Leaderboard> leaderboard_;
  std::shared_ptr<Observability> observability_;
  std::chrono::nanoseconds interval_{0};
  int max_delta_;
  std::mt19937_64 rng_;
  std::atomic<std::uint64_t> update_count_{0};
  std::atomic<bool> running_{false};
};

}  // namespace rankboard
