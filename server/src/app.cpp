/*
 * 설명: 서버 수명주기와 리스닝, 초기 시드, 점수 시뮬레이터 구동을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_http_test.cpp
 */
#include "rankboard/app.hpp"

#include <algorithm>
#include <csignal>
#include <random>

#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "rankboard/http_session.hpp"
#include "rankboard/seeder.hpp"

namespace rankboard {

namespace {
std::uint64_t ResolveSeed(std::uint64_t configured) {
  if (configured != 0) {
    return configured;
  }
  std::random_device device;
  return (static_cast<std::uint64_t>(device()) << 32) ^ device();
}
}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<Leaderboard> leaderboard, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), leaderboard_(std::move(leaderboard)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->leaderboard_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<Leaderboard> leaderboard_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level).value_or(LogLevel::kInfo));
  leaderboard_ = std::make_shared<Leaderboard>();
  leaderboard_->SetObservability(observability_);
  simulator_ = std::make_shared<ScoreUpdateSimulator>(ioc_, leaderboard_, observability_,
                                                      config.score_updates_per_second, config.score_delta_max,
                                                      ResolveSeed(config.random_seed) + 1);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    std::mt19937_64 rng(ResolveSeed(config_.random_seed));
    SeedCompetitors(*leaderboard_, config_.seed_competitors, rng, observability_);

    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, leaderboard_, observability_);
    listener_->Run();
    simulator_->Start();
    signals_ = std::make_unique<boost::asio::signal_set>(ioc_, SIGINT, SIGTERM);
    signals_->async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->LogEvent(LogLevel::kInfo, "server.signal", {{"signal", signal_number}});
      simulator_->Stop();
      listener_->Stop();
      work_guard_.reset();
      ioc_.stop();
    });
    observability_->LogEvent(LogLevel::kInfo, "server.started",
                             {{"port", config_.port}, {"competitors", leaderboard_->TotalCount()}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->LogEvent(LogLevel::kError, "server.failed", {{"message", ex.what()}});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = config_.worker_threads > 0
                                        ? static_cast<unsigned int>(config_.worker_threads)
                                        : std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  simulator_->Stop();
  if (signals_) {
    boost::system::error_code ec;
    signals_->cancel(ec);
  }
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  observability_->LogEvent(LogLevel::kInfo, "server.stopped");
}

}  // namespace rankboard
