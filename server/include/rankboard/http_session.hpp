/*
 * 설명: HTTP 연결을 처리하고 리더보드/검색/통계 엔드포인트와 CORS 응답을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_http_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "rankboard/config.hpp"
#include "rankboard/leaderboard.hpp"
#include "rankboard/observability.hpp"

namespace rankboard {

using QueryParams = std::unordered_map<std::string, std::string>;

std::string UrlDecode(const std::string& value);
QueryParams ParseQueryParams(const std::string& query);
std::optional<long long> ParseLeadingInt(const std::string& value);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, std::shared_ptr<Leaderboard> leaderboard,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleLeaderboard(const QueryParams& params, Response& res);
  void HandleSearch(const QueryParams& params, Response& res);
  void HandleStats(Response& res);
  void HandleMetrics(Response& res);
  void HandleRoot(Response& res);
  void SetJsonBody(Response& res, boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<Leaderboard> leaderboard_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace rankboard
