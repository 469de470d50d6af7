/*
 * 설명: HTTP 요청을 파싱해 리더보드/검색/통계 /메트릭 핸들러로 분기하고 CORS 헤더를 붙인다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_http_test.cpp
 */
#include "rankboard/http_session.hpp"

#include <cerrno>
#include <cstdlib>

#include <boost/beast/version.hpp>

#include "rankboard/api_response.hpp"

namespace rankboard {

namespace {
constexpr std::size_t kDefaultPage = 1;
constexpr std::size_t kDefaultPageSize = 50;
constexpr std::size_t kMaxPageSize = 100;

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string NormalizePath(const std::string& path) {
  const std::string prefix = "/api";
  if (path == prefix) {
    return "/";
  }
  if (path.compare(0, prefix.size() + 1, prefix + "/") == 0) {
    return path.substr(prefix.size());
  }
  return path;
}
}  // namespace

std::string UrlDecode(const std::string& value) {
  std::string decoded;
  decoded.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      decoded.push_back(' ');
      continue;
    }
    if (c == '%' && i + 2 < value.size()) {
      int hi = HexValue(value[i + 1]);
      int lo = HexValue(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        decoded.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    decoded.push_back(c);
  }
  return decoded;
}

QueryParams ParseQueryParams(const std::string& query) {
  QueryParams params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(UrlDecode(pair.substr(0, eq)), UrlDecode(pair.substr(eq + 1)));
    } else if (!pair.empty()) {
      params.emplace(UrlDecode(pair), std::string{});
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<long long> ParseLeadingInt(const std::string& value) {
  const char* begin = value.c_str();
  char* end = nullptr;
  errno = 0;
  long long parsed = std::strtoll(begin, &end, 10);
  if (end == begin || errno == ERANGE) {
    return std::nullopt;
  }
  return parsed;
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<Leaderboard> leaderboard, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), leaderboard_(std::move(leaderboard)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->keep_alive(false);
  res->set(http::field::server, "rankboard");
  res->set(http::field::access_control_allow_origin, config_.cors_allow_origin);
  res->set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
  res->set(http::field::access_control_allow_headers, "Origin, Content-Type, Accept");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }
  path = NormalizePath(path);

  if (req_.method() == http::verb::options) {
    res->result(http::status::no_content);
    res->content_length(0);
    return SendResponse(res);
  }

  bool known_path = path == "/" || path == "/leaderboard" || path == "/search" || path == "/stats" ||
                    path == "/metrics";
  if (!known_path) {
    SetJsonBody(*res, http::status::not_found, MakeErrorBody("not found"));
    return SendResponse(res);
  }
  if (req_.method() != http::verb::get) {
    SetJsonBody(*res, http::status::method_not_allowed, MakeErrorBody("method not allowed"));
    return SendResponse(res);
  }

  auto params = ParseQueryParams(query);
  if (path == "/leaderboard") {
    HandleLeaderboard(params, *res);
  } else if (path == "/search") {
    HandleSearch(params, *res);
  } else if (path == "/stats") {
    HandleStats(*res);
  } else if (path == "/metrics") {
    HandleMetrics(*res);
  } else {
    HandleRoot(*res);
  }
  SendResponse(res);
}

void HttpSession::HandleLeaderboard(const QueryParams& params, Response& res) {
  std::size_t page = kDefaultPage;
  std::size_t page_size = kDefaultPageSize;

  auto page_it = params.find("page");
  if (page_it != params.end()) {
    auto parsed = ParseLeadingInt(page_it->second);
    if (parsed) {
      page = *parsed < 1 ? 1 : static_cast<std::size_t>(*parsed);
    }
  }
  auto size_it = params.find("pageSize");
  if (size_it != params.end()) {
    auto parsed = ParseLeadingInt(size_it->second);
    if (parsed && *parsed >= 1 && *parsed <= static_cast<long long>(kMaxPageSize)) {
      page_size = static_cast<std::size_t>(*parsed);
    }
  }

  auto users = leaderboard_->GetPage(page, page_size);
  auto total = leaderboard_->TotalCount();
  SetJsonBody(res, boost::beast::http::status::ok, MakeLeaderboardBody(users, page, page_size, total));
}

void HttpSession::HandleSearch(const QueryParams& params, Response& res) {
  auto it = params.find("q");
  if (it == params.end() || it->second.empty()) {
    SetJsonBody(res, boost::beast::http::status::bad_request, MakeErrorBody("query parameter 'q' is required"));
    return;
  }
  SetJsonBody(res, boost::beast::http::status::ok, MakeSearchBody(leaderboard_->Search(it->second)));
}

void HttpSession::HandleStats(Response& res) {
  SetJsonBody(res, boost::beast::http::status::ok, MakeStatsBody(leaderboard_->TotalCount()));
}

void HttpSession::HandleMetrics(Response& res) {
  MetricsSnapshot snapshot = observability_ ? observability_->Snapshot() : MetricsSnapshot{};
  SetJsonBody(res, boost::beast::http::status::ok, MakeMetricsBody(snapshot));
}

void HttpSession::HandleRoot(Response& res) {
  nlohmann::json body{{"status", "running"},
                      {"message", "Leaderboard API is live!"},
                      {"users", leaderboard_->TotalCount()}};
  SetJsonBody(res, boost::beast::http::status::ok, body);
}

void HttpSession::SetJsonBody(Response& res, boost::beast::http::status status, const nlohmann::json& body) {
  res.result(status);
  res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res.body() = body.dump();
  res.content_length(res.body().size());
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{trace_id_, std::string(req_.target()), res->result_int(), static_cast<long>(latency)});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace rankboard
