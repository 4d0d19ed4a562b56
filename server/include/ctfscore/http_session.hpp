/*
 * 설명: HTTP 연결을 처리하고 제출/힌트/KOTH/점수/리더보드/운영 엔드포인트를 분기한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/scoring_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "ctfscore/capability.hpp"
#include "ctfscore/config.hpp"
#include "ctfscore/hint_ledger.hpp"
#include "ctfscore/koth_arbiter.hpp"
#include "ctfscore/leaderboard_cache.hpp"
#include "ctfscore/observability.hpp"
#include "ctfscore/score_aggregator.hpp"
#include "ctfscore/submission_validator.hpp"

namespace ctfscore {

// 연결마다 공유하는 코어 서비스 묶음. arbiter는 koth 모듈이 꺼져 있으면 비어 있다.
struct ScoringServices {
  std::shared_ptr<ScoreAggregator> aggregator;
  std::shared_ptr<SubmissionValidator> validator;
  std::shared_ptr<HintLedger> hints;
  std::shared_ptr<KothArbiter> arbiter;
  std::shared_ptr<LeaderboardCache> leaderboard;
  std::shared_ptr<Observability> observability;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, ScoringServices services);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void Route(const std::string& path, Response& res);
  void HandleSubmit(int challenge_id, Response& res);
  void HandleUnlock(int hint_id, Response& res);
  void HandleClaim(int target_id, Response& res);
  void HandleTeamScore(int team_id, Response& res);
  void HandleLeaderboard(Response& res);
  void HandleMetrics(Response& res);
  void HandleReconcile(Response& res);
  void HandleClose(Response& res);
  // 식별 헤더가 없거나 잘못되면 std::nullopt
  std::optional<Principal> ExtractPrincipal();
  int RequireTeam(const Principal& principal);
  bool CheckOpsToken(Response& res);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  ScoringServices services_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<int> team_id_;
};

}  // namespace ctfscore
