/*
 * 설명: HTTP 요청을 처리하고 코어 연산 호출 전 식별 헤더와 권한을 검사한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/scoring_flow_test.cpp
 */
#include "ctfscore/http_session.hpp"

#include <boost/beast/version.hpp>

#include "ctfscore/api_response.hpp"
#include "ctfscore/errors.hpp"

namespace ctfscore {

namespace {

namespace http = boost::beast::http;

std::optional<int> ParseId(const std::string& value) {
  if (value.empty() || value.size() > 9) {
    return std::nullopt;
  }
  for (char c : value) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }
  return std::stoi(value);
}

// "/api/challenges/12/submit" 형태에서 prefix와 suffix 사이의 숫자 id를 꺼낸다.
std::optional<int> MatchIdRoute(const std::string& path, const std::string& prefix, const std::string& suffix) {
  if (path.size() <= prefix.size() + suffix.size()) {
    return std::nullopt;
  }
  if (path.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  if (path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0) {
    return std::nullopt;
  }
  return ParseId(path.substr(prefix.size(), path.size() - prefix.size() - suffix.size()));
}

http::status StatusFor(const std::string& code) {
  if (code == "not_found") {
    return http::status::not_found;
  }
  if (code == "forbidden") {
    return http::status::forbidden;
  }
  if (code == "unauthorized") {
    return http::status::unauthorized;
  }
  if (code == "store_unavailable") {
    return http::status::service_unavailable;
  }
  return http::status::bad_request;
}

void WriteJson(HttpSession::Response& res, http::status status, const nlohmann::json& envelope) {
  auto body = envelope.dump();
  res.result(status);
  res.body() = body;
  res.content_length(body.size());
}

nlohmann::json OptionalTime(const std::optional<TimePoint>& tp) {
  return tp ? nlohmann::json(FormatTimestamp(*tp)) : nlohmann::json(nullptr);
}

nlohmann::json OptionalInt(const std::optional<int>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json ParseBody(const std::string& body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }
  auto parsed = nlohmann::json::parse(body);
  if (!parsed.is_object()) {
    throw ValidationError("bad_request", "JSON 본문이 객체가 아닙니다");
  }
  return parsed;
}

}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, ScoringServices services)
    : stream_(std::move(socket)), config_(config), services_(std::move(services)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read(stream_, buffer_, req_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
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
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = services_.observability ? services_.observability->NextTraceId() : std::string{};
  team_id_.reset();
  if (services_.observability) {
    services_.observability->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "ctfscore");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path = path.substr(0, qpos);
  }

  bool is_submit = MatchIdRoute(path, "/api/challenges/", "/submit").has_value();
  try {
    Route(path, *res);
  } catch (const ValidationError& ex) {
    if (is_submit && ex.code != "not_found") {
      WriteJson(*res, http::status::bad_request, MakeErrorEnvelope("invalid", ex.what(), {{"reason", ex.code}}));
    } else {
      WriteJson(*res, StatusFor(ex.code), MakeErrorEnvelope(ex.code, ex.what()));
    }
  } catch (const ScoringError& ex) {
    WriteJson(*res, StatusFor(ex.code), MakeErrorEnvelope(ex.code, ex.what()));
  } catch (const nlohmann::json::exception&) {
    WriteJson(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
  } catch (const std::exception& ex) {
    WriteJson(*res, http::status::internal_server_error,
              MakeErrorEnvelope("internal_error", "서버 내부 오류", {{"message", ex.what()}}));
  }
  SendResponse(res);
}

void HttpSession::Route(const std::string& path, Response& res) {
  auto method = req_.method();

  if (method == http::verb::get && path == "/api/health") {
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.1.0"}}));
  }
  if (method == http::verb::get && path == "/metrics") {
    return HandleMetrics(res);
  }
  if (method == http::verb::get && path == "/api/leaderboard") {
    return HandleLeaderboard(res);
  }
  if (method == http::verb::post && path == "/ops/reconcile") {
    return HandleReconcile(res);
  }
  if (method == http::verb::post && path == "/ops/competition/close") {
    return HandleClose(res);
  }
  if (method == http::verb::post) {
    if (auto id = MatchIdRoute(path, "/api/challenges/", "/submit")) {
      return HandleSubmit(*id, res);
    }
    if (auto id = MatchIdRoute(path, "/api/hints/", "/unlock")) {
      return HandleUnlock(*id, res);
    }
    if (auto id = MatchIdRoute(path, "/api/koth/", "/claim"); id && services_.arbiter) {
      return HandleClaim(*id, res);
    }
  }
  if (method == http::verb::get) {
    if (auto id = MatchIdRoute(path, "/api/teams/", "/score")) {
      return HandleTeamScore(*id, res);
    }
  }
  WriteJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

std::optional<Principal> HttpSession::ExtractPrincipal() {
  auto role_it = req_.base().find("X-Role");
  auto user_it = req_.base().find("X-User-Id");
  if (role_it == req_.base().end() || user_it == req_.base().end()) {
    return std::nullopt;
  }
  auto role = ParseRole(std::string(role_it->value()));
  auto user_id = ParseId(std::string(user_it->value()));
  if (!role || !user_id) {
    return std::nullopt;
  }
  Principal principal;
  principal.role = *role;
  principal.user_id = *user_id;
  auto team_it = req_.base().find("X-Team-Id");
  if (team_it != req_.base().end()) {
    principal.team_id = ParseId(std::string(team_it->value()));
    if (!principal.team_id) {
      return std::nullopt;
    }
    team_id_ = principal.team_id;
  }
  return principal;
}

int HttpSession::RequireTeam(const Principal& principal) {
  if (!principal.team_id) {
    throw ScoringError("unauthorized", "팀 식별 정보가 필요합니다");
  }
  return *principal.team_id;
}

bool HttpSession::CheckOpsToken(Response& res) {
  auto header_it = req_.base().find("X-Ops-Token");
  std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
  if (config_.ops_token.empty() || header_token != config_.ops_token) {
    WriteJson(res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    return false;
  }
  return true;
}

void HttpSession::HandleSubmit(int challenge_id, Response& res) {
  auto principal = ExtractPrincipal();
  if (!principal) {
    throw ScoringError("unauthorized", "인증 정보가 필요합니다");
  }
  RequireCapability(*principal, Capability::kSubmitFlag);
  int team_id = RequireTeam(*principal);
  auto body = ParseBody(req_.body());
  if (!body.contains("flag") || !body["flag"].is_string()) {
    throw ValidationError("invalid_input", "flag 필드가 필요합니다");
  }
  auto result = services_.validator->Submit(team_id, principal->user_id, challenge_id, body["flag"].get<std::string>());
  nlohmann::json data{{"result", ToString(result.outcome)},
                      {"awarded", result.awarded},
                      {"challengeId", challenge_id},
                      {"category", result.category},
                      {"submissionId", result.submission.submission_id}};
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleUnlock(int hint_id, Response& res) {
  auto principal = ExtractPrincipal();
  if (!principal) {
    throw ScoringError("unauthorized", "인증 정보가 필요합니다");
  }
  RequireCapability(*principal, Capability::kUnlockHint);
  int team_id = RequireTeam(*principal);
  auto result = services_.hints->Unlock(team_id, principal->user_id, hint_id);
  nlohmann::json data{{"result", ToString(result.outcome)}, {"cost", result.cost}, {"hintId", hint_id}};
  if (result.outcome != UnlockOutcome::kOutOfOrder) {
    data["text"] = result.hint.text;
  }
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleClaim(int target_id, Response& res) {
  auto principal = ExtractPrincipal();
  if (!principal) {
    throw ScoringError("unauthorized", "인증 정보가 필요합니다");
  }
  RequireCapability(*principal, Capability::kClaimKoth);
  int team_id = RequireTeam(*principal);
  auto body = ParseBody(req_.body());
  std::string proof;
  if (body.contains("proof")) {
    if (!body["proof"].is_string()) {
      throw ValidationError("invalid_input", "proof는 문자열이어야 합니다");
    }
    proof = body["proof"].get<std::string>();
  }
  auto result = services_.arbiter->Claim(team_id, target_id, proof);
  nlohmann::json data{{"result", ToString(result.outcome)},
                      {"owner", OptionalInt(result.owner_team_id)},
                      {"reason", ToString(result.reason)}};
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleTeamScore(int team_id, Response& res) {
  auto principal = ExtractPrincipal();
  if (!principal) {
    throw ScoringError("unauthorized", "인증 정보가 필요합니다");
  }
  RequireCapability(*principal, Capability::kViewScores);
  auto summary = services_.aggregator->Summary(team_id);
  nlohmann::json data{
      {"teamId", summary.team_id}, {"score", summary.score}, {"lastSolveAt", OptionalTime(summary.last_solve_at)}};
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleLeaderboard(Response& res) {
  auto snapshot = services_.leaderboard->RankedTeams();
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& entry : snapshot.entries) {
    entries.push_back({{"rank", entry.rank},
                       {"teamId", entry.team_id},
                       {"name", entry.name},
                       {"score", entry.score},
                       {"lastSolveAt", OptionalTime(entry.last_solve_at)}});
  }
  nlohmann::json data{{"builtAt", FormatTimestamp(snapshot.built_at)}, {"entries", entries}};
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleMetrics(Response& res) {
  auto snapshot = services_.observability->Snapshot();
  nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                      {"submissions", {{"total", snapshot.submissions}, {"awards", snapshot.awards}}},
                      {"hints", {{"unlocks", snapshot.hint_unlocks}}},
                      {"koth", {{"claims", snapshot.koth_claims}}},
                      {"reconciliation", {{"mismatches", snapshot.reconciliation_mismatches}}},
                      {"leaderboard", {{"rebuilds", snapshot.leaderboard_rebuilds}}}};
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleReconcile(Response& res) {
  if (!CheckOpsToken(res)) {
    return;
  }
  auto principal = ExtractPrincipal();
  if (!principal) {
    throw ScoringError("unauthorized", "인증 정보가 필요합니다");
  }
  RequireCapability(*principal, Capability::kReconcile);
  auto repaired = services_.aggregator->ReconcileAll();
  WriteJson(res, http::status::ok, MakeSuccessEnvelope({{"repaired", repaired}}));
}

void HttpSession::HandleClose(Response& res) {
  if (!CheckOpsToken(res)) {
    return;
  }
  auto principal = ExtractPrincipal();
  if (!principal) {
    throw ScoringError("unauthorized", "인증 정보가 필요합니다");
  }
  RequireCapability(*principal, Capability::kCloseCompetition);
  std::size_t closed = services_.arbiter ? services_.arbiter->CloseAll() : 0;
  WriteJson(res, http::status::ok, MakeSuccessEnvelope({{"closedTargets", closed}}));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (auto& observability = services_.observability) {
    auto status = static_cast<unsigned>(res->result_int());
    if (status >= 400) {
      observability->IncrementError();
    }
    auto latency =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
            .count();
    observability->Log(LogContext{trace_id_, team_id_, std::string(req_.target()), static_cast<long>(latency),
                                  status >= 500 ? LogLevel::kError : LogLevel::kInfo,
                                  {{"method", std::string(req_.method_string())}, {"status", status}}});
  }
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

}  // namespace ctfscore
