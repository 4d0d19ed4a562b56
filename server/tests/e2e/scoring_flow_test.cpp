#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "ctfscore/app.hpp"
#include "ctfscore/memory_ledger_store.hpp"

namespace {

namespace http = boost::beast::http;
using Headers = std::map<std::string, std::string>;

ctfscore::AppConfig TestConfig(unsigned short port) {
  ctfscore::AppConfig cfg{};
  cfg.port = port;
  cfg.store_backend = "memory";
  cfg.log_level = "error";
  cfg.leaderboard_staleness_ms = 0;
  cfg.leaderboard_debounce_ms = 10;
  cfg.reconcile_interval_seconds = 0;
  cfg.koth_accrual_points = 10;
  cfg.koth_accrual_interval_seconds = 60;
  cfg.ops_token = "ops-secret";
  return cfg;
}

struct SimpleHttpResponse {
  http::status status;
  nlohmann::json body;
};

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  EXPECT_TRUE(body["data"].is_null());
  ASSERT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
}

Headers Player(int team_id, int user_id) {
  return {{"X-Role", "player"}, {"X-Team-Id", std::to_string(team_id)}, {"X-User-Id", std::to_string(user_id)}};
}

class ScoringFlowFixture : public ::testing::Test {
 protected:
  virtual ctfscore::AppConfig MakeConfig() { return TestConfig(18090); }

  void SetUp() override {
    config_ = MakeConfig();
    store_ = std::make_shared<ctfscore::MemoryLedgerStore>();
    auto registered = ctfscore::TimePoint{std::chrono::seconds(1700000000)};
    store_->PutChallenge(ctfscore::Challenge{1, "warmup", "misc", 100, "flag{abc}", false, false, false});
    store_->PutChallenge(ctfscore::Challenge{2, "second", "web", 300, "flag{web}", false, false, false});
    store_->PutHint(ctfscore::Hint{10, 1, 20, 1, "try lowercase"});
    store_->PutHint(ctfscore::Hint{11, 1, 30, 2, "it is abc"});
    store_->PutTeam(ctfscore::Team{1, "alpha", {1, 2}, "", registered});
    store_->PutTeam(ctfscore::Team{2, "bravo", {3}, "", registered});
    store_->PutKothTarget(ctfscore::KothTarget{1, "hill", ctfscore::CaptureRule::kProof, "root-proof"});
    app_ = std::make_unique<ctfscore::ServerApp>(config_, store_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  SimpleHttpResponse Send(http::verb method, const std::string& target, const Headers& headers = {},
                          const std::string& body = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    stream.connect(results);

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "localhost");
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    for (const auto& header : headers) {
      req.set(header.first, header.second);
    }
    if (!body.empty()) {
      req.set(http::field::content_type, "application/json");
      req.body() = body;
    }
    req.prepare_payload();

    http::write(stream, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse SubmitFlag(int team_id, int user_id, int challenge_id, const std::string& flag) {
    nlohmann::json body{{"flag", flag}};
    return Send(http::verb::post, "/api/challenges/" + std::to_string(challenge_id) + "/submit",
                Player(team_id, user_id), body.dump());
  }

  int ScoreOf(int team_id) {
    auto res = Send(http::verb::get, "/api/teams/" + std::to_string(team_id) + "/score", Player(team_id, 1));
    EXPECT_EQ(res.status, http::status::ok);
    return res.body["data"]["score"].get<int>();
  }

  ctfscore::AppConfig config_;
  std::shared_ptr<ctfscore::MemoryLedgerStore> store_;
  std::unique_ptr<ctfscore::ServerApp> app_;
  std::thread server_thread_;
};

}  // namespace

TEST_F(ScoringFlowFixture, HintThenSolveThenResubmit) {
  auto health = Send(http::verb::get, "/api/health");
  ASSERT_EQ(health.status, http::status::ok);
  EXPECT_TRUE(health.body["success"].get<bool>());

  auto skipped = Send(http::verb::post, "/api/hints/11/unlock", Player(1, 1));
  ASSERT_EQ(skipped.status, http::status::ok);
  EXPECT_EQ(skipped.body["data"]["result"], "out-of-order");

  auto unlocked = Send(http::verb::post, "/api/hints/10/unlock", Player(1, 1));
  ASSERT_EQ(unlocked.status, http::status::ok);
  EXPECT_EQ(unlocked.body["data"]["result"], "unlocked");
  EXPECT_EQ(unlocked.body["data"]["cost"], 20);
  EXPECT_EQ(unlocked.body["data"]["text"], "try lowercase");

  auto again = Send(http::verb::post, "/api/hints/10/unlock", Player(1, 2));
  EXPECT_EQ(again.body["data"]["result"], "already-unlocked");
  EXPECT_EQ(again.body["data"]["cost"], 0);

  auto wrong = SubmitFlag(1, 1, 1, "flag{nope}");
  ASSERT_EQ(wrong.status, http::status::ok);
  EXPECT_EQ(wrong.body["data"]["result"], "incorrect");

  auto accepted = SubmitFlag(1, 1, 1, "FLAG{abc}");
  ASSERT_EQ(accepted.status, http::status::ok);
  EXPECT_EQ(accepted.body["data"]["result"], "accepted");
  EXPECT_EQ(accepted.body["data"]["awarded"], 100);
  EXPECT_EQ(accepted.body["data"]["category"], "misc");
  EXPECT_EQ(ScoreOf(1), 80);

  auto repeat = SubmitFlag(1, 2, 1, " flag{abc} ");
  EXPECT_EQ(repeat.body["data"]["result"], "already-solved");
  EXPECT_EQ(ScoreOf(1), 80);
}

TEST_F(ScoringFlowFixture, LeaderboardOrdersSolvedTeamsFirst) {
  ASSERT_EQ(SubmitFlag(2, 3, 2, "flag{web}").body["data"]["result"], "accepted");
  auto board = Send(http::verb::get, "/api/leaderboard");
  ASSERT_EQ(board.status, http::status::ok);
  auto entries = board.body["data"]["entries"];
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0]["teamId"], 2);
  EXPECT_EQ(entries[0]["name"], "bravo");
  EXPECT_EQ(entries[0]["score"], 300);
  EXPECT_EQ(entries[0]["rank"], 1);
  EXPECT_FALSE(entries[0]["lastSolveAt"].is_null());
  EXPECT_EQ(entries[1]["teamId"], 1);
  EXPECT_TRUE(entries[1]["lastSolveAt"].is_null());
  EXPECT_TRUE(board.body["data"].contains("builtAt"));
}

TEST_F(ScoringFlowFixture, InvalidSubmissionsAreRejected) {
  auto empty = SubmitFlag(1, 1, 1, "   ");
  EXPECT_EQ(empty.status, http::status::bad_request);
  ExpectErrorEnvelope(empty.body, "invalid");
  EXPECT_EQ(empty.body["error"]["detail"]["reason"], "invalid_input");

  auto missing_field = Send(http::verb::post, "/api/challenges/1/submit", Player(1, 1), R"({"answer":"x"})");
  EXPECT_EQ(missing_field.status, http::status::bad_request);
  ExpectErrorEnvelope(missing_field.body, "invalid");

  auto broken_json = Send(http::verb::post, "/api/challenges/1/submit", Player(1, 1), "{not json");
  EXPECT_EQ(broken_json.status, http::status::bad_request);
  ExpectErrorEnvelope(broken_json.body, "bad_request");

  auto unknown = SubmitFlag(1, 1, 99, "flag{abc}");
  EXPECT_EQ(unknown.status, http::status::not_found);
  ExpectErrorEnvelope(unknown.body, "not_found");

  auto stranger = SubmitFlag(1, 3, 1, "flag{abc}");
  EXPECT_EQ(stranger.status, http::status::bad_request);
  EXPECT_EQ(stranger.body["error"]["detail"]["reason"], "not_team_member");
  EXPECT_EQ(ScoreOf(1), 0);
}

TEST_F(ScoringFlowFixture, IdentityAndCapabilitiesAreChecked) {
  nlohmann::json body{{"flag", "flag{abc}"}};
  auto anonymous = Send(http::verb::post, "/api/challenges/1/submit", {}, body.dump());
  EXPECT_EQ(anonymous.status, http::status::unauthorized);
  ExpectErrorEnvelope(anonymous.body, "unauthorized");

  Headers editor{{"X-Role", "editor"}, {"X-Team-Id", "1"}, {"X-User-Id", "1"}};
  auto forbidden = Send(http::verb::post, "/api/challenges/1/submit", editor, body.dump());
  EXPECT_EQ(forbidden.status, http::status::forbidden);
  ExpectErrorEnvelope(forbidden.body, "forbidden");

  auto no_token = Send(http::verb::post, "/ops/reconcile", {{"X-Role", "judge"}, {"X-User-Id", "9"}});
  EXPECT_EQ(no_token.status, http::status::unauthorized);

  auto player_ops =
      Send(http::verb::post, "/ops/reconcile", {{"X-Role", "player"}, {"X-User-Id", "1"}, {"X-Ops-Token", "ops-secret"}});
  EXPECT_EQ(player_ops.status, http::status::forbidden);

  auto judge_ops =
      Send(http::verb::post, "/ops/reconcile", {{"X-Role", "judge"}, {"X-User-Id", "9"}, {"X-Ops-Token", "ops-secret"}});
  ASSERT_EQ(judge_ops.status, http::status::ok);
  EXPECT_EQ(judge_ops.body["data"]["repaired"], 0);
}

TEST_F(ScoringFlowFixture, ReconcileRepairsDriftFromDirectStoreWrite) {
  EXPECT_EQ(ScoreOf(2), 0);
  auto at = ctfscore::TimePoint{std::chrono::seconds(1700000100)};
  store_->AppendSubmission(
      ctfscore::Submission{0, 2, 2, 3, "flag{web}", at, ctfscore::SubmissionOutcome::kCorrect, 300});
  EXPECT_EQ(ScoreOf(2), 0);

  auto reconcile =
      Send(http::verb::post, "/ops/reconcile", {{"X-Role", "judge"}, {"X-User-Id", "9"}, {"X-Ops-Token", "ops-secret"}});
  ASSERT_EQ(reconcile.status, http::status::ok);
  EXPECT_EQ(reconcile.body["data"]["repaired"], 1);
  EXPECT_EQ(ScoreOf(2), 300);

  auto metrics = Send(http::verb::get, "/metrics");
  ASSERT_EQ(metrics.status, http::status::ok);
  EXPECT_EQ(metrics.body["data"]["reconciliation"]["mismatches"], 1);
}

TEST_F(ScoringFlowFixture, KothClaimTakeoverAndClose) {
  nlohmann::json no_proof = nlohmann::json::object();
  auto first = Send(http::verb::post, "/api/koth/1/claim", Player(1, 1), no_proof.dump());
  ASSERT_EQ(first.status, http::status::ok);
  EXPECT_EQ(first.body["data"]["result"], "claimed");
  EXPECT_EQ(first.body["data"]["owner"], 1);

  auto mine = Send(http::verb::post, "/api/koth/1/claim", Player(1, 2), no_proof.dump());
  EXPECT_EQ(mine.body["data"]["result"], "already-owner");

  nlohmann::json bad{{"proof", "guess"}};
  auto rejected = Send(http::verb::post, "/api/koth/1/claim", Player(2, 3), bad.dump());
  EXPECT_EQ(rejected.body["data"]["result"], "rejected");
  EXPECT_EQ(rejected.body["data"]["reason"], "proof_invalid");
  EXPECT_EQ(rejected.body["data"]["owner"], 1);

  nlohmann::json good{{"proof", "root-proof"}};
  auto taken = Send(http::verb::post, "/api/koth/1/claim", Player(2, 3), good.dump());
  EXPECT_EQ(taken.body["data"]["result"], "claimed");
  EXPECT_EQ(taken.body["data"]["owner"], 2);

  Headers admin{{"X-Role", "superadmin"}, {"X-User-Id", "99"}, {"X-Ops-Token", "ops-secret"}};
  auto closed = Send(http::verb::post, "/ops/competition/close", admin);
  ASSERT_EQ(closed.status, http::status::ok);
  EXPECT_EQ(closed.body["data"]["closedTargets"], 1);

  auto late = Send(http::verb::post, "/api/koth/1/claim", Player(1, 1), good.dump());
  EXPECT_EQ(late.body["data"]["result"], "rejected");
  EXPECT_EQ(late.body["data"]["reason"], "closed");
}

TEST_F(ScoringFlowFixture, StoreOutageMapsToServiceUnavailable) {
  store_->SetFaultInjector([]() { return true; });
  auto res = SubmitFlag(1, 1, 1, "flag{abc}");
  store_->SetFaultInjector(nullptr);
  EXPECT_EQ(res.status, http::status::service_unavailable);
  ExpectErrorEnvelope(res.body, "store_unavailable");
  EXPECT_TRUE(store_->SubmissionsForTeam(1).empty());
}

class ScheduledReconcileFixture : public ScoringFlowFixture {
 protected:
  ctfscore::AppConfig MakeConfig() override {
    auto cfg = TestConfig(18091);
    cfg.reconcile_interval_seconds = 1;
    return cfg;
  }
};

TEST_F(ScheduledReconcileFixture, TimerRepairsDriftWithoutOperatorCall) {
  EXPECT_EQ(ScoreOf(2), 0);
  auto at = ctfscore::TimePoint{std::chrono::seconds(1700000100)};
  store_->AppendSubmission(
      ctfscore::Submission{0, 2, 2, 3, "flag{web}", at, ctfscore::SubmissionOutcome::kCorrect, 300});

  int score = 0;
  for (int i = 0; i < 30 && score != 300; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    score = ScoreOf(2);
  }
  EXPECT_EQ(score, 300);

  auto metrics = Send(http::verb::get, "/metrics");
  ASSERT_EQ(metrics.status, http::status::ok);
  EXPECT_EQ(metrics.body["data"]["reconciliation"]["mismatches"], 1);
}
