/*
 * 설명: 서버 수명주기, 코어 서비스 조립, 리스닝과 재계산 타이머를 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/scoring_flow_test.cpp
 */
#include "ctfscore/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "ctfscore/capability.hpp"
#include "ctfscore/db_client.hpp"
#include "ctfscore/errors.hpp"
#include "ctfscore/mariadb_ledger_store.hpp"
#include "ctfscore/memory_ledger_store.hpp"

namespace ctfscore {

namespace {

const char* EventKindName(ScoreEventKind kind) {
  switch (kind) {
    case ScoreEventKind::kSolve:
      return "solve";
    case ScoreEventKind::kHintUnlock:
      return "hint";
    case ScoreEventKind::kKothAccrual:
      return "accrual";
    case ScoreEventKind::kRecompute:
      return "recompute";
  }
  return "unknown";
}

std::optional<TimePoint> FromEpoch(std::int64_t epoch) {
  if (epoch <= 0) {
    return std::nullopt;
  }
  return TimePoint{std::chrono::seconds(epoch)};
}

}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           ScoringServices services)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), services_(std::move(services)) {
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
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->services_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  ScoringServices services_;
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<LedgerStore> store)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), reconcile_timer_(ioc_),
      store_(std::move(store)) {
  auto observability = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  if (!store_) {
    if (config.store_backend == "memory") {
      store_ = std::make_shared<MemoryLedgerStore>();
    } else if (config.store_backend == "mariadb") {
      DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
      store_ = std::make_shared<MariaDbLedgerStore>(std::make_shared<MariaDbClient>(db_config));
    } else {
      throw std::invalid_argument("알 수 없는 STORE_BACKEND: " + config.store_backend);
    }
  }
  bus_ = std::make_shared<EventBus>(ioc_);
  bus_->Subscribe([observability](const ScoreEvent& event) {
    observability->Log(LogContext{"", event.team_id, "score.changed", 0, LogLevel::kDebug,
                                  {{"key", event.key}, {"kind", EventKindName(event.kind)}, {"delta", event.delta}}});
  });

  CompetitionWindow window{FromEpoch(config.competition_start_epoch), FromEpoch(config.competition_end_epoch)};
  auto clock = SystemClock();

  services_.observability = observability;
  services_.aggregator = std::make_shared<ScoreAggregator>(store_, bus_, observability,
                                                            std::chrono::milliseconds(config.reconcile_grace_ms), clock);
  services_.validator = std::make_shared<SubmissionValidator>(store_, services_.aggregator, observability, window, clock);
  services_.hints = std::make_shared<HintLedger>(store_, services_.aggregator, observability, window, clock);
  if (ModuleEnabled("koth")) {
    KothConfig koth_config;
    koth_config.accrual_points = config.koth_accrual_points;
    koth_config.accrual_interval = std::chrono::seconds(config.koth_accrual_interval_seconds);
    services_.arbiter =
        std::make_shared<KothArbiter>(ioc_, store_, services_.aggregator, observability, koth_config, clock);
  }
  LeaderboardConfig board_config;
  board_config.staleness_bound = std::chrono::milliseconds(config.leaderboard_staleness_ms);
  board_config.debounce = std::chrono::milliseconds(config.leaderboard_debounce_ms);
  // 이벤트 누락에 대비한 안전망. staleness 한도의 절반 주기로 갱신한다.
  board_config.refresh_interval = std::max(std::chrono::milliseconds(100), board_config.staleness_bound / 2);
  services_.leaderboard =
      std::make_shared<LeaderboardCache>(ioc_, services_.aggregator, bus_, board_config, clock, observability);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, services_);
    listener_->Run();
    services_.leaderboard->Start();
    if (services_.arbiter) {
      services_.arbiter->Start();
    }
    ScheduleReconcile();
    services_.observability->Log(LogContext{"", std::nullopt, "server.started", 0, LogLevel::kInfo,
                                            {{"port", config_.port}, {"store", config_.store_backend}}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    services_.observability->Log(
        LogContext{"", std::nullopt, "server.failed", 0, LogLevel::kError, {{"message", ex.what()}}});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::ScheduleReconcile() {
  if (config_.reconcile_interval_seconds == 0) {
    return;
  }
  reconcile_timer_.expires_after(std::chrono::seconds(config_.reconcile_interval_seconds));
  reconcile_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || !running_) {
      return;
    }
    try {
      auto repaired = services_.aggregator->ReconcileAll();
      services_.observability->Log(
          LogContext{"", std::nullopt, "score.reconciled", 0, LogLevel::kDebug, {{"repaired", repaired}}});
    } catch (const StoreUnavailable& ex) {
      services_.observability->Log(
          LogContext{"", std::nullopt, "score.reconcile_failed", 0, LogLevel::kWarn, {{"message", ex.what()}}});
    }
    ScheduleReconcile();
  });
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  services_.leaderboard->Stop();
  if (services_.arbiter) {
    services_.arbiter->Stop();
  }
  reconcile_timer_.cancel();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.store_backend = get_env("STORE_BACKEND", "mariadb");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "ctfscore");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.leaderboard_staleness_ms = static_cast<std::size_t>(std::stoul(get_env("LEADERBOARD_STALENESS_MS", "5000")));
  cfg.leaderboard_debounce_ms = static_cast<std::size_t>(std::stoul(get_env("LEADERBOARD_DEBOUNCE_MS", "250")));
  cfg.reconcile_interval_seconds = static_cast<std::size_t>(std::stoul(get_env("RECONCILE_INTERVAL_SECONDS", "60")));
  cfg.reconcile_grace_ms = static_cast<std::size_t>(std::stoul(get_env("RECONCILE_GRACE_MS", "5000")));
  cfg.koth_accrual_points = std::stoi(get_env("KOTH_ACCRUAL_POINTS", "10"));
  cfg.koth_accrual_interval_seconds =
      static_cast<std::size_t>(std::stoul(get_env("KOTH_ACCRUAL_INTERVAL_SECONDS", "60")));
  cfg.competition_start_epoch = std::stoll(get_env("COMPETITION_START_EPOCH", "0"));
  cfg.competition_end_epoch = std::stoll(get_env("COMPETITION_END_EPOCH", "0"));
  cfg.ops_token = get_env("OPS_TOKEN", "");
  return cfg;
}

}  // namespace ctfscore
