/*
 * 설명: 채점 서버 전체 수명주기와 코어 서비스 조립을 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/scoring_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "ctfscore/config.hpp"
#include "ctfscore/event_bus.hpp"
#include "ctfscore/hint_ledger.hpp"
#include "ctfscore/http_session.hpp"
#include "ctfscore/koth_arbiter.hpp"
#include "ctfscore/leaderboard_cache.hpp"
#include "ctfscore/ledger_store.hpp"
#include "ctfscore/observability.hpp"
#include "ctfscore/score_aggregator.hpp"
#include "ctfscore/submission_validator.hpp"

namespace ctfscore {

class Listener;

class ServerApp {
 public:
  // store가 주어지면 STORE_BACKEND 대신 그것을 쓴다.
  explicit ServerApp(const AppConfig& config, std::shared_ptr<LedgerStore> store = nullptr);
  ~ServerApp();

  void Run();
  void Stop();

 private:
  void RunWorkers();
  void ScheduleReconcile();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::steady_timer reconcile_timer_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<LedgerStore> store_;
  std::shared_ptr<EventBus> bus_;
  ScoringServices services_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace ctfscore
