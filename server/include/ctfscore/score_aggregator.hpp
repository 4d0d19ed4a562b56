/*
 * 설명: 팀 점수를 원장 이벤트에서 유도한다. 증분 합계와 전체 재계산을 함께 유지하고 서로 대조한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/score_aggregator_test.cpp
 */
#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctfscore/event_bus.hpp"
#include "ctfscore/ledger_store.hpp"
#include "ctfscore/model.hpp"
#include "ctfscore/observability.hpp"

namespace ctfscore {

struct TeamScore {
  int team_id{0};
  int score{0};
  std::optional<TimePoint> last_solve_at;
};

struct TeamStanding {
  int team_id{0};
  std::string name;
  int score{0};
  std::optional<TimePoint> last_solve_at;
};

class ScoreAggregator {
 public:
  // 작성자가 커밋한 뒤 Apply하기까지의 최대 지연. 이보다 최근 이벤트의 누락은 불일치로 보지 않는다.
  static constexpr std::chrono::milliseconds kDefaultCommitGrace{5000};

  ScoreAggregator(std::shared_ptr<LedgerStore> store, std::shared_ptr<EventBus> bus,
                  std::shared_ptr<Observability> observability,
                  std::chrono::milliseconds commit_grace = kDefaultCommitGrace, ClockFn clock = SystemClock());

  int ScoreOf(int team_id);
  TeamScore Summary(int team_id);
  // 원장 전체를 다시 접어 캐시를 교체한다. 읽기 이후 반영된 이벤트는 유지한다.
  TeamScore Recompute(int team_id);
  // 커밋된 이벤트 하나를 반영한다. 같은 키는 한 번만 반영되며 새로 반영되면 true다.
  bool Apply(const ScoreEvent& event);
  // 증분 합계가 원장 재계산과 다르면 ReconciliationMismatch를 던진다.
  // commit_grace 안의 미반영 이벤트는 진행 중인 쓰기로 보고 양쪽에서 제외한다.
  void Verify(int team_id);
  // 모든 팀을 검증하고 불일치 팀은 강제로 재계산한다. 복구한 팀 수를 돌려준다.
  std::size_t ReconcileAll();
  std::vector<TeamStanding> Standings();

  static TeamScore Fold(int team_id, const std::vector<ScoreEvent>& events);

 private:
  struct TeamLedger {
    bool loaded{false};
    std::unordered_map<std::string, ScoreEvent> applied;
    int score{0};
    std::optional<TimePoint> last_solve_at;
  };

  struct Stripe {
    std::mutex mutex;
    std::unordered_map<int, TeamLedger> teams;
  };

  static constexpr std::size_t kStripes = 16;

  Stripe& StripeFor(int team_id);
  TeamScore RecomputeInternal(int team_id, bool announce);
  void Publish(const ScoreEvent& event);
  static void Accumulate(TeamLedger& ledger, const ScoreEvent& event);
  static TeamScore ToScore(int team_id, const TeamLedger& ledger);

  std::shared_ptr<LedgerStore> store_;
  std::shared_ptr<EventBus> bus_;
  std::shared_ptr<Observability> observability_;
  std::chrono::milliseconds commit_grace_;
  ClockFn clock_;
  std::array<Stripe, kStripes> stripes_;
};

}  // namespace ctfscore
