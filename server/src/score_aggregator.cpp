/*
 * 설명: 수상/힌트/적립 이벤트를 팀 점수로 접고, 증분 결과와 재계산 결과를 대조한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/score_aggregator_test.cpp
 */
#include "ctfscore/score_aggregator.hpp"

#include <unordered_map>

#include "ctfscore/errors.hpp"

namespace ctfscore {

ScoreAggregator::ScoreAggregator(std::shared_ptr<LedgerStore> store, std::shared_ptr<EventBus> bus,
                                 std::shared_ptr<Observability> observability, std::chrono::milliseconds commit_grace,
                                 ClockFn clock)
    : store_(std::move(store)),
      bus_(std::move(bus)),
      observability_(std::move(observability)),
      commit_grace_(commit_grace),
      clock_(std::move(clock)) {}

ScoreAggregator::Stripe& ScoreAggregator::StripeFor(int team_id) {
  return stripes_[static_cast<std::size_t>(team_id) % kStripes];
}

void ScoreAggregator::Accumulate(TeamLedger& ledger, const ScoreEvent& event) {
  ledger.score += event.delta;
  if (event.kind == ScoreEventKind::kSolve) {
    if (!ledger.last_solve_at || *ledger.last_solve_at < event.at) {
      ledger.last_solve_at = event.at;
    }
  }
}

TeamScore ScoreAggregator::ToScore(int team_id, const TeamLedger& ledger) {
  return TeamScore{team_id, ledger.score, ledger.last_solve_at};
}

TeamScore ScoreAggregator::Fold(int team_id, const std::vector<ScoreEvent>& events) {
  TeamLedger ledger;
  for (const auto& event : events) {
    if (event.team_id != team_id || event.kind == ScoreEventKind::kRecompute) {
      continue;
    }
    if (ledger.applied.emplace(event.key, event).second) {
      Accumulate(ledger, event);
    }
  }
  return ToScore(team_id, ledger);
}

int ScoreAggregator::ScoreOf(int team_id) { return Summary(team_id).score; }

TeamScore ScoreAggregator::Summary(int team_id) {
  {
    auto& stripe = StripeFor(team_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    auto it = stripe.teams.find(team_id);
    if (it != stripe.teams.end() && it->second.loaded) {
      return ToScore(team_id, it->second);
    }
  }
  return RecomputeInternal(team_id, false);
}

TeamScore ScoreAggregator::Recompute(int team_id) { return RecomputeInternal(team_id, true); }

TeamScore ScoreAggregator::RecomputeInternal(int team_id, bool announce) {
  if (!store_->FindTeam(team_id)) {
    throw ValidationError("not_found", "팀을 찾을 수 없습니다");
  }
  auto events = store_->ScoreEventsForTeam(team_id);

  TeamScore result;
  bool changed = false;
  {
    auto& stripe = StripeFor(team_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    auto& ledger = stripe.teams[team_id];
    TeamLedger rebuilt;
    for (const auto& event : events) {
      if (rebuilt.applied.emplace(event.key, event).second) {
        Accumulate(rebuilt, event);
      }
    }
    // 원장을 읽은 뒤 커밋되어 이미 반영된 이벤트
    for (const auto& entry : ledger.applied) {
      if (rebuilt.applied.emplace(entry.first, entry.second).second) {
        Accumulate(rebuilt, entry.second);
      }
    }
    rebuilt.loaded = true;
    changed = !ledger.loaded || ledger.score != rebuilt.score || ledger.last_solve_at != rebuilt.last_solve_at;
    ledger = std::move(rebuilt);
    result = ToScore(team_id, ledger);
  }
  if (announce && changed) {
    Publish(ScoreEvent{"recompute:" + std::to_string(team_id), team_id, ScoreEventKind::kRecompute, 0,
                       std::chrono::system_clock::now()});
  }
  return result;
}

bool ScoreAggregator::Apply(const ScoreEvent& event) {
  {
    auto& stripe = StripeFor(event.team_id);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    auto& ledger = stripe.teams[event.team_id];
    if (!ledger.applied.emplace(event.key, event).second) {
      return false;
    }
    Accumulate(ledger, event);
  }
  Publish(event);
  return true;
}

void ScoreAggregator::Verify(int team_id) {
  auto events = store_->ScoreEventsForTeam(team_id);
  auto folded = Fold(team_id, events);
  std::unordered_map<std::string, const ScoreEvent*> folded_events;
  for (const auto& event : events) {
    if (event.team_id == team_id && event.kind != ScoreEventKind::kRecompute) {
      folded_events.emplace(event.key, &event);
    }
  }
  auto settled_before = clock_() - commit_grace_;

  auto& stripe = StripeFor(team_id);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  auto it = stripe.teams.find(team_id);
  if (it == stripe.teams.end() || !it->second.loaded) {
    return;
  }
  const auto& ledger = it->second;
  int applied_after_read = 0;
  for (const auto& entry : ledger.applied) {
    if (folded_events.count(entry.first) == 0) {
      applied_after_read += entry.second.delta;
    }
  }
  // 커밋되었지만 작성자가 아직 Apply하지 않은 이벤트
  int in_flight = 0;
  bool missing = false;
  for (const auto& entry : folded_events) {
    if (ledger.applied.count(entry.first) != 0) {
      continue;
    }
    if (entry.second->at > settled_before) {
      in_flight += entry.second->delta;
    } else {
      missing = true;
    }
  }
  int authoritative = folded.score - in_flight + applied_after_read;
  if (missing || ledger.score != authoritative) {
    throw ReconciliationMismatch(team_id, ledger.score, folded.score + applied_after_read);
  }
}

std::size_t ScoreAggregator::ReconcileAll() {
  std::size_t repaired = 0;
  for (const auto& team : store_->ListTeams()) {
    try {
      Verify(team.team_id);
    } catch (const ReconciliationMismatch& ex) {
      if (observability_) {
        observability_->IncrementMismatch();
        observability_->Log(LogContext{"", team.team_id, "score.reconcile_mismatch", 0, LogLevel::kError,
                                       {{"incremental", ex.incremental}, {"authoritative", ex.authoritative}}});
      }
      {
        auto& stripe = StripeFor(team.team_id);
        std::lock_guard<std::mutex> lock(stripe.mutex);
        stripe.teams.erase(team.team_id);
      }
      RecomputeInternal(team.team_id, false);
      Publish(ScoreEvent{"recompute:" + std::to_string(team.team_id), team.team_id, ScoreEventKind::kRecompute, 0,
                         std::chrono::system_clock::now()});
      ++repaired;
    }
  }
  return repaired;
}

std::vector<TeamStanding> ScoreAggregator::Standings() {
  std::vector<TeamStanding> standings;
  for (const auto& team : store_->ListTeams()) {
    auto score = Summary(team.team_id);
    standings.push_back(TeamStanding{team.team_id, team.name, score.score, score.last_solve_at});
  }
  return standings;
}

void ScoreAggregator::Publish(const ScoreEvent& event) {
  if (bus_) {
    bus_->Publish(event);
  }
}

}  // namespace ctfscore
