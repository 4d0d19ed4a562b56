/*
 * 설명: 힌트 해제를 (팀, 힌트)당 한 번만 차감하고 힌트 순서를 강제한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/hint_ledger_test.cpp
 */
#pragma once

#include <memory>

#include "ctfscore/ledger_store.hpp"
#include "ctfscore/observability.hpp"
#include "ctfscore/score_aggregator.hpp"
#include "ctfscore/submission_validator.hpp"

namespace ctfscore {

enum class UnlockOutcome { kUnlocked, kAlreadyUnlocked, kOutOfOrder };

const char* ToString(UnlockOutcome outcome);

struct UnlockResult {
  UnlockOutcome outcome{UnlockOutcome::kOutOfOrder};
  int cost{0};
  Hint hint;
};

class HintLedger {
 public:
  HintLedger(std::shared_ptr<LedgerStore> store, std::shared_ptr<ScoreAggregator> aggregator,
             std::shared_ptr<Observability> observability, CompetitionWindow window, ClockFn clock);

  // 동시에 같은 힌트를 해제하면 하나만 kUnlocked이고 나머지는 차감 없이 kAlreadyUnlocked다.
  UnlockResult Unlock(int team_id, int user_id, int hint_id);

 private:
  std::shared_ptr<LedgerStore> store_;
  std::shared_ptr<ScoreAggregator> aggregator_;
  std::shared_ptr<Observability> observability_;
  CompetitionWindow window_;
  ClockFn clock_;
};

}  // namespace ctfscore
