/*
 * 설명: 선행 힌트 확인과 조건부 삽입을 저장소 트랜잭션 하나로 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/hint_ledger_test.cpp
 */
#include "ctfscore/hint_ledger.hpp"

#include <vector>

#include "ctfscore/errors.hpp"

namespace ctfscore {

const char* ToString(UnlockOutcome outcome) {
  switch (outcome) {
    case UnlockOutcome::kUnlocked:
      return "unlocked";
    case UnlockOutcome::kAlreadyUnlocked:
      return "already-unlocked";
    case UnlockOutcome::kOutOfOrder:
      return "out-of-order";
  }
  return "out-of-order";
}

HintLedger::HintLedger(std::shared_ptr<LedgerStore> store, std::shared_ptr<ScoreAggregator> aggregator,
                       std::shared_ptr<Observability> observability, CompetitionWindow window, ClockFn clock)
    : store_(std::move(store)),
      aggregator_(std::move(aggregator)),
      observability_(std::move(observability)),
      window_(window),
      clock_(std::move(clock)) {}

UnlockResult HintLedger::Unlock(int team_id, int user_id, int hint_id) {
  auto now = TruncateToMicros(clock_());
  auto hint = store_->FindHint(hint_id);
  if (!hint) {
    throw ValidationError("not_found", "힌트를 찾을 수 없습니다");
  }
  auto challenge = store_->FindChallenge(hint->challenge_id);
  if (!challenge || challenge->hidden || challenge->retired) {
    throw ValidationError("challenge_unavailable", "해제할 수 없는 힌트입니다");
  }
  RequireActiveMember(*store_, window_, team_id, user_id, now);

  std::vector<int> prerequisites;
  for (const auto& sibling : store_->HintsForChallenge(hint->challenge_id)) {
    if (sibling.rank < hint->rank) {
      prerequisites.push_back(sibling.hint_id);
    }
  }

  HintUnlock unlock{team_id, hint_id, hint->challenge_id, user_id, hint->cost, now};
  UnlockResult result;
  result.hint = *hint;
  switch (store_->InsertHintUnlock(unlock, prerequisites)) {
    case HintInsertStatus::kInserted:
      result.outcome = UnlockOutcome::kUnlocked;
      result.cost = hint->cost;
      aggregator_->Apply(HintEvent(unlock));
      if (observability_) {
        observability_->IncrementHintUnlock();
      }
      break;
    case HintInsertStatus::kDuplicate:
      result.outcome = UnlockOutcome::kAlreadyUnlocked;
      break;
    case HintInsertStatus::kMissingPrerequisite:
      result.outcome = UnlockOutcome::kOutOfOrder;
      break;
  }

  if (observability_) {
    observability_->Log(LogContext{"", team_id, "hint.unlock", 0, LogLevel::kDebug,
                                   {{"hintId", hint_id}, {"outcome", ToString(result.outcome)}, {"cost", result.cost}}});
  }
  return result;
}

}  // namespace ctfscore
