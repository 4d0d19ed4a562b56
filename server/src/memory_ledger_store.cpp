/*
 * 설명: 락 스트라이프 기반 프로세스 내 원장 저장소를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_ledger_store_test.cpp
 */
#include "ctfscore/memory_ledger_store.hpp"

#include <algorithm>
#include <limits>

#include "ctfscore/errors.hpp"

namespace ctfscore {

MemoryLedgerStore::TeamStripe& MemoryLedgerStore::StripeForTeam(int team_id) {
  return team_stripes_[static_cast<std::size_t>(team_id) % kStripes];
}

MemoryLedgerStore::TargetStripe& MemoryLedgerStore::StripeForTarget(int target_id) {
  return target_stripes_[static_cast<std::size_t>(target_id) % kStripes];
}

void MemoryLedgerStore::SetFaultInjector(const std::function<bool()>& injector) {
  std::lock_guard<std::mutex> lock(fault_mutex_);
  fault_injector_ = injector;
}

void MemoryLedgerStore::MaybeFail() const {
  std::function<bool()> injector;
  {
    std::lock_guard<std::mutex> lock(fault_mutex_);
    injector = fault_injector_;
  }
  if (injector && injector()) {
    throw StoreUnavailable("주입된 저장소 장애");
  }
}

void MemoryLedgerStore::PutChallenge(const Challenge& challenge) {
  ValidateChallenge(challenge);
  MaybeFail();
  std::unique_lock<std::shared_mutex> lock(catalog_mutex_);
  challenges_[challenge.challenge_id] = challenge;
}

void MemoryLedgerStore::PutHint(const Hint& hint) {
  ValidateHint(hint);
  MaybeFail();
  std::unique_lock<std::shared_mutex> lock(catalog_mutex_);
  if (challenges_.count(hint.challenge_id) == 0) {
    throw ValidationError("not_found", "힌트가 속한 문제가 없습니다");
  }
  for (const auto& entry : hints_) {
    const auto& other = entry.second;
    if (other.hint_id != hint.hint_id && other.challenge_id == hint.challenge_id && other.rank == hint.rank) {
      throw ValidationError("invalid_input", "같은 문제에 동일한 순번의 힌트가 이미 있습니다");
    }
  }
  hints_[hint.hint_id] = hint;
}

void MemoryLedgerStore::PutTeam(const Team& team) {
  ValidateTeam(team);
  MaybeFail();
  std::unique_lock<std::shared_mutex> lock(catalog_mutex_);
  for (const auto& entry : teams_) {
    if (entry.first != team.team_id && entry.second.name == team.name) {
      throw ValidationError("invalid_input", "이미 존재하는 팀 이름입니다");
    }
  }
  teams_[team.team_id] = team;
}

void MemoryLedgerStore::PutKothTarget(const KothTarget& target) {
  ValidateKothTarget(target);
  MaybeFail();
  {
    std::unique_lock<std::shared_mutex> lock(catalog_mutex_);
    koth_targets_[target.target_id] = target;
  }
  auto& stripe = StripeForTarget(target.target_id);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  if (stripe.states.count(target.target_id) == 0) {
    KothState state;
    state.target_id = target.target_id;
    stripe.states.emplace(target.target_id, state);
  }
}

std::optional<Challenge> MemoryLedgerStore::FindChallenge(int challenge_id) {
  MaybeFail();
  std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
  auto it = challenges_.find(challenge_id);
  if (it == challenges_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Hint> MemoryLedgerStore::FindHint(int hint_id) {
  MaybeFail();
  std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
  auto it = hints_.find(hint_id);
  if (it == hints_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Hint> MemoryLedgerStore::HintsForChallenge(int challenge_id) {
  MaybeFail();
  std::vector<Hint> result;
  {
    std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
    for (const auto& entry : hints_) {
      if (entry.second.challenge_id == challenge_id) {
        result.push_back(entry.second);
      }
    }
  }
  std::sort(result.begin(), result.end(), [](const Hint& a, const Hint& b) { return a.rank < b.rank; });
  return result;
}

std::optional<Team> MemoryLedgerStore::FindTeam(int team_id) {
  MaybeFail();
  std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
  auto it = teams_.find(team_id);
  if (it == teams_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Team> MemoryLedgerStore::ListTeams() {
  MaybeFail();
  std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
  std::vector<Team> result;
  result.reserve(teams_.size());
  for (const auto& entry : teams_) {
    result.push_back(entry.second);
  }
  return result;
}

std::optional<KothTarget> MemoryLedgerStore::FindKothTarget(int target_id) {
  MaybeFail();
  std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
  auto it = koth_targets_.find(target_id);
  if (it == koth_targets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<KothTarget> MemoryLedgerStore::ListKothTargets() {
  MaybeFail();
  std::shared_lock<std::shared_mutex> lock(catalog_mutex_);
  std::vector<KothTarget> result;
  for (const auto& entry : koth_targets_) {
    result.push_back(entry.second);
  }
  return result;
}

Submission MemoryLedgerStore::AppendSubmission(const Submission& attempt) {
  ValidateSubmission(attempt);
  MaybeFail();
  Submission stored = attempt;
  stored.submission_id = next_submission_id_.fetch_add(1);
  auto& stripe = StripeForTeam(attempt.team_id);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  if (stored.outcome == SubmissionOutcome::kCorrect) {
    bool inserted = stripe.solved.emplace(attempt.team_id, attempt.challenge_id).second;
    if (!inserted) {
      stored.outcome = SubmissionOutcome::kDuplicate;
      stored.value_snapshot = 0;
    }
  } else {
    stored.value_snapshot = 0;
  }
  stripe.submissions[attempt.team_id].push_back(stored);
  return stored;
}

HintInsertStatus MemoryLedgerStore::InsertHintUnlock(const HintUnlock& unlock,
                                                     const std::vector<int>& prerequisite_hint_ids) {
  MaybeFail();
  auto& stripe = StripeForTeam(unlock.team_id);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  auto key = std::make_pair(unlock.team_id, unlock.hint_id);
  if (stripe.hint_unlocks.count(key) > 0) {
    return HintInsertStatus::kDuplicate;
  }
  for (int prerequisite : prerequisite_hint_ids) {
    if (stripe.hint_unlocks.count(std::make_pair(unlock.team_id, prerequisite)) == 0) {
      return HintInsertStatus::kMissingPrerequisite;
    }
  }
  stripe.hint_unlocks.emplace(key, unlock);
  return HintInsertStatus::kInserted;
}

std::optional<KothState> MemoryLedgerStore::LoadKothState(int target_id) {
  MaybeFail();
  auto& stripe = StripeForTarget(target_id);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  auto it = stripe.states.find(target_id);
  if (it == stripe.states.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryLedgerStore::CloseOpenClaim(std::vector<KothClaim>& claims, TimePoint at) {
  for (auto& claim : claims) {
    if (!claim.released_at) {
      claim.released_at = at;
    }
  }
}

KothCommit MemoryLedgerStore::CommitKothTransition(const KothTransition& transition) {
  if (transition.kind == KothTransitionKind::kClaim && !transition.new_owner_team_id) {
    throw ValidationError("invalid_input", "새 소유 팀이 필요합니다");
  }
  MaybeFail();
  auto& stripe = StripeForTarget(transition.target_id);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  auto it = stripe.states.find(transition.target_id);
  if (it == stripe.states.end()) {
    throw ValidationError("not_found", "KOTH 대상을 찾을 수 없습니다");
  }
  KothState& state = it->second;
  if (state.version != transition.expected_version || state.closed) {
    return KothCommit{false, state, std::nullopt};
  }

  std::optional<KothAccrual> accrual = transition.accrual;
  if (accrual) {
    accrual->accrual_id = next_accrual_id_.fetch_add(1);
    accrual->target_id = transition.target_id;
    // 대상 스트라이프 -> 팀 스트라이프 순서로만 잠근다.
    auto& team_stripe = StripeForTeam(accrual->team_id);
    std::lock_guard<std::mutex> team_lock(team_stripe.mutex);
    team_stripe.accruals[accrual->team_id].push_back(*accrual);
  }

  auto& claims = stripe.claims[transition.target_id];
  switch (transition.kind) {
    case KothTransitionKind::kClaim: {
      CloseOpenClaim(claims, transition.at);
      claims.push_back(KothClaim{next_claim_id_.fetch_add(1), transition.target_id, *transition.new_owner_team_id,
                                 transition.at, std::nullopt});
      state.owner_team_id = transition.new_owner_team_id;
      state.owner_since = transition.at;
      state.accrued_until = transition.at;
      break;
    }
    case KothTransitionKind::kSettle:
      state.accrued_until = accrual ? accrual->accrued_to : transition.at;
      break;
    case KothTransitionKind::kClose:
      CloseOpenClaim(claims, transition.at);
      state.owner_team_id.reset();
      state.accrued_until = transition.at;
      state.closed = true;
      break;
  }
  ++state.version;
  return KothCommit{true, state, accrual};
}

std::vector<Submission> MemoryLedgerStore::SubmissionsForTeam(int team_id) {
  MaybeFail();
  auto& stripe = StripeForTeam(team_id);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  auto it = stripe.submissions.find(team_id);
  if (it == stripe.submissions.end()) {
    return {};
  }
  return it->second;
}

std::vector<HintUnlock> MemoryLedgerStore::HintUnlocksForTeam(int team_id) {
  MaybeFail();
  auto& stripe = StripeForTeam(team_id);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  std::vector<HintUnlock> result;
  auto it = stripe.hint_unlocks.lower_bound(std::make_pair(team_id, std::numeric_limits<int>::min()));
  for (; it != stripe.hint_unlocks.end() && it->first.first == team_id; ++it) {
    result.push_back(it->second);
  }
  return result;
}

std::vector<KothClaim> MemoryLedgerStore::ClaimsForTarget(int target_id) {
  MaybeFail();
  auto& stripe = StripeForTarget(target_id);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  auto it = stripe.claims.find(target_id);
  if (it == stripe.claims.end()) {
    return {};
  }
  return it->second;
}

std::vector<ScoreEvent> MemoryLedgerStore::ScoreEventsForTeam(int team_id) {
  MaybeFail();
  auto& stripe = StripeForTeam(team_id);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  std::vector<ScoreEvent> events;
  auto sub_it = stripe.submissions.find(team_id);
  if (sub_it != stripe.submissions.end()) {
    for (const auto& submission : sub_it->second) {
      if (submission.outcome == SubmissionOutcome::kCorrect) {
        events.push_back(SolveEvent(submission));
      }
    }
  }
  auto hint_it = stripe.hint_unlocks.lower_bound(std::make_pair(team_id, std::numeric_limits<int>::min()));
  for (; hint_it != stripe.hint_unlocks.end() && hint_it->first.first == team_id; ++hint_it) {
    events.push_back(HintEvent(hint_it->second));
  }
  auto accrual_it = stripe.accruals.find(team_id);
  if (accrual_it != stripe.accruals.end()) {
    for (const auto& accrual : accrual_it->second) {
      events.push_back(AccrualEvent(accrual));
    }
  }
  return events;
}

}  // namespace ctfscore
