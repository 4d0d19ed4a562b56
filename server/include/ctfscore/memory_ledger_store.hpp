/*
 * 설명: 프로세스 내 원장 저장소. 팀/대상 단위 락 스트라이프로 조건부 삽입과 CAS를 보장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_ledger_store_test.cpp
 */
#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ctfscore/ledger_store.hpp"

namespace ctfscore {

class MemoryLedgerStore : public LedgerStore {
 public:
  MemoryLedgerStore() = default;

  void PutChallenge(const Challenge& challenge) override;
  void PutHint(const Hint& hint) override;
  void PutTeam(const Team& team) override;
  void PutKothTarget(const KothTarget& target) override;

  std::optional<Challenge> FindChallenge(int challenge_id) override;
  std::optional<Hint> FindHint(int hint_id) override;
  std::vector<Hint> HintsForChallenge(int challenge_id) override;
  std::optional<Team> FindTeam(int team_id) override;
  std::vector<Team> ListTeams() override;
  std::optional<KothTarget> FindKothTarget(int target_id) override;
  std::vector<KothTarget> ListKothTargets() override;

  Submission AppendSubmission(const Submission& attempt) override;
  HintInsertStatus InsertHintUnlock(const HintUnlock& unlock, const std::vector<int>& prerequisite_hint_ids) override;

  std::optional<KothState> LoadKothState(int target_id) override;
  KothCommit CommitKothTransition(const KothTransition& transition) override;

  std::vector<Submission> SubmissionsForTeam(int team_id) override;
  std::vector<HintUnlock> HintUnlocksForTeam(int team_id) override;
  std::vector<KothClaim> ClaimsForTarget(int target_id) override;
  std::vector<ScoreEvent> ScoreEventsForTeam(int team_id) override;

  // true를 돌려주면 해당 호출이 StoreUnavailable로 실패한다.
  void SetFaultInjector(const std::function<bool()>& injector);

 private:
  static constexpr std::size_t kStripes = 16;

  struct TeamStripe {
    std::mutex mutex;
    std::unordered_map<int, std::vector<Submission>> submissions;
    std::set<std::pair<int, int>> solved;
    std::map<std::pair<int, int>, HintUnlock> hint_unlocks;
    std::unordered_map<int, std::vector<KothAccrual>> accruals;
  };

  struct TargetStripe {
    std::mutex mutex;
    std::unordered_map<int, KothState> states;
    std::unordered_map<int, std::vector<KothClaim>> claims;
  };

  TeamStripe& StripeForTeam(int team_id);
  TargetStripe& StripeForTarget(int target_id);
  void MaybeFail() const;
  static void CloseOpenClaim(std::vector<KothClaim>& claims, TimePoint at);

  mutable std::shared_mutex catalog_mutex_;
  std::map<int, Challenge> challenges_;
  std::map<int, Hint> hints_;
  std::map<int, Team> teams_;
  std::map<int, KothTarget> koth_targets_;

  std::array<TeamStripe, kStripes> team_stripes_;
  std::array<TargetStripe, kStripes> target_stripes_;

  std::atomic<std::int64_t> next_submission_id_{1};
  std::atomic<std::int64_t> next_claim_id_{1};
  std::atomic<std::int64_t> next_accrual_id_{1};

  mutable std::mutex fault_mutex_;
  std::function<bool()> fault_injector_;
};

}  // namespace ctfscore
