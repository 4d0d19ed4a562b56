/*
 * 설명: 조건부 삽입과 CAS 전이를 제공하는 원장 저장소 계약을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/unit/memory_ledger_store_test.cpp, server/tests/it/mariadb_ledger_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "ctfscore/model.hpp"

namespace ctfscore {

// schema.sql의 flag, submitted_text, proof 열 너비
inline constexpr std::size_t kMaxFlagLength = 255;

enum class HintInsertStatus { kInserted, kDuplicate, kMissingPrerequisite };

// 모든 메서드는 저장소 장애 시 StoreUnavailable을 던지며 부분 상태를 남기지 않는다.
class LedgerStore {
 public:
  virtual ~LedgerStore() = default;

  // 카탈로그는 외부 관리 도구가 채운다.
  virtual void PutChallenge(const Challenge& challenge) = 0;
  virtual void PutHint(const Hint& hint) = 0;
  virtual void PutTeam(const Team& team) = 0;
  virtual void PutKothTarget(const KothTarget& target) = 0;

  virtual std::optional<Challenge> FindChallenge(int challenge_id) = 0;
  virtual std::optional<Hint> FindHint(int hint_id) = 0;
  virtual std::vector<Hint> HintsForChallenge(int challenge_id) = 0;
  virtual std::optional<Team> FindTeam(int team_id) = 0;
  virtual std::vector<Team> ListTeams() = 0;
  virtual std::optional<KothTarget> FindKothTarget(int target_id) = 0;
  virtual std::vector<KothTarget> ListKothTargets() = 0;

  // 시도 행을 항상 추가한다. kCorrect 시도는 (팀, 문제)당 한 번만 수상 행이 되고,
  // 조건부 삽입에서 진 시도는 kDuplicate로 기록되어 반환된다.
  virtual Submission AppendSubmission(const Submission& attempt) = 0;

  // 선행 힌트 확인과 (팀, 힌트) 조건부 삽입을 하나의 트랜잭션으로 수행한다.
  virtual HintInsertStatus InsertHintUnlock(const HintUnlock& unlock, const std::vector<int>& prerequisite_hint_ids) = 0;

  virtual std::optional<KothState> LoadKothState(int target_id) = 0;
  // expected_version이 현재 버전과 같을 때만 전이를 반영한다. 실패하면 현재 상태를 돌려준다.
  virtual KothCommit CommitKothTransition(const KothTransition& transition) = 0;

  virtual std::vector<Submission> SubmissionsForTeam(int team_id) = 0;
  virtual std::vector<HintUnlock> HintUnlocksForTeam(int team_id) = 0;
  virtual std::vector<KothClaim> ClaimsForTarget(int target_id) = 0;
  // 수상, 힌트 차감, KOTH 적립을 점수 이벤트로 모두 돌려준다. 재계산의 기준이다.
  virtual std::vector<ScoreEvent> ScoreEventsForTeam(int team_id) = 0;
};

// 카탈로그 값 범위 검사. 위반 시 ValidationError를 던진다.
void ValidateChallenge(const Challenge& challenge);
void ValidateHint(const Hint& hint);
void ValidateTeam(const Team& team);
void ValidateKothTarget(const KothTarget& target);
void ValidateSubmission(const Submission& attempt);

}  // namespace ctfscore
