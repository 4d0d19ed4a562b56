/*
 * 설명: MariaDB 기반 원장 저장소. 유일 인덱스 중복(1062)을 조건부 삽입의 패배로,
 *       버전 비교 UPDATE를 KOTH CAS로 사용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/mariadb_ledger_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "ctfscore/db_client.hpp"
#include "ctfscore/errors.hpp"
#include "ctfscore/ledger_store.hpp"

namespace ctfscore {

class MariaDbLedgerStore : public LedgerStore {
 public:
  explicit MariaDbLedgerStore(std::shared_ptr<MariaDbClient> db_client);

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

  void ClearAll() const;

 private:
  template <typename Fn>
  auto Guarded(Fn&& fn) const -> decltype(fn()) {
    try {
      return fn();
    } catch (const DbException& ex) {
      throw StoreUnavailable(ex.what());
    }
  }

  std::optional<KothState> LoadKothStateInTx(MYSQL* conn, int target_id) const;
  std::vector<Team> LoadTeams(MYSQL* conn, const std::string& where) const;

  Challenge BuildChallenge(MYSQL_ROW row) const;
  Hint BuildHint(MYSQL_ROW row) const;
  KothTarget BuildKothTarget(MYSQL_ROW row) const;
  Submission BuildSubmission(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace ctfscore
