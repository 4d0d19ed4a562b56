/*
 * 설명: 제출/힌트/KOTH 원장을 MariaDB에 저장하고 중복과 경합을 DB 제약으로 해소한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/mariadb_ledger_store_it_test.cpp
 */
#include "ctfscore/mariadb_ledger_store.hpp"

#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

#include <mariadb/errmsg.h>

namespace ctfscore {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;
constexpr unsigned int kForeignKeyMissing = 1452;

int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
std::int64_t ToInt64(const char* value) { return value ? std::stoll(value) : 0; }
bool ToBool(const char* value) { return value && std::string(value) != "0"; }
std::string ToText(const char* value) { return value ? value : ""; }

std::string FormatTimestamp(TimePoint tp) {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
  std::time_t secs = static_cast<std::time_t>(micros / 1'000'000);
  long frac = static_cast<long>(micros % 1'000'000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << frac;
  return oss.str();
}

TimePoint ParseTimestamp(const char* text) {
  if (!text) {
    return TimePoint{};
  }
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  long micros = 0;
  if (iss.peek() == '.') {
    iss.get();
    std::string frac;
    iss >> frac;
    frac.resize(6, '0');
    micros = std::stol(frac.substr(0, 6));
  }
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
  return tp + std::chrono::microseconds(micros);
}

std::string Quoted(TimePoint tp) { return "'" + FormatTimestamp(tp) + "'"; }

std::string JoinIds(const std::vector<int>& ids) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) {
      oss << ",";
    }
    oss << ids[i];
  }
  return oss.str();
}

const char* kChallengeColumns = "challenge_id, title, category, value, flag, hidden, retired, case_sensitive";
const char* kHintColumns = "hint_id, challenge_id, cost, hint_rank, body";
const char* kTargetColumns = "target_id, name, capture_rule, proof";
const char* kSubmissionColumns =
    "submission_id, team_id, challenge_id, user_id, submitted_text, submitted_at, outcome, value_snapshot";
const char* kStateColumns = "target_id, owner_team_id, owner_since, accrued_until, version, closed";
}  // namespace

MariaDbLedgerStore::MariaDbLedgerStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void MariaDbLedgerStore::PutChallenge(const Challenge& challenge) {
  ValidateChallenge(challenge);
  Guarded([&]() {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "INSERT INTO challenges(" << kChallengeColumns << ") VALUES(" << challenge.challenge_id << ", '"
          << db_client_->Escape(conn, challenge.title) << "', '" << db_client_->Escape(conn, challenge.category)
          << "', " << challenge.value << ", '" << db_client_->Escape(conn, challenge.flag) << "', "
          << (challenge.hidden ? 1 : 0) << ", " << (challenge.retired ? 1 : 0) << ", "
          << (challenge.case_sensitive ? 1 : 0)
          << ") ON DUPLICATE KEY UPDATE title=VALUES(title), category=VALUES(category), value=VALUES(value), "
             "flag=VALUES(flag), hidden=VALUES(hidden), retired=VALUES(retired), "
             "case_sensitive=VALUES(case_sensitive);";
      db_client_->Execute(conn, oss.str(), "문제 저장 실패");
      return true;
    });
  });
}

void MariaDbLedgerStore::PutHint(const Hint& hint) {
  ValidateHint(hint);
  Guarded([&]() {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      // 힌트 ID로만 갱신한다. 순번 유일 키에 걸리면 다른 힌트를 덮어쓰지 않고 거부한다.
      bool exists = false;
      std::ostringstream lookup;
      lookup << "SELECT hint_id FROM hints WHERE hint_id=" << hint.hint_id << " FOR UPDATE;";
      db_client_->ForEachRow(conn, lookup.str(), "힌트 조회 실패", [&](MYSQL_ROW) { exists = true; });
      std::ostringstream oss;
      if (exists) {
        oss << "UPDATE hints SET challenge_id=" << hint.challenge_id << ", cost=" << hint.cost
            << ", hint_rank=" << hint.rank << ", body='" << db_client_->Escape(conn, hint.text)
            << "' WHERE hint_id=" << hint.hint_id << ";";
      } else {
        oss << "INSERT INTO hints(" << kHintColumns << ") VALUES(" << hint.hint_id << ", " << hint.challenge_id
            << ", " << hint.cost << ", " << hint.rank << ", '" << db_client_->Escape(conn, hint.text) << "');";
      }
      if (mysql_query(conn, oss.str().c_str()) != 0) {
        unsigned int code = mysql_errno(conn);
        if (code == kForeignKeyMissing) {
          throw ValidationError("not_found", "힌트가 속한 문제가 없습니다");
        }
        if (code == kDuplicateEntry) {
          throw ValidationError("invalid_input", "같은 문제에 동일한 순번의 힌트가 이미 있습니다");
        }
        db_client_->RaiseError(conn, "힌트 저장 실패");
      }
      return true;
    });
  });
}

void MariaDbLedgerStore::PutTeam(const Team& team) {
  ValidateTeam(team);
  Guarded([&]() {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      // 팀 ID로만 갱신한다. 1062는 이름 충돌뿐이다.
      bool exists = false;
      std::ostringstream lookup;
      lookup << "SELECT team_id FROM teams WHERE team_id=" << team.team_id << " FOR UPDATE;";
      db_client_->ForEachRow(conn, lookup.str(), "팀 조회 실패", [&](MYSQL_ROW) { exists = true; });
      std::ostringstream oss;
      if (exists) {
        oss << "UPDATE teams SET name='" << db_client_->Escape(conn, team.name) << "', affiliation='"
            << db_client_->Escape(conn, team.affiliation) << "' WHERE team_id=" << team.team_id << ";";
      } else {
        oss << "INSERT INTO teams(team_id, name, affiliation, registered_at) VALUES(" << team.team_id << ", '"
            << db_client_->Escape(conn, team.name) << "', '" << db_client_->Escape(conn, team.affiliation) << "', "
            << Quoted(team.registered_at) << ");";
      }
      if (mysql_query(conn, oss.str().c_str()) != 0) {
        if (mysql_errno(conn) == kDuplicateEntry) {
          throw ValidationError("invalid_input", "이미 존재하는 팀 이름입니다");
        }
        db_client_->RaiseError(conn, "팀 저장 실패");
      }
      std::ostringstream clear;
      clear << "DELETE FROM team_members WHERE team_id=" << team.team_id << ";";
      db_client_->Execute(conn, clear.str(), "팀원 초기화 실패");
      for (int member : team.members) {
        std::ostringstream insert;
        insert << "INSERT IGNORE INTO team_members(team_id, user_id) VALUES(" << team.team_id << ", " << member
               << ");";
        db_client_->Execute(conn, insert.str(), "팀원 저장 실패");
      }
      return true;
    });
  });
}

void MariaDbLedgerStore::PutKothTarget(const KothTarget& target) {
  ValidateKothTarget(target);
  Guarded([&]() {
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "INSERT INTO koth_targets(" << kTargetColumns << ") VALUES(" << target.target_id << ", '"
          << db_client_->Escape(conn, target.name) << "', '" << ToString(target.rule) << "', '"
          << db_client_->Escape(conn, target.proof)
          << "') ON DUPLICATE KEY UPDATE name=VALUES(name), capture_rule=VALUES(capture_rule), proof=VALUES(proof);";
      db_client_->Execute(conn, oss.str(), "KOTH 대상 저장 실패");
      return true;
    });
  });
}

std::optional<Challenge> MariaDbLedgerStore::FindChallenge(int challenge_id) {
  return Guarded([&]() {
    std::optional<Challenge> result;
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "SELECT " << kChallengeColumns << " FROM challenges WHERE challenge_id=" << challenge_id << ";";
      db_client_->ForEachRow(conn, oss.str(), "문제 조회 실패", [&](MYSQL_ROW row) { result = BuildChallenge(row); });
    });
    return result;
  });
}

std::optional<Hint> MariaDbLedgerStore::FindHint(int hint_id) {
  return Guarded([&]() {
    std::optional<Hint> result;
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "SELECT " << kHintColumns << " FROM hints WHERE hint_id=" << hint_id << ";";
      db_client_->ForEachRow(conn, oss.str(), "힌트 조회 실패", [&](MYSQL_ROW row) { result = BuildHint(row); });
    });
    return result;
  });
}

std::vector<Hint> MariaDbLedgerStore::HintsForChallenge(int challenge_id) {
  return Guarded([&]() {
    std::vector<Hint> result;
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      result.clear();
      std::ostringstream oss;
      oss << "SELECT " << kHintColumns << " FROM hints WHERE challenge_id=" << challenge_id
          << " ORDER BY hint_rank ASC;";
      db_client_->ForEachRow(conn, oss.str(), "힌트 목록 조회 실패",
                             [&](MYSQL_ROW row) { result.push_back(BuildHint(row)); });
    });
    return result;
  });
}

std::vector<Team> MariaDbLedgerStore::LoadTeams(MYSQL* conn, const std::string& where) const {
  std::vector<Team> teams;
  std::map<int, std::size_t> index;
  db_client_->ForEachRow(conn, "SELECT team_id, name, affiliation, registered_at FROM teams " + where +
                                   " ORDER BY team_id ASC;",
                         "팀 조회 실패", [&](MYSQL_ROW row) {
                           Team team;
                           team.team_id = ToInt(row[0]);
                           team.name = ToText(row[1]);
                           team.affiliation = ToText(row[2]);
                           team.registered_at = ParseTimestamp(row[3]);
                           index[team.team_id] = teams.size();
                           teams.push_back(team);
                         });
  if (teams.empty()) {
    return teams;
  }
  db_client_->ForEachRow(conn, "SELECT team_id, user_id FROM team_members ORDER BY team_id, user_id;",
                         "팀원 조회 실패", [&](MYSQL_ROW row) {
                           auto it = index.find(ToInt(row[0]));
                           if (it != index.end()) {
                             teams[it->second].members.push_back(ToInt(row[1]));
                           }
                         });
  return teams;
}

std::optional<Team> MariaDbLedgerStore::FindTeam(int team_id) {
  return Guarded([&]() {
    std::optional<Team> result;
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      auto teams = LoadTeams(conn, "WHERE team_id=" + std::to_string(team_id));
      if (!teams.empty()) {
        result = teams.front();
      }
    });
    return result;
  });
}

std::vector<Team> MariaDbLedgerStore::ListTeams() {
  return Guarded([&]() {
    std::vector<Team> result;
    db_client_->WithConnectionRetry([&](MYSQL* conn) { result = LoadTeams(conn, ""); });
    return result;
  });
}

std::optional<KothTarget> MariaDbLedgerStore::FindKothTarget(int target_id) {
  return Guarded([&]() {
    std::optional<KothTarget> result;
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "SELECT " << kTargetColumns << " FROM koth_targets WHERE target_id=" << target_id << ";";
      db_client_->ForEachRow(conn, oss.str(), "KOTH 대상 조회 실패",
                             [&](MYSQL_ROW row) { result = BuildKothTarget(row); });
    });
    return result;
  });
}

std::vector<KothTarget> MariaDbLedgerStore::ListKothTargets() {
  return Guarded([&]() {
    std::vector<KothTarget> result;
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      result.clear();
      std::ostringstream oss;
      oss << "SELECT " << kTargetColumns << " FROM koth_targets ORDER BY target_id ASC;";
      db_client_->ForEachRow(conn, oss.str(), "KOTH 대상 목록 조회 실패",
                             [&](MYSQL_ROW row) { result.push_back(BuildKothTarget(row)); });
    });
    return result;
  });
}

Submission MariaDbLedgerStore::AppendSubmission(const Submission& attempt) {
  ValidateSubmission(attempt);
  return Guarded([&]() {
    Submission stored = attempt;
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      stored = attempt;
      auto insert = [&](bool award) {
        std::ostringstream oss;
        oss << "INSERT INTO submissions(team_id, challenge_id, user_id, submitted_text, submitted_at, outcome, "
               "value_snapshot, award_key) VALUES("
            << stored.team_id << ", " << stored.challenge_id << ", " << stored.user_id << ", '"
            << db_client_->Escape(conn, stored.text) << "', " << Quoted(stored.submitted_at) << ", '"
            << ToString(stored.outcome) << "', " << stored.value_snapshot << ", " << (award ? "1" : "NULL") << ");";
        if (mysql_query(conn, oss.str().c_str()) != 0) {
          if (award && mysql_errno(conn) == kDuplicateEntry) {
            return false;
          }
          db_client_->RaiseError(conn, "제출 저장 실패");
        }
        return true;
      };

      if (stored.outcome == SubmissionOutcome::kCorrect) {
        if (!insert(true)) {
          stored.outcome = SubmissionOutcome::kDuplicate;
          stored.value_snapshot = 0;
          insert(false);
        }
      } else {
        stored.value_snapshot = 0;
        insert(false);
      }
      stored.submission_id = static_cast<std::int64_t>(mysql_insert_id(conn));
      return true;
    });
    return stored;
  });
}

HintInsertStatus MariaDbLedgerStore::InsertHintUnlock(const HintUnlock& unlock,
                                                      const std::vector<int>& prerequisite_hint_ids) {
  return Guarded([&]() {
    HintInsertStatus status = HintInsertStatus::kInserted;
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      status = HintInsertStatus::kInserted;
      if (!prerequisite_hint_ids.empty()) {
        std::ostringstream check;
        check << "SELECT COUNT(*) FROM hint_unlocks WHERE team_id=" << unlock.team_id << " AND hint_id IN ("
              << JoinIds(prerequisite_hint_ids) << ") LOCK IN SHARE MODE;";
        std::size_t found = 0;
        db_client_->ForEachRow(conn, check.str(), "선행 힌트 조회 실패",
                               [&](MYSQL_ROW row) { found = static_cast<std::size_t>(ToInt64(row[0])); });
        if (found < prerequisite_hint_ids.size()) {
          status = HintInsertStatus::kMissingPrerequisite;
          return false;
        }
      }
      std::ostringstream oss;
      oss << "INSERT INTO hint_unlocks(team_id, hint_id, challenge_id, user_id, cost, unlocked_at) VALUES("
          << unlock.team_id << ", " << unlock.hint_id << ", " << unlock.challenge_id << ", " << unlock.user_id << ", "
          << unlock.cost << ", " << Quoted(unlock.unlocked_at) << ");";
      if (mysql_query(conn, oss.str().c_str()) != 0) {
        if (mysql_errno(conn) == kDuplicateEntry) {
          status = HintInsertStatus::kDuplicate;
          return false;
        }
        db_client_->RaiseError(conn, "힌트 해제 저장 실패");
      }
      return true;
    });
    return status;
  });
}

std::optional<KothState> MariaDbLedgerStore::LoadKothStateInTx(MYSQL* conn, int target_id) const {
  std::optional<KothState> result;
  std::ostringstream oss;
  oss << "SELECT " << kStateColumns << " FROM koth_targets WHERE target_id=" << target_id << ";";
  db_client_->ForEachRow(conn, oss.str(), "KOTH 상태 조회 실패", [&](MYSQL_ROW row) {
    KothState state;
    state.target_id = ToInt(row[0]);
    if (row[1]) {
      state.owner_team_id = ToInt(row[1]);
    }
    state.owner_since = ParseTimestamp(row[2]);
    state.accrued_until = ParseTimestamp(row[3]);
    state.version = static_cast<std::uint64_t>(ToInt64(row[4]));
    state.closed = ToBool(row[5]);
    result = state;
  });
  return result;
}

std::optional<KothState> MariaDbLedgerStore::LoadKothState(int target_id) {
  return Guarded([&]() {
    std::optional<KothState> result;
    db_client_->WithConnectionRetry([&](MYSQL* conn) { result = LoadKothStateInTx(conn, target_id); });
    return result;
  });
}

KothCommit MariaDbLedgerStore::CommitKothTransition(const KothTransition& transition) {
  if (transition.kind == KothTransitionKind::kClaim && !transition.new_owner_team_id) {
    throw ValidationError("invalid_input", "새 소유 팀이 필요합니다");
  }
  return Guarded([&]() {
    KothCommit result;
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      result = KothCommit{};
      std::ostringstream update;
      update << "UPDATE koth_targets SET ";
      switch (transition.kind) {
        case KothTransitionKind::kClaim:
          update << "owner_team_id=" << *transition.new_owner_team_id << ", owner_since=" << Quoted(transition.at)
                 << ", accrued_until=" << Quoted(transition.at);
          break;
        case KothTransitionKind::kSettle:
          update << "accrued_until="
                 << Quoted(transition.accrual ? transition.accrual->accrued_to : transition.at);
          break;
        case KothTransitionKind::kClose:
          update << "owner_team_id=NULL, owner_since=NULL, accrued_until=" << Quoted(transition.at) << ", closed=1";
          break;
      }
      update << ", version=version+1 WHERE target_id=" << transition.target_id
             << " AND version=" << transition.expected_version << " AND closed=0;";
      db_client_->Execute(conn, update.str(), "KOTH 상태 갱신 실패");
      if (mysql_affected_rows(conn) != 1) {
        auto current = LoadKothStateInTx(conn, transition.target_id);
        if (!current) {
          throw ValidationError("not_found", "KOTH 대상을 찾을 수 없습니다");
        }
        result.state = *current;
        return false;
      }

      if (transition.kind != KothTransitionKind::kSettle) {
        std::ostringstream release;
        release << "UPDATE koth_claims SET released_at=" << Quoted(transition.at)
                << ", open_key=NULL WHERE target_id=" << transition.target_id << " AND open_key=1;";
        db_client_->Execute(conn, release.str(), "이전 점유 종료 실패");
      }
      if (transition.kind == KothTransitionKind::kClaim) {
        std::ostringstream claim;
        claim << "INSERT INTO koth_claims(target_id, team_id, claimed_at, released_at, open_key) VALUES("
              << transition.target_id << ", " << *transition.new_owner_team_id << ", " << Quoted(transition.at)
              << ", NULL, 1);";
        db_client_->Execute(conn, claim.str(), "점유 기록 실패");
      }
      if (transition.accrual) {
        KothAccrual accrual = *transition.accrual;
        accrual.target_id = transition.target_id;
        std::ostringstream credit;
        credit << "INSERT INTO koth_accruals(target_id, team_id, points, accrued_from, accrued_to) VALUES("
               << accrual.target_id << ", " << accrual.team_id << ", " << accrual.points << ", "
               << Quoted(accrual.accrued_from) << ", " << Quoted(accrual.accrued_to) << ");";
        db_client_->Execute(conn, credit.str(), "적립 기록 실패");
        accrual.accrual_id = static_cast<std::int64_t>(mysql_insert_id(conn));
        result.accrual = accrual;
      }
      auto state = LoadKothStateInTx(conn, transition.target_id);
      if (!state) {
        throw DbException("KOTH 상태 재조회 누락", 0, false);
      }
      result.state = *state;
      result.committed = true;
      return true;
    });
    return result;
  });
}

std::vector<Submission> MariaDbLedgerStore::SubmissionsForTeam(int team_id) {
  return Guarded([&]() {
    std::vector<Submission> result;
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      result.clear();
      std::ostringstream oss;
      oss << "SELECT " << kSubmissionColumns << " FROM submissions WHERE team_id=" << team_id
          << " ORDER BY submission_id ASC;";
      db_client_->ForEachRow(conn, oss.str(), "제출 목록 조회 실패",
                             [&](MYSQL_ROW row) { result.push_back(BuildSubmission(row)); });
    });
    return result;
  });
}

std::vector<HintUnlock> MariaDbLedgerStore::HintUnlocksForTeam(int team_id) {
  return Guarded([&]() {
    std::vector<HintUnlock> result;
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      result.clear();
      std::ostringstream oss;
      oss << "SELECT team_id, hint_id, challenge_id, user_id, cost, unlocked_at FROM hint_unlocks WHERE team_id="
          << team_id << " ORDER BY hint_id ASC;";
      db_client_->ForEachRow(conn, oss.str(), "힌트 해제 목록 조회 실패", [&](MYSQL_ROW row) {
        result.push_back(HintUnlock{ToInt(row[0]), ToInt(row[1]), ToInt(row[2]), ToInt(row[3]), ToInt(row[4]),
                                    ParseTimestamp(row[5])});
      });
    });
    return result;
  });
}

std::vector<KothClaim> MariaDbLedgerStore::ClaimsForTarget(int target_id) {
  return Guarded([&]() {
    std::vector<KothClaim> result;
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      result.clear();
      std::ostringstream oss;
      oss << "SELECT claim_id, target_id, team_id, claimed_at, released_at FROM koth_claims WHERE target_id="
          << target_id << " ORDER BY claim_id ASC;";
      db_client_->ForEachRow(conn, oss.str(), "점유 이력 조회 실패", [&](MYSQL_ROW row) {
        KothClaim claim{ToInt64(row[0]), ToInt(row[1]), ToInt(row[2]), ParseTimestamp(row[3]), std::nullopt};
        if (row[4]) {
          claim.released_at = ParseTimestamp(row[4]);
        }
        result.push_back(claim);
      });
    });
    return result;
  });
}

std::vector<ScoreEvent> MariaDbLedgerStore::ScoreEventsForTeam(int team_id) {
  return Guarded([&]() {
    std::vector<ScoreEvent> events;
    db_client_->WithConnectionRetry([&](MYSQL* conn) {
      events.clear();
      // 세 테이블을 같은 스냅샷에서 읽는다.
      db_client_->Execute(conn, "START TRANSACTION WITH CONSISTENT SNAPSHOT;", "스냅샷 시작 실패");
      std::ostringstream solves;
      solves << "SELECT team_id, challenge_id, value_snapshot, submitted_at FROM submissions WHERE team_id="
             << team_id << " AND award_key=1;";
      db_client_->ForEachRow(conn, solves.str(), "수상 이벤트 조회 실패", [&](MYSQL_ROW row) {
        Submission solve;
        solve.team_id = ToInt(row[0]);
        solve.challenge_id = ToInt(row[1]);
        solve.value_snapshot = ToInt(row[2]);
        solve.submitted_at = ParseTimestamp(row[3]);
        events.push_back(SolveEvent(solve));
      });
      std::ostringstream hints;
      hints << "SELECT team_id, hint_id, challenge_id, user_id, cost, unlocked_at FROM hint_unlocks WHERE team_id="
            << team_id << ";";
      db_client_->ForEachRow(conn, hints.str(), "힌트 이벤트 조회 실패", [&](MYSQL_ROW row) {
        events.push_back(HintEvent(HintUnlock{ToInt(row[0]), ToInt(row[1]), ToInt(row[2]), ToInt(row[3]),
                                              ToInt(row[4]), ParseTimestamp(row[5])}));
      });
      std::ostringstream accruals;
      accruals << "SELECT accrual_id, target_id, team_id, points, accrued_from, accrued_to FROM koth_accruals "
                  "WHERE team_id="
               << team_id << ";";
      db_client_->ForEachRow(conn, accruals.str(), "적립 이벤트 조회 실패", [&](MYSQL_ROW row) {
        events.push_back(AccrualEvent(KothAccrual{ToInt64(row[0]), ToInt(row[1]), ToInt(row[2]), ToInt(row[3]),
                                                  ParseTimestamp(row[4]), ParseTimestamp(row[5])}));
      });
      db_client_->Execute(conn, "COMMIT;", "스냅샷 종료 실패");
    });
    return events;
  });
}

void MariaDbLedgerStore::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    for (const char* table : {"koth_accruals", "koth_claims", "koth_targets", "hint_unlocks", "submissions",
                              "team_members", "teams", "hints", "challenges"}) {
      db_client_->Execute(conn, std::string("DELETE FROM ") + table + ";", "테이블 초기화 실패");
    }
  });
}

Challenge MariaDbLedgerStore::BuildChallenge(MYSQL_ROW row) const {
  Challenge challenge;
  challenge.challenge_id = ToInt(row[0]);
  challenge.title = ToText(row[1]);
  challenge.category = ToText(row[2]);
  challenge.value = ToInt(row[3]);
  challenge.flag = ToText(row[4]);
  challenge.hidden = ToBool(row[5]);
  challenge.retired = ToBool(row[6]);
  challenge.case_sensitive = ToBool(row[7]);
  return challenge;
}

Hint MariaDbLedgerStore::BuildHint(MYSQL_ROW row) const {
  return Hint{ToInt(row[0]), ToInt(row[1]), ToInt(row[2]), ToInt(row[3]), ToText(row[4])};
}

KothTarget MariaDbLedgerStore::BuildKothTarget(MYSQL_ROW row) const {
  KothTarget target;
  target.target_id = ToInt(row[0]);
  target.name = ToText(row[1]);
  target.rule = ToText(row[2]) == "open" ? CaptureRule::kOpen : CaptureRule::kProof;
  target.proof = ToText(row[3]);
  return target;
}

Submission MariaDbLedgerStore::BuildSubmission(MYSQL_ROW row) const {
  Submission submission;
  submission.submission_id = ToInt64(row[0]);
  submission.team_id = ToInt(row[1]);
  submission.challenge_id = ToInt(row[2]);
  submission.user_id = ToInt(row[3]);
  submission.text = ToText(row[4]);
  submission.submitted_at = ParseTimestamp(row[5]);
  submission.outcome = ParseSubmissionOutcome(ToText(row[6])).value_or(SubmissionOutcome::kIncorrect);
  submission.value_snapshot = ToInt(row[7]);
  return submission;
}

}  // namespace ctfscore
