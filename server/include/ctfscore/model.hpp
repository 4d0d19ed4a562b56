/*
 * 설명: 채점 코어가 다루는 문제/힌트/팀/제출/KOTH 레코드와 점수 이벤트를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ctfscore {

using TimePoint = std::chrono::system_clock::time_point;
using ClockFn = std::function<TimePoint()>;

inline ClockFn SystemClock() {
  return []() { return std::chrono::system_clock::now(); };
}

// 원장 시각은 저장소 정밀도(마이크로초)에 맞춘다.
inline TimePoint TruncateToMicros(TimePoint tp) {
  return std::chrono::time_point_cast<std::chrono::microseconds>(tp);
}

struct Challenge {
  int challenge_id{0};
  std::string title;
  std::string category;
  int value{0};
  std::string flag;
  bool hidden{false};
  bool retired{false};
  bool case_sensitive{false};
};

struct Hint {
  int hint_id{0};
  int challenge_id{0};
  int cost{0};
  int rank{0};
  std::string text;
};

struct Team {
  int team_id{0};
  std::string name;
  std::vector<int> members;
  std::string affiliation;
  TimePoint registered_at{};

  bool HasMember(int user_id) const;
};

// kDuplicate는 이미 해결한 문제에 대해 다시 맞힌 시도다. 점수에는 반영되지 않는다.
enum class SubmissionOutcome { kCorrect, kIncorrect, kDuplicate };

struct Submission {
  std::int64_t submission_id{0};
  int team_id{0};
  int challenge_id{0};
  int user_id{0};
  std::string text;
  TimePoint submitted_at{};
  SubmissionOutcome outcome{SubmissionOutcome::kIncorrect};
  int value_snapshot{0};
};

struct HintUnlock {
  int team_id{0};
  int hint_id{0};
  int challenge_id{0};
  int user_id{0};
  int cost{0};
  TimePoint unlocked_at{};
};

enum class CaptureRule { kOpen, kProof };

struct KothTarget {
  int target_id{0};
  std::string name;
  CaptureRule rule{CaptureRule::kProof};
  std::string proof;
};

struct KothClaim {
  std::int64_t claim_id{0};
  int target_id{0};
  int team_id{0};
  TimePoint claimed_at{};
  std::optional<TimePoint> released_at;
};

struct KothAccrual {
  std::int64_t accrual_id{0};
  int target_id{0};
  int team_id{0};
  int points{0};
  TimePoint accrued_from{};
  TimePoint accrued_to{};
};

// 대상별 소유 상태. version은 CAS 비교 기준이며 전이마다 1씩 증가한다.
struct KothState {
  int target_id{0};
  std::optional<int> owner_team_id;
  TimePoint owner_since{};
  TimePoint accrued_until{};
  std::uint64_t version{0};
  bool closed{false};
};

enum class KothTransitionKind { kClaim, kSettle, kClose };

struct KothTransition {
  KothTransitionKind kind{KothTransitionKind::kClaim};
  int target_id{0};
  std::uint64_t expected_version{0};
  std::optional<int> new_owner_team_id;
  TimePoint at{};
  std::optional<KothAccrual> accrual;
};

struct KothCommit {
  bool committed{false};
  KothState state;
  std::optional<KothAccrual> accrual;
};

enum class ScoreEventKind { kSolve, kHintUnlock, kKothAccrual, kRecompute };

struct ScoreEvent {
  std::string key;
  int team_id{0};
  ScoreEventKind kind{ScoreEventKind::kSolve};
  int delta{0};
  TimePoint at{};
};

std::string SolveKey(int team_id, int challenge_id);
std::string HintKey(int team_id, int hint_id);
std::string AccrualKey(std::int64_t accrual_id);

ScoreEvent SolveEvent(const Submission& submission);
ScoreEvent HintEvent(const HintUnlock& unlock);
ScoreEvent AccrualEvent(const KothAccrual& accrual);

struct LeaderboardEntry {
  int rank{0};
  int team_id{0};
  std::string name;
  int score{0};
  std::optional<TimePoint> last_solve_at;
};

const char* ToString(SubmissionOutcome outcome);
std::optional<SubmissionOutcome> ParseSubmissionOutcome(const std::string& text);
const char* ToString(CaptureRule rule);

}  // namespace ctfscore
