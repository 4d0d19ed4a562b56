/*
 * 설명: 제출 시도 기록과 조건부 수상을 저장소에 위임하고 새 수상만 집계기에 반영한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/submission_validator_test.cpp
 */
#include "ctfscore/submission_validator.hpp"

#include "ctfscore/errors.hpp"
#include "ctfscore/flag.hpp"

namespace ctfscore {

const char* ToString(SubmitOutcome outcome) {
  switch (outcome) {
    case SubmitOutcome::kAccepted:
      return "accepted";
    case SubmitOutcome::kAlreadySolved:
      return "already-solved";
    case SubmitOutcome::kIncorrect:
      return "incorrect";
  }
  return "incorrect";
}

bool CompetitionWindow::Contains(TimePoint at) const {
  if (start && at < *start) {
    return false;
  }
  if (end && at >= *end) {
    return false;
  }
  return true;
}

Team RequireActiveMember(LedgerStore& store, const CompetitionWindow& window, int team_id, int user_id,
                         TimePoint at) {
  if (!window.Contains(at)) {
    throw ValidationError("competition_not_running", "대회 진행 시간이 아닙니다");
  }
  auto team = store.FindTeam(team_id);
  if (!team) {
    throw ValidationError("not_found", "팀을 찾을 수 없습니다");
  }
  if (!team->members.empty() && !team->HasMember(user_id)) {
    throw ValidationError("not_team_member", "팀 구성원이 아닙니다");
  }
  return *team;
}

SubmissionValidator::SubmissionValidator(std::shared_ptr<LedgerStore> store,
                                         std::shared_ptr<ScoreAggregator> aggregator,
                                         std::shared_ptr<Observability> observability, CompetitionWindow window,
                                         ClockFn clock)
    : store_(std::move(store)),
      aggregator_(std::move(aggregator)),
      observability_(std::move(observability)),
      window_(window),
      clock_(std::move(clock)) {}

SubmitResult SubmissionValidator::Submit(int team_id, int user_id, int challenge_id, const std::string& text) {
  auto now = TruncateToMicros(clock_());
  auto trimmed = TrimCopy(text);
  if (trimmed.empty()) {
    throw ValidationError("invalid_input", "플래그가 비어 있습니다");
  }
  if (text.size() > kMaxSubmissionLength) {
    throw ValidationError("invalid_input", "플래그가 너무 깁니다");
  }

  auto challenge = store_->FindChallenge(challenge_id);
  if (!challenge) {
    throw ValidationError("not_found", "문제를 찾을 수 없습니다");
  }
  if (challenge->hidden || challenge->retired) {
    throw ValidationError("challenge_unavailable", "제출할 수 없는 문제입니다");
  }
  RequireActiveMember(*store_, window_, team_id, user_id, now);

  Submission attempt;
  attempt.team_id = team_id;
  attempt.challenge_id = challenge_id;
  attempt.user_id = user_id;
  attempt.text = text;
  attempt.submitted_at = now;
  attempt.value_snapshot = challenge->value;
  attempt.outcome = FlagMatches(challenge->flag, text, challenge->case_sensitive) ? SubmissionOutcome::kCorrect
                                                                                 : SubmissionOutcome::kIncorrect;

  auto stored = store_->AppendSubmission(attempt);

  SubmitResult result;
  result.category = challenge->category;
  result.submission = stored;
  switch (stored.outcome) {
    case SubmissionOutcome::kCorrect:
      result.outcome = SubmitOutcome::kAccepted;
      result.awarded = stored.value_snapshot;
      aggregator_->Apply(SolveEvent(stored));
      break;
    case SubmissionOutcome::kDuplicate:
      result.outcome = SubmitOutcome::kAlreadySolved;
      break;
    case SubmissionOutcome::kIncorrect:
      result.outcome = SubmitOutcome::kIncorrect;
      break;
  }

  if (observability_) {
    observability_->IncrementSubmission(result.outcome == SubmitOutcome::kAccepted);
    observability_->Log(LogContext{"", team_id, "submission.recorded", 0, LogLevel::kDebug,
                                   {{"challengeId", challenge_id},
                                    {"userId", user_id},
                                    {"outcome", ToString(result.outcome)},
                                    {"awarded", result.awarded}}});
  }
  return result;
}

}  // namespace ctfscore
