/*
 * 설명: 레코드 보조 함수와 점수 이벤트 키 규칙을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "ctfscore/model.hpp"

#include <algorithm>

namespace ctfscore {

bool Team::HasMember(int user_id) const {
  return std::find(members.begin(), members.end(), user_id) != members.end();
}

std::string SolveKey(int team_id, int challenge_id) {
  return "solve:" + std::to_string(team_id) + ":" + std::to_string(challenge_id);
}

std::string HintKey(int team_id, int hint_id) {
  return "hint:" + std::to_string(team_id) + ":" + std::to_string(hint_id);
}

std::string AccrualKey(std::int64_t accrual_id) { return "accrual:" + std::to_string(accrual_id); }

ScoreEvent SolveEvent(const Submission& submission) {
  return ScoreEvent{SolveKey(submission.team_id, submission.challenge_id), submission.team_id, ScoreEventKind::kSolve,
                    submission.value_snapshot, submission.submitted_at};
}

ScoreEvent HintEvent(const HintUnlock& unlock) {
  return ScoreEvent{HintKey(unlock.team_id, unlock.hint_id), unlock.team_id, ScoreEventKind::kHintUnlock,
                    -unlock.cost, unlock.unlocked_at};
}

ScoreEvent AccrualEvent(const KothAccrual& accrual) {
  return ScoreEvent{AccrualKey(accrual.accrual_id), accrual.team_id, ScoreEventKind::kKothAccrual, accrual.points,
                    accrual.accrued_to};
}

const char* ToString(SubmissionOutcome outcome) {
  switch (outcome) {
    case SubmissionOutcome::kCorrect:
      return "correct";
    case SubmissionOutcome::kIncorrect:
      return "incorrect";
    case SubmissionOutcome::kDuplicate:
      return "duplicate";
  }
  return "incorrect";
}

std::optional<SubmissionOutcome> ParseSubmissionOutcome(const std::string& text) {
  if (text == "correct") {
    return SubmissionOutcome::kCorrect;
  }
  if (text == "incorrect") {
    return SubmissionOutcome::kIncorrect;
  }
  if (text == "duplicate") {
    return SubmissionOutcome::kDuplicate;
  }
  return std::nullopt;
}

const char* ToString(CaptureRule rule) { return rule == CaptureRule::kOpen ? "open" : "proof"; }

}  // namespace ctfscore
