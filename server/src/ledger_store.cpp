/*
 * 설명: 저장소 구현이 공유하는 카탈로그/제출 값 검사를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: server/db/schema.sql
 */
#include "ctfscore/ledger_store.hpp"

#include "ctfscore/errors.hpp"
#include "ctfscore/flag.hpp"

namespace ctfscore {
void ValidateChallenge(const Challenge& challenge) {
  if (challenge.challenge_id <= 0) {
    throw ValidationError("invalid_input", "문제 ID는 양수여야 합니다");
  }
  if (challenge.value < 0) {
    throw ValidationError("invalid_input", "문제 점수는 음수일 수 없습니다");
  }
  if (TrimCopy(challenge.flag).empty() || challenge.flag.size() > kMaxFlagLength) {
    throw ValidationError("invalid_input", "플래그가 비어 있거나 너무 깁니다");
  }
}

void ValidateHint(const Hint& hint) {
  if (hint.hint_id <= 0 || hint.challenge_id <= 0) {
    throw ValidationError("invalid_input", "힌트/문제 ID는 양수여야 합니다");
  }
  if (hint.cost < 0) {
    throw ValidationError("invalid_input", "힌트 비용은 음수일 수 없습니다");
  }
}

void ValidateTeam(const Team& team) {
  if (team.team_id <= 0) {
    throw ValidationError("invalid_input", "팀 ID는 양수여야 합니다");
  }
  if (team.name.empty()) {
    throw ValidationError("invalid_input", "팀 이름이 필요합니다");
  }
}

void ValidateKothTarget(const KothTarget& target) {
  if (target.target_id <= 0) {
    throw ValidationError("invalid_input", "KOTH 대상 ID는 양수여야 합니다");
  }
  if (target.rule == CaptureRule::kProof && TrimCopy(target.proof).empty()) {
    throw ValidationError("invalid_input", "증명 규칙 대상에는 증명 값이 필요합니다");
  }
  if (target.proof.size() > kMaxFlagLength) {
    throw ValidationError("invalid_input", "증명 값이 너무 깁니다");
  }
}

void ValidateSubmission(const Submission& attempt) {
  if (attempt.text.empty() || attempt.text.size() > kMaxFlagLength) {
    throw ValidationError("invalid_input", "제출 문자열이 비어 있거나 너무 깁니다");
  }
}

}  // namespace ctfscore
