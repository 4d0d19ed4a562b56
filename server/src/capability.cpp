/*
 * 설명: 역할 문자열 해석과 역할별 권한 검사.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/capability_test.cpp
 */
#include "ctfscore/capability.hpp"

#include "ctfscore/errors.hpp"

namespace ctfscore {

std::optional<Role> ParseRole(const std::string& text) {
  if (text == "player") {
    return Role::kPlayer;
  }
  if (text == "judge") {
    return Role::kJudge;
  }
  if (text == "editor") {
    return Role::kEditor;
  }
  if (text == "superadmin") {
    return Role::kSuperadmin;
  }
  return std::nullopt;
}

const char* ToString(Role role) {
  switch (role) {
    case Role::kPlayer:
      return "player";
    case Role::kJudge:
      return "judge";
    case Role::kEditor:
      return "editor";
    case Role::kSuperadmin:
      return "superadmin";
  }
  return "player";
}

const char* ToString(Capability capability) {
  switch (capability) {
    case Capability::kSubmitFlag:
      return "submit_flag";
    case Capability::kUnlockHint:
      return "unlock_hint";
    case Capability::kClaimKoth:
      return "claim_koth";
    case Capability::kViewScores:
      return "view_scores";
    case Capability::kReconcile:
      return "reconcile";
    case Capability::kCloseCompetition:
      return "close_competition";
  }
  return "";
}

bool HasCapability(Role role, Capability capability) {
  switch (role) {
    case Role::kSuperadmin:
      return true;
    case Role::kPlayer:
      return capability == Capability::kSubmitFlag || capability == Capability::kUnlockHint ||
             capability == Capability::kClaimKoth || capability == Capability::kViewScores;
    case Role::kJudge:
      return capability == Capability::kViewScores || capability == Capability::kReconcile;
    case Role::kEditor:
      return capability == Capability::kViewScores;
  }
  return false;
}

void RequireCapability(const Principal& principal, Capability capability) {
  if (!HasCapability(principal.role, capability)) {
    throw PermissionDenied(std::string(ToString(principal.role)) + " 역할에는 " + ToString(capability) +
                           " 권한이 없습니다");
  }
}

}  // namespace ctfscore
