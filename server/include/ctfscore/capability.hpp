/*
 * 설명: 역할별 권한 표와 컴파일 타임 선택 모듈 표. 코어 연산 이전 경계에서 검사한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/capability_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ctfscore {

enum class Role { kPlayer, kJudge, kEditor, kSuperadmin };

enum class Capability { kSubmitFlag, kUnlockHint, kClaimKoth, kViewScores, kReconcile, kCloseCompetition };

std::optional<Role> ParseRole(const std::string& text);
const char* ToString(Role role);
const char* ToString(Capability capability);

bool HasCapability(Role role, Capability capability);

// 상위 인증 계층이 확인한 호출자 정보
struct Principal {
  std::optional<int> team_id;
  int user_id{0};
  Role role{Role::kPlayer};
};

// 권한이 없으면 PermissionDenied를 던진다.
void RequireCapability(const Principal& principal, Capability capability);

struct ModuleEntry {
  std::string_view name;
  bool enabled;
};

inline constexpr ModuleEntry kModules[] = {
    {"scoring", true},
    {"hints", true},
    {"koth", true},
};

constexpr bool ModuleEnabled(std::string_view name) {
  for (const auto& module : kModules) {
    if (module.name == name) {
      return module.enabled;
    }
  }
  return false;
}

}  // namespace ctfscore
