/*
 * 설명: 채점 코어의 예외 분류(입력 오류, 저장소 장애, 재계산 불일치, 권한 거부)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/score_aggregator_test.cpp, server/tests/unit/submission_validator_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>

namespace ctfscore {

class ScoringError : public std::runtime_error {
 public:
  ScoringError(const std::string& code, const std::string& message) : std::runtime_error(message), code(code) {}
  std::string code;
};

// 쓰기 이전에 거부되는 잘못된 입력. 저장소에는 아무것도 남지 않는다.
class ValidationError : public ScoringError {
 public:
  using ScoringError::ScoringError;
};

// 저장소 트랜잭션이 완료되지 못했다. 호출자는 결과를 알 수 없는 상태로 취급하고 재시도할 수 있다.
class StoreUnavailable : public ScoringError {
 public:
  explicit StoreUnavailable(const std::string& message) : ScoringError("store_unavailable", message) {}
};

class ReconciliationMismatch : public ScoringError {
 public:
  ReconciliationMismatch(int team_id, int incremental, int authoritative)
      : ScoringError("reconciliation_mismatch", "팀 " + std::to_string(team_id) + " 점수 불일치: 증분=" +
                                                    std::to_string(incremental) + ", 재계산=" +
                                                    std::to_string(authoritative)),
        team_id(team_id),
        incremental(incremental),
        authoritative(authoritative) {}
  int team_id;
  int incremental;
  int authoritative;
};

class PermissionDenied : public ScoringError {
 public:
  explicit PermissionDenied(const std::string& message) : ScoringError("forbidden", message) {}
};

}  // namespace ctfscore
