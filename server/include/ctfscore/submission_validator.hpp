/*
 * 설명: 플래그 제출을 검증하고 모든 시도를 기록하며 (팀, 문제)당 한 번만 점수를 수여한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/submission_validator_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "ctfscore/ledger_store.hpp"
#include "ctfscore/model.hpp"
#include "ctfscore/observability.hpp"
#include "ctfscore/score_aggregator.hpp"

namespace ctfscore {

enum class SubmitOutcome { kAccepted, kAlreadySolved, kIncorrect };

const char* ToString(SubmitOutcome outcome);

struct SubmitResult {
  SubmitOutcome outcome{SubmitOutcome::kIncorrect};
  int awarded{0};
  std::string category;
  Submission submission;
};

// 비어 있는 경계는 제한 없음이다.
struct CompetitionWindow {
  std::optional<TimePoint> start;
  std::optional<TimePoint> end;

  bool Contains(TimePoint at) const;
};

class SubmissionValidator {
 public:
  static constexpr std::size_t kMaxSubmissionLength = kMaxFlagLength;

  SubmissionValidator(std::shared_ptr<LedgerStore> store, std::shared_ptr<ScoreAggregator> aggregator,
                      std::shared_ptr<Observability> observability, CompetitionWindow window, ClockFn clock);

  // 잘못된 입력은 ValidationError, 저장소 장애는 StoreUnavailable로 전달된다.
  // 자동 재시도는 하지 않는다.
  SubmitResult Submit(int team_id, int user_id, int challenge_id, const std::string& text);

 private:
  std::shared_ptr<LedgerStore> store_;
  std::shared_ptr<ScoreAggregator> aggregator_;
  std::shared_ptr<Observability> observability_;
  CompetitionWindow window_;
  ClockFn clock_;
};

// 팀 존재, 로스터 소속, 대회 기간 검사. 힌트 해제와 공유한다.
Team RequireActiveMember(LedgerStore& store, const CompetitionWindow& window, int team_id, int user_id,
                         TimePoint at);

}  // namespace ctfscore
