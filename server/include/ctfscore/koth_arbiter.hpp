/*
 * 설명: KOTH 대상별 소유권 상태 머신. 동시 점령 경쟁을 CAS로 단일 승자로 정리하고 보유 시간만큼 적립한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/koth_arbiter_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "ctfscore/ledger_store.hpp"
#include "ctfscore/observability.hpp"
#include "ctfscore/score_aggregator.hpp"

namespace ctfscore {

enum class ClaimOutcome { kClaimed, kAlreadyOwner, kRejected };
enum class ClaimRejection { kNone, kClosed, kProofInvalid, kLostRace };

const char* ToString(ClaimOutcome outcome);
const char* ToString(ClaimRejection reason);

struct ClaimResult {
  ClaimOutcome outcome{ClaimOutcome::kRejected};
  ClaimRejection reason{ClaimRejection::kNone};
  std::optional<int> owner_team_id;
};

struct KothConfig {
  int accrual_points{10};
  std::chrono::milliseconds accrual_interval{std::chrono::seconds(60)};
};

class KothArbiter : public std::enable_shared_from_this<KothArbiter> {
 public:
  KothArbiter(boost::asio::io_context& ioc, std::shared_ptr<LedgerStore> store,
              std::shared_ptr<ScoreAggregator> aggregator, std::shared_ptr<Observability> observability,
              KothConfig config, ClockFn clock);

  // 경쟁에서 진 호출자는 kLostRace와 새 소유 팀을 받는다. 재시도는 호출자 몫이다.
  ClaimResult Claim(int team_id, int target_id, const std::string& proof);
  // 소유 중인 대상마다 완료된 적립 구간을 정산한다. 정산한 대상 수를 돌려준다.
  std::size_t SettleAll();
  // 대회 종료. 열린 점령을 닫고 마지막 적립을 반영한 뒤 이후 점령을 거부한다.
  std::size_t CloseAll();
  int AccrualFor(TimePoint from, TimePoint to) const;

  void Start();
  void Stop();

 private:
  std::optional<KothAccrual> BuildAccrual(const KothState& state, TimePoint to) const;
  void ApplyAccrual(const KothCommit& commit);
  void ScheduleTick();
  void OnTick(const boost::system::error_code& ec);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  std::shared_ptr<LedgerStore> store_;
  std::shared_ptr<ScoreAggregator> aggregator_;
  std::shared_ptr<Observability> observability_;
  KothConfig config_;
  ClockFn clock_;
  std::atomic<bool> stopped_{false};
};

}  // namespace ctfscore
