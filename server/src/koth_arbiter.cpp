/*
 * 설명: 점령/정산/종료 전이를 저장소 CAS로 커밋하고 적립을 집계기에 반영한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/koth_arbiter_test.cpp
 */
#include "ctfscore/koth_arbiter.hpp"

#include <algorithm>
#include <cstdint>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>

#include "ctfscore/errors.hpp"
#include "ctfscore/flag.hpp"

namespace ctfscore {

const char* ToString(ClaimOutcome outcome) {
  switch (outcome) {
    case ClaimOutcome::kClaimed:
      return "claimed";
    case ClaimOutcome::kAlreadyOwner:
      return "already-owner";
    case ClaimOutcome::kRejected:
      return "rejected";
  }
  return "rejected";
}

const char* ToString(ClaimRejection reason) {
  switch (reason) {
    case ClaimRejection::kNone:
      return "";
    case ClaimRejection::kClosed:
      return "closed";
    case ClaimRejection::kProofInvalid:
      return "proof_invalid";
    case ClaimRejection::kLostRace:
      return "lost_race";
  }
  return "";
}

KothArbiter::KothArbiter(boost::asio::io_context& ioc, std::shared_ptr<LedgerStore> store,
                         std::shared_ptr<ScoreAggregator> aggregator, std::shared_ptr<Observability> observability,
                         KothConfig config, ClockFn clock)
    : strand_(boost::asio::make_strand(ioc)),
      timer_(strand_),
      store_(std::move(store)),
      aggregator_(std::move(aggregator)),
      observability_(std::move(observability)),
      config_(config),
      clock_(std::move(clock)) {}

int KothArbiter::AccrualFor(TimePoint from, TimePoint to) const {
  auto interval_ms = config_.accrual_interval.count();
  if (interval_ms <= 0 || config_.accrual_points <= 0 || to <= from) {
    return 0;
  }
  auto held_ms = std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
  return static_cast<int>(static_cast<std::int64_t>(config_.accrual_points) * held_ms / interval_ms);
}

std::optional<KothAccrual> KothArbiter::BuildAccrual(const KothState& state, TimePoint to) const {
  if (!state.owner_team_id) {
    return std::nullopt;
  }
  int points = AccrualFor(state.accrued_until, to);
  if (points <= 0) {
    return std::nullopt;
  }
  return KothAccrual{0, state.target_id, *state.owner_team_id, points, state.accrued_until, to};
}

void KothArbiter::ApplyAccrual(const KothCommit& commit) {
  if (commit.accrual) {
    aggregator_->Apply(AccrualEvent(*commit.accrual));
  }
}

ClaimResult KothArbiter::Claim(int team_id, int target_id, const std::string& proof) {
  auto now = TruncateToMicros(clock_());
  if (!store_->FindTeam(team_id)) {
    throw ValidationError("not_found", "팀을 찾을 수 없습니다");
  }
  auto target = store_->FindKothTarget(target_id);
  if (!target) {
    throw ValidationError("not_found", "KOTH 대상을 찾을 수 없습니다");
  }
  auto state = store_->LoadKothState(target_id);
  if (!state) {
    throw ValidationError("not_found", "KOTH 상태를 찾을 수 없습니다");
  }
  if (state->closed) {
    return ClaimResult{ClaimOutcome::kRejected, ClaimRejection::kClosed, state->owner_team_id};
  }
  if (state->owner_team_id && *state->owner_team_id == team_id) {
    return ClaimResult{ClaimOutcome::kAlreadyOwner, ClaimRejection::kNone, team_id};
  }
  if (state->owner_team_id && target->rule == CaptureRule::kProof && !FlagMatches(target->proof, proof, true)) {
    return ClaimResult{ClaimOutcome::kRejected, ClaimRejection::kProofInvalid, state->owner_team_id};
  }

  // 소유 이력이 시간 순서를 유지하도록 정산 시각보다 앞서지 않는다.
  auto at = std::max(now, state->accrued_until);
  KothTransition transition;
  transition.kind = KothTransitionKind::kClaim;
  transition.target_id = target_id;
  transition.expected_version = state->version;
  transition.new_owner_team_id = team_id;
  transition.at = at;
  transition.accrual = BuildAccrual(*state, at);

  auto commit = store_->CommitKothTransition(transition);
  if (!commit.committed) {
    if (commit.state.closed) {
      return ClaimResult{ClaimOutcome::kRejected, ClaimRejection::kClosed, commit.state.owner_team_id};
    }
    if (commit.state.owner_team_id && *commit.state.owner_team_id == team_id) {
      return ClaimResult{ClaimOutcome::kAlreadyOwner, ClaimRejection::kNone, team_id};
    }
    return ClaimResult{ClaimOutcome::kRejected, ClaimRejection::kLostRace, commit.state.owner_team_id};
  }

  ApplyAccrual(commit);
  if (observability_) {
    observability_->IncrementKothClaim();
    nlohmann::json detail{{"targetId", target_id}};
    detail["previousOwner"] = state->owner_team_id ? nlohmann::json(*state->owner_team_id) : nlohmann::json(nullptr);
    detail["accrued"] = commit.accrual ? commit.accrual->points : 0;
    observability_->Log(LogContext{"", team_id, "koth.claimed", 0, LogLevel::kInfo, detail});
  }
  return ClaimResult{ClaimOutcome::kClaimed, ClaimRejection::kNone, team_id};
}

std::size_t KothArbiter::SettleAll() {
  auto now = TruncateToMicros(clock_());
  auto interval = std::chrono::duration_cast<TimePoint::duration>(config_.accrual_interval);
  if (interval.count() <= 0) {
    return 0;
  }
  std::size_t settled = 0;
  for (const auto& target : store_->ListKothTargets()) {
    auto state = store_->LoadKothState(target.target_id);
    if (!state || state->closed || !state->owner_team_id || now <= state->accrued_until) {
      continue;
    }
    // 완료된 구간만 정산해 남은 보유 시간이 다음 정산으로 이어지게 한다.
    auto whole = (now - state->accrued_until) / interval;
    if (whole <= 0) {
      continue;
    }
    auto to = state->accrued_until + whole * interval;
    KothTransition transition;
    transition.kind = KothTransitionKind::kSettle;
    transition.target_id = target.target_id;
    transition.expected_version = state->version;
    transition.at = to;
    transition.accrual = BuildAccrual(*state, to);
    auto commit = store_->CommitKothTransition(transition);
    if (commit.committed) {
      ApplyAccrual(commit);
      ++settled;
    }
  }
  return settled;
}

std::size_t KothArbiter::CloseAll() {
  std::size_t closed = 0;
  for (const auto& target : store_->ListKothTargets()) {
    while (true) {
      auto state = store_->LoadKothState(target.target_id);
      if (!state || state->closed) {
        break;
      }
      auto at = std::max(TruncateToMicros(clock_()), state->accrued_until);
      KothTransition transition;
      transition.kind = KothTransitionKind::kClose;
      transition.target_id = target.target_id;
      transition.expected_version = state->version;
      transition.at = at;
      transition.accrual = BuildAccrual(*state, at);
      auto commit = store_->CommitKothTransition(transition);
      if (commit.committed) {
        ApplyAccrual(commit);
        ++closed;
        break;
      }
    }
  }
  stopped_ = true;
  if (observability_) {
    observability_->Log(LogContext{"", std::nullopt, "koth.closed", 0, LogLevel::kInfo, {{"targets", closed}}});
  }
  return closed;
}

void KothArbiter::Start() {
  stopped_ = false;
  boost::asio::dispatch(strand_, [self = shared_from_this()]() { self->ScheduleTick(); });
}

void KothArbiter::Stop() {
  stopped_ = true;
  boost::asio::dispatch(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
}

void KothArbiter::ScheduleTick() {
  if (stopped_) {
    return;
  }
  timer_.expires_after(config_.accrual_interval);
  timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code& ec) { self->OnTick(ec); }));
}

void KothArbiter::OnTick(const boost::system::error_code& ec) {
  if (ec || stopped_) {
    return;
  }
  try {
    SettleAll();
  } catch (const StoreUnavailable& ex) {
    if (observability_) {
      observability_->Log(LogContext{"", std::nullopt, "koth.settle_failed", 0, LogLevel::kWarn, {{"message", ex.what()}}});
    }
  }
  ScheduleTick();
}

}  // namespace ctfscore
