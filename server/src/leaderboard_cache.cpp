/*
 * 설명: 순위 스냅샷 재구성, 디바운스 갱신, 주기 갱신 타이머.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_cache_test.cpp
 */
#include "ctfscore/leaderboard_cache.hpp"

#include <algorithm>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>

#include "ctfscore/errors.hpp"

namespace ctfscore {

namespace {

bool SameRank(const TeamStanding& a, const TeamStanding& b) {
  return a.score == b.score && a.last_solve_at == b.last_solve_at;
}

}  // namespace

std::vector<LeaderboardEntry> RankStandings(std::vector<TeamStanding> standings) {
  std::sort(standings.begin(), standings.end(), [](const TeamStanding& a, const TeamStanding& b) {
    bool a_solved = a.last_solve_at.has_value();
    bool b_solved = b.last_solve_at.has_value();
    if (a_solved != b_solved) {
      return a_solved;
    }
    if (a.score != b.score) {
      return a.score > b.score;
    }
    if (a_solved && *a.last_solve_at != *b.last_solve_at) {
      return *a.last_solve_at < *b.last_solve_at;
    }
    return a.team_id < b.team_id;
  });

  std::vector<LeaderboardEntry> entries;
  entries.reserve(standings.size());
  int rank = 0;
  for (std::size_t i = 0; i < standings.size(); ++i) {
    const auto& standing = standings[i];
    if (i == 0 || !SameRank(standings[i - 1], standing)) {
      ++rank;
    }
    entries.push_back(LeaderboardEntry{rank, standing.team_id, standing.name, standing.score, standing.last_solve_at});
  }
  return entries;
}

LeaderboardCache::LeaderboardCache(boost::asio::io_context& ioc, std::shared_ptr<ScoreAggregator> aggregator,
                                   std::shared_ptr<EventBus> bus, LeaderboardConfig config, ClockFn clock,
                                   std::shared_ptr<Observability> observability)
    : strand_(boost::asio::make_strand(ioc)),
      debounce_timer_(strand_),
      refresh_timer_(strand_),
      aggregator_(std::move(aggregator)),
      bus_(std::move(bus)),
      config_(config),
      clock_(std::move(clock)),
      observability_(std::move(observability)) {}

void LeaderboardCache::Start() {
  stopped_ = false;
  if (bus_) {
    std::weak_ptr<LeaderboardCache> weak = shared_from_this();
    bus_->Subscribe([weak](const ScoreEvent&) {
      if (auto self = weak.lock()) {
        self->OnScoreChanged();
      }
    });
  }
  boost::asio::dispatch(strand_, [self = shared_from_this()]() { self->ScheduleRefresh(); });
}

void LeaderboardCache::Stop() {
  stopped_ = true;
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    self->debounce_timer_.cancel();
    self->refresh_timer_.cancel();
  });
}

LeaderboardSnapshot LeaderboardCache::RankedTeams() {
  std::shared_ptr<const LeaderboardSnapshot> current;
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    current = snapshot_;
  }
  auto now = clock_();
  if (current && now - current->built_at <= config_.staleness_bound) {
    return *current;
  }
  std::lock_guard<std::mutex> rebuild_lock(rebuild_mutex_);
  // 대기하는 동안 다른 스레드가 충분히 새로운 스냅샷을 만들었을 수 있다.
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    current = snapshot_;
  }
  if (current && now - current->built_at <= config_.staleness_bound) {
    return *current;
  }
  return RebuildLocked();
}

LeaderboardSnapshot LeaderboardCache::Rebuild() {
  std::lock_guard<std::mutex> rebuild_lock(rebuild_mutex_);
  return RebuildLocked();
}

LeaderboardSnapshot LeaderboardCache::RebuildLocked() {
  auto started = std::chrono::steady_clock::now();
  auto snapshot = std::make_shared<LeaderboardSnapshot>();
  // 점수를 읽기 전에 시각을 잡아 스냅샷이 실제보다 최신으로 보이지 않게 한다.
  snapshot->built_at = clock_();
  snapshot->entries = RankStandings(aggregator_->Standings());
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if (!snapshot_ || snapshot_->built_at <= snapshot->built_at) {
      snapshot_ = snapshot;
    }
  }
  if (observability_) {
    observability_->IncrementRebuild();
    auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    observability_->Log(LogContext{"", std::nullopt, "leaderboard.rebuilt", static_cast<long>(elapsed), LogLevel::kDebug,
                                   {{"teams", snapshot->entries.size()}}});
  }
  return *snapshot;
}

void LeaderboardCache::OnScoreChanged() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (self->stopped_ || self->debounce_pending_) {
      return;
    }
    self->debounce_pending_ = true;
    self->debounce_timer_.expires_after(self->config_.debounce);
    self->debounce_timer_.async_wait(
        boost::asio::bind_executor(self->strand_, [self](const boost::system::error_code& ec) {
          self->debounce_pending_ = false;
          if (ec || self->stopped_) {
            return;
          }
          self->RebuildLogged("event");
        }));
  });
}

void LeaderboardCache::ScheduleRefresh() {
  if (stopped_) {
    return;
  }
  refresh_timer_.expires_after(config_.refresh_interval);
  refresh_timer_.async_wait(
      boost::asio::bind_executor(strand_, [self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec || self->stopped_) {
          return;
        }
        self->RebuildLogged("timer");
        self->ScheduleRefresh();
      }));
}

void LeaderboardCache::RebuildLogged(const char* trigger) {
  try {
    Rebuild();
  } catch (const ScoringError& ex) {
    if (observability_) {
      observability_->Log(LogContext{"", std::nullopt, "leaderboard.rebuild_failed", 0, LogLevel::kWarn,
                                     {{"trigger", trigger}, {"code", ex.code}, {"message", ex.what()}}});
    }
  }
}

}  // namespace ctfscore
