/*
 * 설명: 집계기 점수를 정렬한 읽기 전용 순위 스냅샷. 이벤트 디바운스와 주기 타이머로 갱신하고 staleness 한도를 보장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_cache_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "ctfscore/event_bus.hpp"
#include "ctfscore/model.hpp"
#include "ctfscore/observability.hpp"
#include "ctfscore/score_aggregator.hpp"

namespace ctfscore {

struct LeaderboardConfig {
  std::chrono::milliseconds staleness_bound{5000};
  std::chrono::milliseconds debounce{250};
  std::chrono::milliseconds refresh_interval{2000};
};

struct LeaderboardSnapshot {
  TimePoint built_at{};
  std::vector<LeaderboardEntry> entries;
};

// 해결 기록이 있는 팀이 먼저, 점수 내림차순, 마지막 해결 시각 오름차순.
// 세 값이 모두 같은 팀은 같은 순위를 공유한다(dense rank).
std::vector<LeaderboardEntry> RankStandings(std::vector<TeamStanding> standings);

class LeaderboardCache : public std::enable_shared_from_this<LeaderboardCache> {
 public:
  LeaderboardCache(boost::asio::io_context& ioc, std::shared_ptr<ScoreAggregator> aggregator,
                   std::shared_ptr<EventBus> bus, LeaderboardConfig config, ClockFn clock,
                   std::shared_ptr<Observability> observability);

  void Start();
  void Stop();

  // 스냅샷이 staleness 한도보다 오래되었으면 호출 스레드에서 다시 만든다.
  LeaderboardSnapshot RankedTeams();
  LeaderboardSnapshot Rebuild();

 private:
  void OnScoreChanged();
  void ScheduleRefresh();
  void RebuildLogged(const char* trigger);
  // rebuild_mutex_를 잡은 상태에서 호출한다.
  LeaderboardSnapshot RebuildLocked();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer debounce_timer_;
  boost::asio::steady_timer refresh_timer_;
  std::shared_ptr<ScoreAggregator> aggregator_;
  std::shared_ptr<EventBus> bus_;
  LeaderboardConfig config_;
  ClockFn clock_;
  std::shared_ptr<Observability> observability_;

  std::mutex rebuild_mutex_;
  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const LeaderboardSnapshot> snapshot_;
  bool debounce_pending_{false};
  std::atomic<bool> stopped_{false};
};

}  // namespace ctfscore
