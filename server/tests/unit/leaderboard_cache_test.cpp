#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "ctfscore/event_bus.hpp"
#include "ctfscore/leaderboard_cache.hpp"
#include "ctfscore/memory_ledger_store.hpp"
#include "ctfscore/submission_validator.hpp"

using namespace ctfscore;

namespace {

TimePoint At(int seconds) { return TimePoint{std::chrono::seconds(1700000000 + seconds)}; }

TeamStanding Standing(int team_id, const std::string& name, int score, std::optional<TimePoint> last_solve) {
  return TeamStanding{team_id, name, score, last_solve};
}

// 팀 목록 조회에 지연을 줄 수 있는 저장소
class PacedStore : public MemoryLedgerStore {
 public:
  std::vector<Team> ListTeams() override {
    if (list_delay.count() > 0) {
      std::this_thread::sleep_for(list_delay);
    }
    return MemoryLedgerStore::ListTeams();
  }

  std::chrono::milliseconds list_delay{0};
};

class LeaderboardCacheTest : public ::testing::Test {
 protected:
  void SetUp() override {
    now_ = std::make_shared<std::atomic<TimePoint>>(At(0));
    store_ = std::make_shared<PacedStore>();
    store_->PutChallenge(Challenge{1, "intro", "misc", 500, "flag{a}", false, false, false});
    store_->PutChallenge(Challenge{2, "extra", "misc", 300, "flag{b}", false, false, false});
    store_->PutTeam(Team{1, "A", {}, "", At(0)});
    store_->PutTeam(Team{2, "B", {}, "", At(0)});
    store_->PutTeam(Team{3, "C", {}, "", At(0)});
    bus_ = std::make_shared<EventBus>(ioc_);
    observability_ = std::make_shared<Observability>(LogLevel::kError);
    aggregator_ = std::make_shared<ScoreAggregator>(store_, bus_, observability_);
    auto now = now_;
    clock_ = [now]() { return now->load(); };
    validator_ = std::make_shared<SubmissionValidator>(store_, aggregator_, nullptr, CompetitionWindow{}, clock_);
  }

  std::shared_ptr<LeaderboardCache> MakeCache(LeaderboardConfig config) {
    return std::make_shared<LeaderboardCache>(ioc_, aggregator_, bus_, config, clock_, observability_);
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<std::atomic<TimePoint>> now_;
  ClockFn clock_;
  std::shared_ptr<PacedStore> store_;
  std::shared_ptr<EventBus> bus_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ScoreAggregator> aggregator_;
  std::shared_ptr<SubmissionValidator> validator_;
};

}  // namespace

TEST(RankStandingsTest, ScoreThenEarlierSolveThenUnsolved) {
  auto entries = RankStandings({Standing(3, "C", 300, std::nullopt), Standing(2, "B", 500, At(20)),
                                Standing(1, "A", 500, At(10))});
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].team_id, 1);
  EXPECT_EQ(entries[1].team_id, 2);
  EXPECT_EQ(entries[2].team_id, 3);
  EXPECT_EQ(entries[0].rank, 1);
  EXPECT_EQ(entries[1].rank, 2);
  EXPECT_EQ(entries[2].rank, 3);
  EXPECT_EQ(entries[0].name, "A");
}

TEST(RankStandingsTest, FullTiesShareDenseRank) {
  auto entries = RankStandings({Standing(4, "D", 100, At(5)), Standing(2, "B", 100, At(5)),
                                Standing(3, "C", 50, At(1)), Standing(1, "A", 0, std::nullopt),
                                Standing(5, "E", 0, std::nullopt)});
  ASSERT_EQ(entries.size(), 5u);
  EXPECT_EQ(entries[0].team_id, 2);
  EXPECT_EQ(entries[1].team_id, 4);
  EXPECT_EQ(entries[0].rank, 1);
  EXPECT_EQ(entries[1].rank, 1);
  EXPECT_EQ(entries[2].rank, 2);
  EXPECT_EQ(entries[3].rank, 3);
  EXPECT_EQ(entries[4].rank, 3);
}

TEST(RankStandingsTest, TeamsWithoutSolvesRankBelowSolvers) {
  auto entries = RankStandings({Standing(1, "koth-only", 40, std::nullopt), Standing(2, "net-zero", 0, At(3))});
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].team_id, 2);
  EXPECT_EQ(entries[1].team_id, 1);
}

TEST_F(LeaderboardCacheTest, ReadReflectsCommitsOlderThanStalenessBound) {
  LeaderboardConfig config;
  config.staleness_bound = std::chrono::seconds(5);
  auto cache = MakeCache(config);

  auto first = cache->RankedTeams();
  ASSERT_EQ(first.entries.size(), 3u);
  EXPECT_EQ(first.entries[0].score, 0);

  now_->store(At(1));
  ASSERT_EQ(validator_->Submit(2, 1, 1, "flag{a}").outcome, SubmitOutcome::kAccepted);
  now_->store(At(3));
  auto cached = cache->RankedTeams();
  EXPECT_EQ(cached.built_at, first.built_at);

  now_->store(At(6));
  auto fresh = cache->RankedTeams();
  EXPECT_GT(fresh.built_at, first.built_at);
  EXPECT_EQ(fresh.entries[0].team_id, 2);
  EXPECT_EQ(fresh.entries[0].score, 500);
}

TEST_F(LeaderboardCacheTest, ScoreEventsTriggerDebouncedRebuild) {
  LeaderboardConfig config;
  config.staleness_bound = std::chrono::hours(1);
  config.debounce = std::chrono::milliseconds(10);
  config.refresh_interval = std::chrono::hours(1);
  auto cache = MakeCache(config);
  cache->Start();

  EXPECT_EQ(cache->RankedTeams().entries[0].score, 0);
  auto rebuilds_before = observability_->Snapshot().leaderboard_rebuilds;

  now_->store(At(10));
  validator_->Submit(1, 1, 1, "flag{a}");
  validator_->Submit(3, 1, 2, "flag{b}");
  ioc_.run_for(std::chrono::milliseconds(300));

  auto snapshot = cache->RankedTeams();
  ASSERT_EQ(snapshot.entries.size(), 3u);
  EXPECT_EQ(snapshot.entries[0].team_id, 1);
  EXPECT_EQ(snapshot.entries[0].score, 500);
  EXPECT_EQ(snapshot.entries[1].team_id, 3);
  EXPECT_EQ(snapshot.entries[2].team_id, 2);
  // 가까운 두 이벤트는 한 번의 재구성으로 합쳐진다.
  EXPECT_EQ(observability_->Snapshot().leaderboard_rebuilds, rebuilds_before + 1);

  cache->Stop();
  ioc_.run_for(std::chrono::milliseconds(50));
}

TEST_F(LeaderboardCacheTest, RefreshTimerRebuildsWithoutScoreEvents) {
  LeaderboardConfig config;
  config.staleness_bound = std::chrono::hours(1);
  config.refresh_interval = std::chrono::milliseconds(20);
  // 버스 구독 없이 타이머만으로 갱신되는지 본다.
  auto cache = std::make_shared<LeaderboardCache>(ioc_, aggregator_, nullptr, config, clock_, observability_);
  cache->Rebuild();
  cache->Start();

  now_->store(At(10));
  ASSERT_EQ(validator_->Submit(2, 1, 2, "flag{b}").outcome, SubmitOutcome::kAccepted);
  EXPECT_EQ(cache->RankedTeams().entries[0].score, 0);
  auto rebuilds_before = observability_->Snapshot().leaderboard_rebuilds;

  ioc_.run_for(std::chrono::milliseconds(200));

  EXPECT_GT(observability_->Snapshot().leaderboard_rebuilds, rebuilds_before);
  auto snapshot = cache->RankedTeams();
  EXPECT_EQ(snapshot.built_at, At(10));
  EXPECT_EQ(snapshot.entries[0].team_id, 2);
  EXPECT_EQ(snapshot.entries[0].score, 300);

  cache->Stop();
  ioc_.run_for(std::chrono::milliseconds(50));
}

TEST_F(LeaderboardCacheTest, QueuedStaleReadersShareOneRebuild) {
  LeaderboardConfig config;
  config.staleness_bound = std::chrono::seconds(5);
  auto cache = MakeCache(config);
  store_->list_delay = std::chrono::milliseconds(100);
  auto rebuilds_before = observability_->Snapshot().leaderboard_rebuilds;

  std::vector<std::thread> readers;
  std::atomic<int> complete{0};
  for (int i = 0; i < 8; ++i) {
    readers.emplace_back([&]() {
      if (cache->RankedTeams().entries.size() == 3u) {
        complete.fetch_add(1);
      }
    });
  }
  for (auto& reader : readers) {
    reader.join();
  }
  EXPECT_EQ(complete.load(), 8);
  EXPECT_EQ(observability_->Snapshot().leaderboard_rebuilds, rebuilds_before + 1);
}
