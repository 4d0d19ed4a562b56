#include <chrono>
#include <functional>
#include <memory>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "ctfscore/errors.hpp"
#include "ctfscore/event_bus.hpp"
#include "ctfscore/hint_ledger.hpp"
#include "ctfscore/memory_ledger_store.hpp"
#include "ctfscore/score_aggregator.hpp"
#include "ctfscore/submission_validator.hpp"

using namespace ctfscore;

namespace {

TimePoint At(int seconds) { return TimePoint{std::chrono::seconds(1700000000 + seconds)}; }

// 커밋을 마친 뒤 작성자에게 돌려주기 전에 훅을 실행하는 저장소
class DelayedReturnStore : public MemoryLedgerStore {
 public:
  Submission AppendSubmission(const Submission& attempt) override {
    auto stored = MemoryLedgerStore::AppendSubmission(attempt);
    if (after_commit) {
      after_commit();
    }
    return stored;
  }

  std::function<void()> after_commit;
};

class ScoreAggregatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<MemoryLedgerStore>();
    for (int id = 1; id <= 5; ++id) {
      store_->PutChallenge(Challenge{id, "c" + std::to_string(id), "misc", id * 50, "flag{" + std::to_string(id) + "}",
                                     false, false, false});
      store_->PutHint(Hint{id * 10, id, id * 5, 1, "hint"});
    }
    store_->PutTeam(Team{1, "one", {}, "", At(0)});
    store_->PutTeam(Team{2, "two", {}, "", At(0)});
    bus_ = std::make_shared<EventBus>(ioc_);
    observability_ = std::make_shared<Observability>(LogLevel::kError);
    aggregator_ = std::make_shared<ScoreAggregator>(store_, bus_, observability_);
  }

  Submission CorrectRow(int team_id, int challenge_id, int value, int second) {
    return Submission{0, team_id, challenge_id, 1, "x", At(second), SubmissionOutcome::kCorrect, value};
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<MemoryLedgerStore> store_;
  std::shared_ptr<EventBus> bus_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ScoreAggregator> aggregator_;
};

}  // namespace

TEST_F(ScoreAggregatorTest, IncrementalMatchesFromScratchAfterEveryEvent) {
  int second = 0;
  auto clock = [&second]() { return At(second); };
  SubmissionValidator validator(store_, aggregator_, nullptr, CompetitionWindow{}, clock);
  HintLedger hints(store_, aggregator_, nullptr, CompetitionWindow{}, clock);

  aggregator_->ScoreOf(1);
  for (int id = 1; id <= 5; ++id) {
    ++second;
    if (id % 2 == 0) {
      hints.Unlock(1, 1, id * 10);
      EXPECT_EQ(aggregator_->ScoreOf(1), ScoreAggregator::Fold(1, store_->ScoreEventsForTeam(1)).score);
    }
    validator.Submit(1, 1, id, id % 3 == 0 ? "wrong" : "flag{" + std::to_string(id) + "}");
    EXPECT_EQ(aggregator_->ScoreOf(1), ScoreAggregator::Fold(1, store_->ScoreEventsForTeam(1)).score);
    EXPECT_NO_THROW(aggregator_->Verify(1));
  }
  // 50 + 100 + 200 + 250 - 10 - 20
  EXPECT_EQ(aggregator_->ScoreOf(1), 570);
  auto summary = aggregator_->Summary(1);
  ASSERT_TRUE(summary.last_solve_at.has_value());
  EXPECT_EQ(*summary.last_solve_at, At(5));
}

TEST_F(ScoreAggregatorTest, ApplyIsIdempotentPerKey) {
  aggregator_->ScoreOf(2);
  auto stored = store_->AppendSubmission(CorrectRow(2, 1, 50, 3));
  auto event = SolveEvent(stored);
  EXPECT_TRUE(aggregator_->Apply(event));
  EXPECT_FALSE(aggregator_->Apply(event));
  EXPECT_EQ(aggregator_->ScoreOf(2), 50);
}

TEST_F(ScoreAggregatorTest, FoldIgnoresRepeatedKeysAndOtherTeams) {
  std::vector<ScoreEvent> events{
      {SolveKey(1, 1), 1, ScoreEventKind::kSolve, 50, At(1)},
      {SolveKey(1, 1), 1, ScoreEventKind::kSolve, 50, At(1)},
      {HintKey(1, 10), 1, ScoreEventKind::kHintUnlock, -5, At(2)},
      {SolveKey(2, 1), 2, ScoreEventKind::kSolve, 50, At(3)},
  };
  auto folded = ScoreAggregator::Fold(1, events);
  EXPECT_EQ(folded.score, 45);
  EXPECT_EQ(folded.last_solve_at, At(1));
}

TEST_F(ScoreAggregatorTest, TeamWithoutSolvesHasNoLastSolve) {
  auto summary = aggregator_->Summary(2);
  EXPECT_EQ(summary.score, 0);
  EXPECT_FALSE(summary.last_solve_at.has_value());
}

TEST_F(ScoreAggregatorTest, UnknownTeamIsNotFound) {
  try {
    aggregator_->ScoreOf(404);
    FAIL() << "unknown team scored";
  } catch (const ValidationError& ex) {
    EXPECT_EQ(ex.code, "not_found");
  }
}

TEST_F(ScoreAggregatorTest, RecomputeKeepsEventsAppliedAfterHistoryRead) {
  aggregator_->ScoreOf(1);
  // 커밋 직후 반영되었지만 재계산 시점의 원장 읽기에는 아직 없는 이벤트
  ScoreEvent late{AccrualKey(77), 1, ScoreEventKind::kKothAccrual, 15, At(9)};
  ASSERT_TRUE(aggregator_->Apply(late));
  EXPECT_EQ(aggregator_->Recompute(1).score, 15);
  EXPECT_NO_THROW(aggregator_->Verify(1));
}

TEST_F(ScoreAggregatorTest, ReconciliationDetectsDirectStoreWrite) {
  EXPECT_EQ(aggregator_->ScoreOf(1), 0);
  // 집계기를 거치지 않은 원장 기록
  store_->AppendSubmission(CorrectRow(1, 2, 100, 4));

  try {
    aggregator_->Verify(1);
    FAIL() << "mismatch not detected";
  } catch (const ReconciliationMismatch& ex) {
    EXPECT_EQ(ex.team_id, 1);
    EXPECT_EQ(ex.incremental, 0);
    EXPECT_EQ(ex.authoritative, 100);
  }

  EXPECT_EQ(aggregator_->ReconcileAll(), 1u);
  EXPECT_EQ(aggregator_->ScoreOf(1), 100);
  EXPECT_NO_THROW(aggregator_->Verify(1));
  EXPECT_EQ(observability_->Snapshot().reconciliation_mismatches, 1u);
  EXPECT_EQ(aggregator_->ReconcileAll(), 0u);
}

TEST_F(ScoreAggregatorTest, AppliedEventsArePublishedAsynchronously) {
  std::vector<ScoreEvent> seen;
  bus_->Subscribe([&seen](const ScoreEvent& event) { seen.push_back(event); });
  aggregator_->ScoreOf(2);
  auto stored = store_->AppendSubmission(CorrectRow(2, 3, 150, 6));
  aggregator_->Apply(SolveEvent(stored));
  EXPECT_TRUE(seen.empty());
  ioc_.run();
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].key, SolveKey(2, 3));
  EXPECT_EQ(seen[0].delta, 150);
}

TEST_F(ScoreAggregatorTest, StandingsCoverEveryTeam) {
  store_->AppendSubmission(CorrectRow(2, 1, 50, 2));
  auto standings = aggregator_->Standings();
  ASSERT_EQ(standings.size(), 2u);
  EXPECT_EQ(standings[0].team_id, 1);
  EXPECT_EQ(standings[0].score, 0);
  EXPECT_EQ(standings[1].name, "two");
  EXPECT_EQ(standings[1].score, 50);
}

TEST(ScoreAggregatorReconcileTest, CommitNotYetAppliedIsNotDrift) {
  auto store = std::make_shared<DelayedReturnStore>();
  store->PutChallenge(Challenge{1, "c1", "misc", 100, "flag{1}", false, false, false});
  store->PutTeam(Team{1, "one", {}, "", At(0)});
  auto observability = std::make_shared<Observability>(LogLevel::kError);
  int now = 10;
  auto clock = [&now]() { return At(now); };
  auto aggregator = std::make_shared<ScoreAggregator>(store, nullptr, observability, std::chrono::seconds(5), clock);
  SubmissionValidator validator(store, aggregator, nullptr, CompetitionWindow{}, clock);
  EXPECT_EQ(aggregator->ScoreOf(1), 0);

  std::size_t repaired_mid_commit = 99;
  store->after_commit = [&]() {
    now = 12;
    EXPECT_NO_THROW(aggregator->Verify(1));
    repaired_mid_commit = aggregator->ReconcileAll();
  };
  EXPECT_EQ(validator.Submit(1, 1, 1, "flag{1}").outcome, SubmitOutcome::kAccepted);

  EXPECT_EQ(repaired_mid_commit, 0u);
  EXPECT_EQ(observability->Snapshot().reconciliation_mismatches, 0u);
  EXPECT_EQ(aggregator->ScoreOf(1), 100);
  EXPECT_NO_THROW(aggregator->Verify(1));
}

TEST(ScoreAggregatorReconcileTest, UnappliedEventPastGraceIsDrift) {
  auto store = std::make_shared<MemoryLedgerStore>();
  store->PutChallenge(Challenge{1, "c1", "misc", 100, "flag{1}", false, false, false});
  store->PutTeam(Team{1, "one", {}, "", At(0)});
  int now = 10;
  auto clock = [&now]() { return At(now); };
  auto aggregator = std::make_shared<ScoreAggregator>(store, nullptr, nullptr, std::chrono::seconds(5), clock);
  EXPECT_EQ(aggregator->ScoreOf(1), 0);
  store->AppendSubmission(Submission{0, 1, 1, 1, "flag{1}", At(9), SubmissionOutcome::kCorrect, 100});

  EXPECT_NO_THROW(aggregator->Verify(1));
  now = 20;
  EXPECT_THROW(aggregator->Verify(1), ReconciliationMismatch);
  EXPECT_EQ(aggregator->ReconcileAll(), 1u);
  EXPECT_EQ(aggregator->ScoreOf(1), 100);
}
