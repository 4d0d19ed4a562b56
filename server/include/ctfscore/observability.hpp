/*
 * 설명: 구조화 로그와 채점 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/scoring_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ctfscore {

enum class LogLevel { kDebug, kInfo, kWarn, kError };

LogLevel ParseLogLevel(const std::string& text);

struct LogContext {
  std::string trace_id;
  std::optional<int> team_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  nlohmann::json detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t submissions{0};
  std::uint64_t awards{0};
  std::uint64_t hint_unlocks{0};
  std::uint64_t koth_claims{0};
  std::uint64_t reconciliation_mismatches{0};
  std::uint64_t leaderboard_rebuilds{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementSubmission(bool awarded);
  void IncrementHintUnlock();
  void IncrementKothClaim();
  void IncrementMismatch();
  void IncrementRebuild();
  MetricsSnapshot Snapshot() const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> submissions_{0};
  std::atomic<std::uint64_t> awards_{0};
  std::atomic<std::uint64_t> hint_unlocks_{0};
  std::atomic<std::uint64_t> koth_claims_{0};
  std::atomic<std::uint64_t> mismatches_{0};
  std::atomic<std::uint64_t> rebuilds_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace ctfscore
