/*
 * 설명: 구조화 로그와 채점 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "ctfscore/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace ctfscore {
namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementSubmission(bool awarded) {
  submissions_.fetch_add(1);
  if (awarded) {
    awards_.fetch_add(1);
  }
}

void Observability::IncrementHintUnlock() { hint_unlocks_.fetch_add(1); }

void Observability::IncrementKothClaim() { koth_claims_.fetch_add(1); }

void Observability::IncrementMismatch() { mismatches_.fetch_add(1); }

void Observability::IncrementRebuild() { rebuilds_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.submissions = submissions_.load();
  snapshot.awards = awards_.load();
  snapshot.hint_unlocks = hint_unlocks_.load();
  snapshot.koth_claims = koth_claims_.load();
  snapshot.reconciliation_mismatches = mismatches_.load();
  snapshot.leaderboard_rebuilds = rebuilds_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (ctx.level < min_level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.team_id) {
    log_json["teamId"] = *ctx.team_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << log_json.dump() << std::endl;
}

}  // namespace ctfscore
