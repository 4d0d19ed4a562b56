/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/scoring_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ctfscore {

struct AppConfig {
  unsigned short port{8080};
  std::string store_backend{"mariadb"};
  std::string db_host{"127.0.0.1"};
  unsigned short db_port{3306};
  std::string db_user{"root"};
  std::string db_password;
  std::string db_name{"ctfscore"};
  std::string log_level{"info"};
  std::size_t leaderboard_staleness_ms{5000};
  std::size_t leaderboard_debounce_ms{250};
  std::size_t reconcile_interval_seconds{60};
  std::size_t reconcile_grace_ms{5000};
  int koth_accrual_points{10};
  std::size_t koth_accrual_interval_seconds{60};
  // 0이면 제한 없음 (epoch seconds)
  std::int64_t competition_start_epoch{0};
  std::int64_t competition_end_epoch{0};
  std::string ops_token;
};

AppConfig LoadConfigFromEnv();

}  // namespace ctfscore
