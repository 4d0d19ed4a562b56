/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include <csignal>
#include <iostream>

#include "ctfscore/app.hpp"

int main() {
  using namespace ctfscore;
  AppConfig config = LoadConfigFromEnv();
  ServerApp app(config);

  std::signal(SIGINT, [](int) {
    std::cout << "SIGINT 수신, 종료를 준비합니다\n";
  });

  app.Run();
  return 0;
}
