/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#include <exception>
#include <iostream>

#include "codebattle/app.hpp"

int main() {
  using namespace codebattle;
  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);
    app.Run();
    app.Stop();
  } catch (const std::exception& ex) {
    std::cerr << "서버 초기화 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
