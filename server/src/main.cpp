/*
 * 설명: 게이트웨이 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/add_gateway_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>

#include <boost/asio/signal_set.hpp>

#include "addsvc/app.hpp"

int main() {
  using namespace addsvc;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정이 올바르지 않습니다: " << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);

  boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
  signals.async_wait([&app](const boost::system::error_code& ec, int /*signal_number*/) {
    if (ec) {
      return;
    }
    std::cout << "종료 신호 수신, 서버를 멈춥니다\n";
    app.GetContext().stop();
  });

  app.Run();
  return 0;
}
