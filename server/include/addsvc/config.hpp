/*
 * 설명: 게이트웨이 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/add_gateway_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace addsvc {

struct AppConfig {
  unsigned short port{8080};
  std::string log_level{"info"};
  bool auth_required{false};
  std::size_t request_timeout_ms{5000};
  std::size_t max_body_bytes{1024 * 1024};
  std::size_t concat_max_length{1024};
  std::string service_name{"addsvc"};
};

AppConfig LoadConfigFromEnv();

}  // namespace addsvc
