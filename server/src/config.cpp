/*
 * 설명: 환경변수에서 게이트웨이 설정을 읽는다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "addsvc/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace addsvc {

namespace {
bool ParseBool(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value == "1" || value == "true" || value == "yes" || value == "on";
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.auth_required = ParseBool(get_env("AUTH_REQUIRED", "false"));
  cfg.request_timeout_ms = static_cast<std::size_t>(std::stoul(get_env("REQUEST_TIMEOUT_MS", "5000")));
  cfg.max_body_bytes = static_cast<std::size_t>(std::stoul(get_env("MAX_BODY_BYTES", "1048576")));
  cfg.concat_max_length = static_cast<std::size_t>(std::stoul(get_env("CONCAT_MAX_LENGTH", "1024")));
  cfg.service_name = get_env("SERVICE_NAME", "addsvc");
  return cfg;
}

}  // namespace addsvc
