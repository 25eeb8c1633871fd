/*
 * 설명: 요청 단위로 전달되는 컨텍스트(마감 시각, 인증 토큰, 트레이스 식별자)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/endpoint_middleware_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace addsvc {

struct RequestContext {
  std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};
  std::optional<std::string> token;
  std::string trace_id;
  std::string span_id;
  std::string parent_span_id;

  bool Expired() const { return std::chrono::steady_clock::now() >= deadline; }
};

}  // namespace addsvc
