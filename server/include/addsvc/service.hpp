/*
 * 설명: 합계/문자열 연결 도메인 서비스 인터페이스와 기본 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/service_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "addsvc/request_context.hpp"

namespace addsvc {

// 실패는 errors.hpp의 오류 타입을 던져 알린다.
class AddService {
 public:
  virtual ~AddService() = default;
  virtual std::int64_t Sum(const RequestContext& ctx, std::int64_t a, std::int64_t b) = 0;
  virtual std::string Concat(const RequestContext& ctx, const std::string& a, const std::string& b) = 0;
};

class BasicAddService : public AddService {
 public:
  explicit BasicAddService(std::size_t max_concat_length = 1024);

  std::int64_t Sum(const RequestContext& ctx, std::int64_t a, std::int64_t b) override;
  std::string Concat(const RequestContext& ctx, const std::string& a, const std::string& b) override;

 private:
  std::size_t max_concat_length_;
};

}  // namespace addsvc
