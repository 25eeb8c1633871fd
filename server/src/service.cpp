/*
 * 설명: 기본 도메인 서비스를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/service_test.cpp
 */
#include "addsvc/service.hpp"

#include <limits>

#include "addsvc/errors.hpp"

namespace addsvc {

BasicAddService::BasicAddService(std::size_t max_concat_length) : max_concat_length_(max_concat_length) {}

std::int64_t BasicAddService::Sum(const RequestContext& /*ctx*/, std::int64_t a, std::int64_t b) {
  if ((b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) ||
      (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b)) {
    throw DomainError("integer overflow", {ErrorDetail{std::string("b"), "a + b does not fit in int64"}});
  }
  return a + b;
}

std::string BasicAddService::Concat(const RequestContext& /*ctx*/, const std::string& a, const std::string& b) {
  if (a.size() + b.size() > max_concat_length_) {
    auto message = "maximum size of " + std::to_string(max_concat_length_) + " exceeded";
    throw DomainError(message, {ErrorDetail{std::string("b"), message}});
  }
  return a + b;
}

}  // namespace addsvc
