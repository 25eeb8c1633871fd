/*
 * 설명: 합계/연결 엔드포인트 집합을 만들고 서비스 인터페이스로 다시 노출한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/endpoint_middleware_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "addsvc/codec.hpp"
#include "addsvc/endpoint.hpp"
#include "addsvc/service.hpp"
#include "addsvc/tracing.hpp"

namespace addsvc {

using SumEndpoint = Endpoint<SumRequest, SumResponse>;
using ConcatEndpoint = Endpoint<ConcatRequest, ConcatResponse>;

// 시작 시 한 번 만들어진 뒤 읽기 전용으로 공유된다.
struct Endpoints {
  SumEndpoint sum;
  ConcatEndpoint concat;
};

struct EndpointOptions {
  // 바깥쪽 백엔드가 먼저 온다. 각 백엔드는 자기 스팬을 하나씩 만든다.
  std::vector<std::shared_ptr<Tracer>> tracers;
  bool require_token{false};
};

template <typename Req, typename Res>
std::vector<Middleware<Req, Res>> TracingMiddlewares(const std::vector<std::shared_ptr<Tracer>>& tracers,
                                                     const std::string& operation, SpanKind kind) {
  std::vector<Middleware<Req, Res>> middlewares;
  for (const auto& tracer : tracers) {
    if (tracer) {
      middlewares.push_back(TraceEndpoint<Req, Res>(tracer, operation, kind));
    }
  }
  return middlewares;
}

// 순서(바깥→안쪽): 트레이싱 백엔드들, 토큰 확인(선택), 도메인 호출.
Endpoints MakeServerEndpoints(std::shared_ptr<AddService> service, const EndpointOptions& options);

class EndpointsService : public AddService {
 public:
  explicit EndpointsService(Endpoints endpoints);

  std::int64_t Sum(const RequestContext& ctx, std::int64_t a, std::int64_t b) override;
  std::string Concat(const RequestContext& ctx, const std::string& a, const std::string& b) override;

 private:
  Endpoints endpoints_;
};

}  // namespace addsvc
