/*
 * 설명: 서버 엔드포인트 집합 구성과 엔드포인트 기반 서비스 어댑터를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/endpoint_middleware_test.cpp
 */
#include "addsvc/endpoints.hpp"

#include <exception>
#include <utility>

#include "addsvc/auth_context.hpp"

namespace addsvc {

namespace {
template <typename Req, typename Res>
Endpoint<Req, Res> Decorate(Endpoint<Req, Res> inner, const EndpointOptions& options, const std::string& operation) {
  auto middlewares = TracingMiddlewares<Req, Res>(options.tracers, operation, SpanKind::kServer);
  if (options.require_token) {
    middlewares.push_back(RequireToken<Req, Res>());
  }
  return Chain(std::move(inner), middlewares);
}
}  // namespace

Endpoints MakeServerEndpoints(std::shared_ptr<AddService> service, const EndpointOptions& options) {
  auto sum = MakeEndpoint<SumRequest, SumResponse>(
      [service](const RequestContext& ctx, const SumRequest& req) {
        return SumResponse{service->Sum(ctx, req.a, req.b)};
      });
  auto concat = MakeEndpoint<ConcatRequest, ConcatResponse>(
      [service](const RequestContext& ctx, const ConcatRequest& req) {
        return ConcatResponse{service->Concat(ctx, req.a, req.b)};
      });

  Endpoints endpoints;
  endpoints.sum = Decorate(std::move(sum), options, "Sum");
  endpoints.concat = Decorate(std::move(concat), options, "Concat");
  return endpoints;
}

EndpointsService::EndpointsService(Endpoints endpoints) : endpoints_(std::move(endpoints)) {}

std::int64_t EndpointsService::Sum(const RequestContext& ctx, std::int64_t a, std::int64_t b) {
  auto outcome = endpoints_.sum(ctx, SumRequest{a, b});
  if (!outcome.ok()) {
    std::rethrow_exception(outcome.error);
  }
  return outcome.value->res;
}

std::string EndpointsService::Concat(const RequestContext& ctx, const std::string& a, const std::string& b) {
  auto outcome = endpoints_.concat(ctx, ConcatRequest{a, b});
  if (!outcome.ok()) {
    std::rethrow_exception(outcome.error);
  }
  return outcome.value->res;
}

}  // namespace addsvc
