/*
 * 설명: Authorization 헤더의 Bearer 토큰을 요청 컨텍스트로 옮기고, 토큰이 필요한 엔드포인트를 보호한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/endpoint_middleware_test.cpp, server/tests/e2e/add_gateway_test.cpp
 */
#pragma once

#include <exception>
#include <string>

#include <boost/beast/http.hpp>

#include "addsvc/endpoint.hpp"
#include "addsvc/errors.hpp"
#include "addsvc/request_context.hpp"

namespace addsvc {

inline constexpr char kTokenContextMissing[] = "token up for parsing was not passed through the context";

std::string ParseBearer(const std::string& header_value);

// 헤더가 없거나 Bearer 형식이 아니면 컨텍스트를 그대로 둔다.
void HttpToContext(const boost::beast::http::request<boost::beast::http::string_body>& req, RequestContext& ctx);

// 토큰이 있으면 나가는 요청에 Authorization 헤더로 싣는다.
void ContextToHttp(const RequestContext& ctx, boost::beast::http::request<boost::beast::http::string_body>& req);

template <typename Req, typename Res>
Middleware<Req, Res> RequireToken() {
  return [](Endpoint<Req, Res> next) -> Endpoint<Req, Res> {
    return [next](const RequestContext& ctx, const Req& req) -> Outcome<Res> {
      if (!ctx.token || ctx.token->empty()) {
        return Outcome<Res>::Failure(std::make_exception_ptr(
            TransportError(TransportError::Kind::kTokenContextMissing, kTokenContextMissing)));
      }
      return next(ctx, req);
    };
  };
}

}  // namespace addsvc
