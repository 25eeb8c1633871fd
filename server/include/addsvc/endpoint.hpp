/*
 * 설명: 전송 계층과 무관한 엔드포인트 호출 규약과 미들웨어 합성 도구를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/endpoint_middleware_test.cpp
 */
#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include <grpcpp/support/status.h>

#include "addsvc/errors.hpp"
#include "addsvc/request_context.hpp"

namespace addsvc {

// 응답과 오류 중 정확히 하나만 채워진다.
template <typename T>
struct Outcome {
  std::optional<T> value;
  std::exception_ptr error;

  bool ok() const { return error == nullptr; }

  static Outcome Success(T v) {
    Outcome out;
    out.value = std::move(v);
    return out;
  }

  static Outcome Failure(std::exception_ptr e) {
    Outcome out;
    out.error = std::move(e);
    return out;
  }
};

template <typename Req, typename Res>
using Endpoint = std::function<Outcome<Res>(const RequestContext&, const Req&)>;

template <typename Req, typename Res>
using Middleware = std::function<Endpoint<Req, Res>(Endpoint<Req, Res>)>;

// middlewares는 바깥쪽에서 안쪽 순서로 나열한다. 첫 원소가 가장 먼저 실행된다.
template <typename Req, typename Res>
Endpoint<Req, Res> Chain(Endpoint<Req, Res> inner, const std::vector<Middleware<Req, Res>>& middlewares) {
  for (auto it = middlewares.rbegin(); it != middlewares.rend(); ++it) {
    inner = (*it)(std::move(inner));
  }
  return inner;
}

// 도메인 호출을 엔드포인트로 감싼다. 예외는 Outcome의 오류 값으로 바뀌며 호출자에게 던져지지 않는다.
template <typename Req, typename Res, typename Fn>
Endpoint<Req, Res> MakeEndpoint(Fn fn) {
  return [fn](const RequestContext& ctx, const Req& req) -> Outcome<Res> {
    if (ctx.Expired()) {
      return Outcome<Res>::Failure(std::make_exception_ptr(
          RpcStatusError(grpc::StatusCode::DEADLINE_EXCEEDED, "context deadline exceeded")));
    }
    try {
      return Outcome<Res>::Success(fn(ctx, req));
    } catch (...) {
      return Outcome<Res>::Failure(std::current_exception());
    }
  };
}

}  // namespace addsvc
