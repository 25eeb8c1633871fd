/*
 * 설명: 원격 게이트웨이를 호출하는 HTTP 클라이언트 엔드포인트와 AddService 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/http_client_test.cpp, server/tests/e2e/add_gateway_test.cpp
 */
#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/beast/http.hpp>

#include "addsvc/codec.hpp"
#include "addsvc/endpoint.hpp"
#include "addsvc/endpoints.hpp"
#include "addsvc/request_context.hpp"
#include "addsvc/service.hpp"
#include "addsvc/tracing.hpp"

namespace addsvc {

struct InstanceUrl {
  std::string scheme;
  std::string host;
  std::string port;
};

// "host:port"처럼 스킴이 없으면 http://를 붙인다. 형식이 틀리면 std::invalid_argument를 던진다.
InstanceUrl ParseInstanceUrl(std::string instance);

// 기본 포트(80)가 아니면 "host:port", IPv6 리터럴은 대괄호로 감싼다.
std::string HostHeader(const InstanceUrl& url);

using ClientRequestFunc = std::function<void(const RequestContext&, HttpRequest&)>;

template <typename Req>
using EncodeRequestFunc = std::function<void(const RequestContext&, HttpRequest&, const Req&)>;
template <typename Res>
using DecodeResponseFunc = std::function<Res(const RequestContext&, const HttpResponse&)>;

struct ClientOptions {
  // 바깥쪽 백엔드가 먼저 온다.
  std::vector<std::shared_ptr<Tracer>> tracers;
  std::chrono::milliseconds timeout{5000};
};

// 요청 하나를 보내고 응답 전체를 읽는다. 마감 시각을 넘기면 DEADLINE_EXCEEDED RpcStatusError를 던진다.
HttpResponse RoundTrip(const InstanceUrl& url, HttpRequest& req, const RequestContext& ctx,
                       std::chrono::milliseconds timeout);

template <typename Req, typename Res>
Endpoint<Req, Res> MakeClientEndpoint(boost::beast::http::verb method, InstanceUrl url, std::string path,
                                      EncodeRequestFunc<Req> encode, DecodeResponseFunc<Res> decode,
                                      std::vector<ClientRequestFunc> before, std::chrono::milliseconds timeout) {
  auto call = [method, url, path, encode, decode, before, timeout](const RequestContext& ctx, const Req& request) {
    HttpRequest req{method, path, 11};
    req.set(boost::beast::http::field::host, HostHeader(url));
    encode(ctx, req, request);
    for (const auto& func : before) {
      func(ctx, req);
    }
    auto res = RoundTrip(url, req, ctx, timeout);
    return decode(ctx, res);
  };
  return MakeEndpoint<Req, Res>(std::move(call));
}

// 서버와 같은 순서로 트레이싱을 감싸지만 토큰 확인은 하지 않는다.
Endpoints MakeClientEndpoints(const InstanceUrl& url, const ClientOptions& options);

std::shared_ptr<AddService> NewHttpClient(const std::string& instance, const ClientOptions& options = {});

}  // namespace addsvc
