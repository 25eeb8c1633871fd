/*
 * 설명: 엔드포인트를 고정 경로에 묶는 HTTP 라우터와 서버 핸들러 합성기를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/http_gateway_test.cpp, server/tests/e2e/add_gateway_test.cpp
 */
#pragma once

#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/beast/http.hpp>

#include "addsvc/codec.hpp"
#include "addsvc/endpoint.hpp"
#include "addsvc/endpoints.hpp"
#include "addsvc/error_translator.hpp"
#include "addsvc/observability.hpp"
#include "addsvc/request_context.hpp"

namespace addsvc {

inline constexpr char kSumPath[] = "/api/add/sum";
inline constexpr char kConcatPath[] = "/api/add/concat";
inline constexpr char kMetricsPath[] = "/metrics";

inline constexpr char kTraceIdHeader[] = "X-B3-TraceId";
inline constexpr char kSpanIdHeader[] = "X-B3-SpanId";
inline constexpr char kParentSpanIdHeader[] = "X-B3-ParentSpanId";
inline constexpr char kSampledHeader[] = "X-B3-Sampled";

// 응답을 채웠으면 true, 연결을 닫아야 하면 false를 돌려준다.
using HttpHandler = std::function<bool(const HttpRequest&, RequestContext&, HttpResponse&)>;
using RequestFunc = std::function<void(const HttpRequest&, RequestContext&)>;
using ErrorLogger = std::function<void(const RequestContext&, const std::string&, const ErrorResItem&)>;

template <typename Req>
using DecodeRequestFunc = std::function<Req(const RequestContext&, const HttpRequest&)>;
template <typename Res>
using EncodeResponseFunc = std::function<void(const RequestContext&, HttpResponse&, const Res&)>;

struct ServerOptions {
  std::vector<RequestFunc> before;
  StatusOverrides status_overrides;
  ErrorLogger error_logger;
};

void TraceHeadersToContext(const HttpRequest& req, RequestContext& ctx);
void ContextToTraceHeaders(const RequestContext& ctx, HttpRequest& req);

// 오류를 번역해 res를 새로 채운다. 로거는 부수 효과로만 호출된다.
bool EncodeError(const std::exception_ptr& error, const std::string& route, const ServerOptions& options,
                 const RequestContext& ctx, HttpResponse& res);

template <typename Req, typename Res>
HttpHandler MakeServerHandler(std::string route, Endpoint<Req, Res> endpoint, DecodeRequestFunc<Req> decode,
                              EncodeResponseFunc<Res> encode, ServerOptions options) {
  return [route, endpoint, decode, encode, options](const HttpRequest& req, RequestContext& ctx,
                                                    HttpResponse& res) -> bool {
    for (const auto& before : options.before) {
      before(req, ctx);
    }
    Req request;
    try {
      request = decode(ctx, req);
    } catch (...) {
      return EncodeError(std::current_exception(), route, options, ctx, res);
    }
    auto outcome = endpoint(ctx, request);
    if (!outcome.ok()) {
      return EncodeError(outcome.error, route, options, ctx, res);
    }
    try {
      encode(ctx, res, *outcome.value);
    } catch (...) {
      return EncodeError(std::current_exception(), route, options, ctx, res);
    }
    return true;
  };
}

class Router {
 public:
  void Handle(boost::beast::http::verb method, const std::string& path, HttpHandler handler);

  // 라우트를 찾아 처리한다. 경로가 없으면 404, 메서드가 다르면 405 ErrorRes를 쓴다.
  bool Serve(const HttpRequest& req, RequestContext& ctx, HttpResponse& res) const;

  // 메트릭 라벨용 이름. 등록되지 않은 경로는 "other"이다.
  std::string RouteName(const HttpRequest& req) const;
  std::vector<std::string> Paths() const;

 private:
  std::map<std::string, std::map<boost::beast::http::verb, HttpHandler>> routes_;
};

struct GatewayOptions {
  ServerOptions server;
  std::shared_ptr<Observability> observability;
};

ServerOptions DefaultServerOptions(std::shared_ptr<Observability> observability);

std::shared_ptr<const Router> MakeHttpHandler(const Endpoints& endpoints, const GatewayOptions& options);

}  // namespace addsvc
