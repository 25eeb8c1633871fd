/*
 * 설명: 라우팅 테이블 구성, 오류 응답 작성, 트레이스 헤더 전파를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/http_gateway_test.cpp, server/tests/e2e/add_gateway_test.cpp
 */
#include "addsvc/http_gateway.hpp"

#include "addsvc/auth_context.hpp"

namespace addsvc {

namespace {
namespace http = boost::beast::http;

std::string TargetPath(const HttpRequest& req) {
  std::string target_str = std::string(req.target());
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    return target_str.substr(0, qpos);
  }
  return target_str;
}

std::string HeaderValue(const HttpRequest& req, const char* name) {
  auto it = req.find(name);
  return it == req.end() ? std::string() : std::string(it->value());
}

ErrorResItem RoutingError(int code, const std::string& message) {
  return ErrorResItem{code, message, {ErrorDetail{std::nullopt, message}}};
}
}  // namespace

void TraceHeadersToContext(const HttpRequest& req, RequestContext& ctx) {
  auto trace_id = HeaderValue(req, kTraceIdHeader);
  if (trace_id.empty()) {
    return;
  }
  ctx.trace_id = trace_id;
  ctx.span_id = HeaderValue(req, kSpanIdHeader);
}

void ContextToTraceHeaders(const RequestContext& ctx, HttpRequest& req) {
  if (ctx.trace_id.empty()) {
    return;
  }
  req.set(kTraceIdHeader, ctx.trace_id);
  if (!ctx.span_id.empty()) {
    req.set(kSpanIdHeader, ctx.span_id);
  }
  if (!ctx.parent_span_id.empty()) {
    req.set(kParentSpanIdHeader, ctx.parent_span_id);
  }
  req.set(kSampledHeader, "1");
}

bool EncodeError(const std::exception_ptr& error, const std::string& route, const ServerOptions& options,
                 const RequestContext& ctx, HttpResponse& res) {
  HttpResponse fresh;
  fresh.version(res.version());
  fresh.keep_alive(res.keep_alive());
  auto item = TranslateError(error, options.status_overrides);
  if (options.error_logger) {
    options.error_logger(ctx, route, item);
  }
  if (!WriteErrorResponse(item, fresh)) {
    return false;
  }
  res = std::move(fresh);
  return true;
}

void Router::Handle(http::verb method, const std::string& path, HttpHandler handler) {
  routes_[path][method] = std::move(handler);
}

bool Router::Serve(const HttpRequest& req, RequestContext& ctx, HttpResponse& res) const {
  auto it = routes_.find(TargetPath(req));
  if (it == routes_.end()) {
    return WriteErrorResponse(RoutingError(404, "route not found"), res);
  }
  auto handler_it = it->second.find(req.method());
  if (handler_it == it->second.end()) {
    std::string allow;
    for (const auto& entry : it->second) {
      if (!allow.empty()) {
        allow += ", ";
      }
      allow += std::string(http::to_string(entry.first));
    }
    res.set(http::field::allow, allow);
    return WriteErrorResponse(RoutingError(405, "method not allowed"), res);
  }
  return handler_it->second(req, ctx, res);
}

std::string Router::RouteName(const HttpRequest& req) const {
  auto path = TargetPath(req);
  return routes_.count(path) > 0 ? path : std::string("other");
}

std::vector<std::string> Router::Paths() const {
  std::vector<std::string> paths;
  for (const auto& entry : routes_) {
    paths.push_back(entry.first);
  }
  return paths;
}

ServerOptions DefaultServerOptions(std::shared_ptr<Observability> observability) {
  ServerOptions options;
  if (observability) {
    options.error_logger = [observability](const RequestContext& ctx, const std::string& route,
                                           const ErrorResItem& item) {
      observability->LogError(ctx.trace_id, route, item);
    };
  }
  return options;
}

std::shared_ptr<const Router> MakeHttpHandler(const Endpoints& endpoints, const GatewayOptions& options) {
  auto router = std::make_shared<Router>();

  auto with_token = options.server;
  with_token.before.push_back(HttpToContext);

  router->Handle(http::verb::post, kSumPath,
                 MakeServerHandler<SumRequest, SumResponse>(kSumPath, endpoints.sum, DecodeHttpSumRequest,
                                                            EncodeJsonResponse<SumResponse>, with_token));
  router->Handle(http::verb::post, kConcatPath,
                 MakeServerHandler<ConcatRequest, ConcatResponse>(kConcatPath, endpoints.concat,
                                                                  DecodeHttpConcatRequest,
                                                                  EncodeJsonResponse<ConcatResponse>, with_token));

  auto observability = options.observability;
  router->Handle(http::verb::get, kMetricsPath,
                 [observability](const HttpRequest& /*req*/, RequestContext& /*ctx*/, HttpResponse& res) {
                   res.set(http::field::content_type, "text/plain; version=0.0.4; charset=utf-8");
                   res.result(http::status::ok);
                   res.body() = observability ? observability->RenderPrometheus() : std::string{};
                   return true;
                 });
  return router;
}

}  // namespace addsvc
