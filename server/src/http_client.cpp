/*
 * 설명: 인스턴스 주소 정규화, 동기 HTTP 왕복, 클라이언트 엔드포인트 구성을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/http_client_test.cpp, server/tests/e2e/add_gateway_test.cpp
 */
#include "addsvc/http_client.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/version.hpp>

#include "addsvc/auth_context.hpp"
#include "addsvc/errors.hpp"
#include "addsvc/http_gateway.hpp"

namespace addsvc {

namespace {
namespace http = boost::beast::http;

bool IsValidPort(const std::string& port) {
  if (port.empty() || port.size() > 5 ||
      !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return false;
  }
  auto value = std::stoul(port);
  return value > 0 && value <= 65535;
}

void Validate(bool condition, const std::string& instance, const char* reason) {
  if (!condition) {
    throw std::invalid_argument("invalid instance url \"" + instance + "\": " + reason);
  }
}
}  // namespace

InstanceUrl ParseInstanceUrl(std::string instance) {
  const std::string original = instance;
  if (instance.compare(0, 4, "http") != 0) {
    instance = "http://" + instance;
  }
  auto scheme_end = instance.find("://");
  Validate(scheme_end != std::string::npos, original, "missing scheme separator");

  InstanceUrl url;
  url.scheme = instance.substr(0, scheme_end);
  Validate(url.scheme == "http", original, "unsupported scheme");

  auto rest = instance.substr(scheme_end + 3);
  auto authority = rest.substr(0, rest.find_first_of("/?#"));
  Validate(authority.find('@') == std::string::npos, original, "user info is not supported");

  std::string port;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    Validate(close != std::string::npos, original, "unterminated IPv6 literal");
    url.host = authority.substr(1, close - 1);
    auto tail = authority.substr(close + 1);
    if (!tail.empty()) {
      Validate(tail.front() == ':', original, "unexpected characters after host");
      port = tail.substr(1);
      Validate(IsValidPort(port), original, "invalid port");
    }
  } else {
    auto colon = authority.rfind(':');
    url.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port = authority.substr(colon + 1);
      Validate(IsValidPort(port), original, "invalid port");
    }
  }
  Validate(!url.host.empty(), original, "missing host");
  Validate(url.host.find_first_of(" \t\r\n") == std::string::npos, original, "invalid host");
  url.port = port.empty() ? "80" : port;
  return url;
}

std::string HostHeader(const InstanceUrl& url) {
  auto host = url.host.find(':') == std::string::npos ? url.host : "[" + url.host + "]";
  if (url.port.empty() || url.port == "80") {
    return host;
  }
  return host + ":" + url.port;
}

HttpResponse RoundTrip(const InstanceUrl& url, HttpRequest& req, const RequestContext& ctx,
                       std::chrono::milliseconds timeout) {
  if (ctx.Expired()) {
    throw RpcStatusError(grpc::StatusCode::DEADLINE_EXCEEDED, "context deadline exceeded");
  }
  auto deadline = std::min(ctx.deadline, std::chrono::steady_clock::now() + timeout);

  boost::asio::io_context ioc;
  boost::asio::ip::tcp::resolver resolver{ioc};
  boost::beast::tcp_stream stream{ioc};
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.prepare_payload();

  HttpResponse res;
  try {
    auto const results = resolver.resolve(url.host, url.port);
    stream.expires_at(deadline);
    stream.connect(results);
    stream.expires_at(deadline);
    http::write(stream, req);
    boost::beast::flat_buffer buffer;
    stream.expires_at(deadline);
    http::read(stream, buffer, res);
  } catch (const boost::system::system_error& ex) {
    if (ex.code() == boost::beast::error::timeout) {
      throw RpcStatusError(grpc::StatusCode::DEADLINE_EXCEEDED, "context deadline exceeded");
    }
    throw;
  }

  boost::beast::error_code ec;
  stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  return res;
}

Endpoints MakeClientEndpoints(const InstanceUrl& url, const ClientOptions& options) {
  std::vector<ClientRequestFunc> before{ContextToTraceHeaders, ContextToHttp};

  auto sum = MakeClientEndpoint<SumRequest, SumResponse>(http::verb::post, url, kSumPath,
                                                         EncodeJsonRequest<SumRequest>, DecodeHttpSumResponse,
                                                         before, options.timeout);
  auto concat = MakeClientEndpoint<ConcatRequest, ConcatResponse>(
      http::verb::post, url, kConcatPath, EncodeJsonRequest<ConcatRequest>, DecodeHttpConcatResponse, before,
      options.timeout);

  Endpoints endpoints;
  endpoints.sum = Chain(std::move(sum),
                        TracingMiddlewares<SumRequest, SumResponse>(options.tracers, "Sum", SpanKind::kClient));
  endpoints.concat = Chain(
      std::move(concat),
      TracingMiddlewares<ConcatRequest, ConcatResponse>(options.tracers, "Concat", SpanKind::kClient));
  return endpoints;
}

std::shared_ptr<AddService> NewHttpClient(const std::string& instance, const ClientOptions& options) {
  auto url = ParseInstanceUrl(instance);
  return std::make_shared<EndpointsService>(MakeClientEndpoints(url, options));
}

}  // namespace addsvc
