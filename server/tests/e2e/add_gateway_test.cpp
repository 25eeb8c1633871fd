#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "addsvc/app.hpp"
#include "addsvc/errors.hpp"
#include "addsvc/http_client.hpp"

namespace {

namespace http = boost::beast::http;

addsvc::AppConfig TestConfig(unsigned short port) {
  addsvc::AppConfig cfg{};
  cfg.port = port;
  cfg.log_level = "info";
  cfg.auth_required = false;
  cfg.request_timeout_ms = 2000;
  cfg.max_body_bytes = 256;
  cfg.concat_max_length = 8;
  cfg.service_name = "addsvc-e2e";
  return cfg;
}

struct SimpleHttpResponse {
  http::status status;
  std::string content_type;
  std::string body;
  std::string server;
};

void ExpectErrorEnvelope(const SimpleHttpResponse& res, int code) {
  EXPECT_EQ(static_cast<int>(res.status), code);
  EXPECT_EQ(res.content_type, "application/json");
  auto body = nlohmann::json::parse(res.body);
  ASSERT_TRUE(body.is_object());
  ASSERT_TRUE(body.contains("error"));
  EXPECT_EQ(body["error"]["code"], code);
  ASSERT_TRUE(body["error"]["errors"].is_array());
  EXPECT_FALSE(body["error"]["errors"].empty());
}

class GatewayFixture : public ::testing::Test {
 protected:
  void Start(const addsvc::AppConfig& config, std::shared_ptr<addsvc::AddService> service = nullptr) {
    config_ = config;
    app_ = std::make_unique<addsvc::ServerApp>(config_, std::move(service));
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    if (app_) {
      app_->Stop();
    }
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  std::string Instance() const { return "127.0.0.1:" + std::to_string(config_.port); }

  SimpleHttpResponse Send(http::verb method, const std::string& target, const std::string& body,
                          const std::string& extra_header_name = "", const std::string& extra_header_value = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    stream.connect(results);

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "localhost");
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/json");
    if (!extra_header_name.empty()) {
      req.set(extra_header_name, extra_header_value);
    }
    req.body() = body;
    req.prepare_payload();

    http::write(stream, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), std::string(res[http::field::content_type]), res.body(),
                              std::string(res[http::field::server])};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  addsvc::AppConfig config_;
  std::unique_ptr<addsvc::ServerApp> app_;
  std::thread server_thread_;
};

class NotFoundService : public addsvc::AddService {
 public:
  std::int64_t Sum(const addsvc::RequestContext&, std::int64_t, std::int64_t) override {
    throw addsvc::RpcStatusError(grpc::StatusCode::NOT_FOUND, "no such accumulator");
  }
  std::string Concat(const addsvc::RequestContext&, const std::string&, const std::string&) override {
    throw addsvc::RpcStatusError(grpc::StatusCode::UNAVAILABLE, "backend draining");
  }
};

}  // namespace

TEST_F(GatewayFixture, SumConcatAndDecodeErrors) {
  Start(TestConfig(18090));

  auto sum = Send(http::verb::post, "/api/add/sum", R"({"a":2,"b":3})");
  ASSERT_EQ(sum.status, http::status::ok);
  EXPECT_EQ(sum.content_type, "application/json; charset=utf-8");
  EXPECT_EQ(nlohmann::json::parse(sum.body), (nlohmann::json{{"res", 5}}));

  auto concat = Send(http::verb::post, "/api/add/concat", R"({"a":"foo","b":"bar"})");
  ASSERT_EQ(concat.status, http::status::ok);
  EXPECT_EQ(nlohmann::json::parse(concat.body), (nlohmann::json{{"res", "foobar"}}));

  EXPECT_EQ(sum.server, "addsvc-e2e");
  auto bad = Send(http::verb::post, "/api/add/sum", "not-json");
  ExpectErrorEnvelope(bad, 400);
  EXPECT_EQ(bad.server, "addsvc-e2e");
  ExpectErrorEnvelope(Send(http::verb::post, "/api/add/sum", ""), 400);
  ExpectErrorEnvelope(Send(http::verb::post, "/api/add/concat", R"({"a":"12345","b":"6789"})"), 500);
  ExpectErrorEnvelope(Send(http::verb::post, "/api/add/nothing", "{}"), 404);
  ExpectErrorEnvelope(Send(http::verb::get, "/api/add/sum", ""), 405);
  ExpectErrorEnvelope(Send(http::verb::post, "/api/add/sum", std::string(300, ' ')), 413);

  auto metrics = Send(http::verb::get, "/metrics", "");
  ASSERT_EQ(metrics.status, http::status::ok);
  EXPECT_NE(metrics.body.find("addsvc_route_requests_total{route=\"/api/add/sum\"}"), std::string::npos);
  EXPECT_NE(metrics.body.find("addsvc_translated_errors_total 3"), std::string::npos);
  EXPECT_NE(metrics.body.find("addsvc_spans_reported_total{backend=\"memory\"} 3"), std::string::npos);
}

TEST_F(GatewayFixture, TraceHeadersReachSpans) {
  Start(TestConfig(18091));
  auto res = Send(http::verb::post, "/api/add/sum", R"({"a":1,"b":1})", "X-B3-TraceId", "463ac35c9f6413ad");
  ASSERT_EQ(res.status, http::status::ok);

  auto spans = app_->GetSpanRecorder()->Spans();
  ASSERT_EQ(spans.size(), 1u);
  EXPECT_EQ(spans[0].operation, "Sum");
  EXPECT_EQ(spans[0].trace_id, "463ac35c9f6413ad");
  EXPECT_EQ(spans[0].backend, "memory");
  EXPECT_FALSE(spans[0].error);
}

TEST_F(GatewayFixture, ClientRoundTripAndRemoteErrors) {
  Start(TestConfig(18092));
  auto client = addsvc::NewHttpClient(Instance());
  addsvc::RequestContext ctx;
  ctx.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

  EXPECT_EQ(client->Sum(ctx, 40, 2), 42);
  EXPECT_EQ(client->Concat(ctx, "ab", "cd"), "abcd");

  try {
    client->Concat(ctx, "12345", "6789");
    FAIL() << "expected remote error";
  } catch (const addsvc::RemoteError& ex) {
    EXPECT_EQ(ex.Code(), 500);
    EXPECT_EQ(ex.Msg(), "maximum size of 8 exceeded");
    ASSERT_EQ(ex.Errors().size(), 1u);
    EXPECT_EQ(ex.Errors()[0].field, std::optional<std::string>("b"));
  }
}

TEST_F(GatewayFixture, RequiredTokenGuardsRoutes) {
  auto cfg = TestConfig(18093);
  cfg.auth_required = true;
  Start(cfg);

  ExpectErrorEnvelope(Send(http::verb::post, "/api/add/sum", R"({"a":2,"b":3})"), 401);
  auto allowed = Send(http::verb::post, "/api/add/sum", R"({"a":2,"b":3})", "Authorization", "Bearer t0k3n");
  EXPECT_EQ(allowed.status, http::status::ok);

  auto client = addsvc::NewHttpClient(Instance());
  addsvc::RequestContext anonymous;
  try {
    client->Sum(anonymous, 1, 2);
    FAIL() << "expected unauthorized";
  } catch (const addsvc::RemoteError& ex) {
    EXPECT_EQ(ex.Code(), 401);
  }

  addsvc::RequestContext authed;
  authed.token = "t0k3n";
  EXPECT_EQ(client->Sum(authed, 1, 2), 3);
}

TEST_F(GatewayFixture, RpcStatusErrorsMapToHttpCodes) {
  Start(TestConfig(18094), std::make_shared<NotFoundService>());
  auto not_found = Send(http::verb::post, "/api/add/sum", R"({"a":2,"b":3})");
  ExpectErrorEnvelope(not_found, 404);
  EXPECT_EQ(nlohmann::json::parse(not_found.body)["error"]["message"], "no such accumulator");
  ExpectErrorEnvelope(Send(http::verb::post, "/api/add/concat", R"({"a":"x","b":"y"})"), 503);
}
