/*
 * 설명: HTTP 요청을 읽어 요청 컨텍스트를 만들고 라우터 결과를 응답으로 보낸다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/add_gateway_test.cpp
 */
#include "addsvc/http_session.hpp"

#include <utility>

#include <boost/beast/version.hpp>

#include "addsvc/error_translator.hpp"

namespace addsvc {

namespace http = boost::beast::http;

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<const Router> router, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), router_(std::move(router)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  parser_.emplace();
  parser_->body_limit(config_.max_body_bytes);
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read(stream_, buffer_, *parser_,
                   [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                     self->OnRead(ec, bytes_transferred);
                   });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    return DoClose();
  }
  if (ec == http::error::body_limit) {
    return RejectOversizedBody();
  }
  if (ec) {
    return;
  }
  req_ = parser_->release();
  HandleRequest();
}

void HttpSession::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  route_ = router_->RouteName(req_);

  RequestContext ctx;
  ctx.deadline = request_start_ + std::chrono::milliseconds(config_.request_timeout_ms);
  TraceHeadersToContext(req_, ctx);
  if (ctx.trace_id.empty()) {
    ctx.trace_id = observability_ ? observability_->NextTraceId() : NewTraceId();
  }
  trace_id_ = ctx.trace_id;

  auto res = std::make_shared<HttpResponse>();
  res->version(req_.version());
  res->keep_alive(req_.keep_alive());

  if (!router_->Serve(req_, ctx, *res)) {
    // 오류 본문조차 만들지 못했으면 연결을 닫는다.
    return DoClose();
  }
  SendResponse(res);
}

void HttpSession::RejectOversizedBody() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : NewTraceId();
  route_ = "other";
  req_ = parser_->release();
  auto res = std::make_shared<HttpResponse>();
  res->version(req_.version());
  res->keep_alive(false);
  auto message = "request body exceeds " + std::to_string(config_.max_body_bytes) + " bytes";
  if (!WriteErrorResponse(ErrorResItem{413, message, {ErrorDetail{std::nullopt, message}}}, *res)) {
    return DoClose();
  }
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<HttpResponse> res) {
  auto self = shared_from_this();
  // 성공/오류 응답 모두 같은 공통 헤더를 가진다.
  res->set(http::field::server, config_.service_name);
  res->prepare_payload();
  if (observability_) {
    auto elapsed = std::chrono::steady_clock::now() - request_start_;
    observability_->RecordRequest(route_, static_cast<int>(res->result_int()),
                                  std::chrono::duration_cast<std::chrono::microseconds>(elapsed));
    observability_->Log(LogContext{trace_id_, std::string(http::to_string(req_.method())), std::string(req_.target()),
                                   static_cast<int>(res->result_int()),
                                   static_cast<long>(
                                       std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count())});
  }
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    if (res->need_eof()) {
      return self->DoClose();
    }
    self->DoRead();
  });
}

void HttpSession::DoClose() {
  boost::beast::error_code ignored;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
}

}  // namespace addsvc
