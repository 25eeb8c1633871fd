/*
 * 설명: HTTP 연결 하나를 읽고 라우터에 위임한 뒤 응답을 쓴다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/add_gateway_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "addsvc/codec.hpp"
#include "addsvc/config.hpp"
#include "addsvc/http_gateway.hpp"
#include "addsvc/observability.hpp"

namespace addsvc {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, std::shared_ptr<const Router> router,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void RejectOversizedBody();
  void SendResponse(std::shared_ptr<HttpResponse> res);
  void DoClose();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
  HttpRequest req_;
  AppConfig config_;
  std::shared_ptr<const Router> router_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::string route_;
};

}  // namespace addsvc
