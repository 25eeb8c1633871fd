/*
 * 설명: 게이트웨이 구성(엔드포인트, 라우터, 관측성)과 서버 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/add_gateway_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "addsvc/config.hpp"
#include "addsvc/endpoints.hpp"
#include "addsvc/error_translator.hpp"
#include "addsvc/http_gateway.hpp"
#include "addsvc/observability.hpp"
#include "addsvc/service.hpp"
#include "addsvc/tracing.hpp"

namespace addsvc {

class Listener;

class ServerApp {
 public:
  // service가 없으면 BasicAddService를 쓴다.
  explicit ServerApp(const AppConfig& config, std::shared_ptr<AddService> service = nullptr,
                     StatusOverrides status_overrides = {});
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }
  std::shared_ptr<SpanRecorder> GetSpanRecorder() { return span_recorder_; }
  std::shared_ptr<const Router> GetRouter() const { return router_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<AddService> service_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<SpanRecorder> span_recorder_;
  std::shared_ptr<LogTracer> log_tracer_;
  Endpoints endpoints_;
  std::shared_ptr<const Router> router_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace addsvc
