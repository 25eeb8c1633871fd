/*
 * 설명: 게이트웨이 구성 요소를 한 번 조립하고 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/add_gateway_test.cpp
 */
#include "addsvc/app.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "addsvc/http_session.hpp"

namespace addsvc {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<const Router> router, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), router_(std::move(router)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->router_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<const Router> router_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<AddService> service, StatusOverrides status_overrides)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), service_(std::move(service)) {
  if (!service_) {
    service_ = std::make_shared<BasicAddService>(config_.concat_max_length);
  }
  observability_ = std::make_shared<Observability>(
      std::vector<std::string>{kSumPath, kConcatPath, kMetricsPath}, config_.log_level);
  span_recorder_ = std::make_shared<SpanRecorder>("memory", config_.service_name);
  log_tracer_ = std::make_shared<LogTracer>("log", config_.service_name);
  observability_->AttachSpanRecorder(span_recorder_);

  EndpointOptions endpoint_options;
  endpoint_options.tracers = {span_recorder_, log_tracer_};
  endpoint_options.require_token = config_.auth_required;
  endpoints_ = MakeServerEndpoints(service_, endpoint_options);

  GatewayOptions gateway_options;
  gateway_options.server = DefaultServerOptions(observability_);
  gateway_options.server.status_overrides = std::move(status_overrides);
  gateway_options.observability = observability_;
  router_ = MakeHttpHandler(endpoints_, gateway_options);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, router_, observability_);
    listener_->Run();
    std::cout << "서버 시작: 포트 " << config_.port << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace addsvc
