/*
 * 설명: 구조화 로그와 라우트별 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/ops/runbook.md, design/protocol/contract.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "addsvc/observability.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace addsvc {

namespace {
constexpr char kOtherRoute[] = "other";

void WriteHeader(std::ostringstream& oss, const char* name, const char* help, const char* type) {
  oss << "# HELP " << name << " " << help << "\n";
  oss << "# TYPE " << name << " " << type << "\n";
}
}  // namespace

Observability::Observability(std::vector<std::string> routes, std::string log_level)
    : info_enabled_(log_level != "error") {
  for (const auto& route : routes) {
    routes_.try_emplace(route);
  }
  routes_.try_emplace(kOtherRoute);
}

std::string Observability::NextTraceId() { return NewTraceId(); }

Observability::RouteCounters* Observability::Find(const std::string& route) {
  auto it = routes_.find(route);
  if (it == routes_.end()) {
    it = routes_.find(kOtherRoute);
  }
  return &it->second;
}

void Observability::RecordRequest(const std::string& route, int status, std::chrono::microseconds latency) {
  request_total_.fetch_add(1);
  auto* counters = Find(route);
  counters->requests.fetch_add(1);
  counters->latency_us.fetch_add(static_cast<std::uint64_t>(latency.count()));
  if (status >= 400) {
    request_errors_.fetch_add(1);
    counters->errors.fetch_add(1);
  }
}

void Observability::AttachSpanRecorder(std::shared_ptr<SpanRecorder> recorder) {
  span_recorder_ = std::move(recorder);
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.translated_errors = translated_errors_.load();
  return snapshot;
}

std::string Observability::RenderPrometheus() const {
  std::ostringstream oss;
  WriteHeader(oss, "addsvc_http_requests_total", "Total HTTP requests handled.", "counter");
  oss << "addsvc_http_requests_total " << request_total_.load() << "\n";
  WriteHeader(oss, "addsvc_http_request_errors_total", "HTTP responses with status >= 400.", "counter");
  oss << "addsvc_http_request_errors_total " << request_errors_.load() << "\n";
  WriteHeader(oss, "addsvc_translated_errors_total", "Errors written through the error translator.", "counter");
  oss << "addsvc_translated_errors_total " << translated_errors_.load() << "\n";

  WriteHeader(oss, "addsvc_route_requests_total", "HTTP requests per route.", "counter");
  for (const auto& [route, counters] : routes_) {
    oss << "addsvc_route_requests_total{route=\"" << route << "\"} " << counters.requests.load() << "\n";
  }
  WriteHeader(oss, "addsvc_route_errors_total", "HTTP error responses per route.", "counter");
  for (const auto& [route, counters] : routes_) {
    oss << "addsvc_route_errors_total{route=\"" << route << "\"} " << counters.errors.load() << "\n";
  }
  WriteHeader(oss, "addsvc_route_latency_seconds_sum", "Accumulated handling time per route.", "counter");
  for (const auto& [route, counters] : routes_) {
    oss << "addsvc_route_latency_seconds_sum{route=\"" << route << "\"} " << std::fixed << std::setprecision(6)
        << static_cast<double>(counters.latency_us.load()) / 1e6 << "\n";
  }
  if (span_recorder_) {
    WriteHeader(oss, "addsvc_spans_reported_total", "Finished endpoint spans.", "counter");
    oss << "addsvc_spans_reported_total{backend=\"" << span_recorder_->Backend() << "\"} "
        << span_recorder_->ReportedCount() << "\n";
  }
  return oss.str();
}

void Observability::Log(const LogContext& ctx) const {
  if (!info_enabled_) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = "info";
  log_json["traceId"] = ctx.trace_id;
  log_json["method"] = ctx.method;
  log_json["eventName"] = ctx.name;
  log_json["status"] = ctx.status;
  log_json["latencyMs"] = ctx.latency_ms;
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void Observability::LogError(const std::string& trace_id, const std::string& route, const ErrorResItem& item) {
  translated_errors_.fetch_add(1);
  nlohmann::json log_json;
  log_json["level"] = "error";
  log_json["traceId"] = trace_id;
  log_json["eventName"] = route;
  log_json["code"] = item.code;
  log_json["message"] = item.message;
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace addsvc
