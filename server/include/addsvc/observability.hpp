/*
 * 설명: 구조화 로그와 라우트별 메트릭 카운터를 관리하고 Prometheus 텍스트 형식으로 노출한다.
 * 버전: v1.0.0
 * 관련 문서: design/ops/runbook.md, design/protocol/contract.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/add_gateway_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "addsvc/errors.hpp"
#include "addsvc/tracing.hpp"

namespace addsvc {

struct LogContext {
  std::string trace_id;
  std::string method;
  std::string name;
  int status{0};
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t translated_errors{0};
};

class Observability {
 public:
  Observability(std::vector<std::string> routes, std::string log_level = "info");

  std::string NextTraceId();
  void RecordRequest(const std::string& route, int status, std::chrono::microseconds latency);
  void AttachSpanRecorder(std::shared_ptr<SpanRecorder> recorder);
  MetricsSnapshot Snapshot() const;
  std::string RenderPrometheus() const;
  void Log(const LogContext& ctx) const;
  void LogError(const std::string& trace_id, const std::string& route, const ErrorResItem& item);

 private:
  struct RouteCounters {
    std::atomic<std::uint64_t> requests{0};
    std::atomic<std::uint64_t> errors{0};
    std::atomic<std::uint64_t> latency_us{0};
  };

  RouteCounters* Find(const std::string& route);

  bool info_enabled_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> translated_errors_{0};
  std::map<std::string, RouteCounters> routes_;
  std::shared_ptr<SpanRecorder> span_recorder_;
};

}  // namespace addsvc
