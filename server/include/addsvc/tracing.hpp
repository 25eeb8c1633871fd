/*
 * 설명: 엔드포인트 스팬을 만드는 트레이싱 미들웨어와 두 가지 보고 백엔드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/ops/tracing.md
 * 테스트: server/tests/unit/endpoint_middleware_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "addsvc/endpoint.hpp"
#include "addsvc/request_context.hpp"

namespace addsvc {

enum class SpanKind { kServer, kClient };

struct SpanRecord {
  std::string backend;
  std::string service;
  std::string operation;
  SpanKind kind{SpanKind::kServer};
  std::string trace_id;
  std::string span_id;
  std::string parent_span_id;
  std::chrono::microseconds duration{0};
  bool error{false};
  std::string error_message;
};

class Tracer {
 public:
  virtual ~Tracer() = default;
  virtual const std::string& Backend() const = 0;
  virtual const std::string& Service() const = 0;
  virtual void Report(const SpanRecord& span) = 0;
};

// 완료된 스팬을 JSON 한 줄로 stdout에 기록한다.
class LogTracer : public Tracer {
 public:
  LogTracer(std::string backend, std::string service);

  const std::string& Backend() const override { return backend_; }
  const std::string& Service() const override { return service_; }
  void Report(const SpanRecord& span) override;

 private:
  std::string backend_;
  std::string service_;
};

// 최근 스팬을 메모리에 보관한다.
class SpanRecorder : public Tracer {
 public:
  SpanRecorder(std::string backend, std::string service, std::size_t capacity = 256);

  const std::string& Backend() const override { return backend_; }
  const std::string& Service() const override { return service_; }
  void Report(const SpanRecord& span) override;

  std::vector<SpanRecord> Spans() const;
  std::uint64_t ReportedCount() const;

 private:
  std::string backend_;
  std::string service_;
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<SpanRecord> spans_;
  std::uint64_t reported_{0};
};

std::string NewTraceId();
std::string NewSpanId();
std::string DescribeError(const std::exception_ptr& error);
const char* SpanKindName(SpanKind kind);

template <typename Req, typename Res>
Middleware<Req, Res> TraceEndpoint(std::shared_ptr<Tracer> tracer, std::string operation, SpanKind kind) {
  return [tracer, operation, kind](Endpoint<Req, Res> next) -> Endpoint<Req, Res> {
    return [tracer, operation, kind, next](const RequestContext& ctx, const Req& req) -> Outcome<Res> {
      RequestContext child = ctx;
      if (child.trace_id.empty()) {
        child.trace_id = NewTraceId();
      }
      child.parent_span_id = ctx.span_id;
      child.span_id = NewSpanId();

      auto start = std::chrono::steady_clock::now();
      auto outcome = next(child, req);

      SpanRecord span;
      span.backend = tracer->Backend();
      span.service = tracer->Service();
      span.operation = operation;
      span.kind = kind;
      span.trace_id = child.trace_id;
      span.span_id = child.span_id;
      span.parent_span_id = child.parent_span_id;
      span.duration =
          std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
      if (!outcome.ok()) {
        span.error = true;
        span.error_message = DescribeError(outcome.error);
      }
      tracer->Report(span);
      return outcome;
    };
  };
}

}  // namespace addsvc
