/*
 * 설명: 트레이스 식별자 생성과 스팬 보고 백엔드를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/ops/tracing.md
 * 테스트: server/tests/unit/endpoint_middleware_test.cpp
 */
#include "addsvc/tracing.hpp"

#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <openssl/rand.h>

namespace addsvc {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    // 엔트로피 풀을 쓸 수 없으면 식별자 용도로만 의사난수를 쓴다.
    thread_local std::mt19937_64 fallback{std::random_device{}()};
    for (auto& b : buffer) {
      b = static_cast<unsigned char>(fallback() & 0xff);
    }
  }
  return BytesToHex(buffer.data(), buffer.size());
}
}  // namespace

std::string NewTraceId() { return RandomHex(8); }

std::string NewSpanId() { return RandomHex(8); }

std::string DescribeError(const std::exception_ptr& error) {
  if (!error) {
    return {};
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "unknown error";
  }
}

const char* SpanKindName(SpanKind kind) { return kind == SpanKind::kClient ? "client" : "server"; }

LogTracer::LogTracer(std::string backend, std::string service)
    : backend_(std::move(backend)), service_(std::move(service)) {}

void LogTracer::Report(const SpanRecord& span) {
  nlohmann::json log_json;
  log_json["span"] = span.operation;
  log_json["backend"] = span.backend;
  log_json["service"] = span.service;
  log_json["kind"] = SpanKindName(span.kind);
  log_json["traceId"] = span.trace_id;
  log_json["spanId"] = span.span_id;
  if (!span.parent_span_id.empty()) {
    log_json["parentSpanId"] = span.parent_span_id;
  }
  log_json["durationUs"] = span.duration.count();
  log_json["error"] = span.error;
  if (span.error) {
    log_json["errorMessage"] = span.error_message;
  }
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

SpanRecorder::SpanRecorder(std::string backend, std::string service, std::size_t capacity)
    : backend_(std::move(backend)), service_(std::move(service)), capacity_(capacity) {}

void SpanRecorder::Report(const SpanRecord& span) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++reported_;
  if (capacity_ == 0) {
    return;
  }
  if (spans_.size() >= capacity_) {
    spans_.pop_front();
  }
  spans_.push_back(span);
}

std::vector<SpanRecord> SpanRecorder::Spans() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {spans_.begin(), spans_.end()};
}

std::uint64_t SpanRecorder::ReportedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reported_;
}

}  // namespace addsvc
