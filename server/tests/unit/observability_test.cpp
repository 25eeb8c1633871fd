#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "addsvc/errors.hpp"
#include "addsvc/observability.hpp"
#include "addsvc/tracing.hpp"

namespace {

bool Contains(const std::string& text, const std::string& needle) { return text.find(needle) != std::string::npos; }

TEST(ObservabilityTest, CountsRequestsAndErrorsPerRoute) {
  addsvc::Observability obs({"/api/add/sum", "/api/add/concat"}, "error");
  obs.RecordRequest("/api/add/sum", 200, std::chrono::microseconds(250));
  obs.RecordRequest("/api/add/sum", 400, std::chrono::microseconds(250));
  obs.RecordRequest("/nowhere", 404, std::chrono::microseconds(10));

  auto snapshot = obs.Snapshot();
  EXPECT_EQ(snapshot.request_total, 3u);
  EXPECT_EQ(snapshot.request_errors, 2u);
  EXPECT_EQ(snapshot.translated_errors, 0u);

  auto text = obs.RenderPrometheus();
  EXPECT_TRUE(Contains(text, "addsvc_http_requests_total 3\n"));
  EXPECT_TRUE(Contains(text, "addsvc_route_requests_total{route=\"/api/add/sum\"} 2\n"));
  EXPECT_TRUE(Contains(text, "addsvc_route_errors_total{route=\"/api/add/sum\"} 1\n"));
  EXPECT_TRUE(Contains(text, "addsvc_route_requests_total{route=\"/api/add/concat\"} 0\n"));
  EXPECT_TRUE(Contains(text, "addsvc_route_requests_total{route=\"other\"} 1\n"));
  EXPECT_TRUE(Contains(text, "addsvc_route_latency_seconds_sum{route=\"/api/add/sum\"} 0.000500\n"));
  EXPECT_TRUE(Contains(text, "# TYPE addsvc_http_requests_total counter\n"));
  EXPECT_FALSE(Contains(text, "addsvc_spans_reported_total"));
}

TEST(ObservabilityTest, LogErrorCountsTranslatedErrors) {
  addsvc::Observability obs({"/api/add/sum"}, "info");
  addsvc::ErrorResItem item{400, "EOF", {addsvc::ErrorDetail{std::nullopt, "EOF"}}};
  obs.LogError("trace-1", "/api/add/sum", item);
  obs.LogError("trace-2", "/api/add/sum", item);
  EXPECT_EQ(obs.Snapshot().translated_errors, 2u);
  EXPECT_TRUE(Contains(obs.RenderPrometheus(), "addsvc_translated_errors_total 2\n"));
}

TEST(ObservabilityTest, ExposesSpanRecorderCount) {
  addsvc::Observability obs({}, "error");
  auto recorder = std::make_shared<addsvc::SpanRecorder>("memory", "addsvc");
  obs.AttachSpanRecorder(recorder);
  addsvc::SpanRecord span;
  span.operation = "Sum";
  recorder->Report(span);
  EXPECT_TRUE(Contains(obs.RenderPrometheus(), "addsvc_spans_reported_total{backend=\"memory\"} 1\n"));
}

TEST(ObservabilityTest, TraceIdsAreDistinctHex) {
  addsvc::Observability obs({}, "error");
  auto first = obs.NextTraceId();
  auto second = obs.NextTraceId();
  EXPECT_FALSE(first.empty());
  EXPECT_NE(first, second);
  EXPECT_EQ(first.find_first_not_of("0123456789abcdef"), std::string::npos);
}

}  // namespace
