/*
 * 설명: 오류 타입 구현과 ErrorRes JSON 직렬화를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/error_model_test.cpp
 */
#include "addsvc/errors.hpp"

#include <utility>

namespace addsvc {

namespace {
bool IsDetailObject(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("message") || !j["message"].is_string()) {
    return false;
  }
  return !j.contains("field") || j["field"].is_string() || j["field"].is_null();
}
}  // namespace

bool operator==(const ErrorDetail& lhs, const ErrorDetail& rhs) {
  return lhs.field == rhs.field && lhs.message == rhs.message;
}

void to_json(nlohmann::json& j, const ErrorDetail& detail) {
  j = nlohmann::json::object();
  if (detail.field) {
    j["field"] = *detail.field;
  }
  j["message"] = detail.message;
}

void from_json(const nlohmann::json& j, ErrorDetail& detail) {
  detail.field.reset();
  if (j.contains("field") && j["field"].is_string()) {
    detail.field = j["field"].get<std::string>();
  }
  detail.message = j.value("message", std::string{});
}

std::vector<ErrorDetail> ParseErrorString(const std::string& text) {
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (!parsed.is_discarded()) {
    if (IsDetailObject(parsed)) {
      return {parsed.get<ErrorDetail>()};
    }
    if (parsed.is_array() && !parsed.empty()) {
      bool all_details = true;
      for (const auto& entry : parsed) {
        all_details = all_details && IsDetailObject(entry);
      }
      if (all_details) {
        return parsed.get<std::vector<ErrorDetail>>();
      }
    }
  }
  return {ErrorDetail{std::nullopt, text}};
}

void to_json(nlohmann::json& j, const ErrorResItem& item) {
  j = nlohmann::json{{"code", item.code}, {"message", item.message}, {"errors", item.errors}};
}

void from_json(const nlohmann::json& j, ErrorResItem& item) {
  item.code = j.at("code").get<int>();
  item.message = j.at("message").get<std::string>();
  item.errors.clear();
  if (j.contains("errors") && j["errors"].is_array()) {
    item.errors = j["errors"].get<std::vector<ErrorDetail>>();
  }
}

void to_json(nlohmann::json& j, const ErrorRes& res) { j = nlohmann::json{{"error", res.error}}; }

void from_json(const nlohmann::json& j, ErrorRes& res) { res.error = j.at("error").get<ErrorResItem>(); }

DomainError::DomainError(const std::string& message, std::vector<ErrorDetail> errors)
    : std::runtime_error(message), message_(message), errors_(std::move(errors)) {}

RemoteError::RemoteError(int code, const std::string& message, std::vector<ErrorDetail> errors)
    : DomainError(message, std::move(errors)), code_(code) {}

RpcStatusError::RpcStatusError(grpc::Status status)
    : std::runtime_error(status.error_message()), status_(std::move(status)) {}

RpcStatusError::RpcStatusError(grpc::StatusCode code, const std::string& message)
    : RpcStatusError(grpc::Status(code, message)) {}

TransportError::TransportError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

}  // namespace addsvc
