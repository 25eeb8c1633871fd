/*
 * 설명: 게이트웨이 전반에서 공유하는 오류 타입과 ErrorRes 와이어 형식을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/error_model_test.cpp
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <grpcpp/support/status.h>
#include <nlohmann/json.hpp>

namespace addsvc {

struct ErrorDetail {
  std::optional<std::string> field;
  std::string message;
};

bool operator==(const ErrorDetail& lhs, const ErrorDetail& rhs);

void to_json(nlohmann::json& j, const ErrorDetail& detail);
void from_json(const nlohmann::json& j, ErrorDetail& detail);

// 문자열을 하위 오류 목록으로 변환한다. 결과는 항상 원소가 하나 이상이다.
std::vector<ErrorDetail> ParseErrorString(const std::string& text);

struct ErrorResItem {
  int code{500};
  std::string message;
  std::vector<ErrorDetail> errors;
};

struct ErrorRes {
  ErrorResItem error;
};

void to_json(nlohmann::json& j, const ErrorResItem& item);
void from_json(const nlohmann::json& j, ErrorResItem& item);
void to_json(nlohmann::json& j, const ErrorRes& res);
void from_json(const nlohmann::json& j, ErrorRes& res);

class DomainError : public std::runtime_error {
 public:
  explicit DomainError(const std::string& message, std::vector<ErrorDetail> errors = {});

  const std::string& Msg() const { return message_; }
  const std::vector<ErrorDetail>& Errors() const { return errors_; }

 private:
  std::string message_;
  std::vector<ErrorDetail> errors_;
};

// 원격 게이트웨이가 돌려준 ErrorRes를 복원한 오류.
class RemoteError : public DomainError {
 public:
  RemoteError(int code, const std::string& message, std::vector<ErrorDetail> errors);

  int Code() const { return code_; }

 private:
  int code_;
};

class RpcStatusError : public std::runtime_error {
 public:
  explicit RpcStatusError(grpc::Status status);
  RpcStatusError(grpc::StatusCode code, const std::string& message);

  const grpc::Status& Status() const { return status_; }
  grpc::StatusCode Code() const { return status_.error_code(); }

 private:
  grpc::Status status_;
};

class TransportError : public std::runtime_error {
 public:
  enum class Kind { kUnexpectedEof, kTokenContextMissing, kJsonSyntax, kJsonType };

  TransportError(Kind kind, const std::string& message);

  Kind GetKind() const { return kind_; }

 private:
  Kind kind_;
};

}  // namespace addsvc
