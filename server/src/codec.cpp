/*
 * 설명: 요청/응답 JSON 매핑과 HTTP 본문 디코딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/codec_test.cpp
 */
#include "addsvc/codec.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "addsvc/errors.hpp"

namespace addsvc {

namespace {
std::string TypeName(const nlohmann::json& value) {
  if (value.is_number_float()) {
    return "number";
  }
  return value.type_name();
}

[[noreturn]] void ThrowTypeMismatch(const nlohmann::json& value, const std::string& target) {
  throw TransportError(TransportError::Kind::kJsonType,
                       "json: cannot unmarshal " + TypeName(value) + " into " + target);
}

void ExpectObject(const nlohmann::json& j, const char* record) {
  if (!j.is_object()) {
    ThrowTypeMismatch(j, std::string("value of type ") + record);
  }
}

std::int64_t ReadInt64(const nlohmann::json& j, const char* record, const char* field) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    return 0;
  }
  auto target = std::string("field ") + record + "." + field + " of type int64";
  if (!it->is_number_integer()) {
    ThrowTypeMismatch(*it, target);
  }
  if (it->is_number_unsigned() &&
      it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    ThrowTypeMismatch(*it, target);
  }
  return it->get<std::int64_t>();
}

std::string ReadString(const nlohmann::json& j, const char* record, const char* field) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    ThrowTypeMismatch(*it, std::string("field ") + record + "." + field + " of type string");
  }
  return it->get<std::string>();
}

std::string StripExceptionPrefix(const std::string& what) {
  // "[json.exception.parse_error.101] parse error at ..." 의 접두어를 제거한다.
  auto pos = what.find("] ");
  if (!what.empty() && what.front() == '[' && pos != std::string::npos) {
    return what.substr(pos + 2);
  }
  return what;
}

bool IsBlank(const std::string& body) {
  return body.find_first_not_of(" \t\r\n") == std::string::npos;
}

template <typename Res>
Res DecodeJsonResponse(const HttpResponse& res) {
  auto status = res.result_int();
  if (status < 200 || status >= 300) {
    ThrowJsonErrorResponse(res);
  }
  auto body = ParseJsonBody(res.body());
  if (body.is_null()) {
    return Res{};
  }
  return body.get<Res>();
}
}  // namespace

bool operator==(const SumRequest& lhs, const SumRequest& rhs) { return lhs.a == rhs.a && lhs.b == rhs.b; }

bool operator==(const SumResponse& lhs, const SumResponse& rhs) { return lhs.res == rhs.res; }

bool operator==(const ConcatRequest& lhs, const ConcatRequest& rhs) { return lhs.a == rhs.a && lhs.b == rhs.b; }

bool operator==(const ConcatResponse& lhs, const ConcatResponse& rhs) { return lhs.res == rhs.res; }

void to_json(nlohmann::json& j, const SumRequest& req) { j = nlohmann::json{{"a", req.a}, {"b", req.b}}; }

void from_json(const nlohmann::json& j, SumRequest& req) {
  ExpectObject(j, "SumRequest");
  req.a = ReadInt64(j, "SumRequest", "a");
  req.b = ReadInt64(j, "SumRequest", "b");
}

void to_json(nlohmann::json& j, const SumResponse& res) { j = nlohmann::json{{"res", res.res}}; }

void from_json(const nlohmann::json& j, SumResponse& res) {
  ExpectObject(j, "SumResponse");
  res.res = ReadInt64(j, "SumResponse", "res");
}

void to_json(nlohmann::json& j, const ConcatRequest& req) { j = nlohmann::json{{"a", req.a}, {"b", req.b}}; }

void from_json(const nlohmann::json& j, ConcatRequest& req) {
  ExpectObject(j, "ConcatRequest");
  req.a = ReadString(j, "ConcatRequest", "a");
  req.b = ReadString(j, "ConcatRequest", "b");
}

void to_json(nlohmann::json& j, const ConcatResponse& res) { j = nlohmann::json{{"res", res.res}}; }

void from_json(const nlohmann::json& j, ConcatResponse& res) {
  ExpectObject(j, "ConcatResponse");
  res.res = ReadString(j, "ConcatResponse", "res");
}

nlohmann::json ParseJsonBody(const std::string& body) {
  if (IsBlank(body)) {
    throw TransportError(TransportError::Kind::kUnexpectedEof, "EOF");
  }
  // 첫 번째 JSON 값만 읽고 뒤따르는 데이터는 무시한다.
  std::istringstream stream(body);
  nlohmann::json value;
  try {
    stream >> value;
    return value;
  } catch (const nlohmann::json::parse_error& ex) {
    if (ex.byte > body.size()) {
      throw TransportError(TransportError::Kind::kUnexpectedEof, "unexpected EOF");
    }
    throw TransportError(TransportError::Kind::kJsonSyntax, StripExceptionPrefix(ex.what()));
  }
}

SumRequest DecodeHttpSumRequest(const RequestContext& /*ctx*/, const HttpRequest& req) {
  auto body = ParseJsonBody(req.body());
  if (body.is_null()) {
    return SumRequest{};
  }
  return body.get<SumRequest>();
}

ConcatRequest DecodeHttpConcatRequest(const RequestContext& /*ctx*/, const HttpRequest& req) {
  auto body = ParseJsonBody(req.body());
  if (body.is_null()) {
    return ConcatRequest{};
  }
  return body.get<ConcatRequest>();
}

void ThrowJsonErrorResponse(const HttpResponse& res) {
  auto content_type = std::string(res[boost::beast::http::field::content_type]);
  if (content_type.find("application/json") == std::string::npos) {
    throw std::runtime_error("expected JSON formatted error, got Content-Type " + content_type);
  }
  auto body = ParseJsonBody(res.body());
  ErrorRes envelope;
  try {
    envelope = body.get<ErrorRes>();
  } catch (const nlohmann::json::exception& ex) {
    throw TransportError(TransportError::Kind::kJsonType, StripExceptionPrefix(ex.what()));
  }
  throw RemoteError(envelope.error.code, envelope.error.message, std::move(envelope.error.errors));
}

SumResponse DecodeHttpSumResponse(const RequestContext& /*ctx*/, const HttpResponse& res) {
  return DecodeJsonResponse<SumResponse>(res);
}

ConcatResponse DecodeHttpConcatResponse(const RequestContext& /*ctx*/, const HttpResponse& res) {
  return DecodeJsonResponse<ConcatResponse>(res);
}

}  // namespace addsvc
