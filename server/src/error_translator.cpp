/*
 * 설명: 오류 분류 순서(RPC 상태 → 도메인 → 전송 → 기타)에 따라 HTTP 응답을 결정한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/error_translator_test.cpp
 */
#include "addsvc/error_translator.hpp"

#include <utility>

#include <nlohmann/json.hpp>

namespace addsvc {

namespace {
constexpr int kInternalServerError = 500;

int TransportStatus(TransportError::Kind kind) {
  switch (kind) {
    case TransportError::Kind::kTokenContextMissing:
      return 401;
    case TransportError::Kind::kUnexpectedEof:
    case TransportError::Kind::kJsonSyntax:
    case TransportError::Kind::kJsonType:
      return 400;
  }
  return kInternalServerError;
}

std::optional<int> ApplyOverrides(const DomainError& error, const StatusOverrides& overrides) {
  for (const auto& rule : overrides) {
    if (!rule) {
      continue;
    }
    auto code = rule(error);
    if (code) {
      return code;
    }
  }
  return std::nullopt;
}

void FromErrorString(ErrorResItem& item, const std::string& text) {
  item.errors = ParseErrorString(text);
  item.message = item.errors.front().message;
}
}  // namespace

int HttpStatusFromRpcCode(grpc::StatusCode code) {
  switch (code) {
    case grpc::StatusCode::OK:
      return 200;
    case grpc::StatusCode::CANCELLED:
      return 408;
    case grpc::StatusCode::UNKNOWN:
      return 500;
    case grpc::StatusCode::INVALID_ARGUMENT:
      return 400;
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      return 504;
    case grpc::StatusCode::NOT_FOUND:
      return 404;
    case grpc::StatusCode::ALREADY_EXISTS:
      return 409;
    case grpc::StatusCode::PERMISSION_DENIED:
      return 403;
    case grpc::StatusCode::UNAUTHENTICATED:
      return 401;
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
      return 429;
    case grpc::StatusCode::FAILED_PRECONDITION:
      return 400;
    case grpc::StatusCode::ABORTED:
      return 409;
    case grpc::StatusCode::OUT_OF_RANGE:
      return 400;
    case grpc::StatusCode::UNIMPLEMENTED:
      return 501;
    case grpc::StatusCode::INTERNAL:
      return 500;
    case grpc::StatusCode::UNAVAILABLE:
      return 503;
    case grpc::StatusCode::DATA_LOSS:
      return 500;
    default:
      return kInternalServerError;
  }
}

ErrorResItem TranslateError(const std::exception_ptr& error, const StatusOverrides& overrides) {
  ErrorResItem item;
  item.code = kInternalServerError;
  if (!error) {
    FromErrorString(item, "unknown error");
    return item;
  }
  try {
    std::rethrow_exception(error);
  } catch (const RpcStatusError& ex) {
    item.code = HttpStatusFromRpcCode(ex.Code());
    FromErrorString(item, ex.Status().error_message());
  } catch (const DomainError& ex) {
    if (auto code = ApplyOverrides(ex, overrides)) {
      item.code = *code;
    }
    if (!ex.Msg().empty()) {
      item.message = ex.Msg();
      item.errors = ex.Errors();
    }
    if (item.message.empty()) {
      FromErrorString(item, ex.what());
    } else if (item.errors.empty()) {
      item.errors.push_back(ErrorDetail{std::nullopt, item.message});
    }
  } catch (const TransportError& ex) {
    item.code = TransportStatus(ex.GetKind());
    FromErrorString(item, ex.what());
  } catch (const nlohmann::json::parse_error& ex) {
    item.code = 400;
    FromErrorString(item, ex.what());
  } catch (const nlohmann::json::type_error& ex) {
    item.code = 400;
    FromErrorString(item, ex.what());
  } catch (const std::exception& ex) {
    FromErrorString(item, ex.what());
  } catch (...) {
    FromErrorString(item, "unknown error");
  }
  // 오류 봉투는 성공 상태를 가질 수 없다.
  if (item.code < 400) {
    item.code = kInternalServerError;
  }
  return item;
}

std::string SerializeErrorRes(const ErrorResItem& item) {
  nlohmann::json body = ErrorRes{item};
  return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool WriteErrorResponse(const ErrorResItem& item, HttpResponse& res) {
  try {
    auto body = SerializeErrorRes(item);
    res.set(boost::beast::http::field::content_type, "application/json");
    res.result(static_cast<unsigned>(item.code));
    res.body() = std::move(body);
    res.prepare_payload();
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace addsvc
