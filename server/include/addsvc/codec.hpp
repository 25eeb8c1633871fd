/*
 * 설명: 합계/연결 요청·응답 레코드와 HTTP JSON 인코딩/디코딩 함수를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/codec_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "addsvc/request_context.hpp"

namespace addsvc {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

inline constexpr char kJsonContentType[] = "application/json; charset=utf-8";

struct SumRequest {
  std::int64_t a{0};
  std::int64_t b{0};
};

struct SumResponse {
  std::int64_t res{0};
};

struct ConcatRequest {
  std::string a;
  std::string b;
};

struct ConcatResponse {
  std::string res;
};

bool operator==(const SumRequest& lhs, const SumRequest& rhs);
bool operator==(const SumResponse& lhs, const SumResponse& rhs);
bool operator==(const ConcatRequest& lhs, const ConcatRequest& rhs);
bool operator==(const ConcatResponse& lhs, const ConcatResponse& rhs);

// 없는 필드와 null은 0 값으로 남고, 타입이 다르면 TransportError(kJsonType)를 던진다.
void to_json(nlohmann::json& j, const SumRequest& req);
void from_json(const nlohmann::json& j, SumRequest& req);
void to_json(nlohmann::json& j, const SumResponse& res);
void from_json(const nlohmann::json& j, SumResponse& res);
void to_json(nlohmann::json& j, const ConcatRequest& req);
void from_json(const nlohmann::json& j, ConcatRequest& req);
void to_json(nlohmann::json& j, const ConcatResponse& res);
void from_json(const nlohmann::json& j, ConcatResponse& res);

// 빈 본문은 kUnexpectedEof, 문법 오류는 kJsonSyntax TransportError로 바뀐다.
nlohmann::json ParseJsonBody(const std::string& body);

SumRequest DecodeHttpSumRequest(const RequestContext& ctx, const HttpRequest& req);
ConcatRequest DecodeHttpConcatRequest(const RequestContext& ctx, const HttpRequest& req);

// 2xx가 아닌 응답 본문을 ErrorRes로 해석해 RemoteError를 던진다.
[[noreturn]] void ThrowJsonErrorResponse(const HttpResponse& res);

SumResponse DecodeHttpSumResponse(const RequestContext& ctx, const HttpResponse& res);
ConcatResponse DecodeHttpConcatResponse(const RequestContext& ctx, const HttpResponse& res);

template <typename T, typename = void>
struct HasHeaders : std::false_type {};
template <typename T>
struct HasHeaders<T, std::void_t<decltype(std::declval<const T&>().Headers())>> : std::true_type {};

template <typename T, typename = void>
struct HasStatusCode : std::false_type {};
template <typename T>
struct HasStatusCode<T, std::void_t<decltype(std::declval<const T&>().StatusCode())>> : std::true_type {};

template <typename T, typename = void>
struct HasAltResponse : std::false_type {};
template <typename T>
struct HasAltResponse<T, std::void_t<decltype(std::declval<const T&>().Response())>> : std::true_type {};

template <typename Res>
void EncodeJsonResponse(const RequestContext& /*ctx*/, HttpResponse& res, const Res& response) {
  res.set(boost::beast::http::field::content_type, kJsonContentType);
  if constexpr (HasHeaders<Res>::value) {
    for (const auto& header : response.Headers()) {
      res.insert(header.first, header.second);
    }
  }
  unsigned code = 200;
  if constexpr (HasStatusCode<Res>::value) {
    code = static_cast<unsigned>(response.StatusCode());
  }
  res.result(code);
  if (res.result() == boost::beast::http::status::no_content) {
    res.body().clear();
    return;
  }
  nlohmann::json body;
  if constexpr (HasAltResponse<Res>::value) {
    body = response.Response();
  } else {
    body = response;
  }
  res.body() = body.dump();
}

template <typename Req>
void EncodeJsonRequest(const RequestContext& /*ctx*/, HttpRequest& req, const Req& request) {
  req.set(boost::beast::http::field::content_type, kJsonContentType);
  req.body() = nlohmann::json(request).dump();
  req.prepare_payload();
}

}  // namespace addsvc
