/*
 * 설명: Bearer 토큰 추출과 전달을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/endpoint_middleware_test.cpp
 */
#include "addsvc/auth_context.hpp"

#include <cstddef>

#include <boost/beast/core/string.hpp>

namespace addsvc {

std::string ParseBearer(const std::string& header_value) {
  constexpr std::size_t kSchemeLength = 6;
  if (header_value.size() <= kSchemeLength + 1 || header_value[kSchemeLength] != ' ') {
    return "";
  }
  // 스킴 이름은 대소문자를 가리지 않는다.
  if (!boost::beast::iequals(boost::beast::string_view(header_value.data(), kSchemeLength), "Bearer")) {
    return "";
  }
  return header_value.substr(kSchemeLength + 1);
}

void HttpToContext(const boost::beast::http::request<boost::beast::http::string_body>& req, RequestContext& ctx) {
  auto auth_it = req.find(boost::beast::http::field::authorization);
  if (auth_it == req.end()) {
    return;
  }
  auto token = ParseBearer(std::string(auth_it->value()));
  if (token.empty()) {
    return;
  }
  ctx.token = token;
}

void ContextToHttp(const RequestContext& ctx, boost::beast::http::request<boost::beast::http::string_body>& req) {
  if (!ctx.token || ctx.token->empty()) {
    return;
  }
  req.set(boost::beast::http::field::authorization, "Bearer " + *ctx.token);
}

}  // namespace addsvc
