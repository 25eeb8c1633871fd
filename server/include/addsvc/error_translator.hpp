/*
 * 설명: 어떤 단계에서 발생한 오류든 HTTP 상태 코드와 ErrorRes 본문으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/error_translator_test.cpp
 */
#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <grpcpp/support/status.h>

#include "addsvc/codec.hpp"
#include "addsvc/errors.hpp"

namespace addsvc {

// 도메인 오류별 상태 코드 재정의 규칙. 먼저 값을 돌려준 규칙이 이긴다.
using StatusOverride = std::function<std::optional<int>(const DomainError&)>;
using StatusOverrides = std::vector<StatusOverride>;

// 정의되지 않은 코드는 500이다.
int HttpStatusFromRpcCode(grpc::StatusCode code);

// 항상 errors가 하나 이상이고 code가 400 이상인 ErrorResItem을 만든다. 예외를 던지지 않는다.
ErrorResItem TranslateError(const std::exception_ptr& error, const StatusOverrides& overrides = {});

// 상태 줄, Content-Type, 본문을 한 번에 채운다. 직렬화에 실패하면 false를 돌려준다.
bool WriteErrorResponse(const ErrorResItem& item, HttpResponse& res);

std::string SerializeErrorRes(const ErrorResItem& item);

}  // namespace addsvc
