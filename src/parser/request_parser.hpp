#pragma once

// ---------------------------------------------------------------------------
// request_parser.hpp
//
// 요청 문서를 Request 로 변환한다.
//
//   { "<id>": { "type": "<type name>", "value": <scalar | [scalars]> }, ... }
//
// 정책 문서와 같은 타입 이름 / 리터럴 규칙 (AttributeValue::coerce) 을 쓴다.
// 요청은 작고 한 번만 읽으므로 YAML::Node API 로 읽는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "policy/evaluation_session.hpp"

#include <expected>
#include <string_view>

#include <yaml-cpp/yaml.h>

class RequestParser {
public:
    // 실패: std::unexpected(PdpError{kSchemaError | kTypeError, ..., path = 속성 id})
    [[nodiscard]] static std::expected<Request, PdpError> parse(std::string_view document);

    // 이미 읽은 노드 (예: 서버 명령의 "attributes" 필드) 로부터
    [[nodiscard]] static std::expected<Request, PdpError> from_node(const YAML::Node& attributes);
};
