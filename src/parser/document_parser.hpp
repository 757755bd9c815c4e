#pragma once

// ---------------------------------------------------------------------------
// document_parser.hpp
//
// 정책 문서 (YAML / JSON) 를 검증된 PolicyTree 로 변환한다.
//
// [설계 원칙]
// - All-or-nothing: 첫 오류에서 중단하고 부분 트리를 절대 반환하지 않는다.
// - 이벤트 열을 한 번만 읽는다. 객체마다 (태그, 디코더) 디스패치 테이블로
//   키를 처리하며 키 비교는 대소문자를 구분하지 않는다.
// - 알 수 없는 키는 kSchemaError (키 이름과 경로 포함).
// - 정책 문서 전체를 로그에 출력하지 않는다.
//
// [문서 구조]
//   { "attributes": { <id>: <type>, ... },      // 사용 전에 선언
//     "policies":   <policy | policyset> }
//
//   policy    : { id, alg, target?, rules: [...],    obligations? }
//   policyset : { id, alg, target?, policies: [...], obligations? }
//   rule      : { id, effect, target?, condition?, obligations? }
//
// [오류 위치]
// PdpError.path 는 "policies.policies[1].rules[0].condition" 형태,
// line / column 은 1-based 문서 위치이다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "policy/policy_tree.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <string_view>

class DocumentParser {
public:
    // parse
    //   성공: 게시 전 트리 (generation 0)
    //   실패: std::unexpected(PdpError): kSchemaError 또는 kTypeError
    [[nodiscard]] static std::expected<std::shared_ptr<PolicyTree>, PdpError>
    parse(std::string_view document);

    // parse_file
    //   경로를 정규화한 뒤 파일 내용을 parse() 한다.
    //   파일을 열 수 없으면 kSchemaError.
    [[nodiscard]] static std::expected<std::shared_ptr<PolicyTree>, PdpError>
    parse_file(const std::filesystem::path& path);
};
