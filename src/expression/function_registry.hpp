#pragma once

// ---------------------------------------------------------------------------
// function_registry.hpp
//
// 식에서 호출 가능한 순수 함수의 정적 오버로드 테이블.
//
// [설계 원칙]
// - 테이블은 최초 조회 시 한 번 구성되고 이후 불변이다 (스레드 안전).
// - 오버로드 선택은 파싱 시점에만 일어난다. 평가 시점에는 FunctionOverload
//   포인터로 바로 호출한다 (런타임 문자열 비교 없음).
// - 구현 함수는 인자 타입이 시그니처와 일치한다고 가정한다. 런타임 전제조건
//   위반 (0 나누기, 정수 오버플로) 만 std::unexpected 로 보고한다.
// - and / or / not 은 단락 평가가 필요하므로 이 테이블이 아니라 전용 식
//   노드 (AndExpression 등) 로 처리된다.
//
// [함수 목록]
//   equal(T, T)                    T: 모든 스칼라
//   greater/less/greater-or-equal/less-or-equal(T, T)
//                                  T: integer, float, string, time
//   contains(string, string)       부분 문자열
//   contains(network, address)
//   contains(set of networks, address)
//   contains(set|list of T, T)
//   subdomain(domain, domain)
//   intersect/union(C, C)          C: set/list of T
//   len(string | set of T | list of T)
//   add/subtract/multiply/divide(integer, integer | float, float)
// ---------------------------------------------------------------------------

#include "attribute/attribute_value.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

using FunctionResult = std::expected<AttributeValue, std::string>;
using FunctionImpl   = FunctionResult (*)(const std::vector<AttributeValue>& args);

struct FunctionOverload {
    std::string                name{};     // 정규화된 (소문자) 함수 이름
    std::vector<AttributeType> params{};
    AttributeType              result{};
    FunctionImpl               impl{nullptr};
};

// resolve_function
//   이름 (대소문자 무관) 과 인자 정적 타입으로 오버로드를 찾는다.
//   실패: 알 수 없는 함수 / 일치하는 오버로드 없음 메시지.
[[nodiscard]] std::expected<const FunctionOverload*, std::string>
resolve_function(std::string_view name, const std::vector<AttributeType>& arg_types);

[[nodiscard]] bool is_known_function(std::string_view name);
