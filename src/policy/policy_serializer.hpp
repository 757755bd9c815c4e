#pragma once

// ---------------------------------------------------------------------------
// policy_serializer.hpp
//
// PolicyTree 를 DocumentParser 가 읽는 문서 형식으로 되돌린다.
//
// - 출력은 JSON (YAML flow + 큰따옴표 문자열) 이다.
// - 키는 정규 소문자, 알고리즘은 정규 이름으로 쓴다.
// - target 은 항상 완전한 any / all 구조로 쓴다.
// 한 번 파싱한 트리를 직렬화하고 다시 파싱 / 직렬화하면 같은 문서가 나온다.
// ---------------------------------------------------------------------------

#include "policy/policy_tree.hpp"

#include <string>

[[nodiscard]] std::string serialize_policy_tree(const PolicyTree& tree);
