#pragma once

// ---------------------------------------------------------------------------
// evaluator.hpp
//
// 정책 트리 순회와 최종 Decision 생성.
//
// [노드 평가 순서]
//   1. target 평가: 오류 → Indeterminate, 불일치 → NotApplicable
//      (불일치면 자식/조건을 절대 평가하지 않는다)
//   2. Rule     : condition (없으면 참). false → NotApplicable, 오류 → Indeterminate
//      컨테이너 : combine() 으로 자식 조합
//   3. Permit/Deny 이면 자기 의무 목록을 Outcome 뒤에 붙인다
//   4. Indeterminate 이면 자기 id 를 reason.path 에 붙인다
//
// [의무 평가]
// evaluate_tree() 는 루트 Outcome 확정 후 의무 식을 같은 세션으로 평가한다.
// 의무 평가 오류는 판정 전체를 Indeterminate 로 만든다 (fail-close).
// ---------------------------------------------------------------------------

#include "policy/combining.hpp"
#include "policy/policy_tree.hpp"

class EvaluationSession;

[[nodiscard]] Outcome evaluate_rule(const Rule& rule, EvaluationSession& session);

[[nodiscard]] Outcome evaluate_node(const PolicyNode& node, EvaluationSession& session);

// evaluate_tree
//   tree.generation 이 찍힌 Decision 을 반환한다. 예외를 던지지 않는다.
[[nodiscard]] Decision evaluate_tree(const PolicyTree& tree, EvaluationSession& session);
