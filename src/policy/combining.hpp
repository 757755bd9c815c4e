#pragma once

// ---------------------------------------------------------------------------
// combining.hpp
//
// 조합 알고리즘 엔진.
//   자식 결과 (Outcome) 들을 알고리즘에 따라 하나의 Outcome 으로 합친다.
//
// [알고리즘]
//   FirstApplicable   : 선언 순서로 평가, 첫 non-NotApplicable 이 승리.
//                       Indeterminate 도 그대로 반환.
//   DenyOverrides     : 첫 Deny 에서 중단. 없으면 Indeterminate (첫 원인),
//                       없으면 Permit (모든 Permit 자식의 의무), 없으면 NA.
//   PermitOverrides   : DenyOverrides 의 대칭.
//   OnlyOneApplicable : Indeterminate 전파. 적용 자식 0개 → NA,
//                       2개 이상 → kAmbiguityError (두 자식 id 포함).
//   Mapper            : selector 값으로 자식 부분집합을 골라 sub_algorithm 으로 조합.
//
// [의무 (obligation) 지연 평가]
// Outcome 은 의무 식을 평가하지 않고 의무 목록 포인터만 나른다.
// 순서는 가장 안쪽 노드부터, 바깥 컨테이너 순이다.
// 루트 결과가 확정된 뒤에만 evaluator 가 한 번 평가한다.
// 따라서 진 분기의 의무는 절대 평가되지 않는다.
//
// [Indeterminate 경로]
// reason.path 는 실패 노드부터 루트 방향으로 쌓인다 (leaf-first).
// evaluator 가 Decision 을 만들 때 뒤집는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "policy/policy_tree.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class EvaluationSession;

// ---------------------------------------------------------------------------
// Outcome
// ---------------------------------------------------------------------------
struct Outcome {
    Effect                                       effect{Effect::kNotApplicable};
    std::vector<const std::vector<Obligation>*>  obligations{};
    std::optional<DecisionReason>                reason{};

    [[nodiscard]] static Outcome not_applicable() { return Outcome{}; }

    [[nodiscard]] static Outcome of(Effect effect) {
        return Outcome{effect, {}, std::nullopt};
    }

    // 오류로부터 Indeterminate (경로는 비어 있음)
    [[nodiscard]] static Outcome indeterminate(const PdpError& error);

    [[nodiscard]] bool applicable() const noexcept {
        return effect != Effect::kNotApplicable;
    }
};

// ---------------------------------------------------------------------------
// ChildSet
//   조합 대상 자식 목록 추상화.
//   evaluator 는 Rule 목록 / PolicyNode 목록에 대해 구현한다.
// ---------------------------------------------------------------------------
class ChildSet {
public:
    virtual ~ChildSet() = default;

    [[nodiscard]] virtual std::size_t size() const noexcept = 0;
    [[nodiscard]] virtual const std::string& id(std::size_t index) const = 0;
    [[nodiscard]] virtual Outcome evaluate(std::size_t index, EvaluationSession& session) const = 0;
};

// combine
//   algorithm 에 따라 children 을 조합한다.
//   자식은 필요한 만큼만, 선언 순서대로 평가된다 (매퍼는 선택된 자식만).
[[nodiscard]] Outcome combine(const CombiningAlgorithm& algorithm,
                              const ChildSet&           children,
                              EvaluationSession&        session);
