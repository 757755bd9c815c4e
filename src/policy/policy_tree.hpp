#pragma once

// ---------------------------------------------------------------------------
// policy_tree.hpp
//
// 파싱이 끝난 불변 정책 트리 모델과 판정 결과 타입.
//
//   PolicyTree
//     attributes : 선언된 속성 (id, 타입), 문서 순서
//     root       : PolicyNode (Policy | PolicySet)
//
//   PolicySet ─ children: PolicyNode...
//   Policy    ─ rules:    Rule...
//   Rule      ─ effect, condition
//
// [설계 원칙]
// - 트리는 DocumentParser 가 한 번에 만들고 이후 절대 수정하지 않는다.
//   PolicyStore 가 shared_ptr<const PolicyTree> 로 게시하며, 평가 중인
//   요청이 참조를 잡고 있는 동안 이전 트리도 유효하다.
// - 형제 노드 id 는 파싱 시점에 유일성이 검증된다.
// - Target 은 any/all 구조를 그대로 보관한다 (직렬화 왕복 보존).
//
// [fail-close 원칙]
// Decision 의 기본 effect 는 kIndeterminate 이다.
// 호출자는 kIndeterminate 를 절대 kPermit 으로 취급하지 않는다.
// ---------------------------------------------------------------------------

#include "attribute/attribute_value.hpp"
#include "common/types.hpp"
#include "expression/expression.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// Obligation
//   판정에 붙어 나가는 (선언된 속성 id, 식) 쌍.
//   식의 정적 타입은 선언 타입과 같다 (파싱 시점 검증).
//   승리한 분기의 의무만 최종 판정 뒤에 평가된다.
// ---------------------------------------------------------------------------
struct Obligation {
    std::string   attribute_id{};
    ExpressionPtr expression{};
};

// ---------------------------------------------------------------------------
// Target
//   clauses 는 any 절의 AND.
//   각 any 절은 all 절의 OR, 각 all 절은 불리언 식의 AND.
//   비어 있으면 모든 요청에 적용된다.
// ---------------------------------------------------------------------------
struct Target {
    using AllClause = std::vector<ExpressionPtr>;
    using AnyClause = std::vector<AllClause>;

    std::vector<AnyClause> clauses{};

    [[nodiscard]] bool empty() const noexcept { return clauses.empty(); }

    // 일치 여부. 식 평가 오류는 그대로 전파한다.
    [[nodiscard]] std::expected<bool, PdpError> evaluate(EvaluationSession& session) const;
};

// ---------------------------------------------------------------------------
// 조합 알고리즘
// ---------------------------------------------------------------------------
enum class AlgorithmKind : std::uint8_t {
    kFirstApplicable   = 0,
    kDenyOverrides     = 1,
    kPermitOverrides   = 2,
    kOnlyOneApplicable = 3,
    kMapper            = 4,
};

// 매퍼가 어떤 자식과도 일치하지 않을 때의 결과 (default 자식이 없을 때)
enum class NoMatchEffect : std::uint8_t {
    kNotApplicable = 0,
    kIndeterminate = 1,
};

// ---------------------------------------------------------------------------
// MapperSpec
//   selector 값 (string / set of strings / list of strings) 으로 자식을 id 로
//   골라 sub_algorithm 으로 조합한다.
//   default_index / error_index / child_index 는 파싱 시점에 자식 목록에서
//   계산된 인덱스이다.
// ---------------------------------------------------------------------------
struct MapperSpec {
    ExpressionPtr                                    selector{};
    AlgorithmKind                                    sub_algorithm{AlgorithmKind::kFirstApplicable};
    std::optional<std::string>                       default_id{};
    std::optional<std::string>                       error_id{};
    NoMatchEffect                                    nomatch{NoMatchEffect::kNotApplicable};
    std::optional<std::size_t>                       default_index{};
    std::optional<std::size_t>                       error_index{};
    std::map<std::string, std::size_t, std::less<>>  child_index{};
};

struct CombiningAlgorithm {
    AlgorithmKind                     kind{AlgorithmKind::kFirstApplicable};
    std::unique_ptr<const MapperSpec> mapper{};  // kind == kMapper 일 때만
};

// 알고리즘 이름 조회 (대소문자 무관, "FirstApplicable" 별칭 포함)
[[nodiscard]] std::optional<AlgorithmKind> find_algorithm(std::string_view name);

// 정규 이름 ("FirstApplicableEffect", "DenyOverrides", ...)
[[nodiscard]] std::string_view algorithm_name(AlgorithmKind kind) noexcept;

// ---------------------------------------------------------------------------
// 노드
// ---------------------------------------------------------------------------
struct Rule {
    std::string             id{};
    Effect                  effect{Effect::kDeny};
    Target                  target{};
    ExpressionPtr           condition{};    // nullptr 이면 항상 참
    std::vector<Obligation> obligations{};
};

struct Policy {
    std::string             id{};
    Target                  target{};
    CombiningAlgorithm      algorithm{};
    std::vector<Rule>       rules{};
    std::vector<Obligation> obligations{};
};

struct PolicyNode;

struct PolicySet {
    std::string             id{};
    Target                  target{};
    CombiningAlgorithm      algorithm{};
    std::vector<PolicyNode> children{};
    std::vector<Obligation> obligations{};
};

struct PolicyNode {
    std::variant<Policy, PolicySet> node{};
};

[[nodiscard]] const std::string& node_id(const PolicyNode& node) noexcept;

// ---------------------------------------------------------------------------
// PolicyTree
//   generation 은 PolicyStore 가 게시 직전에 부여한다 (0 = 미게시).
// ---------------------------------------------------------------------------
struct PolicyTree {
    std::vector<std::pair<std::string, AttributeType>> attributes{};
    PolicyNode                                          root{};
    std::uint64_t                                       generation{0};

    // 선언된 속성 타입 조회
    [[nodiscard]] std::optional<AttributeType> attribute_type(std::string_view id) const;
};

// ---------------------------------------------------------------------------
// Decision
// ---------------------------------------------------------------------------
struct ResolvedObligation {
    std::string    attribute_id{};
    AttributeValue value;
};

// kIndeterminate 일 때의 원인.
//   path: 루트부터 실패한 노드까지의 노드 id
struct DecisionReason {
    ErrorKind                kind{ErrorKind::kSchemaError};
    std::string              message{};
    std::string              function{};
    std::vector<std::string> path{};
};

struct Decision {
    Effect                          effect{Effect::kIndeterminate};  // fail-close 기본값
    std::vector<ResolvedObligation> obligations{};
    std::optional<DecisionReason>   reason{};
    std::uint64_t                   generation{0};
};

// 로그/응답용 한 줄 요약 ("FunctionError: division by zero (function 'divide') at root/p1/r2")
[[nodiscard]] std::string describe(const DecisionReason& reason);
