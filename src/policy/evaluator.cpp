// ---------------------------------------------------------------------------
// evaluator.cpp
// ---------------------------------------------------------------------------

#include "policy/evaluator.hpp"

#include "policy/evaluation_session.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

class RuleChildren final : public ChildSet {
public:
    explicit RuleChildren(const std::vector<Rule>& rules) : rules_{rules} {}

    std::size_t size() const noexcept override { return rules_.size(); }
    const std::string& id(std::size_t index) const override { return rules_[index].id; }

    Outcome evaluate(std::size_t index, EvaluationSession& session) const override {
        return evaluate_rule(rules_[index], session);
    }

private:
    const std::vector<Rule>& rules_;
};

class NodeChildren final : public ChildSet {
public:
    explicit NodeChildren(const std::vector<PolicyNode>& nodes) : nodes_{nodes} {}

    std::size_t size() const noexcept override { return nodes_.size(); }
    const std::string& id(std::size_t index) const override { return node_id(nodes_[index]); }

    Outcome evaluate(std::size_t index, EvaluationSession& session) const override {
        return evaluate_node(nodes_[index], session);
    }

private:
    const std::vector<PolicyNode>& nodes_;
};

// 결과에 노드 정보를 반영한다 (의무 목록 / 실패 경로)
Outcome finish(Outcome outcome, const std::string& id, const std::vector<Obligation>& obligations) {
    if (outcome.effect == Effect::kIndeterminate) {
        if (outcome.reason) {
            outcome.reason->path.push_back(id);
        }
        return outcome;
    }
    if (outcome.applicable() && !obligations.empty()) {
        outcome.obligations.push_back(&obligations);
    }
    return outcome;
}

template <typename Container, typename Children>
Outcome evaluate_container(const Container& container, const Children& children,
                           EvaluationSession& session) {
    auto matched = container.target.evaluate(session);
    if (!matched) {
        return finish(Outcome::indeterminate(matched.error()), container.id, container.obligations);
    }
    if (!*matched) {
        return Outcome::not_applicable();
    }
    return finish(combine(container.algorithm, children, session), container.id,
                  container.obligations);
}

}  // namespace

Outcome evaluate_rule(const Rule& rule, EvaluationSession& session) {
    auto matched = rule.target.evaluate(session);
    if (!matched) {
        return finish(Outcome::indeterminate(matched.error()), rule.id, rule.obligations);
    }
    if (!*matched) {
        return Outcome::not_applicable();
    }

    if (rule.condition != nullptr) {
        auto holds = evaluate_boolean(*rule.condition, session);
        if (!holds) {
            return finish(Outcome::indeterminate(holds.error()), rule.id, rule.obligations);
        }
        if (!*holds) {
            return Outcome::not_applicable();
        }
    }

    return finish(Outcome::of(rule.effect), rule.id, rule.obligations);
}

Outcome evaluate_node(const PolicyNode& node, EvaluationSession& session) {
    if (const auto* policy = std::get_if<Policy>(&node.node)) {
        return evaluate_container(*policy, RuleChildren{policy->rules}, session);
    }
    const auto& set = std::get<PolicySet>(node.node);
    return evaluate_container(set, NodeChildren{set.children}, session);
}

Decision evaluate_tree(const PolicyTree& tree, EvaluationSession& session) {
    Decision decision;
    decision.generation = tree.generation;

    Outcome outcome = evaluate_node(tree.root, session);
    decision.effect = outcome.effect;

    if (outcome.effect == Effect::kIndeterminate) {
        if (outcome.reason) {
            std::reverse(outcome.reason->path.begin(), outcome.reason->path.end());
            decision.reason = std::move(outcome.reason);
        }
        return decision;
    }
    if (!outcome.applicable()) {
        return decision;
    }

    for (const auto* list : outcome.obligations) {
        for (const auto& obligation : *list) {
            auto value = obligation.expression->evaluate(session);
            if (!value) {
                spdlog::debug("[evaluator] obligation '{}' failed: {}",
                              obligation.attribute_id, describe(value.error()));
                decision.effect = Effect::kIndeterminate;
                decision.obligations.clear();
                decision.reason = DecisionReason{
                    value.error().kind,
                    fmt::format("obligation '{}': {}", obligation.attribute_id,
                                value.error().message),
                    value.error().function,
                    {},
                };
                return decision;
            }
            decision.obligations.push_back(
                ResolvedObligation{obligation.attribute_id, std::move(*value)});
        }
    }
    return decision;
}
