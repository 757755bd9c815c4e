// ---------------------------------------------------------------------------
// combining.cpp
// ---------------------------------------------------------------------------

#include "policy/combining.hpp"

#include "policy/evaluation_session.hpp"

#include <algorithm>
#include <numeric>
#include <span>

#include <spdlog/spdlog.h>

Outcome Outcome::indeterminate(const PdpError& error) {
    return Outcome{
        Effect::kIndeterminate,
        {},
        DecisionReason{error.kind, error.message, error.function, {}},
    };
}

namespace {

using Order = std::span<const std::size_t>;

Outcome first_applicable(const ChildSet& children, Order order, EvaluationSession& session) {
    for (const std::size_t i : order) {
        Outcome o = children.evaluate(i, session);
        if (o.applicable()) {
            return o;
        }
    }
    return Outcome::not_applicable();
}

// DenyOverrides / PermitOverrides 공통 구현
//   winner: 즉시 승리하는 effect, other: 모아 두는 effect
Outcome overrides(const ChildSet& children, Order order, EvaluationSession& session,
                  Effect winner, Effect other) {
    std::optional<Outcome> first_indeterminate;
    Outcome collected = Outcome::not_applicable();

    for (const std::size_t i : order) {
        Outcome o = children.evaluate(i, session);
        if (o.effect == winner) {
            return o;
        }
        if (o.effect == Effect::kIndeterminate) {
            if (!first_indeterminate) {
                first_indeterminate = std::move(o);
            }
            continue;
        }
        if (o.effect == other) {
            collected.effect = other;
            collected.obligations.insert(collected.obligations.end(),
                                         o.obligations.begin(), o.obligations.end());
        }
    }

    if (first_indeterminate) {
        return std::move(*first_indeterminate);
    }
    return collected;
}

Outcome only_one_applicable(const ChildSet& children, Order order, EvaluationSession& session) {
    std::optional<std::size_t> chosen_index;
    Outcome chosen = Outcome::not_applicable();

    for (const std::size_t i : order) {
        Outcome o = children.evaluate(i, session);
        if (o.effect == Effect::kIndeterminate) {
            return o;
        }
        if (!o.applicable()) {
            continue;
        }
        if (chosen_index) {
            return Outcome::indeterminate(PdpError{
                .kind    = ErrorKind::kAmbiguityError,
                .message = fmt::format("both '{}' and '{}' are applicable",
                                       children.id(*chosen_index), children.id(i)),
            });
        }
        chosen_index = i;
        chosen       = std::move(o);
    }
    return chosen;
}

Outcome combine_subset(AlgorithmKind kind, const ChildSet& children, Order order,
                       EvaluationSession& session) {
    switch (kind) {
        case AlgorithmKind::kDenyOverrides:
            return overrides(children, order, session, Effect::kDeny, Effect::kPermit);
        case AlgorithmKind::kPermitOverrides:
            return overrides(children, order, session, Effect::kPermit, Effect::kDeny);
        case AlgorithmKind::kOnlyOneApplicable:
            return only_one_applicable(children, order, session);
        case AlgorithmKind::kFirstApplicable:
        case AlgorithmKind::kMapper:  // 파서가 중첩 매퍼를 거부한다
            break;
    }
    return first_applicable(children, order, session);
}

// ---------------------------------------------------------------------------
// Mapper
// ---------------------------------------------------------------------------
std::vector<std::string> selector_keys(const AttributeValue& value) {
    std::vector<std::string> keys;
    if (!value.type().is_collection()) {
        keys.push_back(value.as_string());
        return keys;
    }
    for (const auto& item : value.items()) {
        const auto& key = std::get<std::string>(item);
        if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
            keys.push_back(key);
        }
    }
    return keys;
}

Outcome mapper(const MapperSpec& spec, const ChildSet& children, EvaluationSession& session) {
    auto selected = spec.selector->evaluate(session);
    if (!selected) {
        const PdpError& error = selected.error();
        if (error.kind == ErrorKind::kCancelled) {
            return Outcome::indeterminate(error);
        }
        if (spec.error_index) {
            return children.evaluate(*spec.error_index, session);
        }
        if (error.kind == ErrorKind::kResolutionError) {
            return Outcome::not_applicable();
        }
        return Outcome::indeterminate(error);
    }

    const auto keys = selector_keys(*selected);
    if (keys.empty()) {
        return Outcome::not_applicable();
    }

    std::vector<std::size_t> order;
    for (const auto& key : keys) {
        const auto it = spec.child_index.find(key);
        if (it != spec.child_index.end() &&
            std::find(order.begin(), order.end(), it->second) == order.end()) {
            order.push_back(it->second);
        }
    }

    if (order.empty()) {
        if (spec.default_index) {
            return children.evaluate(*spec.default_index, session);
        }
        if (spec.nomatch == NoMatchEffect::kIndeterminate) {
            return Outcome::indeterminate(PdpError{
                .kind    = ErrorKind::kResolutionError,
                .message = fmt::format("selector '{}' matched no child", selected->to_string()),
            });
        }
        return Outcome::not_applicable();
    }

    return combine_subset(spec.sub_algorithm, children, order, session);
}

}  // namespace

Outcome combine(const CombiningAlgorithm& algorithm, const ChildSet& children,
                EvaluationSession& session) {
    if (algorithm.kind == AlgorithmKind::kMapper && algorithm.mapper != nullptr) {
        return mapper(*algorithm.mapper, children, session);
    }

    std::vector<std::size_t> order(children.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    return combine_subset(algorithm.kind, children, order, session);
}
