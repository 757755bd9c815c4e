// ---------------------------------------------------------------------------
// policy_tree.cpp
// ---------------------------------------------------------------------------

#include "policy/policy_tree.hpp"

#include "common/text.hpp"

#include <array>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

struct AlgorithmEntry {
    std::string_view name;
    AlgorithmKind    kind;
};

// 첫 항목이 각 kind 의 정규 이름
constexpr std::array<AlgorithmEntry, 6> kAlgorithms{{
    {"FirstApplicableEffect", AlgorithmKind::kFirstApplicable},
    {"DenyOverrides",         AlgorithmKind::kDenyOverrides},
    {"PermitOverrides",       AlgorithmKind::kPermitOverrides},
    {"OnlyOneApplicable",     AlgorithmKind::kOnlyOneApplicable},
    {"Mapper",                AlgorithmKind::kMapper},
    {"FirstApplicable",       AlgorithmKind::kFirstApplicable},
}};

// all 절: 식의 AND (첫 false / 첫 오류에서 중단)
std::expected<bool, PdpError> match_all(const Target::AllClause& clause, EvaluationSession& session) {
    for (const auto& expr : clause) {
        auto v = evaluate_boolean(*expr, session);
        if (!v || !*v) {
            return v;
        }
    }
    return true;
}

// any 절: all 절의 OR (첫 true 에서 중단, 없으면 첫 오류)
std::expected<bool, PdpError> match_any(const Target::AnyClause& clause, EvaluationSession& session) {
    std::optional<PdpError> first_error;
    for (const auto& all : clause) {
        auto v = match_all(all, session);
        if (!v) {
            if (!first_error) {
                first_error = std::move(v.error());
            }
            continue;
        }
        if (*v) {
            return true;
        }
    }
    if (first_error) {
        return std::unexpected(std::move(*first_error));
    }
    return false;
}

}  // namespace

std::expected<bool, PdpError> Target::evaluate(EvaluationSession& session) const {
    for (const auto& any : clauses) {
        auto v = match_any(any, session);
        if (!v || !*v) {
            return v;
        }
    }
    return true;
}

std::optional<AlgorithmKind> find_algorithm(std::string_view name) {
    for (const auto& entry : kAlgorithms) {
        if (iequals(entry.name, name)) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

std::string_view algorithm_name(AlgorithmKind kind) noexcept {
    for (const auto& entry : kAlgorithms) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "FirstApplicableEffect";
}

const std::string& node_id(const PolicyNode& node) noexcept {
    return std::visit([](const auto& n) -> const std::string& { return n.id; }, node.node);
}

std::optional<AttributeType> PolicyTree::attribute_type(std::string_view id) const {
    for (const auto& [name, type] : attributes) {
        if (name == id) {
            return type;
        }
    }
    return std::nullopt;
}

std::string describe(const DecisionReason& reason) {
    std::string out = fmt::format("{}: {}", error_kind_name(reason.kind), reason.message);
    if (!reason.function.empty()) {
        out += fmt::format(" (function '{}')", reason.function);
    }
    if (!reason.path.empty()) {
        out += fmt::format(" at {}", fmt::join(reason.path, "/"));
    }
    return out;
}
