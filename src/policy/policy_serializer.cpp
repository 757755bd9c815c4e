// ---------------------------------------------------------------------------
// policy_serializer.cpp
// ---------------------------------------------------------------------------

#include "policy/policy_serializer.hpp"

#include <yaml-cpp/yaml.h>

namespace {

void emit_target(YAML::Emitter& out, const Target& target) {
    out << YAML::BeginSeq;
    for (const auto& any : target.clauses) {
        out << YAML::BeginMap << YAML::Key << "any" << YAML::Value << YAML::BeginSeq;
        for (const auto& all : any) {
            out << YAML::BeginMap << YAML::Key << "all" << YAML::Value << YAML::BeginSeq;
            for (const auto& match : all) {
                match->serialize(out);
            }
            out << YAML::EndSeq << YAML::EndMap;
        }
        out << YAML::EndSeq << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

void emit_obligations(YAML::Emitter& out, const std::vector<Obligation>& obligations) {
    out << YAML::BeginSeq;
    for (const auto& obligation : obligations) {
        out << YAML::BeginMap << YAML::Key << obligation.attribute_id << YAML::Value;
        obligation.expression->serialize(out);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

void emit_algorithm(YAML::Emitter& out, const CombiningAlgorithm& algorithm) {
    if (algorithm.kind != AlgorithmKind::kMapper || algorithm.mapper == nullptr) {
        out << std::string{algorithm_name(algorithm.kind)};
        return;
    }

    const MapperSpec& spec = *algorithm.mapper;
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << std::string{algorithm_name(AlgorithmKind::kMapper)};
    out << YAML::Key << "map" << YAML::Value;
    spec.selector->serialize(out);
    out << YAML::Key << "alg" << YAML::Value << std::string{algorithm_name(spec.sub_algorithm)};
    if (spec.default_id) {
        out << YAML::Key << "default" << YAML::Value << *spec.default_id;
    }
    if (spec.error_id) {
        out << YAML::Key << "error" << YAML::Value << *spec.error_id;
    }
    if (spec.nomatch == NoMatchEffect::kIndeterminate) {
        out << YAML::Key << "nomatch" << YAML::Value << "Indeterminate";
    }
    out << YAML::EndMap;
}

template <typename Container>
void emit_header(YAML::Emitter& out, const Container& node) {
    out << YAML::Key << "id" << YAML::Value << node.id;
    out << YAML::Key << "alg" << YAML::Value;
    emit_algorithm(out, node.algorithm);
    if (!node.target.empty()) {
        out << YAML::Key << "target" << YAML::Value;
        emit_target(out, node.target);
    }
}

void emit_rule(YAML::Emitter& out, const Rule& rule) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << rule.id;
    out << YAML::Key << "effect" << YAML::Value << std::string{effect_name(rule.effect)};
    if (!rule.target.empty()) {
        out << YAML::Key << "target" << YAML::Value;
        emit_target(out, rule.target);
    }
    if (rule.condition != nullptr) {
        out << YAML::Key << "condition" << YAML::Value;
        rule.condition->serialize(out);
    }
    if (!rule.obligations.empty()) {
        out << YAML::Key << "obligations" << YAML::Value;
        emit_obligations(out, rule.obligations);
    }
    out << YAML::EndMap;
}

void emit_node(YAML::Emitter& out, const PolicyNode& node) {
    out << YAML::BeginMap;
    if (const auto* policy = std::get_if<Policy>(&node.node)) {
        emit_header(out, *policy);
        out << YAML::Key << "rules" << YAML::Value << YAML::BeginSeq;
        for (const auto& rule : policy->rules) {
            emit_rule(out, rule);
        }
        out << YAML::EndSeq;
        if (!policy->obligations.empty()) {
            out << YAML::Key << "obligations" << YAML::Value;
            emit_obligations(out, policy->obligations);
        }
    } else {
        const auto& set = std::get<PolicySet>(node.node);
        emit_header(out, set);
        out << YAML::Key << "policies" << YAML::Value << YAML::BeginSeq;
        for (const auto& child : set.children) {
            emit_node(out, child);
        }
        out << YAML::EndSeq;
        if (!set.obligations.empty()) {
            out << YAML::Key << "obligations" << YAML::Value;
            emit_obligations(out, set.obligations);
        }
    }
    out << YAML::EndMap;
}

}  // namespace

std::string serialize_policy_tree(const PolicyTree& tree) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);

    out << YAML::BeginMap;
    out << YAML::Key << "attributes" << YAML::Value << YAML::BeginMap;
    for (const auto& [id, type] : tree.attributes) {
        out << YAML::Key << id << YAML::Value << type.name();
    }
    out << YAML::EndMap;
    out << YAML::Key << "policies" << YAML::Value;
    emit_node(out, tree.root);
    out << YAML::EndMap;

    return out.c_str();
}
