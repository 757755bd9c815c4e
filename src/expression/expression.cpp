// ---------------------------------------------------------------------------
// expression.cpp
// ---------------------------------------------------------------------------

#include "expression/expression.hpp"

#include "expression/function_registry.hpp"
#include "policy/evaluation_session.hpp"

#include <optional>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

void emit_operands(YAML::Emitter& out, std::string_view name,
                   const std::vector<ExpressionPtr>& operands) {
    out << YAML::BeginMap << YAML::Key << std::string{name} << YAML::Value << YAML::BeginSeq;
    for (const auto& operand : operands) {
        operand->serialize(out);
    }
    out << YAML::EndSeq << YAML::EndMap;
}

}  // namespace

// ---------------------------------------------------------------------------
// LiteralExpression
// ---------------------------------------------------------------------------
LiteralExpression::LiteralExpression(AttributeValue value)
    : value_{std::move(value)}
{}

EvalResult LiteralExpression::evaluate(EvaluationSession& /*session*/) const {
    return value_;
}

void LiteralExpression::serialize(YAML::Emitter& out) const {
    out << YAML::BeginMap << YAML::Key << "val" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << value_.type().name();
    out << YAML::Key << "content" << YAML::Value;
    if (value_.type().is_collection()) {
        out << YAML::BeginSeq;
        for (const auto& item : value_.items()) {
            out << scalar_to_string(item);
        }
        out << YAML::EndSeq;
    } else {
        out << scalar_to_string(value_.scalar());
    }
    out << YAML::EndMap << YAML::EndMap;
}

// ---------------------------------------------------------------------------
// DesignatorExpression
// ---------------------------------------------------------------------------
DesignatorExpression::DesignatorExpression(std::string id, AttributeType type)
    : id_{std::move(id)}
    , type_{type}
{}

EvalResult DesignatorExpression::evaluate(EvaluationSession& session) const {
    return session.resolve(id_, type_);
}

void DesignatorExpression::serialize(YAML::Emitter& out) const {
    out << YAML::BeginMap << YAML::Key << "attr" << YAML::Value << id_ << YAML::EndMap;
}

// ---------------------------------------------------------------------------
// FunctionCallExpression
// ---------------------------------------------------------------------------
FunctionCallExpression::FunctionCallExpression(const FunctionOverload& overload,
                                               std::vector<ExpressionPtr> args)
    : overload_{&overload}
    , args_{std::move(args)}
{}

AttributeType FunctionCallExpression::type() const noexcept {
    return overload_->result;
}

EvalResult FunctionCallExpression::evaluate(EvaluationSession& session) const {
    std::vector<AttributeValue> values;
    values.reserve(args_.size());
    for (const auto& arg : args_) {
        auto v = arg->evaluate(session);
        if (!v) {
            return std::unexpected(std::move(v.error()));
        }
        values.push_back(std::move(*v));
    }

    auto result = overload_->impl(values);
    if (!result) {
        return std::unexpected(PdpError{
            .kind     = ErrorKind::kFunctionError,
            .message  = std::move(result.error()),
            .function = overload_->name,
        });
    }
    return std::move(*result);
}

void FunctionCallExpression::serialize(YAML::Emitter& out) const {
    emit_operands(out, overload_->name, args_);
}

// ---------------------------------------------------------------------------
// And / Or / Not
// ---------------------------------------------------------------------------
AndExpression::AndExpression(std::vector<ExpressionPtr> operands)
    : operands_{std::move(operands)}
{}

EvalResult AndExpression::evaluate(EvaluationSession& session) const {
    for (const auto& operand : operands_) {
        auto v = evaluate_boolean(*operand, session);
        if (!v) {
            return std::unexpected(std::move(v.error()));
        }
        if (!*v) {
            return AttributeValue::boolean(false);
        }
    }
    return AttributeValue::boolean(true);
}

void AndExpression::serialize(YAML::Emitter& out) const {
    emit_operands(out, "and", operands_);
}

OrExpression::OrExpression(std::vector<ExpressionPtr> operands)
    : operands_{std::move(operands)}
{}

EvalResult OrExpression::evaluate(EvaluationSession& session) const {
    std::optional<PdpError> first_error;
    for (const auto& operand : operands_) {
        auto v = evaluate_boolean(*operand, session);
        if (!v) {
            if (!first_error) {
                first_error = std::move(v.error());
            }
            continue;
        }
        if (*v) {
            return AttributeValue::boolean(true);
        }
    }
    if (first_error) {
        return std::unexpected(std::move(*first_error));
    }
    return AttributeValue::boolean(false);
}

void OrExpression::serialize(YAML::Emitter& out) const {
    emit_operands(out, "or", operands_);
}

NotExpression::NotExpression(ExpressionPtr operand)
    : operand_{std::move(operand)}
{}

EvalResult NotExpression::evaluate(EvaluationSession& session) const {
    auto v = evaluate_boolean(*operand_, session);
    if (!v) {
        return std::unexpected(std::move(v.error()));
    }
    return AttributeValue::boolean(!*v);
}

void NotExpression::serialize(YAML::Emitter& out) const {
    out << YAML::BeginMap << YAML::Key << "not" << YAML::Value << YAML::BeginSeq;
    operand_->serialize(out);
    out << YAML::EndSeq << YAML::EndMap;
}

// ---------------------------------------------------------------------------
// evaluate_boolean
// ---------------------------------------------------------------------------
std::expected<bool, PdpError> evaluate_boolean(const Expression& expr, EvaluationSession& session) {
    auto v = expr.evaluate(session);
    if (!v) {
        return std::unexpected(std::move(v.error()));
    }
    if (v->type() != kBooleanType) {
        return std::unexpected(PdpError{
            .kind    = ErrorKind::kTypeError,
            .message = fmt::format("expected boolean, got {}", v->type().name()),
        });
    }
    return v->as_boolean();
}
