#pragma once

// ---------------------------------------------------------------------------
// expression.hpp
//
// 타입이 정해진 조합 가능한 식 트리.
//   LiteralExpression      : 상수 값
//   DesignatorExpression   : 요청 속성 참조 (id, 기대 타입)
//   FunctionCallExpression : 순수 함수 호출 (function_registry 오버로드)
//   And/Or/NotExpression   : 단락 평가 불리언 조합자
//
// [설계 원칙]
// - 모든 식의 정적 타입은 파싱 시점에 결정된다 (type()).
//   사용 위치와 타입이 맞지 않으면 파서가 kTypeError 로 로드를 실패시킨다.
// - evaluate() 는 예외를 던지지 않고 std::expected 로 오류를 전파한다.
//   인자 평가 오류는 삼키지 않고 그대로 호출 결과가 된다.
// - 식 트리는 생성 후 불변이며 여러 스레드에서 동시에 평가할 수 있다.
//   요청별 상태는 모두 EvaluationSession 에 있다.
//
// [단락 평가 규칙]
// - and: 첫 false 또는 첫 오류에서 멈춘다.
// - or : 첫 true 에서 멈춘다. true 가 없고 오류가 있었다면 첫 오류를 반환한다.
// ---------------------------------------------------------------------------

#include "attribute/attribute_value.hpp"
#include "common/types.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace YAML {
class Emitter;
}

class EvaluationSession;
struct FunctionOverload;

using EvalResult = std::expected<AttributeValue, PdpError>;

// ---------------------------------------------------------------------------
// Expression
// ---------------------------------------------------------------------------
class Expression {
public:
    virtual ~Expression() = default;

    Expression(const Expression&)            = delete;
    Expression& operator=(const Expression&) = delete;

    [[nodiscard]] virtual AttributeType type() const noexcept = 0;

    [[nodiscard]] virtual EvalResult evaluate(EvaluationSession& session) const = 0;

    // 문서 형식 ({"attr": ...}, {"val": ...}, {"<fn>": [...]}) 으로 직렬화
    virtual void serialize(YAML::Emitter& out) const = 0;

protected:
    Expression() = default;
};

using ExpressionPtr = std::unique_ptr<const Expression>;

class LiteralExpression final : public Expression {
public:
    explicit LiteralExpression(AttributeValue value);

    [[nodiscard]] AttributeType type() const noexcept override { return value_.type(); }
    [[nodiscard]] EvalResult evaluate(EvaluationSession& session) const override;
    void serialize(YAML::Emitter& out) const override;

    [[nodiscard]] const AttributeValue& value() const noexcept { return value_; }

private:
    AttributeValue value_;
};

class DesignatorExpression final : public Expression {
public:
    DesignatorExpression(std::string id, AttributeType type);

    [[nodiscard]] AttributeType type() const noexcept override { return type_; }
    [[nodiscard]] EvalResult evaluate(EvaluationSession& session) const override;
    void serialize(YAML::Emitter& out) const override;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

private:
    std::string   id_;
    AttributeType type_;
};

class FunctionCallExpression final : public Expression {
public:
    // overload 는 정적 함수 테이블의 항목을 가리킨다 (프로세스 수명).
    FunctionCallExpression(const FunctionOverload& overload, std::vector<ExpressionPtr> args);

    [[nodiscard]] AttributeType type() const noexcept override;
    [[nodiscard]] EvalResult evaluate(EvaluationSession& session) const override;
    void serialize(YAML::Emitter& out) const override;

private:
    const FunctionOverload*    overload_;
    std::vector<ExpressionPtr> args_;
};

class AndExpression final : public Expression {
public:
    explicit AndExpression(std::vector<ExpressionPtr> operands);

    [[nodiscard]] AttributeType type() const noexcept override { return kBooleanType; }
    [[nodiscard]] EvalResult evaluate(EvaluationSession& session) const override;
    void serialize(YAML::Emitter& out) const override;

private:
    std::vector<ExpressionPtr> operands_;
};

class OrExpression final : public Expression {
public:
    explicit OrExpression(std::vector<ExpressionPtr> operands);

    [[nodiscard]] AttributeType type() const noexcept override { return kBooleanType; }
    [[nodiscard]] EvalResult evaluate(EvaluationSession& session) const override;
    void serialize(YAML::Emitter& out) const override;

private:
    std::vector<ExpressionPtr> operands_;
};

class NotExpression final : public Expression {
public:
    explicit NotExpression(ExpressionPtr operand);

    [[nodiscard]] AttributeType type() const noexcept override { return kBooleanType; }
    [[nodiscard]] EvalResult evaluate(EvaluationSession& session) const override;
    void serialize(YAML::Emitter& out) const override;

private:
    ExpressionPtr operand_;
};

// evaluate_boolean
//   boolean 정적 타입 식을 평가하여 bool 로 반환한다.
[[nodiscard]] std::expected<bool, PdpError>
evaluate_boolean(const Expression& expr, EvaluationSession& session);
