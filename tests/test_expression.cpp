// ---------------------------------------------------------------------------
// test_expression.cpp
//
// Expression / function_registry 단위 테스트.
//
// [테스트 범위]
// - 오버로드 해석: 알 수 없는 함수 vs 일치하는 오버로드 없음
// - 함수 호출: 비교, contains, subdomain, len, 산술
// - 런타임 오류: 0 나누기, 정수 오버플로 → kFunctionError (function 이름 포함)
// - and / or / not 단락 평가와 오류 전파 규칙
// - 속성 참조: 요청 값 사용, 없는 속성 → kResolutionError
// ---------------------------------------------------------------------------

#include "expression/expression.hpp"
#include "expression/function_registry.hpp"
#include "policy/evaluation_session.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

namespace {

ExpressionPtr lit(AttributeValue v) {
    return std::make_unique<LiteralExpression>(std::move(v));
}

ExpressionPtr lit_bool(bool b) { return lit(AttributeValue::boolean(b)); }

ExpressionPtr attr(std::string id, AttributeType type) {
    return std::make_unique<DesignatorExpression>(std::move(id), type);
}

ExpressionPtr call(std::string_view name, std::vector<ExpressionPtr> args) {
    std::vector<AttributeType> types;
    for (const auto& a : args) {
        types.push_back(a->type());
    }
    auto overload = resolve_function(name, types);
    EXPECT_TRUE(overload.has_value()) << (overload ? "" : overload.error());
    return std::make_unique<FunctionCallExpression>(**overload, std::move(args));
}

std::vector<ExpressionPtr> args_of(ExpressionPtr a, ExpressionPtr b) {
    std::vector<ExpressionPtr> v;
    v.push_back(std::move(a));
    v.push_back(std::move(b));
    return v;
}

// 평가 횟수를 세는 불리언 식 (단락 평가 검증용)
class CountingExpression final : public Expression {
public:
    CountingExpression(bool value, int* counter, bool fail = false)
        : value_{value}, counter_{counter}, fail_{fail} {}

    AttributeType type() const noexcept override { return kBooleanType; }

    EvalResult evaluate(EvaluationSession& /*session*/) const override {
        ++*counter_;
        if (fail_) {
            return std::unexpected(PdpError{
                .kind    = ErrorKind::kResolutionError,
                .message = "counting failure",
            });
        }
        return AttributeValue::boolean(value_);
    }

    void serialize(YAML::Emitter& /*out*/) const override {}

private:
    bool value_;
    int* counter_;
    bool fail_;
};

ExpressionPtr counting(bool value, int* counter, bool fail = false) {
    return std::make_unique<CountingExpression>(value, counter, fail);
}

class ExpressionTest : public ::testing::Test {
protected:
    Request           request_;
    EvaluationSession session_{request_};
};

} // namespace

// ---------------------------------------------------------------------------
// 오버로드 해석
// ---------------------------------------------------------------------------
TEST(FunctionRegistry, UnknownFunctionIsDistinguishedFromBadOverload) {
    auto unknown = resolve_function("frobnicate", {kIntegerType});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_NE(unknown.error().find("unknown function"), std::string::npos);
    EXPECT_FALSE(is_known_function("frobnicate"));

    auto mismatch = resolve_function("greater", {kIntegerType, kFloatType});
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_NE(mismatch.error().find("no overload"), std::string::npos);
    EXPECT_TRUE(is_known_function("GREATER"));
}

TEST(FunctionRegistry, BooleanHasNoOrdering) {
    EXPECT_FALSE(resolve_function("less", {kBooleanType, kBooleanType}).has_value());
    EXPECT_TRUE(resolve_function("equal", {kBooleanType, kBooleanType}).has_value());
}

TEST(FunctionRegistry, ResultTypes) {
    auto len = resolve_function("len", {AttributeType::set_of(TypeKind::kString)});
    ASSERT_TRUE(len.has_value());
    EXPECT_EQ((*len)->result, kIntegerType);

    auto uni = resolve_function("union", {AttributeType::list_of(TypeKind::kDomain),
                                          AttributeType::list_of(TypeKind::kDomain)});
    ASSERT_TRUE(uni.has_value());
    EXPECT_EQ((*uni)->result, AttributeType::list_of(TypeKind::kDomain));
}

// ---------------------------------------------------------------------------
// 함수 호출
// ---------------------------------------------------------------------------
TEST_F(ExpressionTest, ComparisonFunctions) {
    auto gt = call("greater", args_of(lit(AttributeValue::integer(5)), lit(AttributeValue::integer(3))));
    auto r = evaluate_boolean(*gt, session_);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(*r);

    auto le = call("less-or-equal", args_of(lit(AttributeValue::string("b")), lit(AttributeValue::string("a"))));
    r = evaluate_boolean(*le, session_);
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(*r);
}

TEST_F(ExpressionTest, ContainsNetworkAddress) {
    auto net = AttributeValue::coerce(kNetworkType, "10.0.0.0/8");
    auto ip  = AttributeValue::coerce(kAddressType, "10.20.30.40");
    ASSERT_TRUE(net && ip);

    auto expr = call("contains", args_of(lit(*net), lit(*ip)));
    auto r = evaluate_boolean(*expr, session_);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(*r);
}

TEST_F(ExpressionTest, LenOfString) {
    std::vector<ExpressionPtr> args;
    args.push_back(lit(AttributeValue::string("hello")));
    auto expr = call("len", std::move(args));
    auto r = expr->evaluate(session_);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->as_integer(), 5);
}

TEST_F(ExpressionTest, DivisionByZeroIsFunctionError) {
    auto expr = call("divide", args_of(lit(AttributeValue::integer(1)), lit(AttributeValue::integer(0))));
    auto r = expr->evaluate(session_);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::kFunctionError);
    EXPECT_EQ(r.error().function, "divide");
    EXPECT_NE(r.error().message.find("division by zero"), std::string::npos);
}

TEST_F(ExpressionTest, IntegerOverflowIsFunctionError) {
    const auto max = std::numeric_limits<std::int64_t>::max();
    auto expr = call("add", args_of(lit(AttributeValue::integer(max)), lit(AttributeValue::integer(1))));
    auto r = expr->evaluate(session_);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::kFunctionError);
    EXPECT_EQ(r.error().function, "add");

    const auto min = std::numeric_limits<std::int64_t>::min();
    auto div = call("divide", args_of(lit(AttributeValue::integer(min)), lit(AttributeValue::integer(-1))));
    EXPECT_FALSE(div->evaluate(session_).has_value());
}

TEST_F(ExpressionTest, FloatOverflowIsFunctionError) {
    const double big = std::numeric_limits<double>::max();
    auto expr = call("multiply", args_of(lit(AttributeValue::floating(big)), lit(AttributeValue::floating(2.0))));
    auto r = expr->evaluate(session_);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::kFunctionError);
}

TEST_F(ExpressionTest, ArgumentErrorPropagatesUnchanged) {
    auto expr = call("equal", args_of(attr("missing", kStringType), lit(AttributeValue::string("x"))));
    auto r = expr->evaluate(session_);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::kResolutionError);
}

// ---------------------------------------------------------------------------
// 속성 참조
// ---------------------------------------------------------------------------
TEST(DesignatorExpression, ReadsRequestValue) {
    Request request;
    request.add("user.role", AttributeValue::string("admin"));
    EvaluationSession session{request};

    auto expr = call("equal", args_of(attr("user.role", kStringType), lit(AttributeValue::string("admin"))));
    auto r = evaluate_boolean(*expr, session);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(*r);
}

// ---------------------------------------------------------------------------
// 단락 평가
// ---------------------------------------------------------------------------
TEST_F(ExpressionTest, AndStopsAtFirstFalse) {
    int first = 0, second = 0;
    std::vector<ExpressionPtr> ops;
    ops.push_back(counting(false, &first));
    ops.push_back(counting(true, &second));
    AndExpression expr{std::move(ops)};

    auto r = evaluate_boolean(expr, session_);
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(*r);
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 0) << "and must not evaluate past the first false operand";
}

TEST_F(ExpressionTest, AndStopsAtFirstError) {
    int first = 0, second = 0;
    std::vector<ExpressionPtr> ops;
    ops.push_back(counting(true, &first, /*fail=*/true));
    ops.push_back(counting(false, &second));
    AndExpression expr{std::move(ops)};

    auto r = evaluate_boolean(expr, session_);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(second, 0);
}

TEST_F(ExpressionTest, OrStopsAtFirstTrue) {
    int first = 0, second = 0;
    std::vector<ExpressionPtr> ops;
    ops.push_back(counting(true, &first));
    ops.push_back(counting(false, &second));
    OrExpression expr{std::move(ops)};

    auto r = evaluate_boolean(expr, session_);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(*r);
    EXPECT_EQ(second, 0);
}

TEST_F(ExpressionTest, OrTrueWinsOverEarlierError) {
    int first = 0, second = 0;
    std::vector<ExpressionPtr> ops;
    ops.push_back(counting(false, &first, /*fail=*/true));
    ops.push_back(counting(true, &second));
    OrExpression expr{std::move(ops)};

    auto r = evaluate_boolean(expr, session_);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(*r);
    EXPECT_EQ(second, 1);
}

TEST_F(ExpressionTest, OrWithoutTrueReturnsFirstError) {
    int first = 0, second = 0;
    std::vector<ExpressionPtr> ops;
    ops.push_back(counting(false, &first));
    ops.push_back(counting(false, &second, /*fail=*/true));
    OrExpression expr{std::move(ops)};

    auto r = evaluate_boolean(expr, session_);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "counting failure");
}

TEST_F(ExpressionTest, NotNegates) {
    NotExpression expr{lit_bool(false)};
    auto r = evaluate_boolean(expr, session_);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(*r);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
