// ---------------------------------------------------------------------------
// function_registry.cpp
// ---------------------------------------------------------------------------

#include "expression/function_registry.hpp"

#include "common/text.hpp"

#include <array>
#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

namespace {

using Args = std::vector<AttributeValue>;

constexpr std::array<TypeKind, 8> kAllScalars{
    TypeKind::kBoolean, TypeKind::kString,  TypeKind::kInteger, TypeKind::kFloat,
    TypeKind::kAddress, TypeKind::kNetwork, TypeKind::kDomain,  TypeKind::kTime,
};

constexpr std::array<TypeKind, 7> kElementScalars{
    TypeKind::kString,  TypeKind::kInteger, TypeKind::kFloat, TypeKind::kAddress,
    TypeKind::kNetwork, TypeKind::kDomain,  TypeKind::kTime,
};

constexpr std::array<TypeKind, 4> kOrderedScalars{
    TypeKind::kInteger, TypeKind::kFloat, TypeKind::kString, TypeKind::kTime,
};

// ---------------------------------------------------------------------------
// 구현 함수
// ---------------------------------------------------------------------------
FunctionResult fn_equal(const Args& a) {
    return AttributeValue::boolean(a[0] == a[1]);
}

template <typename Pred>
FunctionResult compare_with(const Args& a, Pred pred) {
    const auto cmp = compare_values(a[0], a[1]);
    if (!cmp) {
        return std::unexpected(fmt::format("cannot order {} and {}",
                                           a[0].type().name(), a[1].type().name()));
    }
    return AttributeValue::boolean(pred(*cmp));
}

FunctionResult fn_greater(const Args& a)          { return compare_with(a, [](int c) { return c > 0; }); }
FunctionResult fn_less(const Args& a)             { return compare_with(a, [](int c) { return c < 0; }); }
FunctionResult fn_greater_or_equal(const Args& a) { return compare_with(a, [](int c) { return c >= 0; }); }
FunctionResult fn_less_or_equal(const Args& a)    { return compare_with(a, [](int c) { return c <= 0; }); }

FunctionResult fn_contains(const Args& a) {
    return AttributeValue::boolean(value_contains(a[0], a[1]));
}

FunctionResult fn_subdomain(const Args& a) {
    return AttributeValue::boolean(a[0].as_domain().is_subdomain_of(a[1].as_domain()));
}

FunctionResult fn_intersect(const Args& a) { return intersect_values(a[0], a[1]); }
FunctionResult fn_union(const Args& a)     { return unite_values(a[0], a[1]); }

FunctionResult fn_len(const Args& a) {
    if (a[0].type() == kStringType) {
        return AttributeValue::integer(static_cast<std::int64_t>(a[0].as_string().size()));
    }
    return AttributeValue::integer(static_cast<std::int64_t>(a[0].items().size()));
}

// 정수 산술: 오버플로는 오류. 부동소수: 결과가 유한해야 한다.
FunctionResult fn_add(const Args& a) {
    if (a[0].type() == kIntegerType) {
        std::int64_t r = 0;
        if (__builtin_add_overflow(a[0].as_integer(), a[1].as_integer(), &r)) {
            return std::unexpected(std::string{"integer overflow"});
        }
        return AttributeValue::integer(r);
    }
    const double r = a[0].as_float() + a[1].as_float();
    if (!std::isfinite(r)) {
        return std::unexpected(std::string{"float result is not finite"});
    }
    return AttributeValue::floating(r);
}

FunctionResult fn_subtract(const Args& a) {
    if (a[0].type() == kIntegerType) {
        std::int64_t r = 0;
        if (__builtin_sub_overflow(a[0].as_integer(), a[1].as_integer(), &r)) {
            return std::unexpected(std::string{"integer overflow"});
        }
        return AttributeValue::integer(r);
    }
    const double r = a[0].as_float() - a[1].as_float();
    if (!std::isfinite(r)) {
        return std::unexpected(std::string{"float result is not finite"});
    }
    return AttributeValue::floating(r);
}

FunctionResult fn_multiply(const Args& a) {
    if (a[0].type() == kIntegerType) {
        std::int64_t r = 0;
        if (__builtin_mul_overflow(a[0].as_integer(), a[1].as_integer(), &r)) {
            return std::unexpected(std::string{"integer overflow"});
        }
        return AttributeValue::integer(r);
    }
    const double r = a[0].as_float() * a[1].as_float();
    if (!std::isfinite(r)) {
        return std::unexpected(std::string{"float result is not finite"});
    }
    return AttributeValue::floating(r);
}

FunctionResult fn_divide(const Args& a) {
    if (a[0].type() == kIntegerType) {
        const std::int64_t x = a[0].as_integer();
        const std::int64_t y = a[1].as_integer();
        if (y == 0) {
            return std::unexpected(std::string{"division by zero"});
        }
        if (x == std::numeric_limits<std::int64_t>::min() && y == -1) {
            return std::unexpected(std::string{"integer overflow"});
        }
        return AttributeValue::integer(x / y);
    }
    if (a[1].as_float() == 0.0) {
        return std::unexpected(std::string{"division by zero"});
    }
    const double r = a[0].as_float() / a[1].as_float();
    if (!std::isfinite(r)) {
        return std::unexpected(std::string{"float result is not finite"});
    }
    return AttributeValue::floating(r);
}

// ---------------------------------------------------------------------------
// 테이블 구성
// ---------------------------------------------------------------------------
std::vector<FunctionOverload> build_table() {
    std::vector<FunctionOverload> table;

    const auto add = [&table](std::string_view name, std::vector<AttributeType> params,
                              AttributeType result, FunctionImpl impl) {
        table.push_back(FunctionOverload{std::string{name}, std::move(params), result, impl});
    };

    for (const TypeKind k : kAllScalars) {
        const auto t = AttributeType::scalar(k);
        add("equal", {t, t}, kBooleanType, fn_equal);
    }

    for (const TypeKind k : kOrderedScalars) {
        const auto t = AttributeType::scalar(k);
        add("greater",          {t, t}, kBooleanType, fn_greater);
        add("less",             {t, t}, kBooleanType, fn_less);
        add("greater-or-equal", {t, t}, kBooleanType, fn_greater_or_equal);
        add("less-or-equal",    {t, t}, kBooleanType, fn_less_or_equal);
    }

    add("contains", {kStringType, kStringType}, kBooleanType, fn_contains);
    add("contains", {kNetworkType, kAddressType}, kBooleanType, fn_contains);
    add("contains", {AttributeType::set_of(TypeKind::kNetwork), kAddressType},
        kBooleanType, fn_contains);

    for (const TypeKind k : kElementScalars) {
        const auto elem = AttributeType::scalar(k);
        const auto set  = AttributeType::set_of(k);
        const auto list = AttributeType::list_of(k);

        add("contains", {set, elem},   kBooleanType, fn_contains);
        add("contains", {list, elem},  kBooleanType, fn_contains);
        add("intersect", {set, set},   set,  fn_intersect);
        add("intersect", {list, list}, list, fn_intersect);
        add("union", {set, set},       set,  fn_union);
        add("union", {list, list},     list, fn_union);
        add("len", {set},              kIntegerType, fn_len);
        add("len", {list},             kIntegerType, fn_len);
    }
    add("len", {kStringType}, kIntegerType, fn_len);

    add("subdomain", {kDomainType, kDomainType}, kBooleanType, fn_subdomain);

    for (const auto& t : {kIntegerType, kFloatType}) {
        add("add",      {t, t}, t, fn_add);
        add("subtract", {t, t}, t, fn_subtract);
        add("multiply", {t, t}, t, fn_multiply);
        add("divide",   {t, t}, t, fn_divide);
    }

    spdlog::debug("function_registry: {} overloads registered", table.size());
    return table;
}

const std::vector<FunctionOverload>& table() {
    static const std::vector<FunctionOverload> instance = build_table();
    return instance;
}

std::string join_types(const std::vector<AttributeType>& types) {
    std::string out;
    for (const auto& t : types) {
        if (!out.empty()) {
            out += ", ";
        }
        out += t.name();
    }
    return out;
}

}  // namespace

bool is_known_function(std::string_view name) {
    for (const auto& overload : table()) {
        if (iequals(overload.name, name)) {
            return true;
        }
    }
    return false;
}

std::expected<const FunctionOverload*, std::string>
resolve_function(std::string_view name, const std::vector<AttributeType>& arg_types) {
    bool known = false;
    for (const auto& overload : table()) {
        if (!iequals(overload.name, name)) {
            continue;
        }
        known = true;
        if (overload.params == arg_types) {
            return &overload;
        }
    }
    if (!known) {
        return std::unexpected(fmt::format("unknown function '{}'", name));
    }
    return std::unexpected(fmt::format("no overload of '{}' accepts ({})",
                                       to_lower(name), join_types(arg_types)));
}
