#pragma once

// ---------------------------------------------------------------------------
// attribute_type.hpp
//
// 속성 타입 태그.
//   스칼라: boolean, string, integer, float, address, network, domain, time
//   컬렉션: set of <T>, list of <T>  (T 는 boolean 을 제외한 스칼라)
//
// [설계 원칙]
// - 타입은 파싱 시점에 모두 결정된다. 런타임에 "알 수 없는 타입" 은 없다.
// - 타입 이름 비교는 대소문자 무관, 원소 이름은 단수/복수 모두 허용한다.
//   ("set of strings" == "Set Of String")
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

enum class TypeKind : std::uint8_t {
    kUndefined = 0,
    kBoolean   = 1,
    kString    = 2,
    kInteger   = 3,
    kFloat     = 4,
    kAddress   = 5,
    kNetwork   = 6,
    kDomain    = 7,
    kTime      = 8,
    kSet       = 9,   // 정렬 + 중복 제거된 컬렉션
    kList      = 10,  // 선언 순서 유지 컬렉션
};

// ---------------------------------------------------------------------------
// AttributeType
//   kind    : 타입 종류
//   element : kind 가 kSet/kList 일 때 원소 스칼라 타입, 그 외 kUndefined
// ---------------------------------------------------------------------------
struct AttributeType {
    TypeKind kind{TypeKind::kUndefined};
    TypeKind element{TypeKind::kUndefined};

    [[nodiscard]] static constexpr AttributeType scalar(TypeKind k) noexcept {
        return AttributeType{k, TypeKind::kUndefined};
    }
    [[nodiscard]] static constexpr AttributeType set_of(TypeKind elem) noexcept {
        return AttributeType{TypeKind::kSet, elem};
    }
    [[nodiscard]] static constexpr AttributeType list_of(TypeKind elem) noexcept {
        return AttributeType{TypeKind::kList, elem};
    }

    [[nodiscard]] constexpr bool is_collection() const noexcept {
        return kind == TypeKind::kSet || kind == TypeKind::kList;
    }

    // 원소 타입을 스칼라 AttributeType 으로 반환 (컬렉션 전용)
    [[nodiscard]] constexpr AttributeType element_type() const noexcept {
        return scalar(element);
    }

    // 정규화된 타입 이름 ("string", "set of strings")
    [[nodiscard]] std::string name() const;

    friend constexpr bool operator==(const AttributeType&, const AttributeType&) = default;
};

inline constexpr AttributeType kBooleanType = AttributeType::scalar(TypeKind::kBoolean);
inline constexpr AttributeType kStringType  = AttributeType::scalar(TypeKind::kString);
inline constexpr AttributeType kIntegerType = AttributeType::scalar(TypeKind::kInteger);
inline constexpr AttributeType kFloatType   = AttributeType::scalar(TypeKind::kFloat);
inline constexpr AttributeType kAddressType = AttributeType::scalar(TypeKind::kAddress);
inline constexpr AttributeType kNetworkType = AttributeType::scalar(TypeKind::kNetwork);
inline constexpr AttributeType kDomainType  = AttributeType::scalar(TypeKind::kDomain);
inline constexpr AttributeType kTimeType    = AttributeType::scalar(TypeKind::kTime);

// 컬렉션 원소로 허용되는 스칼라인지
[[nodiscard]] bool is_collection_element(TypeKind kind) noexcept;

// 순서 비교(greater/less)가 정의된 스칼라인지
[[nodiscard]] bool is_ordered(TypeKind kind) noexcept;

[[nodiscard]] std::string_view scalar_name(TypeKind kind) noexcept;

// parse_attribute_type
//   문서의 타입 이름을 AttributeType 으로 변환한다.
//   실패: std::unexpected(오류 메시지): 호출자가 kTypeError 로 감싼다.
[[nodiscard]] std::expected<AttributeType, std::string>
parse_attribute_type(std::string_view name);
