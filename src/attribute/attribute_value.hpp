#pragma once

// ---------------------------------------------------------------------------
// attribute_value.hpp
//
// 타입이 붙은 속성 값 (tagged union) 과 타입별 연산.
//
// [설계 원칙]
// - 모든 연산은 순수 함수이며 올바른 입력에 대해 total 이다.
// - 잘못된 리터럴 (파싱 불가 IP 등) 은 coerce() 에서 실패한다.
//   즉 파싱 시점에 걸러지고, 평가 시점에는 발생하지 않는다.
// - set 은 항상 정렬 + 중복 제거 상태로 보관한다 (이진 탐색 멤버십).
// - list 는 선언 순서와 중복을 그대로 유지한다.
//
// [IP 주소]
// IPv4 는 bytes[0..3] 만 사용하고 v6 = false.
// 패밀리가 다른 주소/네트워크 간 contains 는 항상 false 이다.
// ---------------------------------------------------------------------------

#include "attribute/attribute_type.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// IpAddress
// ---------------------------------------------------------------------------
struct IpAddress {
    bool                          v6{false};
    std::array<std::uint8_t, 16>  bytes{};

    [[nodiscard]] static std::optional<IpAddress> parse(std::string_view text);
    [[nodiscard]] std::string to_string() const;

    friend auto operator<=>(const IpAddress&, const IpAddress&) = default;
};

// ---------------------------------------------------------------------------
// IpNetwork
//   "10.0.0.0/8", "2001:db8::/32". 호스트 비트는 파싱 시 0 으로 정규화한다.
// ---------------------------------------------------------------------------
struct IpNetwork {
    IpAddress    address{};
    std::uint8_t prefix{0};

    [[nodiscard]] static std::optional<IpNetwork> parse(std::string_view text);
    [[nodiscard]] bool contains(const IpAddress& ip) const noexcept;
    [[nodiscard]] std::string to_string() const;

    friend auto operator<=>(const IpNetwork&, const IpNetwork&) = default;
};

// ---------------------------------------------------------------------------
// DomainName
//   소문자 정규화, 끝의 '.' 제거.
//   라벨: 1~63자 [a-z0-9_-], '-' 로 시작/끝 불가. 전체 253자 이하.
// ---------------------------------------------------------------------------
struct DomainName {
    std::string name{};

    [[nodiscard]] static std::optional<DomainName> parse(std::string_view text);

    // zone 자신 또는 그 하위 도메인이면 true ("a.example.com" ⊂ "example.com")
    [[nodiscard]] bool is_subdomain_of(const DomainName& zone) const noexcept;

    friend auto operator<=>(const DomainName&, const DomainName&) = default;
};

// ---------------------------------------------------------------------------
// TimePoint
//   UTC 초 + 나노초 나머지. 정렬은 (seconds, nanos) 사전순.
//   sys_time<nanoseconds> 는 1677~2262 년만 표현하므로 쓰지 않는다.
//   표현 범위: 0000-01-01T00:00:00Z ~ 9999-12-31T23:59:59.999999999Z (UTC 기준)
// ---------------------------------------------------------------------------
struct TimePoint {
    std::chrono::sys_seconds seconds{};
    std::int32_t             nanos{0};     // [0, 999'999'999]

    friend auto operator<=>(const TimePoint&, const TimePoint&) = default;
};

// RFC 3339: "2024-01-02T03:04:05Z", "2024-01-02T03:04:05.25+09:00"
// UTC 로 정규화한 결과가 표현 범위를 벗어나면 nullopt.
[[nodiscard]] std::optional<TimePoint> parse_time(std::string_view text);
[[nodiscard]] std::string format_time(TimePoint tp);

// variant 인덱스 순서는 고정: 스칼라 TypeKind 와 1:1 대응
using ScalarValue = std::variant<
    bool,
    std::string,
    std::int64_t,
    double,
    IpAddress,
    IpNetwork,
    DomainName,
    TimePoint>;

[[nodiscard]] TypeKind scalar_kind(const ScalarValue& value) noexcept;
[[nodiscard]] std::string scalar_to_string(const ScalarValue& value);

// parse_scalar
//   raw 문자열을 kind 타입의 스칼라로 변환한다.
//   실패 메시지는 기대 타입과 입력을 모두 포함한다.
[[nodiscard]] std::expected<ScalarValue, std::string>
parse_scalar(TypeKind kind, std::string_view raw);

// ---------------------------------------------------------------------------
// AttributeValue
//   스칼라이면 scalar_ 만, 컬렉션이면 items_ 만 의미가 있다.
//   생성 후 불변 (값 객체).
// ---------------------------------------------------------------------------
class AttributeValue {
public:
    [[nodiscard]] static AttributeValue boolean(bool v);
    [[nodiscard]] static AttributeValue string(std::string v);
    [[nodiscard]] static AttributeValue integer(std::int64_t v);
    [[nodiscard]] static AttributeValue floating(double v);
    [[nodiscard]] static AttributeValue address(IpAddress v);
    [[nodiscard]] static AttributeValue network(IpNetwork v);
    [[nodiscard]] static AttributeValue domain(DomainName v);
    [[nodiscard]] static AttributeValue time(TimePoint v);

    // 스칼라 variant 로부터 (타입은 alternative 로 결정)
    [[nodiscard]] static AttributeValue from_scalar(ScalarValue v);

    // collection
    //   type 은 kSet/kList 여야 하며 모든 원소가 type.element 와 일치해야 한다.
    //   set 이면 정렬 + 중복 제거한다.
    [[nodiscard]] static std::expected<AttributeValue, std::string>
    collection(const AttributeType& type, std::vector<ScalarValue> items);

    // coerce
    //   문서/요청의 원시 문자열을 type 으로 변환한다.
    //   스칼라 타입에 목록을 주거나 컬렉션 타입에 스칼라를 주면 실패.
    [[nodiscard]] static std::expected<AttributeValue, std::string>
    coerce(const AttributeType& type, std::string_view raw);

    [[nodiscard]] static std::expected<AttributeValue, std::string>
    coerce(const AttributeType& type, const std::vector<std::string>& raw_items);

    [[nodiscard]] const AttributeType& type() const noexcept { return type_; }

    // 타입별 접근자. 타입이 다르면 std::bad_variant_access (호출자 버그).
    [[nodiscard]] bool               as_boolean() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] std::int64_t       as_integer() const;
    [[nodiscard]] double             as_float() const;
    [[nodiscard]] const IpAddress&   as_address() const;
    [[nodiscard]] const IpNetwork&   as_network() const;
    [[nodiscard]] const DomainName&  as_domain() const;
    [[nodiscard]] TimePoint          as_time() const;

    [[nodiscard]] const ScalarValue&              scalar() const noexcept { return scalar_; }
    [[nodiscard]] const std::vector<ScalarValue>& items() const noexcept { return items_; }

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const AttributeValue&, const AttributeValue&) = default;

private:
    AttributeValue(AttributeType type, ScalarValue scalar, std::vector<ScalarValue> items);

    AttributeType            type_{};
    ScalarValue              scalar_{false};
    std::vector<ScalarValue> items_{};
};

// ---------------------------------------------------------------------------
// 타입별 연산
//   인자 타입 조합은 function_registry 에서 파싱 시점에 검증된다.
// ---------------------------------------------------------------------------

// 같은 순서형 스칼라 타입끼리 비교. 비교 불가 조합이면 std::nullopt.
[[nodiscard]] std::optional<int> compare_values(const AttributeValue& a, const AttributeValue& b);

// 멤버십/포함 검사
//   (string, string)           : 부분 문자열
//   (network, address)         : 주소가 네트워크에 속함
//   (set|list of T, T)         : 원소 멤버십
//   (set of networks, address) : 어느 한 네트워크라도 주소를 포함
[[nodiscard]] bool value_contains(const AttributeValue& container, const AttributeValue& item);

// 같은 컬렉션 타입끼리의 교집합/합집합
[[nodiscard]] AttributeValue intersect_values(const AttributeValue& a, const AttributeValue& b);
[[nodiscard]] AttributeValue unite_values(const AttributeValue& a, const AttributeValue& b);
