// ---------------------------------------------------------------------------
// test_attribute_value.cpp
//
// AttributeType / AttributeValue 단위 테스트.
//
// [테스트 범위]
// - 타입 이름 파싱 (대소문자 무관, set/list of X)
// - 리터럴 변환 (coerce): 스칼라 8종 성공/실패
// - set 정렬 + 중복 제거, list 순서 보존
// - 네트워크 호스트 비트 정규화, 주소 패밀리 분리
// - 도메인 정규화 및 하위 도메인 판정
// - RFC 3339 시간 (오프셋, 소수 초)
// - contains / intersect / union / compare_values
// ---------------------------------------------------------------------------

#include "attribute/attribute_type.hpp"
#include "attribute/attribute_value.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

AttributeValue must_coerce(const AttributeType& type, std::string_view raw) {
    auto v = AttributeValue::coerce(type, raw);
    EXPECT_TRUE(v.has_value()) << "coerce failed: " << (v ? "" : v.error());
    return v ? *v : AttributeValue::boolean(false);
}

AttributeValue must_coerce(const AttributeType& type, const std::vector<std::string>& raw) {
    auto v = AttributeValue::coerce(type, raw);
    EXPECT_TRUE(v.has_value()) << "coerce failed: " << (v ? "" : v.error());
    return v ? *v : AttributeValue::boolean(false);
}

} // namespace

// ---------------------------------------------------------------------------
// 타입 이름
// ---------------------------------------------------------------------------
TEST(AttributeType, ParsesScalarNamesCaseInsensitively) {
    auto t = parse_attribute_type("Integer");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, kIntegerType);

    auto d = parse_attribute_type("DOMAIN");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, kDomainType);
}

TEST(AttributeType, ParsesCollectionNames) {
    auto s = parse_attribute_type("set of strings");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(*s, AttributeType::set_of(TypeKind::kString));
    EXPECT_EQ(s->name(), "set of strings");

    auto l = parse_attribute_type("List Of Addresses");
    ASSERT_TRUE(l.has_value());
    EXPECT_EQ(*l, AttributeType::list_of(TypeKind::kAddress));
}

TEST(AttributeType, RejectsUnknownNames) {
    EXPECT_FALSE(parse_attribute_type("uuid").has_value());
    EXPECT_FALSE(parse_attribute_type("set of uuids").has_value());
    EXPECT_FALSE(parse_attribute_type("").has_value());
}

// ---------------------------------------------------------------------------
// 스칼라 변환
// ---------------------------------------------------------------------------
TEST(AttributeValue, CoercesBooleanCaseInsensitively) {
    EXPECT_TRUE(must_coerce(kBooleanType, "TRUE").as_boolean());
    EXPECT_FALSE(must_coerce(kBooleanType, "false").as_boolean());
    EXPECT_FALSE(AttributeValue::coerce(kBooleanType, "yes").has_value());
}

TEST(AttributeValue, CoercesIntegerStrictly) {
    EXPECT_EQ(must_coerce(kIntegerType, "-42").as_integer(), -42);
    EXPECT_FALSE(AttributeValue::coerce(kIntegerType, "12abc").has_value());
    EXPECT_FALSE(AttributeValue::coerce(kIntegerType, "").has_value());
    EXPECT_FALSE(AttributeValue::coerce(kIntegerType, "99999999999999999999").has_value());
}

TEST(AttributeValue, FloatRejectsNonFinite) {
    EXPECT_DOUBLE_EQ(must_coerce(kFloatType, "2.5").as_float(), 2.5);
    EXPECT_FALSE(AttributeValue::coerce(kFloatType, "inf").has_value());
    EXPECT_FALSE(AttributeValue::coerce(kFloatType, "nan").has_value());
}

TEST(AttributeValue, FailureMessageNamesExpectedTypeAndInput) {
    auto v = AttributeValue::coerce(kAddressType, "10.0.0.256");
    ASSERT_FALSE(v.has_value());
    EXPECT_NE(v.error().find("address"), std::string::npos);
    EXPECT_NE(v.error().find("10.0.0.256"), std::string::npos);
}

TEST(AttributeValue, ScalarTypeRejectsListAndViceVersa) {
    EXPECT_FALSE(AttributeValue::coerce(kStringType, std::vector<std::string>{"a"}).has_value());
    EXPECT_FALSE(AttributeValue::coerce(AttributeType::set_of(TypeKind::kString), "a").has_value());
}

// ---------------------------------------------------------------------------
// 컬렉션
// ---------------------------------------------------------------------------
TEST(AttributeValue, SetIsSortedAndDeduplicated) {
    const auto v = must_coerce(AttributeType::set_of(TypeKind::kString), {"b", "a", "b", "c"});
    ASSERT_EQ(v.items().size(), 3u);
    EXPECT_EQ(v.to_string(), "[a, b, c]");
}

TEST(AttributeValue, ListKeepsOrderAndDuplicates) {
    const auto v = must_coerce(AttributeType::list_of(TypeKind::kInteger), {"3", "1", "3"});
    ASSERT_EQ(v.items().size(), 3u);
    EXPECT_EQ(v.to_string(), "[3, 1, 3]");
}

TEST(AttributeValue, CollectionRejectsBadElement) {
    auto v = AttributeValue::coerce(AttributeType::list_of(TypeKind::kInteger), std::vector<std::string>{"1", "x"});
    EXPECT_FALSE(v.has_value());
}

// ---------------------------------------------------------------------------
// IP
// ---------------------------------------------------------------------------
TEST(AttributeValue, NetworkHostBitsAreCleared) {
    const auto net = must_coerce(kNetworkType, "10.1.2.3/8");
    EXPECT_EQ(net.to_string(), "10.0.0.0/8");
    EXPECT_FALSE(AttributeValue::coerce(kNetworkType, "10.0.0.0/33").has_value());
    EXPECT_FALSE(AttributeValue::coerce(kNetworkType, "10.0.0.0").has_value());
}

TEST(AttributeValue, NetworkContainsAddressOfSameFamilyOnly) {
    const auto net4 = must_coerce(kNetworkType, "192.168.0.0/16");
    const auto net6 = must_coerce(kNetworkType, "2001:db8::/32");

    EXPECT_TRUE(value_contains(net4, must_coerce(kAddressType, "192.168.44.1")));
    EXPECT_FALSE(value_contains(net4, must_coerce(kAddressType, "192.169.0.1")));
    EXPECT_TRUE(value_contains(net6, must_coerce(kAddressType, "2001:db8::1")));
    EXPECT_FALSE(value_contains(net6, must_coerce(kAddressType, "192.168.44.1")));
}

TEST(AttributeValue, NetworkPrefixNotOnByteBoundary) {
    const auto net = must_coerce(kNetworkType, "10.0.0.0/12");
    EXPECT_TRUE(value_contains(net, must_coerce(kAddressType, "10.15.255.255")));
    EXPECT_FALSE(value_contains(net, must_coerce(kAddressType, "10.16.0.0")));
}

TEST(AttributeValue, SetOfNetworksContainsAddress) {
    const auto nets = must_coerce(AttributeType::set_of(TypeKind::kNetwork), std::vector<std::string>{"10.0.0.0/8", "172.16.0.0/12"});
    EXPECT_TRUE(value_contains(nets, must_coerce(kAddressType, "172.20.1.1")));
    EXPECT_FALSE(value_contains(nets, must_coerce(kAddressType, "8.8.8.8")));
}

// ---------------------------------------------------------------------------
// 도메인
// ---------------------------------------------------------------------------
TEST(AttributeValue, DomainIsNormalized) {
    EXPECT_EQ(must_coerce(kDomainType, "WWW.Example.COM.").to_string(), "www.example.com");
    EXPECT_FALSE(AttributeValue::coerce(kDomainType, "-bad.example.com").has_value());
    EXPECT_FALSE(AttributeValue::coerce(kDomainType, "a..b").has_value());
}

TEST(AttributeValue, SubdomainRespectsLabelBoundary) {
    const auto zone = must_coerce(kDomainType, "example.com").as_domain();
    EXPECT_TRUE(must_coerce(kDomainType, "a.b.example.com").as_domain().is_subdomain_of(zone));
    EXPECT_TRUE(must_coerce(kDomainType, "example.com").as_domain().is_subdomain_of(zone));
    EXPECT_FALSE(must_coerce(kDomainType, "badexample.com").as_domain().is_subdomain_of(zone));
}

// ---------------------------------------------------------------------------
// 시간
// ---------------------------------------------------------------------------
TEST(AttributeValue, TimeOffsetsAreNormalizedToUtc) {
    const auto a = must_coerce(kTimeType, "2024-01-02T12:00:00+09:00");
    const auto b = must_coerce(kTimeType, "2024-01-02T03:00:00Z");
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.to_string(), "2024-01-02T03:00:00Z");
}

TEST(AttributeValue, TimeKeepsFractionalSeconds) {
    const auto t = must_coerce(kTimeType, "2024-01-02T03:04:05.250Z");
    EXPECT_EQ(t.to_string(), "2024-01-02T03:04:05.25Z");
    EXPECT_FALSE(AttributeValue::coerce(kTimeType, "2024-02-30T00:00:00Z").has_value());
    EXPECT_FALSE(AttributeValue::coerce(kTimeType, "2024-01-02 03:04:05").has_value());
}

// ---------------------------------------------------------------------------
// 먼 미래 / 먼 과거 시간
//   "만료 없음" 관례 (9999-12-31) 가 현재보다 뒤로 정렬되어야 한다.
// ---------------------------------------------------------------------------
TEST(AttributeValue, TimeOutsideNanosecondEpochRangeKeepsOrder) {
    const auto now      = must_coerce(kTimeType, "2024-01-02T03:04:05Z");
    const auto forever  = must_coerce(kTimeType, "9999-12-31T23:59:59Z");
    const auto ancient  = must_coerce(kTimeType, "1600-01-01T00:00:00Z");
    const auto far_late = must_coerce(kTimeType, "2300-01-01T00:00:00.5Z");

    EXPECT_EQ(compare_values(now, forever), -1);
    EXPECT_EQ(compare_values(forever, now), 1);
    EXPECT_EQ(compare_values(ancient, now), -1);
    EXPECT_EQ(compare_values(far_late, now), 1);
    EXPECT_EQ(compare_values(far_late, forever), -1);

    EXPECT_EQ(forever.to_string(), "9999-12-31T23:59:59Z");
    EXPECT_EQ(ancient.to_string(), "1600-01-01T00:00:00Z");
    EXPECT_EQ(far_late.to_string(), "2300-01-01T00:00:00.5Z");
}

TEST(AttributeValue, TimeNormalizedOutsideYearRangeIsRejected) {
    EXPECT_TRUE(AttributeValue::coerce(kTimeType, "0000-01-01T00:00:00Z").has_value());
    EXPECT_FALSE(AttributeValue::coerce(kTimeType, "0000-01-01T00:30:00+01:00").has_value());
    EXPECT_FALSE(AttributeValue::coerce(kTimeType, "9999-12-31T23:30:00-01:00").has_value());
}

// ---------------------------------------------------------------------------
// 연산
// ---------------------------------------------------------------------------
TEST(AttributeValue, CompareOrderedTypesOnly) {
    EXPECT_EQ(compare_values(AttributeValue::integer(1), AttributeValue::integer(2)), -1);
    EXPECT_EQ(compare_values(AttributeValue::string("b"), AttributeValue::string("a")), 1);
    EXPECT_EQ(compare_values(AttributeValue::floating(1.0), AttributeValue::floating(1.0)), 0);
    EXPECT_FALSE(compare_values(AttributeValue::integer(1), AttributeValue::floating(1.0)).has_value());
    EXPECT_FALSE(compare_values(AttributeValue::boolean(true), AttributeValue::boolean(false)).has_value());
}

TEST(AttributeValue, StringContainsIsSubstring) {
    EXPECT_TRUE(value_contains(AttributeValue::string("hello world"), AttributeValue::string("lo w")));
    EXPECT_FALSE(value_contains(AttributeValue::string("hello"), AttributeValue::string("Hello")));
}

TEST(AttributeValue, SetIntersectAndUnion) {
    const AttributeType set_t = AttributeType::set_of(TypeKind::kString);
    const auto a = must_coerce(set_t, {"x", "y", "z"});
    const auto b = must_coerce(set_t, {"y", "z", "w"});

    EXPECT_EQ(intersect_values(a, b).to_string(), "[y, z]");
    EXPECT_EQ(unite_values(a, b).to_string(), "[w, x, y, z]");
}

TEST(AttributeValue, ListIntersectKeepsLeftOrder) {
    const AttributeType list_t = AttributeType::list_of(TypeKind::kInteger);
    const auto a = must_coerce(list_t, {"3", "1", "2"});
    const auto b = must_coerce(list_t, std::vector<std::string>{"2", "3"});

    EXPECT_EQ(intersect_values(a, b).to_string(), "[3, 2]");
    EXPECT_EQ(unite_values(b, a).to_string(), "[2, 3, 1]");
}

TEST(AttributeValue, ListUnionAddsEachNewRightItemOnce) {
    const AttributeType list_t = AttributeType::list_of(TypeKind::kInteger);
    const auto a = must_coerce(list_t, std::vector<std::string>{"1", "1"});
    const auto b = must_coerce(list_t, {"2", "2", "1", "3", "2"});

    // 왼쪽 중복은 유지, 오른쪽 중복은 한 번만
    EXPECT_EQ(unite_values(a, b).to_string(), "[1, 1, 2, 3]");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
