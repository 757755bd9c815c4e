// ---------------------------------------------------------------------------
// attribute_value.cpp
//
// AttributeValue 생성/변환 및 타입별 연산 구현.
//
// [알려진 한계]
// - time 은 나노초 정밀도까지만 보존한다 (소수점 이하 9자리 초과는 거부).
// - float 은 유한값만 허용한다 (NaN/Inf 리터럴 거부, 정렬 순서 보장).
// ---------------------------------------------------------------------------

#include "attribute/attribute_value.hpp"

#include "common/text.hpp"

#include <algorithm>
#include <arpa/inet.h>      // inet_pton, inet_ntop
#include <charconv>
#include <cmath>
#include <cstring>         // memcpy
#include <netinet/in.h>

#include <spdlog/spdlog.h>

namespace {

// 고정 폭 숫자 읽기 (RFC 3339 필드용)
bool read_digits(std::string_view s, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        const char c = s[i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

bool is_label_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

std::string join_items(const std::vector<ScalarValue>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += scalar_to_string(items[i]);
    }
    out += "]";
    return out;
}

bool list_has(const std::vector<ScalarValue>& items, const ScalarValue& v) {
    return std::find(items.begin(), items.end(), v) != items.end();
}

}  // namespace

// ---------------------------------------------------------------------------
// IpAddress / IpNetwork
// ---------------------------------------------------------------------------
std::optional<IpAddress> IpAddress::parse(std::string_view text) {
    const std::string buf{text};
    IpAddress ip{};

    struct in_addr v4{};
    if (inet_pton(AF_INET, buf.c_str(), &v4) == 1) {
        std::memcpy(ip.bytes.data(), &v4.s_addr, 4);
        return ip;
    }

    struct in6_addr v6{};
    if (inet_pton(AF_INET6, buf.c_str(), &v6) == 1) {
        ip.v6 = true;
        std::memcpy(ip.bytes.data(), v6.s6_addr, 16);
        return ip;
    }
    return std::nullopt;
}

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN]{};
    if (v6) {
        struct in6_addr addr{};
        std::memcpy(addr.s6_addr, bytes.data(), 16);
        if (inet_ntop(AF_INET6, &addr, buf, sizeof(buf)) == nullptr) {
            return {};
        }
    } else {
        struct in_addr addr{};
        std::memcpy(&addr.s_addr, bytes.data(), 4);
        if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) {
            return {};
        }
    }
    return buf;
}

std::optional<IpNetwork> IpNetwork::parse(std::string_view text) {
    const auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }

    auto address = IpAddress::parse(text.substr(0, slash));
    if (!address) {
        return std::nullopt;
    }

    const std::string_view prefix_str = text.substr(slash + 1);
    unsigned prefix = 0;
    const auto [ptr, ec] = std::from_chars(prefix_str.data(), prefix_str.data() + prefix_str.size(), prefix);
    if (prefix_str.empty() || ec != std::errc{} || ptr != prefix_str.data() + prefix_str.size()) {
        return std::nullopt;
    }
    const unsigned max_prefix = address->v6 ? 128u : 32u;
    if (prefix > max_prefix) {
        return std::nullopt;
    }

    // 호스트 비트 정규화 (10.1.2.3/8 → 10.0.0.0/8)
    const std::size_t width = address->v6 ? 16 : 4;
    for (std::size_t i = 0; i < width; ++i) {
        const unsigned bit_start = static_cast<unsigned>(i) * 8;
        if (bit_start >= prefix) {
            address->bytes[i] = 0;
        } else if (bit_start + 8 > prefix) {
            const unsigned keep = prefix - bit_start;
            address->bytes[i] &= static_cast<std::uint8_t>(0xFFu << (8 - keep));
        }
    }

    return IpNetwork{*address, static_cast<std::uint8_t>(prefix)};
}

bool IpNetwork::contains(const IpAddress& ip) const noexcept {
    if (ip.v6 != address.v6) {
        return false;
    }
    const unsigned full = prefix / 8;
    const unsigned rest = prefix % 8;
    for (unsigned i = 0; i < full; ++i) {
        if (ip.bytes[i] != address.bytes[i]) {
            return false;
        }
    }
    if (rest == 0) {
        return true;
    }
    const auto mask = static_cast<std::uint8_t>(0xFFu << (8 - rest));
    return (ip.bytes[full] & mask) == (address.bytes[full] & mask);
}

std::string IpNetwork::to_string() const {
    return fmt::format("{}/{}", address.to_string(), prefix);
}

// ---------------------------------------------------------------------------
// DomainName
// ---------------------------------------------------------------------------
std::optional<DomainName> DomainName::parse(std::string_view text) {
    std::string name = to_lower(text);
    if (!name.empty() && name.back() == '.') {
        name.pop_back();
    }
    if (name.empty() || name.size() > 253) {
        return std::nullopt;
    }

    std::size_t start = 0;
    while (start <= name.size()) {
        auto dot = name.find('.', start);
        if (dot == std::string::npos) {
            dot = name.size();
        }
        const std::string_view label{name.data() + start, dot - start};
        if (label.empty() || label.size() > 63 || label.front() == '-' || label.back() == '-') {
            return std::nullopt;
        }
        if (!std::all_of(label.begin(), label.end(), is_label_char)) {
            return std::nullopt;
        }
        start = dot + 1;
    }
    return DomainName{std::move(name)};
}

bool DomainName::is_subdomain_of(const DomainName& zone) const noexcept {
    if (name == zone.name) {
        return true;
    }
    if (name.size() <= zone.name.size()) {
        return false;
    }
    const std::size_t boundary = name.size() - zone.name.size() - 1;
    return name[boundary] == '.' && name.compare(boundary + 1, std::string::npos, zone.name) == 0;
}

// ---------------------------------------------------------------------------
// time (RFC 3339)
// ---------------------------------------------------------------------------
std::optional<TimePoint> parse_time(std::string_view s) {
    using namespace std::chrono;

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    if (!read_digits(s, 0, 4, y) || s.size() < 20 || s[4] != '-' ||
        !read_digits(s, 5, 2, mo) || s[7] != '-' ||
        !read_digits(s, 8, 2, d) || (s[10] != 'T' && s[10] != 't') ||
        !read_digits(s, 11, 2, h) || s[13] != ':' ||
        !read_digits(s, 14, 2, mi) || s[16] != ':' ||
        !read_digits(s, 17, 2, sec)) {
        return std::nullopt;
    }
    if (h > 23 || mi > 59 || sec > 59) {
        return std::nullopt;
    }

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    std::int64_t nanos = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (++digits > 9) {
                return std::nullopt;
            }
            nanos = nanos * 10 + (s[pos] - '0');
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (std::size_t i = digits; i < 9; ++i) {
            nanos *= 10;
        }
    }

    minutes offset{0};
    if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
        ++pos;
    } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        const int sign = s[pos] == '-' ? -1 : 1;
        int oh = 0, om = 0;
        if (!read_digits(s, pos + 1, 2, oh) || pos + 3 >= s.size() || s[pos + 3] != ':' ||
            !read_digits(s, pos + 4, 2, om) || oh > 23 || om > 59) {
            return std::nullopt;
        }
        offset = minutes{sign * (oh * 60 + om)};
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) {
        return std::nullopt;
    }

    // 초 단위 int64 는 0000~9999 년 전체를 overflow 없이 담는다
    const sys_seconds utc = sys_seconds{sys_days{ymd}} + hours{h} + minutes{mi} + seconds{sec} - offset;
    const int utc_year = static_cast<int>(year_month_day{floor<days>(utc)}.year());
    if (utc_year < 0 || utc_year > 9999) {
        return std::nullopt;
    }
    return TimePoint{utc, static_cast<std::int32_t>(nanos)};
}

std::string format_time(TimePoint tp) {
    using namespace std::chrono;

    const auto dp = floor<days>(tp.seconds);
    const year_month_day ymd{dp};
    const hh_mm_ss hms{tp.seconds - dp};

    std::string out = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                                  static_cast<int>(ymd.year()),
                                  static_cast<unsigned>(ymd.month()),
                                  static_cast<unsigned>(ymd.day()),
                                  hms.hours().count(),
                                  hms.minutes().count(),
                                  hms.seconds().count());
    const auto frac = tp.nanos;
    if (frac != 0) {
        std::string digits = fmt::format("{:09}", frac);
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        out += "." + digits;
    }
    out += "Z";
    return out;
}

// ---------------------------------------------------------------------------
// 스칼라 헬퍼
// ---------------------------------------------------------------------------
TypeKind scalar_kind(const ScalarValue& value) noexcept {
    switch (value.index()) {
        case 0: return TypeKind::kBoolean;
        case 1: return TypeKind::kString;
        case 2: return TypeKind::kInteger;
        case 3: return TypeKind::kFloat;
        case 4: return TypeKind::kAddress;
        case 5: return TypeKind::kNetwork;
        case 6: return TypeKind::kDomain;
        case 7: return TypeKind::kTime;
        default: return TypeKind::kUndefined;
    }
}

std::string scalar_to_string(const ScalarValue& value) {
    switch (value.index()) {
        case 0: return std::get<bool>(value) ? "true" : "false";
        case 1: return std::get<std::string>(value);
        case 2: return std::to_string(std::get<std::int64_t>(value));
        case 3: return fmt::format("{}", std::get<double>(value));
        case 4: return std::get<IpAddress>(value).to_string();
        case 5: return std::get<IpNetwork>(value).to_string();
        case 6: return std::get<DomainName>(value).name;
        case 7: return format_time(std::get<TimePoint>(value));
        default: return {};
    }
}

std::expected<ScalarValue, std::string> parse_scalar(TypeKind kind, std::string_view raw) {
    const auto fail = [&]() {
        return std::unexpected(fmt::format("expected {}, got '{}'", scalar_name(kind), raw));
    };

    switch (kind) {
        case TypeKind::kBoolean:
            if (iequals(raw, "true")) {
                return ScalarValue{true};
            }
            if (iequals(raw, "false")) {
                return ScalarValue{false};
            }
            return fail();

        case TypeKind::kString:
            return ScalarValue{std::string{raw}};

        case TypeKind::kInteger: {
            std::int64_t v = 0;
            const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), v);
            if (raw.empty() || ec != std::errc{} || ptr != raw.data() + raw.size()) {
                return fail();
            }
            return ScalarValue{v};
        }

        case TypeKind::kFloat: {
            double v = 0.0;
            const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), v);
            if (raw.empty() || ec != std::errc{} || ptr != raw.data() + raw.size() || !std::isfinite(v)) {
                return fail();
            }
            return ScalarValue{v};
        }

        case TypeKind::kAddress:
            if (auto ip = IpAddress::parse(raw)) {
                return ScalarValue{*ip};
            }
            return fail();

        case TypeKind::kNetwork:
            if (auto net = IpNetwork::parse(raw)) {
                return ScalarValue{*net};
            }
            return fail();

        case TypeKind::kDomain:
            if (auto dn = DomainName::parse(raw)) {
                return ScalarValue{std::move(*dn)};
            }
            return fail();

        case TypeKind::kTime:
            if (auto tp = parse_time(raw)) {
                return ScalarValue{*tp};
            }
            return fail();

        default:
            return std::unexpected(fmt::format("'{}' is not a scalar type", scalar_name(kind)));
    }
}

// ---------------------------------------------------------------------------
// AttributeValue
// ---------------------------------------------------------------------------
AttributeValue::AttributeValue(AttributeType type, ScalarValue scalar, std::vector<ScalarValue> items)
    : type_{type}
    , scalar_{std::move(scalar)}
    , items_{std::move(items)}
{}

AttributeValue AttributeValue::boolean(bool v)          { return from_scalar(v); }
AttributeValue AttributeValue::string(std::string v)    { return from_scalar(std::move(v)); }
AttributeValue AttributeValue::integer(std::int64_t v)  { return from_scalar(v); }
AttributeValue AttributeValue::floating(double v)       { return from_scalar(v); }
AttributeValue AttributeValue::address(IpAddress v)     { return from_scalar(v); }
AttributeValue AttributeValue::network(IpNetwork v)     { return from_scalar(v); }
AttributeValue AttributeValue::domain(DomainName v)     { return from_scalar(std::move(v)); }
AttributeValue AttributeValue::time(TimePoint v)        { return from_scalar(v); }

AttributeValue AttributeValue::from_scalar(ScalarValue v) {
    const AttributeType type = AttributeType::scalar(scalar_kind(v));
    return AttributeValue{type, std::move(v), {}};
}

std::expected<AttributeValue, std::string>
AttributeValue::collection(const AttributeType& type, std::vector<ScalarValue> items) {
    if (!type.is_collection() || !is_collection_element(type.element)) {
        return std::unexpected(fmt::format("'{}' is not a collection type", type.name()));
    }
    for (const auto& item : items) {
        if (scalar_kind(item) != type.element) {
            return std::unexpected(fmt::format("expected {} element, got {}",
                                               scalar_name(type.element),
                                               scalar_name(scalar_kind(item))));
        }
    }
    if (type.kind == TypeKind::kSet) {
        std::sort(items.begin(), items.end());
        items.erase(std::unique(items.begin(), items.end()), items.end());
    }
    return AttributeValue{type, ScalarValue{false}, std::move(items)};
}

std::expected<AttributeValue, std::string>
AttributeValue::coerce(const AttributeType& type, std::string_view raw) {
    if (type.is_collection()) {
        return std::unexpected(fmt::format("expected {}, got scalar '{}'", type.name(), raw));
    }
    auto scalar = parse_scalar(type.kind, raw);
    if (!scalar) {
        return std::unexpected(scalar.error());
    }
    return from_scalar(std::move(*scalar));
}

std::expected<AttributeValue, std::string>
AttributeValue::coerce(const AttributeType& type, const std::vector<std::string>& raw_items) {
    if (!type.is_collection()) {
        return std::unexpected(fmt::format("expected {}, got a list of {} items",
                                           type.name(), raw_items.size()));
    }
    std::vector<ScalarValue> items;
    items.reserve(raw_items.size());
    for (const auto& raw : raw_items) {
        auto scalar = parse_scalar(type.element, raw);
        if (!scalar) {
            return std::unexpected(fmt::format("{}: {}", type.name(), scalar.error()));
        }
        items.push_back(std::move(*scalar));
    }
    return collection(type, std::move(items));
}

bool AttributeValue::as_boolean() const               { return std::get<bool>(scalar_); }
const std::string& AttributeValue::as_string() const  { return std::get<std::string>(scalar_); }
std::int64_t AttributeValue::as_integer() const       { return std::get<std::int64_t>(scalar_); }
double AttributeValue::as_float() const               { return std::get<double>(scalar_); }
const IpAddress& AttributeValue::as_address() const   { return std::get<IpAddress>(scalar_); }
const IpNetwork& AttributeValue::as_network() const   { return std::get<IpNetwork>(scalar_); }
const DomainName& AttributeValue::as_domain() const   { return std::get<DomainName>(scalar_); }
TimePoint AttributeValue::as_time() const             { return std::get<TimePoint>(scalar_); }

std::string AttributeValue::to_string() const {
    if (type_.is_collection()) {
        return join_items(items_);
    }
    return scalar_to_string(scalar_);
}

// ---------------------------------------------------------------------------
// 타입별 연산
// ---------------------------------------------------------------------------
std::optional<int> compare_values(const AttributeValue& a, const AttributeValue& b) {
    if (a.type() != b.type() || a.type().is_collection() || !is_ordered(a.type().kind)) {
        return std::nullopt;
    }
    const auto& x = a.scalar();
    const auto& y = b.scalar();
    if (x < y) {
        return -1;
    }
    if (y < x) {
        return 1;
    }
    return 0;
}

bool value_contains(const AttributeValue& container, const AttributeValue& item) {
    const AttributeType& ct = container.type();
    const AttributeType& it = item.type();

    if (ct == kStringType && it == kStringType) {
        return container.as_string().find(item.as_string()) != std::string::npos;
    }
    if (ct == kNetworkType && it == kAddressType) {
        return container.as_network().contains(item.as_address());
    }
    if (ct.kind == TypeKind::kSet && ct.element == TypeKind::kNetwork && it == kAddressType) {
        const auto& ip = item.as_address();
        return std::any_of(container.items().begin(), container.items().end(),
                           [&](const ScalarValue& v) { return std::get<IpNetwork>(v).contains(ip); });
    }
    if (ct.is_collection() && !it.is_collection() && ct.element == it.kind) {
        if (ct.kind == TypeKind::kSet) {
            return std::binary_search(container.items().begin(), container.items().end(), item.scalar());
        }
        return list_has(container.items(), item.scalar());
    }
    return false;
}

AttributeValue intersect_values(const AttributeValue& a, const AttributeValue& b) {
    std::vector<ScalarValue> out;
    if (a.type().kind == TypeKind::kSet) {
        std::set_intersection(a.items().begin(), a.items().end(),
                              b.items().begin(), b.items().end(),
                              std::back_inserter(out));
    } else {
        for (const auto& v : a.items()) {
            if (list_has(b.items(), v)) {
                out.push_back(v);
            }
        }
    }
    // 원소 타입은 a 와 동일하므로 실패하지 않는다
    return *AttributeValue::collection(a.type(), std::move(out));
}

AttributeValue unite_values(const AttributeValue& a, const AttributeValue& b) {
    std::vector<ScalarValue> out;
    if (a.type().kind == TypeKind::kSet) {
        std::set_union(a.items().begin(), a.items().end(),
                       b.items().begin(), b.items().end(),
                       std::back_inserter(out));
    } else {
        // 왼쪽은 그대로, 오른쪽은 아직 결과에 없는 항목만 한 번씩 덧붙인다
        out = a.items();
        for (const auto& v : b.items()) {
            if (!list_has(out, v)) {
                out.push_back(v);
            }
        }
    }
    return *AttributeValue::collection(a.type(), std::move(out));
}
