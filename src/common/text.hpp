#pragma once

// ---------------------------------------------------------------------------
// text.hpp
//
// 문서 태그/함수 이름/타입 이름 비교에 쓰는 ASCII 대소문자 무관 헬퍼.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

[[nodiscard]] inline std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}
