#pragma once

// ---------------------------------------------------------------------------
// types.hpp
//
// 모든 레이어가 공유하는 기본 타입 (판정 결과, 오류 분류).
// 이 헤더는 프로젝트 내 다른 헤더에 의존하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// Effect
//   정책 평가 결과.
//   kIndeterminate 는 평가 중 오류를 의미하며 절대 kPermit 으로 취급하지 않는다.
//   호출자(전송 레이어)는 kIndeterminate 를 안전한 기본값(보통 Deny)으로 매핑한다.
// ---------------------------------------------------------------------------
enum class Effect : std::uint8_t {
    kPermit        = 0,
    kDeny          = 1,
    kNotApplicable = 2,
    kIndeterminate = 3,
};

// ---------------------------------------------------------------------------
// ErrorKind
//   오류 분류.
//   파싱 시점 (kSchemaError, kTypeError): 로드 전체 실패, 기존 트리 유지.
//   평가 시점 (나머지): 항상 kIndeterminate 판정으로 축소된다 (엔진 중단 없음).
// ---------------------------------------------------------------------------
enum class ErrorKind : std::uint8_t {
    kSchemaError     = 0,  // 알 수 없는 태그, 잘못된 구조
    kTypeError       = 1,  // 타입 불일치, 중복 id, 알 수 없는 알고리즘/함수
    kResolutionError = 2,  // 속성 없음 + 외부 해석 실패
    kFunctionError   = 3,  // 함수 런타임 전제조건 위반 (0 나누기 등)
    kAmbiguityError  = 4,  // only-one-applicable 에서 복수 적용
    kCancelled       = 5,  // 호출자가 평가를 중단함
    kNoPolicy        = 6,  // 게시된 정책 트리 없음
};

// ---------------------------------------------------------------------------
// PdpError
//   std::expected<T, PdpError> 패턴과 함께 사용하는 오류 정보.
//
//   path    : 파싱 오류 위치 (예: "policies.rules[2].condition")
//   line/column : 1-based 문서 위치. 알 수 없으면 0.
//   function: kFunctionError 를 발생시킨 함수 이름
// ---------------------------------------------------------------------------
struct PdpError {
    ErrorKind   kind{ErrorKind::kSchemaError};
    std::string message{};
    std::string path{};
    std::string function{};
    int         line{0};
    int         column{0};
};

[[nodiscard]] inline std::string_view effect_name(Effect effect) noexcept {
    switch (effect) {
        case Effect::kPermit:        return "Permit";
        case Effect::kDeny:          return "Deny";
        case Effect::kNotApplicable: return "NotApplicable";
        case Effect::kIndeterminate: return "Indeterminate";
    }
    return "Indeterminate";
}

[[nodiscard]] inline std::string_view error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::kSchemaError:     return "SchemaError";
        case ErrorKind::kTypeError:       return "TypeError";
        case ErrorKind::kResolutionError: return "ResolutionError";
        case ErrorKind::kFunctionError:   return "FunctionError";
        case ErrorKind::kAmbiguityError:  return "AmbiguityError";
        case ErrorKind::kCancelled:       return "Cancelled";
        case ErrorKind::kNoPolicy:        return "NoPolicy";
    }
    return "SchemaError";
}

// 사람이 읽을 수 있는 한 줄 요약 (로그/응답용)
[[nodiscard]] std::string describe(const PdpError& error);
