#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사 로그 (structured JSON) 레코드 타입.
//
// [민감정보 취급 주의]
// - 요청 속성 값은 기록하지 않는다. 개수만 남긴다.
// - reason 은 운영자용 진단 문자열이다. 클라이언트에 그대로 노출하지 말 것.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. 환경변수 PDP_LOG_LEVEL 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// DecisionLog
//   판정 한 건.
//   obligations: 해석된 의무의 속성 id 목록 (값은 기록하지 않음)
//   reason     : effect 가 kIndeterminate 일 때 describe(DecisionReason)
// ---------------------------------------------------------------------------
struct DecisionLog {
    std::uint64_t                              request_id{0};
    Effect                                     effect{Effect::kIndeterminate};
    std::uint64_t                              generation{0};
    std::size_t                                attribute_count{0};
    std::vector<std::string>                   obligations{};
    std::string                                reason{};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};   // 평가 소요 시간
};

// ---------------------------------------------------------------------------
// ReloadLog
//   정책 로드 시도 한 건.
//   trigger: "startup" | "sighup" | "command"
//   generation: 성공 시 새 generation, 실패 시 계속 서비스 중인 generation
// ---------------------------------------------------------------------------
struct ReloadLog {
    std::string                                trigger{};
    std::string                                path{};
    bool                                       success{false};
    std::uint64_t                              generation{0};
    std::string                                error{};
    std::chrono::system_clock::time_point      timestamp{};
};
