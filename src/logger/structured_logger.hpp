#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 한 줄 = 하나의 JSON 객체. 필드명은 snake_case.
// - 정상 판정 / 로드 성공은 info, Indeterminate 판정은 warn,
//   로드 실패는 error 레벨로 기록한다.
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// StructuredLogger
//   DecisionLog / ReloadLog 를 JSON 으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
//
//   [스레드 안전성] 모든 메서드는 동시에 호출할 수 있다 (spdlog _mt 싱크).
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (상위 디렉터리는 자동 생성)
    //   실패: std::runtime_error (싱크 생성 실패)
    StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path);

    ~StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    void log_decision(const DecisionLog& entry);

    void log_reload(const ReloadLog& entry);

    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

private:
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
