// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// 레코드 본문은 yaml-cpp Emitter (flow + 큰따옴표) 로 만든다.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

// ISO8601 UTC, 밀리초 ("2024-01-02T03:04:05.123Z")
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto since_epoch = tp.time_since_epoch();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch) -
                        std::chrono::duration_cast<std::chrono::seconds>(since_epoch);

    const std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    std::tm           utc{};
    gmtime_r(&secs, &utc);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", utc, millis.count());
}

// 한 줄 JSON 레코드. 문자열 이스케이프는 Emitter 가 처리한다.
class JsonRecord {
public:
    explicit JsonRecord(std::string_view event) {
        out_.SetMapFormat(YAML::Flow);
        out_.SetSeqFormat(YAML::Flow);
        out_.SetStringFormat(YAML::DoubleQuoted);
        out_ << YAML::BeginMap;
        field("event", std::string{event});
    }

    template <typename T>
    JsonRecord& field(std::string_view key, const T& value) {
        out_ << YAML::Key << std::string{key} << YAML::Value << value;
        return *this;
    }

    JsonRecord& list(std::string_view key, const std::vector<std::string>& items) {
        out_ << YAML::Key << std::string{key} << YAML::Value << YAML::BeginSeq;
        for (const auto& item : items) {
            out_ << item;
        }
        out_ << YAML::EndSeq;
        return *this;
    }

    [[nodiscard]] std::string str() {
        out_ << YAML::EndMap;
        return out_.c_str();
    }

private:
    YAML::Emitter out_;
};

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

}  // namespace

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        // 레지스트리에 등록하지 않는다 (인스턴스마다 독립)
        logger_ = std::make_shared<spdlog::logger>("pdpgate.audit", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 타임스탬프만 접두. JSON 본문은 각 메서드가 만든다.
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ != nullptr && static_cast<int>(min_level_) <= static_cast<int>(level);
}

// ---------------------------------------------------------------------------
// log_decision
// ---------------------------------------------------------------------------
void StructuredLogger::log_decision(const DecisionLog& entry) {
    const LogLevel level = entry.effect == Effect::kIndeterminate ? LogLevel::kWarn : LogLevel::kInfo;
    if (!enabled(level)) {
        return;
    }

    JsonRecord record{"decision"};
    record.field("request_id", entry.request_id)
          .field("effect", std::string{effect_name(entry.effect)})
          .field("generation", entry.generation)
          .field("attribute_count", entry.attribute_count)
          .list("obligations", entry.obligations);
    if (!entry.reason.empty()) {
        record.field("reason", entry.reason);
    }
    record.field("timestamp", format_iso8601(entry.timestamp))
          .field("duration_us", static_cast<std::int64_t>(entry.duration.count()));

    if (level == LogLevel::kWarn) {
        logger_->warn(record.str());
    } else {
        logger_->info(record.str());
    }
}

// ---------------------------------------------------------------------------
// log_reload
// ---------------------------------------------------------------------------
void StructuredLogger::log_reload(const ReloadLog& entry) {
    const LogLevel level = entry.success ? LogLevel::kInfo : LogLevel::kError;
    if (!enabled(level)) {
        return;
    }

    JsonRecord record{"policy_reload"};
    record.field("trigger", entry.trigger)
          .field("path", entry.path)
          .field("success", entry.success)
          .field("generation", entry.generation);
    if (!entry.error.empty()) {
        record.field("error", entry.error);
    }
    record.field("timestamp", format_iso8601(entry.timestamp));

    if (entry.success) {
        logger_->info(record.str());
    } else {
        logger_->error(record.str());
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
