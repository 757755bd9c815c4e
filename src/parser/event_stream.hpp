#pragma once

// ---------------------------------------------------------------------------
// event_stream.hpp
//
// yaml-cpp 이벤트 (scalar / map / sequence 시작·끝) 를 평평한 토큰 열로 기록한다.
// YAML::Node 트리를 만들지 않고, DocumentParser 가 이 토큰 열을 앞에서부터
// 한 번만 읽으며 정책 트리를 직접 만든다.
//
// [설계 원칙]
// - JSON 은 YAML flow 문법으로 그대로 받아들인다.
// - 문서는 정확히 하나여야 한다. 0개 / 2개 이상은 kSchemaError.
// - alias (*ref) 는 토큰으로 남기고 디코더가 거부한다.
// - line / column 은 1-based 로 저장한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

enum class EventKind : std::uint8_t {
    kScalar        = 0,
    kNull          = 1,
    kSequenceStart = 2,
    kSequenceEnd   = 3,
    kMapStart      = 4,
    kMapEnd        = 5,
    kAlias         = 6,
    kEnd           = 7,  // 스트림 끝 표식
};

[[nodiscard]] std::string_view event_kind_name(EventKind kind) noexcept;

struct Event {
    EventKind   kind{EventKind::kEnd};
    std::string value{};   // kScalar 일 때만
    int         line{0};
    int         column{0};
};

// ---------------------------------------------------------------------------
// EventStream
//   read() 이후 읽기 전용 커서.
//   끝을 지나 읽으면 kEnd 이벤트를 계속 돌려준다.
// ---------------------------------------------------------------------------
class EventStream {
public:
    // read
    //   document 의 이벤트를 기록한다.
    //   실패: YAML 문법 오류 (line/column 포함), 빈 입력, 복수 문서.
    [[nodiscard]] static std::expected<EventStream, PdpError> read(std::string_view document);

    [[nodiscard]] const Event& peek(std::size_t offset = 0) const noexcept;
    const Event& next() noexcept;

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= events_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }

    // 마지막으로 소비한 이벤트 (없으면 첫 이벤트)
    [[nodiscard]] const Event& last() const noexcept;

private:
    explicit EventStream(std::vector<Event> events);

    std::vector<Event> events_;
    std::size_t        pos_{0};
};
