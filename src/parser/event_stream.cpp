// ---------------------------------------------------------------------------
// event_stream.cpp
// ---------------------------------------------------------------------------

#include "parser/event_stream.hpp"

#include <sstream>

#include <spdlog/spdlog.h>
#include <yaml-cpp/eventhandler.h>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/mark.h>
#include <yaml-cpp/parser.h>

namespace {

const Event kEndEvent{};

// ---------------------------------------------------------------------------
// EventRecorder
//   yaml-cpp 파서 콜백을 Event 로 옮겨 적는다.
// ---------------------------------------------------------------------------
class EventRecorder final : public YAML::EventHandler {
public:
    explicit EventRecorder(std::vector<Event>& out) : out_{out} {}

    void OnDocumentStart(const YAML::Mark& /*mark*/) override {}
    void OnDocumentEnd() override {}

    void OnNull(const YAML::Mark& mark, YAML::anchor_t /*anchor*/) override {
        push(EventKind::kNull, mark);
    }

    void OnAlias(const YAML::Mark& mark, YAML::anchor_t /*anchor*/) override {
        push(EventKind::kAlias, mark);
    }

    void OnScalar(const YAML::Mark& mark, const std::string& /*tag*/,
                  YAML::anchor_t /*anchor*/, const std::string& value) override {
        push(EventKind::kScalar, mark, value);
    }

    void OnSequenceStart(const YAML::Mark& mark, const std::string& /*tag*/,
                         YAML::anchor_t /*anchor*/, YAML::EmitterStyle::value /*style*/) override {
        push(EventKind::kSequenceStart, mark);
    }

    void OnSequenceEnd() override { push(EventKind::kSequenceEnd, last_mark_); }

    void OnMapStart(const YAML::Mark& mark, const std::string& /*tag*/,
                    YAML::anchor_t /*anchor*/, YAML::EmitterStyle::value /*style*/) override {
        push(EventKind::kMapStart, mark);
    }

    void OnMapEnd() override { push(EventKind::kMapEnd, last_mark_); }

private:
    void push(EventKind kind, const YAML::Mark& mark, std::string value = {}) {
        last_mark_ = mark;
        out_.push_back(Event{kind, std::move(value), mark.line + 1, mark.column + 1});
    }

    std::vector<Event>& out_;
    YAML::Mark          last_mark_{};
};

}  // namespace

std::string_view event_kind_name(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::kScalar:        return "scalar";
        case EventKind::kNull:          return "null";
        case EventKind::kSequenceStart: return "sequence";
        case EventKind::kSequenceEnd:   return "end of sequence";
        case EventKind::kMapStart:      return "object";
        case EventKind::kMapEnd:        return "end of object";
        case EventKind::kAlias:         return "alias";
        case EventKind::kEnd:           return "end of document";
    }
    return "end of document";
}

EventStream::EventStream(std::vector<Event> events)
    : events_{std::move(events)}
{}

std::expected<EventStream, PdpError> EventStream::read(std::string_view document) {
    std::vector<Event> events;
    std::istringstream input{std::string{document}};

    try {
        YAML::Parser parser(input);
        EventRecorder recorder(events);

        if (!parser.HandleNextDocument(recorder)) {
            return std::unexpected(PdpError{
                .kind    = ErrorKind::kSchemaError,
                .message = "empty document",
            });
        }

        std::vector<Event> extra;
        EventRecorder extra_recorder(extra);
        if (parser.HandleNextDocument(extra_recorder)) {
            const int line = extra.empty() ? 0 : extra.front().line;
            return std::unexpected(PdpError{
                .kind    = ErrorKind::kSchemaError,
                .message = "expected a single document",
                .line    = line,
                .column  = 1,
            });
        }
    } catch (const YAML::ParserException& e) {
        return std::unexpected(PdpError{
            .kind    = ErrorKind::kSchemaError,
            .message = e.msg,
            .line    = e.mark.line + 1,
            .column  = e.mark.column + 1,
        });
    } catch (const YAML::Exception& e) {
        return std::unexpected(PdpError{
            .kind    = ErrorKind::kSchemaError,
            .message = e.what(),
        });
    }

    spdlog::debug("[event_stream] recorded {} events", events.size());
    return EventStream{std::move(events)};
}

const Event& EventStream::peek(std::size_t offset) const noexcept {
    const std::size_t at = pos_ + offset;
    return at < events_.size() ? events_[at] : kEndEvent;
}

const Event& EventStream::next() noexcept {
    if (pos_ >= events_.size()) {
        return kEndEvent;
    }
    return events_[pos_++];
}

const Event& EventStream::last() const noexcept {
    if (events_.empty()) {
        return kEndEvent;
    }
    return pos_ == 0 ? events_.front() : events_[pos_ - 1];
}
