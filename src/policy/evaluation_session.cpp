// ---------------------------------------------------------------------------
// evaluation_session.cpp
// ---------------------------------------------------------------------------

#include "policy/evaluation_session.hpp"

#include <spdlog/spdlog.h>

namespace {

PdpError resolution_error(std::string message) {
    return PdpError{
        .kind    = ErrorKind::kResolutionError,
        .message = std::move(message),
    };
}

}  // namespace

// ---------------------------------------------------------------------------
// Request
// ---------------------------------------------------------------------------
void Request::add(std::string id, AttributeValue value) {
    attributes_.insert_or_assign(std::move(id), std::move(value));
}

const AttributeValue* Request::find(std::string_view id) const {
    const auto it = attributes_.find(id);
    return it == attributes_.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// EvaluationSession
// ---------------------------------------------------------------------------
EvaluationSession::EvaluationSession(const Request&           request,
                                     AttributeResolver*       resolver,
                                     const CancellationToken* cancel)
    : request_{request}
    , resolver_{resolver}
    , cancel_{cancel}
{}

bool EvaluationSession::cancelled() const noexcept {
    return cancel_ != nullptr && cancel_->cancelled();
}

PdpError EvaluationSession::cancelled_error(std::string_view id) const {
    return PdpError{
        .kind    = ErrorKind::kCancelled,
        .message = fmt::format("evaluation cancelled while resolving '{}'", id),
    };
}

std::expected<AttributeValue, PdpError>
EvaluationSession::resolve(std::string_view id, const AttributeType& type) {
    if (const AttributeValue* value = request_.find(id)) {
        if (value->type() != type) {
            return std::unexpected(resolution_error(
                fmt::format("attribute '{}' is {}, expected {}",
                            id, value->type().name(), type.name())));
        }
        return *value;
    }

    if (const auto it = cache_.find(id); it != cache_.end()) {
        return it->second;
    }

    if (resolver_ == nullptr) {
        return std::unexpected(resolution_error(fmt::format("attribute '{}' not found", id)));
    }

    if (cancelled()) {
        return std::unexpected(cancelled_error(id));
    }

    ++resolver_calls_;
    auto resolved = resolver_->resolve(id, type, request_);

    if (cancelled()) {
        return std::unexpected(cancelled_error(id));
    }

    CachedResult result = [&]() -> CachedResult {
        if (!resolved) {
            spdlog::debug("[session] resolver failed for '{}': {}", id, resolved.error());
            return std::unexpected(resolution_error(
                fmt::format("resolver failed for '{}': {}", id, resolved.error())));
        }
        if (!resolved->has_value()) {
            return std::unexpected(resolution_error(fmt::format("attribute '{}' not found", id)));
        }
        if ((*resolved)->type() != type) {
            return std::unexpected(resolution_error(
                fmt::format("resolver returned {} for '{}', expected {}",
                            (*resolved)->type().name(), id, type.name())));
        }
        return std::move(**resolved);
    }();

    const auto it = cache_.emplace(std::string{id}, std::move(result)).first;
    return it->second;
}
