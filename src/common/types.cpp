// ---------------------------------------------------------------------------
// types.cpp
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <spdlog/spdlog.h>

std::string describe(const PdpError& error) {
    std::string out = fmt::format("{}: {}", error_kind_name(error.kind), error.message);
    if (!error.function.empty()) {
        out += fmt::format(" (function '{}')", error.function);
    }
    if (!error.path.empty()) {
        out += fmt::format(" at '{}'", error.path);
    }
    if (error.line > 0) {
        out += fmt::format(" [line {}, col {}]", error.line, error.column);
    }
    return out;
}
