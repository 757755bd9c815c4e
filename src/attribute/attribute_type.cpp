// ---------------------------------------------------------------------------
// attribute_type.cpp
// ---------------------------------------------------------------------------

#include "attribute/attribute_type.hpp"

#include "common/text.hpp"

#include <array>

#include <spdlog/spdlog.h>

namespace {

struct ScalarEntry {
    TypeKind         kind;
    std::string_view singular;
    std::string_view plural;
};

// 이름 조회 테이블 (단수/복수)
constexpr std::array<ScalarEntry, 8> kScalars{{
    {TypeKind::kBoolean, "boolean", "booleans"},
    {TypeKind::kString,  "string",  "strings"},
    {TypeKind::kInteger, "integer", "integers"},
    {TypeKind::kFloat,   "float",   "floats"},
    {TypeKind::kAddress, "address", "addresses"},
    {TypeKind::kNetwork, "network", "networks"},
    {TypeKind::kDomain,  "domain",  "domains"},
    {TypeKind::kTime,    "time",    "times"},
}};

const ScalarEntry* find_scalar(std::string_view name) {
    for (const auto& entry : kScalars) {
        if (iequals(name, entry.singular) || iequals(name, entry.plural)) {
            return &entry;
        }
    }
    return nullptr;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

bool is_collection_element(TypeKind kind) noexcept {
    switch (kind) {
        case TypeKind::kString:
        case TypeKind::kInteger:
        case TypeKind::kFloat:
        case TypeKind::kAddress:
        case TypeKind::kNetwork:
        case TypeKind::kDomain:
        case TypeKind::kTime:
            return true;
        default:
            return false;
    }
}

bool is_ordered(TypeKind kind) noexcept {
    return kind == TypeKind::kInteger || kind == TypeKind::kFloat ||
           kind == TypeKind::kString  || kind == TypeKind::kTime;
}

std::string_view scalar_name(TypeKind kind) noexcept {
    for (const auto& entry : kScalars) {
        if (entry.kind == kind) {
            return entry.singular;
        }
    }
    return "undefined";
}

std::string AttributeType::name() const {
    if (kind == TypeKind::kSet || kind == TypeKind::kList) {
        for (const auto& entry : kScalars) {
            if (entry.kind == element) {
                return fmt::format("{} of {}", kind == TypeKind::kSet ? "set" : "list",
                                   entry.plural);
            }
        }
        return "undefined";
    }
    return std::string{scalar_name(kind)};
}

std::expected<AttributeType, std::string> parse_attribute_type(std::string_view name) {
    const std::string_view text = trim(name);

    if (const auto* entry = find_scalar(text)) {
        return AttributeType::scalar(entry->kind);
    }

    // "set of X" / "list of X"
    const auto space = text.find(' ');
    if (space != std::string_view::npos) {
        const std::string_view head = text.substr(0, space);
        std::string_view rest = trim(text.substr(space + 1));
        const bool is_set  = iequals(head, "set");
        const bool is_list = iequals(head, "list");
        if ((is_set || is_list) && rest.size() > 3 && iequals(rest.substr(0, 3), "of ")) {
            rest = trim(rest.substr(3));
            const auto* elem = find_scalar(rest);
            if (elem == nullptr) {
                return std::unexpected(fmt::format("unknown element type '{}' in '{}'", rest, text));
            }
            if (!is_collection_element(elem->kind)) {
                return std::unexpected(
                    fmt::format("'{}' cannot be a collection element type", elem->singular));
            }
            return is_set ? AttributeType::set_of(elem->kind) : AttributeType::list_of(elem->kind);
        }
    }

    return std::unexpected(fmt::format("unknown attribute type '{}'", text));
}
