// ---------------------------------------------------------------------------
// request_parser.cpp
// ---------------------------------------------------------------------------

#include "parser/request_parser.hpp"

#include "common/text.hpp"

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

PdpError request_error(ErrorKind kind, std::string message, std::string path = {}) {
    return PdpError{
        .kind    = kind,
        .message = std::move(message),
        .path    = std::move(path),
    };
}

std::expected<AttributeValue, PdpError> decode_attribute(const std::string& id, const YAML::Node& entry) {
    if (!entry.IsMap()) {
        return std::unexpected(request_error(ErrorKind::kSchemaError,
                                             "attribute must be an object with 'type' and 'value'", id));
    }

    YAML::Node type_node;
    YAML::Node value_node;
    for (const auto& kv : entry) {
        const std::string key = kv.first.as<std::string>();
        if (iequals(key, "type")) {
            type_node = kv.second;
        } else if (iequals(key, "value")) {
            value_node = kv.second;
        } else {
            return std::unexpected(request_error(ErrorKind::kSchemaError,
                                                 fmt::format("unknown key '{}' in attribute", key), id));
        }
    }
    if (!type_node || !type_node.IsScalar()) {
        return std::unexpected(request_error(ErrorKind::kSchemaError, "attribute is missing 'type'", id));
    }
    if (!value_node || value_node.IsNull() || value_node.IsMap()) {
        return std::unexpected(request_error(ErrorKind::kSchemaError, "attribute is missing 'value'", id));
    }

    auto type = parse_attribute_type(type_node.as<std::string>());
    if (!type) {
        return std::unexpected(request_error(ErrorKind::kTypeError, type.error(), id));
    }

    std::expected<AttributeValue, std::string> value = [&]() {
        if (value_node.IsSequence()) {
            std::vector<std::string> items;
            for (const auto& item : value_node) {
                if (!item.IsScalar()) {
                    return std::expected<AttributeValue, std::string>(
                        std::unexpect, "collection items must be scalars");
                }
                items.push_back(item.as<std::string>());
            }
            return AttributeValue::coerce(*type, items);
        }
        return AttributeValue::coerce(*type, value_node.as<std::string>());
    }();
    if (!value) {
        return std::unexpected(request_error(ErrorKind::kTypeError, value.error(), id));
    }
    return std::move(*value);
}

}  // namespace

std::expected<Request, PdpError> RequestParser::from_node(const YAML::Node& attributes) {
    Request request;
    if (!attributes || attributes.IsNull()) {
        return request;
    }
    if (!attributes.IsMap()) {
        return std::unexpected(request_error(ErrorKind::kSchemaError, "request must be an object"));
    }

    try {
        for (const auto& kv : attributes) {
            const std::string id = kv.first.as<std::string>();
            auto value = decode_attribute(id, kv.second);
            if (!value) {
                return std::unexpected(std::move(value.error()));
            }
            request.add(id, std::move(*value));
        }
    } catch (const YAML::Exception& e) {
        return std::unexpected(request_error(ErrorKind::kSchemaError, e.what()));
    }
    return request;
}

std::expected<Request, PdpError> RequestParser::parse(std::string_view document) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{document});
    } catch (const YAML::ParserException& e) {
        return std::unexpected(PdpError{
            .kind    = ErrorKind::kSchemaError,
            .message = e.msg,
            .line    = e.mark.line + 1,
            .column  = e.mark.column + 1,
        });
    } catch (const YAML::Exception& e) {
        return std::unexpected(request_error(ErrorKind::kSchemaError, e.what()));
    }
    return from_node(root);
}
