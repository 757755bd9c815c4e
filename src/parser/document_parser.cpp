// ---------------------------------------------------------------------------
// document_parser.cpp
//
// EventStream 을 재귀 하강으로 디코딩한다.
//
// [오류 처리]
// 디코더 내부에서는 DecodeError 를 던지고 parse() 경계에서
// std::unexpected(PdpError) 로 바꾼다. DecodeError 는 이 파일 밖으로
// 나가지 않는다.
//
// [검증 항목]
// - 속성은 사용 전에 선언, 재선언 금지
// - 노드는 rules / policies 중 정확히 하나
// - 필수 키: 컨테이너 id, alg / 규칙 id, effect
// - 형제 id 유일성
// - target / condition / and / or / not 피연산자는 boolean
// - 함수 오버로드 해석, 의무 식 타입 == 선언 타입
// - 매퍼 selector 타입, default / error 자식 존재
// ---------------------------------------------------------------------------

#include "parser/document_parser.hpp"

#include "common/text.hpp"
#include "expression/function_registry.hpp"
#include "parser/event_stream.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

struct DecodeError {
    PdpError error;
};

// ---------------------------------------------------------------------------
// 디코딩 중간 상태 (draft)
// ---------------------------------------------------------------------------
struct RootDraft {
    bool       has_root{false};
    PolicyNode root{};
};

struct AlgorithmDraft {
    AlgorithmKind               kind{AlgorithmKind::kFirstApplicable};
    std::unique_ptr<MapperSpec> mapper{};
};

struct MapperDraft {
    std::optional<std::string> id{};
    MapperSpec                 spec{};
};

struct NodeDraft {
    std::optional<std::string>             id{};
    std::optional<AlgorithmDraft>          algorithm{};
    Target                                 target{};
    std::optional<std::vector<Rule>>       rules{};
    std::optional<std::vector<PolicyNode>> policies{};
    std::vector<Obligation>                obligations{};
};

struct RuleDraft {
    std::optional<std::string> id{};
    std::optional<Effect>      effect{};
    Target                     target{};
    ExpressionPtr              condition{};
    std::vector<Obligation>    obligations{};
};

struct LiteralDraft {
    std::optional<AttributeType>            type{};
    std::optional<std::string>              scalar{};
    std::optional<std::vector<std::string>> items{};
};

// ---------------------------------------------------------------------------
// Decoder
// ---------------------------------------------------------------------------
class Decoder {
public:
    explicit Decoder(EventStream& events) : events_{events} {}

    std::shared_ptr<PolicyTree> decode_document();

private:
    template <typename Draft>
    struct Field {
        std::string_view tag;
        void (Decoder::*decode)(Draft&);
    };

    class PathScope {
    public:
        PathScope(Decoder& decoder, std::string segment) : decoder_{decoder} {
            decoder_.path_.push_back(std::move(segment));
        }
        ~PathScope() { decoder_.path_.pop_back(); }

        PathScope(const PathScope&)            = delete;
        PathScope& operator=(const PathScope&) = delete;

    private:
        Decoder& decoder_;
    };

    // --- 공통 ---
    [[noreturn]] void fail(ErrorKind kind, std::string message) const;
    [[nodiscard]] std::string current_path() const;

    const Event& expect(EventKind kind, std::string_view what);
    std::string  expect_scalar(std::string_view what);
    bool         is_tagged_map(std::string_view tag) const;

    template <typename Draft, std::size_t N>
    void decode_object(Draft& draft, const std::array<Field<Draft>, N>& fields, std::string_view what);

    template <typename Fn>
    void decode_sequence(std::string_view what, Fn&& item);

    // --- 루트 ---
    void decode_attributes(RootDraft& draft);
    void decode_root_policies(RootDraft& draft);

    // --- 노드 ---
    PolicyNode decode_node();
    void decode_algorithm(NodeDraft& draft);
    void decode_rules(NodeDraft& draft);
    void decode_children(NodeDraft& draft);
    CombiningAlgorithm finish_algorithm(AlgorithmDraft draft, const std::string& node,
                                        const std::vector<std::string>& child_ids);

    void decode_mapper_id(MapperDraft& draft);
    void decode_mapper_selector(MapperDraft& draft);
    void decode_mapper_algorithm(MapperDraft& draft);
    void decode_mapper_default(MapperDraft& draft);
    void decode_mapper_error(MapperDraft& draft);
    void decode_mapper_nomatch(MapperDraft& draft);

    // --- 규칙 ---
    Rule decode_rule();
    void decode_effect(RuleDraft& draft);
    void decode_condition(RuleDraft& draft);

    // --- 노드 / 규칙 공통 필드 ---
    template <typename Draft>
    void decode_id_field(Draft& draft);
    template <typename Draft>
    void decode_target_field(Draft& draft);
    template <typename Draft>
    void decode_obligations_field(Draft& draft);

    Target                  decode_target();
    ExpressionPtr           decode_match();
    std::vector<Obligation> decode_obligations();

    // --- 식 ---
    ExpressionPtr decode_expression();
    ExpressionPtr decode_designator();
    ExpressionPtr decode_literal();
    ExpressionPtr decode_call(const std::string& name);
    void decode_literal_type(LiteralDraft& draft);
    void decode_literal_content(LiteralDraft& draft);

    [[nodiscard]] AttributeType declared_type(const std::string& id) const;

    EventStream&                                       events_;
    std::vector<std::string>                           path_{};
    std::map<std::string, AttributeType, std::less<>>  attributes_{};
    std::shared_ptr<PolicyTree>                        tree_{};
};

// ---------------------------------------------------------------------------
// 공통
// ---------------------------------------------------------------------------
void Decoder::fail(ErrorKind kind, std::string message) const {
    const Event& at = events_.last();
    throw DecodeError{PdpError{kind, std::move(message), current_path(), {}, at.line, at.column}};
}

std::string Decoder::current_path() const {
    std::string out;
    for (const auto& segment : path_) {
        if (!out.empty() && segment.front() != '[') {
            out += '.';
        }
        out += segment;
    }
    return out;
}

const Event& Decoder::expect(EventKind kind, std::string_view what) {
    const Event& event = events_.next();
    if (event.kind == EventKind::kAlias) {
        fail(ErrorKind::kSchemaError, "YAML aliases are not supported");
    }
    if (event.kind != kind) {
        fail(ErrorKind::kSchemaError, fmt::format("expected {} for {}, got {}",
                                                  event_kind_name(kind), what,
                                                  event_kind_name(event.kind)));
    }
    return event;
}

std::string Decoder::expect_scalar(std::string_view what) {
    return expect(EventKind::kScalar, what).value;
}

bool Decoder::is_tagged_map(std::string_view tag) const {
    return events_.peek(0).kind == EventKind::kMapStart &&
           events_.peek(1).kind == EventKind::kScalar &&
           iequals(events_.peek(1).value, tag);
}

template <typename Draft, std::size_t N>
void Decoder::decode_object(Draft& draft, const std::array<Field<Draft>, N>& fields,
                            std::string_view what) {
    expect(EventKind::kMapStart, what);

    std::array<bool, N> seen{};
    while (events_.peek().kind != EventKind::kMapEnd && events_.peek().kind != EventKind::kEnd) {
        const std::string key = expect_scalar(fmt::format("key in {}", what));

        const auto it = std::find_if(fields.begin(), fields.end(),
                                     [&](const Field<Draft>& f) { return iequals(f.tag, key); });
        if (it == fields.end()) {
            fail(ErrorKind::kSchemaError, fmt::format("unknown key '{}' in {}", key, what));
        }
        const auto index = static_cast<std::size_t>(it - fields.begin());
        if (seen[index]) {
            fail(ErrorKind::kSchemaError, fmt::format("duplicate key '{}' in {}", key, what));
        }
        seen[index] = true;

        PathScope scope(*this, std::string{it->tag});
        (this->*(it->decode))(draft);
    }
    expect(EventKind::kMapEnd, what);
}

template <typename Fn>
void Decoder::decode_sequence(std::string_view what, Fn&& item) {
    expect(EventKind::kSequenceStart, what);
    for (std::size_t index = 0;
         events_.peek().kind != EventKind::kSequenceEnd && events_.peek().kind != EventKind::kEnd;
         ++index) {
        PathScope scope(*this, fmt::format("[{}]", index));
        item();
    }
    expect(EventKind::kSequenceEnd, what);
}

AttributeType Decoder::declared_type(const std::string& id) const {
    const auto it = attributes_.find(id);
    if (it == attributes_.end()) {
        fail(ErrorKind::kTypeError, fmt::format("undeclared attribute '{}'", id));
    }
    return it->second;
}

// ---------------------------------------------------------------------------
// 루트
// ---------------------------------------------------------------------------
std::shared_ptr<PolicyTree> Decoder::decode_document() {
    static constexpr std::array<Field<RootDraft>, 2> kFields{{
        {"attributes", &Decoder::decode_attributes},
        {"policies",   &Decoder::decode_root_policies},
    }};

    tree_ = std::make_shared<PolicyTree>();

    RootDraft draft;
    decode_object(draft, kFields, "document");
    if (!draft.has_root) {
        fail(ErrorKind::kSchemaError, "document is missing 'policies'");
    }

    tree_->root = std::move(draft.root);
    return std::move(tree_);
}

void Decoder::decode_attributes(RootDraft& /*draft*/) {
    expect(EventKind::kMapStart, "attributes");
    while (events_.peek().kind != EventKind::kMapEnd && events_.peek().kind != EventKind::kEnd) {
        const std::string id = expect_scalar("attribute id");
        PathScope scope(*this, id);

        const std::string type_name = expect_scalar("attribute type");
        if (attributes_.contains(id)) {
            fail(ErrorKind::kTypeError, fmt::format("attribute '{}' declared twice", id));
        }
        auto type = parse_attribute_type(type_name);
        if (!type) {
            fail(ErrorKind::kTypeError, type.error());
        }
        attributes_.emplace(id, *type);
        tree_->attributes.emplace_back(id, *type);
    }
    expect(EventKind::kMapEnd, "attributes");
}

void Decoder::decode_root_policies(RootDraft& draft) {
    draft.root     = decode_node();
    draft.has_root = true;
}

// ---------------------------------------------------------------------------
// 노드
// ---------------------------------------------------------------------------
PolicyNode Decoder::decode_node() {
    static constexpr std::array<Field<NodeDraft>, 6> kFields{{
        {"id",          &Decoder::decode_id_field<NodeDraft>},
        {"alg",         &Decoder::decode_algorithm},
        {"target",      &Decoder::decode_target_field<NodeDraft>},
        {"rules",       &Decoder::decode_rules},
        {"policies",    &Decoder::decode_children},
        {"obligations", &Decoder::decode_obligations_field<NodeDraft>},
    }};

    NodeDraft draft;
    decode_object(draft, kFields, "policy");

    if (!draft.id) {
        fail(ErrorKind::kSchemaError, "policy is missing 'id'");
    }
    const std::string& id = *draft.id;
    if (draft.rules && draft.policies) {
        fail(ErrorKind::kSchemaError, fmt::format("'{}' has both 'rules' and 'policies'", id));
    }
    if (!draft.rules && !draft.policies) {
        fail(ErrorKind::kSchemaError, fmt::format("'{}' needs 'rules' or 'policies'", id));
    }
    if (!draft.algorithm) {
        fail(ErrorKind::kSchemaError, fmt::format("'{}' is missing 'alg'", id));
    }

    std::vector<std::string> child_ids;
    if (draft.rules) {
        for (const auto& rule : *draft.rules) {
            child_ids.push_back(rule.id);
        }
    } else {
        for (const auto& child : *draft.policies) {
            child_ids.push_back(node_id(child));
        }
    }
    CombiningAlgorithm algorithm = finish_algorithm(std::move(*draft.algorithm), id, child_ids);

    if (draft.rules) {
        return PolicyNode{Policy{
            std::move(*draft.id),
            std::move(draft.target),
            std::move(algorithm),
            std::move(*draft.rules),
            std::move(draft.obligations),
        }};
    }
    return PolicyNode{PolicySet{
        std::move(*draft.id),
        std::move(draft.target),
        std::move(algorithm),
        std::move(*draft.policies),
        std::move(draft.obligations),
    }};
}

void Decoder::decode_rules(NodeDraft& draft) {
    std::vector<Rule> rules;
    decode_sequence("rules", [&]() {
        Rule rule = decode_rule();
        const bool duplicate = std::any_of(rules.begin(), rules.end(),
                                           [&](const Rule& r) { return r.id == rule.id; });
        if (duplicate) {
            fail(ErrorKind::kTypeError, fmt::format("duplicate rule id '{}'", rule.id));
        }
        rules.push_back(std::move(rule));
    });
    draft.rules = std::move(rules);
}

void Decoder::decode_children(NodeDraft& draft) {
    std::vector<PolicyNode> children;
    decode_sequence("policies", [&]() {
        PolicyNode child = decode_node();
        const std::string& id = node_id(child);
        const bool duplicate = std::any_of(children.begin(), children.end(),
                                           [&](const PolicyNode& n) { return node_id(n) == id; });
        if (duplicate) {
            fail(ErrorKind::kTypeError, fmt::format("duplicate policy id '{}'", id));
        }
        children.push_back(std::move(child));
    });
    draft.policies = std::move(children);
}

void Decoder::decode_algorithm(NodeDraft& draft) {
    static constexpr std::array<Field<MapperDraft>, 6> kMapperFields{{
        {"id",      &Decoder::decode_mapper_id},
        {"map",     &Decoder::decode_mapper_selector},
        {"alg",     &Decoder::decode_mapper_algorithm},
        {"default", &Decoder::decode_mapper_default},
        {"error",   &Decoder::decode_mapper_error},
        {"nomatch", &Decoder::decode_mapper_nomatch},
    }};

    if (events_.peek().kind == EventKind::kScalar) {
        const std::string name = expect_scalar("alg");
        const auto kind = find_algorithm(name);
        if (!kind) {
            fail(ErrorKind::kTypeError, fmt::format("unknown combining algorithm '{}'", name));
        }
        if (*kind == AlgorithmKind::kMapper) {
            fail(ErrorKind::kTypeError, "Mapper algorithm needs an object with 'map'");
        }
        draft.algorithm = AlgorithmDraft{*kind, nullptr};
        return;
    }

    MapperDraft mapper;
    decode_object(mapper, kMapperFields, "alg");

    if (!mapper.id || find_algorithm(*mapper.id) != AlgorithmKind::kMapper) {
        fail(ErrorKind::kTypeError, fmt::format("algorithm object must have id 'Mapper', got '{}'",
                                                mapper.id.value_or("")));
    }
    if (!mapper.spec.selector) {
        fail(ErrorKind::kSchemaError, "Mapper is missing 'map'");
    }
    draft.algorithm = AlgorithmDraft{AlgorithmKind::kMapper,
                                     std::make_unique<MapperSpec>(std::move(mapper.spec))};
}

CombiningAlgorithm Decoder::finish_algorithm(AlgorithmDraft draft, const std::string& node,
                                             const std::vector<std::string>& child_ids) {
    if (draft.kind != AlgorithmKind::kMapper) {
        return CombiningAlgorithm{draft.kind, nullptr};
    }

    MapperSpec& spec = *draft.mapper;
    for (std::size_t i = 0; i < child_ids.size(); ++i) {
        spec.child_index.emplace(child_ids[i], i);
    }

    const auto index_of = [&](const std::optional<std::string>& child, std::string_view role)
        -> std::optional<std::size_t> {
        if (!child) {
            return std::nullopt;
        }
        const auto it = spec.child_index.find(*child);
        if (it == spec.child_index.end()) {
            fail(ErrorKind::kTypeError, fmt::format("Mapper {} '{}' is not a child of '{}'",
                                                    role, *child, node));
        }
        return it->second;
    };
    spec.default_index = index_of(spec.default_id, "default");
    spec.error_index   = index_of(spec.error_id, "error");

    return CombiningAlgorithm{AlgorithmKind::kMapper, std::move(draft.mapper)};
}

void Decoder::decode_mapper_id(MapperDraft& draft) {
    draft.id = expect_scalar("alg id");
}

void Decoder::decode_mapper_selector(MapperDraft& draft) {
    ExpressionPtr selector = decode_expression();
    const AttributeType type = selector->type();
    if (type != kStringType && type != AttributeType::set_of(TypeKind::kString) &&
        type != AttributeType::list_of(TypeKind::kString)) {
        fail(ErrorKind::kTypeError,
             fmt::format("Mapper selector must be string, set of strings or list of strings, got {}",
                         type.name()));
    }
    draft.spec.selector = std::move(selector);
}

void Decoder::decode_mapper_algorithm(MapperDraft& draft) {
    const std::string name = expect_scalar("Mapper alg");
    const auto kind = find_algorithm(name);
    if (!kind) {
        fail(ErrorKind::kTypeError, fmt::format("unknown combining algorithm '{}'", name));
    }
    if (*kind == AlgorithmKind::kMapper) {
        fail(ErrorKind::kTypeError, "nested Mapper is not supported");
    }
    draft.spec.sub_algorithm = *kind;
}

void Decoder::decode_mapper_default(MapperDraft& draft) {
    draft.spec.default_id = expect_scalar("Mapper default");
}

void Decoder::decode_mapper_error(MapperDraft& draft) {
    draft.spec.error_id = expect_scalar("Mapper error");
}

void Decoder::decode_mapper_nomatch(MapperDraft& draft) {
    const std::string value = expect_scalar("Mapper nomatch");
    if (iequals(value, "NotApplicable")) {
        draft.spec.nomatch = NoMatchEffect::kNotApplicable;
    } else if (iequals(value, "Indeterminate")) {
        draft.spec.nomatch = NoMatchEffect::kIndeterminate;
    } else {
        fail(ErrorKind::kSchemaError,
             fmt::format("nomatch must be NotApplicable or Indeterminate, got '{}'", value));
    }
}

// ---------------------------------------------------------------------------
// 규칙
// ---------------------------------------------------------------------------
Rule Decoder::decode_rule() {
    static constexpr std::array<Field<RuleDraft>, 5> kFields{{
        {"id",          &Decoder::decode_id_field<RuleDraft>},
        {"effect",      &Decoder::decode_effect},
        {"target",      &Decoder::decode_target_field<RuleDraft>},
        {"condition",   &Decoder::decode_condition},
        {"obligations", &Decoder::decode_obligations_field<RuleDraft>},
    }};

    RuleDraft draft;
    decode_object(draft, kFields, "rule");

    if (!draft.id) {
        fail(ErrorKind::kSchemaError, "rule is missing 'id'");
    }
    if (!draft.effect) {
        fail(ErrorKind::kSchemaError, fmt::format("rule '{}' is missing 'effect'", *draft.id));
    }
    return Rule{
        std::move(*draft.id),
        *draft.effect,
        std::move(draft.target),
        std::move(draft.condition),
        std::move(draft.obligations),
    };
}

void Decoder::decode_effect(RuleDraft& draft) {
    const std::string value = expect_scalar("effect");
    if (iequals(value, "Permit")) {
        draft.effect = Effect::kPermit;
    } else if (iequals(value, "Deny")) {
        draft.effect = Effect::kDeny;
    } else {
        fail(ErrorKind::kSchemaError, fmt::format("effect must be Permit or Deny, got '{}'", value));
    }
}

void Decoder::decode_condition(RuleDraft& draft) {
    ExpressionPtr condition = decode_expression();
    if (condition->type() != kBooleanType) {
        fail(ErrorKind::kTypeError,
             fmt::format("condition must be boolean, got {}", condition->type().name()));
    }
    draft.condition = std::move(condition);
}

// ---------------------------------------------------------------------------
// 공통 필드
// ---------------------------------------------------------------------------
template <typename Draft>
void Decoder::decode_id_field(Draft& draft) {
    std::string id = expect_scalar("id");
    if (id.empty()) {
        fail(ErrorKind::kSchemaError, "id must not be empty");
    }
    draft.id = std::move(id);
}

template <typename Draft>
void Decoder::decode_target_field(Draft& draft) {
    draft.target = decode_target();
}

template <typename Draft>
void Decoder::decode_obligations_field(Draft& draft) {
    draft.obligations = decode_obligations();
}

Target Decoder::decode_target() {
    Target target;
    decode_sequence("target", [&]() {
        if (!is_tagged_map("any")) {
            Target::AllClause all;
            all.push_back(decode_match());
            Target::AnyClause any;
            any.push_back(std::move(all));
            target.clauses.push_back(std::move(any));
            return;
        }

        expect(EventKind::kMapStart, "target item");
        expect_scalar("any");
        PathScope any_scope(*this, "any");

        Target::AnyClause any;
        decode_sequence("any", [&]() {
            Target::AllClause all;
            if (!is_tagged_map("all")) {
                all.push_back(decode_match());
                any.push_back(std::move(all));
                return;
            }
            expect(EventKind::kMapStart, "any item");
            expect_scalar("all");
            PathScope all_scope(*this, "all");
            decode_sequence("all", [&]() { all.push_back(decode_match()); });
            expect(EventKind::kMapEnd, "all");
            if (all.empty()) {
                fail(ErrorKind::kSchemaError, "'all' must not be empty");
            }
            any.push_back(std::move(all));
        });
        expect(EventKind::kMapEnd, "any");
        if (any.empty()) {
            fail(ErrorKind::kSchemaError, "'any' must not be empty");
        }
        target.clauses.push_back(std::move(any));
    });
    return target;
}

ExpressionPtr Decoder::decode_match() {
    ExpressionPtr match = decode_expression();
    if (match->type() != kBooleanType) {
        fail(ErrorKind::kTypeError,
             fmt::format("target match must be boolean, got {}", match->type().name()));
    }
    return match;
}

std::vector<Obligation> Decoder::decode_obligations() {
    std::vector<Obligation> obligations;
    decode_sequence("obligations", [&]() {
        expect(EventKind::kMapStart, "obligation");
        std::string id = expect_scalar("obligation attribute");
        const AttributeType declared = declared_type(id);

        PathScope scope(*this, id);
        ExpressionPtr expr = decode_expression();
        if (expr->type() != declared) {
            fail(ErrorKind::kTypeError, fmt::format("obligation '{}' is {}, got {}",
                                                    id, declared.name(), expr->type().name()));
        }
        expect(EventKind::kMapEnd, "obligation");
        obligations.push_back(Obligation{std::move(id), std::move(expr)});
    });
    return obligations;
}

// ---------------------------------------------------------------------------
// 식
// ---------------------------------------------------------------------------
ExpressionPtr Decoder::decode_expression() {
    expect(EventKind::kMapStart, "expression");
    const std::string tag = expect_scalar("expression tag");

    ExpressionPtr expr;
    {
        PathScope scope(*this, to_lower(tag));
        if (iequals(tag, "attr")) {
            expr = decode_designator();
        } else if (iequals(tag, "val")) {
            expr = decode_literal();
        } else {
            expr = decode_call(tag);
        }
    }

    if (events_.peek().kind != EventKind::kMapEnd) {
        events_.next();
        fail(ErrorKind::kSchemaError, "expression must have exactly one key");
    }
    events_.next();
    return expr;
}

ExpressionPtr Decoder::decode_designator() {
    const std::string id = expect_scalar("attribute id");
    return std::make_unique<DesignatorExpression>(id, declared_type(id));
}

ExpressionPtr Decoder::decode_literal() {
    static constexpr std::array<Field<LiteralDraft>, 2> kFields{{
        {"type",    &Decoder::decode_literal_type},
        {"content", &Decoder::decode_literal_content},
    }};

    LiteralDraft draft;
    decode_object(draft, kFields, "value");

    if (!draft.type) {
        fail(ErrorKind::kSchemaError, "value is missing 'type'");
    }
    if (!draft.scalar && !draft.items) {
        fail(ErrorKind::kSchemaError, "value is missing 'content'");
    }

    auto value = draft.items ? AttributeValue::coerce(*draft.type, *draft.items)
                             : AttributeValue::coerce(*draft.type, *draft.scalar);
    if (!value) {
        fail(ErrorKind::kTypeError, value.error());
    }
    return std::make_unique<LiteralExpression>(std::move(*value));
}

void Decoder::decode_literal_type(LiteralDraft& draft) {
    auto type = parse_attribute_type(expect_scalar("value type"));
    if (!type) {
        fail(ErrorKind::kTypeError, type.error());
    }
    draft.type = *type;
}

void Decoder::decode_literal_content(LiteralDraft& draft) {
    if (events_.peek().kind != EventKind::kSequenceStart) {
        draft.scalar = expect_scalar("value content");
        return;
    }
    std::vector<std::string> items;
    decode_sequence("value content", [&]() { items.push_back(expect_scalar("value item")); });
    draft.items = std::move(items);
}

ExpressionPtr Decoder::decode_call(const std::string& name) {
    const bool is_and = iequals(name, "and");
    const bool is_or  = iequals(name, "or");
    const bool is_not = iequals(name, "not");

    if (!is_and && !is_or && !is_not && !is_known_function(name)) {
        fail(ErrorKind::kSchemaError, fmt::format("unknown expression tag '{}'", name));
    }

    std::vector<ExpressionPtr> args;
    decode_sequence(name, [&]() { args.push_back(decode_expression()); });

    if (is_and || is_or || is_not) {
        const std::string op = to_lower(name);
        if (args.empty()) {
            fail(ErrorKind::kTypeError, fmt::format("'{}' needs at least one operand", op));
        }
        if (is_not && args.size() != 1) {
            fail(ErrorKind::kTypeError,
                 fmt::format("'not' takes exactly one operand, got {}", args.size()));
        }
        for (std::size_t i = 0; i < args.size(); ++i) {
            if (args[i]->type() != kBooleanType) {
                fail(ErrorKind::kTypeError, fmt::format("'{}' operand {} must be boolean, got {}",
                                                        op, i, args[i]->type().name()));
            }
        }
        if (is_not) {
            return std::make_unique<NotExpression>(std::move(args.front()));
        }
        if (is_and) {
            return std::make_unique<AndExpression>(std::move(args));
        }
        return std::make_unique<OrExpression>(std::move(args));
    }

    std::vector<AttributeType> types;
    types.reserve(args.size());
    for (const auto& arg : args) {
        types.push_back(arg->type());
    }
    auto overload = resolve_function(name, types);
    if (!overload) {
        fail(ErrorKind::kTypeError, overload.error());
    }
    return std::make_unique<FunctionCallExpression>(**overload, std::move(args));
}

}  // namespace

// ---------------------------------------------------------------------------
// DocumentParser
// ---------------------------------------------------------------------------
std::expected<std::shared_ptr<PolicyTree>, PdpError>
DocumentParser::parse(std::string_view document) {
    auto events = EventStream::read(document);
    if (!events) {
        return std::unexpected(std::move(events.error()));
    }

    try {
        Decoder decoder(*events);
        auto tree = decoder.decode_document();
        spdlog::debug("document_parser: parsed {} attributes, root '{}'",
                      tree->attributes.size(), node_id(tree->root));
        return tree;
    } catch (const DecodeError& e) {
        return std::unexpected(e.error);
    }
}

std::expected<std::shared_ptr<PolicyTree>, PdpError>
DocumentParser::parse_file(const std::filesystem::path& path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(path, ec);
    if (ec) {
        return std::unexpected(PdpError{
            .kind    = ErrorKind::kSchemaError,
            .message = fmt::format("cannot resolve policy path '{}': {}", path.string(), ec.message()),
        });
    }

    std::ifstream in(canonical_path, std::ios::binary);
    if (!in) {
        return std::unexpected(PdpError{
            .kind    = ErrorKind::kSchemaError,
            .message = fmt::format("cannot open policy file '{}'", canonical_path.string()),
        });
    }

    spdlog::info("document_parser: loading policy from '{}'", canonical_path.string());
    std::ostringstream content;
    content << in.rdbuf();
    return parse(content.str());
}
