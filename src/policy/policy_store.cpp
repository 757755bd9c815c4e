// ---------------------------------------------------------------------------
// policy_store.cpp
// ---------------------------------------------------------------------------

#include "policy/policy_store.hpp"

#include "parser/document_parser.hpp"
#include "policy/evaluation_session.hpp"
#include "policy/evaluator.hpp"

#include <spdlog/spdlog.h>

std::expected<std::uint64_t, PdpError> PolicyStore::load(std::string_view document) {
    auto tree = DocumentParser::parse(document);
    if (!tree) {
        spdlog::error("policy_store: load failed, keeping generation {}: {}",
                      generation(), describe(tree.error()));
        return std::unexpected(std::move(tree.error()));
    }
    return publish(std::move(*tree));
}

std::expected<std::uint64_t, PdpError> PolicyStore::load_file(const std::filesystem::path& path) {
    auto tree = DocumentParser::parse_file(path);
    if (!tree) {
        spdlog::error("policy_store: load of {} failed, keeping generation {}: {}",
                      path.string(), generation(), describe(tree.error()));
        return std::unexpected(std::move(tree.error()));
    }
    return publish(std::move(*tree));
}

std::uint64_t PolicyStore::publish(std::shared_ptr<PolicyTree> tree) {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    tree->generation = next_generation_++;
    const std::uint64_t generation = tree->generation;
    tree_.store(std::move(tree), std::memory_order_release);
    spdlog::info("policy_store: published generation {}", generation);
    return generation;
}

Decision PolicyStore::decide(const Request&           request,
                             AttributeResolver*       resolver,
                             const CancellationToken* cancel) const {
    // 트리 참조는 여기서 한 번만 잡는다
    const auto tree = tree_.load(std::memory_order_acquire);
    if (!tree) {
        Decision decision;
        decision.reason = DecisionReason{ErrorKind::kNoPolicy, "no policy tree published", {}, {}};
        return decision;
    }

    if (cancel != nullptr && cancel->cancelled()) {
        Decision decision;
        decision.generation = tree->generation;
        decision.reason = DecisionReason{ErrorKind::kCancelled, "evaluation cancelled", {}, {}};
        return decision;
    }

    EvaluationSession session(request, resolver, cancel);
    return evaluate_tree(*tree, session);
}

std::shared_ptr<const PolicyTree> PolicyStore::current() const {
    return tree_.load(std::memory_order_acquire);
}

std::uint64_t PolicyStore::generation() const {
    const auto tree = tree_.load(std::memory_order_acquire);
    return tree ? tree->generation : 0;
}
