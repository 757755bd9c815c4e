#pragma once

// ---------------------------------------------------------------------------
// policy_store.hpp
//
// 현재 정책 트리를 원자적으로 교체 가능한 참조로 보관하고
// 요청에 대한 판정을 내린다.
//
// [fail-close 원칙]
// 1. load 실패 (파싱/검증 오류) → 기존 트리를 그대로 유지
// 2. 게시된 트리 없음 → decide() 는 Indeterminate (kNoPolicy)
// 3. Indeterminate 는 절대 Permit 이 아니다. 호출자가 Deny 로 매핑한다.
//
// [Hot Reload]
// load() 는 후보 트리를 락 없이 따로 파싱/검증한다. 성공한 경우에만
// mutex 안에서 generation 을 부여하고 atomic store 로 게시한다.
// decide() 는 시작 시 트리 참조를 한 번만 잡는다 (요청별 스냅샷 격리).
// 게시 도중에 시작된 평가는 끝날 때까지 이전 트리를 사용한다.
//
// [스레드 안전성]
// load / load_file / decide / current 는 모두 동시에 호출할 수 있다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "policy/policy_tree.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string_view>

class AttributeResolver;
class CancellationToken;
class Request;

class PolicyStore {
public:
    PolicyStore() = default;
    ~PolicyStore() = default;

    PolicyStore(const PolicyStore&)            = delete;
    PolicyStore& operator=(const PolicyStore&) = delete;

    // load
    //   문서를 파싱/검증하여 성공 시에만 게시한다.
    //   성공: 이 호출이 게시한 트리의 generation.
    //         동시에 다른 load 가 끝나도 값은 이 호출의 것이다.
    //   실패: std::unexpected(PdpError): 현재 트리는 변하지 않는다.
    [[nodiscard]] std::expected<std::uint64_t, PdpError> load(std::string_view document);

    [[nodiscard]] std::expected<std::uint64_t, PdpError> load_file(const std::filesystem::path& path);

    // decide
    //   현재 트리로 요청을 평가하고 의무를 해석한 Decision 을 반환한다.
    //   Decision.generation 은 평가에 사용한 트리의 generation 이다.
    [[nodiscard]] Decision decide(const Request&           request,
                                  AttributeResolver*       resolver = nullptr,
                                  const CancellationToken* cancel   = nullptr) const;

    // 현재 게시된 트리 (없으면 nullptr)
    [[nodiscard]] std::shared_ptr<const PolicyTree> current() const;

    // 마지막으로 게시된 generation (없으면 0)
    [[nodiscard]] std::uint64_t generation() const;

private:
    std::uint64_t publish(std::shared_ptr<PolicyTree> tree);

    std::atomic<std::shared_ptr<const PolicyTree>> tree_{};
    std::mutex                                     publish_mutex_;
    std::uint64_t                                  next_generation_{1};  // publish_mutex_ 보호
};
