#pragma once

// ---------------------------------------------------------------------------
// evaluation_session.hpp
//
// 요청 하나에 대한 평가 상태.
//   Request           : 호출자가 넘긴 id → 타입 값 맵
//   AttributeResolver : 요청에 없는 속성을 외부(PIP)에서 가져오는 훅
//   CancellationToken : 호출자가 평가를 중단할 때 세우는 플래그
//   EvaluationSession : 위 세 가지와 속성 해석 캐시
//
// [설계 원칙]
// - 세션은 요청마다 새로 만들고 절대 스레드 간에 공유하지 않는다.
//   따라서 캐시에 락이 없다.
// - 요청에 없는 id 에 대해 resolver 는 세션당 최대 한 번만 호출된다.
//   결과는 값/없음/오류 모두 캐시한다. 취소는 캐시하지 않는다.
// - 취소 여부는 resolver 호출 직전과 직후에 확인한다.
//   취소된 세션은 kCancelled 오류를 돌려주고 판정은 kIndeterminate 가 된다.
// ---------------------------------------------------------------------------

#include "attribute/attribute_value.hpp"
#include "common/types.hpp"

#include <atomic>
#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// Request
//   같은 id 를 다시 add 하면 덮어쓴다.
//   선언되지 않은 id 는 정책에서 참조하지 않는 한 무시된다.
// ---------------------------------------------------------------------------
class Request {
public:
    using AttributeMap = std::map<std::string, AttributeValue, std::less<>>;

    void add(std::string id, AttributeValue value);

    [[nodiscard]] const AttributeValue* find(std::string_view id) const;

    [[nodiscard]] const AttributeMap& attributes() const noexcept { return attributes_; }
    [[nodiscard]] std::size_t size() const noexcept { return attributes_.size(); }

private:
    AttributeMap attributes_{};
};

// ---------------------------------------------------------------------------
// AttributeResolver
//   외부 속성 공급자 인터페이스.
//
//   성공: 값 (std::optional 에 담김)
//   없음: std::nullopt
//   실패: std::unexpected(오류 메시지)
//
//   여러 세션이 동시에 호출할 수 있으므로 구현은 스레드 안전해야 한다.
// ---------------------------------------------------------------------------
class AttributeResolver {
public:
    virtual ~AttributeResolver() = default;

    [[nodiscard]] virtual std::expected<std::optional<AttributeValue>, std::string>
    resolve(std::string_view id, const AttributeType& expected_type, const Request& request) = 0;
};

// ---------------------------------------------------------------------------
// CancellationToken
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

// ---------------------------------------------------------------------------
// EvaluationSession
// ---------------------------------------------------------------------------
class EvaluationSession {
public:
    // request 는 세션보다 오래 살아야 한다. resolver / cancel 은 nullptr 허용.
    explicit EvaluationSession(const Request&           request,
                               AttributeResolver*       resolver = nullptr,
                               const CancellationToken* cancel   = nullptr);

    EvaluationSession(const EvaluationSession&)            = delete;
    EvaluationSession& operator=(const EvaluationSession&) = delete;

    // resolve
    //   1. 요청에 있으면 그 값 (타입이 다르면 kResolutionError)
    //   2. 이전 해석 결과가 캐시에 있으면 그대로
    //   3. resolver 호출 (최대 1회) 후 캐시
    //   resolver 가 없거나 없음을 보고하면 kResolutionError.
    [[nodiscard]] std::expected<AttributeValue, PdpError>
    resolve(std::string_view id, const AttributeType& type);

    [[nodiscard]] bool cancelled() const noexcept;

    [[nodiscard]] const Request& request() const noexcept { return request_; }

    // 이 세션에서 resolver 를 호출한 횟수
    [[nodiscard]] std::size_t resolver_calls() const noexcept { return resolver_calls_; }

private:
    using CachedResult = std::expected<AttributeValue, PdpError>;

    [[nodiscard]] PdpError cancelled_error(std::string_view id) const;

    const Request&           request_;
    AttributeResolver*       resolver_;
    const CancellationToken* cancel_;

    std::map<std::string, CachedResult, std::less<>> cache_{};
    std::size_t                                       resolver_calls_{0};
};
