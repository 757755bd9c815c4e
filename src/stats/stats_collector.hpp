#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 판정 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_decision / on_reload: 평가 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 조회 경로. 갱신 경로와 mutex 없이 atomic 로드로 분리한다.
//
// [격리 원칙]
// - 통계 수집 실패가 판정 경로로 전파되지 않도록 모든 갱신 메서드는
//   noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   dps              : 수집 시작 이후 평균 초당 판정 수
//   indeterminate_rate: indeterminate / total_decisions (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                              total_decisions{0};
    std::uint64_t                              permits{0};
    std::uint64_t                              denies{0};
    std::uint64_t                              not_applicable{0};
    std::uint64_t                              indeterminate{0};
    std::uint64_t                              reloads{0};
    std::uint64_t                              failed_reloads{0};
    double                                     dps{0.0};
    double                                     indeterminate_rate{0.0};
    std::chrono::system_clock::time_point      captured_at{};
};

// ---------------------------------------------------------------------------
// StatsCollector
// ---------------------------------------------------------------------------
class StatsCollector {
public:
    StatsCollector() noexcept
        : window_start_(std::chrono::system_clock::now())
    {}

    ~StatsCollector() = default;

    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    // on_decision
    //   판정 한 건이 끝날 때 호출.
    void on_decision(Effect effect) noexcept {
        total_decisions_.fetch_add(1, std::memory_order_relaxed);
        switch (effect) {
            case Effect::kPermit:
                permits_.fetch_add(1, std::memory_order_relaxed);
                break;
            case Effect::kDeny:
                denies_.fetch_add(1, std::memory_order_relaxed);
                break;
            case Effect::kNotApplicable:
                not_applicable_.fetch_add(1, std::memory_order_relaxed);
                break;
            case Effect::kIndeterminate:
                indeterminate_.fetch_add(1, std::memory_order_relaxed);
                break;
        }
    }

    // on_reload
    //   정책 로드 시도 후 호출. success == false 면 기존 트리가 계속 서비스 중.
    void on_reload(bool success) noexcept {
        reloads_.fetch_add(1, std::memory_order_relaxed);
        if (!success) {
            failed_reloads_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now          = std::chrono::system_clock::now();
        const auto total        = total_decisions_.load(std::memory_order_relaxed);
        const auto indet        = indeterminate_.load(std::memory_order_relaxed);
        const auto window_start = window_start_.load();

        const double elapsed_sec = std::chrono::duration<double>(now - window_start).count();

        double dps = 0.0;
        if (elapsed_sec > 0.0) {
            dps = static_cast<double>(total) / elapsed_sec;
        }

        double indeterminate_rate = 0.0;
        if (total > 0) {
            indeterminate_rate = static_cast<double>(indet) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_decisions    = total,
            .permits            = permits_.load(std::memory_order_relaxed),
            .denies             = denies_.load(std::memory_order_relaxed),
            .not_applicable     = not_applicable_.load(std::memory_order_relaxed),
            .indeterminate      = indet,
            .reloads            = reloads_.load(std::memory_order_relaxed),
            .failed_reloads     = failed_reloads_.load(std::memory_order_relaxed),
            .dps                = dps,
            .indeterminate_rate = indeterminate_rate,
            .captured_at        = now,
        };
    }

private:
    std::atomic<std::uint64_t>                          total_decisions_{0};
    std::atomic<std::uint64_t>                          permits_{0};
    std::atomic<std::uint64_t>                          denies_{0};
    std::atomic<std::uint64_t>                          not_applicable_{0};
    std::atomic<std::uint64_t>                          indeterminate_{0};
    std::atomic<std::uint64_t>                          reloads_{0};
    std::atomic<std::uint64_t>                          failed_reloads_{0};
    std::atomic<std::chrono::system_clock::time_point>  window_start_;
};
