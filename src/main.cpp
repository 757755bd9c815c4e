#include "logger/structured_logger.hpp"
#include "policy/policy_store.hpp"
#include "server/pdp_server.hpp"
#include "stats/stats_collector.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

uint32_t env_u32(const char* name, uint32_t default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    try {
        const long parsed = std::stol(val);
        if (parsed < 1) {
            spdlog::warn("env {}: value {} out of range, using default {}", name, parsed, default_val);
            return default_val;
        }
        return static_cast<uint32_t>(parsed);
    } catch (const std::logic_error&) {
        // std::invalid_argument / std::out_of_range
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
}

} // namespace

// ---------------------------------------------------------------------------
// main
//
// 초기 정책 로드가 실패해도 서버는 시작한다. 이때 모든 판정은
// Indeterminate (NoPolicy) 이며, SIGHUP 또는 policy_reload 커맨드로 복구한다.
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 설정 로드 (환경변수 우선, 기본값 fallback) ───────────────────────
    PdpConfig config;
    config.policy_path    = env_str("PDP_POLICY_PATH",    "config/policy.yaml");
    config.socket_path    = env_str("PDP_SOCKET_PATH",    "/tmp/pdpd.sock");
    config.log_path       = env_str("PDP_LOG_PATH",       "/tmp/pdpd.log");
    config.log_level      = env_str("PDP_LOG_LEVEL",      "info");
    config.worker_threads = env_u32("PDP_WORKER_THREADS", 4);

    spdlog::info("Starting pdpd");
    spdlog::info("Policy: {}", config.policy_path);
    spdlog::info("Socket: {}", config.socket_path);
    spdlog::info("Log level: {}", config.log_level);
    spdlog::info("Worker threads: {}", config.worker_threads);

    const LogLevel log_level = parse_log_level(config.log_level);
    if (log_level == LogLevel::kDebug) {
        spdlog::set_level(spdlog::level::debug);
    }

    std::shared_ptr<StructuredLogger> logger;
    try {
        logger = std::make_shared<StructuredLogger>(log_level, config.log_path);
    } catch (const std::runtime_error& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    auto store = std::make_shared<PolicyStore>();
    auto stats = std::make_shared<StatsCollector>();

    boost::asio::io_context ioc;
    PdpServer server{config, store, stats, logger, ioc};

    if (auto loaded = server.reload("startup"); !loaded) {
        spdlog::warn("initial policy load failed (fail-close, all decisions Indeterminate)");
    }

    server.install_signal_handlers();
    boost::asio::co_spawn(ioc, server.run(), boost::asio::detached);

    // ── 워커 스레드 ─────────────────────────────────────────────────────
    std::vector<std::thread> workers;
    workers.reserve(config.worker_threads - 1);
    for (uint32_t i = 1; i < config.worker_threads; ++i) {
        workers.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();
    for (auto& worker : workers) {
        worker.join();
    }

    spdlog::info("pdpd stopped");
    return EXIT_SUCCESS;
}
