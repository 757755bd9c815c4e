#pragma once

// ---------------------------------------------------------------------------
// pdp_server.hpp
//
// Unix Domain Socket 판정 서버.
//
// [프로토콜: 길이 프리픽스 + JSON]
//   요청/응답 프레임 모두:
//     [4byte LE 길이][JSON 본문]
//   한 연결에서 여러 요청을 순서대로 보낼 수 있다. 연결은 EOF 까지 유지.
//
//   요청 예:
//     {"command": "decide", "attributes": {"user.role": {"type": "string", "value": "admin"}}}
//     {"command": "stats"}
//     {"command": "policy_reload"}
//
//   응답:
//     성공: {"ok": true,  "payload": { ... }}
//     실패: {"ok": false, "error": "<메시지>"}
//
//   decide payload:
//     {"effect": "Permit", "generation": 3,
//      "obligations": [{"id": "...", "type": "...", "value": ...}],
//      "reason": {"kind": "...", "message": "...", "function": "...", "path": [...]}}
//   reason 은 effect 가 Indeterminate 일 때만 포함된다.
//
// [스레드/비동기 모델]
//   Boost.Asio co_await 기반. io_context 는 외부에서 주입하며 여러 스레드가
//   run() 할 수 있다. 연결마다 독립 코루틴이므로 판정은 동시에 진행된다.
//
//   resolver 가 있으면 판정은 전용 thread_pool 에서 돌고, 그동안 연결에
//   peek 수신을 걸어 둔다. 클라이언트가 끊기면 해당 요청의 CancellationToken
//   을 취소하여 resolver 호출 이후의 평가를 Indeterminate (Cancelled) 로 끝낸다.
//   resolver 가 없으면 판정은 블로킹 없이 끝나므로 코루틴 안에서 바로 수행한다.
//
// [격리 원칙]
//   클라이언트 I/O 실패나 잘못된 프레임은 해당 연결만 닫는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "logger/structured_logger.hpp"
#include "policy/policy_store.hpp"
#include "stats/stats_collector.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace asio = boost::asio;

class AttributeResolver;
class CancellationToken;

namespace YAML {
class Node;
}

// ---------------------------------------------------------------------------
// PdpConfig
//   하드코딩 금지: 값은 환경변수에서 읽는다 (main.cpp).
//
//   policy_path    : 정책 문서 경로 (YAML/JSON)
//   socket_path    : 판정 요청을 받는 Unix Domain Socket 경로
//   log_path       : 감사 로그 파일 경로
//   log_level      : "debug","info","warn","error"
//   worker_threads : io_context::run() 을 구동할 스레드 수
// ---------------------------------------------------------------------------
struct PdpConfig {
    std::string   policy_path{};
    std::string   socket_path{};
    std::string   log_path{};
    std::string   log_level{};
    std::uint32_t worker_threads{0};
};

// 문자열 → LogLevel (알 수 없는 값은 kInfo)
[[nodiscard]] LogLevel parse_log_level(std::string_view level_str);

// ---------------------------------------------------------------------------
// PdpServer
// ---------------------------------------------------------------------------
class PdpServer {
public:
    // 생성자
    //   store    : 공유 정책 저장소
    //   stats    : 판정/리로드 카운터
    //   logger   : 감사 로거
    //   resolver : 외부 속성 공급자 (nullptr 허용)
    PdpServer(PdpConfig                         config,
              std::shared_ptr<PolicyStore>      store,
              std::shared_ptr<StatsCollector>   stats,
              std::shared_ptr<StructuredLogger> logger,
              asio::io_context&                 ioc,
              AttributeResolver*                resolver = nullptr);

    ~PdpServer();

    PdpServer(const PdpServer&)            = delete;
    PdpServer& operator=(const PdpServer&) = delete;
    PdpServer(PdpServer&&)                 = delete;
    PdpServer& operator=(PdpServer&&)      = delete;

    // run
    //   소켓 바인드/리슨 후 accept 루프를 실행한다. stop() 까지 유지.
    asio::awaitable<void> run();

    // stop
    //   acceptor 를 닫아 run() 을 끝낸다. 시그널 대기도 취소한다.
    void stop();

    // install_signal_handlers
    //   SIGTERM/SIGINT → stop(), SIGHUP → reload("sighup").
    void install_signal_handlers();

    // reload
    //   config.policy_path 를 다시 읽는다. 실패 시 기존 트리 유지.
    //   결과는 감사 로그와 통계에 기록된다.
    //   성공 시 이 호출이 게시한 generation 을 반환한다.
    std::expected<std::uint64_t, PdpError> reload(std::string_view trigger);

    // dispatch
    //   요청 JSON 본문 하나를 처리해 응답 JSON 본문을 만든다.
    //   cancel 은 decide 평가에 전달된다 (nullptr 허용).
    [[nodiscard]] std::string dispatch(std::string_view         request_json,
                                       const CancellationToken* cancel = nullptr);

private:
    asio::awaitable<void> handle_client(asio::local::stream_protocol::socket socket);

    void wait_for_hup();

    [[nodiscard]] std::string handle_decide(const YAML::Node& attributes,
                                            const CancellationToken* cancel);
    [[nodiscard]] std::string handle_stats() const;
    [[nodiscard]] std::string handle_reload();

    PdpConfig                              config_;
    std::shared_ptr<PolicyStore>           store_;
    std::shared_ptr<StatsCollector>        stats_;
    std::shared_ptr<StructuredLogger>      logger_;
    asio::io_context&                      ioc_;
    AttributeResolver*                     resolver_;
    asio::local::stream_protocol::acceptor acceptor_;
    asio::signal_set                       stop_signals_;
    asio::signal_set                       hup_signals_;
    std::atomic<bool>                      stop_requested_{false};
    std::atomic<std::uint64_t>             next_request_id_{1};

    // resolver 가 있을 때만 생성. 마지막 멤버: 먼저 파괴되어 평가 스레드를 join 한다.
    std::unique_ptr<asio::thread_pool>     eval_pool_;
};
