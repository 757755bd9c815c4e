// ---------------------------------------------------------------------------
// pdp_server.cpp
//
// PdpServer 구현.
//
// [지원 커맨드]
//   "decide"       : attributes 를 Request 로 해석 → PolicyStore::decide
//   "stats"        : StatsSnapshot JSON 반환
//   "policy_reload": config.policy_path 재로딩
//   기타           : error 응답
//
// 요청 본문은 yaml-cpp 로 읽는다 (JSON 은 YAML flow 의 부분집합).
// 응답 본문은 YAML::Emitter 를 flow + 큰따옴표 모드로 써서 JSON 을 만든다.
// ---------------------------------------------------------------------------

#include "server/pdp_server.hpp"

#include "common/text.hpp"
#include "parser/request_parser.hpp"
#include "policy/evaluation_session.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <utility>
#include <vector>

namespace {

// 단일 요청 최대 크기 (4MiB)
constexpr std::uint32_t kMaxRequestSize = 4u * 1024u * 1024u;

std::array<std::uint8_t, 4> encode_le4(std::uint32_t val) {
    return {
        static_cast<std::uint8_t>(val),
        static_cast<std::uint8_t>(val >> 8),
        static_cast<std::uint8_t>(val >> 16),
        static_cast<std::uint8_t>(val >> 24),
    };
}

std::uint32_t decode_le4(const std::array<std::uint8_t, 4>& buf) {
    return static_cast<std::uint32_t>(buf[0])
         | (static_cast<std::uint32_t>(buf[1]) << 8)
         | (static_cast<std::uint32_t>(buf[2]) << 16)
         | (static_cast<std::uint32_t>(buf[3]) << 24);
}

void use_json_format(YAML::Emitter& out) {
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
}

// {"ok":true,"payload":<payload>}
std::string make_ok_response(std::string_view payload) {
    return fmt::format(R"({{"ok":true,"payload":{}}})", payload);
}

// {"ok":false,"error":"<msg>"}
std::string make_error_response(std::string_view msg) {
    YAML::Emitter out;
    use_json_format(out);
    out << YAML::BeginMap;
    out << YAML::Key << "ok" << YAML::Value << false;
    out << YAML::Key << "error" << YAML::Value << std::string{msg};
    out << YAML::EndMap;
    return out.c_str();
}

void emit_value(YAML::Emitter& out, const AttributeValue& value) {
    if (!value.type().is_collection()) {
        out << value.to_string();
        return;
    }
    out << YAML::BeginSeq;
    for (const auto& item : value.items()) {
        out << scalar_to_string(item);
    }
    out << YAML::EndSeq;
}

std::string serialize_decision(const Decision& decision) {
    YAML::Emitter out;
    use_json_format(out);

    out << YAML::BeginMap;
    out << YAML::Key << "effect" << YAML::Value << std::string{effect_name(decision.effect)};
    out << YAML::Key << "generation" << YAML::Value << decision.generation;

    out << YAML::Key << "obligations" << YAML::Value << YAML::BeginSeq;
    for (const auto& obligation : decision.obligations) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << obligation.attribute_id;
        out << YAML::Key << "type" << YAML::Value << obligation.value.type().name();
        out << YAML::Key << "value" << YAML::Value;
        emit_value(out, obligation.value);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    if (decision.reason) {
        const DecisionReason& reason = *decision.reason;
        out << YAML::Key << "reason" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "kind" << YAML::Value << std::string{error_kind_name(reason.kind)};
        out << YAML::Key << "message" << YAML::Value << reason.message;
        if (!reason.function.empty()) {
            out << YAML::Key << "function" << YAML::Value << reason.function;
        }
        out << YAML::Key << "path" << YAML::Value << YAML::BeginSeq;
        for (const auto& id : reason.path) {
            out << id;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    return out.c_str();
}

} // namespace

LogLevel parse_log_level(std::string_view level_str) {
    if (iequals(level_str, "debug")) { return LogLevel::kDebug; }
    if (iequals(level_str, "warn"))  { return LogLevel::kWarn;  }
    if (iequals(level_str, "error")) { return LogLevel::kError; }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// PdpServer 생성자/소멸자
// ---------------------------------------------------------------------------
PdpServer::PdpServer(PdpConfig                         config,
                     std::shared_ptr<PolicyStore>      store,
                     std::shared_ptr<StatsCollector>   stats,
                     std::shared_ptr<StructuredLogger> logger,
                     asio::io_context&                 ioc,
                     AttributeResolver*                resolver)
    : config_{std::move(config)}
    , store_{std::move(store)}
    , stats_{std::move(stats)}
    , logger_{std::move(logger)}
    , ioc_{ioc}
    , resolver_{resolver}
    , acceptor_{ioc}
    , stop_signals_{ioc}
    , hup_signals_{ioc}
    , eval_pool_{resolver != nullptr
                     ? std::make_unique<asio::thread_pool>(std::max<std::uint32_t>(1, config_.worker_threads))
                     : nullptr}
{}

PdpServer::~PdpServer() {
    stop();
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------
void PdpServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    auto close_all = [this]() {
        boost::system::error_code ec;
        acceptor_.cancel(ec);
        if (ec && ec != asio::error::bad_descriptor) {
            spdlog::warn("[pdp_server] stop: acceptor cancel error: {}", ec.message());
        }
        acceptor_.close(ec);
        if (ec && ec != asio::error::bad_descriptor) {
            spdlog::warn("[pdp_server] stop: acceptor close error: {}", ec.message());
        }
        stop_signals_.cancel(ec);
        hup_signals_.cancel(ec);
    };

    // acceptor 소유 스레드(io_context)에서 정리해 TSan 경합을 방지한다.
    if (ioc_.stopped()) {
        close_all();
        return;
    }
    asio::post(ioc_, std::move(close_all));
}

// ---------------------------------------------------------------------------
// install_signal_handlers
//   SIGHUP 은 수신 후 wait_for_hup() 으로 재등록하여 반복 감지한다.
// ---------------------------------------------------------------------------
void PdpServer::install_signal_handlers() {
    stop_signals_.add(SIGTERM);
    stop_signals_.add(SIGINT);
    stop_signals_.async_wait([this](const boost::system::error_code& ec, int signum) {
        if (!ec) {
            spdlog::info("[pdp_server] signal {} received, shutting down", signum);
            stop();
        }
    });

    hup_signals_.add(SIGHUP);
    wait_for_hup();
}

void PdpServer::wait_for_hup() {
    hup_signals_.async_wait([this](const boost::system::error_code& ec, int /*signum*/) {
        if (ec) {
            return;
        }
        spdlog::info("[pdp_server] SIGHUP received, reloading policy: {}", config_.policy_path);
        // 실패는 reload() 안에서 기록된다. 기존 트리로 계속 서비스.
        static_cast<void>(reload("sighup"));
        if (!stop_requested_.load(std::memory_order_acquire)) {
            wait_for_hup();
        }
    });
}

// ---------------------------------------------------------------------------
// reload
// ---------------------------------------------------------------------------
std::expected<std::uint64_t, PdpError> PdpServer::reload(std::string_view trigger) {
    auto result = store_->load_file(config_.policy_path);

    stats_->on_reload(result.has_value());

    ReloadLog entry{
        .trigger    = std::string{trigger},
        .path       = config_.policy_path,
        .success    = result.has_value(),
        // 실패 시에는 유지 중인 generation
        .generation = result ? *result : store_->generation(),
        .error      = result ? std::string{} : describe(result.error()),
        .timestamp  = std::chrono::system_clock::now(),
    };
    logger_->log_reload(entry);

    if (!result) {
        spdlog::warn("[pdp_server] policy reload failed (keeping generation {}): {}",
                     entry.generation, entry.error);
    } else {
        spdlog::info("[pdp_server] policy reloaded, generation {}", entry.generation);
    }
    return result;
}

// ---------------------------------------------------------------------------
// run
//   기존 소켓 파일 제거 → bind/listen → accept 루프.
// ---------------------------------------------------------------------------
asio::awaitable<void> PdpServer::run() {
    using stream_protocol = asio::local::stream_protocol;

    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    std::error_code fs_ec;
    std::filesystem::remove(config_.socket_path, fs_ec);
    if (fs_ec && fs_ec != std::make_error_code(std::errc::no_such_file_or_directory)) {
        spdlog::error("[pdp_server] failed to remove old socket {}: {}",
                      config_.socket_path, fs_ec.message());
        co_return;
    }

    boost::system::error_code ec;
    acceptor_.open(stream_protocol(), ec);
    if (ec) {
        spdlog::error("[pdp_server] open error: {}", ec.message());
        co_return;
    }

    acceptor_.bind(stream_protocol::endpoint{config_.socket_path}, ec);
    if (ec) {
        spdlog::error("[pdp_server] bind error on {}: {}", config_.socket_path, ec.message());
        co_return;
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("[pdp_server] listen error: {}", ec.message());
        co_return;
    }

    spdlog::info("[pdp_server] listening on {}", config_.socket_path);

    for (;;) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            co_return;
        }

        stream_protocol::socket client_socket{ioc_};
        boost::system::error_code accept_ec;
        co_await acceptor_.async_accept(
            client_socket, asio::redirect_error(asio::use_awaitable, accept_ec));

        if (accept_ec) {
            if (accept_ec == asio::error::operation_aborted ||
                accept_ec == boost::system::errc::bad_file_descriptor) {
                spdlog::info("[pdp_server] accept loop stopped");
            } else {
                spdlog::error("[pdp_server] accept error: {}", accept_ec.message());
            }
            co_return;
        }

        asio::co_spawn(ioc_, handle_client(std::move(client_socket)), asio::detached);
    }
}

// ---------------------------------------------------------------------------
// handle_client
//   EOF 또는 오류까지 프레임 단위로 요청을 처리한다.
//   잘못된 길이 (0 또는 최대치 초과) 는 응답 없이 연결을 닫는다.
// ---------------------------------------------------------------------------
asio::awaitable<void> PdpServer::handle_client(asio::local::stream_protocol::socket socket) {
    for (;;) {
        boost::system::error_code ec;

        std::array<std::uint8_t, 4> req_hdr{};
        const std::size_t hdr_n = co_await asio::async_read(
            socket, asio::buffer(req_hdr), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec != asio::error::eof) {
                spdlog::warn("[pdp_server] handle_client: read header error: {}", ec.message());
            }
            co_return;
        }
        if (hdr_n != req_hdr.size()) {
            spdlog::warn("[pdp_server] handle_client: short header ({} bytes)", hdr_n);
            co_return;
        }

        const std::uint32_t body_len = decode_le4(req_hdr);
        if (body_len == 0 || body_len > kMaxRequestSize) {
            spdlog::warn("[pdp_server] handle_client: invalid body length {}", body_len);
            co_return;
        }

        std::vector<char> body_buf(body_len);
        const std::size_t body_n = co_await asio::async_read(
            socket, asio::buffer(body_buf), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            spdlog::warn("[pdp_server] handle_client: read body error: {}", ec.message());
            co_return;
        }
        if (body_n != body_len) {
            spdlog::warn("[pdp_server] handle_client: short body ({}/{} bytes)", body_n, body_len);
            co_return;
        }

        std::string response_body;
        if (!eval_pool_) {
            response_body = dispatch(std::string_view{body_buf.data(), body_n});
        } else {
            // peek 는 데이터를 소비하지 않는다. 파이프라인된 다음 요청은 그대로 남는다.
            auto cancel = std::make_shared<CancellationToken>();
            auto peek   = std::make_shared<std::array<char, 1>>();
            socket.async_receive(
                asio::buffer(*peek), asio::socket_base::message_peek,
                [cancel, peek](const boost::system::error_code& peek_ec, std::size_t peek_n) {
                    if (peek_ec == asio::error::operation_aborted) {
                        return;
                    }
                    if (peek_ec || peek_n == 0) {
                        spdlog::debug("[pdp_server] client disconnected during decision, cancelling");
                        cancel->cancel();
                    }
                });

            response_body = co_await asio::co_spawn(
                *eval_pool_,
                [this, body = std::string{body_buf.data(), body_n}, cancel]()
                    -> asio::awaitable<std::string> {
                    co_return dispatch(body, cancel.get());
                },
                asio::use_awaitable);

            boost::system::error_code cancel_ec;
            socket.cancel(cancel_ec);
            if (cancel_ec) {
                spdlog::debug("[pdp_server] handle_client: cancel peek error: {}", cancel_ec.message());
            }
        }

        const auto resp_hdr = encode_le4(static_cast<std::uint32_t>(response_body.size()));
        std::array<asio::const_buffer, 2> bufs{
            asio::buffer(resp_hdr),
            asio::buffer(response_body),
        };
        const std::size_t write_n = co_await asio::async_write(
            socket, bufs, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            spdlog::warn("[pdp_server] handle_client: write error: {}", ec.message());
            co_return;
        }
        spdlog::debug("[pdp_server] response_bytes={}", write_n);
    }
}

// ---------------------------------------------------------------------------
// dispatch
// ---------------------------------------------------------------------------
std::string PdpServer::dispatch(std::string_view request_json, const CancellationToken* cancel) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{request_json});
    } catch (const YAML::Exception& e) {
        spdlog::warn("[pdp_server] malformed request: {}", e.what());
        return make_error_response(fmt::format("malformed request: {}", e.msg));
    }

    if (!root.IsMap() || !root["command"] || !root["command"].IsScalar()) {
        spdlog::warn("[pdp_server] dispatch: missing or malformed 'command' field");
        return make_error_response("missing or malformed 'command' field");
    }

    const std::string cmd = root["command"].as<std::string>();
    if (cmd == "decide") {
        return handle_decide(root["attributes"], cancel);
    }
    if (cmd == "stats") {
        return handle_stats();
    }
    if (cmd == "policy_reload") {
        return handle_reload();
    }

    spdlog::warn("[pdp_server] dispatch: unknown command '{}'", cmd);
    return make_error_response(fmt::format("unknown command '{}'", cmd));
}

// ---------------------------------------------------------------------------
// handle_decide
//   속성 형식 오류는 판정이 아니라 요청 오류로 응답한다 (통계 미집계).
// ---------------------------------------------------------------------------
std::string PdpServer::handle_decide(const YAML::Node& attributes, const CancellationToken* cancel) {
    auto request = RequestParser::from_node(attributes);
    if (!request) {
        spdlog::warn("[pdp_server] invalid decide request: {}", describe(request.error()));
        return make_error_response(fmt::format("invalid request: {}", describe(request.error())));
    }

    const std::uint64_t request_id = next_request_id_.fetch_add(1, std::memory_order_relaxed);
    const auto          started    = std::chrono::steady_clock::now();

    const Decision decision = store_->decide(*request, resolver_, cancel);

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    stats_->on_decision(decision.effect);

    DecisionLog entry{
        .request_id      = request_id,
        .effect          = decision.effect,
        .generation      = decision.generation,
        .attribute_count = request->size(),
        .timestamp       = std::chrono::system_clock::now(),
        .duration        = elapsed,
    };
    for (const auto& obligation : decision.obligations) {
        entry.obligations.push_back(obligation.attribute_id);
    }
    if (decision.reason) {
        entry.reason = describe(*decision.reason);
    }
    logger_->log_decision(entry);

    return make_ok_response(serialize_decision(decision));
}

// ---------------------------------------------------------------------------
// handle_stats
//   captured_at 은 Unix epoch 밀리초로 직렬화한다.
// ---------------------------------------------------------------------------
std::string PdpServer::handle_stats() const {
    const StatsSnapshot s = stats_->snapshot();
    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        s.captured_at.time_since_epoch()).count();

    return make_ok_response(fmt::format(
        R"({{"total_decisions":{},"permits":{},"denies":{},"not_applicable":{},"indeterminate":{},)"
        R"("reloads":{},"failed_reloads":{},"generation":{},"dps":{:.4f},"indeterminate_rate":{:.4f},)"
        R"("captured_at_ms":{}}})",
        s.total_decisions,
        s.permits,
        s.denies,
        s.not_applicable,
        s.indeterminate,
        s.reloads,
        s.failed_reloads,
        store_->generation(),
        s.dps,
        s.indeterminate_rate,
        epoch_ms));
}

std::string PdpServer::handle_reload() {
    auto result = reload("command");
    if (!result) {
        return make_error_response(describe(result.error()));
    }
    return make_ok_response(fmt::format(R"({{"generation":{}}})", *result));
}
