// ---------------------------------------------------------------------------
// test_pdp_server.cpp
//
// PdpServer 단위 테스트.
//
// [테스트 범위]
// - "decide"        → effect / generation / obligations / reason 응답
// - 정책 미게시 상태의 decide → Indeterminate (NoPolicy)
// - 잘못된 attributes → {"ok":false}, 판정 통계 미집계
// - "stats"         → 카운터와 generation
// - "policy_reload" → 파일 재로딩, 실패 시 기존 generation 유지
// - 동시 reload: 응답과 감사 로그의 generation 은 각 reload 자신의 것
// - resolver 사용 시: 판정은 평가 풀에서 수행, 클라이언트가 끊기면 취소
// - 미지원 커맨드 / command 누락 / 파싱 불가 본문 → {"ok":false,"error":...}
// - 잘못된 프레임 (0-length, 과대 길이) → 응답 없이 연결 종료
// - 한 연결에서 여러 요청, 여러 클라이언트 동시 접속
// - run() 전 stop() → 크래시/hang 없음
//
// [테스트 패턴]
// - 각 테스트는 임시 소켓 경로와 임시 정책 파일을 사용한다.
// - 서버는 전용 io_context 를 백그라운드 스레드에서 구동한다.
// - 클라이언트는 별도 io_context 의 동기 소켓을 사용한다.
// - 응답 JSON 은 yaml-cpp 로 읽어 필드를 검증한다.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"
#include "policy/evaluation_session.hpp"
#include "policy/policy_store.hpp"
#include "server/pdp_server.hpp"
#include "stats/stats_collector.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace asio = boost::asio;
using stream_protocol = asio::local::stream_protocol;

namespace {

constexpr const char* kPermitPolicy = R"(
attributes:
  user.role: string
  audit.tag: string
  client.ip: address
policies:
  id: root
  alg: DenyOverrides
  rules:
    - id: deny-guest
      effect: Deny
      condition:
        equal:
          - attr: user.role
          - val: { type: string, content: guest }
    - id: allow
      effect: Permit
      target:
        - contains:
            - val: { type: network, content: 10.0.0.0/8 }
            - attr: client.ip
      obligations:
        - audit.tag: { val: { type: string, content: internal } }
)";

constexpr const char* kDenyAllPolicy = R"(
policies:
  id: root
  alg: FirstApplicable
  rules:
    - id: deny
      effect: Deny
)";

constexpr const char* kResolvedRolePolicy = R"(
attributes:
  user.role: string
policies:
  id: root
  alg: FirstApplicable
  rules:
    - id: admin-only
      effect: Permit
      condition:
        equal:
          - attr: user.role
          - val: { type: string, content: admin }
)";

// 임시 경로 생성 (PID + 단조 카운터로 테스트 간 충돌 방지)
std::filesystem::path temp_path(const char* tag, const char* ext) {
    static std::atomic<int> counter{0};
    return std::filesystem::path("/tmp") /
           ("test_pdp_" + std::to_string(::getpid()) +
            "_" + std::to_string(counter.fetch_add(1)) +
            "_" + tag + ext);
}

std::array<uint8_t, 4> encode_le4(uint32_t v) {
    return {
        static_cast<uint8_t>(v),
        static_cast<uint8_t>(v >> 8),
        static_cast<uint8_t>(v >> 16),
        static_cast<uint8_t>(v >> 24),
    };
}

uint32_t decode_le4(const std::array<uint8_t, 4>& b) {
    return static_cast<uint32_t>(b[0])
         | (static_cast<uint32_t>(b[1]) << 8)
         | (static_cast<uint32_t>(b[2]) << 16)
         | (static_cast<uint32_t>(b[3]) << 24);
}

void write_file(const std::filesystem::path& path, std::string_view content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

// 감사 로그에서 event 가 일치하는 JSON 레코드만 읽는다
std::vector<YAML::Node> read_audit_records(const std::filesystem::path& path, std::string_view event) {
    std::vector<YAML::Node> records;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        const auto brace = line.find('{');
        if (brace == std::string::npos) {
            continue;
        }
        YAML::Node record = YAML::Load(line.substr(brace));
        if (record["event"] && record["event"].as<std::string>() == event) {
            records.push_back(record);
        }
    }
    return records;
}

// ---------------------------------------------------------------------------
// GatedResolver
//   release() 전까지 resolve() 가 막힌다. 항상 role "admin" 을 돌려준다.
// ---------------------------------------------------------------------------
class GatedResolver final : public AttributeResolver {
public:
    std::expected<std::optional<AttributeValue>, std::string>
    resolve(std::string_view /*id*/, const AttributeType& /*type*/, const Request& /*request*/) override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return released_; });
        return std::optional<AttributeValue>{AttributeValue::string("admin")};
    }

    bool wait_entered(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return entered_; });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex              mutex_;
    std::condition_variable cv_;
    bool                    entered_{false};
    bool                    released_{false};
};

// ---------------------------------------------------------------------------
// UdsSyncClient
//   동기 UDS 클라이언트. 자체 io_context 로 서버 ioc 와 분리된다.
// ---------------------------------------------------------------------------
struct UdsSyncClient {
    asio::io_context        ioc;
    stream_protocol::socket sock{ioc};

    void connect(const std::filesystem::path& path) {
        sock.connect(stream_protocol::endpoint{path.string()});
    }

    void send(std::string_view body) {
        const auto hdr = encode_le4(static_cast<uint32_t>(body.size()));
        std::array<asio::const_buffer, 2> bufs{
            asio::buffer(hdr),
            asio::buffer(body.data(), body.size()),
        };
        asio::write(sock, bufs);
    }

    // 서버가 소켓을 닫으면 빈 문자열
    std::string recv() {
        std::array<uint8_t, 4> hdr{};
        boost::system::error_code ec;
        asio::read(sock, asio::buffer(hdr), ec);
        if (ec) { return {}; }

        const uint32_t len = decode_le4(hdr);
        if (len == 0 || len > 16u * 1024u * 1024u) { return {}; }

        std::string body(len, '\0');
        asio::read(sock, asio::buffer(body), ec);
        if (ec) { return {}; }
        return body;
    }

    void send_raw_header(uint32_t fake_len) {
        const auto hdr = encode_le4(fake_len);
        boost::system::error_code ec;
        asio::write(sock, asio::buffer(hdr), ec);
    }

    YAML::Node call(std::string_view body) {
        send(body);
        const std::string resp = recv();
        return resp.empty() ? YAML::Node{} : YAML::Load(resp);
    }
};

} // namespace

// ---------------------------------------------------------------------------
// PdpServerTest 픽스처
// ---------------------------------------------------------------------------
class PdpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        socket_path_ = temp_path("srv", ".sock");
        policy_path_ = temp_path("policy", ".yaml");
        log_path_    = temp_path("audit", ".log");
        write_file(policy_path_, kPermitPolicy);

        PdpConfig config{
            .policy_path    = policy_path_.string(),
            .socket_path    = socket_path_.string(),
            .log_path       = log_path_.string(),
            .log_level      = "debug",
            .worker_threads = 1,
        };
        store_  = std::make_shared<PolicyStore>();
        stats_  = std::make_shared<StatsCollector>();
        logger_ = std::make_shared<StructuredLogger>(LogLevel::kDebug, log_path_);
        ioc_    = std::make_unique<asio::io_context>();
        server_ = std::make_unique<PdpServer>(config, store_, stats_, logger_, *ioc_, server_resolver());
    }

    // 서버에 넘길 resolver (기본: 없음)
    virtual AttributeResolver* server_resolver() { return nullptr; }

    void TearDown() override {
        stop_server();
        server_.reset();
        std::filesystem::remove(socket_path_);
        std::filesystem::remove(policy_path_);
        std::filesystem::remove(log_path_);
    }

    void start_server() {
        asio::co_spawn(*ioc_, server_->run(), asio::detached);
        server_thread_ = std::thread([this]() { ioc_->run(); });
    }

    void stop_server() {
        if (server_) { server_->stop(); }
        ioc_->stop();
        if (server_thread_.joinable()) { server_thread_.join(); }
    }

    bool wait_for_socket(std::chrono::milliseconds timeout = std::chrono::seconds{2}) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (std::filesystem::exists(socket_path_)) { return true; }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        return false;
    }

    std::filesystem::path              socket_path_;
    std::filesystem::path              policy_path_;
    std::filesystem::path              log_path_;
    std::shared_ptr<PolicyStore>       store_;
    std::shared_ptr<StatsCollector>    stats_;
    std::shared_ptr<StructuredLogger>  logger_;
    std::unique_ptr<asio::io_context>  ioc_;
    std::unique_ptr<PdpServer>         server_;
    std::thread                        server_thread_;
};

// ---------------------------------------------------------------------------
// dispatch (소켓 없이)
// ---------------------------------------------------------------------------
TEST_F(PdpServerTest, Dispatch_DecideWithoutPolicyIsIndeterminate) {
    const YAML::Node resp = YAML::Load(server_->dispatch(R"({"command":"decide","attributes":{}})"));

    ASSERT_TRUE(resp["ok"].as<bool>());
    EXPECT_EQ(resp["payload"]["effect"].as<std::string>(), "Indeterminate");
    EXPECT_EQ(resp["payload"]["generation"].as<std::uint64_t>(), 0u);
    EXPECT_EQ(resp["payload"]["reason"]["kind"].as<std::string>(), "NoPolicy");
    EXPECT_EQ(stats_->snapshot().indeterminate, 1u);
}

TEST_F(PdpServerTest, Dispatch_DecidePermitWithObligations) {
    ASSERT_TRUE(server_->reload("startup").has_value());

    const YAML::Node resp = YAML::Load(server_->dispatch(R"({
        "command": "decide",
        "attributes": {
            "user.role": {"type": "string",  "value": "dev"},
            "client.ip": {"type": "address", "value": "10.2.3.4"}
        }
    })"));

    ASSERT_TRUE(resp["ok"].as<bool>());
    const YAML::Node payload = resp["payload"];
    EXPECT_EQ(payload["effect"].as<std::string>(), "Permit");
    EXPECT_EQ(payload["generation"].as<std::uint64_t>(), 1u);
    EXPECT_FALSE(payload["reason"]);
    ASSERT_EQ(payload["obligations"].size(), 1u);
    EXPECT_EQ(payload["obligations"][0]["id"].as<std::string>(), "audit.tag");
    EXPECT_EQ(payload["obligations"][0]["type"].as<std::string>(), "string");
    EXPECT_EQ(payload["obligations"][0]["value"].as<std::string>(), "internal");

    const auto snap = stats_->snapshot();
    EXPECT_EQ(snap.permits, 1u);
    EXPECT_EQ(snap.reloads, 1u);
}

TEST_F(PdpServerTest, Dispatch_MissingAttributeIsIndeterminateWithPath) {
    ASSERT_TRUE(server_->reload("startup").has_value());

    // user.role 없음 → deny-guest 조건이 해석 실패
    const YAML::Node resp = YAML::Load(server_->dispatch(R"({
        "command": "decide",
        "attributes": {"client.ip": {"type": "address", "value": "192.168.0.1"}}
    })"));

    ASSERT_TRUE(resp["ok"].as<bool>());
    const YAML::Node reason = resp["payload"]["reason"];
    ASSERT_TRUE(reason);
    EXPECT_EQ(resp["payload"]["effect"].as<std::string>(), "Indeterminate");
    EXPECT_EQ(reason["kind"].as<std::string>(), "ResolutionError");
    ASSERT_EQ(reason["path"].size(), 2u);
    EXPECT_EQ(reason["path"][0].as<std::string>(), "root");
    EXPECT_EQ(reason["path"][1].as<std::string>(), "deny-guest");
}

TEST_F(PdpServerTest, Dispatch_InvalidAttributesAreNotCounted) {
    const YAML::Node resp = YAML::Load(server_->dispatch(
        R"({"command":"decide","attributes":{"n":{"type":"integer","value":"many"}}})"));

    EXPECT_FALSE(resp["ok"].as<bool>());
    EXPECT_NE(resp["error"].as<std::string>().find("invalid request"), std::string::npos);
    EXPECT_EQ(stats_->snapshot().total_decisions, 0u);
}

TEST_F(PdpServerTest, Dispatch_MalformedBodyIsError) {
    const YAML::Node resp = YAML::Load(server_->dispatch("{\"command\": [unclosed"));
    EXPECT_FALSE(resp["ok"].as<bool>());
    EXPECT_NE(resp["error"].as<std::string>().find("malformed request"), std::string::npos);
}

TEST_F(PdpServerTest, Dispatch_ReloadFailureKeepsGeneration) {
    ASSERT_TRUE(server_->reload("startup").has_value());

    write_file(policy_path_, "policies: { id: p, alg: NoSuchAlg, rules: [] }");
    const YAML::Node failed = YAML::Load(server_->dispatch(R"({"command":"policy_reload"})"));
    EXPECT_FALSE(failed["ok"].as<bool>());
    EXPECT_EQ(store_->generation(), 1u);

    write_file(policy_path_, kDenyAllPolicy);
    const YAML::Node ok = YAML::Load(server_->dispatch(R"({"command":"policy_reload"})"));
    ASSERT_TRUE(ok["ok"].as<bool>());
    EXPECT_EQ(ok["payload"]["generation"].as<std::uint64_t>(), 2u);

    const auto snap = stats_->snapshot();
    EXPECT_EQ(snap.reloads, 3u);
    EXPECT_EQ(snap.failed_reloads, 1u);
}

// ---------------------------------------------------------------------------
// ConcurrentReloadsReportTheirOwnGeneration
//   reload 가 겹쳐도 반환값과 감사 로그의 generation 은 각 호출이 게시한
//   것이어야 한다. 합치면 1..N 이 한 번씩 나온다.
// ---------------------------------------------------------------------------
TEST_F(PdpServerTest, ConcurrentReloadsReportTheirOwnGeneration) {
    constexpr int kThreads          = 4;
    constexpr int kReloadsPerThread = 10;

    std::vector<std::vector<std::uint64_t>> returned(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t, &returned]() {
            for (int i = 0; i < kReloadsPerThread; ++i) {
                auto result = server_->reload("command");
                if (result) {
                    returned[static_cast<std::size_t>(t)].push_back(*result);
                }
            }
        });
    }
    for (auto& th : threads) { th.join(); }

    std::vector<std::uint64_t> from_calls;
    for (const auto& v : returned) {
        from_calls.insert(from_calls.end(), v.begin(), v.end());
    }
    std::sort(from_calls.begin(), from_calls.end());

    std::vector<std::uint64_t> from_log;
    for (const auto& record : read_audit_records(log_path_, "policy_reload")) {
        EXPECT_TRUE(record["success"].as<bool>());
        from_log.push_back(record["generation"].as<std::uint64_t>());
    }
    std::sort(from_log.begin(), from_log.end());

    constexpr std::size_t kTotal = kThreads * kReloadsPerThread;
    ASSERT_EQ(from_calls.size(), kTotal);
    ASSERT_EQ(from_log.size(), kTotal);
    for (std::size_t i = 0; i < kTotal; ++i) {
        EXPECT_EQ(from_calls[i], i + 1);
        EXPECT_EQ(from_log[i], i + 1) << "audit log reported another reload's generation";
    }
}

TEST(PdpServerConfig, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("WARN"),  LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::kError);
    EXPECT_EQ(parse_log_level("info"),  LogLevel::kInfo);
    EXPECT_EQ(parse_log_level("bogus"), LogLevel::kInfo);
}

// ---------------------------------------------------------------------------
// 소켓 경유
// ---------------------------------------------------------------------------
TEST_F(PdpServerTest, DecideOverSocket) {
    ASSERT_TRUE(server_->reload("startup").has_value());
    start_server();
    ASSERT_TRUE(wait_for_socket()) << "UDS socket not created within 2s";

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));

    const YAML::Node resp = client.call(R"({
        "command": "decide",
        "attributes": {"user.role": {"type": "string", "value": "guest"}}
    })");
    ASSERT_TRUE(resp.IsMap());
    ASSERT_TRUE(resp["ok"].as<bool>());
    EXPECT_EQ(resp["payload"]["effect"].as<std::string>(), "Deny");
}

TEST_F(PdpServerTest, MultipleRequestsOnOneConnection) {
    ASSERT_TRUE(server_->reload("startup").has_value());
    start_server();
    ASSERT_TRUE(wait_for_socket());

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));

    for (int i = 0; i < 3; ++i) {
        const YAML::Node resp = client.call(R"({
            "command": "decide",
            "attributes": {"user.role": {"type": "string", "value": "guest"}}
        })");
        ASSERT_TRUE(resp.IsMap()) << "request " << i;
        EXPECT_TRUE(resp["ok"].as<bool>());
    }

    const YAML::Node stats = client.call(R"({"command":"stats"})");
    ASSERT_TRUE(stats.IsMap());
    ASSERT_TRUE(stats["ok"].as<bool>());
    EXPECT_EQ(stats["payload"]["total_decisions"].as<std::uint64_t>(), 3u);
    EXPECT_EQ(stats["payload"]["denies"].as<std::uint64_t>(), 3u);
    EXPECT_EQ(stats["payload"]["generation"].as<std::uint64_t>(), 1u);
    EXPECT_TRUE(stats["payload"]["captured_at_ms"]);
}

TEST_F(PdpServerTest, PolicyReloadOverSocket) {
    start_server();
    ASSERT_TRUE(wait_for_socket());

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));

    const YAML::Node reload = client.call(R"({"command":"policy_reload"})");
    ASSERT_TRUE(reload.IsMap());
    ASSERT_TRUE(reload["ok"].as<bool>());
    EXPECT_EQ(reload["payload"]["generation"].as<std::uint64_t>(), 1u);
}

TEST_F(PdpServerTest, UnknownCommand_ReturnsError) {
    start_server();
    ASSERT_TRUE(wait_for_socket());

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));

    const YAML::Node resp = client.call(R"({"command":"xyz_unknown_command"})");
    ASSERT_TRUE(resp.IsMap());
    EXPECT_FALSE(resp["ok"].as<bool>());
    EXPECT_NE(resp["error"].as<std::string>().find("xyz_unknown_command"), std::string::npos);
}

TEST_F(PdpServerTest, MissingCommandField_ReturnsError) {
    start_server();
    ASSERT_TRUE(wait_for_socket());

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));

    const YAML::Node resp = client.call(R"({"attributes":{}})");
    ASSERT_TRUE(resp.IsMap());
    EXPECT_FALSE(resp["ok"].as<bool>());
}

TEST_F(PdpServerTest, MalformedFrame_ZeroBodyLength_Handled) {
    start_server();
    ASSERT_TRUE(wait_for_socket());

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));

    client.send_raw_header(0u);
    EXPECT_TRUE(client.recv().empty())
        << "Server must close connection on zero-length body without sending response";
}

TEST_F(PdpServerTest, MalformedFrame_OversizedBodyLength_Handled) {
    start_server();
    ASSERT_TRUE(wait_for_socket());

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));

    client.send_raw_header(0xFFFFFFFFu);
    EXPECT_TRUE(client.recv().empty());
}

TEST_F(PdpServerTest, MultipleClients_Concurrent) {
    constexpr int kClientCount = 4;

    ASSERT_TRUE(server_->reload("startup").has_value());
    start_server();
    ASSERT_TRUE(wait_for_socket());

    std::vector<std::string> responses(static_cast<std::size_t>(kClientCount));
    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(kClientCount));

    for (int i = 0; i < kClientCount; ++i) {
        threads.emplace_back([this, i, &responses]() {
            UdsSyncClient client;
            try {
                client.connect(socket_path_);
                client.send(R"({"command":"decide","attributes":{"user.role":{"type":"string","value":"guest"}}})");
                responses[static_cast<std::size_t>(i)] = client.recv();
            } catch (const std::exception& ex) {
                responses[static_cast<std::size_t>(i)] =
                    std::string("EXCEPTION: ") + ex.what();
            }
        });
    }

    for (auto& t : threads) { t.join(); }

    for (int i = 0; i < kClientCount; ++i) {
        const auto& resp = responses[static_cast<std::size_t>(i)];
        ASSERT_FALSE(resp.empty()) << "Client " << i << " must receive a response";
        EXPECT_NE(resp.find("Deny"), std::string::npos) << "Client " << i << ": " << resp;
    }
    EXPECT_EQ(stats_->snapshot().denies, static_cast<std::uint64_t>(kClientCount));
}

TEST_F(PdpServerTest, StopBeforeRun_NoCrash) {
    ASSERT_NO_THROW(server_->stop());
}

// ---------------------------------------------------------------------------
// resolver 가 붙은 서버
//   user.role 은 요청에 없으므로 GatedResolver 로 해석된다.
// ---------------------------------------------------------------------------
class PdpServerResolverTest : public PdpServerTest {
protected:
    void SetUp() override {
        PdpServerTest::SetUp();
        write_file(policy_path_, kResolvedRolePolicy);
    }

    void TearDown() override {
        // 평가 스레드가 막힌 채로 서버를 파괴하지 않도록 먼저 풀어 준다
        resolver_.release();
        PdpServerTest::TearDown();
    }

    AttributeResolver* server_resolver() override { return &resolver_; }

    bool wait_for_decisions(std::uint64_t count,
                            std::chrono::milliseconds timeout = std::chrono::seconds{2}) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (stats_->snapshot().total_decisions >= count) { return true; }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        return false;
    }

    GatedResolver resolver_;
};

TEST_F(PdpServerResolverTest, ResolvedAttributeDecidesOverSocket) {
    ASSERT_TRUE(server_->reload("startup").has_value());
    start_server();
    ASSERT_TRUE(wait_for_socket());

    UdsSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));
    client.send(R"({"command":"decide","attributes":{}})");

    ASSERT_TRUE(resolver_.wait_entered(std::chrono::seconds{2}));
    resolver_.release();

    const std::string resp = client.recv();
    ASSERT_FALSE(resp.empty());
    const YAML::Node node = YAML::Load(resp);
    ASSERT_TRUE(node["ok"].as<bool>());
    EXPECT_EQ(node["payload"]["effect"].as<std::string>(), "Permit");
}

TEST_F(PdpServerResolverTest, ClientDisconnectCancelsPendingDecision) {
    ASSERT_TRUE(server_->reload("startup").has_value());
    start_server();
    ASSERT_TRUE(wait_for_socket());

    {
        UdsSyncClient client;
        ASSERT_NO_THROW(client.connect(socket_path_));
        client.send(R"({"command":"decide","attributes":{}})");
        ASSERT_TRUE(resolver_.wait_entered(std::chrono::seconds{2}));

        boost::system::error_code ec;
        client.sock.close(ec);
        ASSERT_FALSE(ec) << ec.message();
    }

    // 서버가 EOF 를 감지할 시간을 준 뒤 resolver 를 푼다
    std::this_thread::sleep_for(std::chrono::milliseconds{200});
    resolver_.release();

    ASSERT_TRUE(wait_for_decisions(1));
    const auto snap = stats_->snapshot();
    EXPECT_EQ(snap.indeterminate, 1u);
    EXPECT_EQ(snap.permits, 0u);

    // 통계 갱신 직후에 감사 로그가 기록된다
    std::vector<YAML::Node> records;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
    do {
        records = read_audit_records(log_path_, "decision");
        if (!records.empty()) { break; }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    } while (std::chrono::steady_clock::now() < deadline);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["effect"].as<std::string>(), "Indeterminate");
    EXPECT_NE(records[0]["reason"].as<std::string>().find("Cancelled"), std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
