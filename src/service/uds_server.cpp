// ---------------------------------------------------------------------------
// uds_server.cpp
//
// GateServer 구현: Unix Domain Socket 판정/감사 데몬.
//
// [프로토콜]
//   요청/응답 모두 4byte LE 길이 프리픽스 + JSON 바디.
//   요청 JSON 은 yaml-cpp 로 파싱한다 (JSON 은 YAML flow 문법의 부분집합).
//
// [지원 커맨드]
//   "evaluate" / "append" / "query" / "stats"
//   기타 → error 응답 (연결은 유지)
//
// [격리 원칙]
//   한 클라이언트의 I/O 오류는 해당 연결만 닫는다. 감사 저장소 오류는
//   에러 응답 + audit_failure 이벤트로 보고하고 데몬은 계속 동작한다.
// ---------------------------------------------------------------------------

#include "service/uds_server.hpp"
#include "audit/record_codec.hpp"
#include "logger/structured_logger.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

// ---------------------------------------------------------------------------
// make_ok_response
//   {"ok":true,"payload":<data>}
// ---------------------------------------------------------------------------
std::string make_ok_response(std::string_view data) {
    return fmt::format(R"({{"ok":true,"payload":{}}})", data);
}

// ---------------------------------------------------------------------------
// make_error_response
//   {"ok":false,"error":"<msg>"}
// ---------------------------------------------------------------------------
std::string make_error_response(std::string_view msg) {
    return fmt::format(R"({{"ok":false,"error":"{}"}})", RecordCodec::escape_json(msg));
}

std::string json_optional(const std::optional<std::string>& value) {
    if (!value) {
        return "null";
    }
    return fmt::format(R"("{}")", RecordCodec::escape_json(*value));
}

std::string serialize_verdict(const Verdict& v) {
    return fmt::format(R"({{"safety_level":"{}","reason":{},"matched_rule":{}}})",
                       tier_name(v.tier), json_optional(v.reason), json_optional(v.matched_rule));
}

std::string serialize_statistics(const AuditStatistics& s) {
    return fmt::format(
        R"({{"total":{},"executed":{},"failed_executions":{},"per_tier":{{"safe":{},"warning":{},"dangerous":{},"blocked":{}}},"dangerous_or_blocked":{},"skipped_lines":{}}})",
        s.total,
        s.executed,
        s.failed_executions,
        s.count(SafetyTier::kSafe),
        s.count(SafetyTier::kWarning),
        s.count(SafetyTier::kDangerous),
        s.count(SafetyTier::kBlocked),
        s.dangerous_or_blocked(),
        s.skipped_lines
    );
}

std::string describe(const AuditError& err) {
    return fmt::format("audit log {}: {}", audit_error_name(err.code), err.message);
}

// ---------------------------------------------------------------------------
// encode_le4 / decode_le4
// ---------------------------------------------------------------------------
std::array<uint8_t, 4> encode_le4(uint32_t val) {
    return {
        static_cast<uint8_t>(val),
        static_cast<uint8_t>(val >> 8),
        static_cast<uint8_t>(val >> 16),
        static_cast<uint8_t>(val >> 24),
    };
}

uint32_t decode_le4(const std::array<uint8_t, 4>& buf) {
    return static_cast<uint32_t>(buf[0])
         | (static_cast<uint32_t>(buf[1]) << 8)
         | (static_cast<uint32_t>(buf[2]) << 16)
         | (static_cast<uint32_t>(buf[3]) << 24);
}

// 요청 노드의 선택 문자열 필드. 스칼라가 아니면 std::nullopt.
std::optional<std::string> scalar_field(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull() || !node.IsScalar()) {
        return std::nullopt;
    }
    return node.Scalar();
}

// query 요청 → AuditFilter. 잘못된 값은 에러 메시지.
std::expected<AuditFilter, std::string> parse_filter(const YAML::Node& root) {
    AuditFilter filter{};
    filter.user       = scalar_field(root, "user");
    filter.session_id = scalar_field(root, "session_id");

    if (const auto tier = scalar_field(root, "tier")) {
        filter.tier = parse_tier(*tier);
        if (!filter.tier) {
            return std::unexpected(fmt::format("unknown tier '{}'", *tier));
        }
    }
    if (const auto since = scalar_field(root, "since")) {
        filter.since = RecordCodec::parse_timestamp(*since);
        if (!filter.since) {
            return std::unexpected(fmt::format("invalid 'since' timestamp '{}'", *since));
        }
    }
    if (const auto until = scalar_field(root, "until")) {
        filter.until = RecordCodec::parse_timestamp(*until);
        if (!filter.until) {
            return std::unexpected(fmt::format("invalid 'until' timestamp '{}'", *until));
        }
    }

    filter.limit = kDefaultQueryLimit;
    if (const auto limit = scalar_field(root, "limit")) {
        std::uint64_t value = 0;
        const auto* last = limit->data() + limit->size();
        const auto [ptr, ec] = std::from_chars(limit->data(), last, value);
        if (ec != std::errc{} || ptr != last) {
            return std::unexpected(fmt::format("invalid 'limit' value '{}'", *limit));
        }
        filter.limit = value;
    }
    return filter;
}

// 단일 클라이언트에서 수신할 최대 메시지 크기 (4MiB)
constexpr uint32_t kMaxRequestSize = 4u * 1024u * 1024u;

} // namespace

// ---------------------------------------------------------------------------
// GateServer 생성자/소멸자
// ---------------------------------------------------------------------------
GateServer::GateServer(const std::filesystem::path& socket_path,
                       EnterpriseConfig             enterprise,
                       std::shared_ptr<AuditStore>  store,
                       asio::io_context&            ioc,
                       StructuredLogger*            logger)
    : socket_path_{socket_path}
    , enterprise_{std::move(enterprise)}
    , store_{std::move(store)}
    , ioc_{ioc}
    , logger_{logger}
    , acceptor_{ioc}
{}

GateServer::~GateServer() {
    stop();
}

// ---------------------------------------------------------------------------
// stop
//   acceptor를 닫아 run()의 accept 루프를 종료한다.
// ---------------------------------------------------------------------------
void GateServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    auto close_acceptor = [this]() {
        boost::system::error_code cancel_ec;
        acceptor_.cancel(cancel_ec);
        if (cancel_ec && cancel_ec != asio::error::bad_descriptor) {
            spdlog::warn("[gate_server] stop: acceptor cancel error: {}", cancel_ec.message());
        }

        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        if (close_ec && close_ec != asio::error::bad_descriptor) {
            spdlog::warn("[gate_server] stop: acceptor close error: {}", close_ec.message());
        }
    };

    // acceptor 소유 스레드(io_context)에서 정리한다.
    if (ioc_.stopped()) {
        close_acceptor();
        return;
    }
    asio::post(ioc_, std::move(close_acceptor));
}

// ---------------------------------------------------------------------------
// run
//   기존 소켓 파일 제거 → bind/listen → accept 루프 → 소켓 파일 제거.
// ---------------------------------------------------------------------------
asio::awaitable<void> GateServer::run() {
    using stream_protocol = asio::local::stream_protocol;

    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    // 기존 소켓 파일 제거 (bind 실패 방지)
    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
    if (fs_ec && fs_ec != std::make_error_code(std::errc::no_such_file_or_directory)) {
        spdlog::error("[gate_server] failed to remove old socket {}: {}",
                      socket_path_.string(), fs_ec.message());
        co_return;
    }

    boost::system::error_code ec;
    acceptor_.open(stream_protocol(), ec);
    if (ec) {
        spdlog::error("[gate_server] open error: {}", ec.message());
        co_return;
    }

    acceptor_.bind(stream_protocol::endpoint{socket_path_.string()}, ec);
    if (ec) {
        spdlog::error("[gate_server] bind error on {}: {}", socket_path_.string(), ec.message());
        co_return;
    }

    // 같은 사용자만 접속 가능
    std::filesystem::permissions(socket_path_,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 fs_ec);
    if (fs_ec) {
        spdlog::warn("[gate_server] cannot restrict socket permissions: {}", fs_ec.message());
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("[gate_server] listen error: {}", ec.message());
        co_return;
    }

    spdlog::info("[gate_server] listening on {}", socket_path_.string());

    for (;;) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            break;
        }

        stream_protocol::socket   client_socket{ioc_};
        boost::system::error_code accept_ec;
        co_await acceptor_.async_accept(
            client_socket, asio::redirect_error(asio::use_awaitable, accept_ec));

        if (accept_ec) {
            if (accept_ec == asio::error::operation_aborted ||
                accept_ec == boost::system::errc::bad_file_descriptor) {
                spdlog::info("[gate_server] accept loop stopped");
            } else {
                spdlog::error("[gate_server] accept error: {}", accept_ec.message());
            }
            break;
        }

        asio::co_spawn(
            ioc_,
            handle_client(std::move(client_socket)),
            asio::detached
        );
    }

    std::filesystem::remove(socket_path_, fs_ec);
}

// ---------------------------------------------------------------------------
// handle_client
//   연결이 닫히거나 잘못된 프레임이 올 때까지:
//     1. 4바이트 LE 헤더로 요청 크기 읽기
//     2. JSON 바디 읽기
//     3. handle_request 디스패치
//     4. 4바이트 LE 헤더 + JSON 바디 응답 송신
// ---------------------------------------------------------------------------
asio::awaitable<void> GateServer::handle_client(
    asio::local::stream_protocol::socket socket)
{
    for (;;) {
        // ── 요청 헤더 읽기 ──────────────────────────────────────────────
        std::array<uint8_t, 4>    req_hdr{};
        boost::system::error_code hdr_ec;
        const std::size_t hdr_n = co_await asio::async_read(
            socket, asio::buffer(req_hdr),
            asio::redirect_error(asio::use_awaitable, hdr_ec));

        if (hdr_ec) {
            if (hdr_ec != asio::error::eof) {
                spdlog::warn("[gate_server] handle_client: read header error: {}", hdr_ec.message());
            }
            co_return;
        }
        if (hdr_n != 4) {
            spdlog::warn("[gate_server] handle_client: short header ({} bytes)", hdr_n);
            co_return;
        }

        const uint32_t body_len = decode_le4(req_hdr);
        if (body_len == 0 || body_len > kMaxRequestSize) {
            spdlog::warn("[gate_server] handle_client: invalid body length {}", body_len);
            co_return;
        }

        // ── 요청 바디 읽기 ──────────────────────────────────────────────
        std::vector<char>         body_buf(body_len);
        boost::system::error_code body_ec;
        const std::size_t body_n = co_await asio::async_read(
            socket, asio::buffer(body_buf),
            asio::redirect_error(asio::use_awaitable, body_ec));

        if (body_ec) {
            spdlog::warn("[gate_server] handle_client: read body error: {}", body_ec.message());
            co_return;
        }
        if (body_n != body_len) {
            spdlog::warn("[gate_server] handle_client: short body ({}/{} bytes)", body_n, body_len);
            co_return;
        }

        const std::string response_body =
            handle_request(std::string_view{body_buf.data(), body_n});

        // ── 응답 송신 ───────────────────────────────────────────────────
        const auto resp_hdr = encode_le4(static_cast<uint32_t>(response_body.size()));
        std::array<asio::const_buffer, 2> bufs{
            asio::buffer(resp_hdr),
            asio::buffer(response_body),
        };
        boost::system::error_code write_ec;
        const std::size_t write_n = co_await asio::async_write(
            socket, bufs, asio::redirect_error(asio::use_awaitable, write_ec));

        if (write_ec) {
            spdlog::warn("[gate_server] handle_client: write error: {}", write_ec.message());
            co_return;
        }
        spdlog::debug("[gate_server] response_bytes={}", write_n);
    }
}

// ---------------------------------------------------------------------------
// handle_request
// ---------------------------------------------------------------------------
std::string GateServer::handle_request(std::string_view request_json) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{request_json});
    } catch (const YAML::Exception& e) {
        spdlog::warn("[gate_server] malformed request: {}", e.what());
        return make_error_response("malformed JSON request");
    }
    if (!root.IsMap()) {
        return make_error_response("request is not a JSON object");
    }

    try {
        const auto cmd = scalar_field(root, "command");
        if (!cmd) {
            spdlog::warn("[gate_server] missing or malformed 'command' field");
            return make_error_response("missing or malformed 'command' field");
        }

        // ── evaluate ────────────────────────────────────────────────────
        if (*cmd == "evaluate") {
            const auto shell_command = scalar_field(root, "shell_command");
            if (!shell_command) {
                return make_error_response("missing 'shell_command' field");
            }
            const auto    started = std::chrono::steady_clock::now();
            const Verdict verdict = engine_.evaluate(*shell_command, enterprise_.policy);
            const auto    elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - started);

            if (logger_ != nullptr) {
                VerdictLog entry;
                entry.user         = scalar_field(root, "user").value_or("unknown");
                entry.session_id   = scalar_field(root, "session_id");
                entry.command      = *shell_command;
                entry.tier         = verdict.tier;
                entry.matched_rule = verdict.matched_rule;
                entry.reason       = verdict.reason;
                entry.timestamp    = std::chrono::system_clock::now();
                entry.duration     = elapsed;
                logger_->log_verdict(entry);
            }
            return make_ok_response(serialize_verdict(verdict));
        }

        if (*cmd != "append" && *cmd != "query" && *cmd != "stats") {
            spdlog::warn("[gate_server] unknown command '{}'", *cmd);
            return make_error_response(fmt::format("unknown command '{}'", *cmd));
        }

        if (!store_) {
            return make_error_response("audit log is disabled");
        }

        const auto report = [this](const char* operation, const AuditError& err) {
            if (logger_ != nullptr) {
                AuditFailureLog entry;
                entry.operation = operation;
                entry.code      = err.code;
                entry.message   = err.message;
                entry.path      = err.path.string();
                entry.timestamp = std::chrono::system_clock::now();
                logger_->log_audit_failure(entry);
            }
            return make_error_response(describe(err));
        };

        // ── append ──────────────────────────────────────────────────────
        if (*cmd == "append") {
            auto record = RecordCodec::from_node(root["record"], std::chrono::system_clock::now());
            if (!record) {
                return make_error_response(fmt::format("invalid record: {}", record.error().message));
            }
            if (!record->organization) {
                record->organization = enterprise_.organization;
            }
            if (!record->department) {
                record->department = enterprise_.department;
            }
            if (auto appended = store_->append(*record); !appended) {
                return report("append", appended.error());
            }
            return make_ok_response(R"({"appended":true})");
        }

        // ── query ───────────────────────────────────────────────────────
        if (*cmd == "query") {
            auto filter = parse_filter(root);
            if (!filter) {
                return make_error_response(filter.error());
            }
            auto query = store_->query(std::move(*filter));
            if (!query) {
                return report("query", query.error());
            }
            auto cursor = query->open();
            if (!cursor) {
                return report("query", cursor.error());
            }

            std::string records;
            for (const AuditRecord& record : *cursor) {
                if (!records.empty()) {
                    records += ',';
                }
                records += RecordCodec::serialize(record);
            }
            return make_ok_response(fmt::format(R"({{"records":[{}],"skipped_lines":{}}})",
                                                records, cursor->skipped_lines()));
        }

        // ── stats ───────────────────────────────────────────────────────
        auto stats = store_->statistics();
        if (!stats) {
            return report("statistics", stats.error());
        }
        return make_ok_response(serialize_statistics(*stats));

    } catch (const std::exception& e) {
        spdlog::error("[gate_server] request failed: {}", e.what());
        return make_error_response("internal error");
    }
}
