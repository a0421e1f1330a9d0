// ---------------------------------------------------------------------------
// commands.cpp
//
// cmdgate 서브커맨드 구현.
//
// [출력 규칙]
// - stdout(out): 결과만 출력한다. check 의 첫 줄은 항상 등급 이름이므로
//   셸 스크립트가 `cmdgate check -- CMD | head -1` 로 읽을 수 있다.
// - stderr(err): "cmdgate: " 접두어가 붙은 오류/경고.
// ---------------------------------------------------------------------------

#include "app/commands.hpp"
#include "audit/audit_store.hpp"
#include "audit/record_codec.hpp"
#include "logger/structured_logger.hpp"
#include "policy/policy_engine.hpp"
#include "service/uds_server.hpp"

#include <chrono>
#include <csignal>
#include <memory>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/signal_set.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

namespace {

// 감사 저장소 실패를 stderr 와 구조화 로그에 남긴다.
int report_audit_error(const char*       operation,
                       const AuditError& error,
                       StructuredLogger* logger,
                       std::ostream&     err) {
    fmt::print(err, "cmdgate: {} failed: {} ({}): {}\n", operation,
               audit_error_name(error.code), error.path.string(), error.message);
    if (logger != nullptr) {
        AuditFailureLog entry;
        entry.operation = operation;
        entry.code      = error.code;
        entry.message   = error.message;
        entry.path      = error.path.string();
        entry.timestamp = std::chrono::system_clock::now();
        logger->log_audit_failure(entry);
    }
    return kExitIoError;
}

AuditRecord base_record(const AppConfig& config, const std::optional<std::string>& user) {
    AuditRecord record{};
    record.timestamp    = std::chrono::system_clock::now();
    record.user         = resolve_user(user);
    record.organization = config.enterprise.organization;
    record.department   = config.enterprise.department;
    return record;
}

int append_record(const AuditRecord& record,
                  const AppConfig&   config,
                  StructuredLogger*  logger,
                  std::ostream&      err) {
    AuditStore store{config.security.audit_log_path};
    if (auto appended = store.append(record); !appended) {
        return report_audit_error("append", appended.error(), logger, err);
    }
    return kExitOk;
}

}  // namespace

// ---------------------------------------------------------------------------
// run_check
// ---------------------------------------------------------------------------
int run_check(const CheckOptions& options,
              const AppConfig&    config,
              StructuredLogger*   logger,
              std::ostream&       out,
              std::ostream&       err) {
    const PolicyEngine engine;

    const auto    started = std::chrono::steady_clock::now();
    const Verdict verdict = engine.evaluate(options.command, config.enterprise.policy);
    const auto    elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    fmt::print(out, "{}\n", tier_name(verdict.tier));
    if (verdict.reason) {
        fmt::print(out, "reason: {}\n", *verdict.reason);
    }
    if (verdict.matched_rule) {
        fmt::print(out, "rule: {}\n", *verdict.matched_rule);
    }

    const std::string user = resolve_user(options.user);
    if (logger != nullptr) {
        VerdictLog entry;
        entry.user         = user;
        entry.session_id   = options.session_id;
        entry.command      = options.command;
        entry.tier         = verdict.tier;
        entry.matched_rule = verdict.matched_rule;
        entry.reason       = verdict.reason;
        entry.timestamp    = std::chrono::system_clock::now();
        entry.duration     = elapsed;
        logger->log_verdict(entry);
    }

    if (options.record) {
        if (!config.security.audit_log) {
            fmt::print(err, "cmdgate: audit log is disabled in configuration, not recording\n");
        } else {
            AuditRecord record            = base_record(config, user);
            record.natural_language_input = options.input.value_or("");
            record.generated_command      = options.command;
            record.executed               = false;
            record.tier                   = verdict.tier;
            record.backend_id             = options.backend.value_or("cli");
            record.notes                  = verdict.reason;
            record.session_id             = options.session_id;
            if (const int rc = append_record(record, config, logger, err); rc != kExitOk) {
                return rc;
            }
        }
    }

    return verdict.tier == SafetyTier::kBlocked ? kExitBlocked : kExitOk;
}

// ---------------------------------------------------------------------------
// run_record
// ---------------------------------------------------------------------------
int run_record(const RecordOptions& options,
               const AppConfig&     config,
               StructuredLogger*    logger,
               std::ostream&        out,
               std::ostream&        err) {
    if (!config.security.audit_log) {
        fmt::print(err, "cmdgate: audit log is disabled in configuration, not recording\n");
        return kExitOk;
    }

    AuditRecord record            = base_record(config, options.user);
    record.natural_language_input = options.input.value_or("");
    record.generated_command      = options.command;
    record.executed               = options.executed;
    record.exit_code              = options.exit_code;
    record.tier                   = options.tier;
    record.backend_id             = options.backend.value_or("cli");
    record.notes                  = options.notes;
    record.session_id             = options.session_id;

    const int rc = append_record(record, config, logger, err);
    if (rc == kExitOk) {
        fmt::print(out, "recorded\n");
    }
    return rc;
}

// ---------------------------------------------------------------------------
// run_query
// ---------------------------------------------------------------------------
int run_query(const AuditFilter& filter,
              const AppConfig&   config,
              StructuredLogger*  logger,
              std::ostream&      out,
              std::ostream&      err) {
    const AuditStore store{config.security.audit_log_path};

    auto query = store.query(filter);
    if (!query) {
        return report_audit_error("query", query.error(), logger, err);
    }
    auto cursor = query->open();
    if (!cursor) {
        return report_audit_error("query", cursor.error(), logger, err);
    }

    for (const AuditRecord& record : *cursor) {
        fmt::print(out, "{}\n", RecordCodec::serialize(record));
    }
    if (cursor->skipped_lines() > 0) {
        fmt::print(err, "cmdgate: skipped {} unreadable line(s)\n", cursor->skipped_lines());
    }
    return kExitOk;
}

// ---------------------------------------------------------------------------
// run_stats
// ---------------------------------------------------------------------------
int run_stats(const AppConfig&  config,
              StructuredLogger* logger,
              std::ostream&     out,
              std::ostream&     err) {
    const AuditStore store{config.security.audit_log_path};

    const auto stats = store.statistics();
    if (!stats) {
        return report_audit_error("statistics", stats.error(), logger, err);
    }

    fmt::print(out, "total: {}\n", stats->total);
    fmt::print(out, "executed: {}\n", stats->executed);
    fmt::print(out, "failed_executions: {}\n", stats->failed_executions);
    for (const auto tier : kAllSafetyTiers) {
        fmt::print(out, "{}: {}\n", tier_name(tier), stats->count(tier));
    }
    fmt::print(out, "dangerous_or_blocked: {}\n", stats->dangerous_or_blocked());
    fmt::print(out, "skipped_lines: {}\n", stats->skipped_lines);
    return kExitOk;
}

// ---------------------------------------------------------------------------
// run_serve
// ---------------------------------------------------------------------------
int run_serve(const ServeOptions& options,
              const AppConfig&    config,
              StructuredLogger*   logger) {
    const std::filesystem::path socket_path =
        options.socket_path.value_or(config.service.socket_path);

    std::shared_ptr<AuditStore> store;
    if (config.security.audit_log) {
        store = std::make_shared<AuditStore>(config.security.audit_log_path);
    } else {
        spdlog::warn("serve: audit log disabled, append/query/stats will be rejected");
    }

    spdlog::info("Starting cmdgate daemon");
    spdlog::info("Socket: {}", socket_path.string());
    spdlog::info("Audit log: {}", config.security.audit_log_path);
    spdlog::info("Compliance mode: {}, allowed={}, blocked={}",
                 config.enterprise.policy.compliance_mode,
                 config.enterprise.policy.allow_list.size(),
                 config.enterprise.policy.deny_list.size());

    boost::asio::io_context ioc;
    GateServer server{socket_path, config.enterprise, store, ioc, logger};

    // ── 종료 시그널 처리 ────────────────────────────────────────────────
    bool                    signalled = false;
    boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        signalled = true;
        spdlog::info("serve: received signal {}, shutting down", signo);
        server.stop();
        ioc.stop();
    });

    boost::asio::co_spawn(ioc, server.run(), [&](std::exception_ptr eptr) {
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& e) {
                spdlog::error("serve: server failed: {}", e.what());
            }
        }
        // accept 루프가 끝나면 (bind 실패 포함) 데몬도 종료한다
        signals.cancel();
        ioc.stop();
    });

    ioc.run();

    if (!signalled) {
        // 시그널 없이 accept 루프가 끝났다 = 소켓 bind/listen 실패
        spdlog::error("serve: daemon stopped unexpectedly (see previous errors)");
        return kExitIoError;
    }
    spdlog::info("cmdgate daemon stopped");
    return kExitOk;
}
