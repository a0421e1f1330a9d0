// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"
#include "audit/record_codec.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kLoggerName = "cmdgate";

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::floor<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration - seconds);

    const std::time_t time_t_val = static_cast<std::time_t>(seconds.count());
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

void write_optional(std::ostringstream& json, const std::optional<std::string>& value) {
    if (value) {
        json << '"' << RecordCodec::escape_json(*value) << '"';
    } else {
        json << "null";
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
int StructuredLogger::to_spdlog_level(LogLevel level) const {
    switch (level) {
        case LogLevel::kDebug:
            return static_cast<int>(spdlog::level::debug);
        case LogLevel::kInfo:
            return static_cast<int>(spdlog::level::info);
        case LogLevel::kWarn:
            return static_cast<int>(spdlog::level::warn);
        case LogLevel::kError:
            return static_cast<int>(spdlog::level::err);
        default:
            return static_cast<int>(spdlog::level::info);
    }
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   bool                         console)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        // 로그 디렉터리 생성
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        // 싱크 생성: stderr + rotating file
        std::vector<spdlog::sink_ptr> sinks;

        if (console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
        }

        // Rotating file sink (10MB, 3개 파일 유지)
        const size_t max_file_size = 10 * 1024 * 1024;
        const size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        // 로거 생성 (스레드 안전)
        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(static_cast<spdlog::level::level_enum>(to_spdlog_level(min_level)));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");

        // 매 로그마다 파일을 플러시하도록 설정
        logger_->flush_on(spdlog::level::trace);

        spdlog::drop(kLoggerName);
        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (!logger_) {
        return;
    }
    try {
        logger_->flush();
        spdlog::drop(kLoggerName);
    } catch (const std::exception& ex) {
        // 소멸자에서 예외를 전파하지 않는다
        fprintf(stderr, "cmdgate: logger shutdown failed: %s\n", ex.what());
    }
}

// ---------------------------------------------------------------------------
// log_verdict: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_verdict(const VerdictLog& entry) {
    const bool      blocked = (entry.tier == SafetyTier::kBlocked);
    const LogLevel  level   = blocked ? LogLevel::kWarn : LogLevel::kInfo;
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"verdict","user":")" << RecordCodec::escape_json(entry.user)
         << R"(","session_id":)";
    write_optional(json, entry.session_id);
    json << R"(,"command":")" << RecordCodec::escape_json(entry.command)
         << R"(","safety_level":")" << tier_name(entry.tier) << R"(","matched_rule":)";
    write_optional(json, entry.matched_rule);
    json << R"(,"reason":)";
    write_optional(json, entry.reason);
    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << '}';

    if (blocked) {
        logger_->warn(json.str());
    } else {
        logger_->info(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_audit_failure: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_audit_failure(const AuditFailureLog& entry) {
    if (!logger_) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"audit_failure","operation":")" << RecordCodec::escape_json(entry.operation)
         << R"(","code":")" << audit_error_name(entry.code) << R"(","message":")"
         << RecordCodec::escape_json(entry.message) << R"(","path":")"
         << RecordCodec::escape_json(entry.path) << R"(","timestamp":")"
         << format_iso8601(entry.timestamp) << R"("})";

    logger_->error(json.str());
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
