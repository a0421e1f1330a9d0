#include "app/command_line.hpp"
#include "app/commands.hpp"
#include "logger/structured_logger.hpp"
#include "policy/policy_loader.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// Helper: 설정 로드 (실패 시 경고 후 기본값)
// ---------------------------------------------------------------------------
namespace {

AppConfig load_config(const CommandLine& cl) {
    const std::filesystem::path path = cl.config_path.value_or(PolicyLoader::default_config_path());

    auto loaded = PolicyLoader::load(path);
    if (loaded) {
        return std::move(*loaded);
    }

    spdlog::warn("config: {}; falling back to defaults", loaded.error());
    // 빈 문서 = 모든 필드 기본값 (경로 확장 포함)
    auto defaults = PolicyLoader::parse("");
    if (defaults) {
        return std::move(*defaults);
    }
    return AppConfig{};
}

// 구조화 로거 생성. 실패해도 명령은 계속 수행한다 (로그만 잃는다).
std::unique_ptr<StructuredLogger> make_logger(const AppConfig& config, bool console) {
    try {
        auto logger = std::make_unique<StructuredLogger>(parse_log_level(config.global.log_level),
                                                         config.global.log_path, console);
        // 모듈 코드의 spdlog::xxx() 호출도 같은 싱크로 보낸다.
        // 기본 로거 이름은 "cmdgate" 와 달라야 한다 (StructuredLogger 소멸 시 drop 대상).
        const auto& sinks = logger->spdlog_logger()->sinks();
        auto diag = std::make_shared<spdlog::logger>("cmdgate-diag", sinks.begin(), sinks.end());
        diag->set_level(logger->spdlog_logger()->level());
        spdlog::set_default_logger(diag);
        return logger;
    } catch (const std::runtime_error& e) {
        spdlog::warn("logger: {}; continuing without diagnostic log file", e.what());
        return nullptr;
    }
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 초기 콘솔 로거: stdout 은 결과 전용이므로 stderr 로 ─────────────
    spdlog::set_default_logger(spdlog::stderr_color_mt("cmdgate-console"));
    spdlog::set_level(spdlog::level::warn);

    // ── 명령행 파싱 ────────────────────────────────────────────────────
    const std::vector<std::string_view> args(argv + 1, argv + argc);
    const auto cl = parse_command_line(args);
    if (!cl) {
        std::cerr << "cmdgate: " << cl.error() << "\n\n" << usage();
        return kExitUsage;
    }
    if (cl->subcommand == Subcommand::kHelp) {
        std::cout << usage();
        return kExitOk;
    }

    // ── 설정/로깅 초기화 ───────────────────────────────────────────────
    const bool serve = (cl->subcommand == Subcommand::kServe);
    if (serve) {
        spdlog::set_level(spdlog::level::info);
    }
    const AppConfig config = load_config(*cl);
    const auto      logger = make_logger(config, serve);

    // ── 서브커맨드 실행 ────────────────────────────────────────────────
    switch (cl->subcommand) {
        case Subcommand::kCheck:
            return run_check(cl->check, config, logger.get(), std::cout, std::cerr);
        case Subcommand::kRecord:
            return run_record(cl->record, config, logger.get(), std::cout, std::cerr);
        case Subcommand::kQuery:
            return run_query(cl->query, config, logger.get(), std::cout, std::cerr);
        case Subcommand::kStats:
            return run_stats(config, logger.get(), std::cout, std::cerr);
        case Subcommand::kServe:
            return run_serve(cl->serve, config, logger.get());
        case Subcommand::kHelp:
            break;
    }

    std::cout << usage();
    return kExitOk;
}
