#pragma once

// ---------------------------------------------------------------------------
// uds_server.hpp
//
// Unix Domain Socket 데몬. 한 호스트의 여러 셸이 판정/감사 기록을 하나의
// 프로세스로 모은다 (감사 로그 단일 writer).
//
// [프로토콜: 길이 프리픽스 + JSON]
//   요청 프레임:
//     [4byte LE 길이][JSON 본문]
//     예: {"command": "evaluate", "shell_command": "rm -rf /tmp/x"}
//
//   응답 프레임:
//     [4byte LE 길이][JSON 본문]
//     성공: {"ok": true,  "payload": { ... }}
//     실패: {"ok": false, "error": "<메시지>"}
//
//   한 연결에서 여러 요청을 순서대로 보낼 수 있다. 클라이언트가 연결을 닫거나
//   잘못된 프레임(길이 0, 최대 크기 초과, 짧은 본문)을 보내면 연결을 닫는다.
//
// [지원 커맨드]
//   "evaluate" {shell_command, user?, session_id?}
//       → {"safety_level":..., "reason":..., "matched_rule":...}
//   "append"   {record: {감사 로그 한 줄과 같은 키}}
//       → {"appended": true}
//       timestamp 가 없으면 수신 시각, organization/department 가 없으면
//       설정 값을 채운다.
//   "query"    {user?, tier?, since?, until?, session_id?, limit?}
//       → {"records": [...], "skipped_lines": N}
//       limit 미지정 시 kDefaultQueryLimit 개까지만 반환한다.
//   "stats"
//       → {"total":..., "executed":..., "failed_executions":...,
//          "per_tier": {...}, "dangerous_or_blocked":..., "skipped_lines":...}
//
// [스레드/비동기 모델]
//   Boost.Asio co_await 기반. io_context 는 외부에서 주입.
//   append 의 fdatasync 는 io 스레드에서 동기로 수행된다. 감사 로그 쓰기가
//   끝나기 전에는 다음 요청을 처리하지 않는다.
// ---------------------------------------------------------------------------

#include "audit/audit_store.hpp"
#include "policy/policy_engine.hpp"
#include "policy/rule.hpp"

#include <utility>  // std::exchange, used (but not included) by boost/asio/awaitable.hpp in Boost 1.74
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

class StructuredLogger;

namespace asio = boost::asio;

// query 요청에 limit 가 없을 때 반환하는 최대 레코드 수
inline constexpr std::uint64_t kDefaultQueryLimit = 1000;

// ---------------------------------------------------------------------------
// GateServer
//   PolicyEngine 판정과 AuditStore 기록/조회를 UDS 클라이언트에 노출한다.
// ---------------------------------------------------------------------------
class GateServer {
public:
    // 생성자
    //   socket_path : Unix Domain Socket 파일 경로
    //   enterprise  : 정책 설정 + 조직/부서 (수명 동안 불변)
    //   store       : 공유 감사 저장소 (nullptr 이면 append/query/stats 는 에러 응답)
    //   ioc         : 외부에서 주입된 Asio io_context
    //   logger      : 구조화 이벤트 로거 (nullptr 허용)
    GateServer(const std::filesystem::path& socket_path,
               EnterpriseConfig             enterprise,
               std::shared_ptr<AuditStore>  store,
               asio::io_context&            ioc,
               StructuredLogger*            logger = nullptr);

    ~GateServer();

    // 복사 금지
    GateServer(const GateServer&)            = delete;
    GateServer& operator=(const GateServer&) = delete;

    // 이동 금지 (acceptor 소유권 명확화)
    GateServer(GateServer&&)            = delete;
    GateServer& operator=(GateServer&&) = delete;

    // run
    //   UDS 소켓 바인드/리슨 후 accept 루프를 실행한다.
    //   소켓 파일 권한은 0600 으로 제한한다.
    asio::awaitable<void> run();

    // stop
    //   acceptor 를 닫아 run() 의 accept 루프를 종료한다.
    void stop();

    // handle_request
    //   JSON 요청 본문 하나를 처리하여 JSON 응답 본문을 돌려준다.
    //   소켓 없이 디스패치 로직을 사용할 수 있도록 공개한다.
    [[nodiscard]] std::string handle_request(std::string_view request_json);

private:
    asio::awaitable<void> handle_client(asio::local::stream_protocol::socket socket);

    std::filesystem::path                  socket_path_;
    EnterpriseConfig                       enterprise_;
    PolicyEngine                           engine_;
    std::shared_ptr<AuditStore>            store_;
    asio::io_context&                      ioc_;
    StructuredLogger*                      logger_;
    asio::local::stream_protocol::acceptor acceptor_;
    std::atomic<bool>                      stop_requested_{false};
};
