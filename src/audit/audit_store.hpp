#pragma once

// ---------------------------------------------------------------------------
// audit_store.hpp
//
// 추가 전용(append-only) 감사 저장소.
//
// [저장 형식]
// 파일 하나에 레코드 하나당 JSON 한 줄 (record_codec.hpp 참조).
//
// [쓰기 경로: 단일 writer]
// 모든 append 는 저장소 내부의 mutex 로 직렬화되며, O_APPEND 로 열린 하나의
// 파일 디스크립터를 공유한다. 한 줄은 write 루프 + fdatasync 가 끝난 뒤에만
// 성공으로 보고된다. 파일 flock 으로 같은 경로를 연 다른 인스턴스와도
// 직렬화된다. 중간에 실패하면 파일이 append 직전 길이 + 이번에 쓴 길이일
// 때만 ftruncate 로 되돌린다. 다른 writer 가 그 사이에 기록했다면 남의
// 레코드를 지우지 않고 조각 뒤에 개행만 써서 손상 줄로 남긴다.
//
// [읽기 경로: 지연 스캔]
// query() 는 즉시 파일을 읽지 않는다. AuditQuery::open() 이 호출될 때마다
// 파일 처음부터 새로 읽는 AuditCursor 를 만든다. 커서는 한 줄씩 읽으므로
// 로그 전체를 메모리에 올리지 않는다.
//
// [손상 허용]
// - 파싱 실패 줄은 건너뛰고 skipped_lines 로 센다.
// - 마지막 줄에 개행이 없으면 기록 중 중단된 줄로 보고 건너뛴다.
// - 저장소가 처음 파일을 열 때 파일 끝이 개행이 아니면 개행을 먼저 써서
//   다음 레코드가 손상 조각에 이어 붙지 않게 한다.
//
// [알려진 한계]
// - 여러 프로세스가 같은 파일에 동시에 쓰는 경우는 조정하지 않는다.
//   한 호스트의 여러 셸은 GateServer(UDS 데몬)를 통해 하나의 writer 로 모은다.
// - 로그 회전/압축/삭제는 하지 않는다.
// ---------------------------------------------------------------------------

#include "audit/audit_record.hpp"
#include "common/types.hpp"  // AuditError

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AuditCursor
//   한 번의 순차 스캔. 입력 반복자(range-for) 로 일치 레코드를 파일 순서대로
//   돌려준다. 이동만 가능하다.
//
//   사용 예:
//     auto cursor = query->open();
//     for (const AuditRecord& r : *cursor) { ... }
//     cursor->skipped_lines();
// ---------------------------------------------------------------------------
class AuditCursor {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = AuditRecord;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const AuditRecord*;
        using reference         = const AuditRecord&;

        Iterator() = default;
        explicit Iterator(AuditCursor* cursor) : cursor_(cursor) {}

        reference operator*() const { return *cursor_->current_; }
        pointer   operator->() const { return &*cursor_->current_; }

        Iterator& operator++() {
            if (!cursor_->advance()) {
                cursor_ = nullptr;
            }
            return *this;
        }
        void operator++(int) { ++*this; }

        bool operator==(const Iterator& other) const noexcept { return cursor_ == other.cursor_; }

    private:
        AuditCursor* cursor_{nullptr};
    };

    ~AuditCursor() = default;

    AuditCursor(const AuditCursor&)            = delete;
    AuditCursor& operator=(const AuditCursor&) = delete;
    AuditCursor(AuditCursor&&)                 = default;
    AuditCursor& operator=(AuditCursor&&)      = default;

    // 첫 일치 레코드를 읽은 반복자. 커서당 한 번만 호출할 것.
    [[nodiscard]] Iterator begin();
    [[nodiscard]] Iterator end() noexcept { return Iterator{}; }

    // next
    //   다음 일치 레코드. 끝이면 std::nullopt.
    [[nodiscard]] std::optional<AuditRecord> next();

    // 지금까지 건너뛴 손상/미완성 줄 수
    [[nodiscard]] std::uint64_t skipped_lines() const noexcept { return skipped_lines_; }

    // 지금까지 돌려준 일치 레코드 수
    [[nodiscard]] std::uint64_t matched() const noexcept { return matched_; }

private:
    friend class AuditQuery;
    friend class AuditStore;

    AuditCursor(std::unique_ptr<std::ifstream> in, AuditFilter filter);

    // 다음 일치 레코드를 current_ 에 채운다. 없으면 false.
    bool advance();

    // 필터와 무관하게 다음 정상 레코드를 읽는다 (statistics 용).
    std::optional<AuditRecord> next_record();

    std::unique_ptr<std::ifstream> in_;
    AuditFilter                    filter_;
    std::optional<AuditRecord>     current_{};
    std::uint64_t                  skipped_lines_{0};
    std::uint64_t                  matched_{0};
    bool                           exhausted_{false};
};

// ---------------------------------------------------------------------------
// AuditQuery
//   재시작 가능한 지연 쿼리. open() 마다 새 커서를 만든다.
//   저장소가 바뀌지 않았다면 반복 실행 결과는 동일하다.
// ---------------------------------------------------------------------------
class AuditQuery {
public:
    AuditQuery(std::filesystem::path path, AuditFilter filter)
        : path_(std::move(path)), filter_(std::move(filter)) {}

    [[nodiscard]] std::expected<AuditCursor, AuditError> open() const;

    // collect
    //   모든 일치 레코드를 벡터로 모은다. limit 가 없으면 로그 크기만큼 메모리를
    //   사용하므로 CLI/테스트 등 작은 결과에만 사용할 것.
    [[nodiscard]] std::expected<std::vector<AuditRecord>, AuditError> collect() const;

    [[nodiscard]] const AuditFilter&           filter() const noexcept { return filter_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    AuditFilter           filter_;
};

// ---------------------------------------------------------------------------
// AuditStore
//   append 는 스레드 안전하다. query/statistics 는 append 와 동시에 호출해도
//   되며, 진행 중인 append 의 줄은 개행까지 기록된 뒤에만 보인다.
// ---------------------------------------------------------------------------
class AuditStore {
public:
    explicit AuditStore(std::filesystem::path path);
    ~AuditStore();

    AuditStore(const AuditStore&)            = delete;
    AuditStore& operator=(const AuditStore&) = delete;
    AuditStore(AuditStore&&)                 = delete;
    AuditStore& operator=(AuditStore&&)      = delete;

    // append
    //   레코드 한 줄을 기록하고 fdatasync 후 반환한다.
    //   파일/상위 디렉터리가 없으면 생성한다.
    [[nodiscard]] std::expected<void, AuditError> append(const AuditRecord& record);

    // query
    //   경로가 없으면 kNotFound.
    [[nodiscard]] std::expected<AuditQuery, AuditError> query(AuditFilter filter = {}) const;

    // statistics
    //   전체 파일을 한 번 스캔하여 집계한다.
    [[nodiscard]] std::expected<AuditStatistics, AuditError> statistics() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    // writer 디스크립터를 연다 (mutex 보유 상태에서 호출).
    std::expected<void, AuditError> open_writer();

    std::filesystem::path path_;
    std::mutex            write_mutex_;
    int                   fd_{-1};  // write_mutex_ 로 보호
};
