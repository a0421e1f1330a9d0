// ---------------------------------------------------------------------------
// test_audit_store.cpp
//
// AuditStore / AuditQuery / AuditCursor 단위 테스트.
//
// [테스트 범위]
// - append → query: 레코드 동등성, 기록 순서 유지, 반복 조회 동일 결과
// - 필터: user, tier, session_id, since/until 반개구간, limit
// - statistics: 합계, executed, failed_executions, 등급별 개수
// - 손상 내성: 잘못된 줄 / 개행 없는 마지막 줄 skip 후 계속, 복구 개행
// - 오류: 존재하지 않는 경로 → kNotFound, 생성 불가 경로 → 오류 반환
// - 동시성: 여러 스레드 append 후 모든 레코드가 온전한 한 줄
//   (한 인스턴스 공유 / 같은 경로의 두 인스턴스)
// - 실패한 append 되돌리기: 우리 조각만 잘라내고, 그 사이 다른 writer 가
//   남긴 레코드는 지우지 않는다 (detail::rollback_failed_append)
// - 지연 평가: 파일을 끝까지 읽지 않고 limit 에서 멈춤
//
// [알려진 한계]
// - 디스크 가득 참(ENOSPC), fdatasync 실패 자체는 재현하지 않는다. 실패 뒤
//   되돌리기 판단은 쓰다 만 조각을 직접 기록한 뒤 detail 함수로 검증한다.
// - 권한 거부는 root 로 실행 시 재현되지 않으므로 "파일 아래 디렉터리" 경로로
//   생성 실패만 검증한다.
// ---------------------------------------------------------------------------

#include "audit/append_detail.hpp"
#include "audit/audit_store.hpp"
#include "audit/record_codec.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

namespace {

using namespace std::chrono_literals;
using Clock = std::chrono::system_clock;

Clock::time_point at_minute(int minute) {
    const std::chrono::sys_days day{std::chrono::year{2024} / std::chrono::June / 1};
    return Clock::time_point{day} + std::chrono::minutes{minute};
}

AuditRecord make_record(std::string user,
                        SafetyTier  tier,
                        bool        executed,
                        std::optional<int> exit_code,
                        Clock::time_point  ts = at_minute(0)) {
    AuditRecord record{};
    record.timestamp              = ts;
    record.user                   = std::move(user);
    record.natural_language_input = "do something";
    record.generated_command      = "echo ok";
    record.executed               = executed;
    record.exit_code              = exit_code;
    record.tier                   = tier;
    record.backend_id             = "test";
    return record;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

class AuditStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string{"cmdgate_audit_"} + info->name() + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        path_ = dir_ / "logs" / "audit.log";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::vector<AuditRecord> query_all(const AuditStore& store, AuditFilter filter = {}) {
        auto query = store.query(std::move(filter));
        EXPECT_TRUE(query.has_value());
        if (!query) {
            return {};
        }
        auto records = query->collect();
        EXPECT_TRUE(records.has_value());
        return records ? std::move(*records) : std::vector<AuditRecord>{};
    }

    void append_raw(const std::string& text) {
        std::ofstream out(path_, std::ios::binary | std::ios::app);
        out << text;
    }

    std::filesystem::path dir_;
    std::filesystem::path path_;
};

}  // namespace

// ===========================================================================
// 기본 동작
// ===========================================================================

TEST_F(AuditStoreTest, Append_CreatesParentDirectoryAndFile) {
    AuditStore store{path_};
    ASSERT_TRUE(store.append(make_record("alice", SafetyTier::kSafe, false, std::nullopt)));

    ASSERT_TRUE(std::filesystem::exists(path_));
    const auto content = read_file(path_);
    ASSERT_FALSE(content.empty());
    EXPECT_EQ(content.back(), '\n');
    EXPECT_EQ(std::count(content.begin(), content.end(), '\n'), 1);
}

TEST_F(AuditStoreTest, Append_ThenQuery_ReturnsEqualRecordsInOrder) {
    AuditStore store{path_};
    std::vector<AuditRecord> written;
    for (int i = 0; i < 5; ++i) {
        auto record = make_record("user" + std::to_string(i), SafetyTier::kWarning, true, i,
                                  at_minute(i));
        record.session_id = "s";
        record.notes      = "note \"" + std::to_string(i) + "\"\n";
        written.push_back(record);
        ASSERT_TRUE(store.append(record));
    }

    const auto records = query_all(store);
    EXPECT_EQ(records, written);
}

TEST_F(AuditStoreTest, Query_RepeatableAndNonDestructive) {
    AuditStore store{path_};
    ASSERT_TRUE(store.append(make_record("alice", SafetyTier::kSafe, false, std::nullopt)));
    ASSERT_TRUE(store.append(make_record("bob", SafetyTier::kBlocked, false, std::nullopt)));

    const auto before = read_file(path_);
    const auto first  = query_all(store);
    const auto second = query_all(store);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.size(), 2U);
    EXPECT_EQ(read_file(path_), before);
}

TEST_F(AuditStoreTest, Statistics_MixedExecution) {
    AuditStore store{path_};
    ASSERT_TRUE(store.append(make_record("a", SafetyTier::kSafe, true, 0)));
    ASSERT_TRUE(store.append(make_record("b", SafetyTier::kSafe, true, 0)));
    ASSERT_TRUE(store.append(make_record("c", SafetyTier::kWarning, false, std::nullopt)));

    const auto stats = store.statistics();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, 3U);
    EXPECT_EQ(stats->executed, 2U);
    EXPECT_EQ(stats->failed_executions, 0U);
    EXPECT_EQ(stats->count(SafetyTier::kSafe), 2U);
    EXPECT_EQ(stats->count(SafetyTier::kWarning), 1U);
    EXPECT_EQ(stats->dangerous_or_blocked(), 0U);
    EXPECT_EQ(stats->skipped_lines, 0U);
}

TEST_F(AuditStoreTest, Statistics_FailedExecutions) {
    AuditStore store{path_};
    ASSERT_TRUE(store.append(make_record("a", SafetyTier::kDangerous, true, 1)));
    ASSERT_TRUE(store.append(make_record("b", SafetyTier::kBlocked, true, std::nullopt)));
    ASSERT_TRUE(store.append(make_record("c", SafetyTier::kBlocked, false, 2)));

    const auto stats = store.statistics();
    ASSERT_TRUE(stats.has_value());
    // 실행되었고 exit_code 가 0 이 아니거나 없음 → 실패. 미실행은 실패가 아니다.
    EXPECT_EQ(stats->failed_executions, 2U);
    EXPECT_EQ(stats->dangerous_or_blocked(), 3U);
    EXPECT_EQ(stats->total, query_all(store).size());
}

// ===========================================================================
// 필터
// ===========================================================================

TEST_F(AuditStoreTest, Filter_UserTierSession) {
    AuditStore store{path_};
    auto r1 = make_record("alice", SafetyTier::kSafe, false, std::nullopt);
    auto r2 = make_record("alice", SafetyTier::kBlocked, false, std::nullopt);
    auto r3 = make_record("bob", SafetyTier::kBlocked, false, std::nullopt);
    r2.session_id = "s-42";
    for (const auto& r : {r1, r2, r3}) {
        ASSERT_TRUE(store.append(r));
    }

    AuditFilter by_user;
    by_user.user = "alice";
    EXPECT_EQ(query_all(store, by_user).size(), 2U);

    AuditFilter by_tier;
    by_tier.tier = SafetyTier::kBlocked;
    EXPECT_EQ(query_all(store, by_tier).size(), 2U);

    AuditFilter combined;
    combined.user = "alice";
    combined.tier = SafetyTier::kBlocked;
    const auto both = query_all(store, combined);
    ASSERT_EQ(both.size(), 1U);
    EXPECT_EQ(both[0], r2);

    AuditFilter by_session;
    by_session.session_id = "s-42";
    EXPECT_EQ(query_all(store, by_session), std::vector<AuditRecord>{r2});

    AuditFilter nobody;
    nobody.user = "Alice";  // 대소문자 구분
    EXPECT_TRUE(query_all(store, nobody).empty());
}

TEST_F(AuditStoreTest, Filter_TimeWindowIsHalfOpen) {
    AuditStore store{path_};
    for (int minute = 0; minute < 5; ++minute) {
        ASSERT_TRUE(store.append(make_record("u", SafetyTier::kSafe, false, std::nullopt,
                                             at_minute(minute))));
    }

    AuditFilter window;
    window.since = at_minute(1);
    window.until = at_minute(3);
    const auto records = query_all(store, window);
    ASSERT_EQ(records.size(), 2U);
    EXPECT_EQ(records[0].timestamp, at_minute(1));
    EXPECT_EQ(records[1].timestamp, at_minute(2));
}

TEST_F(AuditStoreTest, Filter_LimitStopsEarly) {
    AuditStore store{path_};
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(store.append(make_record("u" + std::to_string(i), SafetyTier::kSafe, false,
                                             std::nullopt)));
    }

    AuditFilter limited;
    limited.limit = 3;
    const auto records = query_all(store, limited);
    ASSERT_EQ(records.size(), 3U);
    EXPECT_EQ(records[0].user, "u0");
    EXPECT_EQ(records[2].user, "u2");

    AuditFilter none;
    none.limit = 0;
    EXPECT_TRUE(query_all(store, none).empty());
}

TEST_F(AuditStoreTest, Cursor_NextIsLazy) {
    AuditStore store{path_};
    ASSERT_TRUE(store.append(make_record("first", SafetyTier::kSafe, false, std::nullopt)));
    ASSERT_TRUE(store.append(make_record("second", SafetyTier::kSafe, false, std::nullopt)));

    auto query = store.query();
    ASSERT_TRUE(query.has_value());
    auto cursor = query->open();
    ASSERT_TRUE(cursor.has_value());

    const auto first = cursor->next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->user, "first");

    // 커서가 열린 뒤 추가된 레코드도 아직 읽지 않은 위치라면 보인다
    ASSERT_TRUE(store.append(make_record("third", SafetyTier::kSafe, false, std::nullopt)));

    EXPECT_EQ(cursor->next()->user, "second");
    EXPECT_EQ(cursor->next()->user, "third");
    EXPECT_FALSE(cursor->next().has_value());
    EXPECT_EQ(cursor->matched(), 3U);
}

// ===========================================================================
// 손상 내성
// ===========================================================================

TEST_F(AuditStoreTest, MalformedLines_SkippedAndCounted) {
    AuditStore store{path_};
    ASSERT_TRUE(store.append(make_record("before", SafetyTier::kSafe, false, std::nullopt)));
    append_raw("this is not json\n");
    append_raw("\n");
    append_raw(R"({"user":"missing-fields"})" "\n");
    ASSERT_TRUE(store.append(make_record("after", SafetyTier::kSafe, false, std::nullopt)));

    auto query = store.query();
    ASSERT_TRUE(query.has_value());
    auto cursor = query->open();
    ASSERT_TRUE(cursor.has_value());

    std::vector<std::string> users;
    for (const auto& record : *cursor) {
        users.push_back(record.user);
    }
    EXPECT_EQ(users, (std::vector<std::string>{"before", "after"}));
    // 빈 줄은 손상으로 세지 않는다
    EXPECT_EQ(cursor->skipped_lines(), 2U);

    const auto stats = store.statistics();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, 2U);
    EXPECT_EQ(stats->skipped_lines, 2U);
}

TEST_F(AuditStoreTest, TruncatedFinalLine_SkippedThenRepairedOnAppend) {
    {
        AuditStore store{path_};
        ASSERT_TRUE(store.append(make_record("complete", SafetyTier::kSafe, false, std::nullopt)));
    }
    // 기록 도중 중단된 레코드 (개행 없음)
    const auto full = RecordCodec::serialize(make_record("torn", SafetyTier::kSafe, false,
                                                         std::nullopt));
    append_raw(full.substr(0, full.size() / 2));

    AuditStore store{path_};
    auto before = store.statistics();
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->total, 1U);
    EXPECT_EQ(before->skipped_lines, 1U);

    // 새 writer 는 조각을 개행으로 닫은 뒤 기록한다
    ASSERT_TRUE(store.append(make_record("next", SafetyTier::kSafe, false, std::nullopt)));

    const auto records = query_all(store);
    ASSERT_EQ(records.size(), 2U);
    EXPECT_EQ(records[0].user, "complete");
    EXPECT_EQ(records[1].user, "next");

    const auto after = store.statistics();
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->skipped_lines, 1U);  // 조각은 이제 잘못된 완결 줄
}

TEST_F(AuditStoreTest, CompleteFinalLineWithoutNewline_StillSkipped) {
    std::filesystem::create_directories(path_.parent_path());
    append_raw(RecordCodec::serialize(make_record("no-newline", SafetyTier::kSafe, false,
                                                  std::nullopt)));

    AuditStore store{path_};
    const auto stats = store.statistics();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, 0U);
    EXPECT_EQ(stats->skipped_lines, 1U);
}

// ===========================================================================
// 오류
// ===========================================================================

TEST_F(AuditStoreTest, Query_MissingLog_NotFound) {
    const AuditStore store{path_};

    const auto query = store.query();
    ASSERT_FALSE(query.has_value());
    EXPECT_EQ(query.error().code, AuditErrorCode::kNotFound);
    EXPECT_EQ(query.error().path, path_);

    const auto stats = store.statistics();
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, AuditErrorCode::kNotFound);
}

TEST_F(AuditStoreTest, Query_FileRemovedAfterQueryCreated_OpenFails) {
    AuditStore store{path_};
    ASSERT_TRUE(store.append(make_record("a", SafetyTier::kSafe, false, std::nullopt)));
    auto query = store.query();
    ASSERT_TRUE(query.has_value());

    std::filesystem::remove(path_);
    const auto cursor = query->open();
    ASSERT_FALSE(cursor.has_value());
    EXPECT_EQ(cursor.error().code, AuditErrorCode::kNotFound);
}

TEST_F(AuditStoreTest, Append_ParentIsRegularFile_Fails) {
    const auto blocker = dir_ / "blocker";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    AuditStore store{blocker / "audit.log"};

    const auto result = store.append(make_record("a", SafetyTier::kSafe, false, std::nullopt));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, AuditErrorCode::kCreateFailed);
    EXPECT_FALSE(result.error().message.empty());
}

TEST_F(AuditStoreTest, Append_PathIsDirectory_Fails) {
    std::filesystem::create_directories(path_);
    AuditStore store{path_};

    const auto result = store.append(make_record("a", SafetyTier::kSafe, false, std::nullopt));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, AuditErrorCode::kCreateFailed);
}

// ===========================================================================
// 동시성
// ===========================================================================

TEST_F(AuditStoreTest, ConcurrentAppends_NoInterleaving) {
    AuditStore store{path_};
    constexpr int kThreads    = 8;
    constexpr int kPerThread  = 25;

    std::vector<std::thread> threads;
    std::atomic<int>         failures{0};
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto record = make_record("t" + std::to_string(t), SafetyTier::kSafe, true, i);
                record.generated_command = std::string(200, static_cast<char>('a' + t));
                if (!store.append(record)) {
                    ++failures;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(failures.load(), 0);

    const auto stats = store.statistics();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, static_cast<std::uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(stats->skipped_lines, 0U);

    // 스레드별 기록 순서 유지
    const auto records = query_all(store);
    std::vector<int> next_expected(kThreads, 0);
    for (const auto& record : records) {
        const int t = std::stoi(record.user.substr(1));
        ASSERT_TRUE(record.exit_code.has_value());
        EXPECT_EQ(*record.exit_code, next_expected[t]);
        next_expected[t] = *record.exit_code + 1;
        EXPECT_EQ(record.generated_command, std::string(200, static_cast<char>('a' + t)));
    }
}

TEST_F(AuditStoreTest, ConcurrentAppends_TwoInstancesSamePath) {
    AuditStore first{path_};
    AuditStore second{path_};
    constexpr int kThreads   = 4;
    constexpr int kPerThread = 25;

    std::vector<std::thread> threads;
    std::atomic<int>         failures{0};
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            AuditStore& store = (t % 2 == 0) ? first : second;
            for (int i = 0; i < kPerThread; ++i) {
                auto record = make_record("t" + std::to_string(t), SafetyTier::kSafe, true, i);
                record.generated_command = std::string(300, static_cast<char>('a' + t));
                if (!store.append(record)) {
                    ++failures;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(failures.load(), 0);

    const auto stats = first.statistics();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, static_cast<std::uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(stats->skipped_lines, 0U);
}

// ===========================================================================
// 실패한 append 되돌리기
// ===========================================================================

namespace {

// 테스트용 O_APPEND fd. 실패한 append 가 남긴 조각을 흉내 낸다.
class RawAppender {
public:
    explicit RawAppender(const std::filesystem::path& path)
        : fd_(::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC)) {}
    ~RawAppender() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    RawAppender(const RawAppender&)            = delete;
    RawAppender& operator=(const RawAppender&) = delete;

    [[nodiscard]] int fd() const { return fd_; }

    std::size_t write(std::string_view text) {
        const ssize_t n = ::write(fd_, text.data(), text.size());
        return n < 0 ? 0 : static_cast<std::size_t>(n);
    }

private:
    int fd_;
};

off_t file_size(const std::filesystem::path& path) {
    return static_cast<off_t>(std::filesystem::file_size(path));
}

}  // namespace

TEST_F(AuditStoreTest, Rollback_OnlyOwnFragment_Truncated) {
    AuditStore store{path_};
    const auto kept = make_record("kept", SafetyTier::kSafe, true, 0);
    ASSERT_TRUE(store.append(kept));
    const std::string before_content = read_file(path_);
    const off_t       before         = ::file_size(path_);

    const std::string line = RecordCodec::serialize(make_record("lost", SafetyTier::kSafe, true, 0)) + "\n";
    RawAppender       raw{path_};
    ASSERT_GE(raw.fd(), 0);
    const std::size_t written = raw.write(std::string_view{line}.substr(0, 20));
    ASSERT_EQ(written, 20U);

    EXPECT_EQ(detail::rollback_failed_append(raw.fd(), before, written, line.size()),
              detail::RollbackAction::kTruncated);
    EXPECT_EQ(read_file(path_), before_content);

    const auto stats = store.statistics();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, 1U);
    EXPECT_EQ(stats->skipped_lines, 0U);
}

TEST_F(AuditStoreTest, Rollback_OtherWriterBetween_KeepsCommittedRecord) {
    AuditStore first{path_};
    AuditStore second{path_};
    const auto r1 = make_record("first", SafetyTier::kSafe, true, 0);
    const auto r2 = make_record("second", SafetyTier::kWarning, true, 0);

    ASSERT_TRUE(first.append(r1));
    const off_t before = ::file_size(path_);

    // before 를 읽은 뒤 다른 인스턴스가 레코드를 확정한다.
    ASSERT_TRUE(second.append(r2));

    // 이어서 첫 인스턴스의 쓰기가 중간에 실패한 상황
    const std::string line = RecordCodec::serialize(make_record("torn", SafetyTier::kSafe, true, 0)) + "\n";
    RawAppender       raw{path_};
    ASSERT_GE(raw.fd(), 0);
    const std::size_t written = raw.write(std::string_view{line}.substr(0, 30));
    ASSERT_EQ(written, 30U);

    EXPECT_EQ(detail::rollback_failed_append(raw.fd(), before, written, line.size()),
              detail::RollbackAction::kTerminated);

    auto query = first.query();
    ASSERT_TRUE(query.has_value());
    auto cursor = query->open();
    ASSERT_TRUE(cursor.has_value());
    std::vector<AuditRecord> records;
    for (const AuditRecord& record : *cursor) {
        records.push_back(record);
    }
    EXPECT_EQ(records, (std::vector<AuditRecord>{r1, r2}));
    EXPECT_EQ(cursor->skipped_lines(), 1U);

    // 조각이 개행으로 닫혔으므로 다음 레코드는 온전한 줄이 된다.
    const auto r3 = make_record("third", SafetyTier::kSafe, true, 0);
    ASSERT_TRUE(second.append(r3));
    EXPECT_EQ(query_all(first), (std::vector<AuditRecord>{r1, r2, r3}));
}

TEST_F(AuditStoreTest, Rollback_CompleteLineAfterOtherWriter_Kept) {
    AuditStore first{path_};
    AuditStore second{path_};
    const auto r1 = make_record("first", SafetyTier::kSafe, true, 0);
    const auto r2 = make_record("second", SafetyTier::kSafe, true, 0);
    const auto r3 = make_record("synced-late", SafetyTier::kSafe, true, 0);

    ASSERT_TRUE(first.append(r1));
    const off_t before = ::file_size(path_);
    ASSERT_TRUE(second.append(r2));

    // 줄 전체는 기록됐지만 fdatasync 가 실패한 상황
    const std::string line = RecordCodec::serialize(r3) + "\n";
    RawAppender       raw{path_};
    ASSERT_GE(raw.fd(), 0);
    ASSERT_EQ(raw.write(line), line.size());

    EXPECT_EQ(detail::rollback_failed_append(raw.fd(), before, line.size(), line.size()),
              detail::RollbackAction::kKeptComplete);
    EXPECT_EQ(query_all(first), (std::vector<AuditRecord>{r1, r2, r3}));
}

TEST_F(AuditStoreTest, Rollback_NothingWritten_NoChange) {
    AuditStore store{path_};
    ASSERT_TRUE(store.append(make_record("only", SafetyTier::kSafe, true, 0)));
    const std::string content = read_file(path_);

    RawAppender raw{path_};
    ASSERT_GE(raw.fd(), 0);
    EXPECT_EQ(detail::rollback_failed_append(raw.fd(), 0, 0, 100),
              detail::RollbackAction::kNothingWritten);
    EXPECT_EQ(read_file(path_), content);
}
