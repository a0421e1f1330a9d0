// ---------------------------------------------------------------------------
// audit_store.cpp
//
// 추가 전용 감사 저장소 구현 (POSIX open/write/fdatasync).
//
// [append 원자성]
// 1. 인스턴스 mutex 와 파일 flock(LOCK_EX) 을 잡는다. flock 은 열린 파일
//    단위이므로 같은 경로를 연 다른 AuditStore 인스턴스와도 직렬화된다.
// 2. fstat 으로 append 직전 길이를 기록한다.
// 3. "<json>\n" 전체를 write 루프로 기록한다 (EINTR 재시도).
// 4. fdatasync 로 내구성을 확보한 뒤 성공을 반환한다.
// 3/4 단계가 실패하면 rollback_failed_append 가 현재 길이를 다시 확인한다.
// 길이가 before + written 일 때만 잘라내고, flock 을 따르지 않는 writer 가
// 끼어든 경우에는 조각 뒤에 개행만 써서 남의 레코드를 지우지 않는다.
//
// [errno → AuditErrorCode]
// EACCES / EPERM / EROFS       → kPermissionDenied
// ENOSPC / EDQUOT              → kNoSpace
// ENOENT / ENOTDIR / EISDIR    → kCreateFailed (쓰기 경로)
// 그 외                        → kWriteFailed / kReadFailed
// ---------------------------------------------------------------------------

#include "audit/audit_store.hpp"
#include "audit/append_detail.hpp"
#include "audit/record_codec.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace {

AuditError make_error(AuditErrorCode code, int err, const std::filesystem::path& path) {
    return AuditError{code, std::strerror(err), path};
}

AuditErrorCode classify_write_errno(int err) {
    switch (err) {
        case EACCES:
        case EPERM:
        case EROFS:
            return AuditErrorCode::kPermissionDenied;
        case ENOSPC:
        case EDQUOT:
            return AuditErrorCode::kNoSpace;
        case ENOENT:
        case ENOTDIR:
        case EISDIR:
            return AuditErrorCode::kCreateFailed;
        default:
            return AuditErrorCode::kWriteFailed;
    }
}

AuditErrorCode classify_read_errno(int err) {
    switch (err) {
        case ENOENT:
            return AuditErrorCode::kNotFound;
        case EACCES:
        case EPERM:
            return AuditErrorCode::kPermissionDenied;
        default:
            return AuditErrorCode::kReadFailed;
    }
}

// EINTR 재시도, 부분 쓰기 계속. 실패 시 errno 를 반환한다 (성공 0).
// written 에는 실패 전까지 실제로 쓴 바이트 수가 남는다.
int write_all(int fd, const char* data, std::size_t size, std::size_t& written) {
    written = 0;
    while (written < size) {
        const ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno;
        }
        if (n == 0) {
            return EIO;
        }
        written += static_cast<std::size_t>(n);
    }
    return 0;
}

int write_all(int fd, const char* data, std::size_t size) {
    std::size_t written = 0;
    return write_all(fd, data, size, written);
}

// ---------------------------------------------------------------------------
// FileLock
//   flock(LOCK_EX) RAII. 잠금 실패는 error() 로 확인한다.
// ---------------------------------------------------------------------------
class FileLock {
public:
    explicit FileLock(int fd) noexcept : fd_(fd) {
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno != EINTR) {
                error_ = errno;
                break;
            }
        }
    }
    ~FileLock() {
        if (error_ == 0) {
            ::flock(fd_, LOCK_UN);
        }
    }
    FileLock(const FileLock&)            = delete;
    FileLock& operator=(const FileLock&) = delete;

    [[nodiscard]] int error() const noexcept { return error_; }

private:
    int fd_;
    int error_{0};
};

}  // namespace

// ---------------------------------------------------------------------------
// detail::rollback_failed_append
// ---------------------------------------------------------------------------
detail::RollbackAction detail::rollback_failed_append(int         fd,
                                                      off_t       before,
                                                      std::size_t written,
                                                      std::size_t line_size) noexcept {
    if (written == 0) {
        return RollbackAction::kNothingWritten;
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return RollbackAction::kFailed;
    }
    if (st.st_size == before + static_cast<off_t>(written)) {
        return ::ftruncate(fd, before) == 0 ? RollbackAction::kTruncated : RollbackAction::kFailed;
    }
    if (written == line_size) {
        return RollbackAction::kKeptComplete;
    }
    return write_all(fd, "\n", 1) == 0 ? RollbackAction::kTerminated : RollbackAction::kFailed;
}

// ===========================================================================
// AuditCursor
// ===========================================================================
AuditCursor::AuditCursor(std::unique_ptr<std::ifstream> in, AuditFilter filter)
    : in_(std::move(in))
    , filter_(std::move(filter))
{
}

std::optional<AuditRecord> AuditCursor::next_record() {
    if (exhausted_ || !in_) {
        return std::nullopt;
    }

    std::string line;
    while (std::getline(*in_, line)) {
        // getline 이 eof 로 끝났다 = 마지막 줄에 개행이 없다 (기록 중 중단)
        const bool unterminated = in_->eof();

        if (line.empty() || line == "\r") {
            if (unterminated) {
                break;
            }
            continue;
        }
        if (unterminated) {
            ++skipped_lines_;
            spdlog::debug("audit_store: skipping unterminated final line");
            break;
        }

        auto record = RecordCodec::parse(line);
        if (!record) {
            ++skipped_lines_;
            spdlog::debug("audit_store: skipping malformed line: {} (near '{}')",
                          record.error().message, record.error().context);
            continue;
        }
        return std::move(*record);
    }

    exhausted_ = true;
    return std::nullopt;
}

bool AuditCursor::advance() {
    current_.reset();
    if (filter_.limit && matched_ >= *filter_.limit) {
        exhausted_ = true;
        return false;
    }
    while (auto record = next_record()) {
        if (filter_.matches(*record)) {
            current_ = std::move(record);
            ++matched_;
            return true;
        }
    }
    return false;
}

AuditCursor::Iterator AuditCursor::begin() {
    if (!advance()) {
        return Iterator{};
    }
    return Iterator{this};
}

std::optional<AuditRecord> AuditCursor::next() {
    if (!advance()) {
        return std::nullopt;
    }
    return std::move(current_);
}

// ===========================================================================
// AuditQuery
// ===========================================================================
std::expected<AuditCursor, AuditError> AuditQuery::open() const {
    errno = 0;
    auto in = std::make_unique<std::ifstream>(path_, std::ios::in | std::ios::binary);
    if (!in->is_open()) {
        const int err = (errno != 0) ? errno : EIO;
        spdlog::error("audit_store: cannot open '{}' for reading: {}", path_.string(),
                      std::strerror(err));
        return std::unexpected(make_error(classify_read_errno(err), err, path_));
    }
    return AuditCursor{std::move(in), filter_};
}

std::expected<std::vector<AuditRecord>, AuditError> AuditQuery::collect() const {
    auto cursor = open();
    if (!cursor) {
        return std::unexpected(cursor.error());
    }
    std::vector<AuditRecord> records;
    for (const AuditRecord& record : *cursor) {
        records.push_back(record);
    }
    return records;
}

// ===========================================================================
// AuditStore
// ===========================================================================
AuditStore::AuditStore(std::filesystem::path path)
    : path_(std::move(path))
{
}

AuditStore::~AuditStore() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

// ---------------------------------------------------------------------------
// open_writer
//   상위 디렉터리 생성 → O_APPEND 열기 → 손상 조각 뒤 개행 보정
// ---------------------------------------------------------------------------
std::expected<void, AuditError> AuditStore::open_writer() {
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            const auto code = (ec == std::errc::permission_denied ||
                               ec == std::errc::read_only_file_system)
                ? AuditErrorCode::kPermissionDenied
                : AuditErrorCode::kCreateFailed;
            spdlog::error("audit_store: cannot create directory '{}': {}",
                          parent.string(), ec.message());
            return std::unexpected(AuditError{code, ec.message(), path_});
        }
    }

    const int fd = ::open(path_.c_str(), O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0640);
    if (fd < 0) {
        const int err = errno;
        spdlog::error("audit_store: cannot open '{}' for append: {}", path_.string(),
                      std::strerror(err));
        return std::unexpected(make_error(classify_write_errno(err), err, path_));
    }

    // 이전 크래시로 개행 없이 끝난 조각이 있으면 개행으로 닫는다.
    int repair_err = 0;
    {
        const FileLock file_lock(fd);
        if (file_lock.error() != 0) {
            spdlog::warn("audit_store: flock '{}' failed: {}", path_.string(),
                         std::strerror(file_lock.error()));
        }
        struct stat st{};
        if (::fstat(fd, &st) == 0 && st.st_size > 0) {
            char last = '\n';
            if (::pread(fd, &last, 1, st.st_size - 1) == 1 && last != '\n') {
                spdlog::warn("audit_store: '{}' ends with a partial line, terminating it",
                             path_.string());
                repair_err = write_all(fd, "\n", 1);
            }
        }
    }
    if (repair_err != 0) {
        ::close(fd);
        spdlog::error("audit_store: cannot repair '{}': {}", path_.string(),
                      std::strerror(repair_err));
        return std::unexpected(make_error(classify_write_errno(repair_err), repair_err, path_));
    }

    fd_ = fd;
    return {};
}

// ---------------------------------------------------------------------------
// append
// ---------------------------------------------------------------------------
std::expected<void, AuditError> AuditStore::append(const AuditRecord& record) {
    std::string line = RecordCodec::serialize(record);
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(write_mutex_);

    if (fd_ < 0) {
        auto opened = open_writer();
        if (!opened) {
            return opened;
        }
    }

    const FileLock file_lock(fd_);
    if (file_lock.error() != 0) {
        spdlog::warn("audit_store: flock '{}' failed: {}", path_.string(),
                     std::strerror(file_lock.error()));
    }

    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        const int err = errno;
        spdlog::error("audit_store: fstat '{}' failed: {}", path_.string(), std::strerror(err));
        return std::unexpected(make_error(AuditErrorCode::kWriteFailed, err, path_));
    }
    const off_t before = st.st_size;

    std::size_t written = 0;
    int err = write_all(fd_, line.data(), line.size(), written);
    if (err == 0 && ::fdatasync(fd_) != 0) {
        err = errno;
    }
    if (err != 0) {
        const auto action = detail::rollback_failed_append(fd_, before, written, line.size());
        if (action == detail::RollbackAction::kFailed) {
            spdlog::error("audit_store: rollback of '{}' after {} of {} bytes failed: {}",
                          path_.string(), written, line.size(), std::strerror(errno));
        } else if (action == detail::RollbackAction::kTerminated) {
            spdlog::warn("audit_store: '{}' was extended by another writer, "
                         "left a terminated partial line", path_.string());
        }
        spdlog::error("audit_store: append to '{}' failed: {}", path_.string(),
                      std::strerror(err));
        return std::unexpected(make_error(classify_write_errno(err), err, path_));
    }
    return {};
}

// ---------------------------------------------------------------------------
// query
// ---------------------------------------------------------------------------
std::expected<AuditQuery, AuditError> AuditStore::query(AuditFilter filter) const {
    std::error_code ec;
    const bool present = std::filesystem::exists(path_, ec);
    if (ec) {
        spdlog::error("audit_store: cannot stat '{}': {}", path_.string(), ec.message());
        const auto code = (ec == std::errc::permission_denied)
            ? AuditErrorCode::kPermissionDenied
            : AuditErrorCode::kReadFailed;
        return std::unexpected(AuditError{code, ec.message(), path_});
    }
    if (!present) {
        return std::unexpected(
            AuditError{AuditErrorCode::kNotFound, "audit log does not exist", path_});
    }
    return AuditQuery{path_, std::move(filter)};
}

// ---------------------------------------------------------------------------
// statistics
// ---------------------------------------------------------------------------
std::expected<AuditStatistics, AuditError> AuditStore::statistics() const {
    auto query_result = query();
    if (!query_result) {
        return std::unexpected(query_result.error());
    }
    auto cursor = query_result->open();
    if (!cursor) {
        return std::unexpected(cursor.error());
    }

    AuditStatistics stats{};
    while (auto record = cursor->next_record()) {
        ++stats.total;
        ++stats.per_tier[tier_index(record->tier)];
        if (record->executed) {
            ++stats.executed;
        }
        if (record->failed_execution()) {
            ++stats.failed_executions;
        }
    }
    stats.skipped_lines = cursor->skipped_lines();

    if (stats.skipped_lines > 0) {
        spdlog::warn("audit_store: '{}' has {} unreadable line(s)", path_.string(),
                     stats.skipped_lines);
    }
    return stats;
}
