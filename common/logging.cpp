// logging.cpp - Async file logger backed by a bounded MPMC queue

#include "common/logging.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <filesystem>
#include <functional>
#include <mutex>
#include <new>
#include <thread>

#include "common/time_utils.h"

namespace Common {

namespace {

// ---------- Vyukov MPMC bounded queue ----------
class MPMCQueue {
public:
    static constexpr std::size_t MAX_CAPACITY = 65536;

    struct LogRecord {
        uint64_t wall_ns{0};
        uint32_t thread_id{0};
        uint16_t level{0};
        uint16_t len{0};
        char msg[240]{};
    };

    MPMCQueue(const MPMCQueue&) = delete;
    MPMCQueue& operator=(const MPMCQueue&) = delete;
    MPMCQueue(MPMCQueue&&) = delete;
    MPMCQueue& operator=(MPMCQueue&&) = delete;

    explicit MPMCQueue(std::size_t capacity)
        : size_(std::min(roundUpPow2(capacity), MAX_CAPACITY)),
          mask_(size_ - 1),
          cells_(new (std::nothrow) Cell[size_]) {
        if (cells_) {
            for (std::size_t i = 0; i < size_; ++i) {
                cells_[i].seq.store(i, std::memory_order_relaxed);
            }
        }
    }

    ~MPMCQueue() {
        delete[] cells_;
    }

    [[nodiscard]] auto valid() const noexcept -> bool { return cells_ != nullptr; }

    auto enqueue(const LogRecord& rec) noexcept -> bool {
        std::size_t pos = tail_.load(std::memory_order_relaxed);
        for (;;) {
            Cell& c = cells_[pos & mask_];
            const std::size_t seq = c.seq.load(std::memory_order_acquire);
            const auto diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
            if (diff == 0) {
                if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    c.data = rec;
                    c.seq.store(pos + 1, std::memory_order_release);
                    return true;
                }
            } else if (diff < 0) {
                return false;  // full
            } else {
                pos = tail_.load(std::memory_order_relaxed);
            }
        }
    }

    auto dequeue(LogRecord& out) noexcept -> bool {
        std::size_t pos = head_.load(std::memory_order_relaxed);
        for (;;) {
            Cell& c = cells_[pos & mask_];
            const std::size_t seq = c.seq.load(std::memory_order_acquire);
            const auto diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);
            if (diff == 0) {
                if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    out = c.data;
                    c.seq.store(pos + size_, std::memory_order_release);
                    return true;
                }
            } else if (diff < 0) {
                return false;  // empty
            } else {
                pos = head_.load(std::memory_order_relaxed);
            }
        }
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

private:
    struct Cell {
        alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> seq{0};
        LogRecord data{};
    };

    static auto roundUpPow2(std::size_t n) noexcept -> std::size_t {
        if (n < 2) return 2;
        --n;
        n |= n >> 1;  n |= n >> 2;  n |= n >> 4;
        n |= n >> 8;  n |= n >> 16; n |= n >> 32;
        return n + 1;
    }

    alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> head_{0};
    alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> tail_{0};
    std::size_t size_;
    std::size_t mask_;
    Cell* cells_;
};

// ---------- Writer ----------
class AsyncLogger {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 8192;
    static constexpr std::size_t BATCH_SIZE = 128;

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    explicit AsyncLogger(const char* path)
        : queue_(DEFAULT_CAPACITY) {
        std::strncpy(path_, path, sizeof(path_) - 1);

        std::filesystem::path p(path_);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
            // fopen below reports the failure if the directory is missing
        }

        file_ = std::fopen(path_, "a");
        if (!file_) {
            std::fprintf(stderr, "logger: cannot open %s: %s\n", path_, std::strerror(errno));
        }

        writer_thread_ = std::thread([this] { writerLoop(); });
    }

    ~AsyncLogger() {
        running_.store(false, std::memory_order_release);
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
        if (file_) {
            std::fflush(file_);
            std::fclose(file_);
        }
    }

    auto log(uint16_t level, const char* msg, std::size_t len) noexcept -> void {
        MPMCQueue::LogRecord rec{};
        rec.wall_ns = getWallClockNanos();
        rec.thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
        rec.level = level;
        rec.len = static_cast<uint16_t>(std::min(len, sizeof(rec.msg) - 1));
        std::memcpy(rec.msg, msg, rec.len);
        rec.msg[rec.len] = '\0';

        if (UNLIKELY(!queue_.valid() || !queue_.enqueue(rec))) {
            drops_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        if (queue_was_empty_.exchange(false, std::memory_order_acq_rel)) {
            cv_.notify_one();
        }
    }

    [[nodiscard]] auto stats() const noexcept -> LogStats {
        LogStats s;
        s.messages_written = written_.load(std::memory_order_relaxed);
        s.messages_dropped = drops_.load(std::memory_order_relaxed);
        s.bytes_written = bytes_.load(std::memory_order_relaxed);
        return s;
    }

private:
    void writerLoop() noexcept {
        MPMCQueue::LogRecord rec;
        std::unique_lock<std::mutex> lock(mutex_);

        while (running_.load(std::memory_order_acquire) || (queue_.valid() && !queue_.empty())) {
            cv_.wait_for(lock, std::chrono::milliseconds(1), [this] {
                return !running_.load(std::memory_order_acquire) || (queue_.valid() && !queue_.empty());
            });
            lock.unlock();

            std::size_t n = 0;
            while (n < BATCH_SIZE && queue_.valid() && queue_.dequeue(rec)) {
                writeRecord(rec);
                ++n;
            }

            if (queue_.valid() && queue_.empty()) {
                queue_was_empty_.store(true, std::memory_order_release);
                if (n > 0 && file_) {
                    std::fflush(file_);
                }
            }
            lock.lock();
        }
    }

    void writeRecord(const MPMCQueue::LogRecord& rec) noexcept {
        if (!file_) {
            return;
        }
        const auto seconds = static_cast<long long>(rec.wall_ns / 1'000'000'000ULL);
        const auto nanos = static_cast<long long>(rec.wall_ns % 1'000'000'000ULL);
        const int n = std::fprintf(file_, "[%lld.%09lld][%s][T%u] %s\n",
                                   seconds, nanos,
                                   levelTag(rec.level),
                                   rec.thread_id,
                                   rec.msg);
        if (n > 0) {
            written_.fetch_add(1, std::memory_order_relaxed);
            bytes_.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
        }
    }

    static auto levelTag(uint16_t level) noexcept -> const char* {
        switch (level) {
            case 0: return "DEBUG";
            case 1: return "INFO ";
            case 2: return "WARN ";
            case 3: return "ERROR";
            case 4: return "FATAL";
            default: return "UNKN ";
        }
    }

    char path_[512]{};
    FILE* file_{nullptr};
    MPMCQueue queue_;
    std::thread writer_thread_{};
    std::mutex mutex_{};
    std::condition_variable cv_{};
    std::atomic<bool> running_{true};
    alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> drops_{0};
    alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> written_{0};
    alignas(CACHE_LINE_SIZE) std::atomic<uint64_t> bytes_{0};
    alignas(CACHE_LINE_SIZE) std::atomic<bool> queue_was_empty_{true};
};

std::mutex g_logger_mutex;
AsyncLogger* g_logger = nullptr;
std::atomic<AsyncLogger*> g_active{nullptr};
std::atomic<uint32_t> g_in_use{0};   // logMessage calls that may hold g_active
std::atomic<uint16_t> g_level{static_cast<uint16_t>(LogLevel::INFO)};

// Pins the active logger for the duration of one logMessage call
struct ActiveLoggerRef {
    ActiveLoggerRef() noexcept {
        g_in_use.fetch_add(1, std::memory_order_seq_cst);
        logger = g_active.load(std::memory_order_seq_cst);
    }
    ~ActiveLoggerRef() { g_in_use.fetch_sub(1, std::memory_order_release); }

    ActiveLoggerRef(const ActiveLoggerRef&) = delete;
    ActiveLoggerRef& operator=(const ActiveLoggerRef&) = delete;

    AsyncLogger* logger{nullptr};
};

// Caller holds g_logger_mutex. Unpublishes g_logger and frees it once no
// logMessage call can still reach it.
void retireLoggerLocked() noexcept {
    g_active.store(nullptr, std::memory_order_seq_cst);
    while (g_in_use.load(std::memory_order_acquire) != 0) {
        std::this_thread::yield();
    }
    delete g_logger;
    g_logger = nullptr;
}

} // namespace

void initLogging(const char* log_file) noexcept {
    if (!log_file || log_file[0] == '\0') {
        return;
    }
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        retireLoggerLocked();
    }
    g_logger = new (std::nothrow) AsyncLogger(log_file);
    g_active.store(g_logger, std::memory_order_seq_cst);
}

void shutdownLogging() noexcept {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    retireLoggerLocked();
}

auto isLoggingInitialized() noexcept -> bool {
    return g_active.load(std::memory_order_acquire) != nullptr;
}

auto setLogLevel(LogLevel level) noexcept -> void {
    g_level.store(static_cast<uint16_t>(level), std::memory_order_relaxed);
}

auto getLogLevel() noexcept -> LogLevel {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

auto parseLogLevel(const char* name, LogLevel fallback) noexcept -> LogLevel {
    if (!name) return fallback;
    if (strcasecmp(name, "DEBUG") == 0) return LogLevel::DEBUG;
    if (strcasecmp(name, "INFO") == 0) return LogLevel::INFO;
    if (strcasecmp(name, "WARN") == 0 || strcasecmp(name, "WARNING") == 0) return LogLevel::WARN;
    if (strcasecmp(name, "ERROR") == 0) return LogLevel::ERROR;
    if (strcasecmp(name, "FATAL") == 0) return LogLevel::FATAL;
    return fallback;
}

auto logLevelName(LogLevel level) noexcept -> const char* {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

auto getLogStats() noexcept -> LogStats {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return g_logger ? g_logger->stats() : LogStats{};
}

void logMessage(LogLevel level, const char* format, ...) noexcept {
    if (static_cast<uint16_t>(level) < g_level.load(std::memory_order_relaxed)) {
        return;
    }
    const ActiveLoggerRef ref;
    AsyncLogger* logger = ref.logger;
    if (!logger) {
        return;
    }

    char buffer[240];
    va_list args;
    va_start(args, format);
    const int len = std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    if (len > 0) {
        logger->log(static_cast<uint16_t>(level), buffer,
                    std::min(static_cast<std::size_t>(len), sizeof(buffer) - 1));
    }
}

} // namespace Common
