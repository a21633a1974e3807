#pragma once

/**
 * @file LogService.hpp
 * @brief Unified logging service for Homestead
 *
 * Provides both immediate and buffered logging modes. Entries are stamped
 * with the simulation month they were emitted in (or kNoMonth outside the
 * monthly loop) and with the scenario/component context.
 *
 * Consolidates: LogConfig, LogEntry, LogContextManager, LogService
 */

#include <homestead/core/CoreTypes.hpp>
#include <homestead/io/Console.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace homestead {

// =============================================================================
// LogConfig
// =============================================================================

/**
 * @brief Logging configuration (the `logging:` section of a scenario file)
 */
struct LogConfig {
    LogLevel console_level = LogLevel::Info;
    bool quiet_mode = false; ///< Suppress all but errors

    [[nodiscard]] static LogConfig Default() { return LogConfig{}; }

    [[nodiscard]] static LogConfig Quiet() {
        LogConfig config;
        config.console_level = LogLevel::Error;
        config.quiet_mode = true;
        return config;
    }

    [[nodiscard]] static LogConfig Verbose() {
        LogConfig config;
        config.console_level = LogLevel::Trace;
        return config;
    }

    /// Level actually applied to the console sink
    [[nodiscard]] LogLevel EffectiveLevel() const {
        return quiet_mode ? std::max(console_level, LogLevel::Error) : console_level;
    }
};

// =============================================================================
// LogContext
// =============================================================================

/**
 * @brief Who emitted a log entry
 */
struct LogContext {
    std::string scenario;  ///< Scenario name (e.g., "hong_kong_500sqft")
    std::string component; ///< Engine stage (e.g., "MonthlyLoop")

    /// Full path: "scenario.component" or just "component" if no scenario
    [[nodiscard]] std::string FullPath() const { return MakeFullPath(scenario, component); }

    [[nodiscard]] bool IsSet() const { return !component.empty(); }
};

// =============================================================================
// LogEntry
// =============================================================================

/// Month stamp for entries emitted outside the monthly loop
inline constexpr int kNoMonth = -1;

/**
 * @brief A single log entry with full context
 *
 * Immutable after creation. Collected into the buffer during the monthly loop.
 */
struct LogEntry {
    LogLevel level;      ///< Severity level
    int month;           ///< Simulation month (0-based), or kNoMonth
    std::string message; ///< Log message
    LogContext context;  ///< Scenario/component context

    /// Wall clock time for ordering
    std::chrono::steady_clock::time_point wall_time;

    static LogEntry Create(LogLevel level, int month, std::string_view message,
                           const LogContext &ctx) {
        LogEntry entry;
        entry.level = level;
        entry.month = month;
        entry.message = std::string(message);
        entry.context = ctx;
        entry.wall_time = std::chrono::steady_clock::now();
        return entry;
    }

    /// Format for output: "[m 012] [LEVEL] [scenario.component] message"
    [[nodiscard]] std::string Format(bool include_context = true) const {
        std::ostringstream oss;
        oss << "[" << MonthStamp() << "] ";
        oss << "[" << GetLevelString(level) << "] ";

        if (include_context && context.IsSet()) {
            oss << "[" << context.FullPath() << "] ";
        }

        oss << message;
        return oss.str();
    }

    /// Format with colors (for terminal)
    [[nodiscard]] std::string FormatColored(const Console &console) const {
        std::ostringstream oss;
        oss << console.Colorize("[" + MonthStamp() + "]", AnsiColor::Dim) << " ";
        oss << console.Colorize("[" + std::string(GetLevelString(level)) + "]",
                                GetLevelColor(level))
            << " ";
        if (context.IsSet()) {
            oss << console.Colorize("[" + context.FullPath() + "]", AnsiColor::Cyan) << " ";
        }
        oss << message;
        return oss.str();
    }

  private:
    [[nodiscard]] std::string MonthStamp() const {
        if (month == kNoMonth) {
            return "-----";
        }
        std::ostringstream oss;
        oss << "m " << std::setw(3) << std::setfill('0') << month;
        return oss.str();
    }

    [[nodiscard]] static const char *GetLevelString(LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return "TRC";
        case LogLevel::Debug:
            return "DBG";
        case LogLevel::Info:
            return "INF";
        case LogLevel::Event:
            return "EVT";
        case LogLevel::Warning:
            return "WRN";
        case LogLevel::Error:
            return "ERR";
        case LogLevel::Fatal:
            return "FTL";
        }
        return "???";
    }

    [[nodiscard]] static const char *GetLevelColor(LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return AnsiColor::Gray;
        case LogLevel::Debug:
            return AnsiColor::Cyan;
        case LogLevel::Info:
            return AnsiColor::White;
        case LogLevel::Event:
            return AnsiColor::Green;
        case LogLevel::Warning:
            return AnsiColor::Yellow;
        case LogLevel::Error:
            return AnsiColor::Red;
        case LogLevel::Fatal:
            return AnsiColor::BgRed;
        }
        return AnsiColor::White;
    }
};

// =============================================================================
// LogContextManager
// =============================================================================

/**
 * @brief Thread-local log context manager
 *
 * Simulate() sets the scenario/component context around each engine stage.
 */
class LogContextManager {
  public:
    static void SetContext(const LogContext &ctx) { current_context_ = ctx; }
    static void ClearContext() { current_context_ = LogContext{}; }
    [[nodiscard]] static const LogContext &GetContext() { return current_context_; }

    /**
     * @brief RAII guard for automatic context management
     *
     * An empty scenario keeps the scenario of the enclosing scope.
     */
    class ScopedContext {
      public:
        ScopedContext(const std::string &scenario, const std::string &component)
            : previous_(current_context_) {
            if (!scenario.empty()) {
                current_context_.scenario = scenario;
            }
            current_context_.component = component;
        }

        ~ScopedContext() { current_context_ = previous_; }

        ScopedContext(const ScopedContext &) = delete;
        ScopedContext &operator=(const ScopedContext &) = delete;
        ScopedContext(ScopedContext &&) = delete;
        ScopedContext &operator=(ScopedContext &&) = delete;

      private:
        LogContext previous_;
    };

  private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    static inline thread_local LogContext current_context_;
};

// =============================================================================
// LogService
// =============================================================================

/**
 * @brief Unified logging service
 *
 * Two modes:
 *
 * 1. **Immediate mode** (loading, normalization, settlement):
 *    each entry is handed to the sinks as soon as it is logged.
 *
 * 2. **Buffered mode** (monthly loop):
 *    entries are collected and handed to the sinks when the
 *    BufferedScope closes.
 *
 * The mode and the pending buffer belong to the calling thread, so
 * concurrent Simulate() calls on the global service never flush or clear
 * each other's entries. Sinks are shared and invoked under the lock.
 */
class LogService {
  public:
    /// Sink callback type: receives batch of entries to output
    using Sink = std::function<void(const std::vector<LogEntry> &)>;

    LogService() = default;

    // === Mode Control ===

    /// Set the calling thread's mode
    void SetImmediateMode(bool immediate) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &buffer = buffers_[std::this_thread::get_id()];
        buffer.immediate = immediate;
        if (immediate && buffer.entries.empty()) {
            buffers_.erase(std::this_thread::get_id());
        }
    }

    [[nodiscard]] bool IsImmediateMode() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto *buffer = FindBuffer();
        return buffer == nullptr || buffer->immediate;
    }

    /**
     * @brief RAII guard for buffered mode
     *
     * Switches to buffered mode on construction, restores previous mode
     * and flushes on destruction.
     */
    class BufferedScope {
      public:
        explicit BufferedScope(LogService &service)
            : service_(service), previous_mode_(service.IsImmediateMode()) {
            service_.SetImmediateMode(false);
        }

        ~BufferedScope() {
            service_.FlushAndClear();
            service_.SetImmediateMode(previous_mode_);
        }

        BufferedScope(const BufferedScope &) = delete;
        BufferedScope &operator=(const BufferedScope &) = delete;
        BufferedScope(BufferedScope &&) = delete;
        BufferedScope &operator=(BufferedScope &&) = delete;

      private:
        LogService &service_;
        bool previous_mode_;
    };

    // === Configuration ===

    /// Set minimum level (below this = dropped)
    void SetMinLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetMinLevel() const { return min_level_.load(); }

    /// Apply a scenario's logging section and attach a console sink
    void Configure(const LogConfig &config, const Console &console) {
        std::lock_guard<std::mutex> lock(mutex_);
        const LogLevel level = config.EffectiveLevel();
        min_level_ = level;
        sinks_.clear();
        sinks_.emplace_back(MakeConsoleSink(console), level);
    }

    void AddSink(Sink sink) { AddSink(std::move(sink), LogLevel::Trace); }

    void AddSink(Sink sink, LogLevel min_level) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.emplace_back(std::move(sink), min_level);
    }

    void ClearSinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    // === Logging API ===

    /// Log a message (uses current thread-local context)
    void Log(LogLevel level, int month, std::string_view message) {
        Log(level, month, message, LogContextManager::GetContext());
    }

    /// Log with explicit context (bypasses thread-local)
    void Log(LogLevel level, int month, std::string_view message, const LogContext &ctx) {
        if (level < min_level_.load()) {
            return;
        }

        auto entry = LogEntry::Create(level, month, message, ctx);

        std::lock_guard<std::mutex> lock(mutex_);

        if (level == LogLevel::Error) {
            ++error_count_;
        } else if (level == LogLevel::Fatal) {
            ++fatal_count_;
        }

        auto *buffer = FindBuffer();
        if (buffer == nullptr || buffer->immediate) {
            FlushEntry(entry);
        } else {
            buffer->entries.push_back(std::move(entry));
        }
    }

    void Trace(int m, std::string_view msg) { Log(LogLevel::Trace, m, msg); }
    void Debug(int m, std::string_view msg) { Log(LogLevel::Debug, m, msg); }
    void Info(int m, std::string_view msg) { Log(LogLevel::Info, m, msg); }
    void Event(int m, std::string_view msg) { Log(LogLevel::Event, m, msg); }
    void Warning(int m, std::string_view msg) { Log(LogLevel::Warning, m, msg); }
    void Error(int m, std::string_view msg) { Log(LogLevel::Error, m, msg); }
    void Fatal(int m, std::string_view msg) { Log(LogLevel::Fatal, m, msg); }

    // === Flush Control ===

    /// Flush the calling thread's buffer to all sinks
    void Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto *buffer = FindBuffer()) {
            FlushEntries(buffer->entries);
        }
    }

    void FlushAndClear() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto *buffer = FindBuffer()) {
            FlushEntries(buffer->entries);
            buffer->entries.clear();
        }
    }

    /// Discard the calling thread's pending entries without flushing
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto *buffer = FindBuffer()) {
            buffer->entries.clear();
        }
    }

    // === Query API ===

    [[nodiscard]] std::size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto *buffer = FindBuffer();
        return buffer == nullptr ? 0 : buffer->entries.size();
    }

    [[nodiscard]] std::vector<LogEntry> GetPending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto *buffer = FindBuffer();
        return buffer == nullptr ? std::vector<LogEntry>{} : buffer->entries;
    }

    [[nodiscard]] bool HasErrors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_ > 0;
    }

    [[nodiscard]] std::size_t ErrorCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_;
    }

    [[nodiscard]] std::size_t FatalCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fatal_count_;
    }

    void ResetErrorCounts() {
        std::lock_guard<std::mutex> lock(mutex_);
        error_count_ = 0;
        fatal_count_ = 0;
    }

    /// Sink writing each entry as one console line (colored on a TTY)
    [[nodiscard]] static Sink MakeConsoleSink(const Console &console) {
        return [&console](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                console.WriteLine(console.IsColorEnabled() ? entry.FormatColored(console)
                                                           : entry.Format());
            }
        };
    }

  private:
    /// Per-thread mode and pending entries
    struct ThreadBuffer {
        bool immediate = true;
        std::vector<LogEntry> entries;
    };

    std::unordered_map<std::thread::id, ThreadBuffer> buffers_;
    std::vector<std::pair<Sink, LogLevel>> sinks_; ///< sink + min level
    std::atomic<LogLevel> min_level_{LogLevel::Info};

    std::size_t error_count_ = 0;
    std::size_t fatal_count_ = 0;

    mutable std::mutex mutex_;

    // Lookups below expect mutex_ to be held
    ThreadBuffer *FindBuffer() {
        auto it = buffers_.find(std::this_thread::get_id());
        return it == buffers_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] const ThreadBuffer *FindBuffer() const {
        auto it = buffers_.find(std::this_thread::get_id());
        return it == buffers_.end() ? nullptr : &it->second;
    }

    void FlushEntry(const LogEntry &entry) {
        for (const auto &[sink, min_level] : sinks_) {
            if (entry.level >= min_level) {
                sink({entry});
            }
        }
    }

    void FlushEntries(const std::vector<LogEntry> &entries) {
        if (entries.empty()) {
            return;
        }
        for (const auto &[sink, min_level] : sinks_) {
            std::vector<LogEntry> filtered;
            filtered.reserve(entries.size());
            for (const auto &entry : entries) {
                if (entry.level >= min_level) {
                    filtered.push_back(entry);
                }
            }
            if (!filtered.empty()) {
                sink(filtered);
            }
        }
    }
};

/**
 * @brief Global log service singleton
 */
inline LogService &GetLogService() {
    static LogService instance;
    return instance;
}

} // namespace homestead

// =============================================================================
// Logging Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define HOMESTEAD_LOG_TRACE(month, msg) ::homestead::GetLogService().Trace(month, msg)

#define HOMESTEAD_LOG_DEBUG(month, msg) ::homestead::GetLogService().Debug(month, msg)

#define HOMESTEAD_LOG_INFO(month, msg) ::homestead::GetLogService().Info(month, msg)

#define HOMESTEAD_LOG_EVENT(month, msg) ::homestead::GetLogService().Event(month, msg)

#define HOMESTEAD_LOG_WARN(month, msg) ::homestead::GetLogService().Warning(month, msg)

#define HOMESTEAD_LOG_ERROR(month, msg) ::homestead::GetLogService().Error(month, msg)
// NOLINTEND(cppcoreguidelines-macro-usage)
