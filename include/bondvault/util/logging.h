// BONDVAULT - Logging System
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Every subsystem logs under one LogCategory. The logger keeps a global
// level and a category mask; each sink adds its own level threshold.

#ifndef BONDVAULT_UTIL_LOGGING_H
#define BONDVAULT_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace bondvault {
namespace util {

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

/// Upper-case name, e.g. "WARN"
const char* LogLevelToString(LogLevel level);

/// Case-insensitive; accepts "warning" and "none". Unknown names give Info.
LogLevel LogLevelFromString(const std::string& name);

enum class LogCategory : uint8_t {
    DEFAULT,
    ORACLE,
    RELAY,
    VAULT,
    DB,
    CONFIG,
    CLI
};

using LogCategoryMask = uint32_t;

constexpr LogCategoryMask ALL_LOG_CATEGORIES = 0xFFFFFFFFu;

constexpr LogCategoryMask CategoryBit(LogCategory category) {
    return LogCategoryMask{1} << static_cast<uint8_t>(category);
}

/// Lower-case name as written in config files, e.g. "relay"
const char* LogCategoryToString(LogCategory category);

/// Returns false for an unknown name
bool LogCategoryFromString(const std::string& name, LogCategory& out);

/**
 * Parse a comma separated category list ("oracle, vault").
 * An empty list or "all" selects every category.
 * Returns false and names the offending entry in badName on failure.
 */
bool ParseLogCategoryMask(const std::string& list, LogCategoryMask& out,
                          std::string* badName = nullptr);

// ============================================================================
// Records
// ============================================================================

struct LogRecord {
    LogLevel level{LogLevel::Info};
    LogCategory category{LogCategory::DEFAULT};
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point when;
};

/// Which optional columns a rendered line carries
struct LineLayout {
    bool timestamp{true};
    bool category{true};
    bool location{false};
};

/// "2023-11-14T22:13:20.125Z [WARN] [relay] text (file.cpp:12)"
std::string RenderLogLine(const LogRecord& record, const LineLayout& layout);

/// UTC, millisecond precision, ISO 8601
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Strip directories from a path
std::string GetBasename(const std::string& path);

// ============================================================================
// Sinks
// ============================================================================

/// Output destination. The threshold lives here; the logger consults
/// Accepts() before handing a record over.
class LogSink {
public:
    explicit LogSink(LogLevel threshold) : threshold_(threshold) {}
    virtual ~LogSink() = default;

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    void SetLevel(LogLevel level) { threshold_.store(level); }
    LogLevel GetLevel() const { return threshold_.load(); }

    bool Accepts(LogLevel level) const {
        return level != LogLevel::Off && level >= threshold_.load();
    }

    virtual void Write(const LogRecord& record) = 0;
    virtual void Flush() {}

private:
    std::atomic<LogLevel> threshold_;
};

/// Writes to stdout, or to stderr when Config::useStderr is set
class ConsoleSink : public LogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        bool showTimestamp{true};
        bool showCategory{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() : ConsoleSink(Config{}) {}
    explicit ConsoleSink(const Config& config);

    void Write(const LogRecord& record) override;
    void Flush() override;

private:
    Config config_;
    LineLayout layout_;
    std::mutex mutex_;
};

/// Appends rendered lines, with source locations, to a file
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);

    bool IsOpen() const { return out_.is_open(); }
    const std::string& Path() const { return path_; }

    void Write(const LogRecord& record) override;
    void Flush() override;

private:
    std::string path_;
    std::ofstream out_;
    std::mutex mutex_;
};

class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : LogSink(level), callback_(std::move(callback)) {}

    void Write(const LogRecord& record) override {
        if (callback_) callback_(record);
    }

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * Process-wide logger.
 *
 * WillLog() is lock-free so disabled statements cost two atomic loads.
 * Sinks are called in registration order under the sink lock.
 */
class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<LogSink> sink);
    void RemoveSink(const std::shared_ptr<LogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    void SetCategoryMask(LogCategoryMask mask) { mask_.store(mask); }
    LogCategoryMask GetCategoryMask() const { return mask_.load(); }

    /// Restrict output to a single category
    void OnlyCategory(LogCategory category) { SetCategoryMask(CategoryBit(category)); }
    void EnableCategory(LogCategory category);
    void DisableCategory(LogCategory category);
    void EnableAllCategories() { SetCategoryMask(ALL_LOG_CATEGORIES); }
    bool IsCategoryEnabled(LogCategory category) const {
        return (mask_.load() & CategoryBit(category)) != 0;
    }

    bool WillLog(LogLevel level, LogCategory category) const {
        return level != LogLevel::Off && level >= level_.load() &&
               IsCategoryEnabled(category);
    }

    void Submit(LogRecord record);

    void Flush();

    /// Flush and drop all sinks
    void Shutdown();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::atomic<LogCategoryMask> mask_{ALL_LOG_CATEGORIES};
};

// ============================================================================
// Statement Builder
// ============================================================================

/// Accumulates one statement and submits it when the full expression ends
class LogLine {
public:
    LogLine(LogLevel level, LogCategory category, const char* file, int line);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template<typename T>
    LogLine& operator<<(const T& value) {
        text_ << value;
        return *this;
    }

private:
    LogRecord record_;
    std::ostringstream text_;
};

// ============================================================================
// Macros
// ============================================================================

#define BONDVAULT_LOG(level, category)                                           \
    if (!::bondvault::util::Logger::Instance().WillLog(                         \
            ::bondvault::util::LogLevel::level, category)) {} else              \
        ::bondvault::util::LogLine(::bondvault::util::LogLevel::level, category, \
                                   __FILE__, __LINE__)

#define LOG_TRACE(category)   BONDVAULT_LOG(Trace, category)
#define LOG_DEBUG(category)   BONDVAULT_LOG(Debug, category)
#define LOG_INFO(category)    BONDVAULT_LOG(Info, category)
#define LOG_WARN(category)    BONDVAULT_LOG(Warn, category)
#define LOG_ERROR(category)   BONDVAULT_LOG(Error, category)

} // namespace util
} // namespace bondvault

#endif // BONDVAULT_UTIL_LOGGING_H
