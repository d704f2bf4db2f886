// BONDVAULT - Logging System Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/util/logging.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace bondvault {
namespace util {

namespace {

struct CategoryName {
    LogCategory category;
    const char* name;
};

constexpr CategoryName CATEGORY_NAMES[] = {
    {LogCategory::DEFAULT, "default"},
    {LogCategory::ORACLE, "oracle"},
    {LogCategory::RELAY, "relay"},
    {LogCategory::VAULT, "vault"},
    {LogCategory::DB, "db"},
    {LogCategory::CONFIG, "config"},
    {LogCategory::CLI, "cli"},
};

std::string Lowered(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string Trimmed(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

const char* AnsiColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[1;31m";
        default:              return "";
    }
}

} // namespace

// ============================================================================
// Names
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "?";
}

LogLevel LogLevelFromString(const std::string& name) {
    std::string s = Lowered(Trimmed(name));
    if (s == "trace") return LogLevel::Trace;
    if (s == "debug") return LogLevel::Debug;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "off" || s == "none") return LogLevel::Off;
    return LogLevel::Info;
}

const char* LogCategoryToString(LogCategory category) {
    for (const auto& entry : CATEGORY_NAMES) {
        if (entry.category == category) return entry.name;
    }
    return "default";
}

bool LogCategoryFromString(const std::string& name, LogCategory& out) {
    std::string s = Lowered(Trimmed(name));
    for (const auto& entry : CATEGORY_NAMES) {
        if (s == entry.name) {
            out = entry.category;
            return true;
        }
    }
    return false;
}

bool ParseLogCategoryMask(const std::string& list, LogCategoryMask& out,
                          std::string* badName) {
    std::string all = Lowered(Trimmed(list));
    if (all.empty() || all == "all") {
        out = ALL_LOG_CATEGORIES;
        return true;
    }

    LogCategoryMask mask = 0;
    std::istringstream in(list);
    std::string item;
    while (std::getline(in, item, ',')) {
        if (Trimmed(item).empty()) continue;
        LogCategory category;
        if (!LogCategoryFromString(item, category)) {
            if (badName) *badName = Trimmed(item);
            return false;
        }
        mask |= CategoryBit(category);
    }
    out = mask;
    return true;
}

// ============================================================================
// Rendering
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    auto sinceEpoch = tp.time_since_epoch();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count() % 1000;
    std::time_t secs = std::chrono::system_clock::to_time_t(tp);

    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &secs);
#else
    gmtime_r(&secs, &utc);
#endif
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return out.str();
}

std::string GetBasename(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string RenderLogLine(const LogRecord& record, const LineLayout& layout) {
    std::ostringstream out;
    if (layout.timestamp) {
        out << FormatLogTimestamp(record.when) << ' ';
    }
    out << '[' << LogLevelToString(record.level) << "] ";
    if (layout.category) {
        out << '[' << LogCategoryToString(record.category) << "] ";
    }
    out << record.message;
    if (layout.location && record.file) {
        out << " (" << GetBasename(record.file) << ':' << record.line << ')';
    }
    return out.str();
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(const Config& config)
    : LogSink(config.level), config_(config) {
    layout_.timestamp = config.showTimestamp;
    layout_.category = config.showCategory;
}

void ConsoleSink::Write(const LogRecord& record) {
    std::string text = RenderLogLine(record, layout_);
    bool toStderr = config_.useStderr && record.level >= LogLevel::Warn;
    std::ostream& os = toStderr ? std::cerr : std::cout;

    std::lock_guard<std::mutex> lock(mutex_);
    const char* color = config_.useColors ? AnsiColor(record.level) : "";
    if (*color) {
        os << color << text << "\033[0m\n";
    } else {
        os << text << '\n';
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, LogLevel level)
    : LogSink(level), path_(path), out_(path, std::ios::app) {}

void FileSink::Write(const LogRecord& record) {
    LineLayout layout;
    layout.location = true;
    std::string text = RenderLogLine(record, layout);

    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_ << text << '\n';
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) out_.flush();
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::EnableCategory(LogCategory category) {
    mask_.fetch_or(CategoryBit(category));
}

void Logger::DisableCategory(LogCategory category) {
    mask_.fetch_and(~CategoryBit(category));
}

void Logger::Submit(LogRecord record) {
    if (!WillLog(record.level, record.category)) return;

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        if (sink->Accepts(record.level)) {
            sink->Write(record);
        }
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
    sinks_.clear();
}

// ============================================================================
// LogLine
// ============================================================================

LogLine::LogLine(LogLevel level, LogCategory category, const char* file, int line) {
    record_.level = level;
    record_.category = category;
    record_.file = file;
    record_.line = line;
    record_.when = std::chrono::system_clock::now();
}

LogLine::~LogLine() {
    record_.message = text_.str();
    Logger::Instance().Submit(std::move(record_));
}

} // namespace util
} // namespace bondvault
