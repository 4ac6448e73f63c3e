//! # Logger Implementation
//!
//! Level names, record formatting, filter parsing and the Logger singleton.

#include "log/log.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>

namespace memscope::log {

namespace {

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && s.front() == ' ')
        s.remove_prefix(1);
    while (!s.empty() && s.back() == ' ')
        s.remove_suffix(1);
    return s;
}

} // namespace

// ============================================================================
// Levels and Records
// ============================================================================

auto level_name(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

auto parse_level(std::string_view name) -> std::optional<LogLevel> {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Off}) {
        std::string_view upper = level_name(level);
        if (name.size() != upper.size())
            continue;
        bool same = true;
        for (size_t i = 0; i < name.size() && same; ++i) {
            same = name[i] == upper[i] || name[i] == upper[i] - 'A' + 'a';
        }
        if (same)
            return level;
    }
    return std::nullopt;
}

auto format_record(const LogRecord& record) -> std::string {
    std::ostringstream oss;
    oss << std::left << std::setw(5) << level_name(record.level) << " [" << record.module << "] "
        << record.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink() : out_(&std::cerr) {}

void ConsoleSink::write(const LogRecord& record) {
    *out_ << format_record(record) << '\n';
}

// ============================================================================
// LogFilter
// ============================================================================

auto LogFilter::parse(std::string_view spec, LogLevel default_level)
    -> Result<LogFilter, std::string> {
    LogFilter filter(default_level);

    size_t pos = 0;
    while (pos <= spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos)
            comma = spec.size();
        auto entry = trim(spec.substr(pos, comma - pos));
        pos = comma + 1;

        if (entry.empty())
            continue;

        size_t eq = entry.find('=');
        auto module = trim(entry.substr(0, eq));
        LogLevel level = LogLevel::Trace;
        if (eq != std::string_view::npos) {
            auto parsed = parse_level(trim(entry.substr(eq + 1)));
            if (!parsed)
                return "unknown log level in '" + std::string(entry) + "'";
            level = *parsed;
        }
        if (module.empty())
            return "missing module name in '" + std::string(entry) + "'";

        if (module == "*") {
            filter.default_level_ = level;
        } else {
            filter.module_levels_[std::string(module)] = level;
        }
    }
    return filter;
}

auto LogFilter::level_for(std::string_view module) const -> LogLevel {
    auto it = module_levels_.find(std::string(module));
    return it != module_levels_.end() ? it->second : default_level_;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(std::make_unique<ConsoleSink>());
    if (const char* env = std::getenv("MEMSCOPE_LOG")) {
        auto result = configure(env);
        if (is_err(result)) {
            std::cerr << "warning: ignoring MEMSCOPE_LOG: " << unwrap_err(result) << "\n";
        }
    }
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, std::string message, const char* file,
                 int line) {
    LogRecord record{level, module, std::move(message), file, line};

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

auto Logger::configure(std::string_view spec) -> Result<LogFilter, std::string> {
    spec = trim(spec);
    Result<LogFilter, std::string> result = std::string();

    // A lone level name sets every module; anything else is a module filter
    if (auto level = parse_level(spec)) {
        result = LogFilter(*level);
    } else {
        result = LogFilter::parse(spec);
    }

    if (is_ok(result)) {
        std::lock_guard<std::mutex> lock(mutex_);
        filter_ = unwrap(result);
    }
    return result;
}

} // namespace memscope::log
