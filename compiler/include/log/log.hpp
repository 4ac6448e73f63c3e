//! # memscope Logging
//!
//! Module-tagged diagnostics for the symbol table (`"types"`) and the member
//! collector (`"members"`). Records go through a per-module level filter to
//! every registered sink; the default sink prints one line per record to
//! stderr.
//!
//! ## Configuration
//!
//! The logger starts at `Warn` and then applies the `MEMSCOPE_LOG`
//! environment variable, which holds either a level or a module filter:
//!
//! ```text
//! MEMSCOPE_LOG=debug                  all modules at Debug
//! MEMSCOPE_LOG=members=trace,*=warn   collector traces, everything else Warn
//! MEMSCOPE_LOG=members                shorthand for members=trace
//! ```
//!
//! ## Usage
//!
//! ```cpp
//! MEMSCOPE_LOG_TRACE("members", "collect_symbols " << type_to_string(type));
//! MEMSCOPE_LOG_WARN("types", "class '" << name << "' is already defined");
//! ```

#ifndef MEMSCOPE_LOG_HPP
#define MEMSCOPE_LOG_HPP

#include "common.hpp"

#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace memscope::log {

// ============================================================================
// Levels and Records
// ============================================================================

/// Record severity, ascending. `Off` only appears in filters.
enum class LogLevel : int {
    Trace = 0, ///< Per-collection summaries
    Debug = 1, ///< Registration details
    Info = 2,
    Warn = 3,  ///< Rejected definitions
    Error = 4,
    Off = 5
};

[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Parses "trace" .. "off" in lower or upper case.
[[nodiscard]] auto parse_level(std::string_view name) -> std::optional<LogLevel>;

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< "members", "types"
    std::string message;
    const char* file; ///< __FILE__ of the logging statement
    int line;
};

/// "WARN  [types] message", without a trailing newline.
[[nodiscard]] auto format_record(const LogRecord& record) -> std::string;

// ============================================================================
// Sinks
// ============================================================================

/// Destination for records that passed the filter.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
};

/// Writes `format_record()` lines to a stream (stderr by default).
class ConsoleSink : public LogSink {
public:
    ConsoleSink();
    explicit ConsoleSink(std::ostream& out) : out_(&out) {}

    void write(const LogRecord& record) override;

private:
    std::ostream* out_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module minimum levels with a default for unlisted modules.
class LogFilter {
public:
    explicit LogFilter(LogLevel default_level = LogLevel::Warn) : default_level_(default_level) {}

    /// Parses "members=trace,types=debug,*=warn". A bare module name means
    /// Trace; `*` sets the default. Empty entries are ignored.
    [[nodiscard]] static auto parse(std::string_view spec,
                                    LogLevel default_level = LogLevel::Warn)
        -> Result<LogFilter, std::string>;

    [[nodiscard]] auto level_for(std::string_view module) const -> LogLevel;

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool {
        return level != LogLevel::Off && level >= level_for(module);
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

private:
    LogLevel default_level_;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger. Thread-safe.
class Logger {
public:
    /// The logger, configured from `MEMSCOPE_LOG` on first use.
    static auto instance() -> Logger&;

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(LogLevel level, std::string_view module, std::string message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink; records are dropped until one is added.
    void clear_sinks();

    /// Replaces the filter with one read from `spec`, either a level name or
    /// a module filter. Leaves the filter unchanged on error.
    auto configure(std::string_view spec) -> Result<LogFilter, std::string>;

private:
    Logger();

    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Macros
// ============================================================================

// Records below this level compile away. 0=Trace .. 4=Error
#ifndef MEMSCOPE_MIN_LOG_LEVEL
#define MEMSCOPE_MIN_LOG_LEVEL 0
#endif

#define MEMSCOPE_LOG_IMPL(level, module_str, msg)                                                  \
    do {                                                                                           \
        if (static_cast<int>(level) >= MEMSCOPE_MIN_LOG_LEVEL) {                                   \
            auto& logger_ = ::memscope::log::Logger::instance();                                   \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define MEMSCOPE_LOG_TRACE(module, msg) MEMSCOPE_LOG_IMPL(::memscope::log::LogLevel::Trace, module, msg)
#define MEMSCOPE_LOG_DEBUG(module, msg) MEMSCOPE_LOG_IMPL(::memscope::log::LogLevel::Debug, module, msg)
#define MEMSCOPE_LOG_INFO(module, msg) MEMSCOPE_LOG_IMPL(::memscope::log::LogLevel::Info, module, msg)
#define MEMSCOPE_LOG_WARN(module, msg) MEMSCOPE_LOG_IMPL(::memscope::log::LogLevel::Warn, module, msg)
#define MEMSCOPE_LOG_ERROR(module, msg) MEMSCOPE_LOG_IMPL(::memscope::log::LogLevel::Error, module, msg)

} // namespace memscope::log

#endif // MEMSCOPE_LOG_HPP
