//! # Logger Unit Tests
//!
//! Level and filter parsing, logger configuration, the console line format,
//! and the diagnostics the symbol table and collector emit.

#include "log/log.hpp"
#include "members/collector.hpp"
#include "types/symbol_table.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace memscope;
using namespace memscope::log;

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, ParseAcceptsEitherCase) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("Warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
}

TEST(LogLevelTest, ParseRejectsUnknownNames) {
    EXPECT_FALSE(parse_level("loud").has_value());
    EXPECT_FALSE(parse_level("").has_value());
    EXPECT_FALSE(parse_level("warning").has_value());
}

// ============================================================================
// LogFilter
// ============================================================================

TEST(LogFilterTest, ModuleLevelsAndDefault) {
    auto result = LogFilter::parse("members=debug, types = error ,*=info");
    ASSERT_TRUE(is_ok(result));
    const auto& filter = unwrap(result);

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "members"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "members"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "types"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "types"));
    EXPECT_EQ(filter.default_level(), LogLevel::Info);
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "other"));
}

TEST(LogFilterTest, BareModuleMeansTrace) {
    auto result = LogFilter::parse("members");
    ASSERT_TRUE(is_ok(result));

    EXPECT_EQ(unwrap(result).level_for("members"), LogLevel::Trace);
    EXPECT_EQ(unwrap(result).level_for("types"), LogLevel::Warn);
}

TEST(LogFilterTest, OffSilencesModule) {
    auto result = LogFilter::parse("types=off");
    ASSERT_TRUE(is_ok(result));

    EXPECT_FALSE(unwrap(result).should_log(LogLevel::Error, "types"));
    EXPECT_TRUE(unwrap(result).should_log(LogLevel::Error, "members"));
}

TEST(LogFilterTest, UnknownLevelIsError) {
    auto result = LogFilter::parse("members=chatty");

    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("members=chatty"), std::string::npos);
}

TEST(LogFilterTest, MissingModuleIsError) {
    EXPECT_TRUE(is_err(LogFilter::parse("=trace")));
}

// ============================================================================
// Formatting
// ============================================================================

TEST(ConsoleSinkTest, WritesOneLinePerRecord) {
    std::ostringstream out;
    ConsoleSink sink(out);

    sink.write(LogRecord{LogLevel::Warn, "types", "undefined parent", __FILE__, __LINE__});
    sink.write(LogRecord{LogLevel::Trace, "members", "kept 2", __FILE__, __LINE__});

    EXPECT_EQ(out.str(), "WARN  [types] undefined parent\nTRACE [members] kept 2\n");
}

// ============================================================================
// Logger
// ============================================================================

class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::vector<Entry>& out) : out_(out) {}

    void write(const LogRecord& record) override {
        out_.push_back({record.level, std::string(record.module), record.message});
    }

private:
    std::vector<Entry>& out_;
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.add_sink(std::make_unique<CaptureSink>(records));
        ASSERT_TRUE(is_ok(logger.configure("warn")));
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.add_sink(std::make_unique<ConsoleSink>());
        ASSERT_TRUE(is_ok(logger.configure("warn")));
    }

    std::vector<CaptureSink::Entry> records;
};

TEST_F(LoggerTest, LevelNameConfiguresEveryModule) {
    auto& logger = Logger::instance();
    ASSERT_TRUE(is_ok(logger.configure("debug")));

    EXPECT_TRUE(logger.should_log(LogLevel::Debug, "types"));
    EXPECT_TRUE(logger.should_log(LogLevel::Debug, "members"));
    EXPECT_FALSE(logger.should_log(LogLevel::Trace, "members"));
}

TEST_F(LoggerTest, FilterConfiguresModules) {
    auto& logger = Logger::instance();
    ASSERT_TRUE(is_ok(logger.configure("members=trace,*=error")));

    EXPECT_TRUE(logger.should_log(LogLevel::Trace, "members"));
    EXPECT_FALSE(logger.should_log(LogLevel::Warn, "types"));
}

TEST_F(LoggerTest, BadSpecLeavesFilterUnchanged) {
    auto& logger = Logger::instance();
    ASSERT_TRUE(is_ok(logger.configure("members=trace")));

    EXPECT_TRUE(is_err(logger.configure("members=chatty")));
    EXPECT_TRUE(logger.should_log(LogLevel::Trace, "members"));
}

TEST_F(LoggerTest, MacrosFormatMessage) {
    ASSERT_TRUE(is_ok(Logger::instance().configure("trace")));
    MEMSCOPE_LOG_DEBUG("members", "kept " << 3 << " of " << 5);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Debug);
    EXPECT_EQ(records[0].module, "members");
    EXPECT_EQ(records[0].message, "kept 3 of 5");
}

TEST_F(LoggerTest, BelowLevelIsDropped) {
    MEMSCOPE_LOG_INFO("members", "hidden");
    MEMSCOPE_LOG_ERROR("members", "shown");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "shown");
}

TEST_F(LoggerTest, ConcurrentLogging) {
    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([]() {
            for (int i = 0; i < messages_per_thread; i++) {
                MEMSCOPE_LOG_WARN("members", "message " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(records.size()), num_threads * messages_per_thread);
}

// ============================================================================
// Emitted Diagnostics
// ============================================================================

TEST_F(LoggerTest, DuplicateClassWarns) {
    types::SymbolTable table;
    ASSERT_TRUE(is_ok(table.define_class("Animal")));
    ASSERT_TRUE(is_err(table.define_class("Animal")));

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Warn);
    EXPECT_EQ(records[0].module, "types");
    EXPECT_NE(records[0].message.find("Animal"), std::string::npos);
}

TEST_F(LoggerTest, RejectedMembersWarn) {
    types::SymbolTable table;
    ASSERT_TRUE(is_ok(table.define_class("Animal")));

    ASSERT_TRUE(is_err(table.define_member("Animal", {.name = ""})));
    ASSERT_TRUE(is_err(table.define_member("Plant", {.name = "grow"})));

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].level, LogLevel::Warn);
    EXPECT_NE(records[0].message.find("must have a name"), std::string::npos);
    EXPECT_EQ(records[1].level, LogLevel::Warn);
    EXPECT_NE(records[1].message.find("Plant"), std::string::npos);
}

TEST_F(LoggerTest, CollectorTracesSummary) {
    ASSERT_TRUE(is_ok(Logger::instance().configure("members=trace")));

    types::SymbolTable table;
    ASSERT_TRUE(is_ok(table.define_class("Animal")));
    ASSERT_TRUE(is_ok(table.define_member("Animal", {.name = "speak"})));
    auto found = members::collect_symbols(table.class_type("Animal"), members::FilterPolicy{},
                                          table);
    EXPECT_EQ(found.size(), 1u);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Trace);
    EXPECT_EQ(records[0].module, "members");
    EXPECT_NE(records[0].message.find("collect_symbols Animal [term]"), std::string::npos);
}
