/**
 * @file test_logging.cpp
 * @brief Unit tests for console output and the log service
 */

#include <homestead/io/Console.hpp>
#include <homestead/io/LogService.hpp>
#include <homestead/io/ScalarFormat.hpp>
#include <homestead/sim/Simulate.hpp>

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace homestead;

// =============================================================================
// Console Tests
// =============================================================================

TEST(Console, DefaultColorDetection) {
    Console console;
    EXPECT_EQ(console.IsColorEnabled(), console.IsTerminal());
}

TEST(Console, ColorizeStripsWhenDisabled) {
    Console console;
    console.SetColorEnabled(false);
    EXPECT_EQ(console.Colorize("test", AnsiColor::Red), "test");
}

TEST(Console, ColorizeAddsWhenEnabled) {
    Console console;
    console.SetColorEnabled(true);

    auto result = console.Colorize("test", AnsiColor::Red);
    EXPECT_NE(result.find("\033[31m"), std::string::npos);
    EXPECT_NE(result.find("\033[0m"), std::string::npos);
}

TEST(Console, Padding) {
    EXPECT_EQ(Console::PadRight("foo", 6), "foo   ");
    EXPECT_EQ(Console::PadRight("foobar", 4), "foobar");
    EXPECT_EQ(Console::PadLeft("foo", 6), "   foo");
}

TEST(Console, FormatNumberGroupsThousands) {
    EXPECT_EQ(Console::FormatNumber(1234567.891), "1,234,567.89");
    EXPECT_EQ(Console::FormatNumber(999.7, 0), "1,000");
    EXPECT_EQ(Console::FormatNumber(-31218.917, 2), "-31,218.92");
    EXPECT_EQ(Console::FormatNumber(0.0015, 4), "0.0015");
    EXPECT_EQ(Console::FormatNumber(-0.001, 2), "0.00");
}

TEST(Console, FormatCurrency) {
    EXPECT_EQ(Console::FormatCurrency(14449961.2146), "$14,449,961");
    EXPECT_EQ(Console::FormatCurrency(-17010527.2086), "-$17,010,527");
    EXPECT_EQ(Console::FormatCurrency(0.0), "$0");
}

TEST(Console, ParseLogLevel) {
    EXPECT_EQ(ParseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(ParseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(ParseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(ParseLogLevel("Warning"), LogLevel::Warning);
    EXPECT_FALSE(ParseLogLevel("loud").has_value());
}

// =============================================================================
// ScalarFormat Tests
// =============================================================================

TEST(ScalarFormat, NumericUsesGrouping) {
    EXPECT_EQ(io::FormatScalar(7000000.0), "7,000,000.00");
}

TEST(ScalarFormat, SymbolicConstantFolds) {
    EXPECT_EQ(io::FormatScalar(SymbolicScalar(2500.0)), "2,500.00");
    EXPECT_EQ(io::FormatScalar(janus::sym("x")), "<symbolic>");
}

// =============================================================================
// LogEntry / LogContext Tests
// =============================================================================

TEST(LogEntry, FormatWithMonthAndContext) {
    LogContext ctx{"hk", "MonthlyLoop"};
    auto entry = LogEntry::Create(LogLevel::Debug, 11, "Year 1", ctx);
    EXPECT_EQ(entry.Format(), "[m 011] [DBG] [hk.MonthlyLoop] Year 1");
    EXPECT_EQ(entry.Format(false), "[m 011] [DBG] Year 1");
}

TEST(LogEntry, FormatOutsideLoop) {
    auto entry = LogEntry::Create(LogLevel::Info, kNoMonth, "Loaded", LogContext{});
    EXPECT_EQ(entry.Format(), "[-----] [INF] Loaded");
}

TEST(LogContext, FullPath) {
    LogContext ctx{"", "Settlement"};
    EXPECT_EQ(ctx.FullPath(), "Settlement");
    ctx.scenario = "hk";
    EXPECT_EQ(ctx.FullPath(), "hk.Settlement");
    EXPECT_TRUE(ctx.IsSet());
    EXPECT_FALSE(LogContext{}.IsSet());
}

TEST(LogContextManager, NestedScopedContextKeepsScenario) {
    LogContextManager::ClearContext();
    {
        LogContextManager::ScopedContext outer("hk", "Simulate");
        EXPECT_EQ(LogContextManager::GetContext().FullPath(), "hk.Simulate");
        {
            LogContextManager::ScopedContext inner("", "MonthlyLoop");
            EXPECT_EQ(LogContextManager::GetContext().FullPath(), "hk.MonthlyLoop");
        }
        EXPECT_EQ(LogContextManager::GetContext().FullPath(), "hk.Simulate");
    }
    EXPECT_FALSE(LogContextManager::GetContext().IsSet());
}

// =============================================================================
// LogConfig Tests
// =============================================================================

TEST(LogConfig, QuietRaisesEffectiveLevel) {
    EXPECT_EQ(LogConfig::Default().EffectiveLevel(), LogLevel::Info);
    EXPECT_EQ(LogConfig::Verbose().EffectiveLevel(), LogLevel::Trace);

    LogConfig cfg;
    cfg.console_level = LogLevel::Debug;
    cfg.quiet_mode = true;
    EXPECT_EQ(cfg.EffectiveLevel(), LogLevel::Error);

    cfg.console_level = LogLevel::Fatal;
    EXPECT_EQ(cfg.EffectiveLevel(), LogLevel::Fatal);
}

// =============================================================================
// LogService Tests
// =============================================================================

TEST(LogService, DefaultImmediateMode) {
    LogService service;
    EXPECT_TRUE(service.IsImmediateMode());
}

TEST(LogService, LogLevelFiltering) {
    LogService service;
    service.SetMinLevel(LogLevel::Warning);
    service.SetImmediateMode(false);

    service.Info(0, "This is info");
    EXPECT_EQ(service.PendingCount(), 0u);

    service.Warning(0, "This is warning");
    EXPECT_EQ(service.PendingCount(), 1u);

    service.Clear();
}

TEST(LogService, ErrorTracking) {
    LogService service;
    service.SetImmediateMode(false);

    EXPECT_FALSE(service.HasErrors());
    service.Error(3, "Test error");
    service.Fatal(4, "Test fatal");
    EXPECT_TRUE(service.HasErrors());
    EXPECT_EQ(service.ErrorCount(), 1u);
    EXPECT_EQ(service.FatalCount(), 1u);

    service.ResetErrorCounts();
    EXPECT_FALSE(service.HasErrors());
    service.Clear();
}

TEST(LogService, BufferedScopeFlushesOnExit) {
    LogService service;
    std::vector<LogEntry> received;
    service.AddSink([&received](const std::vector<LogEntry> &entries) {
        received.insert(received.end(), entries.begin(), entries.end());
    });

    {
        LogService::BufferedScope scope(service);
        EXPECT_FALSE(service.IsImmediateMode());
        service.Info(0, "first");
        service.Info(1, "second");
        EXPECT_TRUE(received.empty());
        EXPECT_EQ(service.PendingCount(), 2u);
    }

    EXPECT_TRUE(service.IsImmediateMode());
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[1].month, 1);
    EXPECT_EQ(service.PendingCount(), 0u);
}

TEST(LogService, BufferedScopesAreIsolatedPerThread) {
    LogService service;
    std::vector<LogEntry> received;
    service.AddSink([&received](const std::vector<LogEntry> &entries) {
        received.insert(received.end(), entries.begin(), entries.end());
    });

    {
        LogService::BufferedScope scope(service);
        service.Info(0, "main first");
        service.Info(1, "main second");

        std::thread worker([&service] {
            EXPECT_TRUE(service.IsImmediateMode());
            LogService::BufferedScope worker_scope(service);
            service.Info(5, "worker");
            EXPECT_EQ(service.PendingCount(), 1u);
        });
        worker.join();

        // Closing the worker's scope flushed only the worker's entry
        ASSERT_EQ(received.size(), 1u);
        EXPECT_EQ(received[0].month, 5);
        EXPECT_FALSE(service.IsImmediateMode());
        EXPECT_EQ(service.PendingCount(), 2u);
    }

    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(received[1].month, 0);
    EXPECT_EQ(received[2].month, 1);
    EXPECT_TRUE(service.IsImmediateMode());
}

TEST(LogService, ConcurrentSimulationsShareTheGlobalService) {
    auto &global = GetLogService();
    global.ClearSinks();
    global.SetMinLevel(LogLevel::Debug);
    std::vector<LogEntry> received;
    global.AddSink([&received](const std::vector<LogEntry> &entries) {
        received.insert(received.end(), entries.begin(), entries.end());
    });

    const auto expected = Simulate(SimulationParameters::Default());
    const std::size_t entries_per_run = received.size();
    received.clear();

    constexpr int kThreads = 4;
    constexpr int kRuns = 10;
    std::vector<double> advantages(kThreads * kRuns, 0.0);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([t, &advantages] {
            for (int r = 0; r < kRuns; ++r) {
                advantages[t * kRuns + r] =
                    Simulate(SimulationParameters::Default()).net_advantage_buy;
            }
        });
    }
    for (auto &w : workers) {
        w.join();
    }

    for (double adv : advantages) {
        EXPECT_EQ(adv, expected.net_advantage_buy);
    }
    EXPECT_EQ(received.size(), entries_per_run * kThreads * kRuns);
    EXPECT_EQ(global.PendingCount(), 0u);
    EXPECT_TRUE(global.IsImmediateMode());

    global.ClearSinks();
    global.SetMinLevel(LogLevel::Info);
}

TEST(LogService, ImmediateModeDoesNotStore) {
    LogService service;
    int calls = 0;
    service.AddSink([&calls](const std::vector<LogEntry> &) { ++calls; });
    service.Info(kNoMonth, "now");
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(service.PendingCount(), 0u);
}

TEST(LogService, SinkWithMinLevel) {
    LogService service;
    service.SetImmediateMode(false);
    service.SetMinLevel(LogLevel::Trace);

    std::vector<LogEntry> received;
    service.AddSink(
        [&received](const std::vector<LogEntry> &entries) {
            received.insert(received.end(), entries.begin(), entries.end());
        },
        LogLevel::Warning);

    service.Debug(0, "debug");
    service.Warning(0, "warning");
    service.Error(0, "error");
    service.Flush();

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0].level, LogLevel::Warning);
    service.Clear();
}

TEST(LogService, SimulateLogsYearEndsUnderLoopContext) {
    auto &log = GetLogService();
    log.ClearSinks();
    log.SetMinLevel(LogLevel::Debug);

    std::vector<LogEntry> received;
    log.AddSink([&received](const std::vector<LogEntry> &entries) {
        received.insert(received.end(), entries.begin(), entries.end());
    });

    auto p = SimulationParameters::Default();
    p.horizon_years = 3;
    (void)Simulate(p, "hk");

    int year_entries = 0;
    bool saw_settled = false;
    for (const auto &entry : received) {
        if (entry.context.FullPath() == "hk.MonthlyLoop" && entry.level == LogLevel::Debug) {
            ++year_entries;
        }
        if (entry.level == LogLevel::Event &&
            entry.message.find("Horizon settled") != std::string::npos) {
            saw_settled = true;
            EXPECT_EQ(entry.month, 35);
        }
    }
    EXPECT_EQ(year_entries, 3);
    EXPECT_TRUE(saw_settled);

    log.ClearSinks();
    log.SetMinLevel(LogLevel::Info);
}
