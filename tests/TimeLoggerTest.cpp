#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "Utils/QuestDBLogger.hpp"
#include "Utils/StreamLogger.hpp"
#include "Utils/TimeLogger.hpp"

namespace {

class RecordingLogger : public ILogger {
public:
    std::vector<std::pair<std::string, long>> samples;

    void log(const std::string& command, long duration_ms) override {
        samples.emplace_back(command, duration_ms);
    }
};

} // namespace

TEST(TimeLoggerTest, ReportsElapsedTimeOnScopeExit) {
    RecordingLogger logger;
    {
        TimeLogger timer(logger, "book");
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        EXPECT_TRUE(logger.samples.empty());
    }

    ASSERT_EQ(logger.samples.size(), 1u);
    EXPECT_EQ(logger.samples[0].first, "book");
    EXPECT_GE(logger.samples[0].second, 20);
}

TEST(StreamLoggerTest, WritesTimingLine) {
    std::ostringstream out;
    StreamLogger logger(out);

    logger.log("trades", 42);

    EXPECT_EQ(out.str(), "[TIMING] trades 42 ms\n");
}

TEST(QuestDBLoggerTest, InsertStatementQuotesCommand) {
    EXPECT_EQ(QuestDBLogger::insert_statement("ping", 7),
              "INSERT INTO execution_times(ts, methodName, durationMs) VALUES(systimestamp(), 'ping', 7)");
    EXPECT_EQ(QuestDBLogger::insert_statement("it's", 1),
              "INSERT INTO execution_times(ts, methodName, durationMs) VALUES(systimestamp(), 'it''s', 1)");
}

TEST(QuestDBLoggerTest, UnreachableServerDoesNotThrow) {
    // Port 9 (discard) is closed on test machines; the failure is only logged.
    QuestDBLogger logger("http://127.0.0.1:9/");
    EXPECT_NO_THROW(logger.log("ping", 1));
}
