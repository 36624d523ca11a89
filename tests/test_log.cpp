/**
 * The MIT License (MIT)
 *
 * Copyright (c) 2019-2020 Edward.Wu
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of
 * the Software, and to permit persons to whom the Software is furnished to do so,
 * subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS
 * FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR
 * COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER
 * IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <memory>

#include "core/SGDJsonSink.hpp"
#include "core/SGDLog.hpp"
#include "core/SGDLogRateLimiter.hpp"
#include "core/SGDSummaryLogger.hpp"
#include "test_helpers.hpp"

using json = nlohmann::json;

TEST(LogRateLimiter, FirstEventThenEveryNth)
{
    ManualClock clock;
    CSGDLogRateLimiter limiter(60000, 5);
    limiter.set_clock(clock.fn());

    CSGDLogRateLimiter::EventStats stats;
    EXPECT_TRUE(limiter.should_log("reject:chat_message:u1", stats));
    EXPECT_EQ(stats.count, 1);

    for (int i = 2; i <= 4; i++)
        EXPECT_FALSE(limiter.should_log("reject:chat_message:u1", stats)) << "event " << i;
    EXPECT_EQ(stats.suppressed, 3);

    EXPECT_TRUE(limiter.should_log("reject:chat_message:u1", stats));
    EXPECT_EQ(stats.count, 5);
    EXPECT_EQ(stats.suppressed, 3);

    EXPECT_FALSE(limiter.should_log("reject:chat_message:u1", stats));
    EXPECT_EQ(stats.suppressed, 1);

    // other keys are independent
    EXPECT_TRUE(limiter.should_log("failopen:signaling", stats));
    EXPECT_EQ(limiter.get_tracked_keys(), 2u);
}

TEST(LogRateLimiter, WindowRestarts)
{
    ManualClock clock;
    CSGDLogRateLimiter limiter(1000, 10);
    limiter.set_clock(clock.fn());

    CSGDLogRateLimiter::EventStats stats;
    EXPECT_TRUE(limiter.should_log("k", stats));
    EXPECT_FALSE(limiter.should_log("k", stats));

    clock.advance_ms(1001);
    EXPECT_TRUE(limiter.should_log("k", stats));
    EXPECT_EQ(stats.count, 1);

    limiter.clear();
    EXPECT_EQ(limiter.get_tracked_keys(), 0u);
}

TEST(LogRateLimiter, ThresholdIsAtLeastOne)
{
    CSGDLogRateLimiter limiter(1000, 0);
    EXPECT_EQ(limiter.get_threshold(), 1);

    CSGDLogRateLimiter::EventStats stats;
    EXPECT_TRUE(limiter.should_log("k", stats));
    EXPECT_TRUE(limiter.should_log("k", stats));
}

TEST(SummaryLogger, ReportsAndResetsCounters)
{
    CSGDSummaryLogger summary;
    summary.reset(0);

    std::string message;
    EXPECT_FALSE(summary.should_log_summary(60, 59999, message));

    for (int i = 0; i < 3; i++)
        summary.record_allowed();
    summary.record_rejected();
    summary.record_fail_open();
    summary.record_buffered();
    summary.record_buffered();
    summary.record_reconnect(4);
    summary.record_content_rejected();

    ASSERT_TRUE(summary.should_log_summary(60, 60000, message));
    EXPECT_EQ(message,
              "[summary] Last 60s: 3 allowed, 1 rejected, 1 fail-open | 2 buffered, 1 reconnects (4 replayed)"
              " | 1 content rejected");

    ASSERT_FALSE(summary.should_log_summary(60, 60001, message));
    ASSERT_TRUE(summary.should_log_summary(60, 120000, message));
    EXPECT_EQ(message, "[summary] Last 60s: 0 allowed, 0 rejected | 0 buffered, 0 reconnects");
}

TEST(SummaryLogger, BufferFailures)
{
    CSGDSummaryLogger summary;
    summary.reset(0);
    summary.record_buffered();
    summary.record_buffer_failure();

    std::string message;
    ASSERT_TRUE(summary.should_log_summary(10, 10000, message));
    EXPECT_NE(message.find("1 buffered (1 failed)"), std::string::npos);
}

TEST(JsonSink, ExtractsCategoryAndFields)
{
    json doc = sgd_json_file_sink_mt::to_json_fields(
        "[ratelimit] Rate limit exceeded | limit_type=chat_message identifier=u1 retry_after=12.");
    EXPECT_EQ(doc["category"], "ratelimit");
    EXPECT_EQ(doc["fields"]["limit_type"], "chat_message");
    EXPECT_EQ(doc["fields"]["identifier"], "u1");
    EXPECT_EQ(doc["fields"]["retry_after"], "12");

    json plain = sgd_json_file_sink_mt::to_json_fields("no structure here");
    EXPECT_FALSE(plain.contains("category"));
    EXPECT_FALSE(plain.contains("fields"));
}

TEST(JsonSink, WritesOneDocumentPerLine)
{
    std::string path = ::testing::TempDir() + "sig_guard_json_sink_test.log";
    std::remove(path.c_str());
    {
        auto sink = std::make_shared<sgd_json_file_sink_mt>(path);
        spdlog::logger logger("json-test", sink);
        logger.warn("[security] IP added to blocklist | ip={} ttl={}s", "10.0.0.1", 60);
        logger.flush();
    }

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    json doc = json::parse(line);
    EXPECT_EQ(doc["category"], "security");
    EXPECT_EQ(doc["level"], "warning");
    EXPECT_EQ(doc["logger"], "json-test");
    EXPECT_EQ(doc["fields"]["ip"], "10.0.0.1");
    EXPECT_EQ(doc["fields"]["ttl"], "60s");
    EXPECT_FALSE(doc["timestamp"].get<std::string>().empty());
    EXPECT_FALSE(std::getline(in, line));
    std::remove(path.c_str());
}

TEST(Log, CategoryLevels)
{
    initialize_logger();
    ASSERT_EQ(sgd_set_log_level("info"), SGD_OK);
    EXPECT_FALSE(sgd_should_log_category(SGDLogCategory::STORE, spdlog::level::debug));

    ASSERT_EQ(sgd_set_category_log_level(SGDLogCategory::STORE, "debug"), SGD_OK);
    EXPECT_TRUE(sgd_should_log_category(SGDLogCategory::STORE, spdlog::level::debug));
    EXPECT_FALSE(sgd_should_log_category(SGDLogCategory::RECONNECT, spdlog::level::debug));

    EXPECT_EQ(sgd_set_category_log_level(SGDLogCategory::STORE, "chatty"), SGD_ERROR);
    EXPECT_EQ(sgd_set_log_level("chatty"), SGD_ERROR);
    EXPECT_EQ(sgd_set_log_level("Warning"), SGD_OK);
    EXPECT_EQ(sgd_set_log_level("info"), SGD_OK);

    SGDLogCategory category;
    ASSERT_TRUE(sgd_log_category_from_string("ratelimit", category));
    EXPECT_EQ(category, SGDLogCategory::RATELIMIT);
    EXPECT_FALSE(sgd_log_category_from_string("bogus", category));
}

TEST(Log, RepeatedEventsRespectSwitch)
{
    initialize_logger();
    sgd_log_config_t &config = sgd_get_log_config();
    config.rate_limit_enabled = false;

    int suppressed = -1;
    for (int i = 0; i < 3; i++)
    {
        EXPECT_TRUE(sgd_should_log_repeated("log-test:switch", suppressed));
        EXPECT_EQ(suppressed, 0);
    }

    config.rate_limit_enabled = true;
    sgd_get_log_rate_limiter().clear();
    EXPECT_TRUE(sgd_should_log_repeated("log-test:switch", suppressed));
    EXPECT_FALSE(sgd_should_log_repeated("log-test:switch", suppressed));
}
