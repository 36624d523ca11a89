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

#include <set>
#include <thread>
#include <vector>

#include "core/SGDError.hpp"
#include "core/SGDMemoryStore.hpp"
#include "core/SGDRateLimiter.hpp"
#include "test_helpers.hpp"

class RateLimiterTest : public ::testing::Test
{
protected:
    RateLimiterTest()
        : store(clock.fn()),
          limiter(&store, clock.fn())
    {
    }

    ManualClock clock;
    CSGDMemoryStore store;
    CSGDRateLimiter limiter;
};

TEST_F(RateLimiterTest, DefaultCatalog)
{
    sgd_rate_limit_conf_t conf;
    ASSERT_TRUE(limiter.get_limit("chat_message", conf));
    EXPECT_EQ(conf.max_requests, 60);
    EXPECT_EQ(conf.window_seconds, 60);

    ASSERT_TRUE(limiter.get_limit("file_share", conf));
    EXPECT_EQ(conf.max_requests, 10);
    EXPECT_EQ(conf.window_seconds, 300);

    ASSERT_TRUE(limiter.get_limit("room_create", conf));
    EXPECT_EQ(conf.max_requests, 5);
    EXPECT_EQ(conf.window_seconds, 3600);

    EXPECT_FALSE(limiter.get_limit("nonexistent", conf));
}

TEST_F(RateLimiterTest, AllowsUpToLimitThenRejects)
{
    sgd_rate_limit_info_t info;
    for (int i = 0; i < 10; i++)
    {
        ASSERT_EQ(limiter.check("hand_raise", "user-1", true, info), SGDRateDecision::ALLOWED) << "request " << i;
        EXPECT_EQ(info.current, i);
        EXPECT_FALSE(info.request_id.empty());
    }

    EXPECT_EQ(limiter.check("hand_raise", "user-1", true, info), SGDRateDecision::EXCEEDED);
    EXPECT_EQ(info.current, 10);
    EXPECT_EQ(info.max_allowed, 10);
    EXPECT_EQ(info.retry_after, 60);

    int64_t count = 0;
    ASSERT_EQ(store.zset_prune_and_count(CSGDRateLimiter::make_key("hand_raise", "user-1"), 0, count), SGD_OK);
    EXPECT_EQ(count, 10);
}

TEST_F(RateLimiterTest, IdentifiersAndTypesAreIndependent)
{
    sgd_rate_limit_info_t info;
    for (int i = 0; i < 10; i++)
        ASSERT_EQ(limiter.check("hand_raise", "user-1", true, info), SGDRateDecision::ALLOWED);

    EXPECT_EQ(limiter.check("hand_raise", "user-2", true, info), SGDRateDecision::ALLOWED);
    EXPECT_EQ(limiter.check("reaction", "user-1", true, info), SGDRateDecision::ALLOWED);
}

TEST_F(RateLimiterTest, WindowSlides)
{
    sgd_rate_limit_info_t info;
    for (int i = 0; i < 5; i++)
    {
        ASSERT_EQ(limiter.check("room_create", "user-1", true, info), SGDRateDecision::ALLOWED);
        clock.advance_sec(60);
    }
    ASSERT_EQ(limiter.check("room_create", "user-1", true, info), SGDRateDecision::EXCEEDED);
    // oldest entry was recorded 300s ago, window is 3600s
    EXPECT_EQ(info.retry_after, 3300);

    clock.advance_sec(3300);
    EXPECT_EQ(limiter.check("room_create", "user-1", true, info), SGDRateDecision::ALLOWED);
    EXPECT_EQ(info.current, 4);
}

TEST_F(RateLimiterTest, EntryAtWindowBoundaryHasExpired)
{
    sgd_rate_limit_info_t info;
    ASSERT_EQ(limiter.register_limit("tiny", {1, 10}), SGD_OK);
    ASSERT_EQ(limiter.check("tiny", "u", true, info), SGDRateDecision::ALLOWED);

    clock.advance_ms(9999);
    EXPECT_EQ(limiter.check("tiny", "u", true, info), SGDRateDecision::EXCEEDED);
    EXPECT_EQ(info.retry_after, 1);

    clock.advance_ms(1);
    EXPECT_EQ(limiter.check("tiny", "u", true, info), SGDRateDecision::ALLOWED);
}

TEST_F(RateLimiterTest, PeekDoesNotRecord)
{
    sgd_rate_limit_info_t info;
    ASSERT_EQ(limiter.register_limit("tiny", {1, 10}), SGD_OK);
    for (int i = 0; i < 5; i++)
    {
        ASSERT_EQ(limiter.check("tiny", "u", false, info), SGDRateDecision::ALLOWED);
        EXPECT_TRUE(info.request_id.empty());
    }
    EXPECT_EQ(limiter.check("tiny", "u", true, info), SGDRateDecision::ALLOWED);
    EXPECT_EQ(limiter.check("tiny", "u", false, info), SGDRateDecision::EXCEEDED);
}

TEST_F(RateLimiterTest, RejectedRequestsAreNotRecorded)
{
    sgd_rate_limit_info_t info;
    ASSERT_EQ(limiter.register_limit("tiny", {2, 10}), SGD_OK);
    ASSERT_EQ(limiter.check("tiny", "u", true, info), SGDRateDecision::ALLOWED);
    ASSERT_EQ(limiter.check("tiny", "u", true, info), SGDRateDecision::ALLOWED);
    for (int i = 0; i < 20; i++)
        ASSERT_EQ(limiter.check("tiny", "u", true, info), SGDRateDecision::EXCEEDED);

    sgd_rate_limit_status_t status;
    ASSERT_EQ(limiter.get_rate_limit_status("tiny", "u", status), SGD_OK);
    EXPECT_EQ(status.used, 2);
}

TEST_F(RateLimiterTest, RegisterLimitValidates)
{
    EXPECT_EQ(limiter.register_limit("", {1, 1}), SGD_ERROR);
    EXPECT_EQ(limiter.register_limit("bad", {0, 10}), SGD_ERROR);
    EXPECT_EQ(limiter.register_limit("bad", {10, 0}), SGD_ERROR);

    sgd_rate_limit_conf_t conf;
    EXPECT_FALSE(limiter.get_limit("bad", conf));

    ASSERT_EQ(limiter.register_limit("chat_message", {3, 5}), SGD_OK);
    ASSERT_TRUE(limiter.get_limit("chat_message", conf));
    EXPECT_EQ(conf.max_requests, 3);
}

TEST_F(RateLimiterTest, UnknownTypeFollowsPolicy)
{
    sgd_rate_limit_info_t info;
    EXPECT_EQ(limiter.check("nonexistent", "u", true, info), SGDRateDecision::UNKNOWN_TYPE);
    EXPECT_TRUE(limiter.check_rate_limit("nonexistent", "u"));
    EXPECT_EQ(store.size(), 0u);

    limiter.set_unknown_limit_policy(SGDUnknownLimitPolicy::REJECT);
    try
    {
        limiter.check_rate_limit("nonexistent", "u");
        FAIL() << "expected CSGDError";
    }
    catch (const CSGDError &e)
    {
        EXPECT_EQ(e.get_error_code(), SGDErrorCode::INVALID_PARAMETER);
        EXPECT_EQ(e.get_status_code(), 400);
    }
}

TEST_F(RateLimiterTest, CheckRateLimitThrowsWhenExceeded)
{
    ASSERT_EQ(limiter.register_limit("tiny", {1, 30}), SGD_OK);
    EXPECT_TRUE(limiter.check_rate_limit("tiny", "u"));

    clock.advance_sec(10);
    try
    {
        limiter.check_rate_limit("tiny", "u");
        FAIL() << "expected CSGDError";
    }
    catch (const CSGDError &e)
    {
        EXPECT_EQ(e.get_error_code(), SGDErrorCode::RATE_LIMIT_EXCEEDED);
        EXPECT_EQ(e.get_status_code(), 429);
        EXPECT_EQ(e.get_retry_after(), 20);
        EXPECT_EQ(e.get_details()["limit_type"], "tiny");
        EXPECT_EQ(e.get_details()["current"], 1);
        EXPECT_EQ(e.get_details()["max_allowed"], 1);
    }
}

TEST_F(RateLimiterTest, Status)
{
    ASSERT_EQ(limiter.register_limit("tiny", {3, 10}), SGD_OK);

    sgd_rate_limit_status_t status;
    ASSERT_EQ(limiter.get_rate_limit_status("tiny", "u", status), SGD_OK);
    EXPECT_EQ(status.limit, 3);
    EXPECT_EQ(status.used, 0);
    EXPECT_EQ(status.remaining, 3);
    EXPECT_EQ(status.window_seconds, 10);
    EXPECT_EQ(status.reset_at, (clock.now() + 10000 + 999) / 1000);

    int64_t first = clock.now();
    ASSERT_TRUE(limiter.check_rate_limit("tiny", "u"));
    clock.advance_sec(2);
    ASSERT_TRUE(limiter.check_rate_limit("tiny", "u"));

    ASSERT_EQ(limiter.get_rate_limit_status("tiny", "u", status), SGD_OK);
    EXPECT_EQ(status.used, 2);
    EXPECT_EQ(status.remaining, 1);
    EXPECT_EQ(status.reset_at, (first + 10000 + 999) / 1000);

    // reading the status never records a request
    ASSERT_EQ(limiter.get_rate_limit_status("tiny", "u", status), SGD_OK);
    EXPECT_EQ(status.used, 2);

    EXPECT_EQ(limiter.get_rate_limit_status("nonexistent", "u", status), SGD_ERROR);
    EXPECT_FALSE(status.error.empty());
}

TEST_F(RateLimiterTest, Reset)
{
    ASSERT_EQ(limiter.register_limit("tiny", {1, 60}), SGD_OK);
    ASSERT_TRUE(limiter.check_rate_limit("tiny", "u"));
    EXPECT_THROW(limiter.check_rate_limit("tiny", "u"), CSGDError);

    EXPECT_TRUE(limiter.reset_rate_limit("tiny", "u"));
    EXPECT_TRUE(limiter.check_rate_limit("tiny", "u"));
}

TEST_F(RateLimiterTest, RequestIdsAreUnique)
{
    ASSERT_EQ(limiter.register_limit("burst", {1000, 60}), SGD_OK);
    std::set<std::string> ids;
    sgd_rate_limit_info_t info;
    for (int i = 0; i < 200; i++)
    {
        ASSERT_EQ(limiter.check("burst", "u", true, info), SGDRateDecision::ALLOWED);
        ids.insert(info.request_id);
    }
    // all recorded within the same millisecond
    EXPECT_EQ(ids.size(), 200u);

    sgd_rate_limit_status_t status;
    ASSERT_EQ(limiter.get_rate_limit_status("burst", "u", status), SGD_OK);
    EXPECT_EQ(status.used, 200);
}

TEST(RateLimiter, FailsOpenWhenStoreIsDown)
{
    FailingStore store;
    CSGDRateLimiter limiter(&store);

    sgd_rate_limit_info_t info;
    EXPECT_EQ(limiter.check("chat_message", "u", true, info), SGDRateDecision::FAIL_OPEN);
    EXPECT_TRUE(limiter.check_rate_limit("chat_message", "u"));

    sgd_rate_limit_status_t status;
    EXPECT_EQ(limiter.get_rate_limit_status("chat_message", "u", status), SGD_ERROR);
    EXPECT_FALSE(status.error.empty());

    EXPECT_FALSE(limiter.reset_rate_limit("chat_message", "u"));
}

TEST(RateLimiter, SharedStoreAcrossInstances)
{
    ManualClock clock;
    CSGDMemoryStore store(clock.fn());
    sgd_rate_limit_catalog_t limits = {{"tiny", {4, 60}}};
    CSGDRateLimiter a(&store, limits, SGDUnknownLimitPolicy::ALLOW, clock.fn());
    CSGDRateLimiter b(&store, limits, SGDUnknownLimitPolicy::ALLOW, clock.fn());

    sgd_rate_limit_info_t info;
    EXPECT_EQ(a.check("tiny", "u", true, info), SGDRateDecision::ALLOWED);
    EXPECT_EQ(b.check("tiny", "u", true, info), SGDRateDecision::ALLOWED);
    EXPECT_EQ(a.check("tiny", "u", true, info), SGDRateDecision::ALLOWED);
    EXPECT_EQ(b.check("tiny", "u", true, info), SGDRateDecision::ALLOWED);
    EXPECT_EQ(a.check("tiny", "u", true, info), SGDRateDecision::EXCEEDED);
    EXPECT_EQ(b.check("tiny", "u", true, info), SGDRateDecision::EXCEEDED);
}

TEST(RateLimiter, ConcurrentChecksNeverExceedTheLimitByMuch)
{
    CSGDMemoryStore store;
    sgd_rate_limit_catalog_t limits = {{"burst", {50, 60}}};
    CSGDRateLimiter limiter(&store, limits, SGDUnknownLimitPolicy::ALLOW);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++)
    {
        threads.emplace_back([&limiter]() {
            sgd_rate_limit_info_t info;
            for (int i = 0; i < 40; i++)
                limiter.check("burst", "shared", true, info);
        });
    }
    for (std::thread &thread : threads)
        thread.join();

    sgd_rate_limit_status_t status;
    ASSERT_EQ(limiter.get_rate_limit_status("burst", "shared", status), SGD_OK);
    // check-then-add is two steps; concurrent callers may overshoot by at most one each
    EXPECT_GE(status.used, 50);
    EXPECT_LE(status.used, 54);
}

TEST(RateLimiter, DecisionNames)
{
    EXPECT_STREQ(sgd_rate_decision_name(SGDRateDecision::ALLOWED), "allowed");
    EXPECT_STREQ(sgd_rate_decision_name(SGDRateDecision::EXCEEDED), "exceeded");
    EXPECT_STREQ(sgd_rate_decision_name(SGDRateDecision::FAIL_OPEN), "fail_open");
    EXPECT_EQ(CSGDRateLimiter::make_key("chat_message", "user-1"), "ratelimit:chat_message:user-1");
}
