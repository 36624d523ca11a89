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

#include <cmath>
#include <utility>
#include "spdlog/spdlog.h"

#include "SGDRateLimiter.hpp"
#include "SGDError.hpp"
#include "SGDLog.hpp"
#include "SGDRequestId.hpp"

// Extra TTL on a tracking set beyond its window
#define SGD_RATE_LIMIT_TTL_SLACK_SEC 60

const char *sgd_rate_decision_name(SGDRateDecision decision)
{
    switch (decision)
    {
    case SGDRateDecision::ALLOWED:      return "allowed";
    case SGDRateDecision::EXCEEDED:     return "exceeded";
    case SGDRateDecision::UNKNOWN_TYPE: return "unknown_type";
    case SGDRateDecision::FAIL_OPEN:    return "fail_open";
    default:                            return "unknown";
    }
}

CSGDRateLimiter::CSGDRateLimiter(CSGDStore *store, sgd_clock_fn clock)
    : CSGDRateLimiter(store, sgd_default_rate_limits(), SGDUnknownLimitPolicy::ALLOW, std::move(clock))
{
}

CSGDRateLimiter::CSGDRateLimiter(CSGDStore *store, const sgd_rate_limit_catalog_t &limits,
                                 SGDUnknownLimitPolicy unknown_policy, sgd_clock_fn clock)
    : m_store(store),
      m_clock(std::move(clock)),
      m_unknown_policy(unknown_policy)
{
    for (const auto &limit : limits)
        register_limit(limit.first, limit.second);
}

CSGDRateLimiter::~CSGDRateLimiter()
{
}

int64_t CSGDRateLimiter::now_ms() const
{
    return m_clock ? m_clock() : sgd_gettime_ms();
}

std::string CSGDRateLimiter::make_key(const std::string &limit_type, const std::string &identifier)
{
    return "ratelimit:" + limit_type + ":" + identifier;
}

int CSGDRateLimiter::register_limit(const std::string &limit_type, const sgd_rate_limit_conf_t &conf)
{
    if (limit_type.empty() || conf.max_requests <= 0 || conf.window_seconds <= 0)
    {
        spdlog::error("[ratelimit] CSGDRateLimiter::register_limit, invalid limit | limit_type={} max_requests={} window_seconds={}",
                      limit_type, conf.max_requests, conf.window_seconds);
        return SGD_ERROR;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_limits[limit_type] = conf;
    return SGD_OK;
}

bool CSGDRateLimiter::get_limit(const std::string &limit_type, sgd_rate_limit_conf_t &conf)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_limits.find(limit_type);
    if (it == m_limits.end())
        return false;
    conf = it->second;
    return true;
}

void CSGDRateLimiter::set_unknown_limit_policy(SGDUnknownLimitPolicy policy)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_unknown_policy = policy;
}

SGDUnknownLimitPolicy CSGDRateLimiter::get_unknown_limit_policy()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_unknown_policy;
}

void CSGDRateLimiter::log_fail_open(const std::string &limit_type, const std::string &identifier, const char *step)
{
    sgd_get_summary_logger().record_fail_open();

    int suppressed = 0;
    if (!sgd_should_log_repeated("failopen:" + limit_type, suppressed))
        return;
    spdlog::error("[ratelimit] Store failure, failing open | limit_type={} identifier={} step={} suppressed={}",
                  limit_type, identifier, step, suppressed);
}

SGDRateDecision CSGDRateLimiter::check(const std::string &limit_type, const std::string &identifier,
                                       bool increment, sgd_rate_limit_info_t &info)
{
    info.current = 0;
    info.max_allowed = 0;
    info.window_seconds = 0;
    info.retry_after = 0;
    info.request_id.clear();

    sgd_rate_limit_conf_t conf;
    if (!get_limit(limit_type, conf))
    {
        int suppressed = 0;
        if (sgd_should_log_repeated("unknown:" + limit_type, suppressed))
            spdlog::warn("[ratelimit] Unknown limit type | limit_type={} identifier={} suppressed={}",
                         limit_type, identifier, suppressed);
        return SGDRateDecision::UNKNOWN_TYPE;
    }
    info.max_allowed = conf.max_requests;
    info.window_seconds = conf.window_seconds;

    std::string key = make_key(limit_type, identifier);
    int64_t now = now_ms();
    int64_t window_ms = (int64_t)conf.window_seconds * 1000;
    int64_t window_start = now - window_ms;

    int64_t count = 0;
    if (m_store->zset_prune_and_count(key, (double)window_start, count) != SGD_OK)
    {
        log_fail_open(limit_type, identifier, "prune");
        return SGDRateDecision::FAIL_OPEN;
    }
    info.current = count;

    if (count >= conf.max_requests)
    {
        bool found = false;
        double oldest = 0;
        int retry_after = conf.window_seconds;
        if (m_store->zset_oldest(key, found, oldest) == SGD_OK && found)
            retry_after = (int)std::ceil(((int64_t)oldest + window_ms - now) / 1000.0);
        if (retry_after < 1)
            retry_after = 1;
        info.retry_after = retry_after;

        sgd_get_summary_logger().record_rejected();
        int suppressed = 0;
        if (sgd_should_log_category(SGDLogCategory::RATELIMIT, spdlog::level::warn) &&
            sgd_should_log_repeated("reject:" + limit_type + ":" + identifier, suppressed))
        {
            spdlog::warn("[ratelimit] Rate limit exceeded | limit_type={} identifier={} current={} max={} retry_after={} suppressed={}",
                         limit_type, identifier, count, conf.max_requests, retry_after, suppressed);
        }
        return SGDRateDecision::EXCEEDED;
    }

    if (increment)
    {
        info.request_id = CSGDRequestId::generate(now);
        if (m_store->zset_add(key, info.request_id, (double)now, conf.window_seconds + SGD_RATE_LIMIT_TTL_SLACK_SEC) != SGD_OK)
        {
            log_fail_open(limit_type, identifier, "add");
            return SGDRateDecision::FAIL_OPEN;
        }
    }

    sgd_get_summary_logger().record_allowed();
    if (sgd_should_log_category(SGDLogCategory::RATELIMIT, spdlog::level::trace))
    {
        spdlog::trace("[ratelimit] Allowed | limit_type={} identifier={} current={} max={}",
                      limit_type, identifier, count + (increment ? 1 : 0), conf.max_requests);
    }
    return SGDRateDecision::ALLOWED;
}

bool CSGDRateLimiter::check_rate_limit(const std::string &limit_type, const std::string &identifier, bool increment)
{
    sgd_rate_limit_info_t info;
    SGDRateDecision decision = check(limit_type, identifier, increment, info);

    switch (decision)
    {
    case SGDRateDecision::EXCEEDED:
        throw CSGDError::rate_limit_exceeded(limit_type, (int)info.current, info.max_allowed, info.retry_after);
    case SGDRateDecision::UNKNOWN_TYPE:
        if (get_unknown_limit_policy() == SGDUnknownLimitPolicy::REJECT)
            throw CSGDError(SGDErrorCode::INVALID_PARAMETER,
                            "Unknown rate limit type: " + limit_type,
                            nlohmann::json{{"limit_type", limit_type}},
                            SGD_NO_RETRY_AFTER,
                            "Use one of the configured rate limit types");
        return true;
    default:
        return true;
    }
}

int CSGDRateLimiter::get_rate_limit_status(const std::string &limit_type, const std::string &identifier,
                                           sgd_rate_limit_status_t &status)
{
    status.limit = 0;
    status.remaining = 0;
    status.used = 0;
    status.reset_at = 0;
    status.window_seconds = 0;
    status.error.clear();

    sgd_rate_limit_conf_t conf;
    if (!get_limit(limit_type, conf))
    {
        status.error = "Unknown limit type: " + limit_type;
        return SGD_ERROR;
    }
    status.limit = conf.max_requests;
    status.window_seconds = conf.window_seconds;

    std::string key = make_key(limit_type, identifier);
    int64_t now = now_ms();
    int64_t window_ms = (int64_t)conf.window_seconds * 1000;

    int64_t used = 0;
    bool found = false;
    double oldest = 0;
    if (m_store->zset_prune_and_count(key, (double)(now - window_ms), used) != SGD_OK ||
        m_store->zset_oldest(key, found, oldest) != SGD_OK)
    {
        spdlog::error("[ratelimit] Status unavailable | limit_type={} identifier={}", limit_type, identifier);
        status.error = "Rate limit store unavailable";
        return SGD_ERROR;
    }

    status.used = used;
    status.remaining = used >= conf.max_requests ? 0 : conf.max_requests - used;
    int64_t reset_ms = found ? (int64_t)oldest + window_ms : now + window_ms;
    status.reset_at = (reset_ms + 999) / 1000;
    return SGD_OK;
}

bool CSGDRateLimiter::reset_rate_limit(const std::string &limit_type, const std::string &identifier)
{
    if (m_store->del(make_key(limit_type, identifier)) != SGD_OK)
    {
        spdlog::error("[ratelimit] Reset failed | limit_type={} identifier={}", limit_type, identifier);
        return false;
    }
    spdlog::info("[ratelimit] Rate limit reset | limit_type={} identifier={}", limit_type, identifier);
    return true;
}
