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

#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "common.hpp"
#include "SGDConf.hpp"
#include "SGDStore.hpp"

enum class SGDRateDecision
{
    ALLOWED = 0,
    EXCEEDED,
    UNKNOWN_TYPE, // limit type not registered, nothing was counted
    FAIL_OPEN     // store failed, request let through
};

const char *sgd_rate_decision_name(SGDRateDecision decision);

/**
 * Details of one check() call
 */
struct sgd_rate_limit_info_t
{
    int64_t current;     // entries in the window before this call
    int max_allowed;
    int window_seconds;
    int retry_after;     // seconds, set on EXCEEDED
    std::string request_id; // member recorded on ALLOWED with increment
};

struct sgd_rate_limit_status_t
{
    int limit;
    int64_t remaining;
    int64_t used;
    int64_t reset_at; // epoch seconds when the oldest counted entry leaves the window
    int window_seconds;
    std::string error; // set when the status could not be read
};

/**
 * Sliding-window rate limiter over a shared CSGDStore
 *
 * Each (limit_type, identifier) owns the sorted set ratelimit:{type}:{id},
 * one member per accepted request scored by its millisecond timestamp.
 * Correctness across instances relies only on the store's atomic
 * prune-and-count; the limiter itself keeps no per-identifier state.
 *
 * The store is not owned and must outlive the limiter.
 */
class CSGDRateLimiter
{
public:
    explicit CSGDRateLimiter(CSGDStore *store, sgd_clock_fn clock = sgd_clock_fn());
    CSGDRateLimiter(CSGDStore *store, const sgd_rate_limit_catalog_t &limits,
                    SGDUnknownLimitPolicy unknown_policy, sgd_clock_fn clock = sgd_clock_fn());
    ~CSGDRateLimiter();

    /**
     * Add or replace a limit type. Both values must be > 0.
     */
    int register_limit(const std::string &limit_type, const sgd_rate_limit_conf_t &conf);
    bool get_limit(const std::string &limit_type, sgd_rate_limit_conf_t &conf);

    void set_unknown_limit_policy(SGDUnknownLimitPolicy policy);
    SGDUnknownLimitPolicy get_unknown_limit_policy();

    /**
     * One sliding-window decision. Store failures yield FAIL_OPEN, never an
     * exception.
     */
    SGDRateDecision check(const std::string &limit_type, const std::string &identifier,
                          bool increment, sgd_rate_limit_info_t &info);

    /**
     * check() with policy applied: returns true when the request may
     * proceed, throws CSGDError (rate_limit_exceeded) when it may not.
     * Unknown types follow the unknown-limit policy; rejecting one throws
     * CSGDError (invalid_parameter).
     */
    bool check_rate_limit(const std::string &limit_type, const std::string &identifier, bool increment = true);

    /**
     * Snapshot of the window. Prunes expired entries but never records one.
     */
    int get_rate_limit_status(const std::string &limit_type, const std::string &identifier,
                              sgd_rate_limit_status_t &status);

    /**
     * Administrative override: forget every entry of (limit_type, identifier)
     */
    bool reset_rate_limit(const std::string &limit_type, const std::string &identifier);

    static std::string make_key(const std::string &limit_type, const std::string &identifier);

private:
    int64_t now_ms() const;
    void log_fail_open(const std::string &limit_type, const std::string &identifier, const char *step);

    CSGDStore *m_store;
    sgd_clock_fn m_clock;

    std::mutex m_mutex;
    sgd_rate_limit_catalog_t m_limits;
    SGDUnknownLimitPolicy m_unknown_policy;
};
