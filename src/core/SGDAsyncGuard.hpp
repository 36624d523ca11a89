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

#include <BS_thread_pool.hpp>
#include <future>
#include <string>
#include <nlohmann/json.hpp>

#include "SGDRateLimiter.hpp"
#include "SGDReconnectionManager.hpp"

/**
 * Outcome of an asynchronous rate-limit check
 */
struct sgd_async_rate_result_t
{
    SGDRateDecision decision;
    sgd_rate_limit_info_t info;
    bool timed_out;

    sgd_async_rate_result_t() : decision(SGDRateDecision::FAIL_OPEN), timed_out(false) {}
};

/**
 * Runs the store-bound guard operations on a BS::thread_pool
 *
 * Every *_async call returns immediately with a std::shared_future; the
 * store round-trips happen on the pool so the signaling loop never blocks
 * on them. The *_with_timeout helpers wait at most the operation timeout
 * and fall back to the fail-open answer when it expires: a late rate-limit
 * check counts as FAIL_OPEN, a late reconnect as "not a reconnect".
 *
 * USAGE:
 *   CSGDAsyncGuard guard(&limiter, &reconnect, 4, 250);
 *   auto verdict = guard.check_async("chat_message", user_id);
 *   // keep serving other sockets...
 *   if (verdict.get().decision == SGDRateDecision::EXCEEDED) ...
 *
 * The limiter and manager are not owned and must outlive the guard.
 */
class CSGDAsyncGuard
{
public:
    /**
     * @param worker_threads 0 selects the hardware concurrency
     */
    CSGDAsyncGuard(CSGDRateLimiter *limiter,
                   CSGDReconnectionManager *reconnect,
                   int worker_threads = 0,
                   int timeout_ms = 250);
    ~CSGDAsyncGuard();

    std::shared_future<sgd_async_rate_result_t> check_async(const std::string &limit_type,
                                                            const std::string &identifier,
                                                            bool increment = true);

    std::shared_future<int> buffer_message_async(const std::string &room_id, const nlohmann::json &message);

    std::shared_future<sgd_reconnect_result_t> handle_reconnect_async(const std::string &room_id,
                                                                      const std::string &user_id);

    std::shared_future<int> cleanup_room_async(const std::string &room_id);

    sgd_async_rate_result_t check_with_timeout(const std::string &limit_type,
                                               const std::string &identifier,
                                               bool increment = true);

    sgd_reconnect_result_t handle_reconnect_with_timeout(const std::string &room_id,
                                                         const std::string &user_id);

    /**
     * Block until every submitted task has finished
     */
    void wait();

    int get_timeout_ms() const { return m_timeout_ms; }
    size_t get_tasks_queued() const;
    size_t get_tasks_running() const;
    size_t get_thread_count() const;

private:
    CSGDAsyncGuard(const CSGDAsyncGuard &) = delete;
    CSGDAsyncGuard &operator=(const CSGDAsyncGuard &) = delete;

    CSGDRateLimiter *m_limiter;
    CSGDReconnectionManager *m_reconnect;
    int m_timeout_ms;

    // last member: joined before the rest is torn down
    BS::thread_pool<> m_pool;
};
