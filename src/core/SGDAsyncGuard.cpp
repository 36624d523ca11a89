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

#include <chrono>
#include "spdlog/spdlog.h"

#include "SGDAsyncGuard.hpp"
#include "SGDLog.hpp"

CSGDAsyncGuard::CSGDAsyncGuard(CSGDRateLimiter *limiter,
                               CSGDReconnectionManager *reconnect,
                               int worker_threads,
                               int timeout_ms)
    : m_limiter(limiter),
      m_reconnect(reconnect),
      m_timeout_ms(timeout_ms > 0 ? timeout_ms : 250),
      m_pool(worker_threads > 0 ? worker_threads : 0)
{
    spdlog::info("[system] Async guard started | threads={} timeout={}ms",
                 m_pool.get_thread_count(), m_timeout_ms);
}

CSGDAsyncGuard::~CSGDAsyncGuard()
{
    m_pool.wait();
}

std::shared_future<sgd_async_rate_result_t> CSGDAsyncGuard::check_async(const std::string &limit_type,
                                                                        const std::string &identifier,
                                                                        bool increment)
{
    CSGDRateLimiter *limiter = m_limiter;
    return m_pool.submit_task([limiter, limit_type, identifier, increment]() {
        sgd_async_rate_result_t result;
        result.decision = limiter->check(limit_type, identifier, increment, result.info);
        return result;
    }).share();
}

std::shared_future<int> CSGDAsyncGuard::buffer_message_async(const std::string &room_id, const nlohmann::json &message)
{
    CSGDReconnectionManager *reconnect = m_reconnect;
    return m_pool.submit_task([reconnect, room_id, message]() {
        return reconnect->buffer_message(room_id, message);
    }).share();
}

std::shared_future<sgd_reconnect_result_t> CSGDAsyncGuard::handle_reconnect_async(const std::string &room_id,
                                                                                  const std::string &user_id)
{
    CSGDReconnectionManager *reconnect = m_reconnect;
    return m_pool.submit_task([reconnect, room_id, user_id]() {
        return reconnect->handle_reconnect(room_id, user_id);
    }).share();
}

std::shared_future<int> CSGDAsyncGuard::cleanup_room_async(const std::string &room_id)
{
    CSGDReconnectionManager *reconnect = m_reconnect;
    return m_pool.submit_task([reconnect, room_id]() {
        return reconnect->cleanup_room(room_id);
    }).share();
}

sgd_async_rate_result_t CSGDAsyncGuard::check_with_timeout(const std::string &limit_type,
                                                           const std::string &identifier,
                                                           bool increment)
{
    std::shared_future<sgd_async_rate_result_t> future = check_async(limit_type, identifier, increment);
    if (future.wait_for(std::chrono::milliseconds(m_timeout_ms)) == std::future_status::ready)
        return future.get();

    sgd_async_rate_result_t result;
    result.decision = SGDRateDecision::FAIL_OPEN;
    result.timed_out = true;
    sgd_get_summary_logger().record_fail_open();

    int suppressed = 0;
    if (sgd_should_log_repeated("timeout:" + limit_type, suppressed))
        spdlog::error("[ratelimit] Check timed out, failing open | limit_type={} identifier={} timeout={}ms suppressed={}",
                      limit_type, identifier, m_timeout_ms, suppressed);
    return result;
}

sgd_reconnect_result_t CSGDAsyncGuard::handle_reconnect_with_timeout(const std::string &room_id,
                                                                     const std::string &user_id)
{
    std::shared_future<sgd_reconnect_result_t> future = handle_reconnect_async(room_id, user_id);
    if (future.wait_for(std::chrono::milliseconds(m_timeout_ms)) == std::future_status::ready)
        return future.get();

    spdlog::warn("[reconnect] Reconnect lookup timed out, treating as new connection | room_id={} user_id={} timeout={}ms",
                 room_id, user_id, m_timeout_ms);

    sgd_reconnect_result_t result;
    result.is_reconnect = false;
    result.last_sequence = 0;
    result.has_disconnect_duration = false;
    result.disconnect_duration_seconds = 0;
    result.error = "timeout";
    return result;
}

void CSGDAsyncGuard::wait()
{
    m_pool.wait();
}

size_t CSGDAsyncGuard::get_tasks_queued() const
{
    return m_pool.get_tasks_queued();
}

size_t CSGDAsyncGuard::get_tasks_running() const
{
    return m_pool.get_tasks_running();
}

size_t CSGDAsyncGuard::get_thread_count() const
{
    return m_pool.get_thread_count();
}
