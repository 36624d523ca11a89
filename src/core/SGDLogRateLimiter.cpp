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

#include "SGDLogRateLimiter.hpp"

#define SGD_LOG_RATE_LIMITER_CLEANUP_EVERY 100

CSGDLogRateLimiter::CSGDLogRateLimiter(int64_t window_ms, int threshold)
    : m_window_ms(window_ms), m_threshold(threshold > 0 ? threshold : 1),
      m_events_since_cleanup(0), m_clock(sgd_gettime_ms)
{
}

CSGDLogRateLimiter::~CSGDLogRateLimiter()
{
}

bool CSGDLogRateLimiter::should_log(const std::string &key, EventStats &stats)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    int64_t now_ms = m_clock();

    if (++m_events_since_cleanup >= SGD_LOG_RATE_LIMITER_CLEANUP_EVERY)
    {
        m_events_since_cleanup = 0;
        cleanup_idle_keys(now_ms);
    }

    auto it = m_events.find(key);
    if (it == m_events.end() || now_ms - it->second.window_start_ms > m_window_ms)
    {
        EventStats fresh;
        fresh.window_start_ms = now_ms;
        fresh.last_seen_ms = now_ms;
        fresh.count = 1;
        fresh.suppressed = 0;
        m_events[key] = fresh;
        stats = fresh;
        return true;
    }

    EventStats &entry = it->second;
    entry.count++;
    entry.last_seen_ms = now_ms;

    if (entry.count % m_threshold == 0)
    {
        stats = entry;
        entry.suppressed = 0;
        return true;
    }

    entry.suppressed++;
    stats = entry;
    return false;
}

void CSGDLogRateLimiter::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.clear();
    m_events_since_cleanup = 0;
}

void CSGDLogRateLimiter::set_window_ms(int64_t window_ms)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_window_ms = window_ms;
}

void CSGDLogRateLimiter::set_threshold(int threshold)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_threshold = threshold > 0 ? threshold : 1;
}

void CSGDLogRateLimiter::set_clock(sgd_clock_fn clock)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_clock = clock ? clock : sgd_clock_fn(sgd_gettime_ms);
}

size_t CSGDLogRateLimiter::get_tracked_keys()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

void CSGDLogRateLimiter::cleanup_idle_keys(int64_t now_ms)
{
    int64_t expiry_ms = now_ms - m_window_ms * 10;

    for (auto it = m_events.begin(); it != m_events.end();)
    {
        if (it->second.last_seen_ms < expiry_ms)
            it = m_events.erase(it);
        else
            ++it;
    }
}
