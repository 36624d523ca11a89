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

#include <string>
#include <unordered_map>
#include <mutex>
#include <cstdint>
#include "common.hpp"

/**
 * Rate limiter for repetitive log events
 *
 * A client hammering a limited action produces one rejection per request.
 * This class keeps those warnings readable: the first event of a key in a
 * window is logged, then only every Nth one, carrying the number of events
 * swallowed in between.
 *
 * Keys are free-form, e.g. "reject:chat_message:user-42" or "failopen:signaling".
 */
class CSGDLogRateLimiter
{
public:
    struct EventStats
    {
        int64_t window_start_ms; // First event of the current window
        int64_t last_seen_ms;    // Most recent event
        int count;               // Events in the current window
        int suppressed;          // Events swallowed since the last emitted log
    };

    /**
     * @param window_ms Window length in milliseconds (default: 60000ms)
     * @param threshold Emit every Nth event after the first (default: 5)
     */
    CSGDLogRateLimiter(int64_t window_ms = 60000, int threshold = 5);
    ~CSGDLogRateLimiter();

    /**
     * @param key Event key
     * @param stats Filled with the key's statistics after this event
     * @return true if the caller should log this event
     */
    bool should_log(const std::string &key, EventStats &stats);

    void clear();

    void set_window_ms(int64_t window_ms);
    void set_threshold(int threshold);
    void set_clock(sgd_clock_fn clock);

    int64_t get_window_ms() const { return m_window_ms; }
    int get_threshold() const { return m_threshold; }
    size_t get_tracked_keys();

private:
    int64_t m_window_ms;
    int m_threshold;
    int m_events_since_cleanup;
    sgd_clock_fn m_clock;

    std::unordered_map<std::string, EventStats> m_events;
    std::mutex m_mutex;

    // drop keys idle for more than ten windows
    void cleanup_idle_keys(int64_t now_ms);
};
