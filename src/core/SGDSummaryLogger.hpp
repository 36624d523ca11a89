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
#include <atomic>
#include <mutex>
#include <string>

/**
 * Summary logger for periodic resilience statistics
 *
 * Counts rate limiter decisions, buffering and replay activity and rejected
 * content between two summaries.
 *
 * Example output:
 * [summary] Last 60s: 812 allowed, 14 rejected, 3 fail-open | 540 buffered, 2 reconnects (37 replayed) | 1 content rejected
 */
class CSGDSummaryLogger
{
public:
    CSGDSummaryLogger();
    ~CSGDSummaryLogger();

    void record_allowed();
    void record_rejected();
    void record_fail_open();
    void record_buffered();
    void record_buffer_failure();
    void record_reconnect(int replayed_messages);
    void record_content_rejected();

    /**
     * @param interval_sec Seconds between summaries
     * @param now_ms Current time
     * @param out_message Summary line when it is time to log
     * @return true if a summary is due; counters are reset in that case
     */
    bool should_log_summary(int interval_sec, int64_t now_ms, std::string &out_message);

    void reset(int64_t now_ms);

private:
    std::atomic<int> m_allowed;
    std::atomic<int> m_rejected;
    std::atomic<int> m_fail_open;
    std::atomic<int> m_buffered;
    std::atomic<int> m_buffer_failures;
    std::atomic<int> m_reconnects;
    std::atomic<int> m_replayed;
    std::atomic<int> m_content_rejected;

    int64_t m_last_summary_time_ms;
    std::mutex m_mutex;
};
