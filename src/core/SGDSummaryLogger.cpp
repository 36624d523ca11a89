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

#include "SGDSummaryLogger.hpp"
#include "common.hpp"
#include <sstream>

CSGDSummaryLogger::CSGDSummaryLogger()
    : m_allowed(0),
      m_rejected(0),
      m_fail_open(0),
      m_buffered(0),
      m_buffer_failures(0),
      m_reconnects(0),
      m_replayed(0),
      m_content_rejected(0),
      m_last_summary_time_ms(sgd_gettime_ms())
{
}

CSGDSummaryLogger::~CSGDSummaryLogger()
{
}

void CSGDSummaryLogger::record_allowed()
{
    m_allowed.fetch_add(1, std::memory_order_relaxed);
}

void CSGDSummaryLogger::record_rejected()
{
    m_rejected.fetch_add(1, std::memory_order_relaxed);
}

void CSGDSummaryLogger::record_fail_open()
{
    m_fail_open.fetch_add(1, std::memory_order_relaxed);
}

void CSGDSummaryLogger::record_buffered()
{
    m_buffered.fetch_add(1, std::memory_order_relaxed);
}

void CSGDSummaryLogger::record_buffer_failure()
{
    m_buffer_failures.fetch_add(1, std::memory_order_relaxed);
}

void CSGDSummaryLogger::record_reconnect(int replayed_messages)
{
    m_reconnects.fetch_add(1, std::memory_order_relaxed);
    m_replayed.fetch_add(replayed_messages, std::memory_order_relaxed);
}

void CSGDSummaryLogger::record_content_rejected()
{
    m_content_rejected.fetch_add(1, std::memory_order_relaxed);
}

bool CSGDSummaryLogger::should_log_summary(int interval_sec, int64_t now_ms, std::string &out_message)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (now_ms - m_last_summary_time_ms < (int64_t)interval_sec * 1000)
    {
        return false;
    }

    int allowed = m_allowed.exchange(0, std::memory_order_relaxed);
    int rejected = m_rejected.exchange(0, std::memory_order_relaxed);
    int fail_open = m_fail_open.exchange(0, std::memory_order_relaxed);
    int buffered = m_buffered.exchange(0, std::memory_order_relaxed);
    int buffer_failures = m_buffer_failures.exchange(0, std::memory_order_relaxed);
    int reconnects = m_reconnects.exchange(0, std::memory_order_relaxed);
    int replayed = m_replayed.exchange(0, std::memory_order_relaxed);
    int content_rejected = m_content_rejected.exchange(0, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << "[summary] Last " << interval_sec << "s: "
        << allowed << " allowed, " << rejected << " rejected";
    if (fail_open > 0)
        oss << ", " << fail_open << " fail-open";

    oss << " | " << buffered << " buffered";
    if (buffer_failures > 0)
        oss << " (" << buffer_failures << " failed)";
    oss << ", " << reconnects << " reconnects";
    if (replayed > 0)
        oss << " (" << replayed << " replayed)";

    if (content_rejected > 0)
        oss << " | " << content_rejected << " content rejected";

    out_message = oss.str();
    m_last_summary_time_ms = now_ms;
    return true;
}

void CSGDSummaryLogger::reset(int64_t now_ms)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    m_allowed.store(0, std::memory_order_relaxed);
    m_rejected.store(0, std::memory_order_relaxed);
    m_fail_open.store(0, std::memory_order_relaxed);
    m_buffered.store(0, std::memory_order_relaxed);
    m_buffer_failures.store(0, std::memory_order_relaxed);
    m_reconnects.store(0, std::memory_order_relaxed);
    m_replayed.store(0, std::memory_order_relaxed);
    m_content_rejected.store(0, std::memory_order_relaxed);
    m_last_summary_time_ms = now_ms;
}
