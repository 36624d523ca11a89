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
#include <string>
#include <functional>

#define SGD_OK 0
#define SGD_ERROR -1

// last_sequence value meaning "replay everything still buffered"
#define SGD_SEQUENCE_UNSET -1

#define SGD_DEFAULT_LOG_LEVEL spdlog::level::info

/**
 * Millisecond wall clock source. Components take one so tests can drive time.
 */
typedef std::function<int64_t()> sgd_clock_fn;

/**
 * Current wall clock time in milliseconds since the epoch
 */
int64_t sgd_gettime_ms();

std::string sgd_strlower(const std::string &str);
std::string sgd_strtrim(const std::string &str);

/**
 * Format epoch milliseconds as ISO 8601 UTC, e.g. "2024-05-01T10:00:00.123Z"
 */
std::string sgd_format_iso8601(int64_t epoch_ms);

/**
 * Escape glob metacharacters (* ? [ ] \) so the value matches literally
 * inside a key scan pattern.
 */
std::string sgd_glob_escape(const std::string &value);

/**
 * Cut str to at most max_chars UTF-8 code points.
 */
std::string sgd_utf8_truncate(const std::string &str, size_t max_chars);

/**
 * Case-insensitive (ASCII) substring search
 */
bool sgd_icontains(const std::string &haystack, const std::string &needle);

/**
 * Number of UTF-8 code points in str (continuation bytes are not counted)
 */
size_t sgd_utf8_length(const std::string &str);
