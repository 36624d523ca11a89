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
#include "spdlog/spdlog.h"

#include "common.hpp"
#include "SGDLogCategory.hpp"
#include "SGDLogRateLimiter.hpp"
#include "SGDSummaryLogger.hpp"

static const char SGD_APP_NAME[] = "sig-guard";

/**
 * Logging configuration structure
 */
struct sgd_log_config_t
{
    bool rate_limit_enabled;
    int rate_limit_window_sec;
    int rate_limit_threshold;
    bool summary_enabled;
    int summary_interval_sec;
    bool json_format;

    spdlog::level::level_enum category_levels[static_cast<int>(SGDLogCategory::COUNT)];
    bool category_level_set[static_cast<int>(SGDLogCategory::COUNT)];
};

/**
 * Initialize logger with default settings
 */
int initialize_logger();

/**
 * Set global log level ("trace", "debug", "info", "warn", "error", "critical", "off")
 */
int sgd_set_log_level(const std::string &log_level);

/**
 * Add a log file sink (JSON lines when json_format is set)
 */
int sgd_set_log_file(const std::string &log_file);

int sgd_set_category_log_level(SGDLogCategory category, const std::string &log_level);

sgd_log_config_t &sgd_get_log_config();

CSGDLogRateLimiter &sgd_get_log_rate_limiter();

CSGDSummaryLogger &sgd_get_summary_logger();

bool sgd_should_log_category(SGDLogCategory category, spdlog::level::level_enum level);

/**
 * Flood control for a repeated event. Returns true if it should be logged;
 * suppressed receives the number of events swallowed since the last log.
 */
bool sgd_should_log_repeated(const std::string &key, int &suppressed);

/**
 * Emit the periodic summary line if the configured interval elapsed
 */
void sgd_log_summary_if_due();
