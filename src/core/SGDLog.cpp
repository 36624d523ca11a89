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

#include <mutex>
#include <vector>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/ansicolor_sink.h"
#include "spdlog/sinks/basic_file_sink.h"

#include "SGDLog.hpp"
#include "SGDJsonSink.hpp"

static std::mutex g_logger_mutex;

static sgd_log_config_t g_log_config = [] {
    sgd_log_config_t config;
    config.rate_limit_enabled = true;
    config.rate_limit_window_sec = 60;
    config.rate_limit_threshold = 5;
    config.summary_enabled = true;
    config.summary_interval_sec = 60;
    config.json_format = false;
    for (int i = 0; i < static_cast<int>(SGDLogCategory::COUNT); i++)
    {
        config.category_level_set[i] = false;
        config.category_levels[i] = spdlog::level::info;
    }
    return config;
}();
static CSGDLogRateLimiter g_log_rate_limiter;
static CSGDSummaryLogger g_summary_logger;

static bool parse_level(const std::string &log_level, spdlog::level::level_enum &level)
{
    std::string name = sgd_strlower(log_level);
    if (name == "warning")
        name = "warn";
    level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    return level != spdlog::level::off || name == "off";
}

int initialize_logger()
{
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
    sinks.push_back(console_sink);

    auto logger = std::make_shared<spdlog::logger>(SGD_APP_NAME, begin(sinks), end(sinks));
    logger->set_level(SGD_DEFAULT_LOG_LEVEL);

    spdlog::set_default_logger(logger);

    g_log_rate_limiter.set_window_ms((int64_t)g_log_config.rate_limit_window_sec * 1000);
    g_log_rate_limiter.set_threshold(g_log_config.rate_limit_threshold);
    g_summary_logger.reset(sgd_gettime_ms());

    return SGD_OK;
}

int sgd_set_log_level(const std::string &log_level)
{
    spdlog::level::level_enum new_level;
    if (!parse_level(log_level, new_level))
    {
        spdlog::error("[system] sgd_set_log_level, unknown level '{}'.", log_level);
        return SGD_ERROR;
    }
    spdlog::default_logger()->set_level(new_level);
    spdlog::warn("[system] Setting logging level to {}", spdlog::level::to_string_view(new_level));
    return SGD_OK;
}

int sgd_set_log_file(const std::string &log_file)
{
    if (log_file.empty())
        return SGD_ERROR;

    spdlog::sink_ptr file_sink;
    try
    {
        if (g_log_config.json_format)
            file_sink = std::make_shared<sgd_json_file_sink_mt>(log_file);
        else
            file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
    }
    catch (const spdlog::spdlog_ex &e)
    {
        spdlog::error("[system] sgd_set_log_file, cannot open '{}': {}", log_file, e.what());
        return SGD_ERROR;
    }

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    spdlog::default_logger()->sinks().push_back(file_sink);
    return SGD_OK;
}

int sgd_set_category_log_level(SGDLogCategory category, const std::string &log_level)
{
    spdlog::level::level_enum new_level;
    if (!parse_level(log_level, new_level))
    {
        spdlog::error("[system] sgd_set_category_log_level, unknown level '{}' for category {}.",
                      log_level, sgd_log_category_name(category));
        return SGD_ERROR;
    }

    int cat_idx = static_cast<int>(category);
    g_log_config.category_levels[cat_idx] = new_level;
    g_log_config.category_level_set[cat_idx] = true;
    return SGD_OK;
}

sgd_log_config_t &sgd_get_log_config()
{
    return g_log_config;
}

CSGDLogRateLimiter &sgd_get_log_rate_limiter()
{
    return g_log_rate_limiter;
}

CSGDSummaryLogger &sgd_get_summary_logger()
{
    return g_summary_logger;
}

bool sgd_should_log_category(SGDLogCategory category, spdlog::level::level_enum level)
{
    int cat_idx = static_cast<int>(category);

    if (g_log_config.category_level_set[cat_idx])
    {
        return level >= g_log_config.category_levels[cat_idx];
    }

    return spdlog::default_logger()->should_log(level);
}

bool sgd_should_log_repeated(const std::string &key, int &suppressed)
{
    suppressed = 0;
    if (!g_log_config.rate_limit_enabled)
        return true;

    CSGDLogRateLimiter::EventStats stats;
    bool emit = g_log_rate_limiter.should_log(key, stats);
    if (emit)
        suppressed = stats.suppressed;
    return emit;
}

void sgd_log_summary_if_due()
{
    if (!g_log_config.summary_enabled)
        return;

    std::string message;
    if (g_summary_logger.should_log_summary(g_log_config.summary_interval_sec, sgd_gettime_ms(), message))
    {
        spdlog::info("{}", message);
    }
}
