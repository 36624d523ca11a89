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

#include <map>
#include <string>
#include <nlohmann/json.hpp>

#include "SGDContentSecurity.hpp"

/**
 * Quota of one limit type
 */
struct sgd_rate_limit_conf_t
{
    int max_requests;
    int window_seconds;
};

typedef std::map<std::string, sgd_rate_limit_conf_t> sgd_rate_limit_catalog_t;

enum class SGDUnknownLimitPolicy
{
    ALLOW = 0, // warn and let the request through
    REJECT
};

struct sgd_conf_log_t
{
    std::string level;
    std::string file;
    bool json;
    std::map<std::string, std::string> category_levels;
    bool rate_limit_enabled;
    int rate_limit_window_sec;
    int rate_limit_threshold;
    bool summary_enabled;
    int summary_interval_sec;
};

struct sgd_conf_store_t
{
    std::string backend; // "memory" or "redis"
    std::string url;
    std::string password;
    int db;
    int connect_timeout_ms;
    int socket_timeout_ms;
    int pool_size;
    int scan_batch;
};

struct sgd_conf_reconnect_t
{
    int buffer_size;
    int buffer_ttl_sec;
};

struct sgd_conf_security_t
{
    int max_text_length;
    int max_html_length;
    sgd_html_policy_t html_policy;
    int blocklist_ttl_sec; // 0 = blocks never expire
};

struct sgd_conf_async_t
{
    int worker_threads; // 0 = hardware concurrency
    int operation_timeout_ms;
};

/**
 * Every tunable of sig-guard with its built-in default
 */
struct sgd_conf_t
{
    sgd_conf_log_t log;
    sgd_conf_store_t store;
    sgd_rate_limit_catalog_t rate_limits;
    SGDUnknownLimitPolicy unknown_limit_type_policy;
    sgd_conf_reconnect_t reconnect;
    sgd_conf_security_t security;
    sgd_conf_async_t async;
};

/**
 * signaling 100/60s, chat_message 60/60s, reaction 30/60s, hand_raise 10/60s,
 * file_share 10/300s, settings_update 20/60s, room_create 5/3600s,
 * api_call 1000/3600s
 */
sgd_rate_limit_catalog_t sgd_default_rate_limits();

void sgd_conf_init(sgd_conf_t &conf);

/**
 * Overlay a JSON document on conf. Returns SGD_ERROR when the document can
 * not be read or parsed; individual invalid values are logged and skipped,
 * keeping the value conf already had.
 */
int sgd_conf_load_file(const std::string &path, sgd_conf_t &conf);
int sgd_conf_load_string(const std::string &text, sgd_conf_t &conf);
int sgd_conf_load_json(const nlohmann::json &doc, sgd_conf_t &conf);

/**
 * Push the log section into the logger (level, file sink, categories,
 * flood control, summary). Call after initialize_logger().
 */
int sgd_conf_apply_logging(const sgd_conf_t &conf);
