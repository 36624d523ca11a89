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

#include <climits>
#include <fstream>
#include "spdlog/spdlog.h"

#include "common.hpp"
#include "SGDConf.hpp"
#include "SGDLog.hpp"

using json = nlohmann::json;

sgd_rate_limit_catalog_t sgd_default_rate_limits()
{
    sgd_rate_limit_catalog_t catalog;
    catalog["signaling"] = {100, 60};
    catalog["chat_message"] = {60, 60};
    catalog["reaction"] = {30, 60};
    catalog["hand_raise"] = {10, 60};
    catalog["file_share"] = {10, 300};
    catalog["settings_update"] = {20, 60};
    catalog["room_create"] = {5, 3600};
    catalog["api_call"] = {1000, 3600};
    return catalog;
}

void sgd_conf_init(sgd_conf_t &conf)
{
    conf.log.level = "info";
    conf.log.file = "";
    conf.log.json = false;
    conf.log.category_levels.clear();
    conf.log.rate_limit_enabled = true;
    conf.log.rate_limit_window_sec = 60;
    conf.log.rate_limit_threshold = 5;
    conf.log.summary_enabled = true;
    conf.log.summary_interval_sec = 60;

    conf.store.backend = "memory";
    conf.store.url = "redis://127.0.0.1:6379";
    conf.store.password = "";
    conf.store.db = 0;
    conf.store.connect_timeout_ms = 500;
    conf.store.socket_timeout_ms = 500;
    conf.store.pool_size = 8;
    conf.store.scan_batch = 100;

    conf.rate_limits = sgd_default_rate_limits();
    conf.unknown_limit_type_policy = SGDUnknownLimitPolicy::ALLOW;

    conf.reconnect.buffer_size = 50;
    conf.reconnect.buffer_ttl_sec = 300;

    conf.security.max_text_length = SGD_MAX_TEXT_LENGTH;
    conf.security.max_html_length = SGD_MAX_HTML_LENGTH;
    conf.security.html_policy = sgd_default_html_policy();
    conf.security.blocklist_ttl_sec = 0;

    conf.async.worker_threads = 0;
    conf.async.operation_timeout_ms = 250;
}

static void read_int(const json &section, const char *section_name, const char *key, int min_value, int &out)
{
    if (!section.contains(key))
        return;
    const json &value = section[key];
    if (!value.is_number_integer() || value.get<int64_t>() < min_value || value.get<int64_t>() > INT_MAX)
    {
        spdlog::error("[system] sgd_conf, {}.{} must be an integer >= {}, keeping {}.",
                      section_name, key, min_value, out);
        return;
    }
    out = value.get<int>();
}

static void read_bool(const json &section, const char *section_name, const char *key, bool &out)
{
    if (!section.contains(key))
        return;
    const json &value = section[key];
    if (!value.is_boolean())
    {
        spdlog::error("[system] sgd_conf, {}.{} must be a boolean, keeping {}.", section_name, key, out);
        return;
    }
    out = value.get<bool>();
}

static void read_string(const json &section, const char *section_name, const char *key, std::string &out)
{
    if (!section.contains(key))
        return;
    const json &value = section[key];
    if (!value.is_string())
    {
        spdlog::error("[system] sgd_conf, {}.{} must be a string, keeping '{}'.", section_name, key, out);
        return;
    }
    out = value.get<std::string>();
}

static bool section_object(const json &doc, const char *name, const json *&section)
{
    if (!doc.contains(name))
        return false;
    if (!doc[name].is_object())
    {
        spdlog::error("[system] sgd_conf, section '{}' must be an object, ignored.", name);
        return false;
    }
    section = &doc[name];
    return true;
}

static void load_log(const json &log, sgd_conf_log_t &conf)
{
    std::string level = conf.level;
    read_string(log, "log", "level", level);
    std::string lower = sgd_strlower(level);
    if (lower == "warning")
        lower = "warn";
    if (spdlog::level::from_str(lower) == spdlog::level::off && lower != "off")
        spdlog::error("[system] sgd_conf, log.level '{}' is not a level name, keeping '{}'.", level, conf.level);
    else
        conf.level = level;

    read_string(log, "log", "file", conf.file);
    read_bool(log, "log", "json", conf.json);
    read_bool(log, "log", "rate_limit_enabled", conf.rate_limit_enabled);
    read_int(log, "log", "rate_limit_window_sec", 1, conf.rate_limit_window_sec);
    read_int(log, "log", "rate_limit_threshold", 1, conf.rate_limit_threshold);
    read_bool(log, "log", "summary_enabled", conf.summary_enabled);
    read_int(log, "log", "summary_interval_sec", 1, conf.summary_interval_sec);

    if (log.contains("categories"))
    {
        if (!log["categories"].is_object())
        {
            spdlog::error("[system] sgd_conf, log.categories must be an object, ignored.");
            return;
        }
        for (const auto &item : log["categories"].items())
        {
            SGDLogCategory category;
            if (!sgd_log_category_from_string(item.key(), category) || !item.value().is_string())
            {
                spdlog::error("[system] sgd_conf, log.categories.{} ignored.", item.key());
                continue;
            }
            conf.category_levels[item.key()] = item.value().get<std::string>();
        }
    }
}

static void load_store(const json &store, sgd_conf_store_t &conf)
{
    std::string backend = conf.backend;
    read_string(store, "store", "backend", backend);
    if (backend != "memory" && backend != "redis")
        spdlog::error("[system] sgd_conf, store.backend '{}' unknown, keeping '{}'.", backend, conf.backend);
    else
        conf.backend = backend;

    read_string(store, "store", "url", conf.url);
    read_string(store, "store", "password", conf.password);
    read_int(store, "store", "db", 0, conf.db);
    read_int(store, "store", "connect_timeout_ms", 1, conf.connect_timeout_ms);
    read_int(store, "store", "socket_timeout_ms", 1, conf.socket_timeout_ms);
    read_int(store, "store", "pool_size", 1, conf.pool_size);
    read_int(store, "store", "scan_batch", 1, conf.scan_batch);
}

static void load_rate_limits(const json &limits, sgd_rate_limit_catalog_t &catalog)
{
    for (const auto &item : limits.items())
    {
        const json &entry = item.value();
        if (!entry.is_object() ||
            !entry.contains("max_requests") || !entry["max_requests"].is_number_integer() ||
            !entry.contains("window_seconds") || !entry["window_seconds"].is_number_integer())
        {
            spdlog::error("[system] sgd_conf, rate_limits.{} needs integer max_requests and window_seconds, ignored.",
                          item.key());
            continue;
        }

        int64_t max_requests = entry["max_requests"].get<int64_t>();
        int64_t window_seconds = entry["window_seconds"].get<int64_t>();
        if (max_requests <= 0 || window_seconds <= 0 || max_requests > INT_MAX || window_seconds > INT_MAX)
        {
            spdlog::error("[system] sgd_conf, rate_limits.{} must be positive (max_requests={}, window_seconds={}), ignored.",
                          item.key(), max_requests, window_seconds);
            continue;
        }
        catalog[item.key()] = {(int)max_requests, (int)window_seconds};
    }
}

static void load_security(const json &security, sgd_conf_security_t &conf)
{
    read_int(security, "security", "max_text_length", 1, conf.max_text_length);
    read_int(security, "security", "max_html_length", 1, conf.max_html_length);
    read_int(security, "security", "blocklist_ttl_sec", 0, conf.blocklist_ttl_sec);

    if (!security.contains("html_policy"))
        return;
    const json &policy = security["html_policy"];
    if (!policy.is_array())
    {
        spdlog::error("[system] sgd_conf, security.html_policy must be an array, keeping the current policy.");
        return;
    }

    sgd_html_policy_t tags;
    for (const json &entry : policy)
    {
        if (!entry.is_object() || !entry.contains("tag") || !entry["tag"].is_string() ||
            entry["tag"].get<std::string>().empty())
        {
            spdlog::error("[system] sgd_conf, security.html_policy entry {} ignored.", entry.dump());
            continue;
        }
        SGDSafeTag tag;
        tag.name = sgd_strlower(entry["tag"].get<std::string>());
        if (entry.contains("attrs") && entry["attrs"].is_array())
        {
            for (const json &attr : entry["attrs"])
            {
                if (attr.is_string())
                    tag.allowed_attrs.push_back(sgd_strlower(attr.get<std::string>()));
            }
        }
        tags.push_back(tag);
    }
    conf.html_policy = tags;
}

int sgd_conf_load_json(const json &doc, sgd_conf_t &conf)
{
    if (!doc.is_object())
    {
        spdlog::error("[system] sgd_conf_load_json, configuration root must be an object.");
        return SGD_ERROR;
    }

    const json *section = NULL;
    if (section_object(doc, "log", section))
        load_log(*section, conf.log);
    if (section_object(doc, "store", section))
        load_store(*section, conf.store);
    if (section_object(doc, "rate_limits", section))
        load_rate_limits(*section, conf.rate_limits);

    if (doc.contains("unknown_limit_type_policy"))
    {
        const json &policy = doc["unknown_limit_type_policy"];
        if (policy.is_string() && policy.get<std::string>() == "allow")
            conf.unknown_limit_type_policy = SGDUnknownLimitPolicy::ALLOW;
        else if (policy.is_string() && policy.get<std::string>() == "reject")
            conf.unknown_limit_type_policy = SGDUnknownLimitPolicy::REJECT;
        else
            spdlog::error("[system] sgd_conf, unknown_limit_type_policy must be \"allow\" or \"reject\", ignored.");
    }

    if (section_object(doc, "reconnect", section))
    {
        read_int(*section, "reconnect", "buffer_size", 1, conf.reconnect.buffer_size);
        read_int(*section, "reconnect", "buffer_ttl_sec", 1, conf.reconnect.buffer_ttl_sec);
    }
    if (section_object(doc, "security", section))
        load_security(*section, conf.security);
    if (section_object(doc, "async", section))
    {
        read_int(*section, "async", "worker_threads", 0, conf.async.worker_threads);
        read_int(*section, "async", "operation_timeout_ms", 1, conf.async.operation_timeout_ms);
    }
    return SGD_OK;
}

int sgd_conf_load_string(const std::string &text, sgd_conf_t &conf)
{
    json doc;
    try
    {
        doc = json::parse(text);
    }
    catch (const nlohmann::json::exception &e)
    {
        spdlog::error("[system] sgd_conf_load_string, invalid JSON: {}", e.what());
        return SGD_ERROR;
    }
    return sgd_conf_load_json(doc, conf);
}

int sgd_conf_load_file(const std::string &path, sgd_conf_t &conf)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        spdlog::error("[system] sgd_conf_load_file, cannot open '{}'.", path);
        return SGD_ERROR;
    }

    json doc;
    try
    {
        doc = json::parse(in);
    }
    catch (const nlohmann::json::exception &e)
    {
        spdlog::error("[system] sgd_conf_load_file, invalid JSON in '{}': {}", path, e.what());
        return SGD_ERROR;
    }

    int ret = sgd_conf_load_json(doc, conf);
    if (ret == SGD_OK)
        spdlog::info("[system] Configuration loaded from {}", path);
    return ret;
}

int sgd_conf_apply_logging(const sgd_conf_t &conf)
{
    sgd_log_config_t &log_config = sgd_get_log_config();
    log_config.rate_limit_enabled = conf.log.rate_limit_enabled;
    log_config.rate_limit_window_sec = conf.log.rate_limit_window_sec;
    log_config.rate_limit_threshold = conf.log.rate_limit_threshold;
    log_config.summary_enabled = conf.log.summary_enabled;
    log_config.summary_interval_sec = conf.log.summary_interval_sec;
    log_config.json_format = conf.log.json;

    sgd_get_log_rate_limiter().set_window_ms((int64_t)conf.log.rate_limit_window_sec * 1000);
    sgd_get_log_rate_limiter().set_threshold(conf.log.rate_limit_threshold);

    int ret = sgd_set_log_level(conf.log.level);

    for (const auto &item : conf.log.category_levels)
    {
        SGDLogCategory category;
        if (!sgd_log_category_from_string(item.first, category) ||
            sgd_set_category_log_level(category, item.second) != SGD_OK)
            ret = SGD_ERROR;
    }

    if (!conf.log.file.empty() && sgd_set_log_file(conf.log.file) != SGD_OK)
        ret = SGD_ERROR;

    return ret;
}
