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
#include <iterator>
#include <utility>
#include "spdlog/spdlog.h"

#include "common.hpp"
#include "SGDRedisStore.hpp"
#include "SGDLog.hpp"

CSGDRedisStore::CSGDRedisStore()
{
}

CSGDRedisStore::~CSGDRedisStore()
{
}

int CSGDRedisStore::init(const sgd_conf_store_t &conf)
{
    try
    {
        sw::redis::ConnectionOptions opts(conf.url);
        if (!conf.password.empty())
            opts.password = conf.password;
        if (conf.db > 0)
            opts.db = conf.db;
        opts.connect_timeout = std::chrono::milliseconds(conf.connect_timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(conf.socket_timeout_ms);

        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = conf.pool_size;
        pool_opts.wait_timeout = std::chrono::milliseconds(conf.socket_timeout_ms);

        std::unique_ptr<sw::redis::Redis> redis(new sw::redis::Redis(opts, pool_opts));
        redis->ping();
        m_redis = std::move(redis);
    }
    catch (const sw::redis::Error &e)
    {
        spdlog::error("[store] CSGDRedisStore::init, cannot connect to {}: {}", conf.url, e.what());
        return SGD_ERROR;
    }

    spdlog::info("[store] Connected to Redis | url={} db={} pool={}", conf.url, conf.db, conf.pool_size);
    return SGD_OK;
}

int CSGDRedisStore::on_error(const char *op, const std::string &key, const sw::redis::Error &e)
{
    int suppressed = 0;
    if (sgd_should_log_repeated(std::string("redis:") + op, suppressed))
        spdlog::error("[store] CSGDRedisStore::{} failed | key={} error={} suppressed={}", op, key, e.what(), suppressed);
    return SGD_ERROR;
}

bool CSGDRedisStore::check_ready(const char *op, const std::string &key)
{
    if (m_redis)
        return true;
    spdlog::error("[store] CSGDRedisStore::{}, not connected | key={}", op, key);
    return false;
}

int CSGDRedisStore::zset_prune_and_count(const std::string &key, double max_score, int64_t &count)
{
    if (!check_ready("zset_prune_and_count", key))
        return SGD_ERROR;
    try
    {
        auto tx = m_redis->transaction(false, false);
        auto replies = tx.zremrangebyscore(key, sw::redis::RightBoundedInterval<double>(max_score, sw::redis::BoundType::LEFT_OPEN))
                           .zcard(key)
                           .exec();
        count = replies.get<long long>(1);
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("zset_prune_and_count", key, e);
    }
    return SGD_OK;
}

int CSGDRedisStore::zset_add(const std::string &key, const std::string &member, double score, int ttl_sec)
{
    if (!check_ready("zset_add", key))
        return SGD_ERROR;
    try
    {
        auto tx = m_redis->transaction(false, false);
        tx.zadd(key, member, score);
        if (ttl_sec > 0)
            tx.expire(key, std::chrono::seconds(ttl_sec));
        tx.exec();
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("zset_add", key, e);
    }
    return SGD_OK;
}

int CSGDRedisStore::zset_oldest(const std::string &key, bool &found, double &score)
{
    if (!check_ready("zset_oldest", key))
        return SGD_ERROR;
    found = false;
    try
    {
        std::vector<std::pair<std::string, double>> oldest;
        m_redis->zrange(key, 0, 0, std::back_inserter(oldest));
        if (!oldest.empty())
        {
            found = true;
            score = oldest.front().second;
        }
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("zset_oldest", key, e);
    }
    return SGD_OK;
}

int CSGDRedisStore::incr(const std::string &key, int ttl_sec, int64_t &value)
{
    if (!check_ready("incr", key))
        return SGD_ERROR;
    try
    {
        auto tx = m_redis->transaction(false, false);
        tx.incr(key);
        if (ttl_sec > 0)
            tx.expire(key, std::chrono::seconds(ttl_sec));
        auto replies = tx.exec();
        value = replies.get<long long>(0);
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("incr", key, e);
    }
    return SGD_OK;
}

int CSGDRedisStore::list_push_trim(const std::string &key, const std::string &value, int max_len, int ttl_sec)
{
    if (!check_ready("list_push_trim", key))
        return SGD_ERROR;
    try
    {
        auto tx = m_redis->transaction(false, false);
        tx.lpush(key, value);
        if (max_len > 0)
            tx.ltrim(key, 0, max_len - 1);
        if (ttl_sec > 0)
            tx.expire(key, std::chrono::seconds(ttl_sec));
        tx.exec();
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("list_push_trim", key, e);
    }
    return SGD_OK;
}

int CSGDRedisStore::list_range(const std::string &key, std::vector<std::string> &values)
{
    if (!check_ready("list_range", key))
        return SGD_ERROR;
    values.clear();
    try
    {
        m_redis->lrange(key, 0, -1, std::back_inserter(values));
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("list_range", key, e);
    }
    return SGD_OK;
}

int CSGDRedisStore::set(const std::string &key, const std::string &value, int ttl_sec)
{
    if (!check_ready("set", key))
        return SGD_ERROR;
    try
    {
        if (ttl_sec > 0)
            m_redis->set(key, value, std::chrono::seconds(ttl_sec));
        else
            m_redis->set(key, value);
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("set", key, e);
    }
    return SGD_OK;
}

int CSGDRedisStore::get(const std::string &key, bool &found, std::string &value)
{
    if (!check_ready("get", key))
        return SGD_ERROR;
    found = false;
    try
    {
        auto reply = m_redis->get(key);
        if (reply)
        {
            found = true;
            value = *reply;
        }
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("get", key, e);
    }
    return SGD_OK;
}

int CSGDRedisStore::del(const std::string &key)
{
    if (!check_ready("del", key))
        return SGD_ERROR;
    try
    {
        m_redis->del(key);
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("del", key, e);
    }
    return SGD_OK;
}

int CSGDRedisStore::del(const std::vector<std::string> &keys, int64_t &deleted)
{
    deleted = 0;
    if (keys.empty())
        return SGD_OK;
    if (!check_ready("del", keys.front()))
        return SGD_ERROR;
    try
    {
        deleted = m_redis->del(keys.begin(), keys.end());
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("del", keys.front(), e);
    }
    return SGD_OK;
}

int CSGDRedisStore::exists(const std::string &key, bool &found)
{
    if (!check_ready("exists", key))
        return SGD_ERROR;
    found = false;
    try
    {
        found = m_redis->exists(key) > 0;
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("exists", key, e);
    }
    return SGD_OK;
}

int CSGDRedisStore::expire(const std::string &key, int ttl_sec)
{
    if (!check_ready("expire", key))
        return SGD_ERROR;
    try
    {
        if (ttl_sec > 0)
            m_redis->expire(key, std::chrono::seconds(ttl_sec));
        else
            m_redis->del(key);
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("expire", key, e);
    }
    return SGD_OK;
}

int CSGDRedisStore::scan(uint64_t cursor, const std::string &pattern, int count,
                         uint64_t &next_cursor, std::vector<std::string> &keys)
{
    if (!check_ready("scan", pattern))
        return SGD_ERROR;
    keys.clear();
    next_cursor = 0;
    try
    {
        auto next = m_redis->scan((long long)cursor, pattern, count, std::back_inserter(keys));
        next_cursor = (uint64_t)next;
    }
    catch (const sw::redis::Error &e)
    {
        return on_error("scan", pattern, e);
    }
    return SGD_OK;
}
