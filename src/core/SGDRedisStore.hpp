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

#include <memory>
#include <string>
#include <sw/redis++/redis++.h>

#include "SGDConf.hpp"
#include "SGDStore.hpp"

/**
 * CSGDStore on Redis (redis-plus-plus)
 *
 * Compound steps run in MULTI/EXEC transactions on a pooled connection.
 * sw::redis::Error never escapes: it is logged in the store category and
 * turned into SGD_ERROR.
 */
class CSGDRedisStore : public CSGDStore
{
public:
    CSGDRedisStore();
    ~CSGDRedisStore() override;

    /**
     * Connect using the store section (url, password, db, timeouts, pool
     * size) and PING the server.
     */
    int init(const sgd_conf_store_t &conf);
    bool is_ready() const { return m_redis != nullptr; }

    int zset_prune_and_count(const std::string &key, double max_score, int64_t &count) override;
    int zset_add(const std::string &key, const std::string &member, double score, int ttl_sec) override;
    int zset_oldest(const std::string &key, bool &found, double &score) override;

    int incr(const std::string &key, int ttl_sec, int64_t &value) override;

    int list_push_trim(const std::string &key, const std::string &value, int max_len, int ttl_sec) override;
    int list_range(const std::string &key, std::vector<std::string> &values) override;

    int set(const std::string &key, const std::string &value, int ttl_sec) override;
    int get(const std::string &key, bool &found, std::string &value) override;

    int del(const std::string &key) override;
    int del(const std::vector<std::string> &keys, int64_t &deleted) override;
    int exists(const std::string &key, bool &found) override;
    int expire(const std::string &key, int ttl_sec) override;

    int scan(uint64_t cursor, const std::string &pattern, int count,
             uint64_t &next_cursor, std::vector<std::string> &keys) override;

private:
    bool check_ready(const char *op, const std::string &key);
    int on_error(const char *op, const std::string &key, const sw::redis::Error &e);

    std::unique_ptr<sw::redis::Redis> m_redis;
};
