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
#include <vector>

/**
 * Shared key/value, sorted-set and list store
 *
 * Every method returns SGD_OK or SGD_ERROR; results come back through the
 * out parameters. Implementations never throw: infrastructure failures are
 * logged in the store category and reported as SGD_ERROR so each caller
 * can apply its own fail-open or fail-safe default.
 *
 * A ttl_sec <= 0 means "no expiry".
 */
class CSGDStore
{
public:
    virtual ~CSGDStore() {}

    /**
     * Atomically remove members scored at or below max_score, then count
     * what is left.
     */
    virtual int zset_prune_and_count(const std::string &key, double max_score, int64_t &count) = 0;

    /**
     * Add member with score and refresh the key TTL in one step.
     */
    virtual int zset_add(const std::string &key, const std::string &member, double score, int ttl_sec) = 0;

    /**
     * Lowest score in the set; found is false when the set is empty.
     */
    virtual int zset_oldest(const std::string &key, bool &found, double &score) = 0;

    /**
     * Atomic increment (starting from 0) plus TTL refresh.
     */
    virtual int incr(const std::string &key, int ttl_sec, int64_t &value) = 0;

    /**
     * Push value at the head of a list, keep the first max_len entries and
     * refresh the TTL, as one atomic step.
     */
    virtual int list_push_trim(const std::string &key, const std::string &value, int max_len, int ttl_sec) = 0;

    /**
     * Read the whole list, head first.
     */
    virtual int list_range(const std::string &key, std::vector<std::string> &values) = 0;

    virtual int set(const std::string &key, const std::string &value, int ttl_sec) = 0;
    virtual int get(const std::string &key, bool &found, std::string &value) = 0;

    virtual int del(const std::string &key) = 0;
    virtual int del(const std::vector<std::string> &keys, int64_t &deleted) = 0;
    virtual int exists(const std::string &key, bool &found) = 0;
    virtual int expire(const std::string &key, int ttl_sec) = 0;

    /**
     * One page of a cursor-based glob scan. Start with cursor 0; the scan is
     * complete when next_cursor comes back as 0. count is a hint for how many
     * keys to examine per page.
     */
    virtual int scan(uint64_t cursor, const std::string &pattern, int count,
                     uint64_t &next_cursor, std::vector<std::string> &keys) = 0;
};
