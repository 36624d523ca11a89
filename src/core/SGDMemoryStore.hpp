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

#include <deque>
#include <map>
#include <mutex>
#include <string>

#include "common.hpp"
#include "SGDStore.hpp"

/**
 * In-process CSGDStore
 *
 * One mutex guards the whole keyspace, which gives every compound operation
 * the same atomicity a MULTI/EXEC block has on Redis. Expired keys are
 * evicted lazily when touched or scanned. Suitable for single-instance
 * deployments and tests; time comes from the injected clock.
 */
class CSGDMemoryStore : public CSGDStore
{
public:
    explicit CSGDMemoryStore(sgd_clock_fn clock = sgd_clock_fn());
    ~CSGDMemoryStore() override;

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

    /**
     * Number of live keys, expired ones excluded.
     */
    size_t size();

private:
    enum class EntryType
    {
        STRING,
        ZSET,
        LIST
    };

    struct Entry
    {
        EntryType type;
        std::string str;
        std::map<std::string, double> zset;
        std::deque<std::string> list;
        int64_t expire_at_ms; // 0 = persistent
    };

    int64_t now_ms() const;
    bool is_expired(const Entry &entry, int64_t now) const;
    void apply_ttl(Entry &entry, int ttl_sec, int64_t now);

    // Returns NULL when the key is absent or expired (expired keys are erased).
    Entry *find_live(const std::string &key, int64_t now);

    // Finds or creates key with the given type. Returns NULL on type mismatch.
    Entry *find_or_create(const std::string &key, EntryType type, int64_t now, const char *op);

    sgd_clock_fn m_clock;
    std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;
};
