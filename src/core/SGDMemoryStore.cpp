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

#include <algorithm>
#include <fnmatch.h>
#include <functional>
#include <stdexcept>
#include <utility>
#include "spdlog/spdlog.h"

#include "SGDMemoryStore.hpp"

CSGDMemoryStore::CSGDMemoryStore(sgd_clock_fn clock)
    : m_clock(std::move(clock))
{
    spdlog::debug("[{}] CSGDMemoryStore::CSGDMemoryStore, in-process store created.", fmt::ptr(this));
}

CSGDMemoryStore::~CSGDMemoryStore()
{
    spdlog::debug("[{}] CSGDMemoryStore::~CSGDMemoryStore, {} keys dropped.", fmt::ptr(this), m_entries.size());
}

int64_t CSGDMemoryStore::now_ms() const
{
    return m_clock ? m_clock() : sgd_gettime_ms();
}

bool CSGDMemoryStore::is_expired(const Entry &entry, int64_t now) const
{
    return entry.expire_at_ms != 0 && entry.expire_at_ms <= now;
}

void CSGDMemoryStore::apply_ttl(Entry &entry, int ttl_sec, int64_t now)
{
    entry.expire_at_ms = ttl_sec > 0 ? now + (int64_t)ttl_sec * 1000 : 0;
}

CSGDMemoryStore::Entry *CSGDMemoryStore::find_live(const std::string &key, int64_t now)
{
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return NULL;
    if (is_expired(it->second, now))
    {
        m_entries.erase(it);
        return NULL;
    }
    return &it->second;
}

CSGDMemoryStore::Entry *CSGDMemoryStore::find_or_create(const std::string &key, EntryType type, int64_t now, const char *op)
{
    Entry *entry = find_live(key, now);
    if (entry)
    {
        if (entry->type != type)
        {
            spdlog::error("[store] CSGDMemoryStore::{}, wrong type for key={}.", op, key);
            return NULL;
        }
        return entry;
    }

    Entry &created = m_entries[key];
    created.type = type;
    created.expire_at_ms = 0;
    return &created;
}

int CSGDMemoryStore::zset_prune_and_count(const std::string &key, double max_score, int64_t &count)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    count = 0;
    Entry *entry = find_live(key, now_ms());
    if (!entry)
        return SGD_OK;
    if (entry->type != EntryType::ZSET)
    {
        spdlog::error("[store] CSGDMemoryStore::zset_prune_and_count, wrong type for key={}.", key);
        return SGD_ERROR;
    }

    for (auto it = entry->zset.begin(); it != entry->zset.end();)
    {
        if (it->second <= max_score)
            it = entry->zset.erase(it);
        else
            ++it;
    }
    count = (int64_t)entry->zset.size();
    if (entry->zset.empty())
        m_entries.erase(key);
    return SGD_OK;
}

int CSGDMemoryStore::zset_add(const std::string &key, const std::string &member, double score, int ttl_sec)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int64_t now = now_ms();
    Entry *entry = find_or_create(key, EntryType::ZSET, now, "zset_add");
    if (!entry)
        return SGD_ERROR;
    entry->zset[member] = score;
    apply_ttl(*entry, ttl_sec, now);
    return SGD_OK;
}

int CSGDMemoryStore::zset_oldest(const std::string &key, bool &found, double &score)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    found = false;
    Entry *entry = find_live(key, now_ms());
    if (!entry)
        return SGD_OK;
    if (entry->type != EntryType::ZSET)
    {
        spdlog::error("[store] CSGDMemoryStore::zset_oldest, wrong type for key={}.", key);
        return SGD_ERROR;
    }
    if (entry->zset.empty())
        return SGD_OK;

    auto oldest = std::min_element(entry->zset.begin(), entry->zset.end(),
                                   [](const std::pair<const std::string, double> &a,
                                      const std::pair<const std::string, double> &b) {
                                       return a.second < b.second;
                                   });
    found = true;
    score = oldest->second;
    return SGD_OK;
}

int CSGDMemoryStore::incr(const std::string &key, int ttl_sec, int64_t &value)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int64_t now = now_ms();
    Entry *entry = find_or_create(key, EntryType::STRING, now, "incr");
    if (!entry)
        return SGD_ERROR;

    int64_t current = 0;
    if (!entry->str.empty())
    {
        try
        {
            size_t idx = 0;
            current = std::stoll(entry->str, &idx);
            if (idx != entry->str.size())
                throw std::invalid_argument(entry->str);
        }
        catch (const std::exception &e)
        {
            spdlog::error("[store] CSGDMemoryStore::incr, value of key={} is not an integer: {}.", key, e.what());
            return SGD_ERROR;
        }
    }

    value = current + 1;
    entry->str = std::to_string(value);
    apply_ttl(*entry, ttl_sec, now);
    return SGD_OK;
}

int CSGDMemoryStore::list_push_trim(const std::string &key, const std::string &value, int max_len, int ttl_sec)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int64_t now = now_ms();
    Entry *entry = find_or_create(key, EntryType::LIST, now, "list_push_trim");
    if (!entry)
        return SGD_ERROR;

    entry->list.push_front(value);
    if (max_len > 0 && entry->list.size() > (size_t)max_len)
        entry->list.resize(max_len);
    apply_ttl(*entry, ttl_sec, now);
    return SGD_OK;
}

int CSGDMemoryStore::list_range(const std::string &key, std::vector<std::string> &values)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    values.clear();
    Entry *entry = find_live(key, now_ms());
    if (!entry)
        return SGD_OK;
    if (entry->type != EntryType::LIST)
    {
        spdlog::error("[store] CSGDMemoryStore::list_range, wrong type for key={}.", key);
        return SGD_ERROR;
    }
    values.assign(entry->list.begin(), entry->list.end());
    return SGD_OK;
}

int CSGDMemoryStore::set(const std::string &key, const std::string &value, int ttl_sec)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int64_t now = now_ms();
    // SET overwrites regardless of the previous type
    Entry &entry = m_entries[key];
    entry.type = EntryType::STRING;
    entry.zset.clear();
    entry.list.clear();
    entry.str = value;
    apply_ttl(entry, ttl_sec, now);
    return SGD_OK;
}

int CSGDMemoryStore::get(const std::string &key, bool &found, std::string &value)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    found = false;
    Entry *entry = find_live(key, now_ms());
    if (!entry)
        return SGD_OK;
    if (entry->type != EntryType::STRING)
    {
        spdlog::error("[store] CSGDMemoryStore::get, wrong type for key={}.", key);
        return SGD_ERROR;
    }
    found = true;
    value = entry->str;
    return SGD_OK;
}

int CSGDMemoryStore::del(const std::string &key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(key);
    return SGD_OK;
}

int CSGDMemoryStore::del(const std::vector<std::string> &keys, int64_t &deleted)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int64_t now = now_ms();
    deleted = 0;
    for (const std::string &key : keys)
    {
        auto it = m_entries.find(key);
        if (it == m_entries.end())
            continue;
        if (!is_expired(it->second, now))
            deleted++;
        m_entries.erase(it);
    }
    return SGD_OK;
}

int CSGDMemoryStore::exists(const std::string &key, bool &found)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    found = find_live(key, now_ms()) != NULL;
    return SGD_OK;
}

int CSGDMemoryStore::expire(const std::string &key, int ttl_sec)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int64_t now = now_ms();
    Entry *entry = find_live(key, now);
    if (!entry)
        return SGD_OK;
    if (ttl_sec <= 0)
    {
        m_entries.erase(key);
        return SGD_OK;
    }
    apply_ttl(*entry, ttl_sec, now);
    return SGD_OK;
}

int CSGDMemoryStore::scan(uint64_t cursor, const std::string &pattern, int count,
                          uint64_t &next_cursor, std::vector<std::string> &keys)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int64_t now = now_ms();
    keys.clear();
    next_cursor = 0;
    if (count <= 0)
        count = 10;

    // The cursor is a position in key-hash order, so keys deleted between
    // pages never shift the keys still to be visited.
    std::hash<std::string> hasher;
    std::vector<std::pair<uint64_t, std::string>> pending;
    for (auto it = m_entries.begin(); it != m_entries.end();)
    {
        if (is_expired(it->second, now))
        {
            it = m_entries.erase(it);
            continue;
        }
        uint64_t h = (uint64_t)hasher(it->first);
        if (h >= cursor)
            pending.emplace_back(h, it->first);
        ++it;
    }
    std::sort(pending.begin(), pending.end());

    size_t examined = 0;
    size_t i = 0;
    while (i < pending.size())
    {
        uint64_t h = pending[i].first;
        // Visit every key sharing this hash in the same page.
        for (; i < pending.size() && pending[i].first == h; i++)
        {
            examined++;
            if (fnmatch(pattern.c_str(), pending[i].second.c_str(), 0) == 0)
                keys.push_back(pending[i].second);
        }
        if (examined >= (size_t)count && i < pending.size())
        {
            next_cursor = h + 1;
            break;
        }
    }
    return SGD_OK;
}

size_t CSGDMemoryStore::size()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int64_t now = now_ms();
    size_t live = 0;
    for (const auto &entry : m_entries)
    {
        if (!is_expired(entry.second, now))
            live++;
    }
    return live;
}
