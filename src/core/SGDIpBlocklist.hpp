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

#include "common.hpp"
#include "SGDStore.hpp"

struct sgd_ip_block_t
{
    std::string ip;
    std::string reason;
    int64_t blocked_at_ms;
};

/**
 * IP denylist shared by every instance through the store
 *
 * One key per address (security:ip_blocklist:{ip}) holding the reason and
 * block time, with an optional TTL. Lookups fail open: if the store cannot
 * be read the address is treated as not blocked.
 *
 * The store is not owned and must outlive the blocklist.
 */
class CSGDIpBlocklist
{
public:
    /**
     * @param default_ttl_sec TTL used when add() gets none, 0 = permanent
     */
    CSGDIpBlocklist(CSGDStore *store, int default_ttl_sec = 0, int scan_batch = 100,
                    sgd_clock_fn clock = sgd_clock_fn());
    ~CSGDIpBlocklist();

    bool check_ip_blocked(const std::string &ip);

    /**
     * @param ttl_sec -1 selects the default TTL, 0 blocks permanently
     */
    int add_ip_to_blocklist(const std::string &ip, const std::string &reason = "", int ttl_sec = -1);
    int remove_ip_from_blocklist(const std::string &ip);

    int get_block(const std::string &ip, bool &found, sgd_ip_block_t &block);
    int list_blocked(std::vector<sgd_ip_block_t> &blocks);

    static std::string make_key(const std::string &ip);

private:
    int64_t now_ms() const;

    CSGDStore *m_store;
    int m_default_ttl_sec;
    int m_scan_batch;
    sgd_clock_fn m_clock;
};
