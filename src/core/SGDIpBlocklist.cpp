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

#include <utility>
#include <nlohmann/json.hpp>
#include "spdlog/spdlog.h"

#include "SGDIpBlocklist.hpp"
#include "SGDLog.hpp"

using json = nlohmann::json;

static const char IP_BLOCKLIST_PREFIX[] = "security:ip_blocklist:";

CSGDIpBlocklist::CSGDIpBlocklist(CSGDStore *store, int default_ttl_sec, int scan_batch, sgd_clock_fn clock)
    : m_store(store),
      m_default_ttl_sec(default_ttl_sec > 0 ? default_ttl_sec : 0),
      m_scan_batch(scan_batch > 0 ? scan_batch : 100),
      m_clock(std::move(clock))
{
}

CSGDIpBlocklist::~CSGDIpBlocklist()
{
}

int64_t CSGDIpBlocklist::now_ms() const
{
    return m_clock ? m_clock() : sgd_gettime_ms();
}

std::string CSGDIpBlocklist::make_key(const std::string &ip)
{
    return IP_BLOCKLIST_PREFIX + ip;
}

bool CSGDIpBlocklist::check_ip_blocked(const std::string &ip)
{
    if (ip.empty())
        return false;

    bool found = false;
    if (m_store->exists(make_key(ip), found) != SGD_OK)
    {
        int suppressed = 0;
        if (sgd_should_log_repeated("blocklist:failopen", suppressed))
            spdlog::error("[security] Blocklist unavailable, allowing | ip={} suppressed={}", ip, suppressed);
        return false;
    }

    if (found)
    {
        int suppressed = 0;
        if (sgd_should_log_repeated("blocked:" + ip, suppressed))
            spdlog::warn("[security] Blocked IP attempted access | ip={} suppressed={}", ip, suppressed);
    }
    return found;
}

int CSGDIpBlocklist::add_ip_to_blocklist(const std::string &ip, const std::string &reason, int ttl_sec)
{
    if (ip.empty())
        return SGD_ERROR;
    if (ttl_sec < 0)
        ttl_sec = m_default_ttl_sec;

    json entry = {{"ip", ip}, {"reason", reason}, {"blocked_at_ms", now_ms()}};
    if (m_store->set(make_key(ip), entry.dump(-1, ' ', false, json::error_handler_t::replace), ttl_sec) != SGD_OK)
    {
        spdlog::error("[security] Failed to add IP to blocklist | ip={}", ip);
        return SGD_ERROR;
    }

    spdlog::warn("[security] IP added to blocklist | ip={} reason={} ttl={}s",
                 ip, reason.empty() ? "-" : reason, ttl_sec);
    return SGD_OK;
}

int CSGDIpBlocklist::remove_ip_from_blocklist(const std::string &ip)
{
    if (m_store->del(make_key(ip)) != SGD_OK)
    {
        spdlog::error("[security] Failed to remove IP from blocklist | ip={}", ip);
        return SGD_ERROR;
    }
    spdlog::info("[security] IP removed from blocklist | ip={}", ip);
    return SGD_OK;
}

int CSGDIpBlocklist::get_block(const std::string &ip, bool &found, sgd_ip_block_t &block)
{
    std::string raw;
    if (m_store->get(make_key(ip), found, raw) != SGD_OK)
        return SGD_ERROR;
    if (!found)
        return SGD_OK;

    block.ip = ip;
    block.reason.clear();
    block.blocked_at_ms = 0;
    try
    {
        json doc = json::parse(raw);
        block.reason = doc.value("reason", std::string());
        block.blocked_at_ms = doc.value("blocked_at_ms", (int64_t)0);
    }
    catch (const nlohmann::json::exception &e)
    {
        spdlog::warn("[security] Unreadable blocklist entry | ip={} error={}", ip, e.what());
    }
    return SGD_OK;
}

int CSGDIpBlocklist::list_blocked(std::vector<sgd_ip_block_t> &blocks)
{
    blocks.clear();
    std::string pattern = std::string(IP_BLOCKLIST_PREFIX) + "*";
    size_t prefix_len = sizeof(IP_BLOCKLIST_PREFIX) - 1;

    uint64_t cursor = 0;
    do
    {
        std::vector<std::string> keys;
        uint64_t next = 0;
        if (m_store->scan(cursor, pattern, m_scan_batch, next, keys) != SGD_OK)
            return SGD_ERROR;
        for (const std::string &key : keys)
        {
            bool found = false;
            sgd_ip_block_t block;
            if (get_block(key.substr(prefix_len), found, block) != SGD_OK)
                return SGD_ERROR;
            if (found)
                blocks.push_back(block);
        }
        cursor = next;
    } while (cursor != 0);
    return SGD_OK;
}
