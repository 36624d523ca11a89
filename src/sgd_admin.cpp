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

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "spdlog/spdlog.h"

#include "core/common.hpp"
#include "core/SGDConf.hpp"
#include "core/SGDIpBlocklist.hpp"
#include "core/SGDLog.hpp"
#include "core/SGDRateLimiter.hpp"
#include "core/SGDReconnectionManager.hpp"
#include "core/SGDRedisStore.hpp"

using json = nlohmann::json;

static void usage(const char *prog)
{
    std::cerr << "Usage: " << prog << " [-c config.json] [-v] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  status <limit_type> <identifier>   show the sliding window of an identifier\n"
              << "  reset <limit_type> <identifier>    forget every recorded request\n"
              << "  block <ip> [ttl_sec] [reason]      add an address to the blocklist\n"
              << "  unblock <ip>                       remove an address from the blocklist\n"
              << "  blocked                            list blocked addresses\n"
              << "  cleanup-room <room_id>             drop buffered messages and user states\n"
              << "  replay <room_id> [last_sequence]   print buffered messages after last_sequence\n";
}

static bool parse_int64(const char *text, int64_t &value)
{
    char *end = NULL;
    errno = 0;
    long long parsed = strtoll(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0')
        return false;
    value = parsed;
    return true;
}

int main(int argc, char *argv[])
{
    initialize_logger();
    // keep stdout for command output
    spdlog::default_logger()->set_level(spdlog::level::warn);

    std::string conf_file;
    bool verbose = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-c") == 0 && i + 1 < argc)
            conf_file = argv[++i];
        else if (strcmp(argv[i], "-v") == 0)
            verbose = true;
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0)
        {
            usage(argv[0]);
            return 0;
        }
        else
            args.push_back(argv[i]);
    }
    if (args.empty())
    {
        usage(argv[0]);
        return 1;
    }

    sgd_conf_t conf;
    sgd_conf_init(conf);
    if (!conf_file.empty() && sgd_conf_load_file(conf_file, conf) != SGD_OK)
        return 1;
    if (verbose && sgd_set_log_level("debug") != SGD_OK)
        return 1;

    CSGDRedisStore store;
    if (store.init(conf.store) != SGD_OK)
    {
        std::cerr << "cannot connect to " << conf.store.url << "\n";
        return 2;
    }

    const std::string &cmd = args[0];
    json out;

    if ((cmd == "status" || cmd == "reset") && args.size() == 3)
    {
        CSGDRateLimiter limiter(&store, conf.rate_limits, conf.unknown_limit_type_policy);
        if (cmd == "reset")
        {
            out["reset"] = limiter.reset_rate_limit(args[1], args[2]);
        }
        else
        {
            sgd_rate_limit_status_t status;
            if (limiter.get_rate_limit_status(args[1], args[2], status) != SGD_OK)
            {
                out["error"] = status.error;
            }
            else
            {
                out = json{{"limit", status.limit},
                           {"remaining", status.remaining},
                           {"used", status.used},
                           {"reset_at", status.reset_at},
                           {"window_seconds", status.window_seconds}};
            }
        }
    }
    else if (cmd == "block" && args.size() >= 2 && args.size() <= 4)
    {
        CSGDIpBlocklist blocklist(&store, conf.security.blocklist_ttl_sec, conf.store.scan_batch);
        int64_t ttl = -1;
        if (args.size() >= 3 && (!parse_int64(args[2].c_str(), ttl) || ttl < 0 || ttl > INT_MAX))
        {
            std::cerr << "invalid ttl '" << args[2] << "'\n";
            return 1;
        }
        std::string reason = args.size() == 4 ? args[3] : "";
        out["blocked"] = blocklist.add_ip_to_blocklist(args[1], reason, (int)ttl) == SGD_OK;
    }
    else if (cmd == "unblock" && args.size() == 2)
    {
        CSGDIpBlocklist blocklist(&store, conf.security.blocklist_ttl_sec, conf.store.scan_batch);
        out["unblocked"] = blocklist.remove_ip_from_blocklist(args[1]) == SGD_OK;
    }
    else if (cmd == "blocked" && args.size() == 1)
    {
        CSGDIpBlocklist blocklist(&store, conf.security.blocklist_ttl_sec, conf.store.scan_batch);
        std::vector<sgd_ip_block_t> blocks;
        if (blocklist.list_blocked(blocks) != SGD_OK)
            return 2;
        out = json::array();
        for (const sgd_ip_block_t &block : blocks)
            out.push_back(json{{"ip", block.ip},
                               {"reason", block.reason},
                               {"blocked_at", sgd_format_iso8601(block.blocked_at_ms)}});
    }
    else if (cmd == "cleanup-room" && args.size() == 2)
    {
        CSGDReconnectionManager reconnect(&store, conf.reconnect.buffer_size, conf.reconnect.buffer_ttl_sec,
                                          conf.store.scan_batch);
        out["cleaned"] = reconnect.cleanup_room(args[1]) == SGD_OK;
    }
    else if (cmd == "replay" && (args.size() == 2 || args.size() == 3))
    {
        int64_t last_sequence = SGD_SEQUENCE_UNSET;
        if (args.size() == 3 && !parse_int64(args[2].c_str(), last_sequence))
        {
            std::cerr << "invalid sequence '" << args[2] << "'\n";
            return 1;
        }
        CSGDReconnectionManager reconnect(&store, conf.reconnect.buffer_size, conf.reconnect.buffer_ttl_sec,
                                          conf.store.scan_batch);
        std::vector<sgd_buffered_message_t> messages;
        if (reconnect.get_missed_messages(args[1], last_sequence, messages) != SGD_OK)
            return 2;
        out = json::array();
        for (const sgd_buffered_message_t &msg : messages)
            out.push_back(msg.to_json());
    }
    else
    {
        usage(argv[0]);
        return 1;
    }

    std::cout << out.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return 0;
}
