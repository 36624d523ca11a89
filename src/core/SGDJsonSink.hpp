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

#include "spdlog/sinks/base_sink.h"
#include "spdlog/details/null_mutex.h"
#include <nlohmann/json.hpp>
#include <mutex>
#include <fstream>
#include <chrono>
#include <string>

#include "common.hpp"

/**
 * JSON-lines file sink for spdlog using nlohmann/json
 *
 * Messages follow the "[category] text key=value key=value" convention used
 * across sig-guard. Each line written has:
 * - timestamp: ISO 8601 UTC
 * - level, logger, message
 * - category: the leading [tag], when present
 * - fields: object with every key=value token of the message
 */
template <typename Mutex>
class sgd_json_file_sink : public spdlog::sinks::base_sink<Mutex>
{
public:
    explicit sgd_json_file_sink(const std::string &filename)
        : file_(filename, std::ios::app)
    {
        if (!file_.is_open())
        {
            throw spdlog::spdlog_ex("Failed to open file " + filename);
        }
    }

    /**
     * Build the JSON document for one message payload. Exposed for tests.
     */
    static nlohmann::json to_json_fields(const std::string &message)
    {
        nlohmann::json out = nlohmann::json::object();
        size_t pos = 0;

        if (message.size() > 2 && message[0] == '[')
        {
            size_t close = message.find(']');
            if (close != std::string::npos)
            {
                out["category"] = message.substr(1, close - 1);
                pos = close + 1;
            }
        }

        nlohmann::json fields = nlohmann::json::object();
        while (pos < message.size())
        {
            size_t start = message.find_first_not_of(' ', pos);
            if (start == std::string::npos)
                break;
            size_t end = message.find(' ', start);
            std::string token = message.substr(start, end == std::string::npos ? std::string::npos : end - start);
            pos = (end == std::string::npos) ? message.size() : end;

            size_t eq = token.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == token.size())
                continue;
            std::string value = token.substr(eq + 1);
            if (!value.empty() && (value.back() == ',' || value.back() == '.'))
                value.pop_back();
            fields[token.substr(0, eq)] = value;
        }
        if (!fields.empty())
            out["fields"] = fields;
        return out;
    }

protected:
    void sink_it_(const spdlog::details::log_msg &msg) override
    {
        int64_t epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               msg.time.time_since_epoch())
                               .count();

        std::string message(msg.payload.begin(), msg.payload.end());
        nlohmann::json entry = to_json_fields(message);

        entry["timestamp"] = sgd_format_iso8601(epoch_ms);
        auto level_sv = spdlog::level::to_string_view(msg.level);
        entry["level"] = std::string(level_sv.data(), level_sv.size());
        entry["logger"] = std::string(msg.logger_name.begin(), msg.logger_name.end());
        entry["message"] = message;

        // replace keeps invalid UTF-8 in identifiers from throwing
        file_ << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    }

    void flush_() override
    {
        file_.flush();
    }

private:
    std::ofstream file_;
};

using sgd_json_file_sink_mt = sgd_json_file_sink<std::mutex>;
using sgd_json_file_sink_st = sgd_json_file_sink<spdlog::details::null_mutex>;
