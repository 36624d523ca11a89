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

#include "SGDRequestId.hpp"
#include "common.hpp"
#include <sstream>
#include <iomanip>
#include <random>

std::atomic<uint32_t> CSGDRequestId::s_counter(0);

const std::string &CSGDRequestId::instance_token()
{
    static const std::string token = [] {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<uint32_t> dist;
        std::ostringstream oss;
        oss << std::hex << std::setw(8) << std::setfill('0') << dist(gen);
        return oss.str();
    }();
    return token;
}

std::string CSGDRequestId::generate(int64_t timestamp_ms)
{
    uint32_t counter = s_counter.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << timestamp_ms << "-" << instance_token() << "-"
        << std::hex << std::setw(4) << std::setfill('0') << counter;
    return oss.str();
}
