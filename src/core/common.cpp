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

#include <time.h>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <algorithm>

#include "common.hpp"

int64_t sgd_gettime_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string sgd_strlower(const std::string &str)
{
    std::string out(str);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return (char)tolower(c); });
    return out;
}

std::string sgd_strtrim(const std::string &str)
{
    const char *ws = " \t\r\n\f\v";
    size_t begin = str.find_first_not_of(ws);
    if (begin == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(ws);
    return str.substr(begin, end - begin + 1);
}

std::string sgd_format_iso8601(int64_t epoch_ms)
{
    time_t secs = (time_t)(epoch_ms / 1000);
    int ms = (int)(epoch_ms % 1000);
    if (ms < 0)
    {
        ms += 1000;
        secs -= 1;
    }

    std::tm tm;
    gmtime_r(&secs, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms << "Z";
    return oss.str();
}

std::string sgd_glob_escape(const std::string &value)
{
    std::string out;
    out.reserve(value.size());
    for (char c : value)
    {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\')
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string sgd_utf8_truncate(const std::string &str, size_t max_chars)
{
    if (str.size() <= max_chars)
        return str;

    size_t chars = 0;
    for (size_t i = 0; i < str.size(); i++)
    {
        // a lead byte starts a new code point
        if (((unsigned char)str[i] & 0xC0) != 0x80)
        {
            if (chars == max_chars)
                return str.substr(0, i);
            chars++;
        }
    }
    return str;
}

bool sgd_icontains(const std::string &haystack, const std::string &needle)
{
    if (needle.empty())
        return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return tolower((unsigned char)a) == tolower((unsigned char)b);
                          });
    return it != haystack.end();
}

size_t sgd_utf8_length(const std::string &str)
{
    size_t len = 0;
    for (unsigned char c : str)
    {
        if ((c & 0xC0) != 0x80)
            len++;
    }
    return len;
}
