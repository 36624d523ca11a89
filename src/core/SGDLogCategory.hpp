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

#include <string>

/**
 * Log categories for hierarchical logging control
 */
enum class SGDLogCategory
{
    RATELIMIT = 0, // Quota checks, rejections, resets
    RECONNECT,     // Buffering, replay, connection state
    SECURITY,      // Sanitization, file vetting, blocklist
    STORE,         // Shared store round-trips and failures
    ERROR,         // Error model conversions
    SYSTEM,        // Startup, configuration
    COUNT          // Total number of categories
};

inline const char *sgd_log_category_name(SGDLogCategory category)
{
    switch (category)
    {
    case SGDLogCategory::RATELIMIT: return "ratelimit";
    case SGDLogCategory::RECONNECT: return "reconnect";
    case SGDLogCategory::SECURITY:  return "security";
    case SGDLogCategory::STORE:     return "store";
    case SGDLogCategory::ERROR:     return "error";
    case SGDLogCategory::SYSTEM:    return "system";
    default:                        return "unknown";
    }
}

/**
 * Parse category from string, returns false for unknown names
 */
inline bool sgd_log_category_from_string(const std::string &name, SGDLogCategory &category)
{
    for (int i = 0; i < static_cast<int>(SGDLogCategory::COUNT); i++)
    {
        SGDLogCategory c = static_cast<SGDLogCategory>(i);
        if (name == sgd_log_category_name(c))
        {
            category = c;
            return true;
        }
    }
    return false;
}
