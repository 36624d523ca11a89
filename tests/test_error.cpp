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

#include <gtest/gtest.h>

#include "core/SGDError.hpp"

using json = nlohmann::json;

TEST(Error, StatusCodeTable)
{
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::UNAUTHORIZED), 401);
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::PERMISSION_DENIED), 403);
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::RATE_LIMIT_EXCEEDED), 429);
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::ROOM_NOT_FOUND), 404);
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::ROOM_CLOSED), 410);
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::ROOM_ALREADY_EXISTS), 409);
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::FILE_TOO_LARGE), 413);
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::FILE_TYPE_NOT_ALLOWED), 415);
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::VALIDATION_ERROR), 422);
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::STORAGE_QUOTA_EXCEEDED), 507);
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::SERVICE_UNAVAILABLE), 503);
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::CONNECTION_TIMEOUT), 504);
    EXPECT_EQ(sgd_get_error_status_code(SGDErrorCode::UNKNOWN_ERROR), 500);
}

TEST(Error, CodeNamesRoundTrip)
{
    for (int i = 0; i < static_cast<int>(SGDErrorCode::COUNT); i++)
    {
        SGDErrorCode code = static_cast<SGDErrorCode>(i);
        SGDErrorCode parsed = SGDErrorCode::UNKNOWN_ERROR;
        ASSERT_TRUE(sgd_error_code_from_string(sgd_error_code_name(code), parsed)) << sgd_error_code_name(code);
        EXPECT_EQ(parsed, code);
    }

    SGDErrorCode parsed;
    EXPECT_FALSE(sgd_error_code_from_string("not_a_code", parsed));
    EXPECT_STREQ(sgd_error_code_name(SGDErrorCode::RATE_LIMIT_EXCEEDED), "rate_limit_exceeded");
}

TEST(Error, Categories)
{
    EXPECT_EQ(sgd_error_category(SGDErrorCode::TOKEN_EXPIRED), SGDErrorCategory::AUTH);
    EXPECT_EQ(sgd_error_category(SGDErrorCode::TOO_MANY_MESSAGES), SGDErrorCategory::RATE_LIMIT);
    EXPECT_EQ(sgd_error_category(SGDErrorCode::MALICIOUS_FILE_DETECTED), SGDErrorCategory::FILE_SHARING);
    EXPECT_EQ(sgd_error_category(SGDErrorCode::STORE_UNAVAILABLE), SGDErrorCategory::NETWORK);
    EXPECT_STREQ(sgd_error_category_name(SGDErrorCategory::VALIDATION), "validation");
}

TEST(Error, DefaultStatusFromCode)
{
    CSGDError err(SGDErrorCode::ROOM_LOCKED, "locked");
    EXPECT_EQ(err.get_status_code(), 403);
    EXPECT_FALSE(err.has_retry_after());
    EXPECT_STREQ(err.what(), "locked");

    CSGDError custom(SGDErrorCode::ROOM_LOCKED, "locked", json::object(), SGD_NO_RETRY_AFTER, "", 418);
    EXPECT_EQ(custom.get_status_code(), 418);
}

TEST(Error, ToDictOmitsAbsentFields)
{
    CSGDError err(SGDErrorCode::INTERNAL_ERROR, "boom");
    json dict = err.to_dict();

    EXPECT_EQ(dict["error_code"], "internal_error");
    EXPECT_EQ(dict["message"], "boom");
    EXPECT_TRUE(dict["details"].is_object());
    EXPECT_FALSE(dict.contains("retry_after"));
    EXPECT_FALSE(dict.contains("recovery_suggestion"));
}

TEST(Error, RateLimitExceededFactory)
{
    CSGDError err = CSGDError::rate_limit_exceeded("chat_message", 60, 60, 12);
    EXPECT_EQ(err.get_error_code(), SGDErrorCode::RATE_LIMIT_EXCEEDED);
    EXPECT_EQ(err.get_status_code(), 429);
    EXPECT_EQ(err.get_retry_after(), 12);
    EXPECT_EQ(err.get_message(), "Rate limit exceeded for chat_message");

    json dict = err.to_dict();
    EXPECT_EQ(dict["retry_after"], 12);
    EXPECT_EQ(dict["details"]["limit_type"], "chat_message");
    EXPECT_EQ(dict["details"]["current"], 60);
    EXPECT_EQ(dict["details"]["max_allowed"], 60);
    EXPECT_EQ(dict["recovery_suggestion"], "Wait 12 seconds before retrying");
}

TEST(Error, Factories)
{
    CSGDError full = CSGDError::room_full("room-1", 10, 10);
    EXPECT_EQ(full.get_error_code(), SGDErrorCode::ROOM_FULL);
    EXPECT_EQ(full.get_details()["current_participants"], 10);

    CSGDError denied = CSGDError::permission_denied("kick");
    EXPECT_FALSE(denied.get_details().contains("required_permission"));
    EXPECT_EQ(CSGDError::permission_denied("kick", "host").get_details()["required_permission"], "host");

    CSGDError invalid = CSGDError::validation("room_id", "too short", "ab");
    EXPECT_EQ(invalid.get_status_code(), 422);
    EXPECT_EQ(invalid.get_details()["invalid_value"], "ab");
    EXPECT_FALSE(CSGDError::validation("room_id", "too short").get_details().contains("invalid_value"));

    CSGDError down = CSGDError::service_unavailable("redis", "connection refused");
    EXPECT_EQ(down.get_status_code(), 503);
    EXPECT_EQ(down.get_retry_after(), 30);
    EXPECT_EQ(down.get_message(), "redis is currently unavailable");
}

TEST(Error, ThrownAsException)
{
    try
    {
        throw CSGDError::room_not_found("lobby");
    }
    catch (const std::exception &e)
    {
        EXPECT_STREQ(e.what(), "Room not found: lobby");
        return;
    }
    FAIL() << "CSGDError was not caught as std::exception";
}

TEST(Error, ToResponse)
{
    sgd_error_response_t response = CSGDError::user_not_found("bob").to_response();
    EXPECT_EQ(response.error_code, SGDErrorCode::USER_NOT_FOUND);
    EXPECT_EQ(response.status_code, 404);
    EXPECT_EQ(response.retry_after, SGD_NO_RETRY_AFTER);
    EXPECT_EQ(response.details["identifier"], "bob");
}
