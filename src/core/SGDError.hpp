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

#include <exception>
#include <string>
#include <nlohmann/json.hpp>

#define SGD_NO_RETRY_AFTER -1

/**
 * Closed vocabulary of failure conditions in the signaling resilience layer.
 * Names are stable wire values, see sgd_error_code_name().
 */
enum class SGDErrorCode
{
    // auth
    UNAUTHORIZED = 0,
    INVALID_TOKEN,
    TOKEN_EXPIRED,
    PERMISSION_DENIED,
    INSUFFICIENT_ROLE,

    // rate limiting
    RATE_LIMIT_EXCEEDED,
    TOO_MANY_MESSAGES,
    TOO_MANY_REQUESTS,

    // capacity
    ROOM_FULL,
    MAX_ROOMS_REACHED,
    MAX_PARTICIPANTS_REACHED,
    STORAGE_QUOTA_EXCEEDED,

    // room state
    ROOM_NOT_FOUND,
    ROOM_LOCKED,
    ROOM_CLOSED,
    ROOM_ALREADY_EXISTS,
    WAITING_ROOM_REQUIRED,

    // participant state
    USER_NOT_FOUND,
    USER_NOT_IN_ROOM,
    USER_ALREADY_IN_ROOM,
    USER_BANNED,

    // media / signaling
    INVALID_SDP,
    INVALID_ICE_CANDIDATE,
    INVALID_MESSAGE_TYPE,
    INVALID_PAYLOAD,
    MEDIA_NOT_SUPPORTED,

    // recording
    RECORDING_NOT_ALLOWED,
    RECORDING_ALREADY_ACTIVE,
    RECORDING_NOT_FOUND,
    RECORDING_FAILED,

    // file sharing
    FILE_TOO_LARGE,
    FILE_TYPE_NOT_ALLOWED,
    FILE_TRANSFER_FAILED,
    MALICIOUS_FILE_DETECTED,

    // network / service
    STORE_UNAVAILABLE,
    DATABASE_UNAVAILABLE,
    WEBSOCKET_ERROR,
    CONNECTION_TIMEOUT,
    SERVICE_UNAVAILABLE,

    // validation
    VALIDATION_ERROR,
    INVALID_ROOM_ID,
    INVALID_USER_ID,
    INVALID_SETTINGS,
    INVALID_PARAMETER,

    // general
    INTERNAL_ERROR,
    OPERATION_FAILED,
    UNKNOWN_ERROR,

    COUNT
};

enum class SGDErrorCategory
{
    AUTH = 0,
    RATE_LIMIT,
    CAPACITY,
    ROOM_STATE,
    PARTICIPANT_STATE,
    MEDIA_SIGNALING,
    RECORDING,
    FILE_SHARING,
    NETWORK,
    VALIDATION,
    GENERAL
};

const char *sgd_error_code_name(SGDErrorCode code);
bool sgd_error_code_from_string(const std::string &name, SGDErrorCode &code);

/**
 * Default transport status for an error code (HTTP semantics). Pure lookup,
 * 500 for anything outside the table.
 */
int sgd_get_error_status_code(SGDErrorCode code);

SGDErrorCategory sgd_error_category(SGDErrorCode code);
const char *sgd_error_category_name(SGDErrorCategory category);

/**
 * Transport-neutral body of an error
 */
struct sgd_error_response_t
{
    SGDErrorCode error_code;
    std::string message;
    nlohmann::json details;
    int retry_after; // SGD_NO_RETRY_AFTER when absent
    std::string recovery_suggestion;
    int status_code;
};

/**
 * Structured error value. Never mutated after construction; thrown by the
 * few entry points that raise (see CSGDRateLimiter::check_rate_limit).
 */
class CSGDError : public std::exception
{
public:
    /**
     * @param status_code -1 selects sgd_get_error_status_code(code)
     */
    CSGDError(SGDErrorCode code,
              const std::string &message,
              const nlohmann::json &details = nlohmann::json::object(),
              int retry_after = SGD_NO_RETRY_AFTER,
              const std::string &recovery_suggestion = "",
              int status_code = -1);

    SGDErrorCode get_error_code() const { return m_error_code; }
    const std::string &get_message() const { return m_message; }
    const nlohmann::json &get_details() const { return m_details; }
    bool has_retry_after() const { return m_retry_after != SGD_NO_RETRY_AFTER; }
    int get_retry_after() const { return m_retry_after; }
    const std::string &get_recovery_suggestion() const { return m_recovery_suggestion; }
    int get_status_code() const { return m_status_code; }

    const char *what() const noexcept override { return m_message.c_str(); }

    sgd_error_response_t to_response() const;

    /**
     * Serialized form: error_code, message, details, plus retry_after and
     * recovery_suggestion when present.
     */
    nlohmann::json to_dict() const;

    static CSGDError rate_limit_exceeded(const std::string &limit_type, int current, int max_allowed, int retry_after);
    static CSGDError room_full(const std::string &room_id, int max_participants, int current_count);
    static CSGDError room_locked(const std::string &room_id);
    static CSGDError room_not_found(const std::string &room_id);
    static CSGDError permission_denied(const std::string &action, const std::string &required_permission = "");
    static CSGDError user_not_found(const std::string &identifier);
    static CSGDError validation(const std::string &field, const std::string &message);
    static CSGDError validation(const std::string &field, const std::string &message, const std::string &value);
    static CSGDError service_unavailable(const std::string &service, const std::string &reason);

private:
    SGDErrorCode m_error_code;
    std::string m_message;
    nlohmann::json m_details;
    int m_retry_after;
    std::string m_recovery_suggestion;
    int m_status_code;
};
