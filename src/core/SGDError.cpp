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

#include "spdlog/spdlog.h"

#include "SGDError.hpp"

using json = nlohmann::json;

struct sgd_error_code_info_t
{
    SGDErrorCode code;
    const char *name;
    int status_code;
    SGDErrorCategory category;
};

// Indexed by SGDErrorCode, keep in enum order.
static const sgd_error_code_info_t g_error_table[] = {
    {SGDErrorCode::UNAUTHORIZED, "unauthorized", 401, SGDErrorCategory::AUTH},
    {SGDErrorCode::INVALID_TOKEN, "invalid_token", 401, SGDErrorCategory::AUTH},
    {SGDErrorCode::TOKEN_EXPIRED, "token_expired", 401, SGDErrorCategory::AUTH},
    {SGDErrorCode::PERMISSION_DENIED, "permission_denied", 403, SGDErrorCategory::AUTH},
    {SGDErrorCode::INSUFFICIENT_ROLE, "insufficient_role", 403, SGDErrorCategory::AUTH},

    {SGDErrorCode::RATE_LIMIT_EXCEEDED, "rate_limit_exceeded", 429, SGDErrorCategory::RATE_LIMIT},
    {SGDErrorCode::TOO_MANY_MESSAGES, "too_many_messages", 429, SGDErrorCategory::RATE_LIMIT},
    {SGDErrorCode::TOO_MANY_REQUESTS, "too_many_requests", 429, SGDErrorCategory::RATE_LIMIT},

    {SGDErrorCode::ROOM_FULL, "room_full", 403, SGDErrorCategory::CAPACITY},
    {SGDErrorCode::MAX_ROOMS_REACHED, "max_rooms_reached", 403, SGDErrorCategory::CAPACITY},
    {SGDErrorCode::MAX_PARTICIPANTS_REACHED, "max_participants_reached", 403, SGDErrorCategory::CAPACITY},
    {SGDErrorCode::STORAGE_QUOTA_EXCEEDED, "storage_quota_exceeded", 507, SGDErrorCategory::CAPACITY},

    {SGDErrorCode::ROOM_NOT_FOUND, "room_not_found", 404, SGDErrorCategory::ROOM_STATE},
    {SGDErrorCode::ROOM_LOCKED, "room_locked", 403, SGDErrorCategory::ROOM_STATE},
    {SGDErrorCode::ROOM_CLOSED, "room_closed", 410, SGDErrorCategory::ROOM_STATE},
    {SGDErrorCode::ROOM_ALREADY_EXISTS, "room_already_exists", 409, SGDErrorCategory::ROOM_STATE},
    {SGDErrorCode::WAITING_ROOM_REQUIRED, "waiting_room_required", 403, SGDErrorCategory::ROOM_STATE},

    {SGDErrorCode::USER_NOT_FOUND, "user_not_found", 404, SGDErrorCategory::PARTICIPANT_STATE},
    {SGDErrorCode::USER_NOT_IN_ROOM, "user_not_in_room", 404, SGDErrorCategory::PARTICIPANT_STATE},
    {SGDErrorCode::USER_ALREADY_IN_ROOM, "user_already_in_room", 409, SGDErrorCategory::PARTICIPANT_STATE},
    {SGDErrorCode::USER_BANNED, "user_banned", 403, SGDErrorCategory::PARTICIPANT_STATE},

    {SGDErrorCode::INVALID_SDP, "invalid_sdp", 400, SGDErrorCategory::MEDIA_SIGNALING},
    {SGDErrorCode::INVALID_ICE_CANDIDATE, "invalid_ice_candidate", 400, SGDErrorCategory::MEDIA_SIGNALING},
    {SGDErrorCode::INVALID_MESSAGE_TYPE, "invalid_message_type", 400, SGDErrorCategory::MEDIA_SIGNALING},
    {SGDErrorCode::INVALID_PAYLOAD, "invalid_payload", 400, SGDErrorCategory::MEDIA_SIGNALING},
    {SGDErrorCode::MEDIA_NOT_SUPPORTED, "media_not_supported", 415, SGDErrorCategory::MEDIA_SIGNALING},

    {SGDErrorCode::RECORDING_NOT_ALLOWED, "recording_not_allowed", 403, SGDErrorCategory::RECORDING},
    {SGDErrorCode::RECORDING_ALREADY_ACTIVE, "recording_already_active", 409, SGDErrorCategory::RECORDING},
    {SGDErrorCode::RECORDING_NOT_FOUND, "recording_not_found", 404, SGDErrorCategory::RECORDING},
    {SGDErrorCode::RECORDING_FAILED, "recording_failed", 500, SGDErrorCategory::RECORDING},

    {SGDErrorCode::FILE_TOO_LARGE, "file_too_large", 413, SGDErrorCategory::FILE_SHARING},
    {SGDErrorCode::FILE_TYPE_NOT_ALLOWED, "file_type_not_allowed", 415, SGDErrorCategory::FILE_SHARING},
    {SGDErrorCode::FILE_TRANSFER_FAILED, "file_transfer_failed", 500, SGDErrorCategory::FILE_SHARING},
    {SGDErrorCode::MALICIOUS_FILE_DETECTED, "malicious_file_detected", 403, SGDErrorCategory::FILE_SHARING},

    {SGDErrorCode::STORE_UNAVAILABLE, "store_unavailable", 503, SGDErrorCategory::NETWORK},
    {SGDErrorCode::DATABASE_UNAVAILABLE, "database_unavailable", 503, SGDErrorCategory::NETWORK},
    {SGDErrorCode::WEBSOCKET_ERROR, "websocket_error", 500, SGDErrorCategory::NETWORK},
    {SGDErrorCode::CONNECTION_TIMEOUT, "connection_timeout", 504, SGDErrorCategory::NETWORK},
    {SGDErrorCode::SERVICE_UNAVAILABLE, "service_unavailable", 503, SGDErrorCategory::NETWORK},

    {SGDErrorCode::VALIDATION_ERROR, "validation_error", 422, SGDErrorCategory::VALIDATION},
    {SGDErrorCode::INVALID_ROOM_ID, "invalid_room_id", 400, SGDErrorCategory::VALIDATION},
    {SGDErrorCode::INVALID_USER_ID, "invalid_user_id", 400, SGDErrorCategory::VALIDATION},
    {SGDErrorCode::INVALID_SETTINGS, "invalid_settings", 400, SGDErrorCategory::VALIDATION},
    {SGDErrorCode::INVALID_PARAMETER, "invalid_parameter", 400, SGDErrorCategory::VALIDATION},

    {SGDErrorCode::INTERNAL_ERROR, "internal_error", 500, SGDErrorCategory::GENERAL},
    {SGDErrorCode::OPERATION_FAILED, "operation_failed", 500, SGDErrorCategory::GENERAL},
    {SGDErrorCode::UNKNOWN_ERROR, "unknown_error", 500, SGDErrorCategory::GENERAL},
};

static_assert(sizeof(g_error_table) / sizeof(g_error_table[0]) == static_cast<size_t>(SGDErrorCode::COUNT),
              "error table out of sync with SGDErrorCode");

static const sgd_error_code_info_t *lookup(SGDErrorCode code)
{
    int idx = static_cast<int>(code);
    if (idx < 0 || idx >= static_cast<int>(SGDErrorCode::COUNT))
        return NULL;
    return &g_error_table[idx];
}

const char *sgd_error_code_name(SGDErrorCode code)
{
    const sgd_error_code_info_t *info = lookup(code);
    return info ? info->name : "unknown_error";
}

bool sgd_error_code_from_string(const std::string &name, SGDErrorCode &code)
{
    for (const sgd_error_code_info_t &info : g_error_table)
    {
        if (name == info.name)
        {
            code = info.code;
            return true;
        }
    }
    return false;
}

int sgd_get_error_status_code(SGDErrorCode code)
{
    const sgd_error_code_info_t *info = lookup(code);
    return info ? info->status_code : 500;
}

SGDErrorCategory sgd_error_category(SGDErrorCode code)
{
    const sgd_error_code_info_t *info = lookup(code);
    return info ? info->category : SGDErrorCategory::GENERAL;
}

const char *sgd_error_category_name(SGDErrorCategory category)
{
    switch (category)
    {
    case SGDErrorCategory::AUTH:              return "auth";
    case SGDErrorCategory::RATE_LIMIT:        return "rate_limit";
    case SGDErrorCategory::CAPACITY:          return "capacity";
    case SGDErrorCategory::ROOM_STATE:        return "room_state";
    case SGDErrorCategory::PARTICIPANT_STATE: return "participant_state";
    case SGDErrorCategory::MEDIA_SIGNALING:   return "media_signaling";
    case SGDErrorCategory::RECORDING:         return "recording";
    case SGDErrorCategory::FILE_SHARING:      return "file_sharing";
    case SGDErrorCategory::NETWORK:           return "network";
    case SGDErrorCategory::VALIDATION:        return "validation";
    default:                                  return "general";
    }
}

/**
 * CSGDError class implementation
 */

CSGDError::CSGDError(SGDErrorCode code,
                     const std::string &message,
                     const json &details,
                     int retry_after,
                     const std::string &recovery_suggestion,
                     int status_code)
    : m_error_code(code),
      m_message(message),
      m_details(details.is_object() ? details : json::object()),
      m_retry_after(retry_after < 0 ? SGD_NO_RETRY_AFTER : retry_after),
      m_recovery_suggestion(recovery_suggestion),
      m_status_code(status_code > 0 ? status_code : sgd_get_error_status_code(code))
{
}

sgd_error_response_t CSGDError::to_response() const
{
    sgd_error_response_t response;
    response.error_code = m_error_code;
    response.message = m_message;
    response.details = m_details;
    response.retry_after = m_retry_after;
    response.recovery_suggestion = m_recovery_suggestion;
    response.status_code = m_status_code;
    return response;
}

json CSGDError::to_dict() const
{
    json out;
    out["error_code"] = sgd_error_code_name(m_error_code);
    out["message"] = m_message;
    out["details"] = m_details;
    if (has_retry_after())
        out["retry_after"] = m_retry_after;
    if (!m_recovery_suggestion.empty())
        out["recovery_suggestion"] = m_recovery_suggestion;
    return out;
}

CSGDError CSGDError::rate_limit_exceeded(const std::string &limit_type, int current, int max_allowed, int retry_after)
{
    json details = {
        {"limit_type", limit_type},
        {"current", current},
        {"max_allowed", max_allowed},
        {"retry_after", retry_after}};
    return CSGDError(SGDErrorCode::RATE_LIMIT_EXCEEDED,
                     "Rate limit exceeded for " + limit_type,
                     details,
                     retry_after,
                     "Wait " + std::to_string(retry_after) + " seconds before retrying");
}

CSGDError CSGDError::room_full(const std::string &room_id, int max_participants, int current_count)
{
    json details = {
        {"room_id", room_id},
        {"max_participants", max_participants},
        {"current_participants", current_count}};
    return CSGDError(SGDErrorCode::ROOM_FULL,
                     "Room " + room_id + " is full",
                     details,
                     SGD_NO_RETRY_AFTER,
                     "Try joining a different room or wait for someone to leave");
}

CSGDError CSGDError::room_locked(const std::string &room_id)
{
    return CSGDError(SGDErrorCode::ROOM_LOCKED,
                     "Room " + room_id + " is locked",
                     json{{"room_id", room_id}},
                     SGD_NO_RETRY_AFTER,
                     "Request host to unlock the room");
}

CSGDError CSGDError::room_not_found(const std::string &room_id)
{
    return CSGDError(SGDErrorCode::ROOM_NOT_FOUND,
                     "Room not found: " + room_id,
                     json{{"room_id", room_id}},
                     SGD_NO_RETRY_AFTER,
                     "Verify the room ID is correct or create a new room");
}

CSGDError CSGDError::permission_denied(const std::string &action, const std::string &required_permission)
{
    json details = {{"action", action}};
    if (!required_permission.empty())
        details["required_permission"] = required_permission;
    return CSGDError(SGDErrorCode::PERMISSION_DENIED,
                     "Permission denied: " + action,
                     details,
                     SGD_NO_RETRY_AFTER,
                     "Request appropriate permissions from room host");
}

CSGDError CSGDError::user_not_found(const std::string &identifier)
{
    return CSGDError(SGDErrorCode::USER_NOT_FOUND,
                     "User not found: " + identifier,
                     json{{"identifier", identifier}},
                     SGD_NO_RETRY_AFTER,
                     "Verify the user identifier is correct");
}

CSGDError CSGDError::validation(const std::string &field, const std::string &message)
{
    return CSGDError(SGDErrorCode::VALIDATION_ERROR,
                     "Validation failed: " + message,
                     json{{"field", field}, {"validation_message", message}},
                     SGD_NO_RETRY_AFTER,
                     "Check the " + field + " field and correct the value");
}

CSGDError CSGDError::validation(const std::string &field, const std::string &message, const std::string &value)
{
    json details = {{"field", field}, {"validation_message", message}, {"invalid_value", value}};
    return CSGDError(SGDErrorCode::VALIDATION_ERROR,
                     "Validation failed: " + message,
                     details,
                     SGD_NO_RETRY_AFTER,
                     "Check the " + field + " field and correct the value");
}

CSGDError CSGDError::service_unavailable(const std::string &service, const std::string &reason)
{
    return CSGDError(SGDErrorCode::SERVICE_UNAVAILABLE,
                     service + " is currently unavailable",
                     json{{"service", service}, {"reason", reason}},
                     30,
                     "Try again in a few moments. If the problem persists, contact support.");
}
