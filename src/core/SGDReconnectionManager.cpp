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

#include <algorithm>
#include <cmath>
#include <utility>
#include "spdlog/spdlog.h"

#include "SGDReconnectionManager.hpp"
#include "SGDLog.hpp"

using json = nlohmann::json;

static const char MESSAGE_BUFFER_PREFIX[] = "webrtc:reconnect:buffer:";
static const char SEQUENCE_PREFIX[] = "webrtc:reconnect:seq:";
static const char USER_STATE_PREFIX[] = "webrtc:reconnect:state:";

const char *sgd_connection_quality_name(SGDConnectionQuality quality)
{
    switch (quality)
    {
    case SGDConnectionQuality::GOOD: return "good";
    case SGDConnectionQuality::FAIR: return "fair";
    case SGDConnectionQuality::POOR: return "poor";
    default:                         return "unknown";
    }
}

bool sgd_connection_quality_from_string(const std::string &name, SGDConnectionQuality &quality)
{
    if (name == "good")
        quality = SGDConnectionQuality::GOOD;
    else if (name == "fair")
        quality = SGDConnectionQuality::FAIR;
    else if (name == "poor")
        quality = SGDConnectionQuality::POOR;
    else if (name == "unknown")
        quality = SGDConnectionQuality::UNKNOWN;
    else
        return false;
    return true;
}

json sgd_buffered_message_t::to_json() const
{
    return json{{"sequence", sequence}, {"timestamp", timestamp}, {"message", message}};
}

json sgd_connection_state_t::to_json() const
{
    return json{
        {"user_id", user_id},
        {"room_id", room_id},
        {"is_connected", is_connected},
        {"last_seen", sgd_format_iso8601(last_seen_ms)},
        {"last_seen_ms", last_seen_ms},
        {"last_sequence", last_sequence},
        {"reconnect_count", reconnect_count},
        {"connection_quality", sgd_connection_quality_name(connection_quality)}};
}

bool sgd_connection_state_t::from_json(const json &doc, sgd_connection_state_t &state)
{
    try
    {
        state.user_id = doc.at("user_id").get<std::string>();
        state.room_id = doc.at("room_id").get<std::string>();
        state.is_connected = doc.at("is_connected").get<bool>();
        state.last_seen_ms = doc.at("last_seen_ms").get<int64_t>();
        state.last_sequence = doc.value("last_sequence", (int64_t)0);
        state.reconnect_count = doc.value("reconnect_count", 0);
        if (!sgd_connection_quality_from_string(doc.value("connection_quality", std::string("good")),
                                                state.connection_quality))
            state.connection_quality = SGDConnectionQuality::UNKNOWN;
    }
    catch (const nlohmann::json::exception &e)
    {
        spdlog::warn("[reconnect] Malformed connection state: {}", e.what());
        return false;
    }
    return true;
}

json sgd_reconnect_result_t::to_json() const
{
    json out;
    out["is_reconnect"] = is_reconnect;
    out["missed_messages"] = json::array();
    for (const sgd_buffered_message_t &msg : missed_messages)
        out["missed_messages"].push_back(msg.to_json());
    out["last_sequence"] = last_sequence;
    if (is_reconnect)
        out["disconnect_duration_seconds"] = has_disconnect_duration ? json(disconnect_duration_seconds) : json(nullptr);
    if (!error.empty())
        out["error"] = error;
    return out;
}

/**
 * CSGDReconnectionManager class implementation
 */

CSGDReconnectionManager::CSGDReconnectionManager(CSGDStore *store, int buffer_size, int buffer_ttl_sec,
                                                 int scan_batch, sgd_clock_fn clock)
    : m_store(store),
      m_buffer_size(buffer_size > 0 ? buffer_size : 50),
      m_buffer_ttl_sec(buffer_ttl_sec > 0 ? buffer_ttl_sec : 300),
      m_scan_batch(scan_batch > 0 ? scan_batch : 100),
      m_clock(std::move(clock))
{
    spdlog::info("[reconnect] Reconnection manager initialized | buffer_size={} ttl={}s",
                 m_buffer_size, m_buffer_ttl_sec);
}

CSGDReconnectionManager::~CSGDReconnectionManager()
{
}

int64_t CSGDReconnectionManager::now_ms() const
{
    return m_clock ? m_clock() : sgd_gettime_ms();
}

std::string CSGDReconnectionManager::buffer_key(const std::string &room_id)
{
    return MESSAGE_BUFFER_PREFIX + room_id;
}

std::string CSGDReconnectionManager::sequence_key(const std::string &room_id)
{
    return SEQUENCE_PREFIX + room_id;
}

std::string CSGDReconnectionManager::state_key(const std::string &room_id, const std::string &user_id)
{
    return USER_STATE_PREFIX + room_id + ":" + user_id;
}

int CSGDReconnectionManager::buffer_message(const std::string &room_id, const json &message, int64_t *sequence)
{
    int64_t seq = 0;
    if (m_store->incr(sequence_key(room_id), m_buffer_ttl_sec, seq) != SGD_OK)
    {
        sgd_get_summary_logger().record_buffer_failure();
        spdlog::error("[reconnect] Failed to buffer message, no sequence | room_id={}", room_id);
        return SGD_ERROR;
    }

    sgd_buffered_message_t buffered;
    buffered.sequence = seq;
    buffered.timestamp = sgd_format_iso8601(now_ms());
    buffered.message = message;

    std::string payload;
    try
    {
        payload = buffered.to_json().dump();
    }
    catch (const nlohmann::json::exception &e)
    {
        sgd_get_summary_logger().record_buffer_failure();
        spdlog::error("[reconnect] Failed to buffer message, payload not serializable | room_id={} seq={} error={}",
                      room_id, seq, e.what());
        return SGD_ERROR;
    }

    if (m_store->list_push_trim(buffer_key(room_id), payload, m_buffer_size, m_buffer_ttl_sec) != SGD_OK)
    {
        sgd_get_summary_logger().record_buffer_failure();
        spdlog::error("[reconnect] Failed to buffer message | room_id={} seq={}", room_id, seq);
        return SGD_ERROR;
    }

    sgd_get_summary_logger().record_buffered();
    if (sgd_should_log_category(SGDLogCategory::RECONNECT, spdlog::level::debug))
        spdlog::debug("[reconnect] Buffered message | room_id={} seq={}", room_id, seq);

    if (sequence)
        *sequence = seq;
    return SGD_OK;
}

int CSGDReconnectionManager::get_missed_messages(const std::string &room_id, int64_t last_sequence,
                                                 std::vector<sgd_buffered_message_t> &messages)
{
    messages.clear();

    std::vector<std::string> raw;
    if (m_store->list_range(buffer_key(room_id), raw) != SGD_OK)
    {
        spdlog::error("[reconnect] Failed to get missed messages | room_id={}", room_id);
        return SGD_ERROR;
    }

    for (const std::string &entry : raw)
    {
        sgd_buffered_message_t msg;
        try
        {
            json doc = json::parse(entry);
            msg.sequence = doc.at("sequence").get<int64_t>();
            msg.timestamp = doc.value("timestamp", std::string());
            msg.message = doc.contains("message") ? doc["message"] : json(nullptr);
        }
        catch (const nlohmann::json::exception &e)
        {
            spdlog::warn("[reconnect] Failed to parse buffered message | room_id={} error={}", room_id, e.what());
            continue;
        }

        if (last_sequence == SGD_SEQUENCE_UNSET || msg.sequence > last_sequence)
            messages.push_back(msg);
    }

    std::sort(messages.begin(), messages.end(),
              [](const sgd_buffered_message_t &a, const sgd_buffered_message_t &b) {
                  return a.sequence < b.sequence;
              });

    if (sgd_should_log_category(SGDLogCategory::RECONNECT, spdlog::level::debug))
        spdlog::debug("[reconnect] Retrieved missed messages | room_id={} count={}", room_id, messages.size());
    return SGD_OK;
}

int CSGDReconnectionManager::write_state(const sgd_connection_state_t &state)
{
    // ids come from callers and may carry invalid UTF-8
    std::string payload = state.to_json().dump(-1, ' ', false, json::error_handler_t::replace);
    if (m_store->set(state_key(state.room_id, state.user_id), payload, m_buffer_ttl_sec) != SGD_OK)
    {
        spdlog::error("[reconnect] Failed to store user state | room_id={} user_id={}", state.room_id, state.user_id);
        return SGD_ERROR;
    }
    return SGD_OK;
}

int CSGDReconnectionManager::track_user_state(const std::string &room_id, const std::string &user_id,
                                              bool is_connected, int64_t last_sequence)
{
    bool found = false;
    sgd_connection_state_t state;
    if (get_user_state(room_id, user_id, found, state) != SGD_OK)
        return SGD_ERROR;

    if (!found)
    {
        state.user_id = user_id;
        state.room_id = room_id;
        state.is_connected = false;
        state.last_sequence = 0;
        state.reconnect_count = 0;
        state.connection_quality = SGDConnectionQuality::GOOD;
    }
    else if (!state.is_connected && is_connected)
    {
        state.reconnect_count++;
    }

    state.is_connected = is_connected;
    state.last_seen_ms = now_ms();
    if (last_sequence != SGD_SEQUENCE_UNSET)
        state.last_sequence = last_sequence;

    if (write_state(state) != SGD_OK)
        return SGD_ERROR;

    if (sgd_should_log_category(SGDLogCategory::RECONNECT, spdlog::level::debug))
        spdlog::debug("[reconnect] Tracked state | room_id={} user_id={} connected={} last_sequence={}",
                      room_id, user_id, is_connected, state.last_sequence);
    return SGD_OK;
}

int CSGDReconnectionManager::get_user_state(const std::string &room_id, const std::string &user_id,
                                            bool &found, sgd_connection_state_t &state)
{
    found = false;
    std::string raw;
    bool exists = false;
    if (m_store->get(state_key(room_id, user_id), exists, raw) != SGD_OK)
    {
        spdlog::error("[reconnect] Failed to get user state | room_id={} user_id={}", room_id, user_id);
        return SGD_ERROR;
    }
    if (!exists)
        return SGD_OK;

    json doc;
    try
    {
        doc = json::parse(raw);
    }
    catch (const nlohmann::json::exception &e)
    {
        spdlog::warn("[reconnect] Unreadable user state ignored | room_id={} user_id={} error={}",
                     room_id, user_id, e.what());
        return SGD_OK;
    }

    found = sgd_connection_state_t::from_json(doc, state);
    if (found)
    {
        // the stored copy may hold replacement characters, the key does not
        state.room_id = room_id;
        state.user_id = user_id;
    }
    return SGD_OK;
}

sgd_reconnect_result_t CSGDReconnectionManager::handle_reconnect(const std::string &room_id, const std::string &user_id)
{
    sgd_reconnect_result_t result;
    result.is_reconnect = false;
    result.last_sequence = 0;
    result.has_disconnect_duration = false;
    result.disconnect_duration_seconds = 0;

    bool found = false;
    sgd_connection_state_t state;
    if (get_user_state(room_id, user_id, found, state) != SGD_OK)
    {
        result.error = "connection state unavailable";
        return result;
    }
    if (!found)
    {
        spdlog::info("[reconnect] No previous state, new connection | room_id={} user_id={}", room_id, user_id);
        return result;
    }

    int64_t now = now_ms();
    result.is_reconnect = true;
    result.last_sequence = state.last_sequence;
    result.has_disconnect_duration = true;
    result.disconnect_duration_seconds = (now - state.last_seen_ms) / 1000.0;

    if (get_missed_messages(room_id, state.last_sequence, result.missed_messages) != SGD_OK)
        result.error = "message buffer unavailable";

    // last_sequence is kept until the client acknowledges the replay
    state.is_connected = true;
    state.last_seen_ms = now;
    state.reconnect_count++;
    if (write_state(state) != SGD_OK && result.error.empty())
        result.error = "connection state not updated";

    sgd_get_summary_logger().record_reconnect((int)result.missed_messages.size());
    spdlog::info("[reconnect] Reconnection handled | room_id={} user_id={} missed={} last_sequence={} away={:.1f}s",
                 room_id, user_id, result.missed_messages.size(), result.last_sequence,
                 result.disconnect_duration_seconds);
    return result;
}

int CSGDReconnectionManager::acknowledge_replay(const std::string &room_id, const std::string &user_id, int64_t sequence)
{
    bool found = false;
    sgd_connection_state_t state;
    if (get_user_state(room_id, user_id, found, state) != SGD_OK)
        return SGD_ERROR;
    if (!found)
    {
        spdlog::warn("[reconnect] Replay acknowledged without state | room_id={} user_id={} seq={}",
                     room_id, user_id, sequence);
        return SGD_ERROR;
    }

    state.last_sequence = std::max(state.last_sequence, sequence);
    state.last_seen_ms = now_ms();
    return write_state(state);
}

SGDConnectionQuality CSGDReconnectionManager::classify_quality(const sgd_connection_metrics_t &metrics)
{
    double values[] = {metrics.latency_ms, metrics.packet_loss_percent, metrics.jitter_ms};
    for (double v : values)
    {
        if (!std::isfinite(v) || v < 0)
            return SGDConnectionQuality::UNKNOWN;
    }

    if (metrics.latency_ms > 300 || metrics.packet_loss_percent > 5 || metrics.jitter_ms > 50)
        return SGDConnectionQuality::POOR;
    if (metrics.latency_ms > 150 || metrics.packet_loss_percent > 2 || metrics.jitter_ms > 30)
        return SGDConnectionQuality::FAIR;
    return SGDConnectionQuality::GOOD;
}

SGDConnectionQuality CSGDReconnectionManager::detect_connection_quality(const std::string &room_id,
                                                                        const std::string &user_id,
                                                                        const sgd_connection_metrics_t &metrics)
{
    SGDConnectionQuality quality = classify_quality(metrics);

    bool found = false;
    sgd_connection_state_t state;
    if (get_user_state(room_id, user_id, found, state) == SGD_OK && found)
    {
        state.connection_quality = quality;
        if (write_state(state) != SGD_OK)
            spdlog::warn("[reconnect] Connection quality not persisted | room_id={} user_id={}", room_id, user_id);
    }

    if (sgd_should_log_category(SGDLogCategory::RECONNECT, spdlog::level::debug))
        spdlog::debug("[reconnect] Connection quality | user_id={} quality={} latency={}ms",
                      user_id, sgd_connection_quality_name(quality), metrics.latency_ms);
    return quality;
}

int CSGDReconnectionManager::cleanup_room(const std::string &room_id)
{
    int ret = SGD_OK;
    if (m_store->del(buffer_key(room_id)) != SGD_OK)
        ret = SGD_ERROR;
    if (m_store->del(sequence_key(room_id)) != SGD_OK)
        ret = SGD_ERROR;

    std::string pattern = USER_STATE_PREFIX + sgd_glob_escape(room_id) + ":*";
    uint64_t cursor = 0;
    int64_t removed = 0;
    do
    {
        std::vector<std::string> keys;
        uint64_t next = 0;
        if (m_store->scan(cursor, pattern, m_scan_batch, next, keys) != SGD_OK)
        {
            spdlog::error("[reconnect] Failed to cleanup room, scan aborted | room_id={}", room_id);
            return SGD_ERROR;
        }
        if (!keys.empty())
        {
            int64_t deleted = 0;
            if (m_store->del(keys, deleted) != SGD_OK)
                ret = SGD_ERROR;
            removed += deleted;
        }
        cursor = next;
    } while (cursor != 0);

    spdlog::info("[reconnect] Cleaned up reconnection state | room_id={} user_states={}", room_id, removed);
    return ret;
}
