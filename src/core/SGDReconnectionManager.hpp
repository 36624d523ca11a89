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

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common.hpp"
#include "SGDStore.hpp"

enum class SGDConnectionQuality
{
    GOOD = 0,
    FAIR,
    POOR,
    UNKNOWN
};

const char *sgd_connection_quality_name(SGDConnectionQuality quality);
bool sgd_connection_quality_from_string(const std::string &name, SGDConnectionQuality &quality);

/**
 * One entry of a room buffer. Immutable once written.
 */
struct sgd_buffered_message_t
{
    int64_t sequence;
    std::string timestamp; // ISO 8601 UTC
    nlohmann::json message;

    nlohmann::json to_json() const;
};

/**
 * Connection continuity of one user in one room
 */
struct sgd_connection_state_t
{
    std::string user_id;
    std::string room_id;
    bool is_connected;
    int64_t last_seen_ms;
    int64_t last_sequence;
    int reconnect_count;
    SGDConnectionQuality connection_quality;

    nlohmann::json to_json() const;
    static bool from_json(const nlohmann::json &doc, sgd_connection_state_t &state);
};

struct sgd_reconnect_result_t
{
    bool is_reconnect;
    std::vector<sgd_buffered_message_t> missed_messages;
    int64_t last_sequence;
    bool has_disconnect_duration;
    double disconnect_duration_seconds;
    std::string error; // set when the lookup degraded

    nlohmann::json to_json() const;
};

struct sgd_connection_metrics_t
{
    double latency_ms;
    double packet_loss_percent;
    double jitter_ms;
};

/**
 * Reconnection and state recovery
 *
 * Buffers the last N messages of each room and tracks per-user connection
 * state so a client coming back within the buffer TTL replays exactly what
 * it missed. All state lives in the shared store under
 * webrtc:reconnect:{buffer,seq,state}:... keys; sequence numbers come from
 * the store's atomic counter so they stay gap-free across instances.
 *
 * Nothing here throws. Failures are logged and degrade to "no state" or
 * "nothing missed" so a store outage never breaks a live connection.
 *
 * The store is not owned and must outlive the manager.
 */
class CSGDReconnectionManager
{
public:
    CSGDReconnectionManager(CSGDStore *store,
                            int buffer_size = 50,
                            int buffer_ttl_sec = 300,
                            int scan_batch = 100,
                            sgd_clock_fn clock = sgd_clock_fn());
    ~CSGDReconnectionManager();

    /**
     * Call after the message was delivered to the room. Returns SGD_ERROR
     * when it could not be buffered; delivery must go on regardless.
     * sequence (optional) receives the assigned sequence number.
     */
    int buffer_message(const std::string &room_id, const nlohmann::json &message, int64_t *sequence = NULL);

    /**
     * Buffered messages with sequence > last_sequence in ascending order;
     * SGD_SEQUENCE_UNSET returns everything still buffered.
     */
    int get_missed_messages(const std::string &room_id, int64_t last_sequence,
                            std::vector<sgd_buffered_message_t> &messages);

    /**
     * Upsert the user's state. last_sequence SGD_SEQUENCE_UNSET keeps the
     * stored value; a disconnected to connected transition counts as a
     * reconnect.
     */
    int track_user_state(const std::string &room_id, const std::string &user_id, bool is_connected,
                         int64_t last_sequence = SGD_SEQUENCE_UNSET);

    int get_user_state(const std::string &room_id, const std::string &user_id,
                       bool &found, sgd_connection_state_t &state);

    sgd_reconnect_result_t handle_reconnect(const std::string &room_id, const std::string &user_id);

    /**
     * Record that the client received everything up to sequence
     */
    int acknowledge_replay(const std::string &room_id, const std::string &user_id, int64_t sequence);

    /**
     * Classify metrics and store the result in the user's state if it exists
     */
    SGDConnectionQuality detect_connection_quality(const std::string &room_id, const std::string &user_id,
                                                   const sgd_connection_metrics_t &metrics);

    static SGDConnectionQuality classify_quality(const sgd_connection_metrics_t &metrics);

    /**
     * Drop the buffer, the sequence counter and every user state of a room
     */
    int cleanup_room(const std::string &room_id);

    static std::string buffer_key(const std::string &room_id);
    static std::string sequence_key(const std::string &room_id);
    static std::string state_key(const std::string &room_id, const std::string &user_id);

    int get_buffer_size() const { return m_buffer_size; }
    int get_buffer_ttl_sec() const { return m_buffer_ttl_sec; }

private:
    int64_t now_ms() const;
    int write_state(const sgd_connection_state_t &state);

    CSGDStore *m_store;
    int m_buffer_size;
    int m_buffer_ttl_sec;
    int m_scan_batch;
    sgd_clock_fn m_clock;
};
