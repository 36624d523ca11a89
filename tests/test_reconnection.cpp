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

#include <cmath>
#include <limits>

#include "core/SGDMemoryStore.hpp"
#include "core/SGDReconnectionManager.hpp"
#include "test_helpers.hpp"

using json = nlohmann::json;

class ReconnectionTest : public ::testing::Test
{
protected:
    ReconnectionTest()
        : store(clock.fn()),
          manager(&store, 50, 300, 100, clock.fn())
    {
    }

    void buffer(const std::string &room_id, int count)
    {
        for (int i = 0; i < count; i++)
            ASSERT_EQ(manager.buffer_message(room_id, json{{"type", "chat"}, {"n", i}}), SGD_OK);
    }

    ManualClock clock;
    CSGDMemoryStore store;
    CSGDReconnectionManager manager;
};

TEST_F(ReconnectionTest, SequencesAreGapFree)
{
    int64_t seq = 0;
    for (int64_t expected = 1; expected <= 5; expected++)
    {
        ASSERT_EQ(manager.buffer_message("room-1", json{{"type", "chat"}}, &seq), SGD_OK);
        EXPECT_EQ(seq, expected);
    }

    ASSERT_EQ(manager.buffer_message("room-2", json{{"type", "chat"}}, &seq), SGD_OK);
    EXPECT_EQ(seq, 1);
}

TEST_F(ReconnectionTest, MissedMessagesAscendingAfterSequence)
{
    buffer("room-1", 10);

    std::vector<sgd_buffered_message_t> messages;
    ASSERT_EQ(manager.get_missed_messages("room-1", 7, messages), SGD_OK);
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].sequence, 8);
    EXPECT_EQ(messages[1].sequence, 9);
    EXPECT_EQ(messages[2].sequence, 10);
    EXPECT_EQ(messages[0].message["n"], 7);
    EXPECT_FALSE(messages[0].timestamp.empty());

    ASSERT_EQ(manager.get_missed_messages("room-1", SGD_SEQUENCE_UNSET, messages), SGD_OK);
    EXPECT_EQ(messages.size(), 10u);

    ASSERT_EQ(manager.get_missed_messages("room-1", 10, messages), SGD_OK);
    EXPECT_TRUE(messages.empty());

    ASSERT_EQ(manager.get_missed_messages("unknown-room", 0, messages), SGD_OK);
    EXPECT_TRUE(messages.empty());
}

TEST_F(ReconnectionTest, BufferKeepsOnlyNewestEntries)
{
    buffer("room-1", 60);

    std::vector<sgd_buffered_message_t> messages;
    ASSERT_EQ(manager.get_missed_messages("room-1", SGD_SEQUENCE_UNSET, messages), SGD_OK);
    ASSERT_EQ(messages.size(), 50u);
    EXPECT_EQ(messages.front().sequence, 11);
    EXPECT_EQ(messages.back().sequence, 60);
}

TEST_F(ReconnectionTest, BufferExpires)
{
    buffer("room-1", 3);
    clock.advance_sec(301);

    std::vector<sgd_buffered_message_t> messages;
    ASSERT_EQ(manager.get_missed_messages("room-1", SGD_SEQUENCE_UNSET, messages), SGD_OK);
    EXPECT_TRUE(messages.empty());
}

TEST_F(ReconnectionTest, MalformedEntriesAreSkipped)
{
    buffer("room-1", 2);
    ASSERT_EQ(store.list_push_trim(CSGDReconnectionManager::buffer_key("room-1"), "{not json", 50, 300), SGD_OK);
    ASSERT_EQ(store.list_push_trim(CSGDReconnectionManager::buffer_key("room-1"), "{\"no_sequence\":1}", 50, 300), SGD_OK);

    std::vector<sgd_buffered_message_t> messages;
    ASSERT_EQ(manager.get_missed_messages("room-1", SGD_SEQUENCE_UNSET, messages), SGD_OK);
    EXPECT_EQ(messages.size(), 2u);
}

TEST_F(ReconnectionTest, TrackUserState)
{
    ASSERT_EQ(manager.track_user_state("room-1", "alice", true, 4), SGD_OK);

    bool found = false;
    sgd_connection_state_t state;
    ASSERT_EQ(manager.get_user_state("room-1", "alice", found, state), SGD_OK);
    ASSERT_TRUE(found);
    EXPECT_TRUE(state.is_connected);
    EXPECT_EQ(state.last_sequence, 4);
    EXPECT_EQ(state.reconnect_count, 0);
    EXPECT_EQ(state.connection_quality, SGDConnectionQuality::GOOD);
    EXPECT_EQ(state.last_seen_ms, clock.now());

    // omitted sequence keeps the stored one
    ASSERT_EQ(manager.track_user_state("room-1", "alice", false), SGD_OK);
    ASSERT_EQ(manager.get_user_state("room-1", "alice", found, state), SGD_OK);
    EXPECT_FALSE(state.is_connected);
    EXPECT_EQ(state.last_sequence, 4);

    ASSERT_EQ(manager.track_user_state("room-1", "alice", true), SGD_OK);
    ASSERT_EQ(manager.get_user_state("room-1", "alice", found, state), SGD_OK);
    EXPECT_EQ(state.reconnect_count, 1);

    ASSERT_EQ(manager.get_user_state("room-1", "bob", found, state), SGD_OK);
    EXPECT_FALSE(found);
}

TEST_F(ReconnectionTest, InvalidUtf8IdsDoNotThrow)
{
    const std::string user_id = "u\xff";
    EXPECT_NO_THROW({
        EXPECT_EQ(manager.track_user_state("room-1", user_id, false, 3), SGD_OK);
    });

    bool found = false;
    sgd_connection_state_t state;
    ASSERT_EQ(manager.get_user_state("room-1", user_id, found, state), SGD_OK);
    ASSERT_TRUE(found);
    EXPECT_EQ(state.user_id, user_id);
    EXPECT_EQ(state.last_sequence, 3);

    ASSERT_EQ(manager.track_user_state("room-1", user_id, true), SGD_OK);
    ASSERT_EQ(manager.get_user_state("room-1", user_id, found, state), SGD_OK);
    EXPECT_EQ(state.reconnect_count, 1);

    EXPECT_NO_THROW({
        EXPECT_EQ(manager.acknowledge_replay("room-1", user_id, 5), SGD_OK);
    });
    ASSERT_EQ(manager.get_user_state("room-1", user_id, found, state), SGD_OK);
    EXPECT_EQ(state.last_sequence, 5);
}

TEST_F(ReconnectionTest, HandleReconnectReplaysMissedMessages)
{
    buffer("room-1", 3);
    ASSERT_EQ(manager.track_user_state("room-1", "alice", true, 3), SGD_OK);
    ASSERT_EQ(manager.track_user_state("room-1", "alice", false), SGD_OK);

    clock.advance_sec(12);
    buffer("room-1", 4);

    sgd_reconnect_result_t result = manager.handle_reconnect("room-1", "alice");
    EXPECT_TRUE(result.is_reconnect);
    EXPECT_TRUE(result.error.empty());
    EXPECT_EQ(result.last_sequence, 3);
    ASSERT_EQ(result.missed_messages.size(), 4u);
    EXPECT_EQ(result.missed_messages.front().sequence, 4);
    EXPECT_EQ(result.missed_messages.back().sequence, 7);
    ASSERT_TRUE(result.has_disconnect_duration);
    EXPECT_DOUBLE_EQ(result.disconnect_duration_seconds, 12.0);

    bool found = false;
    sgd_connection_state_t state;
    ASSERT_EQ(manager.get_user_state("room-1", "alice", found, state), SGD_OK);
    EXPECT_TRUE(state.is_connected);
    EXPECT_EQ(state.reconnect_count, 1);
    EXPECT_EQ(state.last_sequence, 3);

    ASSERT_EQ(manager.acknowledge_replay("room-1", "alice", 7), SGD_OK);
    ASSERT_EQ(manager.get_user_state("room-1", "alice", found, state), SGD_OK);
    EXPECT_EQ(state.last_sequence, 7);

    result = manager.handle_reconnect("room-1", "alice");
    EXPECT_TRUE(result.missed_messages.empty());
    ASSERT_EQ(manager.get_user_state("room-1", "alice", found, state), SGD_OK);
    EXPECT_EQ(state.reconnect_count, 2);
}

TEST_F(ReconnectionTest, HandleReconnectWithoutState)
{
    buffer("room-1", 3);
    sgd_reconnect_result_t result = manager.handle_reconnect("room-1", "stranger");
    EXPECT_FALSE(result.is_reconnect);
    EXPECT_TRUE(result.missed_messages.empty());
    EXPECT_EQ(result.last_sequence, 0);
    EXPECT_FALSE(result.has_disconnect_duration);

    json doc = result.to_json();
    EXPECT_EQ(doc["is_reconnect"], false);
    EXPECT_TRUE(doc["missed_messages"].is_array());
}

TEST_F(ReconnectionTest, AcknowledgeNeverMovesBackwards)
{
    ASSERT_EQ(manager.track_user_state("room-1", "alice", true, 9), SGD_OK);
    ASSERT_EQ(manager.acknowledge_replay("room-1", "alice", 5), SGD_OK);

    bool found = false;
    sgd_connection_state_t state;
    ASSERT_EQ(manager.get_user_state("room-1", "alice", found, state), SGD_OK);
    EXPECT_EQ(state.last_sequence, 9);

    EXPECT_EQ(manager.acknowledge_replay("room-1", "nobody", 5), SGD_ERROR);
}

TEST_F(ReconnectionTest, QualityClassification)
{
    EXPECT_EQ(CSGDReconnectionManager::classify_quality({50, 0, 5}), SGDConnectionQuality::GOOD);
    EXPECT_EQ(CSGDReconnectionManager::classify_quality({150, 2, 30}), SGDConnectionQuality::GOOD);
    EXPECT_EQ(CSGDReconnectionManager::classify_quality({151, 0, 0}), SGDConnectionQuality::FAIR);
    EXPECT_EQ(CSGDReconnectionManager::classify_quality({50, 2.5, 0}), SGDConnectionQuality::FAIR);
    EXPECT_EQ(CSGDReconnectionManager::classify_quality({50, 0, 31}), SGDConnectionQuality::FAIR);
    EXPECT_EQ(CSGDReconnectionManager::classify_quality({301, 0, 0}), SGDConnectionQuality::POOR);
    EXPECT_EQ(CSGDReconnectionManager::classify_quality({50, 6, 0}), SGDConnectionQuality::POOR);
    EXPECT_EQ(CSGDReconnectionManager::classify_quality({50, 0, 51}), SGDConnectionQuality::POOR);
    EXPECT_EQ(CSGDReconnectionManager::classify_quality({-1, 0, 0}), SGDConnectionQuality::UNKNOWN);
    EXPECT_EQ(CSGDReconnectionManager::classify_quality({std::numeric_limits<double>::quiet_NaN(), 0, 0}),
              SGDConnectionQuality::UNKNOWN);
}

TEST_F(ReconnectionTest, DetectQualityPersistsIntoState)
{
    ASSERT_EQ(manager.track_user_state("room-1", "alice", true, 0), SGD_OK);
    EXPECT_EQ(manager.detect_connection_quality("room-1", "alice", {400, 0, 0}), SGDConnectionQuality::POOR);

    bool found = false;
    sgd_connection_state_t state;
    ASSERT_EQ(manager.get_user_state("room-1", "alice", found, state), SGD_OK);
    EXPECT_EQ(state.connection_quality, SGDConnectionQuality::POOR);

    // a later state update keeps the measured quality
    ASSERT_EQ(manager.track_user_state("room-1", "alice", false), SGD_OK);
    ASSERT_EQ(manager.get_user_state("room-1", "alice", found, state), SGD_OK);
    EXPECT_EQ(state.connection_quality, SGDConnectionQuality::POOR);

    EXPECT_EQ(manager.detect_connection_quality("room-1", "nobody", {10, 0, 0}), SGDConnectionQuality::GOOD);
    ASSERT_EQ(manager.get_user_state("room-1", "nobody", found, state), SGD_OK);
    EXPECT_FALSE(found);
}

TEST_F(ReconnectionTest, CleanupRoomLeavesOtherRoomsAlone)
{
    buffer("room-1", 5);
    buffer("room-10", 5);
    for (int i = 0; i < 250; i++)
        ASSERT_EQ(manager.track_user_state("room-1", "user" + std::to_string(i), true, 0), SGD_OK);
    ASSERT_EQ(manager.track_user_state("room-10", "alice", true, 0), SGD_OK);

    ASSERT_EQ(manager.cleanup_room("room-1"), SGD_OK);

    std::vector<sgd_buffered_message_t> messages;
    ASSERT_EQ(manager.get_missed_messages("room-1", SGD_SEQUENCE_UNSET, messages), SGD_OK);
    EXPECT_TRUE(messages.empty());
    bool found = true;
    ASSERT_EQ(store.exists(CSGDReconnectionManager::sequence_key("room-1"), found), SGD_OK);
    EXPECT_FALSE(found);

    sgd_connection_state_t state;
    ASSERT_EQ(manager.get_user_state("room-1", "user7", found, state), SGD_OK);
    EXPECT_FALSE(found);

    ASSERT_EQ(manager.get_missed_messages("room-10", SGD_SEQUENCE_UNSET, messages), SGD_OK);
    EXPECT_EQ(messages.size(), 5u);
    ASSERT_EQ(manager.get_user_state("room-10", "alice", found, state), SGD_OK);
    EXPECT_TRUE(found);

    // sequences restart after cleanup
    int64_t seq = 0;
    ASSERT_EQ(manager.buffer_message("room-1", json{{"type", "chat"}}, &seq), SGD_OK);
    EXPECT_EQ(seq, 1);
}

TEST_F(ReconnectionTest, StateJsonRoundTrip)
{
    sgd_connection_state_t state;
    state.user_id = "alice";
    state.room_id = "room-1";
    state.is_connected = true;
    state.last_seen_ms = 1700000000123LL;
    state.last_sequence = 42;
    state.reconnect_count = 3;
    state.connection_quality = SGDConnectionQuality::FAIR;

    json doc = state.to_json();
    EXPECT_EQ(doc["connection_quality"], "fair");
    EXPECT_EQ(doc["last_seen"], "2023-11-14T22:13:20.123Z");

    sgd_connection_state_t parsed;
    ASSERT_TRUE(sgd_connection_state_t::from_json(doc, parsed));
    EXPECT_EQ(parsed.last_sequence, 42);
    EXPECT_EQ(parsed.reconnect_count, 3);
    EXPECT_EQ(parsed.connection_quality, SGDConnectionQuality::FAIR);

    EXPECT_FALSE(sgd_connection_state_t::from_json(json{{"user_id", "alice"}}, parsed));
}

TEST(Reconnection, StoreOutageDegrades)
{
    FailingStore store;
    CSGDReconnectionManager manager(&store);

    EXPECT_EQ(manager.buffer_message("room-1", json{{"type", "chat"}}), SGD_ERROR);

    std::vector<sgd_buffered_message_t> messages;
    EXPECT_EQ(manager.get_missed_messages("room-1", 0, messages), SGD_ERROR);
    EXPECT_TRUE(messages.empty());

    sgd_reconnect_result_t result = manager.handle_reconnect("room-1", "alice");
    EXPECT_FALSE(result.is_reconnect);
    EXPECT_FALSE(result.error.empty());

    EXPECT_EQ(manager.track_user_state("room-1", "alice", true), SGD_ERROR);
    EXPECT_EQ(manager.cleanup_room("room-1"), SGD_ERROR);
    EXPECT_EQ(manager.detect_connection_quality("room-1", "alice", {400, 0, 0}), SGDConnectionQuality::POOR);
}

TEST(Reconnection, KeyLayout)
{
    EXPECT_EQ(CSGDReconnectionManager::buffer_key("r1"), "webrtc:reconnect:buffer:r1");
    EXPECT_EQ(CSGDReconnectionManager::sequence_key("r1"), "webrtc:reconnect:seq:r1");
    EXPECT_EQ(CSGDReconnectionManager::state_key("r1", "u1"), "webrtc:reconnect:state:r1:u1");
}
