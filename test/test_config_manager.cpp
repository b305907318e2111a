#include "core/config_manager.hpp"
#include <gtest/gtest.h>

using namespace parley;

// Without NVS every getter serves its default, so the hub can still boot
TEST(ConfigManagerTest, UninitializedGettersReturnDefaults) {
    ConfigManager config;
    ASSERT_FALSE(config.is_initialized());

    EXPECT_EQ(config.get_string("prov.kind", "mock"), "mock");
    EXPECT_EQ(config.get_uint32("srv.port", 80), 80u);
    EXPECT_FLOAT_EQ(config.get_float("vad.energy", 0.02f), 0.02f);
    EXPECT_TRUE(config.get_bool("turn.stream", true));
    EXPECT_FALSE(config.has_key("prov.kind"));
}

TEST(ConfigManagerTest, UninitializedWritesFail) {
    ConfigManager config;

    EXPECT_EQ(config.set_string("net.ssid", "home"), ErrorCode::INIT_FAILED);
    EXPECT_EQ(config.set_uint32("srv.port", 8080), ErrorCode::INIT_FAILED);
    EXPECT_EQ(config.set_float("vad.energy", 0.5f), ErrorCode::INIT_FAILED);
    EXPECT_EQ(config.commit(), ErrorCode::INIT_FAILED);
}

TEST(ConfigManagerTest, HubConfigDefaults) {
    ConfigManager config;
    HubConfig hub;

    ASSERT_EQ(config.load_hub_config(hub), ErrorCode::SUCCESS);

    EXPECT_FLOAT_EQ(hub.vad.energy_threshold, 0.01f);
    EXPECT_EQ(hub.silence.medium_ms, 700u);
    EXPECT_EQ(hub.silence.long_ms, 2000u);
    EXPECT_EQ(hub.silence.min_speech_ms, 200u);
    EXPECT_EQ(hub.turn.transcription_timeout_ms, 10000u);
    EXPECT_EQ(hub.turn.ai_timeout_ms, 30000u);
    EXPECT_EQ(hub.turn.context_window, 15u);
    EXPECT_TRUE(hub.turn.stream_ai_response);
    EXPECT_FALSE(hub.turn.confidence_gate);
    EXPECT_EQ(hub.protocol.max_frame_bytes, 500u * 1024u);
    EXPECT_EQ(hub.protocol.max_audio_chunk_bytes, 64u * 1024u);
    EXPECT_EQ(hub.protocol.session_idle_timeout_ms, 300000u);
    EXPECT_EQ(hub.protocol.min_sample_rate, 8000u);
    EXPECT_EQ(hub.protocol.max_sample_rate, 48000u);
    EXPECT_EQ(hub.protocol.max_channels, 2u);
    EXPECT_EQ(hub.protocol.audio_chunks_per_minute, 1200u);
    EXPECT_EQ(hub.protocol.control_messages_per_minute, 60u);
    EXPECT_EQ(hub.protocol.rate_limit_burst, 10u);
    EXPECT_EQ(hub.turn.max_turn_audio_bytes, 1024u * 1024u);
    EXPECT_EQ(hub.turn.turn_history, 32u);
    EXPECT_EQ(hub.store.max_messages, 2000u);
    EXPECT_EQ(hub.store.max_closed_sessions, 32u);
    EXPECT_EQ(hub.provider.kind, "mock");
    EXPECT_EQ(hub.server.ws_path, "/ws");
    EXPECT_EQ(hub.network.hostname, "parley-hub");
}
