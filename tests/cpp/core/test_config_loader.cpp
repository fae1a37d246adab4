/**
 * @file test_config_loader.cpp
 * @brief Unit tests for the worker config loader (JSON configuration)
 */

#include "core/config_loader.h"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <gtest/gtest.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace rtsub;

class ConfigLoaderTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    fs::path testConfigPath;

    void SetUp() override {
        // Unique temp directory per test process so parallel ctest runs do not collide
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "unknown_test";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("realtime_subtitle_test_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
        testConfigPath = tempDir / "test_config.json";

        const char* key = std::getenv("OPENAI_API_KEY");
        if (key) {
            savedKey_ = key;
        }
        unsetenv("OPENAI_API_KEY");
    }

    void TearDown() override {
        fs::remove_all(tempDir);
        if (savedKey_) {
            setenv("OPENAI_API_KEY", savedKey_->c_str(), 1);
        } else {
            unsetenv("OPENAI_API_KEY");
        }
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(testConfigPath);
        file << content;
        file.close();
    }

   private:
    std::optional<std::string> savedKey_;
};

// ============================================================
// Defaults
// ============================================================

TEST_F(ConfigLoaderTest, LoadNonExistentFileReturnsFalse) {
    WorkerConfig config;
    EXPECT_FALSE(loadWorkerConfig("/nonexistent/path/config.json", config, false));
}

TEST_F(ConfigLoaderTest, LoadNonExistentFileUsesDefaults) {
    WorkerConfig config;
    config.asrServer = "http://stale";
    loadWorkerConfig("/nonexistent/path/config.json", config, false);

    EXPECT_EQ(config.asrServer, "http://localhost:8000");
    EXPECT_EQ(config.asrTimeoutMs, 45000);
    EXPECT_EQ(config.source, SourceKind::Monitor);
    EXPECT_EQ(config.direction, "en→zh");
    EXPECT_EQ(config.translation.model, "gpt-4o-mini");
    EXPECT_EQ(config.translation.maxTokens, 400);
    EXPECT_FLOAT_EQ(config.translation.temperature, 0.1f);
    EXPECT_EQ(config.translation.debounceMs, 400);
    EXPECT_FLOAT_EQ(config.vad.threshold, 0.5f);
    EXPECT_EQ(config.vad.silenceFrames, 14);
    EXPECT_EQ(config.vad.maxBufferFrames, 222);
    EXPECT_EQ(config.ipc.eventsEndpoint, "ipc:///tmp/realtime_subtitle_events.sock");
    EXPECT_EQ(config.ipc.commandsEndpoint, "ipc:///tmp/realtime_subtitle_commands.sock");
    EXPECT_EQ(config.openccConfig, "s2twp.json");
    EXPECT_TRUE(config.translation.apiKey.empty());
}

TEST_F(ConfigLoaderTest, LoadEmptyJsonReturnsTrue) {
    writeConfig("{}");
    WorkerConfig config;
    EXPECT_TRUE(loadWorkerConfig(testConfigPath, config, false));
    EXPECT_EQ(config.asrServer, "http://localhost:8000");
}

TEST_F(ConfigLoaderTest, InvalidJsonReturnsFalseWithDefaults) {
    writeConfig("{ \"asr_server\": \"http://x\", ");
    WorkerConfig config;
    EXPECT_FALSE(loadWorkerConfig(testConfigPath, config, false));
    EXPECT_EQ(config.asrServer, "http://localhost:8000");
}

// ============================================================
// Values
// ============================================================

TEST_F(ConfigLoaderTest, LoadsTopLevelKeys) {
    writeConfig(R"({
        "asr_server": "http://10.0.0.5:9000",
        "asr_timeout_ms": 20000,
        "source": "mic",
        "monitor_device": "alsa_output.usb.monitor",
        "mic_device": "hw:1,0",
        "mic_sample_rate": 44100,
        "direction": "ja→en",
        "openai_api_key": "sk-test",
        "translation_model": "gpt-4o",
        "opencc_config": "s2t.json"
    })");
    WorkerConfig config;
    ASSERT_TRUE(loadWorkerConfig(testConfigPath, config, false));

    EXPECT_EQ(config.asrServer, "http://10.0.0.5:9000");
    EXPECT_EQ(config.asrTimeoutMs, 20000);
    EXPECT_EQ(config.source, SourceKind::Mic);
    EXPECT_EQ(config.monitorDevice, "alsa_output.usb.monitor");
    EXPECT_EQ(config.micDevice, "hw:1,0");
    EXPECT_EQ(config.micSampleRate, 44100);
    EXPECT_EQ(config.direction, "ja→en");
    EXPECT_EQ(config.translation.apiKey, "sk-test");
    EXPECT_EQ(config.translation.model, "gpt-4o");
    EXPECT_EQ(config.openccConfig, "s2t.json");
}

TEST_F(ConfigLoaderTest, LoadsNestedSections) {
    writeConfig(R"({
        "translation": {"endpoint": "http://llm.local/v1/chat/completions", "timeout_ms": 5000,
                        "max_tokens": 200, "temperature": 0.3, "debounce_ms": 250},
        "vad": {"model_path": "/opt/vad.onnx", "threshold": 0.6, "silence_frames": 10,
                "max_buffer_frames": 100, "intra_op_threads": 2},
        "ipc": {"events_endpoint": "ipc:///tmp/e.sock", "commands_endpoint": "ipc:///tmp/c.sock",
                "command_poll_ms": 50}
    })");
    WorkerConfig config;
    ASSERT_TRUE(loadWorkerConfig(testConfigPath, config, false));

    EXPECT_EQ(config.translation.endpoint, "http://llm.local/v1/chat/completions");
    EXPECT_EQ(config.translation.timeoutMs, 5000);
    EXPECT_EQ(config.translation.maxTokens, 200);
    EXPECT_FLOAT_EQ(config.translation.temperature, 0.3f);
    EXPECT_EQ(config.translation.debounceMs, 250);
    EXPECT_EQ(config.vad.modelPath, "/opt/vad.onnx");
    EXPECT_FLOAT_EQ(config.vad.threshold, 0.6f);
    EXPECT_EQ(config.vad.silenceFrames, 10);
    EXPECT_EQ(config.vad.maxBufferFrames, 100);
    EXPECT_EQ(config.vad.intraOpThreads, 2);
    EXPECT_EQ(config.ipc.eventsEndpoint, "ipc:///tmp/e.sock");
    EXPECT_EQ(config.ipc.commandsEndpoint, "ipc:///tmp/c.sock");
    EXPECT_EQ(config.ipc.commandPollMs, 50);
}

TEST_F(ConfigLoaderTest, WrongTypesAreIgnored) {
    writeConfig(R"({"asr_server": 42, "asr_timeout_ms": "fast", "vad": {"threshold": "high"},
                    "translation": "not-an-object"})");
    WorkerConfig config;
    ASSERT_TRUE(loadWorkerConfig(testConfigPath, config, false));
    EXPECT_EQ(config.asrServer, "http://localhost:8000");
    EXPECT_EQ(config.asrTimeoutMs, 45000);
    EXPECT_FLOAT_EQ(config.vad.threshold, 0.5f);
    EXPECT_EQ(config.translation.maxTokens, 400);
}

TEST_F(ConfigLoaderTest, ValuesAreClamped) {
    writeConfig(R"({
        "asr_timeout_ms": 1, "mic_sample_rate": 1000000,
        "translation": {"timeout_ms": 999999, "max_tokens": 1, "temperature": 5.0, "debounce_ms": -3},
        "vad": {"threshold": 1.5, "silence_frames": 0, "max_buffer_frames": -1},
        "ipc": {"command_poll_ms": 0}
    })");
    WorkerConfig config;
    ASSERT_TRUE(loadWorkerConfig(testConfigPath, config, false));

    EXPECT_EQ(config.asrTimeoutMs, 1000);
    EXPECT_EQ(config.micSampleRate, 192000);
    EXPECT_EQ(config.translation.timeoutMs, 300000);
    EXPECT_EQ(config.translation.maxTokens, 16);
    EXPECT_FLOAT_EQ(config.translation.temperature, 2.0f);
    EXPECT_EQ(config.translation.debounceMs, 0);
    EXPECT_FLOAT_EQ(config.vad.threshold, 0.99f);
    EXPECT_EQ(config.vad.silenceFrames, 1);
    EXPECT_EQ(config.vad.maxBufferFrames, 1);
    EXPECT_EQ(config.ipc.commandPollMs, 10);
}

TEST_F(ConfigLoaderTest, MalformedDirectionFallsBackToDefault) {
    writeConfig(R"({"direction": "english to chinese"})");
    WorkerConfig config;
    ASSERT_TRUE(loadWorkerConfig(testConfigPath, config, false));
    EXPECT_EQ(config.direction, "en→zh");
}

TEST_F(ConfigLoaderTest, UnknownSourceFallsBackToMonitor) {
    writeConfig(R"({"source": "line-in"})");
    WorkerConfig config;
    ASSERT_TRUE(loadWorkerConfig(testConfigPath, config, false));
    EXPECT_EQ(config.source, SourceKind::Monitor);
}

// ============================================================
// API key fallback
// ============================================================

TEST_F(ConfigLoaderTest, EmptyApiKeyFallsBackToEnvironment) {
    setenv("OPENAI_API_KEY", "sk-from-env", 1);
    writeConfig(R"({"openai_api_key": ""})");
    WorkerConfig config;
    ASSERT_TRUE(loadWorkerConfig(testConfigPath, config, false));
    EXPECT_EQ(config.translation.apiKey, "sk-from-env");
}

TEST_F(ConfigLoaderTest, ConfiguredApiKeyWinsOverEnvironment) {
    setenv("OPENAI_API_KEY", "sk-from-env", 1);
    writeConfig(R"({"openai_api_key": "sk-config"})");
    WorkerConfig config;
    ASSERT_TRUE(loadWorkerConfig(testConfigPath, config, false));
    EXPECT_EQ(config.translation.apiKey, "sk-config");
}

TEST_F(ConfigLoaderTest, MissingFileStillReadsEnvironmentKey) {
    setenv("OPENAI_API_KEY", "sk-from-env", 1);
    WorkerConfig config;
    EXPECT_FALSE(loadWorkerConfig(tempDir / "missing.json", config, false));
    EXPECT_EQ(config.translation.apiKey, "sk-from-env");
}

// ============================================================
// Source kind helpers
// ============================================================

TEST(SourceKindTest, ParseAndFormat) {
    EXPECT_EQ(parseSourceKind("mic"), SourceKind::Mic);
    EXPECT_EQ(parseSourceKind("Microphone"), SourceKind::Mic);
    EXPECT_EQ(parseSourceKind("monitor"), SourceKind::Monitor);
    EXPECT_EQ(parseSourceKind("bogus"), SourceKind::Monitor);
    EXPECT_STREQ(sourceKindToString(SourceKind::Mic), "mic");
    EXPECT_STREQ(sourceKindToString(SourceKind::Monitor), "monitor");
    EXPECT_EQ(otherSourceKind(SourceKind::Mic), SourceKind::Monitor);
    EXPECT_EQ(otherSourceKind(SourceKind::Monitor), SourceKind::Mic);
}
