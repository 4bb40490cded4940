#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <spdlog/spdlog.h>
#include "util.hpp"

class ConfigLoadTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        test_dir = std::filesystem::temp_directory_path() / "nightstream_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string createTestConfig(const std::string& filename, const std::string& content) {
        std::ofstream file(test_dir / filename);
        file << content;
        file.close();
        return (test_dir / filename).string();
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigLoadTest, CameraAndServer) {
    const std::string content = R"(
camera:
  uri: "rtsp://10.0.0.5/stream"
  width: 1280
  height: 720
  fps: 25
  warmup_frames: 6
  saturation: 0.55

server:
  host: "127.0.0.1"
  port: 9000
)";

    AppConfig config = load_config(createTestConfig("camera.yaml", content));

    EXPECT_EQ(config.camera.uri, "rtsp://10.0.0.5/stream");
    EXPECT_EQ(config.camera.width, 1280);
    EXPECT_EQ(config.camera.height, 720);
    EXPECT_EQ(config.camera.fps, 25);
    EXPECT_EQ(config.camera.warmup_frames, 6);
    EXPECT_DOUBLE_EQ(config.camera.saturation, 0.55);
    EXPECT_DOUBLE_EQ(config.camera.sharpness, -1.0);  // untouched
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 9000);
}

TEST_F(ConfigLoadTest, ControllerAndNightVision) {
    const std::string content = R"(
controller:
  adjust_interval_ms: 1500
  min_fps: 20
  night_critical_fps: 12

night_vision:
  enabled: false
  auto_mode: false
  green_mode: true
  strength: 0.75
  light_threshold: 65
  debounce_ms: 1000
)";

    AppConfig config = load_config(createTestConfig("nv.yaml", content));

    EXPECT_EQ(config.controller.adjust_interval_ms, 1500);
    EXPECT_DOUBLE_EQ(config.controller.min_fps, 20.0);
    EXPECT_DOUBLE_EQ(config.controller.max_fps, 30.0);
    EXPECT_DOUBLE_EQ(config.controller.night_critical_fps, 12.0);

    EXPECT_FALSE(config.night_vision.enabled);
    EXPECT_FALSE(config.night_vision.auto_mode);
    EXPECT_TRUE(config.night_vision.green_mode);
    EXPECT_DOUBLE_EQ(config.night_vision.strength, 0.75);
    EXPECT_DOUBLE_EQ(config.night_vision.light_threshold, 65.0);
    EXPECT_EQ(config.night_vision.debounce_ms, 1000);
}

TEST_F(ConfigLoadTest, PipelineStreamHealthLogging) {
    const std::string content = R"(
pipeline:
  target_fps: 24
  jpeg_quality: 85
  max_capture_failures: 4

enhancer:
  red_gain: 1.2
  brightness_lift: 10

stream:
  max_clients: 3
  reduced_stream_fps: 10

health:
  check_interval_ms: 10000
  frame_timeout_ms: 3000

logging:
  level: "debug"
)";

    AppConfig config = load_config(createTestConfig("misc.yaml", content));

    EXPECT_EQ(config.pipeline.target_fps, 24);
    EXPECT_EQ(config.pipeline.jpeg_quality, 85);
    EXPECT_EQ(config.pipeline.max_capture_failures, 4);
    EXPECT_DOUBLE_EQ(config.enhancer.red_gain, 1.2);
    EXPECT_DOUBLE_EQ(config.enhancer.blue_gain, 0.75);
    EXPECT_DOUBLE_EQ(config.enhancer.brightness_lift, 10.0);
    EXPECT_EQ(config.stream.max_clients, 3);
    EXPECT_EQ(config.stream.stream_fps, 30);
    EXPECT_EQ(config.stream.reduced_stream_fps, 10);
    EXPECT_EQ(config.health.check_interval_ms, 10000);
    EXPECT_EQ(config.health.frame_timeout_ms, 3000);
    EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ConfigLoadTest, EmptyConfig) {
    AppConfig config = load_config(createTestConfig("empty.yaml", "{}"));

    EXPECT_EQ(config.camera.uri, "0");
    EXPECT_EQ(config.camera.width, 640);
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.stream.max_clients, 5);
    EXPECT_DOUBLE_EQ(config.night_vision.strength, 0.5);
    EXPECT_EQ(config.log_level, "info");
}

TEST_F(ConfigLoadTest, InvalidFile) {
    EXPECT_THROW(load_config("/nonexistent/path/config.yaml"), std::exception);
}

TEST_F(ConfigLoadTest, MalformedYAML) {
    const std::string malformed_content = R"(
camera:
  uri: "0
  width: [invalid
)";

    EXPECT_THROW(load_config(createTestConfig("malformed.yaml", malformed_content)),
                 std::exception);
}

TEST_F(ConfigLoadTest, WrongValueType) {
    const std::string content = R"(
server:
  port: "not-a-port"
)";
    EXPECT_THROW(load_config(createTestConfig("bad_type.yaml", content)), std::exception);
}

TEST_F(ConfigLoadTest, SampleConfigParses) {
    const std::filesystem::path sample = std::filesystem::path(NIGHTSTREAM_SOURCE_DIR) / "configs" / "config.yaml";
    if (!std::filesystem::exists(sample)) {
        GTEST_SKIP() << "sample config not found at " << sample;
    }
    AppConfig config = load_config(sample.string());
    EXPECT_EQ(config.port, 8000);
    EXPECT_DOUBLE_EQ(config.camera.saturation, 0.55);
}

TEST(LogLevelTest, AppliesKnownLevels) {
    auto saved = spdlog::get_level();

    apply_log_level("debug");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    apply_log_level("error");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
    apply_log_level("verbose-ish");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);

    spdlog::set_level(saved);
}
