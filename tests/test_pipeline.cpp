#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include "pipeline.hpp"
#include "fake_camera.hpp"

using namespace std::chrono_literals;

TEST(PipelineConfigTest, DefaultValues) {
    PipelineConfig config;
    EXPECT_EQ(config.target_fps, 30);
    EXPECT_EQ(config.fps_window, 10u);
    EXPECT_EQ(config.jpeg_quality, 80);
    EXPECT_GT(config.max_capture_failures, 0);
}

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        stats = std::make_shared<FakeCameraStats>();
        source = std::make_unique<FrameSource>(fast_camera_config(),
                                               std::make_unique<FakeCameraDriver>(stats));
        cache = std::make_unique<EncodeCache>(80, 3, &metrics);

        config.max_capture_failures = 3;
        config.camera_retry_ms = 0;
        config.capture_retry_ms = 0;
        pipeline = std::make_unique<Pipeline>(config, *source, enhancer, light, nv, processing,
                                              store, *cache, fps, metrics);
    }

    std::shared_ptr<FakeCameraStats> stats;
    std::unique_ptr<FrameSource> source;
    Enhancer enhancer;
    LowLightDetector light;
    NightVision nv;
    ProcessingState processing;
    LatestFrameStore store;
    MetricsRegistry metrics;
    FpsTracker fps;
    std::unique_ptr<EncodeCache> cache;
    PipelineConfig config;
    std::unique_ptr<Pipeline> pipeline;
};

TEST_F(PipelineTest, StepOpensCameraAndPublishes) {
    EXPECT_EQ(pipeline->state(), CaptureState::AwaitingCamera);
    ASSERT_TRUE(pipeline->step());

    EXPECT_EQ(pipeline->state(), CaptureState::Capturing);
    EXPECT_TRUE(source->ready());
    EXPECT_TRUE(store.has_frame());
    EXPECT_EQ(cache->sequence(), 1u);
    EXPECT_FALSE(cache->get().empty());
    EXPECT_EQ(metrics.frames_total(), 1u);
    EXPECT_TRUE(light.seeded());
}

TEST_F(PipelineTest, StoreAndCacheAdvanceTogether) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(pipeline->step());
    }
    EXPECT_EQ(store.published(), 5u);
    EXPECT_EQ(cache->sequence(), 5u);
    EXPECT_EQ(fps.samples(), 5u);
    EXPECT_EQ(store.latest().size(), make_test_frame().size());
}

TEST_F(PipelineTest, InvalidFramesNeverReachCache) {
    ASSERT_TRUE(pipeline->step());
    const uint64_t seq = cache->sequence();
    auto before = cache->get();
    const double brightness = light.brightness();

    stats->black_frames = true;
    for (int i = 0; i < 4; ++i) {
        EXPECT_FALSE(pipeline->step());
    }
    EXPECT_DOUBLE_EQ(light.brightness(), brightness);
    EXPECT_EQ(cache->sequence(), seq);
    EXPECT_EQ(cache->get().bytes, before.bytes);
    EXPECT_EQ(store.published(), 1u);
    EXPECT_EQ(metrics.invalid_total(), 4u);
    // Still capturing; a black frame is not a camera failure
    EXPECT_EQ(pipeline->state(), CaptureState::Capturing);
}

TEST_F(PipelineTest, RepeatedCaptureFailuresReleaseCamera) {
    ASSERT_TRUE(pipeline->step());
    stats->fail_capture = true;

    EXPECT_FALSE(pipeline->step());
    EXPECT_FALSE(pipeline->step());
    EXPECT_TRUE(source->ready());
    EXPECT_FALSE(pipeline->step());

    EXPECT_FALSE(source->ready());
    EXPECT_EQ(stats->live_handles.load(), 0);
    EXPECT_EQ(pipeline->state(), CaptureState::AwaitingCamera);

    // Camera comes back on the next cycle
    stats->fail_capture = false;
    EXPECT_TRUE(pipeline->step());
    EXPECT_EQ(stats->live_handles.load(), 1);
}

TEST_F(PipelineTest, CameraUnavailableKeepsWaiting) {
    stats->fail_opens = 100;
    EXPECT_FALSE(pipeline->step());
    EXPECT_EQ(pipeline->state(), CaptureState::AwaitingCamera);
    EXPECT_FALSE(store.has_frame());
    EXPECT_TRUE(cache->get().empty());
}

TEST_F(PipelineTest, UsesCurrentProcessingConfig) {
    processing.set(ProcessingConfig{0, true});
    ASSERT_TRUE(pipeline->step());
    processing.set(ProcessingConfig{2, false});
    ASSERT_TRUE(pipeline->step());
    EXPECT_EQ(cache->sequence(), 2u);
}

TEST_F(PipelineTest, StartStop) {
    pipeline->start();
    EXPECT_TRUE(pipeline->running());

    auto deadline = Clock::now() + 2s;
    while (cache->sequence() < 3 && Clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    pipeline->stop();

    EXPECT_FALSE(pipeline->running());
    EXPECT_GE(cache->sequence(), 3u);
}

TEST_F(PipelineTest, StopIsIdempotent) {
    pipeline->stop();
    pipeline->start();
    pipeline->stop();
    pipeline->stop();
    EXPECT_FALSE(pipeline->running());
}
