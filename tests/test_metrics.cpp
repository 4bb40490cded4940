#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include "metrics.hpp"

using namespace std::chrono_literals;

class RollingHistTest : public ::testing::Test {
protected:
    void SetUp() override {
        hist = std::make_unique<RollingHist>(5);  // Small capacity for testing
    }

    std::unique_ptr<RollingHist> hist;
};

TEST_F(RollingHistTest, EmptyHistogram) {
    EXPECT_EQ(hist->size(), 0);
    EXPECT_DOUBLE_EQ(hist->perc(50.0), 0.0);
}

TEST_F(RollingHistTest, CapacityOverflow) {
    for (int i = 1; i <= 7; ++i) {
        hist->add(static_cast<double>(i));
    }

    EXPECT_EQ(hist->size(), 5);
    // Oldest two dropped
    EXPECT_DOUBLE_EQ(hist->perc(0.0), 3.0);
    EXPECT_DOUBLE_EQ(hist->perc(50.0), 5.0);
    EXPECT_DOUBLE_EQ(hist->perc(100.0), 7.0);
}

TEST_F(RollingHistTest, PercentileCalculation) {
    for (int i = 1; i <= 5; ++i) {
        hist->add(static_cast<double>(i * 10));
    }

    EXPECT_DOUBLE_EQ(hist->perc(25.0), 20.0);
    EXPECT_DOUBLE_EQ(hist->perc(75.0), 40.0);
}

TEST_F(RollingHistTest, ThreadSafety) {
    const int num_threads = 4;
    const int values_per_thread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t, values_per_thread]() {
            for (int i = 0; i < values_per_thread; ++i) {
                hist->add(static_cast<double>(t * values_per_thread + i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(hist->size(), 5);
    EXPECT_GE(hist->perc(95.0), hist->perc(50.0));
}

class FpsTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tracker = std::make_unique<FpsTracker>(10);
        t0 = Clock::now();
    }

    std::unique_ptr<FpsTracker> tracker;
    TimePoint t0;
};

TEST_F(FpsTrackerTest, NeedsTwoSamples) {
    auto s = tracker->stats();
    EXPECT_DOUBLE_EQ(s.current, 0.0);

    tracker->tick(t0);
    s = tracker->stats();
    EXPECT_DOUBLE_EQ(s.current, 0.0);
    EXPECT_DOUBLE_EQ(s.avg, 0.0);
}

TEST_F(FpsTrackerTest, SteadyRate) {
    for (int i = 0; i < 5; ++i) {
        tracker->tick(t0 + i * 40ms);  // 25 fps
    }
    auto s = tracker->stats();
    EXPECT_NEAR(s.current, 25.0, 1e-6);
    EXPECT_NEAR(s.min, 25.0, 1e-6);
    EXPECT_NEAR(s.max, 25.0, 1e-6);
    EXPECT_NEAR(s.avg, 25.0, 1e-6);
}

TEST_F(FpsTrackerTest, MinCurrentMaxOrdering) {
    tracker->tick(t0);
    tracker->tick(t0 + 20ms);   // 50 fps
    tracker->tick(t0 + 120ms);  // 10 fps
    tracker->tick(t0 + 160ms);  // 25 fps

    auto s = tracker->stats();
    EXPECT_NEAR(s.current, 3.0 / 0.160, 1e-6);
    EXPECT_NEAR(s.min, 10.0, 1e-6);
    EXPECT_NEAR(s.max, 50.0, 1e-6);
    EXPECT_NEAR(s.avg, (50.0 + 10.0 + 25.0) / 3.0, 1e-6);
    EXPECT_LE(s.min, s.avg);
    EXPECT_LE(s.avg, s.max);
    EXPECT_LE(s.min, s.current);
    EXPECT_LE(s.current, s.max);
}

TEST_F(FpsTrackerTest, SingleLateFrameBarelyMovesCurrent) {
    // 30 fps capture with one 45 ms hiccup
    TimePoint t = t0;
    tracker->tick(t);
    for (int i = 1; i < 10; ++i) {
        t += (i == 5) ? 45ms : 33ms;
        tracker->tick(t);
    }

    auto s = tracker->stats();
    EXPECT_NEAR(s.current, 9.0 / 0.309, 1e-6);
    EXPECT_GT(s.current, 25.0);
    EXPECT_NEAR(s.min, 1.0 / 0.045, 1e-6);
}

TEST_F(FpsTrackerTest, WindowDropsOldest) {
    FpsTracker small(3);
    small.tick(t0);
    small.tick(t0 + 500ms);  // 2 fps, will fall out
    small.tick(t0 + 600ms);
    small.tick(t0 + 700ms);

    EXPECT_EQ(small.samples(), 3);
    auto s = small.stats();
    EXPECT_NEAR(s.min, 10.0, 1e-6);
    EXPECT_NEAR(s.avg, 10.0, 1e-6);
}

TEST_F(FpsTrackerTest, Reset) {
    tracker->tick(t0);
    tracker->tick(t0 + 33ms);
    tracker->reset();
    EXPECT_EQ(tracker->samples(), 0);
    EXPECT_DOUBLE_EQ(tracker->stats().current, 0.0);
}

class MetricsRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_unique<MetricsRegistry>();
    }

    std::unique_ptr<MetricsRegistry> registry;
};

TEST_F(MetricsRegistryTest, InitialState) {
    EXPECT_EQ(registry->frames_total(), 0);
    EXPECT_EQ(registry->invalid_total(), 0);
    EXPECT_EQ(registry->encode_failures_total(), 0);
    EXPECT_EQ(registry->camera_resets_total(), 0);
    EXPECT_EQ(registry->rejected_clients_total(), 0);
}

TEST_F(MetricsRegistryTest, InvalidRate) {
    for (int i = 0; i < 8; ++i) {
        registry->inc_frame();
    }
    registry->inc_invalid();
    registry->inc_invalid();

    auto snapshot = registry->snapshot(FpsStats{});
    EXPECT_DOUBLE_EQ(snapshot.invalid_rate, 0.2);
}

TEST_F(MetricsRegistryTest, LatencyQuantiles) {
    registry->add_enhance(4.0);
    registry->add_encode(2.5);

    auto snapshot = registry->snapshot(FpsStats{30, 28, 31, 29.5});
    EXPECT_DOUBLE_EQ(snapshot.enhance_p50, 4.0);
    EXPECT_DOUBLE_EQ(snapshot.encode_p50, 2.5);
    EXPECT_DOUBLE_EQ(snapshot.fps.current, 30.0);
}

TEST_F(MetricsRegistryTest, PrometheusOutput) {
    registry->inc_frame();
    registry->inc_reset();
    registry->inc_rejected();

    std::string text = registry->prometheus_text(registry->snapshot(FpsStats{}));
    EXPECT_NE(text.find("nightstream_frames_captured_total 1"), std::string::npos);
    EXPECT_NE(text.find("nightstream_camera_resets_total 1"), std::string::npos);
    EXPECT_NE(text.find("nightstream_clients_rejected_total 1"), std::string::npos);
    EXPECT_NE(text.find("nightstream_enhance_ms{quantile=\"0.95\"}"), std::string::npos);
    EXPECT_NE(text.find("nightstream_fps_current"), std::string::npos);
}

TEST_F(MetricsRegistryTest, ConcurrentAccess) {
    const int num_threads = 4;
    const int operations_per_thread = 1000;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, operations_per_thread]() {
            for (int i = 0; i < operations_per_thread; ++i) {
                registry->add_enhance(1.0);
                registry->inc_frame();
                if (i % 10 == 0) {
                    registry->inc_invalid();
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry->frames_total(), num_threads * operations_per_thread);
    EXPECT_EQ(registry->invalid_total(), num_threads * (operations_per_thread / 10));
}
