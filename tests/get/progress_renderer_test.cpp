#include "sendme/get/progress_renderer.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace std::chrono_literals;
using namespace sendme::get;

TEST(ProgressRendererTest, HumanBytes) {
    EXPECT_EQ(human_bytes(0), "0 B");
    EXPECT_EQ(human_bytes(1023), "1023 B");
    EXPECT_EQ(human_bytes(1024), "1.00 KiB");
    EXPECT_EQ(human_bytes(1536), "1.50 KiB");
    EXPECT_EQ(human_bytes(5ULL * 1024 * 1024 * 1024), "5.00 GiB");
}

TEST(ProgressRendererTest, HumanDuration) {
    EXPECT_EQ(human_duration(0s), "0 seconds");
    EXPECT_EQ(human_duration(1s), "1 second");
    EXPECT_EQ(human_duration(90s), "1 minute");
    EXPECT_EQ(human_duration(2h), "2 hours");
}

TEST(ProgressRendererTest, SummaryLine) {
    TransferSummary summary{2048, 2s, 1024};
    EXPECT_EQ(format_summary(summary), "Transferred 2.00 KiB in 2 seconds, 1.00 KiB/s");
}

TEST(ProgressRendererTest, PhaseMessages) {
    ProgressState state;
    EXPECT_EQ(ProgressRenderer::phase_message(state), "[1/3] Connecting ...");

    state.phase = TransferPhase::Requesting;
    EXPECT_EQ(ProgressRenderer::phase_message(state), "[2/3] Requesting ...");

    state.phase = TransferPhase::ReceivingCollection;
    state.overall = Counter{true, 0, 4};
    EXPECT_EQ(ProgressRenderer::phase_message(state), "[3/3] Downloading 4 blob(s)");
}

TEST(ProgressRendererTest, Bar) {
    EXPECT_EQ(ProgressRenderer::bar(0, 10, 10), ">---------");
    EXPECT_EQ(ProgressRenderer::bar(5, 10, 10), "#####>----");
    EXPECT_EQ(ProgressRenderer::bar(10, 10, 10), "##########");
    EXPECT_EQ(ProgressRenderer::bar(20, 10, 4), "####");
}
