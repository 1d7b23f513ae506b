#include <gtest/gtest.h>

#include "prism/core/Profiler.hpp"

using namespace prism;

TEST(SampleRing, RollingWindowStats)
{
    core::SampleRing<3> ring;
    EXPECT_FLOAT_EQ(ring.Average(), 0.0F);
    EXPECT_FLOAT_EQ(ring.Latest(), 0.0F);
    EXPECT_FLOAT_EQ(ring.Max(), 0.0F);

    ring.Push(1.0F);
    ring.Push(2.0F);
    ring.Push(3.0F);
    ring.Push(7.0F); // evicts 1.0

    EXPECT_EQ(ring.Count(), 3u);
    EXPECT_FLOAT_EQ(ring.Latest(), 7.0F);
    EXPECT_FLOAT_EQ(ring.Average(), 4.0F);
    EXPECT_FLOAT_EQ(ring.Max(), 7.0F);
    EXPECT_FLOAT_EQ(ring.Min(), 2.0F);
}

TEST(Profiler, CountersResetEachFrame)
{
    core::Profiler& profiler = core::Profiler::Instance();
    profiler.Reset();

    profiler.BeginFrame();
    profiler.RecordDrawCall(24, 12);
    profiler.RecordDrawCall(3, 1);
    profiler.RecordProgramBind();
    profiler.RecordCacheLookup(true);
    profiler.RecordCacheLookup(false);
    profiler.RecordSkippedObject();
    {
        PROFILE_SCOPE("Render");
    }
    profiler.EndFrame();

    const core::FrameStats& stats = profiler.Stats();
    EXPECT_EQ(stats.drawCalls, 2u);
    EXPECT_EQ(stats.verticesSubmitted, 27u);
    EXPECT_EQ(stats.trianglesSubmitted, 13u);
    EXPECT_EQ(stats.programBinds, 1u);
    EXPECT_EQ(stats.meshCacheHits, 1u);
    EXPECT_EQ(stats.meshCacheMisses, 1u);
    EXPECT_EQ(stats.objectsSkipped, 1u);

    const core::SectionTiming* render = profiler.FindSection("Render");
    ASSERT_NE(render, nullptr);
    EXPECT_EQ(render->calls, 1u);
    EXPECT_EQ(render->history.Count(), 1u);
    EXPECT_EQ(profiler.FrameHistory().Count(), 1u);

    profiler.BeginFrame();
    EXPECT_EQ(profiler.Stats().drawCalls, 0u);
    EXPECT_EQ(profiler.Stats().objectsSkipped, 0u);
    EXPECT_EQ(profiler.FindSection("Render")->calls, 0u);
    profiler.Reset();
}

TEST(Profiler, RepeatedScopesAccumulate)
{
    core::Profiler& profiler = core::Profiler::Instance();
    profiler.Reset();

    profiler.BeginFrame();
    profiler.RecordSection("Swap", 1.5F);
    profiler.RecordSection("Swap", 2.0F);
    profiler.EndFrame();

    const core::SectionTiming* swap = profiler.FindSection("Swap");
    ASSERT_NE(swap, nullptr);
    EXPECT_EQ(swap->calls, 2u);
    EXPECT_FLOAT_EQ(swap->frameMs, 3.5F);
    EXPECT_EQ(profiler.Sections().size(), 1u);
    EXPECT_EQ(profiler.FindSection("Missing"), nullptr);
    profiler.Reset();
}

TEST(Profiler, DisabledSkipsSections)
{
    core::Profiler& profiler = core::Profiler::Instance();
    profiler.Reset();
    profiler.SetEnabled(false);
    {
        PROFILE_SCOPE("Ignored");
    }
    EXPECT_TRUE(profiler.Sections().empty());
    profiler.SetEnabled(true);
}
