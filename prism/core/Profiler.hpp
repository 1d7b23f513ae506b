#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace prism::core
{

/// Rolling window of the last N samples with a running sum.
template <std::size_t N>
class SampleRing
{
public:
    void Push(float sample)
    {
        if (m_count == N)
        {
            m_sum -= m_samples[m_next];
        }
        else
        {
            ++m_count;
        }
        m_samples[m_next] = sample;
        m_sum += sample;
        m_next = (m_next + 1) % N;
    }

    [[nodiscard]] float Average() const { return m_count == 0 ? 0.0F : m_sum / static_cast<float>(m_count); }

    [[nodiscard]] float Max() const
    {
        return m_count == 0 ? 0.0F : *std::max_element(m_samples.begin(), m_samples.begin() + m_count);
    }

    [[nodiscard]] float Min() const
    {
        return m_count == 0 ? 0.0F : *std::min_element(m_samples.begin(), m_samples.begin() + m_count);
    }

    [[nodiscard]] float Latest() const { return m_count == 0 ? 0.0F : m_samples[(m_next + N - 1) % N]; }
    [[nodiscard]] std::size_t Count() const { return m_count; }

private:
    std::array<float, N> m_samples{};
    std::size_t m_next = 0;
    std::size_t m_count = 0;
    float m_sum = 0.0F;
};

inline constexpr std::size_t kProfilerHistory = 120;

struct SectionTiming
{
    std::string name;
    SampleRing<kProfilerHistory> history;
    float frameMs = 0.0F;
    std::uint32_t calls = 0; // this frame
};

/// Timing and render counters for the last completed frame.
struct FrameStats
{
    float frameMs = 0.0F;
    float fps = 0.0F;
    float avgFps = 0.0F;
    float worstFrameMs = 0.0F;
    float renderMs = 0.0F;

    std::uint32_t drawCalls = 0;
    std::uint32_t verticesSubmitted = 0;
    std::uint32_t trianglesSubmitted = 0;
    std::uint32_t programBinds = 0;
    std::uint32_t meshCacheHits = 0;
    std::uint32_t meshCacheMisses = 0;
    std::uint32_t objectsSkipped = 0;
};

/// Process-wide CPU profiler fed by the renderer and ScopedTimer.
class Profiler
{
public:
    using Clock = std::chrono::steady_clock;

    static Profiler& Instance()
    {
        static Profiler s_instance;
        return s_instance;
    }

    void BeginFrame();
    void EndFrame();

    /// Adds |elapsedMs| to the named section for the current frame.
    void RecordSection(std::string_view name, float elapsedMs);

    void RecordDrawCall(std::uint32_t vertices, std::uint32_t triangles = 0);
    void RecordProgramBind();
    void RecordCacheLookup(bool hit);
    void RecordSkippedObject();

    [[nodiscard]] const FrameStats& Stats() const { return m_stats; }
    [[nodiscard]] const std::vector<SectionTiming>& Sections() const { return m_sections; }
    [[nodiscard]] const SectionTiming* FindSection(std::string_view name) const;
    [[nodiscard]] const SampleRing<kProfilerHistory>& FrameHistory() const { return m_frameHistory; }

    void SetEnabled(bool enabled) { m_enabled = enabled; }
    [[nodiscard]] bool IsEnabled() const { return m_enabled; }

    void Reset();

private:
    Profiler() = default;

    bool m_enabled = true;
    Clock::time_point m_frameStart{};
    std::vector<SectionTiming> m_sections;
    FrameStats m_stats{};
    SampleRing<kProfilerHistory> m_frameHistory;
};

/// Measures its own lifetime and reports it as a profiler section.
class ScopedTimer
{
public:
    explicit ScopedTimer(std::string_view name)
        : m_name(name)
        , m_start(Profiler::Clock::now())
    {
    }

    ~ScopedTimer()
    {
        const float elapsedMs = std::chrono::duration<float, std::milli>(Profiler::Clock::now() - m_start).count();
        Profiler::Instance().RecordSection(m_name, elapsedMs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string_view m_name;
    Profiler::Clock::time_point m_start;
};

} // namespace prism::core

#define PRISM_PROFILE_CONCAT_INNER(a, b) a##b
#define PRISM_PROFILE_CONCAT(a, b) PRISM_PROFILE_CONCAT_INNER(a, b)
#define PROFILE_SCOPE(name) ::prism::core::ScopedTimer PRISM_PROFILE_CONCAT(prismScopedTimer_, __LINE__)(name)
