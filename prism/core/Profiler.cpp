#include "prism/core/Profiler.hpp"

#include <iterator>

namespace prism::core
{

void Profiler::BeginFrame()
{
    m_frameStart = Clock::now();

    const float frameMs = m_stats.frameMs;
    const float fps = m_stats.fps;
    const float avgFps = m_stats.avgFps;
    const float worstFrameMs = m_stats.worstFrameMs;
    const float renderMs = m_stats.renderMs;
    m_stats = FrameStats{frameMs, fps, avgFps, worstFrameMs, renderMs};

    for (SectionTiming& section : m_sections)
    {
        section.frameMs = 0.0F;
        section.calls = 0;
    }
}

void Profiler::EndFrame()
{
    const float frameMs = std::chrono::duration<float, std::milli>(Clock::now() - m_frameStart).count();
    m_frameHistory.Push(frameMs);

    m_stats.frameMs = frameMs;
    m_stats.fps = frameMs > 0.001F ? 1000.0F / frameMs : 0.0F;
    const float avgMs = m_frameHistory.Average();
    m_stats.avgFps = avgMs > 0.001F ? 1000.0F / avgMs : 0.0F;
    m_stats.worstFrameMs = m_frameHistory.Max();

    for (SectionTiming& section : m_sections)
    {
        if (section.calls > 0)
        {
            section.history.Push(section.frameMs);
        }
    }

    const SectionTiming* render = FindSection("Render");
    m_stats.renderMs = render != nullptr ? render->frameMs : 0.0F;
}

void Profiler::RecordSection(std::string_view name, float elapsedMs)
{
    if (!m_enabled)
    {
        return;
    }

    auto it = std::find_if(m_sections.begin(), m_sections.end(),
                           [name](const SectionTiming& section) { return section.name == name; });
    if (it == m_sections.end())
    {
        m_sections.push_back(SectionTiming{std::string(name), {}, 0.0F, 0});
        it = std::prev(m_sections.end());
    }
    it->frameMs += elapsedMs;
    ++it->calls;
}

const SectionTiming* Profiler::FindSection(std::string_view name) const
{
    for (const SectionTiming& section : m_sections)
    {
        if (section.name == name)
        {
            return &section;
        }
    }
    return nullptr;
}

void Profiler::RecordDrawCall(std::uint32_t vertices, std::uint32_t triangles)
{
    ++m_stats.drawCalls;
    m_stats.verticesSubmitted += vertices;
    m_stats.trianglesSubmitted += triangles;
}

void Profiler::RecordProgramBind()
{
    ++m_stats.programBinds;
}

void Profiler::RecordCacheLookup(bool hit)
{
    ++(hit ? m_stats.meshCacheHits : m_stats.meshCacheMisses);
}

void Profiler::RecordSkippedObject()
{
    ++m_stats.objectsSkipped;
}

void Profiler::Reset()
{
    m_sections.clear();
    m_stats = FrameStats{};
    m_frameHistory = SampleRing<kProfilerHistory>{};
}

} // namespace prism::core
