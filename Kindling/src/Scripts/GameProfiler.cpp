#include <Scripts/GameProfiler.hpp>
#include <imgui/imgui.h>
#include <algorithm>

namespace Kindling {

static constexpr float kMinRefresh = 0.1f;
static constexpr float kMaxRefresh = 5.0f;

const char* GameProfiler::ToString(Filter f)
{
    switch (f) {
        case Filter::All:     return "All";
        case Filter::Update:  return "Update";
        case Filter::Physics: return "Physics";
        case Filter::Draw:    return "Draw";
    }
    return "?";
}

const char* GameProfiler::ToString(Sorting s)
{
    return s == Sorting::ByTime ? "By time" : "By name";
}

int GameProfiler::PageCount() const
{
    if (rowsPerPage <= 0 || m_snapshot.empty()) return 1;
    return (int)((m_snapshot.size() + rowsPerPage - 1) / rowsPerPage);
}

void GameProfiler::Refresh(const Game& game)
{
    m_snapshot.clear();
    m_frameMs = 0.0;
    for (const auto& s : game.GetLastFrameSamples()) {
        m_frameMs += s.ms;
        if (filter == Filter::All || s.category == ToString(filter)) m_snapshot.push_back(s);
    }

    if (sorting == Sorting::ByTime)
        std::stable_sort(m_snapshot.begin(), m_snapshot.end(),
                         [](const ProfilingSample& a, const ProfilingSample& b) { return a.ms > b.ms; });
    else
        std::stable_sort(m_snapshot.begin(), m_snapshot.end(),
                         [](const ProfilingSample& a, const ProfilingSample& b) { return a.name < b.name; });

    page  = std::clamp(page, 0, PageCount() - 1);
    m_fps = game.GetTime().framesPerSecond;
}

void GameProfiler::Update(Game& game)
{
    const Input::InputSource& in = game.GetInput();

    if (in.IsKeyDown(KEY_LEFT_SHIFT) && in.IsKeyDown(KEY_LEFT_CONTROL) && in.IsKeyPressed(KEY_P)) {
        visible = !visible;
        m_sinceRefresh = refreshInterval;
        TraceLog(LOG_DEBUG, "[Profiler] %s", visible ? "shown" : "hidden");
    }
    if (!visible) return;

    bool dirty = false;
    if (in.IsKeyPressed(KEY_F1)) {
        filter = (Filter)(((int)filter + 1) % 4);
        page   = 0;
        dirty  = true;
    }
    if (in.IsKeyPressed(KEY_F2)) {
        sorting = sorting == Sorting::ByTime ? Sorting::ByName : Sorting::ByTime;
        dirty   = true;
    }
    if (in.IsKeyPressed(KEY_F3)) page = std::max(0, page - 1);
    if (in.IsKeyPressed(KEY_F4)) page = std::min(PageCount() - 1, page + 1);
    if (in.IsKeyPressed(KEY_EQUAL) || in.IsKeyPressed(KEY_KP_ADD))
        refreshInterval = std::min(kMaxRefresh, refreshInterval * 2.0f);
    if (in.IsKeyPressed(KEY_MINUS) || in.IsKeyPressed(KEY_KP_SUBTRACT))
        refreshInterval = std::max(kMinRefresh, refreshInterval * 0.5f);

    m_sinceRefresh += game.GetTime().elapsed;
    if (dirty || m_sinceRefresh >= refreshInterval) {
        m_sinceRefresh = 0.0f;
        Refresh(game);
    }
}

void GameProfiler::DrawOverlay(Game& game)
{
    if (!visible) return;

    ImGui::SetNextWindowPos({ 10, 60 }, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize({ 420, 320 }, ImGuiCond_FirstUseEver);
    ImGui::Begin("Profiler (Shift+Ctrl+P)");

    ImGui::Text("FPS: %.1f  frame work: %.3f ms", m_fps, m_frameMs);
    ImGui::Text("Bodies: %d  contacts: %d", game.GetSimulation().LastBodyCount(),
                game.GetSimulation().LastContactCount());
    ImGui::Text("Filter: %s (F1)   Sort: %s (F2)", ToString(filter), ToString(sorting));
    ImGui::Text("Page %d/%d (F3/F4)   Refresh: %.2fs (+/-)", page + 1, PageCount(), refreshInterval);
    ImGui::Separator();

    if (ImGui::BeginTable("##samples", 3, ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerV)) {
        ImGui::TableSetupColumn("Name");
        ImGui::TableSetupColumn("Category");
        ImGui::TableSetupColumn("ms");
        ImGui::TableHeadersRow();

        std::size_t first = (std::size_t)(page * rowsPerPage);
        std::size_t last  = std::min(m_snapshot.size(), first + (std::size_t)rowsPerPage);
        for (std::size_t i = first; i < last; ++i) {
            const auto& s = m_snapshot[i];
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0); ImGui::TextUnformatted(s.name.c_str());
            ImGui::TableSetColumnIndex(1); ImGui::TextUnformatted(s.category.c_str());
            ImGui::TableSetColumnIndex(2); ImGui::Text("%.3f", s.ms);
        }
        ImGui::EndTable();
    }

    ImGui::End();
}

} // namespace Kindling
