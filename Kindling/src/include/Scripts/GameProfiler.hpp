#pragma once

#include <Engine/Components.hpp>
#include <Engine/Game.hpp>
#include <string>
#include <vector>

namespace Kindling {

// In-game profiler overlay drawn with Dear ImGui.
//
//   Left Shift + Left Ctrl + P   toggle
//   F1                           cycle category filter
//   F2                           cycle sorting
//   F3 / F4                      previous / next page
//   + / -                        refresh interval
class GameProfiler : public ScriptComponent {
public:
    enum class Filter { All, Update, Physics, Draw };
    enum class Sorting { ByTime, ByName };

    void Update(Game& game) override;
    void DrawOverlay(Game& game) override;

    bool    visible         = false;
    Filter  filter          = Filter::All;
    Sorting sorting         = Sorting::ByTime;
    int     page            = 0;
    int     rowsPerPage     = 12;
    float   refreshInterval = 0.5f;   // seconds between snapshot refreshes

    int PageCount() const;
    const std::vector<ProfilingSample>& Snapshot() const { return m_snapshot; }

    static const char* ToString(Filter f);
    static const char* ToString(Sorting s);

private:
    void Refresh(const Game& game);

    std::vector<ProfilingSample> m_snapshot;
    float                        m_sinceRefresh = 0.0f;
    float                        m_fps          = 0.0f;
    double                       m_frameMs      = 0.0;
};

} // namespace Kindling
