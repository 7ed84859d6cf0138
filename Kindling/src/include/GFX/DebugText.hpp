#pragma once

#include <raylib.h>
#include <string>
#include <vector>

namespace Kindling::GFX {

// Text queued during the frame and drawn on top of everything after the 3D
// pass. The queue is cleared at the start of every frame.
class DebugTextSystem {
public:
    struct Entry {
        std::string text;
        int         x, y;
        Color       color;
    };

    void Print(std::string text, int x, int y, Color color = WHITE);
    void Clear() { m_entries.clear(); }

    const std::vector<Entry>& Entries() const { return m_entries; }

    void Draw() const;

    int  fontSize = 16;
    bool visible  = true;

private:
    std::vector<Entry> m_entries;
};

} // namespace Kindling::GFX
