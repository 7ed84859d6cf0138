#pragma once

#include <raylib.h>
#include <memory>
#include <string>
#include <vector>

namespace Kindling {

inline constexpr Color DefaultClearColor = { 40, 40, 40, 255 };

// Describes how a frame is put together: which camera slots exist, the clear
// colour, and whether the UI stage runs.
class GraphicsCompositor {
public:
    // One "Main" camera slot, no UI stage.
    static std::shared_ptr<GraphicsCompositor> CreateDefault(Color clearColor = DefaultClearColor);

    bool HasCameraSlot(const std::string& name) const;

    std::vector<std::string> cameraSlots;
    Color                    clearColor  = DefaultClearColor;
    bool                     uiStage     = false;
    bool                     postEffects = false;
};

} // namespace Kindling
