#include <Engine/GraphicsCompositor.hpp>
#include <algorithm>

namespace Kindling {

std::shared_ptr<GraphicsCompositor> GraphicsCompositor::CreateDefault(Color clearColor)
{
    auto c = std::make_shared<GraphicsCompositor>();
    c->cameraSlots.push_back("Main");
    c->clearColor = clearColor;
    return c;
}

bool GraphicsCompositor::HasCameraSlot(const std::string& name) const
{
    return std::find(cameraSlots.begin(), cameraSlots.end(), name) != cameraSlots.end();
}

} // namespace Kindling
