#include <GFX/Material.hpp>

namespace Kindling::GFX {

MaterialDesc CreateMaterial(std::optional<Color> color, float specular, float microSurface)
{
    MaterialDesc m;
    m.diffuse    = color.value_or(DefaultMaterialColor);
    m.metalness  = specular;
    m.glossiness = microSurface;
    return m;
}

} // namespace Kindling::GFX
