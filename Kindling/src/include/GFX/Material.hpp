#pragma once

#include <raylib.h>
#include <optional>

namespace Kindling::GFX {

inline constexpr Color DefaultMaterialColor       = { 140, 140, 140, 255 };
inline constexpr Color DefaultGroundMaterialColor = {  36,  36,  36, 255 };

// Flat-coloured material description. `metalness` and `glossiness` are kept
// for callers that inspect them; the default raylib shader only uses the
// diffuse colour.
struct MaterialDesc {
    Color diffuse    = DefaultMaterialColor;
    float metalness  = 1.0f;
    float glossiness = 0.65f;
};

MaterialDesc CreateMaterial(std::optional<Color> color = std::nullopt,
                            float specular = 1.0f, float microSurface = 0.65f);

} // namespace Kindling::GFX
