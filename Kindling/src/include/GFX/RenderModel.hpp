#pragma once

#include <GFX/Material.hpp>
#include <GFX/MeshData.hpp>
#include <raylib.h>
#include <vector>

namespace Kindling::GFX {

// A renderable model: one or more meshes plus their materials.
//
// Geometry stays on the CPU until Draw() is first called; at that point the
// meshes are uploaded through raylib (a window / GL context must exist).
// Lighting is computed on the CPU into vertex colours from the key light
// direction handed to Draw(), and refreshed when the light moves relative to
// the model.
class RenderModel {
public:
    explicit RenderModel(MeshData mesh);
    ~RenderModel();

    RenderModel(const RenderModel&)            = delete;
    RenderModel& operator=(const RenderModel&) = delete;

    const std::vector<MeshData>&     Meshes()    const { return m_meshes; }
    const std::vector<MaterialDesc>& Materials() const { return m_materials; }

    void AddMaterial(const MaterialDesc& material);
    void AddMesh(MeshData mesh);

    BoundingBox Bounds() const;
    bool        IsUploaded() const { return m_uploaded; }

    // Draw with the given world transform. Must be called inside BeginMode3D().
    void Draw(const Matrix& world, Vector3 keyLightDir, Color tint = WHITE);
    void DrawWires(const Matrix& world, Color color);

    // Release GPU resources (CPU geometry is kept, so the model can re-upload).
    void Unload();

    // Release the GPU resources of every uploaded model. Models outliving the
    // window must be unloaded before it closes.
    static void UnloadAll();

private:
    void Upload();
    void Shade(Vector3 localLightDir);

    std::vector<MeshData>     m_meshes;
    std::vector<MaterialDesc> m_materials;
    ::Model                   m_gpu      = {};
    bool                      m_uploaded = false;
    Vector3                   m_lastLight = { 0, 0, 0 };
};

} // namespace Kindling::GFX
