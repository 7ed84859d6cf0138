#include <GFX/RenderModel.hpp>
#include <raymath.h>
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace Kindling::GFX {

static constexpr float kAmbient = 0.35f;

static std::unordered_set<RenderModel*>& Uploaded()
{
    static std::unordered_set<RenderModel*> models;
    return models;
}

RenderModel::RenderModel(MeshData mesh)
{
    m_meshes.push_back(std::move(mesh));
}

RenderModel::~RenderModel()
{
    Unload();
}

void RenderModel::AddMaterial(const MaterialDesc& material)
{
    m_materials.push_back(material);
    if (m_uploaded) Unload();
}

void RenderModel::AddMesh(MeshData mesh)
{
    m_meshes.push_back(std::move(mesh));
    if (m_uploaded) Unload();
}

BoundingBox RenderModel::Bounds() const
{
    BoundingBox out{ { 0, 0, 0 }, { 0, 0, 0 } };
    bool first = true;
    for (const auto& m : m_meshes) {
        if (m.Empty()) continue;
        BoundingBox b = m.Bounds();
        if (first) { out = b; first = false; continue; }
        out.min = Vector3Min(out.min, b.min);
        out.max = Vector3Max(out.max, b.max);
    }
    return out;
}

void RenderModel::Upload()
{
    const int meshCount = (int)m_meshes.size();

    m_gpu = {};
    m_gpu.transform     = MatrixIdentity();
    m_gpu.meshCount     = meshCount;
    m_gpu.meshes        = (Mesh*)MemAlloc(sizeof(Mesh) * meshCount);
    m_gpu.materialCount = std::max(1, (int)m_materials.size());
    m_gpu.materials     = (Material*)MemAlloc(sizeof(Material) * m_gpu.materialCount);
    m_gpu.meshMaterial  = (int*)MemAlloc(sizeof(int) * meshCount);

    for (int i = 0; i < m_gpu.materialCount; ++i) {
        m_gpu.materials[i] = LoadMaterialDefault();
        Color c = m_materials.empty() ? DefaultMaterialColor : m_materials[i].diffuse;
        m_gpu.materials[i].maps[MATERIAL_MAP_DIFFUSE].color = c;
    }

    for (int i = 0; i < meshCount; ++i) {
        const MeshData& src = m_meshes[i];
        Mesh mesh = {};
        mesh.vertexCount   = src.VertexCount();
        mesh.triangleCount = src.TriangleCount();
        mesh.vertices  = (float*)MemAlloc(sizeof(float) * 3 * mesh.vertexCount);
        mesh.normals   = (float*)MemAlloc(sizeof(float) * 3 * mesh.vertexCount);
        mesh.texcoords = (float*)MemAlloc(sizeof(float) * 2 * mesh.vertexCount);
        mesh.colors    = (unsigned char*)MemAlloc(4 * mesh.vertexCount);
        mesh.indices   = (unsigned short*)MemAlloc(sizeof(unsigned short) * src.indices.size());

        for (int v = 0; v < mesh.vertexCount; ++v) {
            const Vertex& vx = src.vertices[v];
            mesh.vertices[v * 3 + 0]  = vx.position.x;
            mesh.vertices[v * 3 + 1]  = vx.position.y;
            mesh.vertices[v * 3 + 2]  = vx.position.z;
            mesh.normals[v * 3 + 0]   = vx.normal.x;
            mesh.normals[v * 3 + 1]   = vx.normal.y;
            mesh.normals[v * 3 + 2]   = vx.normal.z;
            mesh.texcoords[v * 2 + 0] = vx.texcoord.x;
            mesh.texcoords[v * 2 + 1] = vx.texcoord.y;
            mesh.colors[v * 4 + 0] = mesh.colors[v * 4 + 1] = mesh.colors[v * 4 + 2] = 255;
            mesh.colors[v * 4 + 3] = 255;
        }
        std::copy(src.indices.begin(), src.indices.end(), mesh.indices);

        UploadMesh(&mesh, true);
        m_gpu.meshes[i]       = mesh;
        m_gpu.meshMaterial[i] = std::min(i, m_gpu.materialCount - 1);
    }

    m_uploaded  = true;
    m_lastLight = { 0, 0, 0 };
    Uploaded().insert(this);
    TraceLog(LOG_DEBUG, "[RenderModel] Uploaded %d mesh(es)", meshCount);
}

// Shade vertices with a single directional light expressed in model space.
// Colours are grey levels; the material diffuse colour tints them in the
// default shader.
void RenderModel::Shade(Vector3 localLightDir)
{
    for (int i = 0; i < m_gpu.meshCount; ++i) {
        Mesh& mesh = m_gpu.meshes[i];
        for (int v = 0; v < mesh.vertexCount; ++v) {
            Vector3 n = { mesh.normals[v * 3], mesh.normals[v * 3 + 1], mesh.normals[v * 3 + 2] };
            float lambert = std::max(0.0f, -Vector3DotProduct(n, localLightDir));
            float shade   = kAmbient + (1.0f - kAmbient) * lambert;
            unsigned char g = (unsigned char)std::clamp(shade * 255.0f, 0.0f, 255.0f);
            mesh.colors[v * 4 + 0] = g;
            mesh.colors[v * 4 + 1] = g;
            mesh.colors[v * 4 + 2] = g;
        }
        UpdateMeshBuffer(mesh, 3, mesh.colors, mesh.vertexCount * 4, 0);
    }
    m_lastLight = localLightDir;
}

void RenderModel::Draw(const Matrix& world, Vector3 keyLightDir, Color tint)
{
    if (m_meshes.empty()) return;
    if (!m_uploaded) Upload();

    // Bring the light into model space with the transpose of the rotation part.
    Vector3 local = {
        world.m0 * keyLightDir.x + world.m1 * keyLightDir.y + world.m2  * keyLightDir.z,
        world.m4 * keyLightDir.x + world.m5 * keyLightDir.y + world.m6  * keyLightDir.z,
        world.m8 * keyLightDir.x + world.m9 * keyLightDir.y + world.m10 * keyLightDir.z,
    };
    local = Vector3Normalize(local);
    if (Vector3DistanceSqr(local, m_lastLight) > 1e-6f) Shade(local);

    m_gpu.transform = world;
    DrawModel(m_gpu, { 0, 0, 0 }, 1.0f, tint);
}

void RenderModel::DrawWires(const Matrix& world, Color color)
{
    if (m_meshes.empty()) return;
    if (!m_uploaded) Upload();
    m_gpu.transform = world;
    DrawModelWires(m_gpu, { 0, 0, 0 }, 1.0f, color);
}

void RenderModel::Unload()
{
    if (!m_uploaded) return;
    UnloadModel(m_gpu);
    m_gpu      = {};
    m_uploaded = false;
    Uploaded().erase(this);
}

void RenderModel::UnloadAll()
{
    std::unordered_set<RenderModel*> models = Uploaded();
    for (RenderModel* m : models) m->Unload();
    TraceLog(LOG_DEBUG, "[RenderModel] Unloaded %zu model(s)", models.size());
}

} // namespace Kindling::GFX
