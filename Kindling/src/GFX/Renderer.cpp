#include <GFX/Renderer.hpp>
#include <Engine/Components.hpp>
#include <Engine/Game.hpp>
#include <GFX/RenderModel.hpp>
#include <Physics/PhysicsComponents.hpp>
#include <UI/UI.hpp>
#include <imgui/imgui.h>
#include <imgui/rlImGui.h>
#include <raylib.h>
#include <raymath.h>
#include <rlgl.h>
#include <algorithm>
#include <cmath>
#include <vector>

namespace Kindling::GFX {

// ─── Palette ──────────────────────────────────────────────────────────────────
static constexpr Color COL_DYNAMIC = {  80, 220, 100, 255 };
static constexpr Color COL_STATIC  = { 240, 150,  40, 255 };
static constexpr Color COL_AXIS_X  = { 230,  60,  60, 255 };
static constexpr Color COL_AXIS_Y  = {  60, 200,  60, 255 };
static constexpr Color COL_AXIS_Z  = {  70, 110, 240, 255 };
static constexpr Color COL_LIGHT   = { 250, 220,  90, 255 };

Renderer::~Renderer()
{
    // Textures can only be released while the GL context is alive; Game calls
    // Unload() before closing the window.
    if (!m_textures.empty() && IsWindowReady()) Unload();
}

void Renderer::ClearScreen(int r, int g, int b, int a)
{
    ClearBackground(Color{ (unsigned char)r, (unsigned char)g, (unsigned char)b, (unsigned char)a });
}

void Renderer::DrawText(const std::string& text, int x, int y, int fontSize, Color color)
{
    DrawTextEx(GetFontDefault(), text.c_str(), Vector2{ (float)x, (float)y }, (float)fontSize, 1.0f, color);
}

void Renderer::Unload()
{
    for (auto& [path, tex] : m_textures) UnloadTexture(tex);
    m_textures.clear();
    m_missing.clear();
    RenderModel::UnloadAll();
}

const Texture2D* Renderer::Texture(const std::string& path)
{
    if (path.empty() || m_missing.count(path)) return nullptr;
    auto it = m_textures.find(path);
    if (it != m_textures.end()) return &it->second;

    if (!FileExists(path.c_str())) {
        TraceLog(LOG_WARNING, "[Renderer] Background texture not found: %s", path.c_str());
        m_missing.insert(path);
        return nullptr;
    }
    Texture2D tex = LoadTexture(path.c_str());
    if (tex.id == 0) {
        TraceLog(LOG_WARNING, "[Renderer] Failed to load background texture: %s", path.c_str());
        m_missing.insert(path);
        return nullptr;
    }
    SetTextureFilter(tex, TEXTURE_FILTER_BILINEAR);
    return &m_textures.emplace(path, tex).first->second;
}

static Color Scale(Color c, float k)
{
    k = std::clamp(k, 0.0f, 1.0f);
    return { (unsigned char)(c.r * k), (unsigned char)(c.g * k), (unsigned char)(c.b * k), c.a };
}

void Renderer::DrawBackground(const BackgroundComponent& bg, int width, int height)
{
    if (const Texture2D* tex = Texture(bg.texturePath)) {
        Rectangle src = { 0, 0, (float)tex->width, (float)tex->height };
        Rectangle dst = { 0, 0, (float)width, (float)height };
        DrawTexturePro(*tex, src, dst, { 0, 0 }, 0.0f, Scale(WHITE, bg.intensity));
        return;
    }
    DrawRectangleGradientV(0, 0, width, height, Scale(bg.top, bg.intensity), Scale(bg.bottom, bg.intensity));
}

// ─── Colliders ────────────────────────────────────────────────────────────────
static void DrawShapeWires(const Physics::ColliderShapeDesc& desc, Color col)
{
    using namespace Physics;

    if (auto* b = desc.As<BoxShape>()) {
        DrawCubeWiresV({ 0, 0, 0 }, b->EffectiveSize(), col);
    } else if (auto* s = desc.As<SphereShape>()) {
        if (s->is2D) DrawCircle3D({ 0, 0, 0 }, s->radius, { 0, 1, 0 }, 0.0f, col);
        else         DrawSphereWires({ 0, 0, 0 }, s->radius, 8, 12, col);
    } else if (auto* c = desc.As<CapsuleShape>()) {
        float h = c->length * 0.5f;
        DrawCapsuleWires({ 0, -h, 0 }, { 0, h, 0 }, c->radius, 8, 4, col);
    } else if (auto* cy = desc.As<CylinderShape>()) {
        DrawCylinderWires({ 0, -cy->height * 0.5f, 0 }, cy->radius, cy->radius, cy->height, 12, col);
    } else if (auto* co = desc.As<ConeShape>()) {
        DrawCylinderWires({ 0, -co->height * 0.5f, 0 }, co->radius, 0.0f, co->height, 12, col);
    } else if (auto* p = desc.As<StaticPlaneShape>()) {
        // Finite patch of the plane around its closest point to the origin.
        Vector3 n      = Vector3Normalize(p->normal);
        Vector3 centre = Vector3Scale(n, p->offset);
        Vector3 t      = fabsf(n.y) < 0.99f ? Vector3{ 0, 1, 0 } : Vector3{ 1, 0, 0 };
        Vector3 u      = Vector3Normalize(Vector3CrossProduct(n, t));
        Vector3 v      = Vector3CrossProduct(n, u);
        for (int i = -10; i <= 10; i += 2) {
            DrawLine3D(Vector3Add(centre, Vector3Add(Vector3Scale(u, (float)i), Vector3Scale(v, -10))),
                       Vector3Add(centre, Vector3Add(Vector3Scale(u, (float)i), Vector3Scale(v,  10))), col);
            DrawLine3D(Vector3Add(centre, Vector3Add(Vector3Scale(v, (float)i), Vector3Scale(u, -10))),
                       Vector3Add(centre, Vector3Add(Vector3Scale(v, (float)i), Vector3Scale(u,  10))), col);
        }
    } else if (auto* h = desc.As<ConvexHullShape>()) {
        for (std::size_t k = 0; k < h->hulls.size() && k < h->hullIndices.size(); ++k) {
            const auto& pts = h->hulls[k];
            const auto& idx = h->hullIndices[k];
            for (std::size_t i = 0; i + 2 < idx.size(); i += 3) {
                if (idx[i] >= pts.size() || idx[i + 1] >= pts.size() || idx[i + 2] >= pts.size()) continue;
                Vector3 a = Vector3Multiply(pts[idx[i]],     h->scaling);
                Vector3 b = Vector3Multiply(pts[idx[i + 1]], h->scaling);
                Vector3 c = Vector3Multiply(pts[idx[i + 2]], h->scaling);
                DrawLine3D(a, b, col);
                DrawLine3D(b, c, col);
                DrawLine3D(c, a, col);
            }
        }
    }
}

void Renderer::DrawColliders(const Scene& scene)
{
    scene.ForEach<Physics::PhysicsComponent>([](Entity& e, Physics::PhysicsComponent& pc) {
        Matrix world = e.WorldMatrix();
        Color  col   = pc.IsDynamic() ? COL_DYNAMIC : COL_STATIC;
        for (const auto& shape : pc.Shapes()) {
            Matrix local = MatrixMultiply(QuaternionToMatrix(shape.localRotation),
                                          MatrixTranslate(shape.localOffset.x, shape.localOffset.y, shape.localOffset.z));
            Matrix m = MatrixMultiply(local, world);
            rlPushMatrix();
            rlMultMatrixf(MatrixToFloatV(m).v);
            DrawShapeWires(shape, col);
            rlPopMatrix();
        }
    });
}

// ─── Gizmos ───────────────────────────────────────────────────────────────────
struct AxisLabel {
    Vector3     pos;
    const char* text;
    Color       color;
};

static void DrawGizmo(Entity& e, const GizmoComponent& g, std::vector<AxisLabel>& labels)
{
    Matrix  world  = e.WorldMatrix();
    Vector3 origin = Vector3Transform({ 0, 0, 0 }, world);

    const Vector3     axes[3]   = { { 1, 0, 0 }, { 0, 1, 0 }, { 0, 0, 1 } };
    const Color       colors[3] = { COL_AXIS_X, COL_AXIS_Y, COL_AXIS_Z };
    const char* const names[3]  = { "X", "Y", "Z" };

    for (int i = 0; i < 3; ++i) {
        Vector3 dir = Vector3Normalize(Vector3Subtract(Vector3Transform(axes[i], world), origin));
        Vector3 tip = Vector3Add(origin, Vector3Scale(dir, g.size));
        DrawLine3D(origin, tip, colors[i]);
        DrawSphere(tip, g.size * 0.04f, colors[i]);
        if (g.showAxisName) {
            Vector3 at = g.rotateAxisNames ? tip : Vector3Add(origin, Vector3Scale(axes[i], g.size));
            labels.push_back({ Vector3Add(at, Vector3Scale(dir, g.size * 0.1f)), names[i], colors[i] });
        }
    }

    if (auto* light = e.Get<LightComponent>()) {
        if (light->type == LightType::Directional) {
            Vector3 end = Vector3Add(origin, Vector3Scale(light->Direction(), g.size * 1.5f));
            DrawLine3D(origin, end, COL_LIGHT);
            DrawCylinderEx(end, Vector3Add(end, Vector3Scale(light->Direction(), g.size * 0.2f)),
                           g.size * 0.08f, 0.0f, 8, COL_LIGHT);
        }
    }
}

// ─── Frame ────────────────────────────────────────────────────────────────────
void Renderer::DrawFrame(Game& game)
{
    Scene&      scene  = game.GetRootScene();
    const int   width  = GetScreenWidth();
    const int   height = GetScreenHeight();
    const auto& comp   = game.GetCompositor();

    CameraComponent* camera = nullptr;
    if (comp) {
        scene.ForEach<CameraComponent>([&](Entity&, CameraComponent& c) {
            if (!camera && c.enabled && comp->HasCameraSlot(c.slot)) camera = &c;
        });
    }

    Vector3 keyLight = fallbackLightDir;
    bool    lightSet = false;
    scene.ForEach<LightComponent>([&](Entity&, LightComponent& l) {
        if (!lightSet && l.type == LightType::Directional) {
            keyLight = l.Direction();
            lightSet = true;
        }
    });

    BeginDrawing();
    ClearBackground(comp ? comp->clearColor : DefaultClearColor);

    scene.ForEach<BackgroundComponent>([&](Entity&, BackgroundComponent& bg) { DrawBackground(bg, width, height); });

    std::vector<AxisLabel> labels;
    Camera3D cam3d = {};
    if (camera) {
        cam3d = camera->ToCamera3D();
        rlSetClipPlanes(camera->nearClip, camera->farClip);
        BeginMode3D(cam3d);

        const RenderGroupMask mask = camera->renderMask;
        scene.ForEach<ModelComponent>([&](Entity& e, ModelComponent& mc) {
            if (!mc.visible || !mc.model || !(mask & MaskOf(mc.renderGroup))) return;
            mc.model->Draw(e.WorldMatrix(), keyLight, mc.tint);
        });

        scene.ForEach<GizmoComponent>([&](Entity& e, GizmoComponent& g) { DrawGizmo(e, g, labels); });

        if (showColliders) DrawColliders(scene);

        scene.ForEach<ScriptComponent>([&](Entity&, ScriptComponent& s) {
            if (s.enabled && s.started) s.Draw3D(game);
        });

        EndMode3D();

        for (const auto& l : labels) {
            Vector2 p = GetWorldToScreenEx(l.pos, cam3d, width, height);
            ::DrawText(l.text, (int)p.x - 4, (int)p.y - 8, 16, l.color);
        }
    }

    if (comp && comp->uiStage) {
        scene.ForEach<UI::UIComponent>([&](Entity&, UI::UIComponent& ui) {
            if (ui.page) ui.page->Draw(width, height);
        });
    }

    rlImGuiBegin();
    scene.ForEach<ScriptComponent>([&](Entity&, ScriptComponent& s) {
        if (s.enabled && s.started) s.DrawOverlay(game);
    });
    rlImGuiEnd();

    game.GetDebugText().Draw();

    EndDrawing();
}

} // namespace Kindling::GFX
