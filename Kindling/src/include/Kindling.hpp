#pragma once
#include <raylib.h>

// ── Kindling convenience API: one include for everything ─────────────────
#include <Core/Error.hpp>              // Kindling::InvalidOperationError
#include <Core/Settings.hpp>           // Kindling::GameSettings, ParseCommandLine
#include <Core/AssetPath.hpp>          // Kindling::ResolveAssetPath
#include <Engine/Entity.hpp>           // Kindling::Entity, Transform
#include <Engine/Scene.hpp>            // Kindling::Scene
#include <Engine/Components.hpp>       // model / camera / light / gizmo / script components
#include <Engine/Game.hpp>             // Kindling::Game, GameTime
#include <Engine/GameExtensions.hpp>   // Kindling::GameExtensions:: (setup + composition)
#include <GFX/ProceduralModels.hpp>    // Kindling::GFX:: (primitive types + builders)
#include <Physics/ColliderMapping.hpp> // Kindling::Physics:: (primitive → collider)
#include <Physics/PhysicsComponents.hpp>
#include <UI/UI.hpp>                   // Kindling::UI:: (text blocks, buttons, grid)
