// Frame scheduler and the Run / Schedule loop adapter

#include "TestGame.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <Engine/GameExtensions.hpp>
#include <Engine/Scheduler.hpp>

using namespace Kindling;
namespace GX = Kindling::GameExtensions;
using Catch::Matchers::WithinAbs;

TEST_CASE("FrameScheduler", "[scheduler]") {
    FrameScheduler scheduler;

    SECTION("continuing tasks run every tick") {
        int calls = 0;
        scheduler.Add([&] { ++calls; return TaskStatus::Continue; });
        for (int i = 0; i < 3; ++i) scheduler.Tick();
        REQUIRE(calls == 3);
        REQUIRE(scheduler.TaskCount() == 1);
    }

    SECTION("finished tasks are dropped") {
        int calls = 0;
        scheduler.Add([&] { ++calls; return TaskStatus::Finished; });
        scheduler.Tick();
        scheduler.Tick();
        REQUIRE(calls == 1);
        REQUIRE(scheduler.TaskCount() == 0);
    }

    SECTION("cancelled tasks stop") {
        int calls = 0;
        CancellationToken token = scheduler.Add([&] { ++calls; return TaskStatus::Continue; });
        scheduler.Tick();
        token.Cancel();
        scheduler.Tick();
        REQUIRE(calls == 1);
        REQUIRE(scheduler.TaskCount() == 0);
    }

    SECTION("tasks added during a tick start on the next one") {
        int inner = 0;
        scheduler.Add([&] {
            scheduler.Add([&] { ++inner; return TaskStatus::Continue; });
            return TaskStatus::Finished;
        });
        scheduler.Tick();
        REQUIRE(inner == 0);
        scheduler.Tick();
        REQUIRE(inner == 1);
    }

    SECTION("cancel all") {
        int calls = 0;
        scheduler.Add([&] { ++calls; return TaskStatus::Continue; });
        scheduler.Add([&] { ++calls; return TaskStatus::Continue; });
        scheduler.CancelAll();
        scheduler.Tick();
        REQUIRE(calls == 0);
    }

    SECTION("copies of a token share the flag") {
        CancellationToken a;
        CancellationToken b = a;
        b.Cancel();
        REQUIRE(a.IsCancellationRequested());
    }
}

TEST_CASE("Run calls start once and update every frame", "[scheduler][run]") {
    Game game(HeadlessSettings(5));

    int starts = 0, updates = 0;
    float lastElapsed = 0.0f;
    GX::Run(
        game,
        [&](Scene&) { ++starts; },
        [&](Scene&, const GameTime& time) {
            ++updates;
            lastElapsed = time.elapsed;
        });

    REQUIRE(starts == 1);
    REQUIRE(updates == 5);
    REQUIRE(game.GetTime().frameCount == 5);
    REQUIRE_THAT(lastElapsed, WithinAbs(game.GetSettings().fixedTimeStep, 1e-6f));
    REQUIRE_FALSE(game.IsRunning());
}

TEST_CASE("Run without update finishes after start", "[scheduler][run]") {
    Game game(HeadlessSettings(3));

    int starts = 0;
    GX::Run(game, [&](Scene& scene) {
        ++starts;
        scene.Add(std::make_shared<Entity>("Marker"));
    });

    REQUIRE(starts == 1);
    REQUIRE(game.GetRootScene().Count("Marker") == 1);
    REQUIRE(game.GetScheduler().TaskCount() == 0);
}

TEST_CASE("Game-flavoured Run passes the game", "[scheduler][run]") {
    Game game(HeadlessSettings(2));

    Game* seen = nullptr;
    int updates = 0;
    GX::Run(game, [&](Game& g) { seen = &g; }, [&](Game&) { ++updates; });

    REQUIRE(seen == &game);
    REQUIRE(updates == 2);
}

TEST_CASE("Cancelling the token stops updates", "[scheduler][run]") {
    Game game(HeadlessSettings(10));

    CancellationToken token;
    int updates = 0;
    GX::Run(game, token, [](Scene&) {}, [&](Scene&, const GameTime&) {
        if (++updates == 3) token.Cancel();
    });

    REQUIRE(updates == 3);
    REQUIRE(game.GetTime().frameCount == 10);
}

TEST_CASE("Exit ends the loop and cancels tasks", "[scheduler][run]") {
    Game game(HeadlessSettings(100));

    int updates = 0;
    CancellationToken token = GX::Schedule(game, [](Scene&) {}, [&](Scene&, const GameTime&) {
        if (++updates == 4) game.Exit();
    });
    game.Run();

    REQUIRE(updates == 4);
    REQUIRE(token.IsCancellationRequested());
    REQUIRE(game.GetTime().frameCount == 4);
}

TEST_CASE("Scripts start before their first update", "[scheduler][scripts]") {
    struct Counter : ScriptComponent {
        int starts = 0, updates = 0;
        void Start(Game&) override { ++starts; }
        void Update(Game&) override { ++updates; }
    };

    Game game(HeadlessSettings(4));
    auto entity  = std::make_shared<Entity>("Counter");
    auto counter = entity->Add<Counter>();
    game.GetRootScene().Add(entity);
    game.Run();

    REQUIRE(counter->starts == 1);
    REQUIRE(counter->updates == 4);
    REQUIRE(GX::DeltaTime(game) == game.GetSettings().fixedTimeStep);
    REQUIRE(GX::DeltaTimeAccurate(game) == (double)game.GetSettings().fixedTimeStep);
    REQUIRE_THAT(game.GetTime().total, WithinAbs(4.0 * game.GetSettings().fixedTimeStep, 1e-9));
}
