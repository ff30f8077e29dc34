/*
Purpose: Shared shapes keyed by archetype.

What this tests: The first acquire of an archetype creates the remote shape,
later acquires reuse its ID, the ID is handed back for removal only when the
last user releases it, and two registries (two scenes) never share state. A
second thread acquiring an archetype that is still being created gets its ID
only after the creation callback finished; a creation callback that throws
leaves nothing registered and the next acquire tries again.
*/

#include "messenger.hpp"
#include "shape_registry.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <thread>

int main()
{
    using namespace apphys;

    Logger::instance().set_level(LogLevel::Off);

    auto reliable = std::make_shared<InProcTransport>();
    auto bestEffort = std::make_shared<InProcTransport>();
    RemotePhysicsConfig cfg;
    cfg.messengerInternalThread = false;
    cfg.simulationID = 4;

    Messenger m;
    m.initialize(cfg, reliable, bestEffort);

    ShapeRegistry shapes;
    int created = 0;
    auto make_capsule = [&](ShapeIndex id)
    {
        ++created;
        m.add_capsule(id, 0.3f, 1.5f);
    };

    const ShapeIndex a = shapes.acquire("avatar:1.5x0.6", make_capsule);
    const ShapeIndex b = shapes.acquire("avatar:1.5x0.6", make_capsule);
    const ShapeIndex c = shapes.acquire("avatar:2.0x0.6", make_capsule);
    assert(a == b);
    assert(a != c);
    assert(created == 2);
    assert(reliable->sent_count() == 2);
    assert(shapes.size() == 2);

    {
        auto d = decode_message<AddCapsule>(as_span(*reliable->take_sent()));
        assert(d && d->body.shape == (ShapeID{4, a}));
    }

    assert(!shapes.release("avatar:1.5x0.6").has_value());
    auto last = shapes.release("avatar:1.5x0.6");
    assert(last && *last == a);
    assert(!shapes.find("avatar:1.5x0.6").has_value());
    assert(shapes.find("avatar:2.0x0.6") == c);

    // Re-acquiring after removal creates a fresh shape.
    const ShapeIndex again = shapes.acquire("avatar:1.5x0.6", make_capsule);
    assert(again != a);
    assert(created == 3);

    // Another scene has its own table.
    ShapeRegistry otherScene;
    int otherCreated = 0;
    otherScene.acquire("avatar:1.5x0.6", [&](ShapeIndex)
                       { ++otherCreated; });
    assert(otherCreated == 1);
    assert(shapes.size() == 2);

    bool threw = false;
    try
    {
        (void)shapes.release("never-acquired");
    }
    catch (const std::runtime_error &)
    {
        threw = true;
    }
    assert(threw);

    // Concurrent acquire of an archetype whose creation is in progress.
    {
        ShapeRegistry scene;
        std::atomic<bool> creating{false};
        std::atomic<bool> createdRemotely{false};
        std::atomic<int> createCalls{0};
        auto slow_box = [&](ShapeIndex)
        {
            createCalls.fetch_add(1);
            creating.store(true);
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            createdRemotely.store(true);
        };

        ShapeIndex first = 0;
        std::thread creator([&]
                            { first = scene.acquire("box:1x1x1", slow_box); });
        while (!creating.load())
        {
            std::this_thread::yield();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        const ShapeIndex second = scene.acquire("box:1x1x1", slow_box);
        assert(createdRemotely.load());
        creator.join();
        assert(first == second);
        assert(createCalls.load() == 1);

        assert(!scene.release("box:1x1x1").has_value());
        assert(scene.release("box:1x1x1") == first);
    }

    // A failing creation callback is not remembered.
    {
        ShapeRegistry scene;
        bool threwOnCreate = false;
        try
        {
            (void)scene.acquire("box:2x2x2", [](ShapeIndex)
                                { throw std::runtime_error("engine rejected shape"); });
        }
        catch (const std::runtime_error &)
        {
            threwOnCreate = true;
        }
        assert(threwOnCreate);
        assert(!scene.find("box:2x2x2").has_value());
        assert(scene.size() == 0);

        int retries = 0;
        const ShapeIndex id = scene.acquire("box:2x2x2", [&](ShapeIndex)
                                            { ++retries; });
        assert(retries == 1);
        assert(scene.find("box:2x2x2") == id);
    }

    return 0;
}
