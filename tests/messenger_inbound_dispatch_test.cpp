/*
Purpose: Inbound side of the messenger over in-process transports.

What this tests: Each notification type reaches its event with the decoded
values; TimeAdvanced only fires for this simulation; foreign versions, short
messages and command types sent back to us are ignored; at most the configured
number of messages is dispatched per update and per channel; a subscriber can
unsubscribe itself during dispatch.
*/

#include "messenger.hpp"

#include <cassert>
#include <memory>
#include <string>
#include <vector>

namespace
{
    using namespace apphys;

    RemotePhysicsConfig cooperative_config()
    {
        RemotePhysicsConfig cfg;
        cfg.messengerInternalThread = false;
        cfg.packetManagerInternalThread = false;
        return cfg;
    }
}

int main()
{
    Logger::instance().set_level(LogLevel::Off);

    auto reliable = std::make_shared<InProcTransport>();
    auto bestEffort = std::make_shared<InProcTransport>();

    Messenger m;
    m.initialize(cooperative_config(), reliable, bestEffort);
    m.logon(7, "TestSim");

    std::vector<SimulationId> ready;
    std::vector<ActorIndex> staticUpdates;
    std::vector<ActorIndex> dynamicUpdates;
    Vector lastLinear;
    float lastMass = 0.0f;
    std::vector<std::pair<std::uint32_t, std::string>> errors;
    int collisions = 0;
    int timeAdvanced = 0;

    m.logon_ready().subscribe([&](SimulationId id)
                              { ready.push_back(id); });
    m.static_actor_updated().subscribe([&](ActorIndex id, Vector pos, Quat)
                                       {
        assert(pos == (Vector{1, 2, 3}));
        staticUpdates.push_back(id); });
    m.dynamic_actor_updated().subscribe([&](ActorIndex id, Vector, Quat, Vector lin, Vector)
                                        {
        lastLinear = lin;
        dynamicUpdates.push_back(id); });
    m.actor_mass_updated().subscribe([&](ActorIndex id, float mass)
                                     {
        assert(id == 42);
        lastMass = mass; });
    m.engine_error().subscribe([&](std::uint32_t idx, const std::string &reason)
                               { errors.emplace_back(idx, reason); });
    m.actors_collided().subscribe([&](ActorIndex collided, ActorIndex colliding, Vector, Vector normal, float separation)
                                  {
        assert(collided == 2);
        assert(colliding == 1);
        assert(normal == (Vector{0, 0, 1}));
        assert(separation < 0.0f);
        ++collisions; });
    m.time_advanced().subscribe([&]
                                { ++timeAdvanced; });

    reliable->deliver(encode_message(LogonReady{7}, 0));
    reliable->deliver(encode_message(SetStaticActor{ActorID{7, 10}, Vector{1, 2, 3}, Quat{}}, 1));
    bestEffort->deliver(encode_message(SetDynamicActor{ActorID{7, 11}, Vector{}, Quat{}, 1.0f, Vector{4, 5, 6}, Vector{}}, 2));
    reliable->deliver(encode_message(UpdateActorMass{ActorID{7, 42}, 12.5f}, 3));
    reliable->deliver(encode_message(ErrorReport{17, "unknown shape"}, 4));
    reliable->deliver(encode_message(ActorsCollided{ActorID{7, 1}, ActorID{7, 2}, Vector{}, Vector{0, 0, 1}, -0.02f}, 5));
    reliable->deliver(encode_message(TimeAdvanced{7}, 6));
    reliable->deliver(encode_message(TimeAdvanced{8}, 7));

    const auto updatesBefore = reliable->update_count();
    m.update();
    assert(reliable->update_count() == updatesBefore + 1);
    assert(bestEffort->update_count() >= 1);

    assert(ready == std::vector<SimulationId>{7});
    assert(staticUpdates == std::vector<ActorIndex>{10});
    assert(dynamicUpdates == std::vector<ActorIndex>{11});
    assert(lastLinear == (Vector{4, 5, 6}));
    assert(lastMass == 12.5f);
    assert(errors.size() == 1 && errors[0].first == 17 && errors[0].second == "unknown shape");
    assert(collisions == 1);
    assert(timeAdvanced == 1);

    // Ignored: command types, foreign versions, truncated notifications.
    {
        reliable->deliver(encode_message(CreateStaticActor{ActorID{7, 1}, Vector{}, Quat{}, 0}, 8));

        ByteBuffer foreign = encode_message(LogonReady{7}, 9);
        store_u16(3, foreign.data(), std::endian::big);
        reliable->deliver(foreign);

        ByteBuffer shortMsg = encode_message(SetStaticActor{ActorID{7, 12}, Vector{1, 2, 3}, Quat{}}, 10);
        shortMsg.resize(kHeaderSize + 10);
        reliable->deliver(shortMsg);

        reliable->deliver(ByteBuffer(5));

        m.update();
        assert(ready.size() == 1);
        assert(staticUpdates.size() == 1);
        assert(reliable->pending_inbound() == 0);
    }

    // Unsubscribing from inside a handler.
    {
        int calls = 0;
        SubscriptionId self = 0;
        self = m.time_advanced().subscribe([&]
                                           {
            ++calls;
            m.time_advanced().unsubscribe(self); });
        reliable->deliver(encode_message(TimeAdvanced{7}, 11));
        reliable->deliver(encode_message(TimeAdvanced{7}, 12));
        m.update();
        assert(calls == 1);
        assert(timeAdvanced == 3);
    }

    m.dispose();

    // Inbound cap per update, per channel.
    {
        auto r = std::make_shared<InProcTransport>();
        auto u = std::make_shared<InProcTransport>();
        RemotePhysicsConfig cfg = cooperative_config();
        cfg.maxInboundPerUpdate = 4;
        cfg.simulationID = 5;

        Messenger capped;
        capped.initialize(cfg, r, u);
        int ticks = 0;
        capped.time_advanced().subscribe([&]
                                         { ++ticks; });
        for (std::uint32_t i = 0; i < 10; ++i)
        {
            r->deliver(encode_message(TimeAdvanced{5}, i));
            u->deliver(encode_message(TimeAdvanced{5}, i));
        }

        capped.update();
        assert(ticks == 8);
        assert(r->pending_inbound() == 6 && u->pending_inbound() == 6);
        capped.update();
        capped.update();
        assert(ticks == 20);
        assert(r->pending_inbound() == 0 && u->pending_inbound() == 0);
    }

    // Default cap.
    assert(RemotePhysicsConfig{}.maxInboundPerUpdate == 5000);

    return 0;
}
