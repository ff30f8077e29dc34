/*
Purpose: Encode/decode symmetry for the whole APP message catalog.

What this tests: Every message type, fixed and variable length, decodes back to
the value it was encoded from, with the header carrying the type code, index,
timestamp and the exact total length.
*/

#include "messages.hpp"

#include <cassert>
#include <cstdint>

namespace
{
    using namespace apphys;

    std::uint32_t g_index = 100;

    template <class M>
    void check_round_trip(const M &m)
    {
        const std::uint32_t index = g_index++;
        const ByteBuffer b = encode_message(m, index, 2.5f);
        assert(b.size() == kHeaderSize + m.body_size());

        auto d = decode_message<M>(as_span(b));
        assert(d.has_value());
        assert(d->header.version == kProtocolVersion);
        assert(d->header.msgType == static_cast<std::uint16_t>(M::kType));
        assert(d->header.msgIndex == index);
        assert(d->header.length == b.size());
        assert(d->header.timestamp == 2.5f);
        assert(d->body == m);
    }

    const ActorID kActor{7, 42};
    const ActorID kOther{7, 43};
    const ShapeID kShape{7, 9};
    const Vector kPos{1.0f, -2.5f, 300.25f};
    const Vector kVel{0.5f, 0.0f, -9.0f};
    const Quat kRot{0.0f, 0.7071068f, 0.0f, 0.7071068f};
    const Material kMat{7700.0f, 0.8f, 0.6f, 0.1f};
}

int main()
{
    check_round_trip(ErrorReport{12, "actor 42 does not exist"});
    check_round_trip(Logon{7, "TestSim"});
    check_round_trip(LogonReady{7});
    check_round_trip(Logoff{7});
    check_round_trip(AdvanceTime{7, 0.89f});
    check_round_trip(TimeAdvanced{7});

    check_round_trip(SetWorld{ActorID{7, 1}, Vector{0.0f, 0.0f, -9.80665f}, 0.2f, 0.3f, 0.0f, 0.04f, -10.0f, Vector{0.0f, 0.0f, 1.0f}});
    check_round_trip(CreateStaticActor{kActor, kPos, kRot, ActorFlagReportCollisions});
    check_round_trip(CreateDynamicActor{kActor, kPos, kRot, 0.5f, kVel, Vector{0.1f, 0.2f, 0.3f}, ActorFlagNone});
    check_round_trip(SetStaticActor{kActor, kPos, kRot});
    check_round_trip(SetDynamicActor{kActor, kPos, kRot, 1.0f, kVel, Vector{3.0f, 2.0f, 1.0f}});
    check_round_trip(UpdateActorPosition{kActor, kPos});
    check_round_trip(UpdateActorOrientation{kActor, kRot});
    check_round_trip(UpdateActorGravityModifier{kActor, 0.25f});
    check_round_trip(UpdateActorLinearVelocity{kActor, kVel});
    check_round_trip(UpdateActorAngularVelocity{kActor, Vector{0.0f, 6.28f, 0.0f}});
    check_round_trip(UpdateActorMass{kActor, 81.5f});
    check_round_trip(GetActorMass{kActor});
    check_round_trip(RemoveActor{kActor});

    {
        AddJoint j;
        j.joint = JointID{7, 3};
        j.actor1 = kActor;
        j.orientation1 = kRot;
        j.translation1 = kPos;
        j.actor2 = kOther;
        j.orientation2 = Quat{};
        j.translation2 = Vector{0.0f, 0.0f, 1.0f};
        j.linearLowerLimits = Vector{-1.0f, -1.0f, -1.0f};
        j.linearUpperLimits = Vector{1.0f, 1.0f, 1.0f};
        j.angularLowerLimits = Vector{-3.14f, 0.0f, 0.0f};
        j.angularUpperLimits = Vector{3.14f, 0.0f, 0.0f};
        check_round_trip(j);
    }
    check_round_trip(RemoveJoint{JointID{7, 3}});

    check_round_trip(AddSphere{kShape, kPos, 0.75f});
    check_round_trip(AddPlane{kShape, Vector{0.0f, 0.0f, 1.0f}, -10.0f});
    check_round_trip(AddCapsule{kShape, 0.3f, 1.5f});
    check_round_trip(AddBox{kShape, 1.0f, 2.0f, 3.0f});

    check_round_trip(AddConvexMesh{kShape, {}});
    check_round_trip(AddConvexMesh{kShape, {Vector{1, 2, 3}, Vector{4, 5, 6}, Vector{-1, 0, 1}}});

    check_round_trip(AddTriangleMesh{kShape, {}, {}});
    check_round_trip(AddTriangleMesh{kShape,
                                     {Vector{0, 0, 0}, Vector{1, 0, 0}, Vector{0, 1, 0}, Vector{0, 0, 1}},
                                     {IndexVector{0, 1, 2}, IndexVector{0, 2, 3}, IndexVector{0, 3, 1}}});

    check_round_trip(AddHeightField{kShape, 0, 0, 1.0f, 1.0f, {}});
    check_round_trip(AddHeightField{kShape, 2, 3, 0.5f, 0.25f, {1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f}});

    check_round_trip(RemoveShape{kShape});
    check_round_trip(AttachShape{kActor, kShape, kMat, kRot, kPos});
    check_round_trip(UpdateShapeMaterial{kActor, kShape, kMat});
    check_round_trip(DetachShape{kActor, kShape});

    check_round_trip(ActorsCollided{kActor, kOther, kPos, Vector{0.0f, 0.0f, 1.0f}, -0.015f});
    check_round_trip(ApplyForce{kActor, Vector{0.0f, 0.0f, 1000.0f}});
    check_round_trip(ApplyTorque{kActor, Vector{5.0f, 0.0f, 0.0f}});

    return 0;
}
