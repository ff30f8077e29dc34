#pragma once

#include "wire.hpp"

namespace apphys
{
    inline constexpr std::uint16_t kProtocolVersion = 1;
    inline constexpr std::size_t kHeaderSize = 24;
    inline constexpr std::size_t kPacketLengthOffset = 8;
    inline constexpr std::size_t kSimulationNameSize = 48;
    inline constexpr std::size_t kErrorReasonSize = 256;

    enum class MessageType : std::uint16_t
    {
        Error = 1,

        Logon = 11,
        LogonReady = 12,
        Logoff = 13,
        AdvanceTime = 14,
        TimeAdvanced = 15,

        SetWorld = 101,
        CreateStaticActor = 102,
        CreateDynamicActor = 103,
        SetStaticActor = 104,
        SetDynamicActor = 105,
        UpdateActorPosition = 106,
        UpdateActorOrientation = 107,
        UpdateActorGravityModifier = 108,
        UpdateActorLinearVelocity = 109,
        UpdateActorAngularVelocity = 110,
        UpdateActorMass = 111,
        GetActorMass = 112,
        RemoveActor = 113,

        AddJoint = 201,
        RemoveJoint = 202,

        AddSphere = 301,
        AddPlane = 302,
        AddCapsule = 303,
        AddBox = 304,
        AddConvexMesh = 305,
        AddTriangleMesh = 306,
        AddHeightField = 307,
        RemoveShape = 308,
        AttachShape = 309,
        UpdateShapeMaterial = 310,
        DetachShape = 311,

        ActorsCollided = 401,
        ApplyForce = 402,
        ApplyTorque = 403,
    };

    inline const char *message_type_name(std::uint16_t code) noexcept
    {
        switch (static_cast<MessageType>(code))
        {
        case MessageType::Error:
            return "Error";
        case MessageType::Logon:
            return "Logon";
        case MessageType::LogonReady:
            return "LogonReady";
        case MessageType::Logoff:
            return "Logoff";
        case MessageType::AdvanceTime:
            return "AdvanceTime";
        case MessageType::TimeAdvanced:
            return "TimeAdvanced";
        case MessageType::SetWorld:
            return "SetWorld";
        case MessageType::CreateStaticActor:
            return "CreateStaticActor";
        case MessageType::CreateDynamicActor:
            return "CreateDynamicActor";
        case MessageType::SetStaticActor:
            return "SetStaticActor";
        case MessageType::SetDynamicActor:
            return "SetDynamicActor";
        case MessageType::UpdateActorPosition:
            return "UpdateActorPosition";
        case MessageType::UpdateActorOrientation:
            return "UpdateActorOrientation";
        case MessageType::UpdateActorGravityModifier:
            return "UpdateActorGravityModifier";
        case MessageType::UpdateActorLinearVelocity:
            return "UpdateActorLinearVelocity";
        case MessageType::UpdateActorAngularVelocity:
            return "UpdateActorAngularVelocity";
        case MessageType::UpdateActorMass:
            return "UpdateActorMass";
        case MessageType::GetActorMass:
            return "GetActorMass";
        case MessageType::RemoveActor:
            return "RemoveActor";
        case MessageType::AddJoint:
            return "AddJoint";
        case MessageType::RemoveJoint:
            return "RemoveJoint";
        case MessageType::AddSphere:
            return "AddSphere";
        case MessageType::AddPlane:
            return "AddPlane";
        case MessageType::AddCapsule:
            return "AddCapsule";
        case MessageType::AddBox:
            return "AddBox";
        case MessageType::AddConvexMesh:
            return "AddConvexMesh";
        case MessageType::AddTriangleMesh:
            return "AddTriangleMesh";
        case MessageType::AddHeightField:
            return "AddHeightField";
        case MessageType::RemoveShape:
            return "RemoveShape";
        case MessageType::AttachShape:
            return "AttachShape";
        case MessageType::UpdateShapeMaterial:
            return "UpdateShapeMaterial";
        case MessageType::DetachShape:
            return "DetachShape";
        case MessageType::ActorsCollided:
            return "ActorsCollided";
        case MessageType::ApplyForce:
            return "ApplyForce";
        case MessageType::ApplyTorque:
            return "ApplyTorque";
        }
        return "Unknown";
    }

    struct MessageHeader
    {
        std::uint16_t version = kProtocolVersion;
        std::uint16_t msgType = 0;
        std::uint32_t msgIndex = 0;
        // Total bytes, header included.
        std::uint32_t length = 0;
        float timestamp = 0.0f;
        std::uint32_t reserved1 = 0;
        std::uint32_t reserved2 = 0;

        bool operator==(const MessageHeader &) const = default;
    };

    inline void write_header(WireWriter &w, const MessageHeader &h)
    {
        w.write_u16(h.version);
        w.write_u16(h.msgType);
        w.write_u32(h.msgIndex);
        w.write_u32(h.length);
        w.write_f32(h.timestamp);
        w.write_u32(h.reserved1);
        w.write_u32(h.reserved2);
    }

    inline MessageHeader read_header(WireReader &r)
    {
        MessageHeader h;
        h.version = r.read_u16();
        h.msgType = r.read_u16();
        h.msgIndex = r.read_u32();
        h.length = r.read_u32();
        h.timestamp = r.read_f32();
        h.reserved1 = r.read_u32();
        h.reserved2 = r.read_u32();
        return h;
    }

    // Sub-records shared by the message bodies.

    struct ActorID
    {
        SimulationId simID = 0;
        ActorIndex actorID = 0;

        bool operator==(const ActorID &) const = default;
        static constexpr std::size_t kWireSize = 8;
    };

    struct ShapeID
    {
        SimulationId simID = 0;
        ShapeIndex shapeID = 0;

        bool operator==(const ShapeID &) const = default;
        static constexpr std::size_t kWireSize = 8;
    };

    struct JointID
    {
        SimulationId simID = 0;
        JointIndex jointID = 0;

        bool operator==(const JointID &) const = default;
        static constexpr std::size_t kWireSize = 8;
    };

    struct Vector
    {
        float x = 0.0f;
        float y = 0.0f;
        float z = 0.0f;

        bool operator==(const Vector &) const = default;
        static constexpr std::size_t kWireSize = 12;
    };

    struct Quat
    {
        float x = 0.0f;
        float y = 0.0f;
        float z = 0.0f;
        float w = 1.0f;

        bool operator==(const Quat &) const = default;
        static constexpr std::size_t kWireSize = 16;
    };

    struct IndexVector
    {
        std::uint32_t p1 = 0;
        std::uint32_t p2 = 0;
        std::uint32_t p3 = 0;

        bool operator==(const IndexVector &) const = default;
        static constexpr std::size_t kWireSize = 12;
    };

    struct Material
    {
        float density = 0.0f;
        float staticFriction = 0.0f;
        float kineticFriction = 0.0f;
        float restitution = 0.0f;

        bool operator==(const Material &) const = default;
        static constexpr std::size_t kWireSize = 16;
    };

    inline void write_field(WireWriter &w, const ActorID &v)
    {
        w.write_u32(v.simID);
        w.write_u32(v.actorID);
    }

    inline void write_field(WireWriter &w, const ShapeID &v)
    {
        w.write_u32(v.simID);
        w.write_u32(v.shapeID);
    }

    inline void write_field(WireWriter &w, const JointID &v)
    {
        w.write_u32(v.simID);
        w.write_u32(v.jointID);
    }

    inline void write_field(WireWriter &w, const Vector &v)
    {
        w.write_f32(v.x);
        w.write_f32(v.y);
        w.write_f32(v.z);
    }

    inline void write_field(WireWriter &w, const Quat &v)
    {
        w.write_f32(v.x);
        w.write_f32(v.y);
        w.write_f32(v.z);
        w.write_f32(v.w);
    }

    inline void write_field(WireWriter &w, const IndexVector &v)
    {
        w.write_u32(v.p1);
        w.write_u32(v.p2);
        w.write_u32(v.p3);
    }

    inline void write_field(WireWriter &w, const Material &v)
    {
        w.write_f32(v.density);
        w.write_f32(v.staticFriction);
        w.write_f32(v.kineticFriction);
        w.write_f32(v.restitution);
    }

    inline void write_field(WireWriter &w, float v) { w.write_f32(v); }
    inline void write_field(WireWriter &w, std::uint32_t v) { w.write_u32(v); }

    inline void read_field(WireReader &r, ActorID &v)
    {
        v.simID = r.read_u32();
        v.actorID = r.read_u32();
    }

    inline void read_field(WireReader &r, ShapeID &v)
    {
        v.simID = r.read_u32();
        v.shapeID = r.read_u32();
    }

    inline void read_field(WireReader &r, JointID &v)
    {
        v.simID = r.read_u32();
        v.jointID = r.read_u32();
    }

    inline void read_field(WireReader &r, Vector &v)
    {
        v.x = r.read_f32();
        v.y = r.read_f32();
        v.z = r.read_f32();
    }

    inline void read_field(WireReader &r, Quat &v)
    {
        v.x = r.read_f32();
        v.y = r.read_f32();
        v.z = r.read_f32();
        v.w = r.read_f32();
    }

    inline void read_field(WireReader &r, IndexVector &v)
    {
        v.p1 = r.read_u32();
        v.p2 = r.read_u32();
        v.p3 = r.read_u32();
    }

    inline void read_field(WireReader &r, Material &v)
    {
        v.density = r.read_f32();
        v.staticFriction = r.read_f32();
        v.kineticFriction = r.read_f32();
        v.restitution = r.read_f32();
    }

    inline void read_field(WireReader &r, float &v) { v = r.read_f32(); }
    inline void read_field(WireReader &r, std::uint32_t &v) { v = r.read_u32(); }
}
