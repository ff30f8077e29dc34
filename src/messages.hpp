#pragma once

#include "log.hpp"
#include "protocol.hpp"

#include <limits>
#include <type_traits>

namespace apphys
{
    namespace detail
    {
        template <class T>
        constexpr std::size_t field_wire_size() noexcept
        {
            if constexpr (std::is_arithmetic_v<T>)
            {
                return 4;
            }
            else
            {
                return T::kWireSize;
            }
        }

        // True when `count` elements of `elemSize` bytes fit in what is left of `r`.
        inline bool elements_fit(const WireReader &r, std::uint64_t count, std::size_t elemSize) noexcept
        {
            return count <= r.remaining() / elemSize;
        }
    }

    // Each message struct carries its type code and the size of the smallest
    // legal body. write_body / read_body overloads below define the layout;
    // read_body returns false when a variable body claims more elements than
    // the buffer holds.

    // ---- Simulation control ----

    struct ErrorReport
    {
        static constexpr MessageType kType = MessageType::Error;
        static constexpr std::size_t kMinBodySize = 4;

        // Index of the offending message previously sent by us.
        std::uint32_t msgIndex = 0;
        std::string reason;

        std::size_t body_size() const noexcept { return 4 + kErrorReasonSize; }
        bool operator==(const ErrorReport &) const = default;
    };

    inline void write_body(WireWriter &w, const ErrorReport &m)
    {
        w.write_u32(m.msgIndex);
        w.write_fixed_string(m.reason, kErrorReasonSize);
    }

    inline bool read_body(WireReader &r, ErrorReport &m)
    {
        m.msgIndex = r.read_u32();
        m.reason = r.read_fixed_string(std::min(r.remaining(), kErrorReasonSize));
        return true;
    }

    struct Logon
    {
        static constexpr MessageType kType = MessageType::Logon;
        static constexpr std::size_t kMinBodySize = 4 + kSimulationNameSize;

        SimulationId simID = 0;
        std::string name;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const Logon &) const = default;
    };

    inline void write_body(WireWriter &w, const Logon &m)
    {
        w.write_u32(m.simID);
        w.write_fixed_string(m.name, kSimulationNameSize);
    }

    inline bool read_body(WireReader &r, Logon &m)
    {
        m.simID = r.read_u32();
        m.name = r.read_fixed_string(kSimulationNameSize);
        return true;
    }

    struct LogonReady
    {
        static constexpr MessageType kType = MessageType::LogonReady;
        static constexpr std::size_t kMinBodySize = 4;

        SimulationId simID = 0;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const LogonReady &) const = default;
    };

    struct Logoff
    {
        static constexpr MessageType kType = MessageType::Logoff;
        static constexpr std::size_t kMinBodySize = 4;

        SimulationId simID = 0;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const Logoff &) const = default;
    };

    struct TimeAdvanced
    {
        static constexpr MessageType kType = MessageType::TimeAdvanced;
        static constexpr std::size_t kMinBodySize = 4;

        SimulationId simID = 0;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const TimeAdvanced &) const = default;
    };

    inline void write_body(WireWriter &w, const LogonReady &m) { w.write_u32(m.simID); }
    inline bool read_body(WireReader &r, LogonReady &m)
    {
        m.simID = r.read_u32();
        return true;
    }

    inline void write_body(WireWriter &w, const Logoff &m) { w.write_u32(m.simID); }
    inline bool read_body(WireReader &r, Logoff &m)
    {
        m.simID = r.read_u32();
        return true;
    }

    inline void write_body(WireWriter &w, const TimeAdvanced &m) { w.write_u32(m.simID); }
    inline bool read_body(WireReader &r, TimeAdvanced &m)
    {
        m.simID = r.read_u32();
        return true;
    }

    struct AdvanceTime
    {
        static constexpr MessageType kType = MessageType::AdvanceTime;
        static constexpr std::size_t kMinBodySize = 8;

        SimulationId simID = 0;
        // Seconds to step the remote world.
        float time = 0.0f;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const AdvanceTime &) const = default;
    };

    inline void write_body(WireWriter &w, const AdvanceTime &m)
    {
        w.write_u32(m.simID);
        w.write_f32(m.time);
    }

    inline bool read_body(WireReader &r, AdvanceTime &m)
    {
        m.simID = r.read_u32();
        m.time = r.read_f32();
        return true;
    }

    // ---- Actor lifecycle ----

    struct SetWorld
    {
        static constexpr MessageType kType = MessageType::SetWorld;
        static constexpr std::size_t kMinBodySize = ActorID::kWireSize + Vector::kWireSize + 5 * 4 + Vector::kWireSize;

        ActorID groundPlane;
        Vector gravity;
        float staticFriction = 0.0f;
        float kineticFriction = 0.0f;
        float restitution = 0.0f;
        float collisionMargin = 0.0f;
        float groundPlaneHeight = 0.0f;
        Vector groundPlaneNormal;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const SetWorld &) const = default;
    };

    inline void write_body(WireWriter &w, const SetWorld &m)
    {
        write_field(w, m.groundPlane);
        write_field(w, m.gravity);
        w.write_f32(m.staticFriction);
        w.write_f32(m.kineticFriction);
        w.write_f32(m.restitution);
        w.write_f32(m.collisionMargin);
        w.write_f32(m.groundPlaneHeight);
        write_field(w, m.groundPlaneNormal);
    }

    inline bool read_body(WireReader &r, SetWorld &m)
    {
        read_field(r, m.groundPlane);
        read_field(r, m.gravity);
        m.staticFriction = r.read_f32();
        m.kineticFriction = r.read_f32();
        m.restitution = r.read_f32();
        m.collisionMargin = r.read_f32();
        m.groundPlaneHeight = r.read_f32();
        read_field(r, m.groundPlaneNormal);
        return true;
    }

    enum ActorFlags : std::uint32_t
    {
        ActorFlagNone = 0,
        ActorFlagReportCollisions = 1u << 0,
    };

    struct CreateStaticActor
    {
        static constexpr MessageType kType = MessageType::CreateStaticActor;
        static constexpr std::size_t kMinBodySize = ActorID::kWireSize + Vector::kWireSize + Quat::kWireSize + 4;

        ActorID actor;
        Vector position;
        Quat orientation;
        std::uint32_t flags = ActorFlagNone;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const CreateStaticActor &) const = default;
    };

    inline void write_body(WireWriter &w, const CreateStaticActor &m)
    {
        write_field(w, m.actor);
        write_field(w, m.position);
        write_field(w, m.orientation);
        w.write_u32(m.flags);
    }

    inline bool read_body(WireReader &r, CreateStaticActor &m)
    {
        read_field(r, m.actor);
        read_field(r, m.position);
        read_field(r, m.orientation);
        m.flags = r.read_u32();
        return true;
    }

    struct CreateDynamicActor
    {
        static constexpr MessageType kType = MessageType::CreateDynamicActor;
        static constexpr std::size_t kMinBodySize =
            ActorID::kWireSize + Vector::kWireSize + Quat::kWireSize + 4 + 2 * Vector::kWireSize + 4;

        ActorID actor;
        Vector position;
        Quat orientation;
        float gravityModifier = 1.0f;
        Vector linearVelocity;
        Vector angularVelocity;
        std::uint32_t flags = ActorFlagNone;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const CreateDynamicActor &) const = default;
    };

    inline void write_body(WireWriter &w, const CreateDynamicActor &m)
    {
        write_field(w, m.actor);
        write_field(w, m.position);
        write_field(w, m.orientation);
        w.write_f32(m.gravityModifier);
        write_field(w, m.linearVelocity);
        write_field(w, m.angularVelocity);
        w.write_u32(m.flags);
    }

    inline bool read_body(WireReader &r, CreateDynamicActor &m)
    {
        read_field(r, m.actor);
        read_field(r, m.position);
        read_field(r, m.orientation);
        m.gravityModifier = r.read_f32();
        read_field(r, m.linearVelocity);
        read_field(r, m.angularVelocity);
        m.flags = r.read_u32();
        return true;
    }

    struct SetStaticActor
    {
        static constexpr MessageType kType = MessageType::SetStaticActor;
        static constexpr std::size_t kMinBodySize = ActorID::kWireSize + Vector::kWireSize + Quat::kWireSize;

        ActorID actor;
        Vector position;
        Quat orientation;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const SetStaticActor &) const = default;
    };

    inline void write_body(WireWriter &w, const SetStaticActor &m)
    {
        write_field(w, m.actor);
        write_field(w, m.position);
        write_field(w, m.orientation);
    }

    inline bool read_body(WireReader &r, SetStaticActor &m)
    {
        read_field(r, m.actor);
        read_field(r, m.position);
        read_field(r, m.orientation);
        return true;
    }

    struct SetDynamicActor
    {
        static constexpr MessageType kType = MessageType::SetDynamicActor;
        static constexpr std::size_t kMinBodySize =
            ActorID::kWireSize + Vector::kWireSize + Quat::kWireSize + 4 + 2 * Vector::kWireSize;

        ActorID actor;
        Vector position;
        Quat orientation;
        float gravityModifier = 1.0f;
        Vector linearVelocity;
        Vector angularVelocity;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const SetDynamicActor &) const = default;
    };

    inline void write_body(WireWriter &w, const SetDynamicActor &m)
    {
        write_field(w, m.actor);
        write_field(w, m.position);
        write_field(w, m.orientation);
        w.write_f32(m.gravityModifier);
        write_field(w, m.linearVelocity);
        write_field(w, m.angularVelocity);
    }

    inline bool read_body(WireReader &r, SetDynamicActor &m)
    {
        read_field(r, m.actor);
        read_field(r, m.position);
        read_field(r, m.orientation);
        m.gravityModifier = r.read_f32();
        read_field(r, m.linearVelocity);
        read_field(r, m.angularVelocity);
        return true;
    }

    // Single-field actor updates: ActorID followed by one value. The tag type
    // only distinguishes the message code.
    template <MessageType Code, class Value>
    struct ActorValueUpdate
    {
        static constexpr MessageType kType = Code;
        static constexpr std::size_t kMinBodySize = ActorID::kWireSize + detail::field_wire_size<Value>();

        ActorID actor;
        Value value{};

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const ActorValueUpdate &) const = default;
    };

    using UpdateActorPosition = ActorValueUpdate<MessageType::UpdateActorPosition, Vector>;
    using UpdateActorOrientation = ActorValueUpdate<MessageType::UpdateActorOrientation, Quat>;
    using UpdateActorGravityModifier = ActorValueUpdate<MessageType::UpdateActorGravityModifier, float>;
    using UpdateActorLinearVelocity = ActorValueUpdate<MessageType::UpdateActorLinearVelocity, Vector>;
    using UpdateActorAngularVelocity = ActorValueUpdate<MessageType::UpdateActorAngularVelocity, Vector>;
    using UpdateActorMass = ActorValueUpdate<MessageType::UpdateActorMass, float>;
    using ApplyForce = ActorValueUpdate<MessageType::ApplyForce, Vector>;
    using ApplyTorque = ActorValueUpdate<MessageType::ApplyTorque, Vector>;

    template <MessageType Code, class Value>
    inline void write_body(WireWriter &w, const ActorValueUpdate<Code, Value> &m)
    {
        write_field(w, m.actor);
        write_field(w, m.value);
    }

    template <MessageType Code, class Value>
    inline bool read_body(WireReader &r, ActorValueUpdate<Code, Value> &m)
    {
        read_field(r, m.actor);
        read_field(r, m.value);
        return true;
    }

    // Messages whose whole body is one identifier record.
    template <MessageType Code, class Id>
    struct IdOnly
    {
        static constexpr MessageType kType = Code;
        static constexpr std::size_t kMinBodySize = Id::kWireSize;

        Id id;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const IdOnly &) const = default;
    };

    using GetActorMass = IdOnly<MessageType::GetActorMass, ActorID>;
    using RemoveActor = IdOnly<MessageType::RemoveActor, ActorID>;
    using RemoveJoint = IdOnly<MessageType::RemoveJoint, JointID>;
    using RemoveShape = IdOnly<MessageType::RemoveShape, ShapeID>;

    template <MessageType Code, class Id>
    inline void write_body(WireWriter &w, const IdOnly<Code, Id> &m)
    {
        write_field(w, m.id);
    }

    template <MessageType Code, class Id>
    inline bool read_body(WireReader &r, IdOnly<Code, Id> &m)
    {
        read_field(r, m.id);
        return true;
    }

    // ---- Joints ----

    struct AddJoint
    {
        static constexpr MessageType kType = MessageType::AddJoint;
        static constexpr std::size_t kMinBodySize =
            JointID::kWireSize + 2 * (ActorID::kWireSize + Quat::kWireSize + Vector::kWireSize) + 4 * Vector::kWireSize;

        JointID joint;
        ActorID actor1;
        Quat orientation1;
        Vector translation1;
        ActorID actor2;
        Quat orientation2;
        Vector translation2;
        Vector linearLowerLimits;
        Vector linearUpperLimits;
        Vector angularLowerLimits;
        Vector angularUpperLimits;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const AddJoint &) const = default;
    };

    inline void write_body(WireWriter &w, const AddJoint &m)
    {
        write_field(w, m.joint);
        write_field(w, m.actor1);
        write_field(w, m.orientation1);
        write_field(w, m.translation1);
        write_field(w, m.actor2);
        write_field(w, m.orientation2);
        write_field(w, m.translation2);
        write_field(w, m.linearLowerLimits);
        write_field(w, m.linearUpperLimits);
        write_field(w, m.angularLowerLimits);
        write_field(w, m.angularUpperLimits);
    }

    inline bool read_body(WireReader &r, AddJoint &m)
    {
        read_field(r, m.joint);
        read_field(r, m.actor1);
        read_field(r, m.orientation1);
        read_field(r, m.translation1);
        read_field(r, m.actor2);
        read_field(r, m.orientation2);
        read_field(r, m.translation2);
        read_field(r, m.linearLowerLimits);
        read_field(r, m.linearUpperLimits);
        read_field(r, m.angularLowerLimits);
        read_field(r, m.angularUpperLimits);
        return true;
    }

    // ---- Shapes ----

    struct AddSphere
    {
        static constexpr MessageType kType = MessageType::AddSphere;
        static constexpr std::size_t kMinBodySize = ShapeID::kWireSize + Vector::kWireSize + 4;

        ShapeID shape;
        Vector origin;
        float radius = 0.0f;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const AddSphere &) const = default;
    };

    inline void write_body(WireWriter &w, const AddSphere &m)
    {
        write_field(w, m.shape);
        write_field(w, m.origin);
        w.write_f32(m.radius);
    }

    inline bool read_body(WireReader &r, AddSphere &m)
    {
        read_field(r, m.shape);
        read_field(r, m.origin);
        m.radius = r.read_f32();
        return true;
    }

    struct AddPlane
    {
        static constexpr MessageType kType = MessageType::AddPlane;
        static constexpr std::size_t kMinBodySize = ShapeID::kWireSize + Vector::kWireSize + 4;

        ShapeID shape;
        Vector normal;
        float constant = 0.0f;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const AddPlane &) const = default;
    };

    inline void write_body(WireWriter &w, const AddPlane &m)
    {
        write_field(w, m.shape);
        write_field(w, m.normal);
        w.write_f32(m.constant);
    }

    inline bool read_body(WireReader &r, AddPlane &m)
    {
        read_field(r, m.shape);
        read_field(r, m.normal);
        m.constant = r.read_f32();
        return true;
    }

    struct AddCapsule
    {
        static constexpr MessageType kType = MessageType::AddCapsule;
        static constexpr std::size_t kMinBodySize = ShapeID::kWireSize + 8;

        ShapeID shape;
        float radius = 0.0f;
        float height = 0.0f;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const AddCapsule &) const = default;
    };

    inline void write_body(WireWriter &w, const AddCapsule &m)
    {
        write_field(w, m.shape);
        w.write_f32(m.radius);
        w.write_f32(m.height);
    }

    inline bool read_body(WireReader &r, AddCapsule &m)
    {
        read_field(r, m.shape);
        m.radius = r.read_f32();
        m.height = r.read_f32();
        return true;
    }

    struct AddBox
    {
        static constexpr MessageType kType = MessageType::AddBox;
        static constexpr std::size_t kMinBodySize = ShapeID::kWireSize + 12;

        ShapeID shape;
        float length = 0.0f;
        float width = 0.0f;
        float height = 0.0f;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const AddBox &) const = default;
    };

    inline void write_body(WireWriter &w, const AddBox &m)
    {
        write_field(w, m.shape);
        w.write_f32(m.length);
        w.write_f32(m.width);
        w.write_f32(m.height);
    }

    inline bool read_body(WireReader &r, AddBox &m)
    {
        read_field(r, m.shape);
        m.length = r.read_f32();
        m.width = r.read_f32();
        m.height = r.read_f32();
        return true;
    }

    struct AddConvexMesh
    {
        static constexpr MessageType kType = MessageType::AddConvexMesh;
        static constexpr std::size_t kMinBodySize = ShapeID::kWireSize + 4;

        ShapeID shape;
        std::vector<Vector> points;

        std::size_t body_size() const noexcept { return kMinBodySize + points.size() * Vector::kWireSize; }
        bool operator==(const AddConvexMesh &) const = default;
    };

    inline void write_body(WireWriter &w, const AddConvexMesh &m)
    {
        write_field(w, m.shape);
        w.write_u32(static_cast<std::uint32_t>(m.points.size()));
        for (const auto &p : m.points)
        {
            write_field(w, p);
        }
    }

    inline bool read_body(WireReader &r, AddConvexMesh &m)
    {
        read_field(r, m.shape);
        const std::uint32_t count = r.read_u32();
        if (!detail::elements_fit(r, count, Vector::kWireSize))
        {
            return false;
        }
        m.points.resize(count);
        for (auto &p : m.points)
        {
            read_field(r, p);
        }
        return true;
    }

    struct AddTriangleMesh
    {
        static constexpr MessageType kType = MessageType::AddTriangleMesh;
        static constexpr std::size_t kMinBodySize = ShapeID::kWireSize + 8;

        ShapeID shape;
        std::vector<Vector> points;
        std::vector<IndexVector> triangles;

        std::size_t body_size() const noexcept
        {
            return kMinBodySize + points.size() * Vector::kWireSize + triangles.size() * IndexVector::kWireSize;
        }
        bool operator==(const AddTriangleMesh &) const = default;
    };

    inline void write_body(WireWriter &w, const AddTriangleMesh &m)
    {
        write_field(w, m.shape);
        w.write_u32(static_cast<std::uint32_t>(m.points.size()));
        w.write_u32(static_cast<std::uint32_t>(m.triangles.size()));
        for (const auto &p : m.points)
        {
            write_field(w, p);
        }
        for (const auto &t : m.triangles)
        {
            write_field(w, t);
        }
    }

    inline bool read_body(WireReader &r, AddTriangleMesh &m)
    {
        read_field(r, m.shape);
        const std::uint32_t pointCount = r.read_u32();
        const std::uint32_t triangleCount = r.read_u32();
        const std::uint64_t needed = static_cast<std::uint64_t>(pointCount) * Vector::kWireSize +
                                     static_cast<std::uint64_t>(triangleCount) * IndexVector::kWireSize;
        if (needed > r.remaining())
        {
            return false;
        }
        m.points.resize(pointCount);
        for (auto &p : m.points)
        {
            read_field(r, p);
        }
        m.triangles.resize(triangleCount);
        for (auto &t : m.triangles)
        {
            read_field(r, t);
        }
        return true;
    }

    struct AddHeightField
    {
        static constexpr MessageType kType = MessageType::AddHeightField;
        static constexpr std::size_t kMinBodySize = ShapeID::kWireSize + 16;

        ShapeID shape;
        std::uint32_t rows = 0;
        std::uint32_t columns = 0;
        float rowSpacing = 0.0f;
        float columnSpacing = 0.0f;
        // Row-major, rows * columns entries.
        std::vector<float> posts;

        std::size_t body_size() const noexcept { return kMinBodySize + posts.size() * 4; }
        bool operator==(const AddHeightField &) const = default;
    };

    inline void write_body(WireWriter &w, const AddHeightField &m)
    {
        write_field(w, m.shape);
        w.write_u32(m.rows);
        w.write_u32(m.columns);
        w.write_f32(m.rowSpacing);
        w.write_f32(m.columnSpacing);
        for (float h : m.posts)
        {
            w.write_f32(h);
        }
    }

    inline bool read_body(WireReader &r, AddHeightField &m)
    {
        read_field(r, m.shape);
        m.rows = r.read_u32();
        m.columns = r.read_u32();
        m.rowSpacing = r.read_f32();
        m.columnSpacing = r.read_f32();
        const std::uint64_t count = static_cast<std::uint64_t>(m.rows) * m.columns;
        if (!detail::elements_fit(r, count, 4))
        {
            return false;
        }
        m.posts.resize(static_cast<std::size_t>(count));
        for (auto &h : m.posts)
        {
            h = r.read_f32();
        }
        return true;
    }

    struct AttachShape
    {
        static constexpr MessageType kType = MessageType::AttachShape;
        static constexpr std::size_t kMinBodySize =
            ActorID::kWireSize + ShapeID::kWireSize + Material::kWireSize + Quat::kWireSize + Vector::kWireSize;

        ActorID actor;
        ShapeID shape;
        Material material;
        // Local pose of the shape relative to the actor.
        Quat orientation;
        Vector translation;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const AttachShape &) const = default;
    };

    inline void write_body(WireWriter &w, const AttachShape &m)
    {
        write_field(w, m.actor);
        write_field(w, m.shape);
        write_field(w, m.material);
        write_field(w, m.orientation);
        write_field(w, m.translation);
    }

    inline bool read_body(WireReader &r, AttachShape &m)
    {
        read_field(r, m.actor);
        read_field(r, m.shape);
        read_field(r, m.material);
        read_field(r, m.orientation);
        read_field(r, m.translation);
        return true;
    }

    struct UpdateShapeMaterial
    {
        static constexpr MessageType kType = MessageType::UpdateShapeMaterial;
        static constexpr std::size_t kMinBodySize = ActorID::kWireSize + ShapeID::kWireSize + Material::kWireSize;

        ActorID actor;
        ShapeID shape;
        Material material;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const UpdateShapeMaterial &) const = default;
    };

    inline void write_body(WireWriter &w, const UpdateShapeMaterial &m)
    {
        write_field(w, m.actor);
        write_field(w, m.shape);
        write_field(w, m.material);
    }

    inline bool read_body(WireReader &r, UpdateShapeMaterial &m)
    {
        read_field(r, m.actor);
        read_field(r, m.shape);
        read_field(r, m.material);
        return true;
    }

    struct DetachShape
    {
        static constexpr MessageType kType = MessageType::DetachShape;
        static constexpr std::size_t kMinBodySize = ActorID::kWireSize + ShapeID::kWireSize;

        ActorID actor;
        ShapeID shape;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const DetachShape &) const = default;
    };

    inline void write_body(WireWriter &w, const DetachShape &m)
    {
        write_field(w, m.actor);
        write_field(w, m.shape);
    }

    inline bool read_body(WireReader &r, DetachShape &m)
    {
        read_field(r, m.actor);
        read_field(r, m.shape);
        return true;
    }

    // ---- Collision notification ----

    struct ActorsCollided
    {
        static constexpr MessageType kType = MessageType::ActorsCollided;
        static constexpr std::size_t kMinBodySize = 2 * ActorID::kWireSize + 2 * Vector::kWireSize + 4;

        ActorID collidingActor;
        ActorID collidedActor;
        Vector contactPoint;
        Vector contactNormal;
        // Negative means the actors interpenetrate.
        float separation = 0.0f;

        std::size_t body_size() const noexcept { return kMinBodySize; }
        bool operator==(const ActorsCollided &) const = default;
    };

    inline void write_body(WireWriter &w, const ActorsCollided &m)
    {
        write_field(w, m.collidingActor);
        write_field(w, m.collidedActor);
        write_field(w, m.contactPoint);
        write_field(w, m.contactNormal);
        w.write_f32(m.separation);
    }

    inline bool read_body(WireReader &r, ActorsCollided &m)
    {
        read_field(r, m.collidingActor);
        read_field(r, m.collidedActor);
        read_field(r, m.contactPoint);
        read_field(r, m.contactNormal);
        m.separation = r.read_f32();
        return true;
    }

    // ---- Framing helpers ----

    template <class M>
    struct Decoded
    {
        MessageHeader header;
        M body;
    };

    template <class M>
    inline ByteBuffer encode_message(const M &m, std::uint32_t msgIndex, float timestamp = 0.0f)
    {
        WireWriter w(kHeaderSize + m.body_size());

        MessageHeader h;
        h.msgType = static_cast<std::uint16_t>(M::kType);
        h.msgIndex = msgIndex;
        h.timestamp = timestamp;
        write_header(w, h);
        write_body(w, m);

        // Length reflects the bytes actually produced for this body.
        if (w.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::runtime_error("encode_message: message exceeds 4 GiB");
        }
        w.patch_u32(kPacketLengthOffset, static_cast<std::uint32_t>(w.size()));
        return w.take();
    }

    inline std::optional<MessageHeader> peek_header(std::span<const std::byte> bytes)
    {
        if (bytes.size() < kHeaderSize)
        {
            Logger::instance().logf(LogLevel::Warn, "codec", "dropping message: %zu bytes is shorter than a header",
                                    bytes.size());
            return std::nullopt;
        }
        WireReader r(bytes);
        return read_header(r);
    }

    // Full validation + decode. Never throws for malformed input; rejected
    // messages are logged and reported as nullopt.
    template <class M>
    inline std::optional<Decoded<M>> decode_message(std::span<const std::byte> bytes)
    {
        auto header = peek_header(bytes);
        if (!header)
        {
            return std::nullopt;
        }

        auto &log = Logger::instance();
        if (header->version != kProtocolVersion)
        {
            log.logf(LogLevel::Warn, "codec", "dropping %s (index %u): protocol version %u, expected %u",
                     message_type_name(header->msgType), header->msgIndex,
                     static_cast<unsigned>(header->version), static_cast<unsigned>(kProtocolVersion));
            return std::nullopt;
        }
        if (header->msgType != static_cast<std::uint16_t>(M::kType))
        {
            log.logf(LogLevel::Warn, "codec", "dropping message: type %u where %s was expected",
                     static_cast<unsigned>(header->msgType), message_type_name(static_cast<std::uint16_t>(M::kType)));
            return std::nullopt;
        }

        // Trailing bytes past the declared length are not part of this message.
        const std::size_t available = std::min<std::size_t>(bytes.size(), header->length);
        if (available < kHeaderSize + M::kMinBodySize)
        {
            log.logf(LogLevel::Warn, "codec", "dropping %s (index %u): %zu bytes, need at least %zu",
                     message_type_name(header->msgType), header->msgIndex, available, kHeaderSize + M::kMinBodySize);
            return std::nullopt;
        }

        WireReader body(bytes.subspan(kHeaderSize, available - kHeaderSize));
        Decoded<M> out;
        out.header = *header;
        if (!read_body(body, out.body))
        {
            log.logf(LogLevel::Warn, "codec", "dropping %s (index %u): element counts exceed the %zu byte body",
                     message_type_name(header->msgType), header->msgIndex, available - kHeaderSize);
            return std::nullopt;
        }
        return out;
    }
}
