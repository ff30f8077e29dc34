#pragma once

#include "config.hpp"
#include "event_registry.hpp"
#include "log.hpp"
#include "messages.hpp"
#include "transport.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace apphys
{
    // APP client: one method per outbound command, one event per inbound
    // notification. Calls made before initialize() are silently ignored.
    class Messenger
    {
    public:
        Messenger() = default;
        ~Messenger() { dispose(); }

        Messenger(const Messenger &) = delete;
        Messenger &operator=(const Messenger &) = delete;

        void initialize(const RemotePhysicsConfig &cfg,
                        std::shared_ptr<IPacketTransport> reliable,
                        std::shared_ptr<IPacketTransport> bestEffort)
        {
            if (!reliable || !bestEffort)
            {
                throw std::invalid_argument("Messenger::initialize: null transport");
            }

            {
                std::lock_guard<std::mutex> lk(m_sendMu);
                if (m_initialized)
                {
                    throw std::runtime_error("Messenger::initialize: already initialized");
                }

                reliable->initialize_packet_parameters(kHeaderSize, kPacketLengthOffset);
                bestEffort->initialize_packet_parameters(kHeaderSize, kPacketLengthOffset);

                m_reliable = std::move(reliable);
                m_bestEffort = std::move(bestEffort);
                m_maxInboundPerUpdate = cfg.maxInboundPerUpdate;
                m_highFrequencyOnBestEffort = cfg.highFrequencyOnBestEffort;
                m_msgIndex = 0;
                m_simID.store(cfg.simulationID);
                m_initialized = true;
            }

            if (cfg.messengerInternalThread)
            {
                // A loop stopped from its own handler has not been joined yet.
                if (m_thread.joinable())
                {
                    m_thread.join();
                }
                m_stop.store(false);
                m_loopDonePromise = std::promise<void>();
                m_loopDone = m_loopDonePromise.get_future();
                m_thread = std::thread([this]
                                       { run_loop_(); });
            }
        }

        bool initialized() const
        {
            std::lock_guard<std::mutex> lk(m_sendMu);
            return m_initialized;
        }

        // Stops the internal loop (bounded grace, then join) and disposes both
        // transports. Called from an event handler on the loop thread, it only
        // asks the loop to stop; the join happens in a later dispose() or the
        // destructor.
        void dispose()
        {
            m_stop.store(true);
            if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id())
            {
                if (m_loopDone.wait_for(kShutdownGrace) != std::future_status::ready)
                {
                    Logger::instance().logf(LogLevel::Warn, "messenger", "update loop still running after %lld ms grace",
                                            static_cast<long long>(kShutdownGrace.count()));
                }
                m_thread.join();
            }

            std::shared_ptr<IPacketTransport> reliable;
            std::shared_ptr<IPacketTransport> bestEffort;
            {
                std::lock_guard<std::mutex> lk(m_sendMu);
                if (!m_initialized)
                {
                    return;
                }
                m_initialized = false;
                reliable = std::move(m_reliable);
                bestEffort = std::move(m_bestEffort);
            }
            reliable->dispose();
            bestEffort->dispose();
        }

        // Index the next outbound message will carry.
        std::uint32_t next_message_index() const
        {
            std::lock_guard<std::mutex> lk(m_sendMu);
            return m_msgIndex;
        }

        SimulationId simulation_id() const noexcept { return m_simID.load(); }

        // Drives the transports when they have no thread of their own, then
        // dispatches up to the configured number of inbound messages per channel.
        void update()
        {
            std::shared_ptr<IPacketTransport> reliable;
            std::shared_ptr<IPacketTransport> bestEffort;
            std::size_t cap = 0;
            {
                std::lock_guard<std::mutex> lk(m_sendMu);
                if (!m_initialized)
                {
                    return;
                }
                reliable = m_reliable;
                bestEffort = m_bestEffort;
                cap = m_maxInboundPerUpdate;
            }

            if (!reliable->self_driven())
            {
                reliable->update();
            }
            if (!bestEffort->self_driven())
            {
                bestEffort->update();
            }

            drain_(*reliable, cap);
            drain_(*bestEffort, cap);
        }

        // ---- Events ----

        EventRegistry<SimulationId> &logon_ready() { return m_logonReady; }
        EventRegistry<ActorIndex, Vector, Quat> &static_actor_updated() { return m_staticActorUpdated; }
        EventRegistry<ActorIndex, Vector, Quat, Vector, Vector> &dynamic_actor_updated() { return m_dynamicActorUpdated; }
        EventRegistry<ActorIndex, float> &actor_mass_updated() { return m_actorMassUpdated; }
        EventRegistry<std::uint32_t, std::string> &engine_error() { return m_engineError; }
        // (collidedActor, collidingActor, contactPoint, contactNormal, separation)
        EventRegistry<ActorIndex, ActorIndex, Vector, Vector, float> &actors_collided() { return m_actorsCollided; }
        EventRegistry<> &time_advanced() { return m_timeAdvanced; }

        // ---- Simulation control ----

        // Sent on both channels; the remote side may see it twice.
        void logon(SimulationId simID, std::string_view simulationName)
        {
            std::lock_guard<std::mutex> lk(m_sendMu);
            if (!m_initialized)
            {
                return;
            }
            m_simID.store(simID);

            Logon msg;
            msg.simID = simID;
            msg.name = std::string(simulationName.substr(0, kSimulationNameSize));

            const ByteBuffer packet = encode_message(msg, m_msgIndex);
            const bool viaReliable = m_reliable->send_packet(packet);
            const bool viaBestEffort = m_bestEffort->send_packet(packet);
            if (viaReliable || viaBestEffort)
            {
                ++m_msgIndex;
            }
            else
            {
                Logger::instance().logf(LogLevel::Warn, "messenger", "logon for simulation %u not accepted by either channel", simID);
            }
        }

        void logoff()
        {
            Logoff msg;
            msg.simID = m_simID.load();
            send_(msg, Channel::Reliable);
        }

        void advance_time(float step)
        {
            AdvanceTime msg;
            msg.simID = m_simID.load();
            msg.time = step;
            send_(msg, Channel::Reliable);
        }

        void initialize_world(const Vector &gravity, float staticFriction, float kineticFriction, float restitution,
                              float collisionMargin, ActorIndex groundPlaneID, float groundPlaneHeight,
                              const Vector &groundPlaneNormal)
        {
            SetWorld msg;
            msg.groundPlane = actor_(groundPlaneID);
            msg.gravity = gravity;
            msg.staticFriction = staticFriction;
            msg.kineticFriction = kineticFriction;
            msg.restitution = restitution;
            msg.collisionMargin = collisionMargin;
            msg.groundPlaneHeight = groundPlaneHeight;
            msg.groundPlaneNormal = groundPlaneNormal;
            send_(msg, Channel::Reliable);
        }

        // ---- Actors ----

        void create_static_actor(ActorIndex actorID, const Vector &position, const Quat &orientation, bool reportCollisions)
        {
            CreateStaticActor msg;
            msg.actor = actor_(actorID);
            msg.position = position;
            msg.orientation = orientation;
            msg.flags = reportCollisions ? ActorFlagReportCollisions : ActorFlagNone;
            send_(msg, Channel::Reliable);
        }

        void create_dynamic_actor(ActorIndex actorID, const Vector &position, const Quat &orientation, float gravityModifier,
                                  const Vector &linearVelocity, const Vector &angularVelocity, bool reportCollisions)
        {
            CreateDynamicActor msg;
            msg.actor = actor_(actorID);
            msg.position = position;
            msg.orientation = orientation;
            msg.gravityModifier = gravityModifier;
            msg.linearVelocity = linearVelocity;
            msg.angularVelocity = angularVelocity;
            msg.flags = reportCollisions ? ActorFlagReportCollisions : ActorFlagNone;
            send_(msg, Channel::Reliable);
        }

        void set_static_actor(ActorIndex actorID, const Vector &position, const Quat &orientation)
        {
            SetStaticActor msg;
            msg.actor = actor_(actorID);
            msg.position = position;
            msg.orientation = orientation;
            send_(msg, Channel::HighFrequency);
        }

        void set_dynamic_actor(ActorIndex actorID, const Vector &position, const Quat &orientation, float gravityModifier,
                               const Vector &linearVelocity, const Vector &angularVelocity)
        {
            SetDynamicActor msg;
            msg.actor = actor_(actorID);
            msg.position = position;
            msg.orientation = orientation;
            msg.gravityModifier = gravityModifier;
            msg.linearVelocity = linearVelocity;
            msg.angularVelocity = angularVelocity;
            send_(msg, Channel::HighFrequency);
        }

        void update_actor_position(ActorIndex actorID, const Vector &position)
        {
            send_(UpdateActorPosition{actor_(actorID), position}, Channel::HighFrequency);
        }

        void update_actor_orientation(ActorIndex actorID, const Quat &orientation)
        {
            send_(UpdateActorOrientation{actor_(actorID), orientation}, Channel::HighFrequency);
        }

        void update_actor_gravity_modifier(ActorIndex actorID, float gravityModifier)
        {
            send_(UpdateActorGravityModifier{actor_(actorID), gravityModifier}, Channel::Reliable);
        }

        void update_actor_velocity(ActorIndex actorID, const Vector &velocity)
        {
            send_(UpdateActorLinearVelocity{actor_(actorID), velocity}, Channel::HighFrequency);
        }

        void update_actor_angular_velocity(ActorIndex actorID, const Vector &velocity)
        {
            send_(UpdateActorAngularVelocity{actor_(actorID), velocity}, Channel::HighFrequency);
        }

        void update_actor_mass(ActorIndex actorID, float mass)
        {
            send_(UpdateActorMass{actor_(actorID), mass}, Channel::Reliable);
        }

        // The engine answers with an UpdateActorMass notification.
        void get_actor_mass(ActorIndex actorID) { send_(GetActorMass{actor_(actorID)}, Channel::Reliable); }

        void remove_actor(ActorIndex actorID) { send_(RemoveActor{actor_(actorID)}, Channel::Reliable); }

        // ---- Joints ----

        void add_joint(JointIndex jointID,
                       ActorIndex actor1ID, const Vector &actor1Translation, const Quat &actor1Orientation,
                       ActorIndex actor2ID, const Vector &actor2Translation, const Quat &actor2Orientation,
                       const Vector &linearLowerLimits, const Vector &linearUpperLimits,
                       const Vector &angularLowerLimits, const Vector &angularUpperLimits)
        {
            AddJoint msg;
            msg.joint = JointID{m_simID.load(), jointID};
            msg.actor1 = actor_(actor1ID);
            msg.orientation1 = actor1Orientation;
            msg.translation1 = actor1Translation;
            msg.actor2 = actor_(actor2ID);
            msg.orientation2 = actor2Orientation;
            msg.translation2 = actor2Translation;
            msg.linearLowerLimits = linearLowerLimits;
            msg.linearUpperLimits = linearUpperLimits;
            msg.angularLowerLimits = angularLowerLimits;
            msg.angularUpperLimits = angularUpperLimits;
            send_(msg, Channel::Reliable);
        }

        void remove_joint(JointIndex jointID)
        {
            send_(RemoveJoint{JointID{m_simID.load(), jointID}}, Channel::Reliable);
        }

        // ---- Shapes ----

        void add_sphere(ShapeIndex shapeID, const Vector &origin, float radius)
        {
            send_(AddSphere{shape_(shapeID), origin, radius}, Channel::Reliable);
        }

        void add_plane(ShapeIndex shapeID, const Vector &normal, float constant)
        {
            send_(AddPlane{shape_(shapeID), normal, constant}, Channel::Reliable);
        }

        void add_capsule(ShapeIndex shapeID, float radius, float height)
        {
            send_(AddCapsule{shape_(shapeID), radius, height}, Channel::Reliable);
        }

        void add_box(ShapeIndex shapeID, float length, float width, float height)
        {
            send_(AddBox{shape_(shapeID), length, width, height}, Channel::Reliable);
        }

        void add_convex_mesh(ShapeIndex shapeID, std::span<const Vector> points)
        {
            AddConvexMesh msg;
            msg.shape = shape_(shapeID);
            msg.points.assign(points.begin(), points.end());
            send_(msg, Channel::Reliable);
        }

        // `indices` is a flat list, three per triangle.
        void add_triangle_mesh(ShapeIndex shapeID, std::span<const Vector> points, std::span<const std::uint32_t> indices)
        {
            if (indices.size() % 3 != 0)
            {
                Logger::instance().logf(LogLevel::Warn, "messenger", "triangle mesh %u: ignoring %zu trailing indices",
                                        shapeID, indices.size() % 3);
            }

            AddTriangleMesh msg;
            msg.shape = shape_(shapeID);
            msg.points.assign(points.begin(), points.end());
            msg.triangles.reserve(indices.size() / 3);
            for (std::size_t i = 0; i + 2 < indices.size(); i += 3)
            {
                msg.triangles.push_back(IndexVector{indices[i], indices[i + 1], indices[i + 2]});
            }
            send_(msg, Channel::Reliable);
        }

        // `posts` is row-major and must hold rows * columns heights.
        void add_height_field(ShapeIndex shapeID, std::uint32_t rows, std::uint32_t columns,
                              float rowSpacing, float columnSpacing, std::span<const float> posts)
        {
            if (static_cast<std::uint64_t>(rows) * columns != posts.size())
            {
                Logger::instance().logf(LogLevel::Error, "messenger", "height field %u: %zu posts for a %ux%u grid; not sent",
                                        shapeID, posts.size(), rows, columns);
                return;
            }

            AddHeightField msg;
            msg.shape = shape_(shapeID);
            msg.rows = rows;
            msg.columns = columns;
            msg.rowSpacing = rowSpacing;
            msg.columnSpacing = columnSpacing;
            msg.posts.assign(posts.begin(), posts.end());
            send_(msg, Channel::Reliable);
        }

        void remove_shape(ShapeIndex shapeID) { send_(RemoveShape{shape_(shapeID)}, Channel::Reliable); }

        void attach_shape(ActorIndex actorID, ShapeIndex shapeID, const Material &material,
                          const Quat &orientation, const Vector &translation)
        {
            AttachShape msg;
            msg.actor = actor_(actorID);
            msg.shape = shape_(shapeID);
            msg.material = material;
            msg.orientation = orientation;
            msg.translation = translation;
            send_(msg, Channel::Reliable);
        }

        void update_shape_material(ActorIndex actorID, ShapeIndex shapeID, const Material &material)
        {
            send_(UpdateShapeMaterial{actor_(actorID), shape_(shapeID), material}, Channel::Reliable);
        }

        void detach_shape(ActorIndex actorID, ShapeIndex shapeID)
        {
            send_(DetachShape{actor_(actorID), shape_(shapeID)}, Channel::Reliable);
        }

        // ---- Dynamics ----

        void apply_force(ActorIndex actorID, const Vector &force)
        {
            send_(ApplyForce{actor_(actorID), force}, Channel::HighFrequency);
        }

        void apply_torque(ActorIndex actorID, const Vector &torque)
        {
            send_(ApplyTorque{actor_(actorID), torque}, Channel::HighFrequency);
        }

    private:
        enum class Channel : std::uint8_t
        {
            Reliable,
            // Best-effort when configured for it, reliable otherwise.
            HighFrequency,
        };

        static constexpr std::chrono::milliseconds kShutdownGrace{500};
        static constexpr std::chrono::milliseconds kLoopInterval{10};

        ActorID actor_(ActorIndex id) const noexcept { return ActorID{m_simID.load(), id}; }
        ShapeID shape_(ShapeIndex id) const noexcept { return ShapeID{m_simID.load(), id}; }

        // msgIndex advances only once the transport has accepted the packet.
        template <class M>
        void send_(const M &msg, Channel channel)
        {
            std::lock_guard<std::mutex> lk(m_sendMu);
            if (!m_initialized)
            {
                return;
            }

            IPacketTransport &t = (channel == Channel::HighFrequency && m_highFrequencyOnBestEffort) ? *m_bestEffort : *m_reliable;
            if (t.send_packet(encode_message(msg, m_msgIndex)))
            {
                ++m_msgIndex;
            }
            else
            {
                Logger::instance().logf(LogLevel::Debug, "messenger", "%s not sent: channel is not accepting packets",
                                        message_type_name(static_cast<std::uint16_t>(M::kType)));
            }
        }

        void drain_(IPacketTransport &t, std::size_t cap)
        {
            for (std::size_t i = 0; i < cap; ++i)
            {
                auto packet = t.get_incoming_packet();
                if (!packet)
                {
                    return;
                }
                dispatch_(as_span(*packet));
            }
        }

        void dispatch_(std::span<const std::byte> bytes)
        {
            // Only the type is read here; decode_message rejects bad versions and sizes.
            const auto header = peek_header(bytes);
            if (!header)
            {
                return;
            }

            switch (static_cast<MessageType>(header->msgType))
            {
            case MessageType::LogonReady:
                if (auto m = decode_message<LogonReady>(bytes))
                {
                    m_logonReady.emit(m->body.simID);
                }
                break;
            case MessageType::SetStaticActor:
                if (auto m = decode_message<SetStaticActor>(bytes))
                {
                    m_staticActorUpdated.emit(m->body.actor.actorID, m->body.position, m->body.orientation);
                }
                break;
            case MessageType::SetDynamicActor:
                if (auto m = decode_message<SetDynamicActor>(bytes))
                {
                    m_dynamicActorUpdated.emit(m->body.actor.actorID, m->body.position, m->body.orientation,
                                               m->body.linearVelocity, m->body.angularVelocity);
                }
                break;
            case MessageType::UpdateActorMass:
                if (auto m = decode_message<UpdateActorMass>(bytes))
                {
                    m_actorMassUpdated.emit(m->body.actor.actorID, m->body.value);
                }
                break;
            case MessageType::Error:
                if (auto m = decode_message<ErrorReport>(bytes))
                {
                    Logger::instance().logf(LogLevel::Warn, "messenger", "remote engine rejected message %u: %s",
                                            m->body.msgIndex, m->body.reason.c_str());
                    m_engineError.emit(m->body.msgIndex, m->body.reason);
                }
                break;
            case MessageType::ActorsCollided:
                if (auto m = decode_message<ActorsCollided>(bytes))
                {
                    m_actorsCollided.emit(m->body.collidedActor.actorID, m->body.collidingActor.actorID,
                                          m->body.contactPoint, m->body.contactNormal, m->body.separation);
                }
                break;
            case MessageType::TimeAdvanced:
                if (auto m = decode_message<TimeAdvanced>(bytes))
                {
                    if (m->body.simID == m_simID.load())
                    {
                        m_timeAdvanced.emit();
                    }
                }
                break;
            default:
                Logger::instance().logf(LogLevel::Trace, "messenger", "ignoring inbound %s (type %u)",
                                        message_type_name(header->msgType), static_cast<unsigned>(header->msgType));
                break;
            }
        }

        void run_loop_()
        {
            while (!m_stop.load())
            {
                try
                {
                    update();
                }
                catch (const std::exception &e)
                {
                    Logger::instance().logf(LogLevel::Error, "messenger", "update failed: %s", e.what());
                }
                std::this_thread::sleep_for(kLoopInterval);
            }
            m_loopDonePromise.set_value();
        }

        mutable std::mutex m_sendMu;
        bool m_initialized = false;
        std::shared_ptr<IPacketTransport> m_reliable;
        std::shared_ptr<IPacketTransport> m_bestEffort;
        std::uint32_t m_msgIndex = 0;
        std::size_t m_maxInboundPerUpdate = 5000;
        bool m_highFrequencyOnBestEffort = false;

        std::atomic<SimulationId> m_simID{0};

        EventRegistry<SimulationId> m_logonReady;
        EventRegistry<ActorIndex, Vector, Quat> m_staticActorUpdated;
        EventRegistry<ActorIndex, Vector, Quat, Vector, Vector> m_dynamicActorUpdated;
        EventRegistry<ActorIndex, float> m_actorMassUpdated;
        EventRegistry<std::uint32_t, std::string> m_engineError;
        EventRegistry<ActorIndex, ActorIndex, Vector, Vector, float> m_actorsCollided;
        EventRegistry<> m_timeAdvanced;

        std::atomic<bool> m_stop{false};
        std::promise<void> m_loopDonePromise;
        std::future<void> m_loopDone;
        std::thread m_thread;
    };
}
