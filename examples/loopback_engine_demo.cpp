#include "config.hpp"
#include "frame_assembler.hpp"
#include "material_library.hpp"
#include "messenger.hpp"
#include "shape_registry.hpp"
#include "tcp_transport.hpp"
#include "udp_transport.hpp"

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <thread>

namespace
{
    using namespace apphys;
    using boost::asio::ip::tcp;
    using boost::asio::ip::udp;

    struct Params
    {
        std::string configPath;
        std::uint32_t staticActors = 4;
        std::uint32_t dynamicActors = 4;
        std::uint32_t steps = 10;
        std::optional<LogLevel> logLevel;
    };

    bool parse_u32(std::string_view s, std::uint32_t &out)
    {
        unsigned long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size() || v > std::numeric_limits<std::uint32_t>::max())
        {
            return false;
        }
        out = static_cast<std::uint32_t>(v);
        return true;
    }

    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "Remote physics client against an in-process mock engine\n"
                  << "  --config PATH         INI file with a [RemotePhysics] section\n"
                  << "  --static N            static actors to create (default 4)\n"
                  << "  --dynamic N           dynamic actors to create (default 4)\n"
                  << "  --steps N             AdvanceTime requests to send (default 10)\n"
                  << "  --log-level L         error|warn|info|debug|trace|off\n";
        std::exit(2);
    }

    Params parse_args(int argc, char **argv)
    {
        Params p;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit();
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--config")
            {
                p.configPath = std::string(need());
            }
            else if (a == "--static")
            {
                if (!parse_u32(need(), p.staticActors))
                    usage_and_exit();
            }
            else if (a == "--dynamic")
            {
                if (!parse_u32(need(), p.dynamicActors))
                    usage_and_exit();
            }
            else if (a == "--steps")
            {
                if (!parse_u32(need(), p.steps))
                    usage_and_exit();
            }
            else if (a == "--log-level")
            {
                p.logLevel = parse_log_level(need());
                if (!p.logLevel)
                    usage_and_exit();
            }
            else
            {
                usage_and_exit();
            }
        }
        return p;
    }

    // Stand-in for the physics engine. Listens for the reliable channel on a TCP
    // port and for the best-effort channel on the UDP port with the same number.
    // Replies always go out over the TCP session. All state lives on the
    // io_context thread.
    class MockEngine
    {
    public:
        explicit MockEngine(boost::asio::io_context &io)
            : m_acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)),
              m_session(io),
              m_udp(io, udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), m_acceptor.local_endpoint().port())),
              m_framer(kHeaderSize, kPacketLengthOffset)
        {
        }

        std::uint16_t port() const { return m_acceptor.local_endpoint().port(); }

        void start()
        {
            m_acceptor.async_accept(m_session, [this](const boost::system::error_code &ec)
                                    {
                if (ec)
                {
                    Logger::instance().logf(LogLevel::Error, "engine", "accept failed: %s", ec.message().c_str());
                    return;
                }
                Logger::instance().logf(LogLevel::Info, "engine", "client connected");
                read_tcp_(); });
            read_udp_();
        }

    private:
        struct Body
        {
            Vector position;
            Quat orientation;
            Vector linearVelocity;
            Vector angularVelocity;
            float gravityModifier = 1.0f;
            bool reportCollisions = false;
        };

        void read_tcp_()
        {
            m_session.async_read_some(boost::asio::buffer(m_tcpBuf), [this](const boost::system::error_code &ec, std::size_t n)
                                      {
                if (ec)
                {
                    Logger::instance().logf(LogLevel::Info, "engine", "client closed: %s", ec.message().c_str());
                    return;
                }
                std::vector<ByteBuffer> frames;
                if (!m_framer.feed(std::span<const std::byte>(m_tcpBuf.data(), n), frames))
                {
                    Logger::instance().logf(LogLevel::Error, "engine", "framing error, dropping client");
                    boost::system::error_code ignored;
                    m_session.close(ignored);
                    return;
                }
                for (const auto &f : frames)
                {
                    handle_(f);
                }
                read_tcp_(); });
        }

        void read_udp_()
        {
            m_udp.async_receive_from(boost::asio::buffer(m_udpBuf), m_udpFrom, [this](const boost::system::error_code &ec, std::size_t n)
                                     {
                if (ec == boost::asio::error::operation_aborted)
                {
                    return;
                }
                if (!ec)
                {
                    handle_(ByteBuffer(m_udpBuf.begin(), m_udpBuf.begin() + static_cast<std::ptrdiff_t>(n)));
                }
                read_udp_(); });
        }

        template <typename M>
        void reply_(const M &msg)
        {
            if (!m_session.is_open())
            {
                return;
            }
            m_outgoing.push_back(encode_message(msg, m_replyIndex++));
            if (m_outgoing.size() == 1)
            {
                write_next_();
            }
        }

        void write_next_()
        {
            boost::asio::async_write(m_session, boost::asio::buffer(m_outgoing.front()),
                                     [this](const boost::system::error_code &ec, std::size_t)
                                     {
                                         if (ec)
                                         {
                                             m_outgoing.clear();
                                             return;
                                         }
                                         m_outgoing.pop_front();
                                         if (!m_outgoing.empty())
                                         {
                                             write_next_();
                                         }
                                     });
        }

        void handle_(const ByteBuffer &frame)
        {
            const auto h = peek_header(as_span(frame));
            if (!h)
            {
                return;
            }
            if (Logger::instance().enabled(LogLevel::Debug))
            {
                Logger::instance().logf(LogLevel::Debug, "engine", "received %s #%u (%zu bytes)",
                                        message_type_name(h->msgType), static_cast<unsigned>(h->msgIndex), frame.size());
            }

            switch (static_cast<MessageType>(h->msgType))
            {
            case MessageType::Logon:
                if (auto m = decode_message<Logon>(as_span(frame)))
                {
                    // Logon arrives on both channels.
                    if (!m_loggedOn)
                    {
                        m_loggedOn = true;
                        m_simID = m->body.simID;
                        reply_(LogonReady{m_simID});
                    }
                }
                break;
            case MessageType::CreateStaticActor:
                if (auto m = decode_message<CreateStaticActor>(as_span(frame)))
                {
                    Body &b = m_static[m->body.actor.actorID];
                    b.position = m->body.position;
                    b.orientation = m->body.orientation;
                    b.reportCollisions = (m->body.flags & ActorFlagReportCollisions) != 0;
                    reply_(SetStaticActor{m->body.actor, b.position, b.orientation});
                }
                break;
            case MessageType::CreateDynamicActor:
                if (auto m = decode_message<CreateDynamicActor>(as_span(frame)))
                {
                    Body &b = m_dynamic[m->body.actor.actorID];
                    b.position = m->body.position;
                    b.orientation = m->body.orientation;
                    b.gravityModifier = m->body.gravityModifier;
                    b.linearVelocity = m->body.linearVelocity;
                    b.angularVelocity = m->body.angularVelocity;
                    b.reportCollisions = (m->body.flags & ActorFlagReportCollisions) != 0;
                    reply_(SetDynamicActor{m->body.actor, b.position, b.orientation, b.gravityModifier,
                                           b.linearVelocity, b.angularVelocity});
                }
                break;
            case MessageType::UpdateActorMass:
                if (auto m = decode_message<UpdateActorMass>(as_span(frame)))
                {
                    m_mass[m->body.actor.actorID] = m->body.value;
                }
                break;
            case MessageType::GetActorMass:
                if (auto m = decode_message<GetActorMass>(as_span(frame)))
                {
                    auto it = m_mass.find(m->body.id.actorID);
                    if (it == m_mass.end())
                    {
                        reply_(ErrorReport{h->msgIndex, "no mass recorded for actor"});
                    }
                    else
                    {
                        reply_(UpdateActorMass{m->body.id, it->second});
                    }
                }
                break;
            case MessageType::RemoveActor:
                if (auto m = decode_message<RemoveActor>(as_span(frame)))
                {
                    m_static.erase(m->body.id.actorID);
                    m_dynamic.erase(m->body.id.actorID);
                    m_mass.erase(m->body.id.actorID);
                }
                break;
            case MessageType::AdvanceTime:
                if (auto m = decode_message<AdvanceTime>(as_span(frame)))
                {
                    step_(m->body.time);
                    reply_(TimeAdvanced{m_simID});
                }
                break;
            case MessageType::Logoff:
                Logger::instance().logf(LogLevel::Info, "engine", "client logged off");
                m_loggedOn = false;
                break;
            default:
                break;
            }
        }

        // Integrates every dynamic body and reports contacts with the plane at z == 0.
        void step_(float dt)
        {
            constexpr float kGravity = -9.80665f;
            for (auto &[id, b] : m_dynamic)
            {
                b.linearVelocity.z += kGravity * b.gravityModifier * dt;
                b.position.x += b.linearVelocity.x * dt;
                b.position.y += b.linearVelocity.y * dt;
                b.position.z += b.linearVelocity.z * dt;

                if (b.position.z < 0.0f)
                {
                    const float depth = b.position.z;
                    b.position.z = 0.0f;
                    b.linearVelocity.z = 0.0f;
                    if (b.reportCollisions && !m_static.empty())
                    {
                        ActorsCollided c;
                        c.collidingActor = ActorID{m_simID, id};
                        c.collidedActor = ActorID{m_simID, m_static.begin()->first};
                        c.contactPoint = b.position;
                        c.contactNormal = Vector{0.0f, 0.0f, 1.0f};
                        c.separation = depth;
                        reply_(c);
                    }
                }

                reply_(SetDynamicActor{ActorID{m_simID, id}, b.position, b.orientation, b.gravityModifier,
                                       b.linearVelocity, b.angularVelocity});
            }
        }

        tcp::acceptor m_acceptor;
        tcp::socket m_session;
        udp::socket m_udp;
        udp::endpoint m_udpFrom;
        FrameAssembler m_framer;

        std::array<std::byte, 4096> m_tcpBuf{};
        std::array<std::byte, 65536> m_udpBuf{};
        std::deque<ByteBuffer> m_outgoing;
        std::uint32_t m_replyIndex = 0;

        bool m_loggedOn = false;
        SimulationId m_simID = 0;
        std::map<ActorIndex, Body> m_static;
        std::map<ActorIndex, Body> m_dynamic;
        std::map<ActorIndex, float> m_mass;
    };

    template <typename Pred>
    bool wait_until(Pred pred, std::chrono::milliseconds timeout)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred())
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }
}

int main(int argc, char **argv)
{
    const Params p = parse_args(argc, argv);

    RemotePhysicsConfig cfg;
    if (!p.configPath.empty())
    {
        std::ifstream in(p.configPath);
        if (!in)
        {
            std::cerr << "cannot open " << p.configPath << "\n";
            return 1;
        }
        try
        {
            cfg = load_config_ini(in);
        }
        catch (const std::exception &e)
        {
            std::cerr << "config error: " << e.what() << "\n";
            return 1;
        }
    }
    Logger::instance().set_level(p.logLevel.value_or(cfg.logLevel));

    boost::asio::io_context engineIo;
    MockEngine engine(engineIo);
    engine.start();
    std::thread engineThread([&]
                             { engineIo.run(); });

    cfg.remoteAddress = "127.0.0.1";
    cfg.remotePort = engine.port();

    std::atomic<bool> ready{false};
    std::atomic<std::uint32_t> staticUpdates{0};
    std::atomic<std::uint32_t> dynamicUpdates{0};
    std::atomic<std::uint32_t> collisions{0};
    std::atomic<std::uint32_t> steps{0};
    std::atomic<std::uint32_t> errors{0};

    int rc = 0;
    try
    {
        const TransportOptions opts = make_transport_options(cfg);
        auto reliable = std::make_shared<TcpTransport>(opts);
        auto bestEffort = std::make_shared<UdpTransport>(opts);
        if (!reliable->connected())
        {
            throw std::runtime_error("could not reach the mock engine");
        }

        Messenger messenger;
        messenger.logon_ready().subscribe([&](SimulationId id)
                                          {
            std::cout << "logon ready, simulation " << id << "\n";
            ready.store(true); });
        messenger.static_actor_updated().subscribe([&](ActorIndex id, Vector pos, Quat)
                                                   {
            std::cout << "static " << id << " at (" << pos.x << ", " << pos.y << ", " << pos.z << ")\n";
            staticUpdates.fetch_add(1); });
        messenger.dynamic_actor_updated().subscribe([&](ActorIndex, Vector, Quat, Vector, Vector)
                                                    { dynamicUpdates.fetch_add(1); });
        messenger.actors_collided().subscribe([&](ActorIndex collided, ActorIndex colliding, Vector, Vector, float separation)
                                              {
            std::cout << "collision " << colliding << " -> " << collided << " separation " << separation << "\n";
            collisions.fetch_add(1); });
        messenger.engine_error().subscribe([&](std::uint32_t msgIndex, const std::string &reason)
                                           {
            std::cout << "engine error on message " << msgIndex << ": " << reason << "\n";
            errors.fetch_add(1); });
        messenger.time_advanced().subscribe([&]
                                            { steps.fetch_add(1); });

        messenger.initialize(cfg, reliable, bestEffort);
        messenger.logon(cfg.simulationID, cfg.simulationName);
        if (!wait_until([&]
                        { return ready.load(); },
                        std::chrono::milliseconds(5000)))
        {
            throw std::runtime_error("no LogonReady from the mock engine");
        }

        messenger.initialize_world(Vector{0.0f, 0.0f, cfg.gravity}, cfg.defaultFriction, cfg.defaultFriction,
                                   cfg.defaultRestitution, cfg.collisionMargin, cfg.groundPlaneID,
                                   cfg.groundPlaneHeight, Vector{0.0f, 0.0f, 1.0f});

        for (std::uint32_t i = 0; i < p.staticActors; ++i)
        {
            messenger.create_static_actor(100 + i, Vector{static_cast<float>(i), 0.0f, 0.0f}, Quat{}, false);
        }
        // Every dynamic actor shares one box shape.
        const MaterialLibrary materials(cfg);
        ShapeRegistry shapes;
        const std::string boxArchetype = "box:0.5x0.5x0.5";
        for (std::uint32_t i = 0; i < p.dynamicActors; ++i)
        {
            const ShapeIndex box = shapes.acquire(boxArchetype, [&](ShapeIndex id)
                                                  { messenger.add_box(id, 0.5f, 0.5f, 0.5f); });
            messenger.create_dynamic_actor(200 + i, Vector{static_cast<float>(i), 0.0f, 2.0f}, Quat{}, 1.0f,
                                           Vector{0.5f, 0.0f, 0.0f}, Vector{}, cfg.reportNonAvatarCollisions);
            messenger.attach_shape(200 + i, box, materials.get(MaterialKind::Metal), Quat{}, Vector{});
            messenger.update_actor_mass(200 + i, 10.0f + static_cast<float>(i));
        }
        if (p.dynamicActors > 0)
        {
            messenger.get_actor_mass(200);
        }
        // Nothing recorded for this one; the engine answers with an error.
        messenger.get_actor_mass(999);

        for (std::uint32_t s = 0; s < p.steps; ++s)
        {
            messenger.advance_time(cfg.physicsTimeStep);
        }

        const bool done = wait_until([&]
                                     { return steps.load() == p.steps && staticUpdates.load() == p.staticActors; },
                                     std::chrono::milliseconds(10000));

        for (std::uint32_t i = 0; i < p.dynamicActors; ++i)
        {
            messenger.remove_actor(200 + i);
            if (const auto shape = shapes.release(boxArchetype))
            {
                messenger.remove_shape(*shape);
            }
        }

        messenger.logoff();
        // Let the update loop flush Logoff before tearing down.
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        messenger.dispose();

        std::cout << "static updates: " << staticUpdates.load() << "\n"
                  << "dynamic updates: " << dynamicUpdates.load() << "\n"
                  << "collisions: " << collisions.load() << "\n"
                  << "steps acknowledged: " << steps.load() << "/" << p.steps << "\n"
                  << "engine errors: " << errors.load() << "\n";
        if (!done)
        {
            std::cerr << "timed out waiting for the engine\n";
            rc = 1;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "error: " << e.what() << "\n";
        rc = 1;
    }

    engineIo.stop();
    engineThread.join();
    return rc;
}
