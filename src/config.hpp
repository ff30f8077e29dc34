#pragma once

#include "common.hpp"
#include "log.hpp"
#include "transport.hpp"

#include <charconv>
#include <chrono>
#include <istream>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace apphys
{
    struct RemotePhysicsConfig
    {
        // Remote engine endpoint; both channels use the same address and port.
        std::string remoteAddress = "127.0.0.1";
        std::uint16_t remotePort = 30000;

        SimulationId simulationID = 0;
        std::string simulationName;

        // Seconds per AdvanceTime step.
        float physicsTimeStep = 0.89f;

        float defaultFriction = 0.2f;
        float defaultDensity = 7700.0f;
        float defaultRestitution = 0.0f;

        // Acceleration along Z, m/s^2.
        float gravity = -9.80665f;
        float collisionMargin = 0.04f;

        ActorIndex groundPlaneID = 0;
        float groundPlaneHeight = -10.0f;

        float terrainFriction = 0.2f;
        float terrainRestitution = 0.0f;
        float terrainCollisionMargin = 0.04f;

        // Threading per layer: true runs a private poll loop, false expects
        // the owner to call update().
        bool packetManagerInternalThread = true;
        bool messengerInternalThread = true;

        bool reportNonAvatarCollisions = true;

        // Route position/orientation/velocity/force updates over UDP.
        bool highFrequencyOnBestEffort = false;

        // Zero waits for the connect without a bound.
        std::chrono::milliseconds connectTimeout{10000};

        std::size_t maxSendPerUpdate = 50;
        std::size_t maxInboundPerUpdate = 5000;

        LogLevel logLevel = LogLevel::Warn;
    };

    namespace detail
    {
        inline std::string_view trim(std::string_view s) noexcept
        {
            const char *ws = " \t\r\n";
            const auto b = s.find_first_not_of(ws);
            if (b == std::string_view::npos)
            {
                return {};
            }
            const auto e = s.find_last_not_of(ws);
            return s.substr(b, e - b + 1);
        }

        inline bool iequals(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i)
            {
                char x = a[i];
                char y = b[i];
                if (x >= 'A' && x <= 'Z')
                    x = static_cast<char>(x - 'A' + 'a');
                if (y >= 'A' && y <= 'Z')
                    y = static_cast<char>(y - 'A' + 'a');
                if (x != y)
                {
                    return false;
                }
            }
            return true;
        }

        [[noreturn]] inline void bad_value(std::string_view key, std::string_view value)
        {
            throw std::runtime_error("config: bad value for '" + std::string(key) + "': '" + std::string(value) + "'");
        }

        template <class T>
        T parse_unsigned(std::string_view key, std::string_view s)
        {
            unsigned long long v = 0;
            auto r = std::from_chars(s.data(), s.data() + s.size(), v);
            if (r.ec != std::errc() || r.ptr != s.data() + s.size() || v > std::numeric_limits<T>::max())
            {
                bad_value(key, s);
            }
            return static_cast<T>(v);
        }

        inline float parse_float(std::string_view key, std::string_view s)
        {
            float v = 0.0f;
            auto r = std::from_chars(s.data(), s.data() + s.size(), v);
            if (r.ec != std::errc() || r.ptr != s.data() + s.size())
            {
                bad_value(key, s);
            }
            return v;
        }

        inline bool parse_bool(std::string_view key, std::string_view s)
        {
            if (iequals(s, "true") || iequals(s, "yes") || iequals(s, "on") || s == "1")
            {
                return true;
            }
            if (iequals(s, "false") || iequals(s, "no") || iequals(s, "off") || s == "0")
            {
                return false;
            }
            bad_value(key, s);
        }
    }

    // Sets one option by its INI key (case-insensitive). Returns false for an
    // unknown key; throws std::runtime_error for a malformed value.
    inline bool apply_config_option(RemotePhysicsConfig &cfg, std::string_view key, std::string_view value)
    {
        using detail::iequals;
        using detail::parse_bool;
        using detail::parse_float;

        if (iequals(key, "RemoteAddress"))
            cfg.remoteAddress = std::string(value);
        else if (iequals(key, "RemotePort"))
            cfg.remotePort = detail::parse_unsigned<std::uint16_t>(key, value);
        else if (iequals(key, "SimulationID"))
            cfg.simulationID = detail::parse_unsigned<SimulationId>(key, value);
        else if (iequals(key, "SimulationName"))
            cfg.simulationName = std::string(value);
        else if (iequals(key, "PhysicsTimeStep"))
            cfg.physicsTimeStep = parse_float(key, value);
        else if (iequals(key, "DefaultFriction"))
            cfg.defaultFriction = parse_float(key, value);
        else if (iequals(key, "DefaultDensity"))
            cfg.defaultDensity = parse_float(key, value);
        else if (iequals(key, "DefaultRestitution"))
            cfg.defaultRestitution = parse_float(key, value);
        else if (iequals(key, "Gravity"))
            cfg.gravity = parse_float(key, value);
        else if (iequals(key, "CollisionMargin"))
            cfg.collisionMargin = parse_float(key, value);
        else if (iequals(key, "GroundPlaneID"))
            cfg.groundPlaneID = detail::parse_unsigned<ActorIndex>(key, value);
        else if (iequals(key, "GroundPlaneHeight"))
            cfg.groundPlaneHeight = parse_float(key, value);
        else if (iequals(key, "TerrainFriction"))
            cfg.terrainFriction = parse_float(key, value);
        else if (iequals(key, "TerrainRestitution"))
            cfg.terrainRestitution = parse_float(key, value);
        else if (iequals(key, "TerrainCollisionMargin"))
            cfg.terrainCollisionMargin = parse_float(key, value);
        else if (iequals(key, "PacketManagerInternalThread"))
            cfg.packetManagerInternalThread = parse_bool(key, value);
        else if (iequals(key, "MessengerInternalThread"))
            cfg.messengerInternalThread = parse_bool(key, value);
        else if (iequals(key, "ReportNonAvatarCollisions"))
            cfg.reportNonAvatarCollisions = parse_bool(key, value);
        else if (iequals(key, "HighFrequencyOnBestEffort"))
            cfg.highFrequencyOnBestEffort = parse_bool(key, value);
        else if (iequals(key, "ConnectTimeoutMs"))
            cfg.connectTimeout = std::chrono::milliseconds(detail::parse_unsigned<std::uint32_t>(key, value));
        else if (iequals(key, "MaxSendPerUpdate"))
            cfg.maxSendPerUpdate = detail::parse_unsigned<std::uint32_t>(key, value);
        else if (iequals(key, "MaxInboundPerUpdate"))
            cfg.maxInboundPerUpdate = detail::parse_unsigned<std::uint32_t>(key, value);
        else if (iequals(key, "LogLevel"))
        {
            auto lvl = parse_log_level(value);
            if (!lvl)
            {
                detail::bad_value(key, value);
            }
            cfg.logLevel = *lvl;
        }
        else
            return false;
        return true;
    }

    // Reads `key = value` pairs from the named [section] of an INI stream.
    // Keys outside the section are ignored; unknown keys inside it are logged.
    inline RemotePhysicsConfig load_config_ini(std::istream &in, std::string_view section = "RemotePhysics")
    {
        RemotePhysicsConfig cfg;
        std::string line;
        bool inSection = false;
        std::size_t lineNo = 0;

        while (std::getline(in, line))
        {
            ++lineNo;
            std::string_view s = detail::trim(line);
            if (s.empty() || s.front() == ';' || s.front() == '#')
            {
                continue;
            }
            if (s.front() == '[')
            {
                if (s.back() != ']')
                {
                    throw std::runtime_error("config: unterminated section header on line " + std::to_string(lineNo));
                }
                inSection = detail::iequals(detail::trim(s.substr(1, s.size() - 2)), section);
                continue;
            }
            if (!inSection)
            {
                continue;
            }

            const auto eq = s.find('=');
            if (eq == std::string_view::npos)
            {
                throw std::runtime_error("config: expected key = value on line " + std::to_string(lineNo));
            }
            const auto key = detail::trim(s.substr(0, eq));
            const auto value = detail::trim(s.substr(eq + 1));
            if (!apply_config_option(cfg, key, value))
            {
                Logger::instance().logf(LogLevel::Warn, "config", "ignoring unknown option '%.*s' on line %zu",
                                        static_cast<int>(key.size()), key.data(), lineNo);
            }
        }
        return cfg;
    }

    inline TransportOptions make_transport_options(const RemotePhysicsConfig &cfg)
    {
        TransportOptions o;
        o.remoteAddress = cfg.remoteAddress;
        o.remotePort = cfg.remotePort;
        o.internalThread = cfg.packetManagerInternalThread;
        o.connectTimeout = cfg.connectTimeout;
        o.maxSendPerUpdate = cfg.maxSendPerUpdate;
        return o;
    }
}
