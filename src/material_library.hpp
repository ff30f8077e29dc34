#pragma once

#include "config.hpp"
#include "protocol.hpp"

#include <array>

namespace apphys
{
    // Surface presets a host assigns to primitives, in the host's material
    // numbering.
    enum class MaterialKind : std::uint32_t
    {
        Stone = 0,
        Metal = 1,
        Glass = 2,
        Wood = 3,
        Flesh = 4,
        Plastic = 5,
        Rubber = 6,
        Light = 7,
    };

    inline constexpr std::size_t kMaterialKindCount = 8;

    class MaterialLibrary
    {
    public:
        explicit MaterialLibrary(const RemotePhysicsConfig &cfg)
        {
            const float density = cfg.defaultDensity;
            set_(MaterialKind::Stone, density, 0.8f, 0.4f);
            set_(MaterialKind::Metal, density, 0.3f, 0.4f);
            set_(MaterialKind::Glass, density, 0.2f, 0.7f);
            set_(MaterialKind::Wood, density, 0.6f, 0.5f);
            set_(MaterialKind::Flesh, density, 0.9f, 0.3f);
            set_(MaterialKind::Plastic, density, 0.4f, 0.7f);
            set_(MaterialKind::Rubber, density, 0.9f, 0.9f);
            set_(MaterialKind::Light, density, cfg.defaultFriction, cfg.defaultRestitution);
        }

        const Material &get(MaterialKind kind) const noexcept { return get(static_cast<std::uint32_t>(kind)); }

        // Unknown indices resolve to Stone.
        const Material &get(std::uint32_t index) const noexcept
        {
            if (index >= kMaterialKindCount)
            {
                return m_materials[static_cast<std::size_t>(MaterialKind::Stone)];
            }
            return m_materials[index];
        }

    private:
        void set_(MaterialKind kind, float density, float friction, float restitution)
        {
            Material &m = m_materials[static_cast<std::size_t>(kind)];
            m.density = density;
            m.staticFriction = friction;
            m.kineticFriction = friction;
            m.restitution = restitution;
        }

        std::array<Material, kMaterialKindCount> m_materials{};
    };
}
