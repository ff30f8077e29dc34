#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace apphys
{
    using ByteBuffer = std::vector<std::byte>;

    using SimulationId = std::uint32_t;
    using ActorIndex = std::uint32_t;
    using ShapeIndex = std::uint32_t;
    using JointIndex = std::uint32_t;

    inline ByteBuffer bytes_from_string(std::string_view s)
    {
        ByteBuffer out(s.size());
        if (!s.empty())
        {
            std::memcpy(out.data(), s.data(), s.size());
        }
        return out;
    }

    inline std::span<const std::byte> as_span(const ByteBuffer &b) noexcept
    {
        return std::span<const std::byte>(b.data(), b.size());
    }
}
