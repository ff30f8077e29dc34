/*
Purpose: Per-cycle send cap on the outgoing packet queue.

What this tests: Enqueuing more packets than the per-update cap releases exactly
the cap on the first cycle and the remainder on later cycles, oldest first.
*/

#include "transport.hpp"

#include <cassert>
#include <cstdint>

namespace
{
    apphys::ByteBuffer tagged(std::uint32_t n)
    {
        apphys::ByteBuffer b(4);
        std::memcpy(b.data(), &n, 4);
        return b;
    }

    std::uint32_t tag_of(const apphys::ByteBuffer &b)
    {
        std::uint32_t n = 0;
        std::memcpy(&n, b.data(), 4);
        return n;
    }
}

int main()
{
    const std::size_t cap = apphys::TransportOptions{}.maxSendPerUpdate;
    assert(cap == 50);

    apphys::PacketQueue q;
    for (std::uint32_t i = 0; i < 120; ++i)
    {
        q.push(tagged(i));
    }

    std::uint32_t expected = 0;
    const std::size_t perCycle[] = {50, 50, 20, 0};
    for (std::size_t want : perCycle)
    {
        auto batch = q.drain(cap);
        assert(batch.size() == want);
        for (const auto &p : batch)
        {
            assert(tag_of(p) == expected++);
        }
    }
    assert(q.empty());

    // Packets queued between cycles go behind the leftovers.
    for (std::uint32_t i = 0; i < 60; ++i)
    {
        q.push(tagged(i));
    }
    auto first = q.drain(cap);
    q.push(tagged(1000));
    auto second = q.drain(cap);
    assert(first.size() == 50);
    assert(second.size() == 11);
    assert(tag_of(second.front()) == 50);
    assert(tag_of(second.back()) == 1000);

    // pop() is FIFO as well.
    q.push(tagged(1));
    q.push(tagged(2));
    assert(tag_of(*q.pop()) == 1);
    assert(tag_of(*q.pop()) == 2);
    assert(!q.pop().has_value());

    return 0;
}
