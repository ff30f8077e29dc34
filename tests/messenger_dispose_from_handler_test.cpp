/*
Purpose: Shutting the messenger down from inside one of its own events.

What this tests: With the internal update loop running, a logon-ready handler
calls dispose(). The call returns promptly on the loop thread, the messenger
reports itself uninitialized, both transports are disposed, and the loop thread
is joined later by the destructor. The messenger can then be initialized again.
*/

#include "messenger.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <thread>

int main()
{
    using namespace apphys;
    using Clock = std::chrono::steady_clock;

    Logger::instance().set_level(LogLevel::Off);

    RemotePhysicsConfig cfg;
    cfg.simulationID = 9;
    cfg.messengerInternalThread = true;

    auto reliable = std::make_shared<InProcTransport>();
    auto bestEffort = std::make_shared<InProcTransport>();

    {
        Messenger m;
        std::atomic<bool> handled{false};
        std::atomic<long long> disposeMs{-1};
        m.logon_ready().subscribe([&](SimulationId)
                                  {
            const auto start = Clock::now();
            m.dispose();
            disposeMs.store(std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
            handled.store(true); });

        m.initialize(cfg, reliable, bestEffort);
        reliable->deliver(encode_message(LogonReady{9}, 0));

        const auto deadline = Clock::now() + std::chrono::seconds(5);
        while (!handled.load() && Clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        assert(handled.load());
        // No self-wait for the shutdown grace period.
        assert(disposeMs.load() >= 0 && disposeMs.load() < 400);
        assert(!m.initialized());
        assert(!reliable->connected());
        assert(!bestEffort->connected());

        // Sends after dispose are dropped.
        m.advance_time(0.5f);
        assert(reliable->sent_count() == 0);

        // Re-initializing joins the stopped loop before starting a new one.
        auto reliable2 = std::make_shared<InProcTransport>();
        auto bestEffort2 = std::make_shared<InProcTransport>();
        m.initialize(cfg, reliable2, bestEffort2);
        assert(m.initialized());
        m.advance_time(0.5f);
        assert(reliable2->sent_count() == 1);
    }

    return 0;
}
