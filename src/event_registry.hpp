#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace apphys
{
    using SubscriptionId = std::uint64_t;

    // Subscriber list for one event. Subscribe/unsubscribe take the lock;
    // emit() copies the current list and invokes it unlocked, so handlers may
    // subscribe or unsubscribe (themselves included) while being called.
    template <class... Args>
    class EventRegistry
    {
    public:
        using Handler = std::function<void(Args...)>;

        SubscriptionId subscribe(Handler handler)
        {
            if (!handler)
            {
                throw std::runtime_error("subscribe: null handler");
            }
            std::lock_guard<std::mutex> lk(m_mu);
            const SubscriptionId id = ++m_lastId;
            m_handlers.emplace_back(id, std::make_shared<const Handler>(std::move(handler)));
            return id;
        }

        bool unsubscribe(SubscriptionId id)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            for (auto it = m_handlers.begin(); it != m_handlers.end(); ++it)
            {
                if (it->first == id)
                {
                    m_handlers.erase(it);
                    return true;
                }
            }
            return false;
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_handlers.size();
        }

        void clear()
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_handlers.clear();
        }

        void emit(const Args &...args) const
        {
            std::vector<std::shared_ptr<const Handler>> snapshot;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                snapshot.reserve(m_handlers.size());
                for (const auto &[id, h] : m_handlers)
                {
                    snapshot.push_back(h);
                }
            }
            for (const auto &h : snapshot)
            {
                (*h)(args...);
            }
        }

    private:
        mutable std::mutex m_mu;
        SubscriptionId m_lastId = 0;
        std::vector<std::pair<SubscriptionId, std::shared_ptr<const Handler>>> m_handlers;
    };
}
