#pragma once

#include "common.hpp"

#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

namespace apphys
{
    // Per-scene table of shapes shared by every actor of the same archetype
    // (e.g. one capsule for all avatars of a given size). The first acquire of
    // an archetype allocates an ID and runs the creation callback; later
    // acquires reuse it.
    class ShapeRegistry
    {
    public:
        using CreateFn = std::function<void(ShapeIndex)>;

        explicit ShapeRegistry(ShapeIndex firstId = 1) : m_nextId(firstId) {}

        // A second acquirer of an archetype still being created blocks until
        // the first creator's callback has returned. If the callback throws,
        // the archetype is forgotten and every waiter sees the same exception.
        ShapeIndex acquire(const std::string &archetype, const CreateFn &create)
        {
            std::unique_lock<std::mutex> lk(m_mu);
            auto it = m_shapes.find(archetype);
            if (it != m_shapes.end())
            {
                ++it->second.users;
                const ShapeIndex id = it->second.id;
                std::shared_future<void> ready = it->second.ready;
                lk.unlock();

                ready.get();
                return id;
            }

            const ShapeIndex id = m_nextId++;
            std::promise<void> created;
            m_shapes.emplace(archetype, Entry{id, 1, created.get_future().share()});
            lk.unlock();

            try
            {
                if (create)
                {
                    create(id);
                }
            }
            catch (...)
            {
                {
                    std::lock_guard<std::mutex> relock(m_mu);
                    auto failed = m_shapes.find(archetype);
                    if (failed != m_shapes.end() && failed->second.id == id)
                    {
                        m_shapes.erase(failed);
                    }
                }
                created.set_exception(std::current_exception());
                throw;
            }
            created.set_value();
            return id;
        }

        // Drops one user of the archetype. Returns the shape ID once the last
        // user is gone so the caller can remove the remote shape.
        std::optional<ShapeIndex> release(const std::string &archetype)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_shapes.find(archetype);
            if (it == m_shapes.end())
            {
                throw std::runtime_error("ShapeRegistry::release: unknown archetype '" + archetype + "'");
            }
            if (--it->second.users > 0)
            {
                return std::nullopt;
            }
            const ShapeIndex id = it->second.id;
            m_shapes.erase(it);
            return id;
        }

        std::optional<ShapeIndex> find(const std::string &archetype) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_shapes.find(archetype);
            if (it == m_shapes.end())
            {
                return std::nullopt;
            }
            return it->second.id;
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_shapes.size();
        }

    private:
        struct Entry
        {
            ShapeIndex id = 0;
            std::uint32_t users = 0;
            // Ready once the creation callback has returned.
            std::shared_future<void> ready;
        };

        mutable std::mutex m_mu;
        ShapeIndex m_nextId;
        std::unordered_map<std::string, Entry> m_shapes;
    };
}
