module;
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

module Input:Events.Impl;

import Core.Error;
import Core.Logging;
import :Types;
import :Events;

namespace Input
{
    // -------------------------------------------------------------------------
    // Subscription
    // -------------------------------------------------------------------------

    Core::Expected<ListenerHandle> EventRegistry::Subscribe(EventKind kind, Vec2Callback callback)
    {
        if (!CarriesVector(kind))
        {
            Core::Log::Warn("EventRegistry: {} has no vector payload", ToString(kind));
            return Core::Err<ListenerHandle>(Core::ErrorCode::TypeMismatch);
        }
        if (!callback)
            return Core::Err<ListenerHandle>(Core::ErrorCode::InvalidArgument);

        auto listener = std::make_unique<Listener>();
        listener->Kind = kind;
        listener->OnVector = std::move(callback);
        return Allocate(std::move(listener));
    }

    Core::Expected<ListenerHandle> EventRegistry::Subscribe(EventKind kind, TriggerCallback callback)
    {
        if (CarriesVector(kind))
        {
            Core::Log::Warn("EventRegistry: {} requires a vector listener", ToString(kind));
            return Core::Err<ListenerHandle>(Core::ErrorCode::TypeMismatch);
        }
        if (!callback)
            return Core::Err<ListenerHandle>(Core::ErrorCode::InvalidArgument);

        auto listener = std::make_unique<Listener>();
        listener->Kind = kind;
        listener->OnTrigger = std::move(callback);
        return Allocate(std::move(listener));
    }

    bool EventRegistry::Unsubscribe(ListenerHandle handle)
    {
        Listener* listener = Resolve(handle);
        if (!listener)
            return false;

        auto& ordered = m_Listeners[static_cast<size_t>(listener->Kind)];
        std::erase(ordered, handle);
        Retire(handle);
        return true;
    }

    bool EventRegistry::IsSubscribed(ListenerHandle handle) const
    {
        return Resolve(handle) != nullptr;
    }

    // -------------------------------------------------------------------------
    // Dispatch
    // -------------------------------------------------------------------------

    template <typename Invoke>
    void EventRegistry::DispatchImpl(EventKind kind, Invoke&& invoke)
    {
        const auto& ordered = m_Listeners[static_cast<size_t>(kind)];
        if (ordered.empty())
            return;

        // Snapshot: the live list may change while listeners run.
        const std::vector<ListenerHandle> snapshot = ordered;

        DispatchScope scope(*this);
        for (const ListenerHandle handle : snapshot)
        {
            if (Listener* listener = Resolve(handle))
            {
                invoke(*listener);
            }
        }
    }

    void EventRegistry::Dispatch(EventKind kind)
    {
        DispatchImpl(kind, [](const Listener& listener) {
            if (listener.OnTrigger) listener.OnTrigger();
        });
    }

    void EventRegistry::Dispatch(EventKind kind, const glm::vec2& value)
    {
        DispatchImpl(kind, [&value](const Listener& listener) {
            if (listener.OnVector) listener.OnVector(value);
        });
    }

    // -------------------------------------------------------------------------
    // Metadata
    // -------------------------------------------------------------------------

    size_t EventRegistry::ListenerCount(EventKind kind) const
    {
        return m_Listeners[static_cast<size_t>(kind)].size();
    }

    size_t EventRegistry::TotalListenerCount() const
    {
        size_t count = 0;
        for (const auto& ordered : m_Listeners)
            count += ordered.size();
        return count;
    }

    void EventRegistry::Clear()
    {
        // Released callables may unsubscribe others; keep the lists out of reach.
        DispatchScope scope(*this);
        for (auto& ordered : m_Listeners)
        {
            const std::vector<ListenerHandle> detached = std::move(ordered);
            ordered.clear();
            for (const ListenerHandle handle : detached)
                Retire(handle);
        }
    }

    // -------------------------------------------------------------------------
    // Internal
    // -------------------------------------------------------------------------

    EventRegistry::DispatchScope::DispatchScope(EventRegistry& registry)
        : m_Registry(registry)
    {
        ++m_Registry.m_DispatchDepth;
    }

    EventRegistry::DispatchScope::~DispatchScope()
    {
        if (--m_Registry.m_DispatchDepth == 0)
            m_Registry.ProcessReleases();
    }

    ListenerHandle EventRegistry::Allocate(std::unique_ptr<Listener> listener)
    {
        uint32_t index;
        if (!m_FreeIndices.empty())
        {
            index = m_FreeIndices.front();
            m_FreeIndices.pop_front();
        }
        else
        {
            index = static_cast<uint32_t>(m_Slots.size());
            m_Slots.emplace_back();
        }

        Slot& slot = m_Slots[index];
        const EventKind kind = listener->Kind;
        slot.Data = std::move(listener);
        ++slot.Generation;
        slot.IsActive = true;

        const ListenerHandle handle{index, slot.Generation};
        m_Listeners[static_cast<size_t>(kind)].push_back(handle);
        return handle;
    }

    EventRegistry::Listener* EventRegistry::Resolve(ListenerHandle handle) const
    {
        if (!handle.IsValid() || handle.Index >= m_Slots.size())
            return nullptr;

        const Slot& slot = m_Slots[handle.Index];
        if (!slot.IsActive || slot.Generation != handle.Generation)
            return nullptr;

        return slot.Data.get();
    }

    void EventRegistry::Retire(ListenerHandle handle)
    {
        Slot& slot = m_Slots[handle.Index];
        slot.IsActive = false; // Soft delete immediately so dispatch skips it

        // Defer the hard delete while a listener may still be on the call stack.
        m_PendingRelease.push_back(handle);
        if (m_DispatchDepth == 0)
            ProcessReleases();
    }

    void EventRegistry::ProcessReleases()
    {
        // Destroying a callable may run arbitrary destructors; take the list first.
        std::vector<ListenerHandle> pending = std::move(m_PendingRelease);
        m_PendingRelease.clear();

        for (const ListenerHandle handle : pending)
        {
            Slot& slot = m_Slots[handle.Index];
            if (!slot.IsActive && slot.Generation == handle.Generation && slot.Data)
            {
                std::unique_ptr<Listener> released = std::move(slot.Data);
                m_FreeIndices.push_back(handle.Index);
                released.reset();
            }
        }
    }
}
