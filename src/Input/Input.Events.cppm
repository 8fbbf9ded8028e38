module;
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <vector>
#include <glm/glm.hpp>

export module Input:Events;

import Core.Error;
import :Types;

export namespace Input
{
    // Generational handle returned by Subscribe. A handle whose slot was released
    // and reused no longer matches, so Unsubscribe on it is a harmless no-op.
    struct ListenerHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr ListenerHandle() = default;
        constexpr ListenerHandle(uint32_t index, uint32_t gen) : Index(index), Generation(gen) {}

        [[nodiscard]] constexpr bool IsValid() const noexcept { return Index != INVALID_INDEX; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return IsValid(); }

        auto operator<=>(const ListenerHandle&) const = default;
    };

    using Vec2Callback = std::function<void(const glm::vec2&)>;
    using TriggerCallback = std::function<void()>;

    // -------------------------------------------------------------------------
    // EventRegistry - per-kind ordered listener sets
    // -------------------------------------------------------------------------
    // Dispatch rules:
    //   - Listeners of one kind run in registration order.
    //   - Each Dispatch iterates a snapshot taken when it starts. Listeners
    //     subscribed during the pass wait for the next dispatch.
    //   - A listener unsubscribed during the pass (by itself or by another
    //     listener) is skipped from then on. Its callable is destroyed only
    //     after the outermost Dispatch returns, so a listener may safely
    //     unsubscribe itself from inside its own invocation.
    //
    // Not thread-safe. All calls come from the thread that ticks the InputSystem.
    // -------------------------------------------------------------------------
    class EventRegistry
    {
    public:
        EventRegistry() = default;
        ~EventRegistry() = default;

        EventRegistry(const EventRegistry&) = delete;
        EventRegistry& operator=(const EventRegistry&) = delete;

        // For MoveStarted and Move. Other kinds return TypeMismatch.
        [[nodiscard]] Core::Expected<ListenerHandle> Subscribe(EventKind kind, Vec2Callback callback);

        // For every kind without a payload. MoveStarted/Move return TypeMismatch.
        [[nodiscard]] Core::Expected<ListenerHandle> Subscribe(EventKind kind, TriggerCallback callback);

        // Returns false for invalid, stale or already removed handles.
        bool Unsubscribe(ListenerHandle handle);

        [[nodiscard]] bool IsSubscribed(ListenerHandle handle) const;

        void Dispatch(EventKind kind);
        void Dispatch(EventKind kind, const glm::vec2& value);

        [[nodiscard]] size_t ListenerCount(EventKind kind) const;
        [[nodiscard]] size_t TotalListenerCount() const;

        [[nodiscard]] bool IsDispatching() const { return m_DispatchDepth > 0; }

        // Forcibly unsubscribes every listener.
        void Clear();

    private:
        struct Listener
        {
            EventKind Kind = EventKind::Move;
            Vec2Callback OnVector;
            TriggerCallback OnTrigger;
        };

        struct Slot
        {
            std::unique_ptr<Listener> Data; // Heap address survives m_Slots growth during dispatch
            uint32_t Generation = 0;
            bool IsActive = false;
        };

        // Holds hard deletes until the outermost scope closes, even if a
        // listener throws.
        class DispatchScope
        {
        public:
            explicit DispatchScope(EventRegistry& registry);
            ~DispatchScope();

            DispatchScope(const DispatchScope&) = delete;
            DispatchScope& operator=(const DispatchScope&) = delete;

        private:
            EventRegistry& m_Registry;
        };

        [[nodiscard]] ListenerHandle Allocate(std::unique_ptr<Listener> listener);
        [[nodiscard]] Listener* Resolve(ListenerHandle handle) const;
        void Retire(ListenerHandle handle);
        void ProcessReleases();

        template <typename Invoke>
        void DispatchImpl(EventKind kind, Invoke&& invoke);

        std::vector<Slot> m_Slots;
        std::deque<uint32_t> m_FreeIndices;
        std::vector<ListenerHandle> m_PendingRelease;
        std::array<std::vector<ListenerHandle>, kEventKindCount> m_Listeners{};
        uint32_t m_DispatchDepth = 0;
    };
}
