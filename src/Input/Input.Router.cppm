module;
#include <array>
#include <cstdint>
#include <optional>
#include <vector>
#include <glm/glm.hpp>

export module Input:Router;

import :Types;
import :ActionMap;
import :Events;

export namespace Input
{
    // Runtime record for one logical action. Vector is meaningful for Move,
    // Pressed for the three triggers.
    struct ActionState
    {
        glm::vec2 Vector{0.0f};
        bool Pressed = false;
        bool IsHeld = false;
        bool WasActiveLastTick = false;
    };

    // -------------------------------------------------------------------------
    // ActionRouter - edge detection and event publication
    // -------------------------------------------------------------------------
    // Owns the configured action maps and the four ActionState records. Every
    // map switch resets all four states before anything is evaluated against
    // the new map. With no map for the selected category the router is
    // disabled: Tick does nothing and no event fires.
    //
    // Per tick, events fire synchronously in the fixed order
    //   MoveStarted, Move, MoveCanceled, Primary*, Secondary*, Menu.
    //
    // A reset requested by a listener during Tick (ResetStates, SwitchMap,
    // Disable) ends the pass after the current dispatch; the states are
    // cleared once evaluation unwinds.
    // -------------------------------------------------------------------------
    class ActionRouter
    {
    public:
        explicit ActionRouter(EventRegistry& events);

        ActionRouter(const ActionRouter&) = delete;
        ActionRouter& operator=(const ActionRouter&) = delete;

        // Replaces the map set and disables the router. Maps are expected to
        // have passed ValidateActionMaps.
        void Configure(std::vector<ActionMap> maps);

        // Reset all states, then activate the map for the category.
        // Returns false (router disabled) if no map is registered for it.
        bool SwitchMap(DeviceCategory category);

        // Reset all states and drop the active map.
        void Disable();

        // Reset all states without firing events; the active map is kept.
        void ResetStates();

        [[nodiscard]] bool IsEvaluating() const { return m_Evaluating; }

        void Tick(const ActionSamples& samples);

        [[nodiscard]] bool IsActive() const { return m_Active.Map != nullptr; }
        [[nodiscard]] const ActionMap* GetActiveMap() const { return m_Active.Map; }
        [[nodiscard]] const ResolvedActionMap& GetResolved() const { return m_Active; }
        [[nodiscard]] const ActionMap* FindMap(DeviceCategory category) const;
        [[nodiscard]] const std::vector<ActionMap>& GetMaps() const { return m_Maps; }

        [[nodiscard]] const ActionState& GetState(LogicalAction action) const { return m_States[IndexOf(action)]; }
        [[nodiscard]] glm::vec2 GetMoveValue() const { return GetState(LogicalAction::Move).Vector; }
        [[nodiscard]] bool IsPrimaryHeld() const { return GetState(LogicalAction::PrimaryInteract).IsHeld; }
        [[nodiscard]] bool IsSecondaryHeld() const { return GetState(LogicalAction::SecondaryInteract).IsHeld; }

        [[nodiscard]] uint64_t GetTickCount() const { return m_TickCount; }

    private:
        // Marks the evaluation pass and applies a deferred reset on exit,
        // including when a listener throws.
        class EvaluationScope
        {
        public:
            explicit EvaluationScope(ActionRouter& router);
            ~EvaluationScope();

            EvaluationScope(const EvaluationScope&) = delete;
            EvaluationScope& operator=(const EvaluationScope&) = delete;

        private:
            ActionRouter& m_Router;
        };

        void EvaluateMove(const glm::vec2& sample);
        void EvaluateTrigger(LogicalAction action, bool sample, EventKind pressedEvent, std::optional<EventKind> releasedEvent);

        EventRegistry& m_Events;
        std::vector<ActionMap> m_Maps;
        ResolvedActionMap m_Active{};
        std::array<ActionState, kLogicalActionCount> m_States{};
        uint64_t m_TickCount = 0;
        bool m_Evaluating = false;
        bool m_ResetPending = false;
    };
}
