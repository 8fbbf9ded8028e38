module;
#include <optional>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

module Input:Router.Impl;

import Core.Logging;
import :Types;
import :ActionMap;
import :Events;
import :Router;

namespace Input
{
    namespace
    {
        [[nodiscard]] inline bool IsNonZero(const glm::vec2& v)
        {
            return v.x != 0.0f || v.y != 0.0f;
        }
    }

    ActionRouter::ActionRouter(EventRegistry& events)
        : m_Events(events)
    {
    }

    // -------------------------------------------------------------------------
    // Map management
    // -------------------------------------------------------------------------

    void ActionRouter::Configure(std::vector<ActionMap> maps)
    {
        Disable();
        m_Maps = std::move(maps);
    }

    const ActionMap* ActionRouter::FindMap(DeviceCategory category) const
    {
        for (const ActionMap& map : m_Maps)
        {
            if (map.GetCategory() == category)
                return &map;
        }
        return nullptr;
    }

    bool ActionRouter::SwitchMap(DeviceCategory category)
    {
        // Held state belongs to the previous map; drop it before anything else.
        ResetStates();

        const ActionMap* map = category == DeviceCategory::None ? nullptr : FindMap(category);
        if (!map)
        {
            m_Active = {};
            return false;
        }

        m_Active = Resolve(*map);
        for (LogicalAction action : kAllActions)
        {
            if (!m_Active.IsBound(action))
                Core::Log::Debug("ActionRouter: map '{}' has no binding for {}, action stays inert",
                                 map->GetName(), ToString(action));
        }
        return true;
    }

    void ActionRouter::Disable()
    {
        ResetStates();
        m_Active = {};
    }

    void ActionRouter::ResetStates()
    {
        if (m_Evaluating)
        {
            m_ResetPending = true;
            return;
        }
        m_States.fill(ActionState{});
    }

    ActionRouter::EvaluationScope::EvaluationScope(ActionRouter& router)
        : m_Router(router)
    {
        m_Router.m_Evaluating = true;
    }

    ActionRouter::EvaluationScope::~EvaluationScope()
    {
        m_Router.m_Evaluating = false;
        if (std::exchange(m_Router.m_ResetPending, false))
            m_Router.m_States.fill(ActionState{});
    }

    // -------------------------------------------------------------------------
    // Evaluation
    // -------------------------------------------------------------------------

    void ActionRouter::Tick(const ActionSamples& samples)
    {
        if (!IsActive() || m_Evaluating)
            return;

        ++m_TickCount;
        EvaluationScope scope(*this);

        // Unbound actions read as permanently inactive under this map.
        const auto bound = [this](LogicalAction action) { return m_Active.IsBound(action); };

        EvaluateMove(bound(LogicalAction::Move) ? samples.Move : glm::vec2(0.0f));
        if (m_ResetPending)
            return;

        EvaluateTrigger(LogicalAction::PrimaryInteract,
                        bound(LogicalAction::PrimaryInteract) && samples.PrimaryInteract,
                        EventKind::PrimaryInteract, EventKind::PrimaryCanceled);
        if (m_ResetPending)
            return;

        EvaluateTrigger(LogicalAction::SecondaryInteract,
                        bound(LogicalAction::SecondaryInteract) && samples.SecondaryInteract,
                        EventKind::SecondaryInteract, EventKind::SecondaryCanceled);
        if (m_ResetPending)
            return;

        EvaluateTrigger(LogicalAction::MenuButton,
                        bound(LogicalAction::MenuButton) && samples.MenuButton,
                        EventKind::Menu, std::nullopt);
    }

    void ActionRouter::EvaluateMove(const glm::vec2& sample)
    {
        ActionState& state = m_States[IndexOf(LogicalAction::Move)];

        if (IsNonZero(sample))
        {
            if (!state.WasActiveLastTick)
            {
                state.WasActiveLastTick = true;
                state.IsHeld = true;
                m_Events.Dispatch(EventKind::MoveStarted, sample);
                if (m_ResetPending)
                    return;
            }
            // Streaming: every active tick, including the first.
            state.Vector = sample;
            m_Events.Dispatch(EventKind::Move, sample);
            return;
        }

        if (state.WasActiveLastTick)
        {
            state = ActionState{};
            m_Events.Dispatch(EventKind::MoveCanceled);
        }
    }

    void ActionRouter::EvaluateTrigger(LogicalAction action, bool sample, EventKind pressedEvent,
                                       std::optional<EventKind> releasedEvent)
    {
        ActionState& state = m_States[IndexOf(action)];

        if (sample && !state.WasActiveLastTick)
        {
            state.Pressed = true;
            state.IsHeld = true;
            state.WasActiveLastTick = true;
            m_Events.Dispatch(pressedEvent);
        }
        else if (!sample && state.WasActiveLastTick)
        {
            state = ActionState{};
            if (releasedEvent)
                m_Events.Dispatch(*releasedEvent);
        }
    }
}
