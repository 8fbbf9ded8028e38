#include <gtest/gtest.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <glm/glm.hpp>

import Core;
import Input;

#include "InputTestHelpers.h"

using Input::ActionSamples;
using Input::DeviceCategory;
using Input::LogicalAction;
using Strings = std::vector<std::string>;

namespace
{
    ActionSamples MoveSample(float x, float y)
    {
        ActionSamples s{};
        s.Move = glm::vec2(x, y);
        return s;
    }

    ActionSamples PrimarySample(bool pressed)
    {
        ActionSamples s{};
        s.PrimaryInteract = pressed;
        return s;
    }

    class ActionRouterTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            Router.Configure(MakeAllMaps());
            ASSERT_TRUE(Router.SwitchMap(DeviceCategory::Keyboard));
        }

        Input::EventRegistry Events;
        Input::ActionRouter Router{Events};
        EventRecorder Recorder{Events};
    };
}

// -----------------------------------------------------------------------------
// Move
// -----------------------------------------------------------------------------

TEST_F(ActionRouterTest, Move_StartsThenStreamsThenCancels)
{
    Router.Tick(MoveSample(1.0f, 0.0f));
    EXPECT_EQ(Recorder.Take(), (Strings{"MoveStarted(1,0)", "Move(1,0)"}));
    EXPECT_TRUE(Router.GetState(LogicalAction::Move).IsHeld);

    Router.Tick(MoveSample(0.5f, 0.5f));
    EXPECT_EQ(Recorder.Take(), (Strings{"Move(0.5,0.5)"}));
    EXPECT_FLOAT_EQ(Router.GetMoveValue().x, 0.5f);

    Router.Tick(MoveSample(0.0f, 0.0f));
    EXPECT_EQ(Recorder.Take(), (Strings{"MoveCanceled"}));
    EXPECT_EQ(Router.GetMoveValue(), glm::vec2(0.0f));
    EXPECT_FALSE(Router.GetState(LogicalAction::Move).WasActiveLastTick);

    Router.Tick(MoveSample(0.0f, 0.0f));
    EXPECT_TRUE(Recorder.Take().empty());
}

TEST_F(ActionRouterTest, Move_SameValueStillStreams)
{
    Router.Tick(MoveSample(0.0f, 1.0f));
    Recorder.Take();

    Router.Tick(MoveSample(0.0f, 1.0f));
    Router.Tick(MoveSample(0.0f, 1.0f));
    EXPECT_EQ(Recorder.Take(), (Strings{"Move(0,1)", "Move(0,1)"}));
}

TEST_F(ActionRouterTest, Move_RestartAfterCancel)
{
    Router.Tick(MoveSample(1.0f, 0.0f));
    Router.Tick(MoveSample(0.0f, 0.0f));
    Recorder.Take();

    Router.Tick(MoveSample(0.0f, 1.0f));
    EXPECT_EQ(Recorder.Take(), (Strings{"MoveStarted(0,1)", "Move(0,1)"}));
}

// -----------------------------------------------------------------------------
// Triggers
// -----------------------------------------------------------------------------

TEST_F(ActionRouterTest, Primary_EdgesOnly)
{
    Router.Tick(PrimarySample(true));
    EXPECT_EQ(Recorder.Take(), (Strings{"PrimaryInteract"}));
    EXPECT_TRUE(Router.IsPrimaryHeld());
    EXPECT_TRUE(Router.GetState(LogicalAction::PrimaryInteract).Pressed);

    Router.Tick(PrimarySample(true));
    Router.Tick(PrimarySample(true));
    EXPECT_TRUE(Recorder.Take().empty());

    Router.Tick(PrimarySample(false));
    EXPECT_EQ(Recorder.Take(), (Strings{"PrimaryCanceled"}));
    EXPECT_FALSE(Router.IsPrimaryHeld());

    Router.Tick(PrimarySample(false));
    EXPECT_TRUE(Recorder.Take().empty());
}

TEST_F(ActionRouterTest, Secondary_EdgesOnly)
{
    ActionSamples held{};
    held.SecondaryInteract = true;

    Router.Tick(held);
    Router.Tick(held);
    Router.Tick(ActionSamples{});
    EXPECT_EQ(Recorder.Take(), (Strings{"SecondaryInteract", "SecondaryCanceled"}));
}

TEST_F(ActionRouterTest, Menu_HasNoCancel)
{
    ActionSamples menu{};
    menu.MenuButton = true;

    Router.Tick(menu);
    Router.Tick(menu);
    Router.Tick(ActionSamples{});
    Router.Tick(menu);
    EXPECT_EQ(Recorder.Take(), (Strings{"Menu", "Menu"}));
}

TEST_F(ActionRouterTest, SameTickOrder)
{
    ActionSamples all{};
    all.Move = glm::vec2(1.0f, 0.0f);
    all.PrimaryInteract = true;
    all.SecondaryInteract = true;
    all.MenuButton = true;

    Router.Tick(all);
    EXPECT_EQ(Recorder.Take(),
              (Strings{"MoveStarted(1,0)", "Move(1,0)", "PrimaryInteract", "SecondaryInteract", "Menu"}));

    Router.Tick(ActionSamples{});
    EXPECT_EQ(Recorder.Take(), (Strings{"MoveCanceled", "PrimaryCanceled", "SecondaryCanceled"}));
}

// -----------------------------------------------------------------------------
// Map switching
// -----------------------------------------------------------------------------

TEST_F(ActionRouterTest, SwitchMap_ResetsSilently)
{
    ActionSamples held{};
    held.Move = glm::vec2(1.0f, 0.0f);
    held.PrimaryInteract = true;
    Router.Tick(held);
    Recorder.Take();

    ASSERT_TRUE(Router.SwitchMap(DeviceCategory::Gamepad));
    EXPECT_TRUE(Recorder.Take().empty());
    EXPECT_FALSE(Router.IsPrimaryHeld());
    EXPECT_EQ(Router.GetMoveValue(), glm::vec2(0.0f));
    EXPECT_EQ(Router.GetActiveMap()->GetName(), "Gamepad");

    // Still held on the new device: fires again as a fresh activation.
    Router.Tick(held);
    EXPECT_EQ(Recorder.Take(), (Strings{"MoveStarted(1,0)", "Move(1,0)", "PrimaryInteract"}));
}

TEST_F(ActionRouterTest, UnboundActionsStayInert)
{
    ASSERT_TRUE(Router.SwitchMap(DeviceCategory::Touch));

    ActionSamples all{};
    all.Move = glm::vec2(1.0f, 1.0f);
    all.PrimaryInteract = true;
    all.SecondaryInteract = true;
    all.MenuButton = true;

    Router.Tick(all);
    EXPECT_EQ(Recorder.Take(), (Strings{"PrimaryInteract"}));
    EXPECT_FALSE(Router.GetState(LogicalAction::Move).IsHeld);
}

TEST_F(ActionRouterTest, MissingMap_DisablesRouter)
{
    Router.Configure({MakeKeyboardMap()});
    EXPECT_FALSE(Router.IsActive());

    EXPECT_FALSE(Router.SwitchMap(DeviceCategory::Touch));
    EXPECT_FALSE(Router.IsActive());
    EXPECT_EQ(Router.GetActiveMap(), nullptr);

    const uint64_t ticks = Router.GetTickCount();
    Router.Tick(PrimarySample(true));
    EXPECT_TRUE(Recorder.Take().empty());
    EXPECT_EQ(Router.GetTickCount(), ticks);
}

TEST_F(ActionRouterTest, SwitchToNone_Disables)
{
    EXPECT_FALSE(Router.SwitchMap(DeviceCategory::None));
    EXPECT_FALSE(Router.IsActive());
}

TEST_F(ActionRouterTest, Disable_DropsHeldState)
{
    Router.Tick(PrimarySample(true));
    Recorder.Take();

    Router.Disable();
    EXPECT_FALSE(Router.IsActive());
    EXPECT_FALSE(Router.IsPrimaryHeld());
    EXPECT_TRUE(Recorder.Take().empty());
}

TEST_F(ActionRouterTest, ListenerUnsubscribingDuringTick)
{
    int calls = 0;
    Input::ListenerHandle handle;
    auto subscribed = Events.Subscribe(Input::EventKind::PrimaryInteract, Input::TriggerCallback([&]
    {
        ++calls;
        Events.Unsubscribe(handle);
    }));
    ASSERT_TRUE(subscribed.has_value());
    handle = *subscribed;

    Router.Tick(PrimarySample(true));
    Router.Tick(PrimarySample(false));
    Router.Tick(PrimarySample(true));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(Recorder.Take(), (Strings{"PrimaryInteract", "PrimaryCanceled", "PrimaryInteract"}));
}

// -----------------------------------------------------------------------------
// Re-entrancy
// -----------------------------------------------------------------------------

TEST_F(ActionRouterTest, ResetFromListener_EndsTheTick)
{
    auto subscribed = Events.Subscribe(Input::EventKind::PrimaryInteract, Input::TriggerCallback([&]
    {
        EXPECT_TRUE(Router.IsEvaluating());
        Router.ResetStates();
    }));
    ASSERT_TRUE(subscribed.has_value());

    ActionSamples all{};
    all.Move = glm::vec2(1.0f, 0.0f);
    all.PrimaryInteract = true;
    all.SecondaryInteract = true;
    all.MenuButton = true;

    Router.Tick(all);
    EXPECT_EQ(Recorder.Take(), (Strings{"MoveStarted(1,0)", "Move(1,0)", "PrimaryInteract"}));
    EXPECT_FALSE(Router.IsEvaluating());
    EXPECT_FALSE(Router.GetState(LogicalAction::Move).WasActiveLastTick);
    EXPECT_EQ(Router.GetMoveValue(), glm::vec2(0.0f));
    EXPECT_FALSE(Router.IsPrimaryHeld());
    EXPECT_FALSE(Router.IsSecondaryHeld());
}

TEST_F(ActionRouterTest, DisableFromMoveStarted_SkipsMove)
{
    auto subscribed = Events.Subscribe(Input::EventKind::MoveStarted, Input::Vec2Callback([&](const glm::vec2&)
    {
        Router.Disable();
    }));
    ASSERT_TRUE(subscribed.has_value());

    ActionSamples held{};
    held.Move = glm::vec2(0.0f, 1.0f);
    held.PrimaryInteract = true;

    Router.Tick(held);
    EXPECT_EQ(Recorder.Take(), (Strings{"MoveStarted(0,1)"}));
    EXPECT_FALSE(Router.IsActive());
    EXPECT_FALSE(Router.GetState(LogicalAction::Move).IsHeld);
    EXPECT_FALSE(Router.IsPrimaryHeld());
}

TEST_F(ActionRouterTest, ThrowingListener_LeavesRouterUsable)
{
    bool shouldThrow = true;
    auto subscribed = Events.Subscribe(Input::EventKind::Menu, Input::TriggerCallback([&]
    {
        if (shouldThrow)
            throw std::runtime_error("listener failure");
    }));
    ASSERT_TRUE(subscribed.has_value());

    ActionSamples menu{};
    menu.MenuButton = true;
    EXPECT_THROW(Router.Tick(menu), std::runtime_error);
    EXPECT_FALSE(Router.IsEvaluating());
    EXPECT_FALSE(Events.IsDispatching());

    shouldThrow = false;
    Recorder.Take();
    Router.Tick(ActionSamples{});
    Router.Tick(menu);
    EXPECT_EQ(Recorder.Take(), (Strings{"Menu"}));
}
