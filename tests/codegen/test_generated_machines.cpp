// Behavior of headers generated by tsmc at build time

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <unordered_set>

#include "Item_sm.h"
#include "Player_sm.h"
#include "Robot_sm.h"
#include "door_sm.h"
#include "std_sm.h"
#include "runtime/TableMachine.h"

namespace Robot = TSM::Generated::Robot;
namespace Player = TSM::Generated::Player;
namespace Item = TSM::Generated::Item;
namespace Door = TSM::Generated;
namespace Shadowing = TSM::Generated::std;

// The generated lookup is usable in constant expressions
static_assert(Robot::State{} == Robot::kInitialState);
static_assert(Robot::kInitialState == Robot::State::Off);
static_assert(Robot::processEvent(Robot::State::Off, Robot::Event::PowerOn) == Robot::State::Idle);
static_assert(!Robot::processEvent(Robot::State::Off, Robot::Event::Tick).has_value());
static_assert(noexcept(Robot::processEvent(Robot::State::Off, Robot::Event::Tick)));

TEST(GeneratedMachineTest, InitialStateIsDefault) {
    EXPECT_EQ(Robot::State{}, Robot::State::Off);
    EXPECT_EQ(Player::State{}, Player::State::Idle);
    EXPECT_EQ(Item::State{}, Item::State::Idle);
    EXPECT_EQ(Door::State{}, Door::State::Closed);
    EXPECT_EQ(Door::kInitialState, Door::State::Closed);
}

TEST(GeneratedMachineTest, EnumerationSizes) {
    EXPECT_EQ(Robot::kStateCount, 5u);
    EXPECT_EQ(Robot::kEventCount, 9u);
    EXPECT_EQ(Door::kStateCount, 4u);
    EXPECT_EQ(Door::kEventCount, 10u);
}

TEST(GeneratedMachineTest, RobotLifecycle) {
    Robot::State state = Robot::kInitialState;

    auto next = Robot::processEvent(state, Robot::Event::PowerOn);
    ASSERT_TRUE(next.has_value());
    state = *next;
    EXPECT_EQ(state, Robot::State::Idle);

    state = Robot::processEvent(state, Robot::Event::MoveTo).value();
    EXPECT_EQ(state, Robot::State::Moving);

    state = Robot::processEvent(state, Robot::Event::ObstacleDetected).value();
    EXPECT_EQ(state, Robot::State::Waiting);

    state = Robot::processEvent(state, Robot::Event::ObstacleClear).value();
    EXPECT_EQ(state, Robot::State::Moving);

    state = Robot::processEvent(state, Robot::Event::Arrive).value();
    EXPECT_EQ(state, Robot::State::Idle);
}

TEST(GeneratedMachineTest, InternalTransitionStaysInState) {
    EXPECT_EQ(Robot::processEvent(Robot::State::Moving, Robot::Event::Tick), Robot::State::Moving);
    EXPECT_EQ(Door::processEvent(Door::State::Opened, Door::Event::Knock), Door::State::Opened);
    EXPECT_EQ(Door::processEvent(Door::State::Locked, Door::Event::Kick), Door::State::Locked);
}

TEST(GeneratedMachineTest, UnlistedPairHasNoTransition) {
    EXPECT_FALSE(Robot::processEvent(Robot::State::Idle, Robot::Event::Tick).has_value());
    EXPECT_FALSE(Robot::processEvent(Robot::State::Off, Robot::Event::EmergencyStop).has_value());
    EXPECT_FALSE(Door::processEvent(Door::State::Locked, Door::Event::Open).has_value());
    EXPECT_FALSE(Door::processEvent(Door::State::Closed, Door::Event::Knock).has_value());
}

TEST(GeneratedMachineTest, MultiSourceClauseCoversEverySource) {
    for (auto state : {Robot::State::Idle, Robot::State::Moving, Robot::State::Waiting}) {
        EXPECT_EQ(Robot::processEvent(state, Robot::Event::EmergencyStop), Robot::State::EmergencyStopped);
    }
    for (auto state : {Player::State::Idle, Player::State::Walking}) {
        EXPECT_EQ(Player::processEvent(state, Player::Event::StartRunning), Player::State::Running);
    }
    EXPECT_FALSE(Player::processEvent(Player::State::Running, Player::Event::StartRunning).has_value());
}

TEST(GeneratedMachineTest, WildcardAppliesToEveryState) {
    for (size_t i = 0; i < Robot::kStateCount; ++i) {
        auto state = static_cast<Robot::State>(i);
        EXPECT_EQ(Robot::processEvent(state, Robot::Event::PowerOff), Robot::State::Off) << i;
    }
    for (size_t i = 0; i < Player::kStateCount; ++i) {
        auto state = static_cast<Player::State>(i);
        EXPECT_EQ(Player::processEvent(state, Player::Event::PickUpItem), Player::State::Idle) << i;
        EXPECT_EQ(Player::processEvent(state, Player::Event::DropItem), Player::State::Idle) << i;
    }
}

TEST(GeneratedMachineTest, ExplicitTransitionOverridesWildcard) {
    EXPECT_EQ(Door::processEvent(Door::State::Locked, Door::Event::Reset), Door::State::Locked);
    EXPECT_EQ(Door::processEvent(Door::State::Opened, Door::Event::Reset), Door::State::Closed);
    EXPECT_EQ(Door::processEvent(Door::State::Broken, Door::Event::Reset), Door::State::Closed);
    EXPECT_EQ(Door::processEvent(Door::State::Locked, Door::Event::Burn), Door::State::Broken);
}

TEST(GeneratedMachineTest, MachinesWithOverlappingNamesCoexist) {
    Player::State player = Player::State::Idle;
    Item::State item = Item::State::Idle;

    player = Player::processEvent(player, Player::Event::StartWalking).value();
    item = Item::processEvent(item, Item::Event::Draw).value();
    EXPECT_EQ(player, Player::State::Walking);
    EXPECT_EQ(item, Item::State::Ready);

    // DropItem exists in both machines with unrelated tables
    EXPECT_EQ(Player::processEvent(player, Player::Event::DropItem), Player::State::Idle);
    EXPECT_EQ(Item::processEvent(item, Item::Event::DropItem), Item::State::Idle);
    EXPECT_FALSE(Item::processEvent(item, Item::Event::CooldownComplete).has_value());
}

TEST(GeneratedMachineTest, FormattingCapability) {
    EXPECT_EQ(Robot::toString(Robot::State::EmergencyStopped), "EmergencyStopped");
    EXPECT_EQ(Robot::toString(Robot::Event::ObstacleClear), "ObstacleClear");

    std::ostringstream ss;
    ss << Door::State::Opened << " " << Door::Event::Slam;
    EXPECT_EQ(ss.str(), "Opened Slam");
}

TEST(GeneratedMachineTest, HashingCapability) {
    std::unordered_set<Robot::State, Robot::StateHash> visited;
    visited.insert(Robot::State::Off);
    visited.insert(Robot::State::Idle);
    visited.insert(Robot::State::Off);
    EXPECT_EQ(visited.size(), 2u);

    std::unordered_set<Door::Event, Door::EventHash> events = {Door::Event::Ram, Door::Event::Burn};
    EXPECT_EQ(events.count(Door::Event::Ram), 1u);

    EXPECT_EQ(Door::StateHash{}(Door::State::Broken), Door::StateHash{}(Door::State::Broken));
}

TEST(GeneratedMachineTest, OrderingAndDefaultCapabilities) {
    EXPECT_LT(Door::State::Closed, Door::State::Broken);
    EXPECT_EQ(Door::State{}, Door::kInitialState);
}

// The generated switch and the serialized table written by the same tsmc run agree
TEST(GeneratedMachineTest, GeneratedCodeMatchesSerializedTable) {
    std::string error;
    auto machine = TSM::TableMachine::loadFile(std::string(TSM_GENERATED_DIR) + "/Robot_table.json", &error);
    ASSERT_NE(machine, nullptr) << error;
    ASSERT_EQ(machine->stateCount(), Robot::kStateCount);
    ASSERT_EQ(machine->eventCount(), Robot::kEventCount);
    EXPECT_EQ(machine->initialState(), static_cast<size_t>(Robot::kInitialState));

    for (size_t s = 0; s < Robot::kStateCount; ++s) {
        for (size_t e = 0; e < Robot::kEventCount; ++e) {
            auto generated = Robot::processEvent(static_cast<Robot::State>(s), static_cast<Robot::Event>(e));
            auto interpreted = machine->processEvent(s, e);

            // Lookup is a pure function: asking again gives the same answer
            EXPECT_EQ(Robot::processEvent(static_cast<Robot::State>(s), static_cast<Robot::Event>(e)), generated);
            EXPECT_EQ(machine->processEvent(s, e), interpreted);

            ASSERT_EQ(generated.has_value(), interpreted.has_value()) << "state " << s << " event " << e;
            if (generated) {
                EXPECT_EQ(static_cast<size_t>(*generated), *interpreted);
                EXPECT_EQ(Robot::toString(*generated), machine->stateName(*interpreted));
            }
        }
    }
}

TEST(GeneratedMachineTest, MachineNamedStdCompilesAndRuns) {
    static_assert(Shadowing::kInitialState == Shadowing::State::Empty);

    auto loaded = Shadowing::processEvent(Shadowing::State::Empty, Shadowing::Event::Push);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, Shadowing::State::Loaded);
    EXPECT_EQ(Shadowing::processEvent(*loaded, Shadowing::Event::Push), Shadowing::State::Loaded);
    EXPECT_FALSE(Shadowing::processEvent(Shadowing::State::Empty, Shadowing::Event::Pop).has_value());

    std::unordered_set<Shadowing::State, Shadowing::StateHash> states = {Shadowing::State::Empty, *loaded};
    EXPECT_EQ(states.size(), 2u);
    EXPECT_EQ(Shadowing::toString(Shadowing::Event::Pop), "Pop");
}
