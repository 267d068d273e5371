#include <gtest/gtest.h>
#include "../../src/leader/leader_state.h"
#include "../../src/common/errors.h"
#include <sstream>

using namespace Shepherd;

TEST(LeaderStateTest, EveryStateSurvivesPersistence) {
    WaitingBarrierState waiting;
    waiting.lease_id = 7001;
    waiting.barrier_key = "v1/barriers/b";
    waiting.wait_for = {"v1/consumer-groups/cg/instance-locks/i1", "v1/consumer-groups/cg/instance-locks/i2"};

    std::vector<LeaderState> states = {
        InitState{},
        LostProducerState{"p1", "e1"},
        waiting,
        ComputingProducerSelectionState{},
        IdleState{"p2", "e2"},
    };
    for (const auto& state : states) {
        EXPECT_EQ(ParseLeaderState(SerializeLeaderState(state)), state) << state;
    }
}

TEST(LeaderStateTest, OpaqueProducerIdsSurvivePersistence) {
    // Producer ids are opaque bytes, not necessarily UTF-8.
    const std::string producer("\xff\xfe\x00p", 4);
    LeaderState lost = LostProducerState{producer, "e1"};
    LeaderState idle = IdleState{producer, "e2"};
    EXPECT_EQ(ParseLeaderState(SerializeLeaderState(lost)), lost);
    EXPECT_EQ(ParseLeaderState(SerializeLeaderState(idle)), idle);
}

TEST(LeaderStateTest, NamesAndPrinting) {
    EXPECT_STREQ(LeaderStateName(InitState{}), "Init");
    EXPECT_STREQ(LeaderStateName(ComputingProducerSelectionState{}), "ComputingProducerSelection");

    std::ostringstream os;
    os << LeaderState(IdleState{"p1", "e1"});
    EXPECT_EQ(os.str(), "Idle{producer_id=p1, execution_id=e1}");
}

TEST(LeaderStateTest, UndecodableBytesAreCorruptedState) {
    try {
        ParseLeaderState(std::string("\xff\xff\xff", 3));
        FAIL() << "expected CoordinationError";
    } catch (const CoordinationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kCorruptedState);
    }
}

TEST(LeaderStateTest, RecordWithoutStateIsCorrupted) {
    try {
        ParseLeaderState("");
        FAIL() << "expected CoordinationError";
    } catch (const CoordinationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kCorruptedState);
    }
}

TEST(LeaderCommandTest, JoinCarriesLockKey) {
    LeaderCommand command = ParseLeaderCommand(SerializeLeaderCommand(JoinCommand{"v1/consumer-groups/cg/instance-locks/i3"}));
    ASSERT_TRUE(std::holds_alternative<JoinCommand>(command));
    EXPECT_EQ(std::get<JoinCommand>(command).lock_key, "v1/consumer-groups/cg/instance-locks/i3");
    EXPECT_THROW(ParseLeaderCommand(""), CoordinationError);
}
