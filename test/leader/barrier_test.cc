#include <gtest/gtest.h>
#include "../../src/leader/barrier.h"
#include "../store/in_memory_store.h"
#include <stdexcept>

using namespace Shepherd;

class BarrierTest : public ::testing::Test {
protected:
    void SetUp() override {
        lease_ = store_.LeaseGrant(10);
    }

    InMemoryStore store_;
    LeaseId lease_ = kNoLease;
    const std::string key_ = "v1/barriers/test";
};

TEST_F(BarrierTest, FiresOnceEveryParticipantArrives) {
    auto barrier = Barrier::Create(&store_, key_, {"i1", "i2"}, lease_);
    OneShotSignal& done = barrier->Wait();
    EXPECT_EQ(&done, &barrier->Wait());

    barrier->Arrive("i1");
    EXPECT_FALSE(done.WaitFor(absl::Milliseconds(50)));
    barrier->Arrive("i2");
    ASSERT_TRUE(done.WaitFor(absl::Seconds(5)));
    EXPECT_FALSE(done.error().has_value());
}

TEST_F(BarrierTest, CountsArrivalsBeforeWait) {
    auto barrier = Barrier::Create(&store_, key_, {"i1", "i2"}, lease_);
    barrier->Arrive("i1");
    barrier->Arrive("i2");
    EXPECT_TRUE(barrier->Wait().IsFired());
}

TEST_F(BarrierTest, NoParticipantsFiresImmediately) {
    auto barrier = Barrier::Create(&store_, key_, {}, lease_);
    EXPECT_TRUE(barrier->Wait().IsFired());
}

TEST_F(BarrierTest, CreateRefusesExistingBarrier) {
    auto first = Barrier::Create(&store_, key_, {"i1"}, lease_);
    try {
        Barrier::Create(&store_, key_, {"i1"}, lease_);
        FAIL() << "expected CoordinationError";
    } catch (const CoordinationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kCorruptedState);
    }
}

TEST_F(BarrierTest, UnknownParticipantIsRejected) {
    auto barrier = Barrier::Create(&store_, key_, {"i1"}, lease_);
    EXPECT_THROW(barrier->Arrive("stranger"), std::invalid_argument);
}

TEST_F(BarrierTest, AttachResumesFromStoredRecord) {
    {
        auto created = Barrier::Create(&store_, key_, {"i1", "i2"}, lease_);
        created->Arrive("i1");
    }
    auto attached = Barrier::Attach(&store_, key_);
    EXPECT_EQ(attached->participants(), (std::vector<std::string>{"i1", "i2"}));
    EXPECT_EQ(attached->lease(), lease_);

    OneShotSignal& done = attached->Wait();
    EXPECT_FALSE(done.IsFired());
    attached->Arrive("i2");
    EXPECT_TRUE(done.WaitFor(absl::Seconds(5)));
}

TEST_F(BarrierTest, AttachToVanishedBarrierIsCorrupted) {
    try {
        Barrier::Attach(&store_, key_);
        FAIL() << "expected CoordinationError";
    } catch (const CoordinationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kCorruptedState);
    }
}

TEST_F(BarrierTest, ReapedLeaseNeverFiresAndCancelReleasesWatch) {
    auto barrier = Barrier::Create(&store_, key_, {"i1", "i2"}, lease_);
    OneShotSignal& done = barrier->Wait();
    barrier->Arrive("i1");
    store_.ExpireLease(lease_);
    EXPECT_FALSE(done.WaitFor(absl::Milliseconds(50)));
    EXPECT_TRUE(store_.Get(key_).kvs.empty());

    barrier->Cancel();
    EXPECT_EQ(store_.ActiveWatchCount(), 0u);
    EXPECT_FALSE(done.IsFired());
}
