#include <gtest/gtest.h>
#include "../../src/common/one_shot.h"
#include <atomic>
#include <chrono>
#include <thread>

using namespace Shepherd;
using namespace std::chrono_literals;

class OneShotSignalTest : public ::testing::Test {
protected:
    OneShotSignal signal_;
};

TEST_F(OneShotSignalTest, FiresOnlyOnce) {
    EXPECT_FALSE(signal_.IsFired());
    EXPECT_TRUE(signal_.Fire());
    EXPECT_TRUE(signal_.IsFired());
    EXPECT_FALSE(signal_.Fire());
    EXPECT_FALSE(signal_.Fail(ErrorCode::kCorruptedState, "too late"));
    EXPECT_FALSE(signal_.error().has_value());
    EXPECT_NO_THROW(signal_.ThrowIfFailed());
}

TEST_F(OneShotSignalTest, FailCarriesError) {
    EXPECT_TRUE(signal_.Fail(ErrorCode::kStoreUnavailable, "watch closed"));
    ASSERT_TRUE(signal_.error().has_value());
    EXPECT_EQ(signal_.error()->code(), ErrorCode::kStoreUnavailable);
    try {
        signal_.ThrowIfFailed();
        FAIL() << "expected CoordinationError";
    } catch (const CoordinationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kStoreUnavailable);
        EXPECT_NE(std::string(e.what()).find("watch closed"), std::string::npos);
    }
}

TEST_F(OneShotSignalTest, WaitForTimesOut) {
    EXPECT_FALSE(signal_.WaitFor(absl::Milliseconds(20)));
    signal_.Fire();
    EXPECT_TRUE(signal_.WaitFor(absl::Milliseconds(20)));
}

TEST_F(OneShotSignalTest, WaitWakesOnFireFromOtherThread) {
    std::thread firer([this]() {
        std::this_thread::sleep_for(20ms);
        signal_.Fire();
    });
    signal_.Wait();
    EXPECT_TRUE(signal_.IsFired());
    firer.join();
}

TEST_F(OneShotSignalTest, ListenersRunOnceAndCanBeRemoved) {
    std::atomic<int> calls{0};
    auto kept = signal_.AddListener([&calls]() { calls++; });
    auto removed = signal_.AddListener([&calls]() { calls += 100; });
    EXPECT_NE(kept, 0u);
    signal_.RemoveListener(removed);

    signal_.Fire();
    signal_.Fire();
    EXPECT_EQ(calls.load(), 1);

    // Registering on a resolved signal runs inline.
    EXPECT_EQ(signal_.AddListener([&calls]() { calls++; }), 0u);
    EXPECT_EQ(calls.load(), 2);
}

TEST(WaitAnyTest, LowestResolvedIndexWins) {
    OneShotSignal interrupt, expired, work;
    work.Fire();
    interrupt.Fire();
    EXPECT_EQ(WaitAny({&interrupt, &expired, &work}), 0u);
}

TEST(WaitAnyTest, ReturnsAlreadyResolvedSignal) {
    OneShotSignal interrupt, work;
    work.Fail(ErrorCode::kCorruptedState, "boom");
    EXPECT_EQ(WaitAny({&interrupt, &work}), 1u);
}

TEST(WaitAnyTest, WakesWhenAnySignalFiresLater) {
    OneShotSignal interrupt, expired, work;
    std::thread firer([&expired]() {
        std::this_thread::sleep_for(20ms);
        expired.Fire();
    });
    EXPECT_EQ(WaitAny({&interrupt, &expired, &work}), 1u);
    firer.join();

    // Listeners were unregistered; later fires must not touch the finished race.
    work.Fire();
    interrupt.Fire();
}
