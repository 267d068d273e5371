#include <gtest/gtest.h>
#include "in_memory_store.h"
#include "../../src/store/managed_lease.h"

using namespace Shepherd;

class ManagedLeaseTest : public ::testing::Test {
protected:
    InMemoryStore store_;
};

TEST_F(ManagedLeaseTest, ExpiryFiresSignal) {
    auto lease = ManagedLease::Grant(&store_, 1);
    EXPECT_TRUE(store_.HasLease(lease->id()));
    EXPECT_FALSE(lease->IsExpired());

    store_.ExpireLease(lease->id());
    EXPECT_TRUE(lease->expired().WaitFor(absl::Seconds(5)));
    EXPECT_TRUE(lease->IsExpired());
}

TEST_F(ManagedLeaseTest, StopLeavesLeaseToTtl) {
    LeaseId id;
    {
        auto lease = ManagedLease::Grant(&store_, 1);
        id = lease->id();
        store_.Put("kept", "", id);
    }
    EXPECT_TRUE(store_.HasLease(id));
    EXPECT_EQ(store_.Get("kept").kvs.size(), 1u);
}

TEST_F(ManagedLeaseTest, RevokeDeletesAttachedKeysOnce) {
    auto lease = ManagedLease::Grant(&store_, 1);
    store_.Put("gone", "", lease->id());
    lease->Revoke();
    EXPECT_FALSE(store_.HasLease(lease->id()));
    EXPECT_TRUE(store_.Get("gone").kvs.empty());
    // Second revoke is a no-op rather than a store error.
    EXPECT_NO_THROW(lease->Revoke());
}

TEST_F(ManagedLeaseTest, AdoptsExistingLease) {
    LeaseId id = store_.LeaseGrant(1);
    ManagedLease adopted(&store_, id, 1);
    EXPECT_EQ(adopted.id(), id);
    adopted.Revoke();
    EXPECT_FALSE(store_.HasLease(id));
}
