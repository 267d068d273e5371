#ifndef SHEPHERD_SRC_LEADER_CONSUMER_GROUP_LEADER_H_
#define SHEPHERD_SRC_LEADER_CONSUMER_GROUP_LEADER_H_

#include <memory>
#include <optional>
#include <string>

#include "absl/container/flat_hash_set.h"
#include "barrier.h"
#include "common/key_paths.h"
#include "common/one_shot.h"
#include "leader_state.h"
#include "producer_dead_signal.h"
#include "producer_selector.h"
#include "store/coordination_store.h"
#include "store/managed_lease.h"

namespace Shepherd {

struct LeaderOptions {
	int64_t barrier_lease_ttl_s = 10;
	int64_t marker_lease_ttl_s = 10;
	KeyPaths paths;
};

/**
 * Leader runtime of one consumer group.
 *
 * Construction loads the persisted state log or atomically initializes it to
 * Init. Run() then drives the failover cycle, persisting every transition in
 * a transaction guarded by the leader lock and by the mod revision of the
 * log key. Any CoordinationError thrown by the constructor or by Run() means
 * this instance must stop acting as leader for the group.
 *
 * Not thread-safe: one thread owns the runtime.
 */
class ConsumerGroupLeader {
	public:
		// leader_lease must be the lease the leader lock key is attached to.
		ConsumerGroupLeader(CoordinationStore* store,
				std::string leader_key,
				std::unique_ptr<ManagedLease> leader_lease,
				ConsumerGroupId consumer_group_id,
				std::unique_ptr<IProducerSelector> selector,
				LeaderOptions options = LeaderOptions());

		ConsumerGroupLeader(const ConsumerGroupLeader&) = delete;
		ConsumerGroupLeader& operator=(const ConsumerGroupLeader&) = delete;

		// Returns when interrupt fires; nothing is persisted after that point.
		void Run(OneShotSignal& interrupt);

		const ConsumerGroupId& consumer_group_id() const { return consumer_group_id_; }
		const LeaderState& state() const { return state_; }
		Revision last_revision() const { return last_revision_; }

	private:
		void Bootstrap();

		// nullopt when interrupted before the transition was computed.
		std::optional<LeaderState> ComputeNextState(OneShotSignal& interrupt);
		LeaderState OnLostProducer(const LostProducerState& state);
		std::optional<LeaderState> OnWaitingBarrier(const WaitingBarrierState& state, OneShotSignal& interrupt);
		LeaderState OnComputingProducerSelection();
		std::optional<LeaderState> OnIdle(const IdleState& state, OneShotSignal& interrupt);

		// False when interrupt won the race.
		bool AwaitOrInterrupt(OneShotSignal& signal, OneShotSignal& interrupt);
		void WritePreStagingMarker();
		void Persist(LeaderState next);
		void ReleaseStaleHandles();

		CoordinationStore* store_;
		std::string leader_key_;
		std::unique_ptr<ManagedLease> leader_lease_;
		ConsumerGroupId consumer_group_id_;
		std::unique_ptr<IProducerSelector> selector_;
		LeaderOptions options_;
		std::string log_key_;

		LeaderState state_;
		Revision last_revision_ = 0;
		std::optional<ProducerId> last_lost_producer_;

		// Runtime caches; only valid while state_ is the state that created them.
		std::unique_ptr<ManagedLease> barrier_lease_;
		std::unique_ptr<Barrier> barrier_;
		std::unique_ptr<ProducerDeadSignal> dead_signal_;
};

} // namespace Shepherd

#endif // SHEPHERD_SRC_LEADER_CONSUMER_GROUP_LEADER_H_
