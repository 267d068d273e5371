#include "consumer_group_leader.h"

#include <stdexcept>
#include <utility>
#include <vector>

#include <glog/logging.h>

#include "common/errors.h"
#include "common/unique_id.h"

namespace Shepherd {

ConsumerGroupLeader::ConsumerGroupLeader(CoordinationStore* store,
		std::string leader_key,
		std::unique_ptr<ManagedLease> leader_lease,
		ConsumerGroupId consumer_group_id,
		std::unique_ptr<IProducerSelector> selector,
		LeaderOptions options)
	: store_(store),
	leader_key_(std::move(leader_key)),
	leader_lease_(std::move(leader_lease)),
	consumer_group_id_(std::move(consumer_group_id)),
	selector_(std::move(selector)),
	options_(std::move(options)),
	log_key_(options_.paths.LeaderStateLogKey(consumer_group_id_)) {
	if (store_ == nullptr || leader_lease_ == nullptr || selector_ == nullptr) {
		throw std::invalid_argument("ConsumerGroupLeader needs a store, a leader lease and a producer selector");
	}
	Bootstrap();
}

void ConsumerGroupLeader::Bootstrap() {
	RangeResult current = store_->Get(log_key_);
	if (!current.kvs.empty()) {
		const KeyValue& kv = current.kvs.front();
		state_ = ParseLeaderState(kv.value);
		last_revision_ = kv.mod_revision;
		if (const auto* lost = std::get_if<LostProducerState>(&state_)) {
			last_lost_producer_ = lost->lost_producer_id;
		}
		LOG(INFO) << "Consumer group " << consumer_group_id_ << " resumes in state " << state_
			<< " at revision " << last_revision_;
		return;
	}

	LeaderState init = InitState{};
	TxnResult result = store_->Txn(
			{
				Compare::Version(leader_key_, CompareOp::kGreater, 0),
				Compare::Version(log_key_, CompareOp::kEqual, 0),
			},
			{TxnPut{log_key_, SerializeLeaderState(init)}});
	if (result.put_revisions.empty()) {
		throw CoordinationError(ErrorCode::kFailedToUpdateStateLog,
				"could not initialize " + log_key_ + ": leadership lost or another leader initialized it");
	}
	state_ = std::move(init);
	last_revision_ = result.put_revisions.back();
	LOG(INFO) << "Consumer group " << consumer_group_id_ << " initialized state log at revision " << last_revision_;
}

void ConsumerGroupLeader::Run(OneShotSignal& interrupt) {
	try {
		while (true) {
			std::optional<LeaderState> next = ComputeNextState(interrupt);
			if (!next.has_value()) {
				LOG(INFO) << "Consumer group " << consumer_group_id_ << " leader interrupted in state " << state_;
				return;
			}
			Persist(std::move(*next));
			if (interrupt.IsFired()) {
				LOG(INFO) << "Consumer group " << consumer_group_id_ << " leader interrupted after reaching " << state_;
				return;
			}
		}
	} catch (const CoordinationError& e) {
		LOG(ERROR) << "Consumer group " << consumer_group_id_ << " leader loop stopped in state " << state_
			<< ": " << e.what();
		throw;
	}
}

std::optional<LeaderState> ConsumerGroupLeader::ComputeNextState(OneShotSignal& interrupt) {
	if (std::holds_alternative<InitState>(state_)) {
		return ComputingProducerSelectionState{};
	}
	if (const auto* lost = std::get_if<LostProducerState>(&state_)) {
		return OnLostProducer(*lost);
	}
	if (const auto* waiting = std::get_if<WaitingBarrierState>(&state_)) {
		return OnWaitingBarrier(*waiting, interrupt);
	}
	if (std::holds_alternative<ComputingProducerSelectionState>(state_)) {
		return OnComputingProducerSelection();
	}
	return OnIdle(std::get<IdleState>(state_), interrupt);
}

LeaderState ConsumerGroupLeader::OnLostProducer(const LostProducerState& state) {
	last_lost_producer_ = state.lost_producer_id;

	std::string barrier_key = options_.paths.BarrierKey(GenerateUuid());
	std::unique_ptr<ManagedLease> lease = ManagedLease::Grant(store_, options_.barrier_lease_ttl_s);

	// TODO: drop instance locks whose owner fails a health check before freezing the set.
	std::vector<std::string> wait_for;
	for (const auto& kv : store_->GetPrefix(options_.paths.InstanceLockPrefix(consumer_group_id_)).kvs) {
		wait_for.push_back(kv.key);
	}

	barrier_ = Barrier::Create(store_, barrier_key, wait_for, lease->id());
	WaitingBarrierState next;
	next.lease_id = lease->id();
	next.barrier_key = barrier_key;
	next.wait_for = std::move(wait_for);
	barrier_lease_ = std::move(lease);
	return next;
}

std::optional<LeaderState> ConsumerGroupLeader::OnWaitingBarrier(const WaitingBarrierState& state,
		OneShotSignal& interrupt) {
	if (!barrier_) {
		barrier_ = Barrier::Attach(store_, state.barrier_key);
	}
	if (!barrier_lease_) {
		barrier_lease_ = std::make_unique<ManagedLease>(store_, state.lease_id, options_.barrier_lease_ttl_s);
	}

	OneShotSignal& arrived = barrier_->Wait();
	// A reaped barrier lease takes the arrivals with it; the rendezvous can no longer complete.
	size_t winner = WaitAny({&interrupt, &leader_lease_->expired(), &arrived, &barrier_lease_->expired()});
	if (winner == 0) {
		return std::nullopt;
	}
	if (winner == 1) {
		throw CoordinationError(ErrorCode::kFailedToUpdateStateLog,
				"leader lease " + std::to_string(leader_lease_->id()) + " expired");
	}
	if (winner == 3) {
		throw CoordinationError(ErrorCode::kCorruptedState,
				"lease " + std::to_string(state.lease_id) + " of barrier " + state.barrier_key + " expired");
	}
	arrived.ThrowIfFailed();
	LOG(INFO) << "All " << state.wait_for.size() << " instances of consumer group " << consumer_group_id_
		<< " reached barrier " << state.barrier_key;
	return ComputingProducerSelectionState{};
}

LeaderState ConsumerGroupLeader::OnComputingProducerSelection() {
	std::vector<ProducerId> candidates = ListLiveProducers(store_, options_.paths);
	absl::flat_hash_set<ProducerId> excluded;
	if (last_lost_producer_.has_value()) {
		excluded.insert(*last_lost_producer_);
	}

	std::optional<ProducerId> chosen = selector_->SelectProducer(candidates, excluded);
	if (!chosen.has_value()) {
		throw CoordinationError(ErrorCode::kNoProducerAvailable,
				"no live producer for consumer group " + consumer_group_id_ +
				" among " + std::to_string(candidates.size()) + " candidates");
	}
	VLOG(1) << "Selected producer " << *chosen << " among " << candidates.size() << " candidates";
	return IdleState{*chosen, GenerateExecutionId()};
}

std::optional<LeaderState> ConsumerGroupLeader::OnIdle(const IdleState& state, OneShotSignal& interrupt) {
	if (!dead_signal_) {
		dead_signal_ = ProducerDeadSignal::Subscribe(store_, options_.paths, state.producer_id);
	}

	OneShotSignal& dead = dead_signal_->signal();
	if (!AwaitOrInterrupt(dead, interrupt)) {
		return std::nullopt;
	}
	dead.ThrowIfFailed();

	LOG(WARNING) << "Received dead signal from producer " << state.producer_id
		<< " of consumer group " << consumer_group_id_;
	WritePreStagingMarker();
	return LostProducerState{state.producer_id, state.execution_id};
}

bool ConsumerGroupLeader::AwaitOrInterrupt(OneShotSignal& signal, OneShotSignal& interrupt) {
	size_t winner = WaitAny({&interrupt, &leader_lease_->expired(), &signal});
	if (winner == 0) {
		return false;
	}
	if (winner == 1) {
		throw CoordinationError(ErrorCode::kFailedToUpdateStateLog,
				"leader lease " + std::to_string(leader_lease_->id()) + " expired");
	}
	return true;
}

void ConsumerGroupLeader::WritePreStagingMarker() {
	// Short-lived key announcing a rendezvous is about to start. Nothing reads it yet.
	std::string marker_key = options_.paths.BarrierKey(GenerateUuid());
	LeaseId lease = store_->LeaseGrant(options_.marker_lease_ttl_s);
	store_->Put(marker_key, "", lease);
	VLOG(1) << "Wrote pre-staging marker " << marker_key << " under lease " << lease;
}

void ConsumerGroupLeader::Persist(LeaderState next) {
	TxnResult result = store_->Txn(
			{
				Compare::Version(leader_key_, CompareOp::kGreater, 0),
				Compare::ModRevision(log_key_, CompareOp::kEqual, last_revision_),
			},
			{TxnPut{log_key_, SerializeLeaderState(next)}});
	if (result.put_revisions.empty()) {
		throw CoordinationError(ErrorCode::kFailedToUpdateStateLog,
				log_key_ + " moved past revision " + std::to_string(last_revision_) + " or leadership was lost");
	}

	Revision revision = result.put_revisions.back();
	LOG(INFO) << "Consumer group " << consumer_group_id_ << ": " << state_ << " -> " << next
		<< " at revision " << revision;
	last_revision_ = revision;
	state_ = std::move(next);
	ReleaseStaleHandles();
}

void ConsumerGroupLeader::ReleaseStaleHandles() {
	if (!std::holds_alternative<IdleState>(state_)) {
		dead_signal_.reset();
	}
	if (!std::holds_alternative<WaitingBarrierState>(state_)) {
		barrier_.reset();
		if (barrier_lease_) {
			// Participants may still be reading the barrier; its TTL reaps it.
			barrier_lease_->Stop();
			barrier_lease_.reset();
		}
	}
}

} // namespace Shepherd
