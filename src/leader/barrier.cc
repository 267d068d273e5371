#include "barrier.h"

#include <stdexcept>
#include <utility>

#include <glog/logging.h>
#include <leader_state.pb.h>

#include "common/errors.h"

namespace Shepherd {

std::unique_ptr<Barrier> Barrier::Create(CoordinationStore* store, const std::string& key,
		const std::vector<std::string>& participants, LeaseId lease) {
	shepherd::BarrierRecord record;
	for (const auto& participant : participants) {
		record.add_participants(participant);
	}

	TxnResult result = store->Txn(
			{Compare::Version(key, CompareOp::kEqual, 0)},
			{TxnPut{key, record.SerializeAsString(), lease}});
	if (!result.succeeded) {
		throw CoordinationError(ErrorCode::kCorruptedState, "barrier " + key + " already exists");
	}
	LOG(INFO) << "Created barrier " << key << " over " << participants.size()
		<< " participants, lease " << lease;
	return std::unique_ptr<Barrier>(new Barrier(store, key, participants, lease));
}

std::unique_ptr<Barrier> Barrier::Attach(CoordinationStore* store, const std::string& key) {
	RangeResult current = store->Get(key);
	if (current.kvs.empty()) {
		throw CoordinationError(ErrorCode::kCorruptedState, "barrier " + key + " no longer exists");
	}
	const KeyValue& kv = current.kvs.front();
	shepherd::BarrierRecord record;
	if (!record.ParseFromString(kv.value)) {
		throw CoordinationError(ErrorCode::kCorruptedState, "barrier record at " + key + " does not parse");
	}
	std::vector<std::string> participants(record.participants().begin(), record.participants().end());
	VLOG(1) << "Attached to barrier " << key << " with " << participants.size() << " participants";
	return std::unique_ptr<Barrier>(new Barrier(store, key, std::move(participants), kv.lease));
}

Barrier::Barrier(CoordinationStore* store, std::string key, std::vector<std::string> participants, LeaseId lease)
	: store_(store), key_(std::move(key)), participants_(std::move(participants)), lease_(lease) {}

Barrier::~Barrier() {
	Cancel();
}

std::string Barrier::ArrivalPrefix() const {
	return key_ + "/arrived/";
}

void Barrier::Arrive(const std::string& participant) {
	bool known = false;
	for (const auto& p : participants_) {
		if (p == participant) {
			known = true;
			break;
		}
	}
	if (!known) {
		throw std::invalid_argument(participant + " is not a participant of barrier " + key_);
	}
	store_->Put(ArrivalPrefix() + participant, "", lease_);
	VLOG(1) << participant << " arrived at barrier " << key_;
}

OneShotSignal& Barrier::Wait() {
	if (wait_started_) {
		return done_;
	}
	wait_started_ = true;

	pending_.insert(participants_.begin(), participants_.end());
	if (pending_.empty()) {
		done_.Fire();
		return done_;
	}

	const std::string prefix = ArrivalPrefix();
	watch_ = store_->Watch(prefix);
	for (const auto& kv : store_->GetPrefix(prefix).kvs) {
		pending_.erase(kv.key.substr(prefix.size()));
	}
	if (pending_.empty()) {
		done_.Fire();
		Cancel();
		return done_;
	}

	drain_thread_ = std::thread([this]() {
			this->DrainArrivals();
			});
	return done_;
}

void Barrier::Cancel() {
	if (!cancelled_.exchange(true) && watch_) {
		watch_->Cancel();
	}
	if (drain_thread_.joinable()) {
		drain_thread_.join();
	}
}

void Barrier::DrainArrivals() {
	const std::string prefix = ArrivalPrefix();
	std::vector<WatchEvent> events;
	while (watch_->Next(&events)) {
		for (const auto& event : events) {
			// Arrivals only disappear when the lease is reaped.
			if (event.type != WatchEventType::kPut) {
				continue;
			}
			pending_.erase(event.kv.key.substr(prefix.size()));
		}
		VLOG(2) << "Barrier " << key_ << " waiting for " << pending_.size() << " participants";
		if (pending_.empty()) {
			done_.Fire();
			return;
		}
	}
	if (!cancelled_.load()) {
		done_.Fail(ErrorCode::kStoreUnavailable, "watch on barrier " + key_ + " terminated early");
	}
}

} // namespace Shepherd
