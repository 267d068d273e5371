#include "producer_dead_signal.h"

#include <utility>
#include <vector>

#include <glog/logging.h>

namespace Shepherd {

std::unique_ptr<ProducerDeadSignal> ProducerDeadSignal::Subscribe(CoordinationStore* store,
		const KeyPaths& paths, const ProducerId& producer_id) {
	std::string lock_key = paths.ProducerLockKey(producer_id);
	std::unique_ptr<WatchStream> watch = store->Watch(lock_key);
	std::unique_ptr<ProducerDeadSignal> dead(
			new ProducerDeadSignal(producer_id, lock_key, std::move(watch)));

	RangeResult current = store->Get(lock_key);
	if (current.kvs.empty()) {
		VLOG(1) << "Producer " << producer_id << " is already dead";
		dead->signal_.Fire();
		dead->Cancel();
		return dead;
	}

	ProducerDeadSignal* raw = dead.get();
	dead->drain_thread_ = std::thread([raw]() {
			raw->DrainWatch();
			});
	return dead;
}

ProducerDeadSignal::ProducerDeadSignal(ProducerId producer_id, std::string lock_key,
		std::unique_ptr<WatchStream> watch)
	: producer_id_(std::move(producer_id)), lock_key_(std::move(lock_key)), watch_(std::move(watch)) {}

ProducerDeadSignal::~ProducerDeadSignal() {
	Cancel();
}

void ProducerDeadSignal::Cancel() {
	if (!cancelled_.exchange(true)) {
		watch_->Cancel();
	}
	if (drain_thread_.joinable()) {
		drain_thread_.join();
	}
}

void ProducerDeadSignal::DrainWatch() {
	std::vector<WatchEvent> events;
	while (watch_->Next(&events)) {
		for (const auto& event : events) {
			if (event.kv.key != lock_key_) {
				continue;
			}
			if (event.type == WatchEventType::kPut) {
				LOG(ERROR) << "Corrupted system state: lock " << event.kv.key << " of producer "
					<< producer_id_ << " was written while waiting for its death";
				signal_.Fail(ErrorCode::kCorruptedState,
						"producer " + producer_id_ + " was created after dead signal");
				return;
			}
			if (!signal_.Fire()) {
				LOG(WARNING) << "Dead signal of producer " << producer_id_ << " was already resolved";
			}
			return;
		}
	}
	if (!cancelled_.load()) {
		signal_.Fail(ErrorCode::kStoreUnavailable,
				"watch on " + lock_key_ + " terminated before producer " + producer_id_ + " died");
	}
}

} // namespace Shepherd
