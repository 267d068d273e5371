#ifndef SHEPHERD_SRC_LEADER_PRODUCER_DEAD_SIGNAL_H_
#define SHEPHERD_SRC_LEADER_PRODUCER_DEAD_SIGNAL_H_

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "common/key_paths.h"
#include "common/one_shot.h"
#include "store/coordination_store.h"

namespace Shepherd {

/**
 * Fires once the liveness key of a producer is deleted from the store.
 *
 * The watch is opened before the key is read so a deletion between the two
 * cannot be missed. A producer whose key is already gone fires immediately.
 * A put on the key while it is watched resolves the signal with
 * kCorruptedState: producers are never resurrected under the same id.
 *
 * Cancel() stops the upstream watch and joins the drain thread; the
 * destructor runs it on every exit path.
 */
class ProducerDeadSignal {
	public:
		static std::unique_ptr<ProducerDeadSignal> Subscribe(CoordinationStore* store,
				const KeyPaths& paths, const ProducerId& producer_id);

		~ProducerDeadSignal();

		ProducerDeadSignal(const ProducerDeadSignal&) = delete;
		ProducerDeadSignal& operator=(const ProducerDeadSignal&) = delete;

		const ProducerId& producer_id() const { return producer_id_; }
		OneShotSignal& signal() { return signal_; }

		void Cancel();

	private:
		ProducerDeadSignal(ProducerId producer_id, std::string lock_key, std::unique_ptr<WatchStream> watch);

		void DrainWatch();

		ProducerId producer_id_;
		std::string lock_key_;
		std::unique_ptr<WatchStream> watch_;
		OneShotSignal signal_;
		std::thread drain_thread_;
		std::atomic<bool> cancelled_{false};
};

} // namespace Shepherd

#endif // SHEPHERD_SRC_LEADER_PRODUCER_DEAD_SIGNAL_H_
