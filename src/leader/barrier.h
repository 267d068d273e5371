#ifndef SHEPHERD_SRC_LEADER_BARRIER_H_
#define SHEPHERD_SRC_LEADER_BARRIER_H_

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "common/one_shot.h"
#include "store/coordination_store.h"

namespace Shepherd {

/**
 * Rendezvous point kept in the coordination store.
 *
 * The record at key lists the participants and is attached to a lease, so a
 * barrier abandoned by a crashed leader is reaped with it. Each participant
 * arrives by writing key/arrived/<participant> under the same lease. Wait()
 * fires once every participant has arrived and never fires otherwise.
 */
class Barrier {
	public:
		static std::unique_ptr<Barrier> Create(CoordinationStore* store, const std::string& key,
				const std::vector<std::string>& participants, LeaseId lease);

		// Re-obtains a handle after the in-memory one was lost, e.g. on restart.
		// Throws kCorruptedState when the record is gone.
		static std::unique_ptr<Barrier> Attach(CoordinationStore* store, const std::string& key);

		~Barrier();

		Barrier(const Barrier&) = delete;
		Barrier& operator=(const Barrier&) = delete;

		const std::string& key() const { return key_; }
		const std::vector<std::string>& participants() const { return participants_; }
		LeaseId lease() const { return lease_; }

		void Arrive(const std::string& participant);

		// The first call starts observing arrivals; later calls return the same signal.
		OneShotSignal& Wait();

		void Cancel();

	private:
		Barrier(CoordinationStore* store, std::string key, std::vector<std::string> participants, LeaseId lease);

		std::string ArrivalPrefix() const;
		void DrainArrivals();

		CoordinationStore* store_;
		std::string key_;
		std::vector<std::string> participants_;
		LeaseId lease_;

		bool wait_started_ = false;
		OneShotSignal done_;
		// Touched only by the drain thread once it runs.
		absl::flat_hash_set<std::string> pending_;
		std::unique_ptr<WatchStream> watch_;
		std::thread drain_thread_;
		std::atomic<bool> cancelled_{false};
};

} // namespace Shepherd

#endif // SHEPHERD_SRC_LEADER_BARRIER_H_
