#ifndef SHEPHERD_SRC_STORE_MANAGED_LEASE_H_
#define SHEPHERD_SRC_STORE_MANAGED_LEASE_H_

#include <memory>
#include <thread>

#include "absl/synchronization/mutex.h"
#include "common/one_shot.h"
#include "coordination_store.h"

namespace Shepherd {

/**
 * Owns a store lease and refreshes it from a background thread.
 *
 * Stop() (also run by the destructor) only ends the refreshing, leaving the
 * lease to run out its TTL so a successor can still adopt it. Revoke() ends it
 * at once, deleting every key attached to it. If a refresh reports the lease
 * as gone, expired() fires and refreshing stops.
 */
class ManagedLease {
	public:
		static std::unique_ptr<ManagedLease> Grant(CoordinationStore* store, int64_t ttl_seconds);

		// Adopts a lease granted earlier, possibly by a previous process.
		ManagedLease(CoordinationStore* store, LeaseId id, int64_t ttl_seconds);
		~ManagedLease();

		ManagedLease(const ManagedLease&) = delete;
		ManagedLease& operator=(const ManagedLease&) = delete;

		LeaseId id() const { return id_; }
		bool IsExpired() const { return expired_.IsFired(); }
		OneShotSignal& expired() { return expired_; }

		void Stop();
		void Revoke();

	private:
		void KeepAliveLoop();

		CoordinationStore* store_;
		LeaseId id_;
		absl::Duration refresh_interval_;
		OneShotSignal expired_;

		absl::Mutex mu_;
		bool stop_ ABSL_GUARDED_BY(mu_) = false;
		bool revoked_ = false;
		std::thread keep_alive_thread_;
};

} // namespace Shepherd

#endif // SHEPHERD_SRC_STORE_MANAGED_LEASE_H_
