#include "managed_lease.h"

#include <algorithm>

#include <glog/logging.h>

namespace Shepherd {

std::unique_ptr<ManagedLease> ManagedLease::Grant(CoordinationStore* store, int64_t ttl_seconds) {
	LeaseId id = store->LeaseGrant(ttl_seconds);
	return std::make_unique<ManagedLease>(store, id, ttl_seconds);
}

ManagedLease::ManagedLease(CoordinationStore* store, LeaseId id, int64_t ttl_seconds)
	: store_(store),
	id_(id),
	refresh_interval_(std::max(absl::Seconds(ttl_seconds) / 3, absl::Milliseconds(500))) {
	keep_alive_thread_ = std::thread([this]() {
			this->KeepAliveLoop();
			});
}

ManagedLease::~ManagedLease() {
	Stop();
}

void ManagedLease::Stop() {
	{
		absl::MutexLock lock(&mu_);
		stop_ = true;
	}
	if (keep_alive_thread_.joinable()) {
		keep_alive_thread_.join();
	}
}

void ManagedLease::Revoke() {
	Stop();
	if (revoked_ || IsExpired()) {
		return;
	}
	revoked_ = true;
	try {
		store_->LeaseRevoke(id_);
		VLOG(1) << "Revoked lease " << id_;
	} catch (const CoordinationError& e) {
		// The TTL reaps the lease anyway.
		LOG(WARNING) << "Failed to revoke lease " << id_ << ": " << e.what();
	}
}

void ManagedLease::KeepAliveLoop() {
	while (true) {
		{
			absl::MutexLock lock(&mu_);
			if (mu_.AwaitWithTimeout(absl::Condition(&stop_), refresh_interval_)) {
				return;
			}
		}
		try {
			int64_t ttl = store_->LeaseKeepAlive(id_);
			if (ttl <= 0) {
				LOG(WARNING) << "Lease " << id_ << " expired";
				expired_.Fire();
				return;
			}
			VLOG(3) << "Lease " << id_ << " refreshed, ttl=" << ttl << "s";
		} catch (const CoordinationError& e) {
			LOG(WARNING) << "Lease " << id_ << " keep-alive failed: " << e.what();
		}
	}
}

} // namespace Shepherd
