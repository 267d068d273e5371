#ifndef SHEPHERD_SRC_STORE_COORDINATION_STORE_H_
#define SHEPHERD_SRC_STORE_COORDINATION_STORE_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/types.h"

namespace Shepherd {

struct KeyValue {
	std::string key;
	std::string value;
	Revision create_revision = 0;
	Revision mod_revision = 0;
	int64_t version = 0;
	LeaseId lease = kNoLease;
};

struct RangeResult {
	// Store revision at which the range was served.
	Revision revision = 0;
	std::vector<KeyValue> kvs;
};

enum class WatchEventType {
	kPut,
	kDelete,
};

struct WatchEvent {
	WatchEventType type;
	KeyValue kv;
};

/**
 * Server-side watch over a key prefix. Next() blocks until a batch of events
 * arrives and returns false once the stream is closed or cancelled. Cancel()
 * may be called from any thread and unblocks a pending Next().
 */
class WatchStream {
	public:
		virtual ~WatchStream() = default;

		virtual bool Next(std::vector<WatchEvent>* events) = 0;
		virtual void Cancel() = 0;
};

enum class CompareTarget {
	kVersion,
	kCreateRevision,
	kModRevision,
};

enum class CompareOp {
	kEqual,
	kGreater,
	kLess,
	kNotEqual,
};

struct Compare {
	std::string key;
	CompareTarget target;
	CompareOp op;
	int64_t operand;

	static Compare Version(std::string key, CompareOp op, int64_t version);
	static Compare ModRevision(std::string key, CompareOp op, Revision revision);
};

struct TxnPut {
	std::string key;
	std::string value;
	LeaseId lease = kNoLease;
};

struct TxnResult {
	bool succeeded = false;
	Revision revision = 0;
	// One write revision per executed put; empty when the guard failed.
	std::vector<Revision> put_revisions;
};

/**
 * Linearizable hierarchical key-value store with leases, prefix watches and
 * guarded multi-key transactions. Implementations throw CoordinationError
 * with ErrorCode::kStoreUnavailable on transport failures.
 */
class CoordinationStore {
	public:
		virtual ~CoordinationStore() = default;

		virtual RangeResult Get(const std::string& key) = 0;
		virtual RangeResult GetPrefix(const std::string& prefix) = 0;
		virtual Revision Put(const std::string& key, const std::string& value, LeaseId lease = kNoLease) = 0;
		virtual Revision Delete(const std::string& key) = 0;

		// start_revision == 0 watches from the next revision.
		virtual std::unique_ptr<WatchStream> Watch(const std::string& prefix, Revision start_revision = 0) = 0;

		virtual LeaseId LeaseGrant(int64_t ttl_seconds) = 0;
		// Returns the remaining TTL in seconds; <= 0 means the lease is gone.
		virtual int64_t LeaseKeepAlive(LeaseId lease) = 0;
		virtual void LeaseRevoke(LeaseId lease) = 0;

		// Puts run only when every compare holds.
		virtual TxnResult Txn(const std::vector<Compare>& compares, const std::vector<TxnPut>& puts) = 0;
};

// Exclusive end key covering every key that starts with prefix.
std::string PrefixRangeEnd(const std::string& prefix);

} // namespace Shepherd

#endif // SHEPHERD_SRC_STORE_COORDINATION_STORE_H_
