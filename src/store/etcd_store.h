#ifndef SHEPHERD_SRC_STORE_ETCD_STORE_H_
#define SHEPHERD_SRC_STORE_ETCD_STORE_H_

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <etcd_rpc.grpc.pb.h>

#include "coordination_store.h"

namespace Shepherd {

/**
 * CoordinationStore backed by an etcd v3 cluster over gRPC.
 *
 * Every unary call carries the configured deadline. Watches are bidi streams
 * that stay open until cancelled and therefore have no deadline. The client is
 * thread-safe: stubs are shared and each call gets its own ClientContext.
 */
class EtcdStore : public CoordinationStore {
	public:
		EtcdStore(const std::string& endpoint, std::chrono::milliseconds rpc_timeout);
		EtcdStore(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds rpc_timeout);

		EtcdStore(const EtcdStore&) = delete;
		EtcdStore& operator=(const EtcdStore&) = delete;

		// Blocks until the channel is connected or the timeout elapses.
		bool Connect(std::chrono::milliseconds timeout);

		RangeResult Get(const std::string& key) override;
		RangeResult GetPrefix(const std::string& prefix) override;
		Revision Put(const std::string& key, const std::string& value, LeaseId lease = kNoLease) override;
		Revision Delete(const std::string& key) override;
		std::unique_ptr<WatchStream> Watch(const std::string& prefix, Revision start_revision = 0) override;
		LeaseId LeaseGrant(int64_t ttl_seconds) override;
		int64_t LeaseKeepAlive(LeaseId lease) override;
		void LeaseRevoke(LeaseId lease) override;
		TxnResult Txn(const std::vector<Compare>& compares, const std::vector<TxnPut>& puts) override;

	private:
		RangeResult Range(const std::string& key, const std::string& range_end);
		void SetDeadline(grpc::ClientContext* context) const;

		std::shared_ptr<grpc::Channel> channel_;
		std::unique_ptr<etcdserverpb::KV::Stub> kv_stub_;
		std::unique_ptr<etcdserverpb::Watch::Stub> watch_stub_;
		std::unique_ptr<etcdserverpb::Lease::Stub> lease_stub_;
		std::chrono::milliseconds rpc_timeout_;
};

} // namespace Shepherd

#endif // SHEPHERD_SRC_STORE_ETCD_STORE_H_
