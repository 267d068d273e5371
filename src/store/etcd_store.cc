#include "etcd_store.h"

#include <atomic>
#include <utility>

#include <glog/logging.h>

#include "common/errors.h"

namespace Shepherd {

namespace {

void CheckStatus(const grpc::Status& status, const char* op) {
	if (!status.ok()) {
		throw CoordinationError(ErrorCode::kStoreUnavailable,
				std::string(op) + " failed: " + std::to_string(status.error_code()) +
				": " + status.error_message());
	}
}

KeyValue FromProto(const mvccpb::KeyValue& kv) {
	KeyValue out;
	out.key = kv.key();
	out.value = kv.value();
	out.create_revision = kv.create_revision();
	out.mod_revision = kv.mod_revision();
	out.version = kv.version();
	out.lease = kv.lease();
	return out;
}

etcdserverpb::Compare::CompareResult ToProto(CompareOp op) {
	switch (op) {
		case CompareOp::kEqual:
			return etcdserverpb::Compare::EQUAL;
		case CompareOp::kGreater:
			return etcdserverpb::Compare::GREATER;
		case CompareOp::kLess:
			return etcdserverpb::Compare::LESS;
		case CompareOp::kNotEqual:
			return etcdserverpb::Compare::NOT_EQUAL;
	}
	return etcdserverpb::Compare::EQUAL;
}

void FillCompare(const Compare& compare, etcdserverpb::Compare* out) {
	out->set_key(compare.key);
	out->set_result(ToProto(compare.op));
	switch (compare.target) {
		case CompareTarget::kVersion:
			out->set_target(etcdserverpb::Compare::VERSION);
			out->set_version(compare.operand);
			break;
		case CompareTarget::kCreateRevision:
			out->set_target(etcdserverpb::Compare::CREATE);
			out->set_create_revision(compare.operand);
			break;
		case CompareTarget::kModRevision:
			out->set_target(etcdserverpb::Compare::MOD);
			out->set_mod_revision(compare.operand);
			break;
	}
}

class EtcdWatchStream : public WatchStream {
	public:
		EtcdWatchStream(etcdserverpb::Watch::Stub* stub, const std::string& prefix, Revision start_revision)
			: prefix_(prefix) {
			stream_ = stub->Watch(&context_);

			etcdserverpb::WatchRequest request;
			auto* create = request.mutable_create_request();
			create->set_key(prefix);
			create->set_range_end(PrefixRangeEnd(prefix));
			create->set_start_revision(start_revision);
			if (!stream_->Write(request)) {
				Cancel();
				Finish();
				throw CoordinationError(ErrorCode::kStoreUnavailable, "failed to send watch request for " + prefix);
			}

			// The watch only guards against races once the server acknowledged it.
			etcdserverpb::WatchResponse response;
			if (!stream_->Read(&response) || !response.created() || response.canceled()) {
				Cancel();
				Finish();
				throw CoordinationError(ErrorCode::kStoreUnavailable,
						"watch on " + prefix + " was not created: " + response.cancel_reason());
			}
			watch_id_ = response.watch_id();
			VLOG(2) << "Watch " << watch_id_ << " created on " << prefix_;
		}

		~EtcdWatchStream() override {
			Cancel();
			Finish();
		}

		bool Next(std::vector<WatchEvent>* events) override {
			events->clear();
			etcdserverpb::WatchResponse response;
			while (!cancelled_.load(std::memory_order_acquire)) {
				if (!stream_->Read(&response)) {
					return false;
				}
				if (response.canceled()) {
					LOG(WARNING) << "Watch " << watch_id_ << " on " << prefix_ << " canceled by server: "
						<< response.cancel_reason();
					return false;
				}
				if (response.events_size() == 0) {
					continue;
				}
				for (const auto& ev : response.events()) {
					WatchEvent event;
					event.type = ev.type() == mvccpb::Event::DELETE ? WatchEventType::kDelete : WatchEventType::kPut;
					event.kv = FromProto(ev.kv());
					events->push_back(std::move(event));
				}
				return true;
			}
			return false;
		}

		void Cancel() override {
			if (!cancelled_.exchange(true, std::memory_order_acq_rel)) {
				VLOG(2) << "Cancelling watch " << watch_id_ << " on " << prefix_;
				context_.TryCancel();
			}
		}

	private:
		void Finish() {
			if (finished_) {
				return;
			}
			finished_ = true;
			grpc::Status status = stream_->Finish();
			VLOG(3) << "Watch stream on " << prefix_ << " finished: " << status.error_message();
		}

		std::string prefix_;
		grpc::ClientContext context_;
		std::unique_ptr<grpc::ClientReaderWriter<etcdserverpb::WatchRequest, etcdserverpb::WatchResponse>> stream_;
		int64_t watch_id_ = -1;
		std::atomic<bool> cancelled_{false};
		bool finished_ = false;
};

} // namespace

EtcdStore::EtcdStore(const std::string& endpoint, std::chrono::milliseconds rpc_timeout)
	: EtcdStore(grpc::CreateChannel(endpoint, grpc::InsecureChannelCredentials()), rpc_timeout) {}

EtcdStore::EtcdStore(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds rpc_timeout)
	: channel_(std::move(channel)),
	kv_stub_(etcdserverpb::KV::NewStub(channel_)),
	watch_stub_(etcdserverpb::Watch::NewStub(channel_)),
	lease_stub_(etcdserverpb::Lease::NewStub(channel_)),
	rpc_timeout_(rpc_timeout) {}

bool EtcdStore::Connect(std::chrono::milliseconds timeout) {
	auto deadline = std::chrono::system_clock::now() + timeout;
	bool connected = channel_->WaitForConnected(deadline);
	if (!connected) {
		LOG(ERROR) << "Failed to connect to etcd within " << timeout.count() << "ms";
	}
	return connected;
}

void EtcdStore::SetDeadline(grpc::ClientContext* context) const {
	context->set_deadline(std::chrono::system_clock::now() + rpc_timeout_);
}

RangeResult EtcdStore::Range(const std::string& key, const std::string& range_end) {
	etcdserverpb::RangeRequest request;
	request.set_key(key);
	if (!range_end.empty()) {
		request.set_range_end(range_end);
	}
	etcdserverpb::RangeResponse response;
	grpc::ClientContext context;
	SetDeadline(&context);
	CheckStatus(kv_stub_->Range(&context, request, &response), "Range");

	RangeResult result;
	result.revision = response.header().revision();
	result.kvs.reserve(response.kvs_size());
	for (const auto& kv : response.kvs()) {
		result.kvs.push_back(FromProto(kv));
	}
	return result;
}

RangeResult EtcdStore::Get(const std::string& key) {
	return Range(key, "");
}

RangeResult EtcdStore::GetPrefix(const std::string& prefix) {
	return Range(prefix, PrefixRangeEnd(prefix));
}

Revision EtcdStore::Put(const std::string& key, const std::string& value, LeaseId lease) {
	etcdserverpb::PutRequest request;
	request.set_key(key);
	request.set_value(value);
	request.set_lease(lease);
	etcdserverpb::PutResponse response;
	grpc::ClientContext context;
	SetDeadline(&context);
	CheckStatus(kv_stub_->Put(&context, request, &response), "Put");
	return response.header().revision();
}

Revision EtcdStore::Delete(const std::string& key) {
	etcdserverpb::DeleteRangeRequest request;
	request.set_key(key);
	etcdserverpb::DeleteRangeResponse response;
	grpc::ClientContext context;
	SetDeadline(&context);
	CheckStatus(kv_stub_->DeleteRange(&context, request, &response), "DeleteRange");
	return response.header().revision();
}

std::unique_ptr<WatchStream> EtcdStore::Watch(const std::string& prefix, Revision start_revision) {
	return std::make_unique<EtcdWatchStream>(watch_stub_.get(), prefix, start_revision);
}

LeaseId EtcdStore::LeaseGrant(int64_t ttl_seconds) {
	etcdserverpb::LeaseGrantRequest request;
	request.set_ttl(ttl_seconds);
	etcdserverpb::LeaseGrantResponse response;
	grpc::ClientContext context;
	SetDeadline(&context);
	CheckStatus(lease_stub_->LeaseGrant(&context, request, &response), "LeaseGrant");
	if (!response.error().empty()) {
		throw CoordinationError(ErrorCode::kStoreUnavailable, "LeaseGrant rejected: " + response.error());
	}
	VLOG(2) << "Granted lease " << response.id() << " ttl=" << response.ttl() << "s";
	return response.id();
}

int64_t EtcdStore::LeaseKeepAlive(LeaseId lease) {
	grpc::ClientContext context;
	SetDeadline(&context);
	auto stream = lease_stub_->LeaseKeepAlive(&context);

	etcdserverpb::LeaseKeepAliveRequest request;
	request.set_id(lease);
	if (!stream->Write(request)) {
		CheckStatus(stream->Finish(), "LeaseKeepAlive");
		throw CoordinationError(ErrorCode::kStoreUnavailable, "LeaseKeepAlive stream closed before write");
	}
	stream->WritesDone();

	etcdserverpb::LeaseKeepAliveResponse response;
	bool got_response = stream->Read(&response);
	etcdserverpb::LeaseKeepAliveResponse drain;
	while (stream->Read(&drain)) {
	}
	CheckStatus(stream->Finish(), "LeaseKeepAlive");
	if (!got_response) {
		throw CoordinationError(ErrorCode::kStoreUnavailable, "LeaseKeepAlive returned no response");
	}
	return response.ttl();
}

void EtcdStore::LeaseRevoke(LeaseId lease) {
	etcdserverpb::LeaseRevokeRequest request;
	request.set_id(lease);
	etcdserverpb::LeaseRevokeResponse response;
	grpc::ClientContext context;
	SetDeadline(&context);
	CheckStatus(lease_stub_->LeaseRevoke(&context, request, &response), "LeaseRevoke");
}

TxnResult EtcdStore::Txn(const std::vector<Compare>& compares, const std::vector<TxnPut>& puts) {
	etcdserverpb::TxnRequest request;
	for (const auto& compare : compares) {
		FillCompare(compare, request.add_compare());
	}
	for (const auto& put : puts) {
		auto* op = request.add_success()->mutable_request_put();
		op->set_key(put.key);
		op->set_value(put.value);
		op->set_lease(put.lease);
	}

	etcdserverpb::TxnResponse response;
	grpc::ClientContext context;
	SetDeadline(&context);
	CheckStatus(kv_stub_->Txn(&context, request, &response), "Txn");

	TxnResult result;
	result.succeeded = response.succeeded();
	result.revision = response.header().revision();
	if (!result.succeeded) {
		return result;
	}
	for (const auto& op : response.responses()) {
		if (op.response_case() != etcdserverpb::ResponseOp::kResponsePut) {
			continue;
		}
		const auto& put = op.response_put();
		// Nested headers may be left empty; every op of a txn shares the txn revision.
		Revision revision = put.has_header() ? put.header().revision() : 0;
		result.put_revisions.push_back(revision > 0 ? revision : result.revision);
	}
	return result;
}

} // namespace Shepherd
