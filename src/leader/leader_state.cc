#include "leader_state.h"

#include <leader_state.pb.h>

#include "common/errors.h"

namespace Shepherd {

namespace {

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

bool operator==(const InitState&, const InitState&) {
	return true;
}

bool operator==(const LostProducerState& a, const LostProducerState& b) {
	return a.lost_producer_id == b.lost_producer_id && a.execution_id == b.execution_id;
}

bool operator==(const WaitingBarrierState& a, const WaitingBarrierState& b) {
	return a.lease_id == b.lease_id && a.barrier_key == b.barrier_key && a.wait_for == b.wait_for;
}

bool operator==(const ComputingProducerSelectionState&, const ComputingProducerSelectionState&) {
	return true;
}

bool operator==(const IdleState& a, const IdleState& b) {
	return a.producer_id == b.producer_id && a.execution_id == b.execution_id;
}

const char* LeaderStateName(const LeaderState& state) {
	return std::visit(Overloaded{
			[](const InitState&) { return "Init"; },
			[](const LostProducerState&) { return "LostProducer"; },
			[](const WaitingBarrierState&) { return "WaitingBarrier"; },
			[](const ComputingProducerSelectionState&) { return "ComputingProducerSelection"; },
			[](const IdleState&) { return "Idle"; },
			}, state);
}

std::ostream& operator<<(std::ostream& os, const LeaderState& state) {
	os << LeaderStateName(state);
	std::visit(Overloaded{
			[&os](const LostProducerState& s) {
				os << "{lost_producer_id=" << s.lost_producer_id << ", execution_id=" << s.execution_id << "}";
			},
			[&os](const WaitingBarrierState& s) {
				os << "{lease_id=" << s.lease_id << ", barrier_key=" << s.barrier_key
					<< ", wait_for=" << s.wait_for.size() << " participants}";
			},
			[&os](const IdleState& s) {
				os << "{producer_id=" << s.producer_id << ", execution_id=" << s.execution_id << "}";
			},
			[](const auto&) {},
			}, state);
	return os;
}

std::string SerializeLeaderState(const LeaderState& state) {
	shepherd::LeaderStateRecord record;
	std::visit(Overloaded{
			[&record](const InitState&) { record.mutable_init(); },
			[&record](const LostProducerState& s) {
				auto* lost = record.mutable_lost_producer();
				lost->set_lost_producer_id(s.lost_producer_id);
				lost->set_execution_id(s.execution_id);
			},
			[&record](const WaitingBarrierState& s) {
				auto* waiting = record.mutable_waiting_barrier();
				waiting->set_lease_id(s.lease_id);
				waiting->set_barrier_key(s.barrier_key);
				for (const auto& key : s.wait_for) {
					waiting->add_wait_for(key);
				}
			},
			[&record](const ComputingProducerSelectionState&) { record.mutable_computing_producer_selection(); },
			[&record](const IdleState& s) {
				auto* idle = record.mutable_idle();
				idle->set_producer_id(s.producer_id);
				idle->set_execution_id(s.execution_id);
			},
			}, state);
	return record.SerializeAsString();
}

LeaderState ParseLeaderState(const std::string& bytes) {
	shepherd::LeaderStateRecord record;
	if (!record.ParseFromString(bytes)) {
		throw CoordinationError(ErrorCode::kCorruptedState, "leader state record does not parse");
	}
	switch (record.state_case()) {
		case shepherd::LeaderStateRecord::kInit:
			return InitState{};
		case shepherd::LeaderStateRecord::kLostProducer:
			return LostProducerState{record.lost_producer().lost_producer_id(), record.lost_producer().execution_id()};
		case shepherd::LeaderStateRecord::kWaitingBarrier: {
			const auto& waiting = record.waiting_barrier();
			WaitingBarrierState s;
			s.lease_id = waiting.lease_id();
			s.barrier_key = waiting.barrier_key();
			s.wait_for.assign(waiting.wait_for().begin(), waiting.wait_for().end());
			return s;
		}
		case shepherd::LeaderStateRecord::kComputingProducerSelection:
			return ComputingProducerSelectionState{};
		case shepherd::LeaderStateRecord::kIdle:
			return IdleState{record.idle().producer_id(), record.idle().execution_id()};
		case shepherd::LeaderStateRecord::STATE_NOT_SET:
			break;
	}
	throw CoordinationError(ErrorCode::kCorruptedState, "leader state record has no state set");
}

std::string SerializeLeaderCommand(const LeaderCommand& command) {
	shepherd::LeaderCommand message;
	std::visit(Overloaded{
			[&message](const JoinCommand& join) { message.mutable_join()->set_lock_key(join.lock_key); },
			}, command);
	return message.SerializeAsString();
}

LeaderCommand ParseLeaderCommand(const std::string& bytes) {
	shepherd::LeaderCommand message;
	if (!message.ParseFromString(bytes)) {
		throw CoordinationError(ErrorCode::kCorruptedState, "leader command does not parse");
	}
	if (message.command_case() != shepherd::LeaderCommand::kJoin) {
		throw CoordinationError(ErrorCode::kCorruptedState, "leader command has no command set");
	}
	return JoinCommand{message.join().lock_key()};
}

} // namespace Shepherd
