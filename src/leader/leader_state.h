#ifndef SHEPHERD_SRC_LEADER_LEADER_STATE_H_
#define SHEPHERD_SRC_LEADER_LEADER_STATE_H_

#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "common/types.h"

namespace Shepherd {

struct InitState {};

struct LostProducerState {
	ProducerId lost_producer_id;
	std::string execution_id;
};

struct WaitingBarrierState {
	LeaseId lease_id = kNoLease;
	std::string barrier_key;
	// Participant keys frozen when the barrier was created.
	std::vector<std::string> wait_for;
};

struct ComputingProducerSelectionState {};

struct IdleState {
	ProducerId producer_id;
	std::string execution_id;
};

/**
 * Leader state of one consumer group. Exactly one value is persisted per group
 * and it only ever moves along the cycle
 *
 *   Init -> ComputingProducerSelection -> Idle -> LostProducer
 *        -> WaitingBarrier -> ComputingProducerSelection -> ...
 *
 * Only keys and ids are stored; live handles are rebuilt at runtime.
 */
using LeaderState = std::variant<
	InitState,
	LostProducerState,
	WaitingBarrierState,
	ComputingProducerSelectionState,
	IdleState>;

bool operator==(const InitState&, const InitState&);
bool operator==(const LostProducerState& a, const LostProducerState& b);
bool operator==(const WaitingBarrierState& a, const WaitingBarrierState& b);
bool operator==(const ComputingProducerSelectionState&, const ComputingProducerSelectionState&);
bool operator==(const IdleState& a, const IdleState& b);

const char* LeaderStateName(const LeaderState& state);
std::ostream& operator<<(std::ostream& os, const LeaderState& state);

std::string SerializeLeaderState(const LeaderState& state);
// Throws CoordinationError(kCorruptedState) on undecodable input.
LeaderState ParseLeaderState(const std::string& bytes);

struct JoinCommand {
	std::string lock_key;
};

// Messages other instances send to the leader. Not consumed by the loop yet.
using LeaderCommand = std::variant<JoinCommand>;

std::string SerializeLeaderCommand(const LeaderCommand& command);
LeaderCommand ParseLeaderCommand(const std::string& bytes);

} // namespace Shepherd

#endif // SHEPHERD_SRC_LEADER_LEADER_STATE_H_
