#ifndef SHEPHERD_SRC_COMMON_KEY_PATHS_H_
#define SHEPHERD_SRC_COMMON_KEY_PATHS_H_

#include <optional>
#include <string>

#include "types.h"

namespace Shepherd {

/**
 * Layout of every key the leader reads or writes in the coordination store.
 *
 *   <root>/consumer-groups/<group>/leader-state-log
 *   <root>/consumer-groups/<group>/leader-lock
 *   <root>/consumer-groups/<group>/instance-locks/<instance>
 *   <root>/producers/<producer>/lock
 *   <root>/barriers/<id>[/arrived/<participant>]
 */
class KeyPaths {
	public:
		explicit KeyPaths(std::string root = "v1");

		const std::string& root() const { return root_; }

		std::string LeaderStateLogKey(const ConsumerGroupId& group) const;
		std::string LeaderLockKey(const ConsumerGroupId& group) const;
		std::string InstanceLockPrefix(const ConsumerGroupId& group) const;
		std::string InstanceLockKey(const ConsumerGroupId& group, const InstanceId& instance) const;

		std::string ProducerLockPrefix() const;
		std::string ProducerLockKey(const ProducerId& producer) const;
		// Inverse of ProducerLockKey; nullopt for keys outside the producer namespace.
		std::optional<ProducerId> ProducerIdFromLockKey(const std::string& key) const;

		std::string BarrierKey(const std::string& barrier_id) const;

	private:
		std::string root_;
};

} // namespace Shepherd

#endif // SHEPHERD_SRC_COMMON_KEY_PATHS_H_
