#ifndef SHEPHERD_SRC_LEADER_PRODUCER_SELECTOR_H_
#define SHEPHERD_SRC_LEADER_PRODUCER_SELECTOR_H_

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "common/key_paths.h"
#include "common/types.h"
#include "store/coordination_store.h"

namespace Shepherd {

/**
 * Policy that picks the producer a consumer group follows next.
 *
 * Implementations must only return a member of candidates that is not in
 * excluded, or nullopt when no such candidate exists.
 */
class IProducerSelector {
	public:
		virtual ~IProducerSelector() = default;

		virtual std::optional<ProducerId> SelectProducer(
				const std::vector<ProducerId>& candidates,
				const absl::flat_hash_set<ProducerId>& excluded) = 0;
};

// Uniformly random among eligible candidates.
class RandomProducerSelector : public IProducerSelector {
	public:
		RandomProducerSelector();
		explicit RandomProducerSelector(uint64_t seed);

		std::optional<ProducerId> SelectProducer(
				const std::vector<ProducerId>& candidates,
				const absl::flat_hash_set<ProducerId>& excluded) override;

	private:
		std::mt19937_64 gen_;
};

// Smallest eligible id. Deterministic, so every leader agrees.
class LowestIdProducerSelector : public IProducerSelector {
	public:
		std::optional<ProducerId> SelectProducer(
				const std::vector<ProducerId>& candidates,
				const absl::flat_hash_set<ProducerId>& excluded) override;
};

// "random" or "lowest"; nullptr for anything else.
std::unique_ptr<IProducerSelector> MakeProducerSelector(const std::string& policy);

// Producers whose liveness key currently exists, sorted by id.
std::vector<ProducerId> ListLiveProducers(CoordinationStore* store, const KeyPaths& paths);

} // namespace Shepherd

#endif // SHEPHERD_SRC_LEADER_PRODUCER_SELECTOR_H_
