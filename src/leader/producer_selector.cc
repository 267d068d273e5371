#include "producer_selector.h"

#include <algorithm>

namespace Shepherd {

namespace {

std::vector<ProducerId> Eligible(const std::vector<ProducerId>& candidates,
		const absl::flat_hash_set<ProducerId>& excluded) {
	std::vector<ProducerId> eligible;
	for (const auto& candidate : candidates) {
		if (!excluded.contains(candidate)) {
			eligible.push_back(candidate);
		}
	}
	return eligible;
}

} // namespace

RandomProducerSelector::RandomProducerSelector() : gen_(std::random_device{}()) {}

RandomProducerSelector::RandomProducerSelector(uint64_t seed) : gen_(seed) {}

std::optional<ProducerId> RandomProducerSelector::SelectProducer(
		const std::vector<ProducerId>& candidates,
		const absl::flat_hash_set<ProducerId>& excluded) {
	std::vector<ProducerId> eligible = Eligible(candidates, excluded);
	if (eligible.empty()) {
		return std::nullopt;
	}
	std::uniform_int_distribution<size_t> dis(0, eligible.size() - 1);
	return eligible[dis(gen_)];
}

std::optional<ProducerId> LowestIdProducerSelector::SelectProducer(
		const std::vector<ProducerId>& candidates,
		const absl::flat_hash_set<ProducerId>& excluded) {
	std::vector<ProducerId> eligible = Eligible(candidates, excluded);
	if (eligible.empty()) {
		return std::nullopt;
	}
	return *std::min_element(eligible.begin(), eligible.end());
}

std::unique_ptr<IProducerSelector> MakeProducerSelector(const std::string& policy) {
	if (policy == "random") {
		return std::make_unique<RandomProducerSelector>();
	}
	if (policy == "lowest") {
		return std::make_unique<LowestIdProducerSelector>();
	}
	return nullptr;
}

std::vector<ProducerId> ListLiveProducers(CoordinationStore* store, const KeyPaths& paths) {
	std::vector<ProducerId> producers;
	for (const auto& kv : store->GetPrefix(paths.ProducerLockPrefix()).kvs) {
		std::optional<ProducerId> id = paths.ProducerIdFromLockKey(kv.key);
		if (id.has_value()) {
			producers.push_back(*id);
		}
	}
	std::sort(producers.begin(), producers.end());
	producers.erase(std::unique(producers.begin(), producers.end()), producers.end());
	return producers;
}

} // namespace Shepherd
