#include "key_paths.h"

#include <utility>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace Shepherd {

namespace {
constexpr char kProducerLockSuffix[] = "/lock";
}

KeyPaths::KeyPaths(std::string root) : root_(std::move(root)) {}

std::string KeyPaths::LeaderStateLogKey(const ConsumerGroupId& group) const {
	return absl::StrCat(root_, "/consumer-groups/", group, "/leader-state-log");
}

std::string KeyPaths::LeaderLockKey(const ConsumerGroupId& group) const {
	return absl::StrCat(root_, "/consumer-groups/", group, "/leader-lock");
}

std::string KeyPaths::InstanceLockPrefix(const ConsumerGroupId& group) const {
	return absl::StrCat(root_, "/consumer-groups/", group, "/instance-locks/");
}

std::string KeyPaths::InstanceLockKey(const ConsumerGroupId& group, const InstanceId& instance) const {
	return absl::StrCat(InstanceLockPrefix(group), instance);
}

std::string KeyPaths::ProducerLockPrefix() const {
	return absl::StrCat(root_, "/producers/");
}

std::string KeyPaths::ProducerLockKey(const ProducerId& producer) const {
	return absl::StrCat(ProducerLockPrefix(), producer, kProducerLockSuffix);
}

std::optional<ProducerId> KeyPaths::ProducerIdFromLockKey(const std::string& key) const {
	absl::string_view view(key);
	const std::string prefix = ProducerLockPrefix();
	if (!absl::ConsumePrefix(&view, prefix) || !absl::ConsumeSuffix(&view, kProducerLockSuffix)) {
		return std::nullopt;
	}
	if (view.empty() || absl::StrContains(view, '/')) {
		return std::nullopt;
	}
	return ProducerId(view);
}

std::string KeyPaths::BarrierKey(const std::string& barrier_id) const {
	return absl::StrCat(root_, "/barriers/", barrier_id);
}

} // namespace Shepherd
