#include "coordination_store.h"

#include <utility>

namespace Shepherd {

Compare Compare::Version(std::string key, CompareOp op, int64_t version) {
	return Compare{std::move(key), CompareTarget::kVersion, op, version};
}

Compare Compare::ModRevision(std::string key, CompareOp op, Revision revision) {
	return Compare{std::move(key), CompareTarget::kModRevision, op, revision};
}

std::string PrefixRangeEnd(const std::string& prefix) {
	std::string end = prefix;
	while (!end.empty()) {
		unsigned char last = static_cast<unsigned char>(end.back());
		if (last < 0xff) {
			end.back() = static_cast<char>(last + 1);
			return end;
		}
		end.pop_back();
	}
	// Every byte was 0xff: etcd's "\0" means "to the end of the keyspace".
	return std::string(1, '\0');
}

} // namespace Shepherd
