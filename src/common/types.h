#pragma once

#include <cstdint>
#include <string>

namespace Shepherd {

using ConsumerGroupId = std::string;
using ProducerId = std::string;
using InstanceId = std::string;

using Revision = int64_t;
using LeaseId = int64_t;

constexpr LeaseId kNoLease = 0;

} // namespace Shepherd
