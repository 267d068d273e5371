#pragma once

#include <string>

namespace Shepherd {

// Random (version 4) UUID in canonical 8-4-4-4-12 hex form.
std::string GenerateUuid();

// Opaque generation token minted on every Idle entry.
std::string GenerateExecutionId();

} // namespace Shepherd
