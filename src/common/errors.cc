#include "errors.h"

namespace Shepherd {

const char* ErrorCodeName(ErrorCode code) {
	switch (code) {
		case ErrorCode::kStoreUnavailable:
			return "StoreUnavailable";
		case ErrorCode::kFailedToUpdateStateLog:
			return "FailedToUpdateStateLog";
		case ErrorCode::kCorruptedState:
			return "CorruptedState";
		case ErrorCode::kNoProducerAvailable:
			return "NoProducerAvailable";
	}
	return "Unknown";
}

CoordinationError::CoordinationError(ErrorCode code, const std::string& message)
	: std::runtime_error(std::string(ErrorCodeName(code)) + ": " + message), code_(code) {}

} // namespace Shepherd
