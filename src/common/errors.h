#ifndef SHEPHERD_SRC_COMMON_ERRORS_H_
#define SHEPHERD_SRC_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace Shepherd {

enum class ErrorCode {
	kStoreUnavailable,
	// CAS guard failed: leadership lost or a concurrent writer advanced the log.
	kFailedToUpdateStateLog,
	kCorruptedState,
	kNoProducerAvailable,
};

const char* ErrorCodeName(ErrorCode code);

/**
 * Every fatal condition of the leader runtime is reported with this exception.
 * The supervisor is expected to drop the runtime and re-elect on any of them.
 */
class CoordinationError : public std::runtime_error {
	public:
		CoordinationError(ErrorCode code, const std::string& message);

		ErrorCode code() const { return code_; }

	private:
		ErrorCode code_;
};

} // namespace Shepherd

#endif // SHEPHERD_SRC_COMMON_ERRORS_H_
