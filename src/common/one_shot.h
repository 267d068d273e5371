#ifndef SHEPHERD_SRC_COMMON_ONE_SHOT_H_
#define SHEPHERD_SRC_COMMON_ONE_SHOT_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "errors.h"

namespace Shepherd {

/**
 * Single-resolution notification shared between a producer thread and waiters.
 *
 * The signal resolves exactly once, either cleanly (Fire) or with an error
 * (Fail). Later resolutions are rejected. Listeners registered with
 * AddListener run on the resolving thread, outside the internal lock.
 */
class OneShotSignal {
	public:
		using ListenerId = uint64_t;

		OneShotSignal() = default;
		OneShotSignal(const OneShotSignal&) = delete;
		OneShotSignal& operator=(const OneShotSignal&) = delete;

		// Returns false when the signal was already resolved.
		bool Fire();
		bool Fail(ErrorCode code, const std::string& message);

		bool IsFired() const;
		void Wait() const;
		bool WaitFor(absl::Duration timeout) const;

		std::optional<CoordinationError> error() const;
		// Rethrows the error the signal was resolved with, if any.
		void ThrowIfFailed() const;

		// If already resolved the listener runs inline and 0 is returned.
		ListenerId AddListener(std::function<void()> listener);
		void RemoveListener(ListenerId id);

	private:
		bool Resolve(std::optional<CoordinationError> error);

		mutable absl::Mutex mu_;
		bool fired_ ABSL_GUARDED_BY(mu_) = false;
		std::optional<CoordinationError> error_ ABSL_GUARDED_BY(mu_);
		ListenerId next_listener_id_ ABSL_GUARDED_BY(mu_) = 1;
		std::vector<std::pair<ListenerId, std::function<void()>>> listeners_ ABSL_GUARDED_BY(mu_);
};

/**
 * Blocks until at least one of the signals resolves and returns its index.
 * When several are resolved the lowest index wins, so callers put the
 * interrupt first.
 */
size_t WaitAny(const std::vector<OneShotSignal*>& signals);

} // namespace Shepherd

#endif // SHEPHERD_SRC_COMMON_ONE_SHOT_H_
