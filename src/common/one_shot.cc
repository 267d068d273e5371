#include "one_shot.h"

#include <memory>

namespace Shepherd {

bool OneShotSignal::Fire() {
	return Resolve(std::nullopt);
}

bool OneShotSignal::Fail(ErrorCode code, const std::string& message) {
	return Resolve(CoordinationError(code, message));
}

bool OneShotSignal::Resolve(std::optional<CoordinationError> error) {
	std::vector<std::pair<ListenerId, std::function<void()>>> listeners;
	{
		absl::MutexLock lock(&mu_);
		if (fired_) {
			return false;
		}
		fired_ = true;
		error_ = std::move(error);
		listeners.swap(listeners_);
	}
	for (auto& listener : listeners) {
		listener.second();
	}
	return true;
}

bool OneShotSignal::IsFired() const {
	absl::MutexLock lock(&mu_);
	return fired_;
}

void OneShotSignal::Wait() const {
	absl::MutexLock lock(&mu_, absl::Condition(&fired_));
}

bool OneShotSignal::WaitFor(absl::Duration timeout) const {
	bool fired = mu_.LockWhenWithTimeout(absl::Condition(&fired_), timeout);
	mu_.Unlock();
	return fired;
}

std::optional<CoordinationError> OneShotSignal::error() const {
	absl::MutexLock lock(&mu_);
	return error_;
}

void OneShotSignal::ThrowIfFailed() const {
	std::optional<CoordinationError> err = error();
	if (err.has_value()) {
		throw *err;
	}
}

OneShotSignal::ListenerId OneShotSignal::AddListener(std::function<void()> listener) {
	{
		absl::MutexLock lock(&mu_);
		if (!fired_) {
			ListenerId id = next_listener_id_++;
			listeners_.emplace_back(id, std::move(listener));
			return id;
		}
	}
	listener();
	return 0;
}

void OneShotSignal::RemoveListener(ListenerId id) {
	if (id == 0) {
		return;
	}
	absl::MutexLock lock(&mu_);
	for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
		if (it->first == id) {
			listeners_.erase(it);
			return;
		}
	}
}

size_t WaitAny(const std::vector<OneShotSignal*>& signals) {
	struct Race {
		absl::Mutex mu;
		bool woken ABSL_GUARDED_BY(mu) = false;
	};
	// Listeners may outlive this frame if a signal resolves while we unregister.
	auto race = std::make_shared<Race>();

	std::vector<OneShotSignal::ListenerId> ids;
	ids.reserve(signals.size());
	for (OneShotSignal* signal : signals) {
		ids.push_back(signal->AddListener([race]() {
			absl::MutexLock lock(&race->mu);
			race->woken = true;
		}));
	}

	race->mu.LockWhen(absl::Condition(&race->woken));
	race->mu.Unlock();

	for (size_t i = 0; i < signals.size(); ++i) {
		signals[i]->RemoveListener(ids[i]);
	}
	for (size_t i = 0; i < signals.size(); ++i) {
		if (signals[i]->IsFired()) {
			return i;
		}
	}
	return signals.size();
}

} // namespace Shepherd
