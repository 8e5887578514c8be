// SingleFlight deduplicates concurrent invocations of one operation: the first caller (leader) runs it, callers which
// arrive while it's in flight (followers) wait and get the same result, or the same exception.
//
// A call which arrives after the in-flight one completes starts a new one.
//
// Example usage:
// SingleFlight<bool> refresh_flight;
// const bool refreshed = refresh_flight.Do([&]() { return RefreshImpl(); });

#pragma once

#include <functional>
#include <future>
#include <mutex>
#include <optional>

namespace tailcache {

template <typename T>
class SingleFlight {
public:
	SingleFlight() = default;
	SingleFlight(const SingleFlight &) = delete;
	SingleFlight &operator=(const SingleFlight &) = delete;

	// Run [func], or join the in-flight invocation if there's one.
	T Do(const std::function<T()> &func) {
		std::promise<T> promise;
		std::shared_future<T> future;
		{
			std::unique_lock<std::mutex> lck(mu);
			if (in_flight.has_value()) {
				future = *in_flight;
				lck.unlock();
				return future.get();
			}
			future = promise.get_future().share();
			in_flight = future;
		}

		// Exception is forwarded to all waiters, and rethrown to the leader via its own future.
		try {
			promise.set_value(func());
		} catch (...) {
			promise.set_exception(std::current_exception());
		}
		{
			std::lock_guard<std::mutex> lck(mu);
			in_flight.reset();
		}
		return future.get();
	}

	// Whether an invocation is in flight.
	bool InFlight() const {
		std::lock_guard<std::mutex> lck(mu);
		return in_flight.has_value();
	}

private:
	mutable std::mutex mu;
	std::optional<std::shared_future<T>> in_flight;
};

} // namespace tailcache
