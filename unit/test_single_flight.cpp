#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include <atomic>
#include <condition_variable>
#include <thread>

#include "single_flight.hpp"
#include "tailcache_common.hpp"

using namespace tailcache; // NOLINT

namespace {

// Blocks callers until released.
class Gate {
public:
	void Wait() {
		std::unique_lock<std::mutex> lck(mu);
		cv.wait(lck, [this]() { return opened; });
	}
	void Open() {
		{
			std::lock_guard<std::mutex> lck(mu);
			opened = true;
		}
		cv.notify_all();
	}

private:
	std::mutex mu;
	std::condition_variable cv;
	bool opened = false;
};

} // namespace

TEST_CASE("Test sequential calls run separately", "[single flight test]") {
	SingleFlight<int> single_flight;
	int invocation = 0;
	REQUIRE(single_flight.Do([&]() { return ++invocation; }) == 1);
	REQUIRE(single_flight.Do([&]() { return ++invocation; }) == 2);
	REQUIRE(!single_flight.InFlight());
}

TEST_CASE("Test concurrent calls are joined", "[single flight test]") {
	constexpr idx_t follower_count = 4;
	SingleFlight<bool> single_flight;
	std::atomic<idx_t> invocation {0};
	Gate leader_started;
	Gate leader_release;

	std::atomic<bool> leader_result {false};
	std::thread leader([&]() {
		leader_result = single_flight.Do([&]() {
			++invocation;
			leader_started.Open();
			leader_release.Wait();
			return true;
		});
	});
	leader_started.Wait();
	REQUIRE(single_flight.InFlight());

	std::atomic<idx_t> true_results {0};
	vector<std::thread> followers;
	for (idx_t idx = 0; idx < follower_count; ++idx) {
		followers.emplace_back([&]() {
			const bool result = single_flight.Do([&]() {
				++invocation;
				return false;
			});
			if (result) {
				++true_results;
			}
		});
	}

	// Followers either joined the in-flight call, or run after it completes; give them time to join.
	std::this_thread::sleep_for(std::chrono::milliseconds(100));
	leader_release.Open();
	leader.join();
	for (auto &cur_follower : followers) {
		cur_follower.join();
	}

	REQUIRE(leader_result.load());
	REQUIRE(invocation.load() + true_results.load() == follower_count + 1);
	REQUIRE(!single_flight.InFlight());
}

TEST_CASE("Test exception is forwarded to all callers", "[single flight test]") {
	SingleFlight<bool> single_flight;
	REQUIRE_THROWS_AS(single_flight.Do([]() -> bool { throw IOException("remote unavailable"); }), IOException);

	// The failed call doesn't stick.
	REQUIRE(!single_flight.InFlight());
	REQUIRE(single_flight.Do([]() { return true; }));
}

int main(int argc, char **argv) {
	return Catch::Session().run(argc, argv);
}
