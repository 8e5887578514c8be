#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include "byte_lru_cache.hpp"

using namespace tailcache; // NOLINT

namespace {

Blob MakeBlob(idx_t size, char value = 'a') {
	return make_shared_ptr<const string>(size, value);
}

} // namespace

TEST_CASE("Test get and put", "[byte lru cache test]") {
	ByteLruCache cache {/*max_bytes_p=*/100};
	REQUIRE(cache.Get("key") == nullptr);
	REQUIRE(!cache.Has("key"));

	REQUIRE(cache.Put("key", make_shared_ptr<const string>("value")));
	auto blob = cache.Get("key");
	REQUIRE(blob != nullptr);
	REQUIRE(*blob == "value");
	REQUIRE(cache.Has("key"));
	REQUIRE(cache.Size() == 1);
	REQUIRE(cache.GetTotalBytes() == 5);
}

TEST_CASE("Test replacing an entry doesn't double count its size", "[byte lru cache test]") {
	ByteLruCache cache {/*max_bytes_p=*/100};
	REQUIRE(cache.Put("key", MakeBlob(60)));
	REQUIRE(cache.Put("key", MakeBlob(70, 'b')));
	REQUIRE(cache.Size() == 1);
	REQUIRE(cache.GetTotalBytes() == 70);
	REQUIRE(*cache.Get("key") == string(70, 'b'));
}

TEST_CASE("Test eviction keeps total bytes within budget", "[byte lru cache test]") {
	vector<string> evicted_keys;
	ByteLruCache cache {/*max_bytes_p=*/100, [&evicted_keys](const string &key, const Blob &blob) {
		                    evicted_keys.emplace_back(key);
	                    }};

	for (idx_t idx = 0; idx < 10; ++idx) {
		REQUIRE(cache.Put(StringUtil::Format("key-%llu", idx), MakeBlob(30)));
		REQUIRE(cache.GetTotalBytes() <= cache.GetMaxBytes());
	}
	REQUIRE(cache.Size() == 3);
	REQUIRE(cache.GetTotalBytes() == 90);
	REQUIRE(evicted_keys == vector<string> {"key-0", "key-1", "key-2", "key-3", "key-4", "key-5", "key-6"});
	REQUIRE(cache.Keys() == vector<string> {"key-7", "key-8", "key-9"});
}

TEST_CASE("Test least recently used entry is evicted first", "[byte lru cache test]") {
	vector<string> evicted_keys;
	ByteLruCache cache {/*max_bytes_p=*/100, [&evicted_keys](const string &key, const Blob &blob) {
		                    evicted_keys.emplace_back(key);
	                    }};
	REQUIRE(cache.Put("a", MakeBlob(40)));
	REQUIRE(cache.Put("b", MakeBlob(40)));

	// Touch "a", so "b" becomes the least recently used one.
	REQUIRE(cache.Get("a") != nullptr);
	REQUIRE(cache.Put("c", MakeBlob(40)));
	REQUIRE(evicted_keys == vector<string> {"b"});
	REQUIRE(cache.Has("a"));
	REQUIRE(cache.Has("c"));

	// Re-put "a" also refreshes recency.
	REQUIRE(cache.Put("a", MakeBlob(40)));
	REQUIRE(cache.Put("d", MakeBlob(40)));
	REQUIRE(evicted_keys == vector<string> {"b", "c"});
	REQUIRE(cache.Keys() == vector<string> {"a", "d"});
}

TEST_CASE("Test has and peek don't affect recency", "[byte lru cache test]") {
	ByteLruCache cache {/*max_bytes_p=*/100};
	REQUIRE(cache.Put("a", MakeBlob(40)));
	REQUIRE(cache.Put("b", MakeBlob(40)));
	REQUIRE(cache.Has("a"));
	REQUIRE(cache.Peek("a") != nullptr);
	REQUIRE(cache.Put("c", MakeBlob(40)));
	REQUIRE(!cache.Has("a"));
	REQUIRE(cache.Peek("a") == nullptr);
}

TEST_CASE("Test oversized blob is rejected", "[byte lru cache test]") {
	idx_t eviction_count = 0;
	ByteLruCache cache {/*max_bytes_p=*/100,
	                    [&eviction_count](const string &key, const Blob &blob) { ++eviction_count; }};
	REQUIRE(cache.Put("small", MakeBlob(50)));
	REQUIRE(!cache.Put("large", MakeBlob(101)));
	REQUIRE(!cache.Has("large"));
	REQUIRE(cache.Has("small"));
	REQUIRE(cache.GetTotalBytes() == 50);
	REQUIRE(eviction_count == 0);

	// A blob of exactly the budget fits after evicting everything else.
	REQUIRE(cache.Put("exact", MakeBlob(100)));
	REQUIRE(cache.Keys() == vector<string> {"exact"});
	REQUIRE(eviction_count == 1);
}

TEST_CASE("Test delete and clear don't invoke eviction callback", "[byte lru cache test]") {
	idx_t eviction_count = 0;
	ByteLruCache cache {/*max_bytes_p=*/100,
	                    [&eviction_count](const string &key, const Blob &blob) { ++eviction_count; }};
	REQUIRE(cache.Put("a", MakeBlob(10)));
	REQUIRE(cache.Put("b", MakeBlob(20)));
	REQUIRE(cache.Put("c", MakeBlob(30)));

	REQUIRE(cache.Delete("a"));
	REQUIRE(!cache.Delete("a"));
	REQUIRE(cache.GetTotalBytes() == 50);

	cache.Clear();
	REQUIRE(cache.Size() == 0);
	REQUIRE(cache.GetTotalBytes() == 0);
	REQUIRE(cache.Keys().empty());
	REQUIRE(eviction_count == 0);
}

TEST_CASE("Test cache stats", "[byte lru cache test]") {
	ByteLruCache cache {/*max_bytes_p=*/200};
	REQUIRE(cache.Put("a", MakeBlob(50)));
	REQUIRE(cache.Put("b", MakeBlob(100)));

	const auto stats = cache.GetStats();
	REQUIRE(stats.entry_count == 2);
	REQUIRE(stats.total_bytes == 150);
	REQUIRE(stats.max_bytes == 200);
	REQUIRE(stats.utilization == Approx(0.75));
}

int main(int argc, char **argv) {
	int result = Catch::Session().run(argc, argv);
	return result;
}
