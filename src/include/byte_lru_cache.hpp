// A least-recently-used cache for binary blobs, which is bounded by total byte size rather than entry count.
//
// This class is not thread-safe by itself; the owner is expected to serialize access.
//
// Example usage:
// ByteLruCache cache {/*max_bytes_p=*/1024};
// cache.Put("key", make_shared_ptr<const string>("value"));
// auto blob = cache.Get("key");

#pragma once

#include <functional>
#include <list>
#include <unordered_map>

#include "tailcache_common.hpp"
#include "tailcache_config.hpp"

namespace tailcache {

struct ByteLruCacheStats {
	idx_t entry_count = 0;
	idx_t total_bytes = 0;
	idx_t max_bytes = 0;
	double utilization = 0.0;
};

class ByteLruCache {
public:
	// Invoked with every entry evicted to make room; not invoked on explicit deletion or clear.
	using EvictionCallback = std::function<void(const string &key, const Blob &blob)>;

	explicit ByteLruCache(idx_t max_bytes_p = DEFAULT_MAX_CACHE_BYTES, EvictionCallback eviction_callback_p = nullptr,
	                      optional_ptr<DatabaseInstance> instance_p = nullptr);

	// Disable copy and move.
	ByteLruCache(const ByteLruCache &) = delete;
	ByteLruCache &operator=(const ByteLruCache &) = delete;
	~ByteLruCache() = default;

	// Return the blob for [key] and mark it as most recently used, or nullptr if absent.
	Blob Get(const string &key);

	// Same as [Get], but recency is not affected.
	Blob Peek(const string &key) const;

	// Whether [key] is present; recency is not affected.
	bool Has(const string &key) const;

	// Insert or replace the blob for [key], evicting least recently used entries until it fits.
	// Return false if the blob alone exceeds the byte budget, in which case the cache is left unchanged.
	bool Put(const string &key, Blob blob);

	// Return whether an entry was removed.
	bool Delete(const string &key);

	void Clear();

	ByteLruCacheStats GetStats() const;

	// Keys ordered from least recently used to most recently used.
	vector<string> Keys() const;

	idx_t GetTotalBytes() const {
		return total_bytes;
	}
	idx_t GetMaxBytes() const {
		return max_bytes;
	}
	idx_t Size() const {
		return entry_map.size();
	}

private:
	struct Entry {
		string key;
		Blob blob;
		idx_t size = 0;
	};
	// Front is the most recently used entry, back is the least recently used one.
	using EntryList = std::list<Entry>;

	// Evict the least recently used entry.
	void EvictOldest();

	const idx_t max_bytes;
	EvictionCallback eviction_callback;
	optional_ptr<DatabaseInstance> instance;

	idx_t total_bytes = 0;
	EntryList entries;
	std::unordered_map<string, EntryList::iterator> entry_map;
};

} // namespace tailcache
