#include "byte_lru_cache.hpp"

#include <utility>

#include "tailcache_logger.hpp"

namespace tailcache {

ByteLruCache::ByteLruCache(idx_t max_bytes_p, EvictionCallback eviction_callback_p,
                           optional_ptr<DatabaseInstance> instance_p)
    : max_bytes(max_bytes_p), eviction_callback(std::move(eviction_callback_p)), instance(instance_p) {
}

Blob ByteLruCache::Get(const string &key) {
	auto iter = entry_map.find(key);
	if (iter == entry_map.end()) {
		return nullptr;
	}
	entries.splice(entries.begin(), entries, iter->second);
	return iter->second->blob;
}

Blob ByteLruCache::Peek(const string &key) const {
	auto iter = entry_map.find(key);
	if (iter == entry_map.end()) {
		return nullptr;
	}
	return iter->second->blob;
}

bool ByteLruCache::Has(const string &key) const {
	return entry_map.find(key) != entry_map.end();
}

bool ByteLruCache::Put(const string &key, Blob blob) {
	D_ASSERT(blob != nullptr);
	const idx_t blob_size = blob->size();
	if (blob_size > max_bytes) {
		TAILCACHE_LOG_WARN(instance, "Byte cache: item %s (%llu bytes) exceeds max size %llu bytes, not caching", key,
		                   blob_size, max_bytes);
		return false;
	}

	// Remove the old entry first, so its size doesn't count against the budget.
	Delete(key);

	while (total_bytes + blob_size > max_bytes && !entries.empty()) {
		EvictOldest();
	}

	entries.emplace_front(Entry {
	    .key = key,
	    .blob = std::move(blob),
	    .size = blob_size,
	});
	entry_map[key] = entries.begin();
	total_bytes += blob_size;
	return true;
}

bool ByteLruCache::Delete(const string &key) {
	auto iter = entry_map.find(key);
	if (iter == entry_map.end()) {
		return false;
	}
	total_bytes -= iter->second->size;
	entries.erase(iter->second);
	entry_map.erase(iter);
	return true;
}

void ByteLruCache::Clear() {
	entries.clear();
	entry_map.clear();
	total_bytes = 0;
}

ByteLruCacheStats ByteLruCache::GetStats() const {
	return ByteLruCacheStats {
	    .entry_count = entry_map.size(),
	    .total_bytes = total_bytes,
	    .max_bytes = max_bytes,
	    .utilization = max_bytes == 0 ? 0.0 : static_cast<double>(total_bytes) / static_cast<double>(max_bytes),
	};
}

vector<string> ByteLruCache::Keys() const {
	vector<string> keys;
	keys.reserve(entries.size());
	for (auto iter = entries.rbegin(); iter != entries.rend(); ++iter) {
		keys.emplace_back(iter->key);
	}
	return keys;
}

void ByteLruCache::EvictOldest() {
	D_ASSERT(!entries.empty());
	auto evicted = std::move(entries.back());
	entries.pop_back();
	entry_map.erase(evicted.key);
	total_bytes -= evicted.size;
	if (eviction_callback) {
		eviction_callback(evicted.key, evicted.blob);
	}
}

} // namespace tailcache
