// Remote file cache tracks one append-only remote columnar file and serves byte ranges and rows of it with as few
// network requests as possible.
//
// Bytes live in two tiers:
// - Tail window, the blob fetched most recently by initialization or refresh, anchored at some offset and running to
//   end of file as of that fetch. It always holds the footer.
// - Block cache, a byte-bounded LRU cache of whole blocks. Blocks other than the last one never change, so they're
//   either promoted from tail window, or fetched on demand; the last block is only cached on demand, and invalidated
//   whenever the file grows.
//
// The cache is itself the [SliceProvider] used for footer parsing and row decoding.
//
// All public functions are thread-safe. Initialization, refresh and block fetch are serialized; concurrent refreshes
// are deduplicated into one.

#pragma once

#include <mutex>
#include <optional>

#include "base_file_format.hpp"
#include "base_range_fetcher.hpp"
#include "byte_lru_cache.hpp"
#include "file_footer.hpp"
#include "remote_block.hpp"
#include "single_flight.hpp"
#include "slice_provider.hpp"
#include "tailcache_common.hpp"
#include "tailcache_config.hpp"

namespace tailcache {

struct RemoteFileCacheStats {
	idx_t file_size = 0;
	// Byte length of serialized footer.
	idx_t metadata_size = 0;
	idx_t block_count = 0;
	// Number of blocks either in block cache or fully inside tail window.
	idx_t cached_block_count = 0;
	idx_t block_cache_bytes = 0;
	idx_t tail_window_bytes = 0;
	// Sum of block cache and tail window bytes.
	idx_t cache_bytes = 0;
	// Byte budget of block cache.
	idx_t cache_budget = 0;
	// Block cache bytes over its budget.
	double cache_utilization = 0.0;
	// Number of restructuring resets since construction.
	idx_t restructure_count = 0;
};

class RemoteFileCache : public SliceProvider {
public:
	RemoteFileCache(string url_p, unique_ptr<BaseRangeFetcher> fetcher_p, shared_ptr<BaseFileFormat> file_format_p,
	                RemoteFileCacheConfig config_p = RemoteFileCacheConfig {},
	                optional_ptr<DatabaseInstance> instance_p = nullptr);
	~RemoteFileCache() override = default;

	// Learn file size, fetch the tail, parse footer and promote immutable blocks inside the tail.
	// Calling it again discards all cached bytes and starts over. On failure, the previous state is kept.
	void Initialize();

	// Check whether the remote file has changed size, and pick up appended blocks if so.
	// Return whether file size changed. Throw [InvalidInputException] if not initialized.
	bool Refresh();

	// Make sure all blocks of the given ordinals are either in tail window or block cache, with at most one range
	// request. Throw [InvalidInputException] if any ordinal is out of range.
	void EnsureBlocksCached(const vector<idx_t> &indices);

	// Decode rows in [row_start, row_end), in file order.
	unique_ptr<duckdb::MaterializedQueryResult> ReadRows(idx_t row_start, idx_t row_end);

	// SliceProvider implementation.
	idx_t GetFileSize() const override;
	std::optional<timestamp_t> GetLastModified() const override;
	string ReadSlice(idx_t start, idx_t end) override;

	// Return nullptr if not initialized.
	shared_ptr<const FileFooter> GetFooter() const;
	vector<RemoteBlock> GetBlocks() const;
	vector<idx_t> GetBlockIndicesForRows(idx_t row_start, idx_t row_end) const;
	vector<RemoteBlock> GetBlocksForTimeRange(timestamp_t from, timestamp_t to) const;
	RemoteFileCacheStats GetStats() const;
	const string &GetUrl() const {
		return url;
	}
	const RemoteFileCacheConfig &GetConfig() const {
		return config;
	}

	// Return cached blob for block of the given ordinal in current layout, or nullptr if it's not in block cache.
	// Recency is not affected.
	Blob GetCachedBlock(idx_t index) const;

private:
	struct TailWindow {
		idx_t start = 0;
		Blob content;

		idx_t GetEnd() const {
			return content == nullptr ? start : start + content->length();
		}
		bool Contains(idx_t range_start, idx_t range_end) const {
			return content != nullptr && range_start >= start && range_end <= GetEnd();
		}
	};

	// Implementation for initialization, refresh and block fetch, which should be called with [op_mu] held.
	void InitializeImpl();
	bool RefreshImpl();
	void EnsureBlocksCachedImpl(const vector<idx_t> &indices);
	// Discard all cached bytes and initialize from scratch.
	void RestructureReset(const string &reason);

	// Fetch bytes in [start, end) and validate response length.
	string FetchRange(idx_t start, idx_t end);

	// Copy every block except the last one, which lies fully in tail window and isn't cached yet, into block cache.
	// Should be called with [mu] held.
	void PromoteImmutableBlocks();
	// Whether the block is in tail window or block cache. Should be called with [mu] held.
	bool IsBlockCached(const RemoteBlock &block) const;

	const string url;
	unique_ptr<BaseRangeFetcher> fetcher;
	shared_ptr<BaseFileFormat> file_format;
	const RemoteFileCacheConfig config;
	optional_ptr<DatabaseInstance> instance;

	// Serializes initialization, refresh and block fetch.
	std::mutex op_mu;
	SingleFlight<bool> refresh_flight;

	// Guards all fields below; never held across network requests or file format calls.
	mutable std::mutex mu;
	idx_t file_size = 0;
	std::optional<timestamp_t> last_modified;
	shared_ptr<const FileFooter> footer;
	vector<RemoteBlock> blocks;
	TailWindow tail;
	ByteLruCache block_cache;
	idx_t restructure_count = 0;
};

// Get block cache key for the given block; the key covers its byte range, so a blob cached under a previous layout is
// never served for a block which moved.
string GetBlockCacheKey(const RemoteBlock &block);

} // namespace tailcache
