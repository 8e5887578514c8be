#pragma once

#include <cstdint>

#include "tailcache_common.hpp"

namespace tailcache {

//===--------------------------------------------------------------------===//
// Default configuration
//===--------------------------------------------------------------------===//

// Number of trailing bytes fetched on initialization, expected to cover the footer and roughly the most recent block.
extern const idx_t DEFAULT_INITIAL_FETCH_SIZE;

// Byte budget for the block blob cache.
extern const idx_t DEFAULT_MAX_CACHE_BYTES;

// A refresh which changes block count by more than this many blocks is treated as a rewrite rather than an append.
extern const idx_t DEFAULT_RESTRUCTURE_BLOCK_COUNT_DELTA;

// A refresh which observes the file shrinking below this fraction of its previous size is treated as a rewrite. The
// value here is the decimal representation for percentage value; for example, 0.8 means 80%.
extern const double DEFAULT_RESTRUCTURE_MIN_SIZE_RATIO;

// Whether a refresh compares byte ranges and row counts of previously immutable blocks against the new footer.
extern const bool DEFAULT_VERIFY_IMMUTABLE_BLOCKS;

//===--------------------------------------------------------------------===//
// Setting names
//===--------------------------------------------------------------------===//
extern const char *const INITIAL_FETCH_SIZE_SETTING;
extern const char *const MAX_CACHE_BYTES_SETTING;
extern const char *const RESTRUCTURE_BLOCK_COUNT_DELTA_SETTING;
extern const char *const RESTRUCTURE_MIN_SIZE_RATIO_SETTING;
extern const char *const VERIFY_IMMUTABLE_BLOCKS_SETTING;

struct RemoteFileCacheConfig {
	idx_t initial_fetch_size = DEFAULT_INITIAL_FETCH_SIZE;
	idx_t max_cache_bytes = DEFAULT_MAX_CACHE_BYTES;
	idx_t restructure_block_count_delta = DEFAULT_RESTRUCTURE_BLOCK_COUNT_DELTA;
	double restructure_min_size_ratio = DEFAULT_RESTRUCTURE_MIN_SIZE_RATIO;
	bool verify_immutable_blocks = DEFAULT_VERIFY_IMMUTABLE_BLOCKS;
};

// Throw [InvalidInputException] if any field of [config] is out of its valid range.
void ValidateConfig(const RemoteFileCacheConfig &config);

//===--------------------------------------------------------------------===//
// Util function for duckdb settings.
//===--------------------------------------------------------------------===//

// Register all tailcache options to the given duckdb instance, so they could be updated with `SET`.
void RegisterRemoteFileCacheSettings(DatabaseInstance &instance);

// Get config from current duckdb settings; options which are not registered keep their default value.
RemoteFileCacheConfig GetRemoteFileCacheConfig(DatabaseInstance &instance);

} // namespace tailcache
