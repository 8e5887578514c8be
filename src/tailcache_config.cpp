#include "tailcache_config.hpp"

#include "duckdb/common/types/value.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/database.hpp"

namespace tailcache {

const idx_t DEFAULT_INITIAL_FETCH_SIZE = 128 * 1024;
const idx_t DEFAULT_MAX_CACHE_BYTES = 10 * 1024 * 1024;
const idx_t DEFAULT_RESTRUCTURE_BLOCK_COUNT_DELTA = 5;
const double DEFAULT_RESTRUCTURE_MIN_SIZE_RATIO = 0.8;
const bool DEFAULT_VERIFY_IMMUTABLE_BLOCKS = true;

const char *const INITIAL_FETCH_SIZE_SETTING = "tailcache_initial_fetch_size";
const char *const MAX_CACHE_BYTES_SETTING = "tailcache_max_cache_bytes";
const char *const RESTRUCTURE_BLOCK_COUNT_DELTA_SETTING = "tailcache_restructure_block_count_delta";
const char *const RESTRUCTURE_MIN_SIZE_RATIO_SETTING = "tailcache_restructure_min_size_ratio";
const char *const VERIFY_IMMUTABLE_BLOCKS_SETTING = "tailcache_verify_immutable_blocks";

namespace {

using duckdb::ClientContext;
using duckdb::LogicalType;
using duckdb::LogicalTypeId;
using duckdb::SetScope;
using duckdb::Value;

void ValidateInitialFetchSize(idx_t initial_fetch_size) {
	if (initial_fetch_size == 0) {
		throw InvalidInputException("%s must be greater than 0", INITIAL_FETCH_SIZE_SETTING);
	}
}

void ValidateMaxCacheBytes(idx_t max_cache_bytes) {
	if (max_cache_bytes == 0) {
		throw InvalidInputException("%s must be greater than 0", MAX_CACHE_BYTES_SETTING);
	}
}

void ValidateMinSizeRatio(double ratio) {
	if (!(ratio > 0.0 && ratio <= 1.0)) {
		throw InvalidInputException("%s must be in range (0, 1], but got %f", RESTRUCTURE_MIN_SIZE_RATIO_SETTING,
		                            ratio);
	}
}

void UpdateInitialFetchSize(ClientContext &context, SetScope scope, Value &parameter) {
	ValidateInitialFetchSize(parameter.GetValue<uint64_t>());
}

void UpdateMaxCacheBytes(ClientContext &context, SetScope scope, Value &parameter) {
	ValidateMaxCacheBytes(parameter.GetValue<uint64_t>());
}

void UpdateMinSizeRatio(ClientContext &context, SetScope scope, Value &parameter) {
	ValidateMinSizeRatio(parameter.GetValue<double>());
}

} // namespace

void ValidateConfig(const RemoteFileCacheConfig &config) {
	ValidateInitialFetchSize(config.initial_fetch_size);
	ValidateMaxCacheBytes(config.max_cache_bytes);
	ValidateMinSizeRatio(config.restructure_min_size_ratio);
}

void RegisterRemoteFileCacheSettings(DatabaseInstance &instance) {
	auto &config = duckdb::DBConfig::GetConfig(instance);

	config.AddExtensionOption(INITIAL_FETCH_SIZE_SETTING,
	                          "Number of trailing bytes a remote file cache fetches on initialization. It should cover "
	                          "the footer and roughly the most recent row group.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_INITIAL_FETCH_SIZE),
	                          UpdateInitialFetchSize);
	config.AddExtensionOption(MAX_CACHE_BYTES_SETTING,
	                          "Byte budget for immutable row groups kept by a remote file cache. Least recently used "
	                          "row groups are evicted once the budget is exceeded.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_MAX_CACHE_BYTES),
	                          UpdateMaxCacheBytes);
	config.AddExtensionOption(RESTRUCTURE_BLOCK_COUNT_DELTA_SETTING,
	                          "A refresh which changes the row group count by more than this value discards all cached "
	                          "state and re-initializes, since the file has likely been rewritten.",
	                          LogicalType {LogicalTypeId::UBIGINT},
	                          Value::UBIGINT(DEFAULT_RESTRUCTURE_BLOCK_COUNT_DELTA));
	config.AddExtensionOption(RESTRUCTURE_MIN_SIZE_RATIO_SETTING,
	                          "A refresh which observes the file shrinking below this fraction of its previous size "
	                          "discards all cached state and re-initializes.",
	                          LogicalType {LogicalTypeId::DOUBLE}, Value::DOUBLE(DEFAULT_RESTRUCTURE_MIN_SIZE_RATIO),
	                          UpdateMinSizeRatio);
	config.AddExtensionOption(VERIFY_IMMUTABLE_BLOCKS_SETTING,
	                          "Whether a refresh checks that previously complete row groups kept their byte range and "
	                          "row count, and re-initializes if they didn't.",
	                          LogicalTypeId::BOOLEAN, Value::BOOLEAN(DEFAULT_VERIFY_IMMUTABLE_BLOCKS));
}

RemoteFileCacheConfig GetRemoteFileCacheConfig(DatabaseInstance &instance) {
	RemoteFileCacheConfig config;
	Value val;
	if (instance.TryGetCurrentSetting(INITIAL_FETCH_SIZE_SETTING, val)) {
		config.initial_fetch_size = val.GetValue<uint64_t>();
	}
	if (instance.TryGetCurrentSetting(MAX_CACHE_BYTES_SETTING, val)) {
		config.max_cache_bytes = val.GetValue<uint64_t>();
	}
	if (instance.TryGetCurrentSetting(RESTRUCTURE_BLOCK_COUNT_DELTA_SETTING, val)) {
		config.restructure_block_count_delta = val.GetValue<uint64_t>();
	}
	if (instance.TryGetCurrentSetting(RESTRUCTURE_MIN_SIZE_RATIO_SETTING, val)) {
		config.restructure_min_size_ratio = val.GetValue<double>();
	}
	if (instance.TryGetCurrentSetting(VERIFY_IMMUTABLE_BLOCKS_SETTING, val)) {
		config.verify_immutable_blocks = val.GetValue<bool>();
	}
	return config;
}

} // namespace tailcache
