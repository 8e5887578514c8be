#include "remote_file_cache.hpp"

#include <algorithm>
#include <cstring>
#include <functional>

#include "byte_range_utils.hpp"
#include "tailcache_logger.hpp"

namespace tailcache {

namespace {

// A contiguous run of cached bytes, either tail window or a cached block.
struct CachedSource {
	idx_t start = 0;
	Blob content;

	idx_t GetEnd() const {
		return start + content->length();
	}
};

// Serves a file version which is fetched but not installed yet: bytes inside the fetched tail come from memory, all
// other ranges are fetched.
class StagedTailProvider : public SliceProvider {
public:
	StagedTailProvider(idx_t file_size_p, std::optional<timestamp_t> last_modified_p, idx_t tail_start_p, Blob tail_p,
	                   std::function<string(idx_t, idx_t)> fetch_p)
	    : file_size(file_size_p), last_modified(last_modified_p), tail_start(tail_start_p), tail(std::move(tail_p)),
	      fetch(std::move(fetch_p)) {
	}

	idx_t GetFileSize() const override {
		return file_size;
	}
	std::optional<timestamp_t> GetLastModified() const override {
		return last_modified;
	}
	string ReadSlice(idx_t start, idx_t end) override {
		if (end < start) {
			throw InvalidInputException("Invalid slice [%llu, %llu)", start, end);
		}
		if (start == end) {
			return string {};
		}
		if (start >= tail_start && end <= tail_start + tail->length()) {
			return tail->substr(start - tail_start, end - start);
		}
		return fetch(start, end);
	}

private:
	const idx_t file_size;
	const std::optional<timestamp_t> last_modified;
	const idx_t tail_start;
	const Blob tail;
	const std::function<string(idx_t, idx_t)> fetch;
};

} // namespace

string GetBlockCacheKey(const RemoteBlock &block) {
	return StringUtil::Format("block-%llu-%llu-%llu", block.index, block.start_byte, block.end_byte);
}

RemoteFileCache::RemoteFileCache(string url_p, unique_ptr<BaseRangeFetcher> fetcher_p,
                                 shared_ptr<BaseFileFormat> file_format_p, RemoteFileCacheConfig config_p,
                                 optional_ptr<DatabaseInstance> instance_p)
    : url(std::move(url_p)), fetcher(std::move(fetcher_p)), file_format(std::move(file_format_p)),
      config(std::move(config_p)), instance(instance_p),
      block_cache(config.max_cache_bytes,
                  [instance = instance_p](const string &key, const Blob &blob) {
	                  TAILCACHE_LOG_DEBUG(instance, "Evict %s (%llu bytes) from block cache", key, blob->length());
                  },
                  instance_p) {
	ValidateConfig(config);
	if (fetcher == nullptr) {
		throw InvalidInputException("Remote file cache for %s requires a range fetcher", url);
	}
	if (file_format == nullptr) {
		throw InvalidInputException("Remote file cache for %s requires a file format", url);
	}
}

//===--------------------------------------------------------------------===//
// Initialization
//===--------------------------------------------------------------------===//

void RemoteFileCache::Initialize() {
	const std::lock_guard<std::mutex> op_lck(op_mu);
	InitializeImpl();
}

void RemoteFileCache::InitializeImpl() {
	// Nothing is installed until the new footer is parsed, so a failure keeps the previous state.
	const auto file_info = fetcher->Head(url);
	if (!file_info.file_size.IsValid()) {
		throw IOException("Remote file %s doesn't report content length", url);
	}
	const idx_t new_file_size = file_info.file_size.GetIndex();
	const idx_t fetch_start = GetTailFetchStart(new_file_size, config.initial_fetch_size);
	auto content = make_shared_ptr<const string>(FetchRange(fetch_start, new_file_size));

	StagedTailProvider staged_provider {new_file_size, file_info.last_modified, fetch_start, content,
	                                    [this](idx_t start, idx_t end) { return FetchRange(start, end); }};
	auto new_footer = file_format->ParseFooter(staged_provider, fetch_start);
	auto new_blocks = ComputeRemoteBlocks(new_footer);

	const std::lock_guard<std::mutex> lck(mu);
	block_cache.Clear();
	file_size = new_file_size;
	last_modified = file_info.last_modified;
	tail = TailWindow {
	    .start = fetch_start,
	    .content = std::move(content),
	};
	footer = make_shared_ptr<const FileFooter>(std::move(new_footer));
	blocks = std::move(new_blocks);
	PromoteImmutableBlocks();
	TAILCACHE_LOG_DEBUG(instance,
	                    "Initialize remote file %s with %llu bytes, %llu blocks, tail window starts at %llu, %llu "
	                    "bytes in block cache",
	                    url, file_size, blocks.size(), tail.start, block_cache.GetTotalBytes());
}

//===--------------------------------------------------------------------===//
// Refresh
//===--------------------------------------------------------------------===//

bool RemoteFileCache::Refresh() {
	return refresh_flight.Do([this]() {
		const std::lock_guard<std::mutex> op_lck(op_mu);
		return RefreshImpl();
	});
}

bool RemoteFileCache::RefreshImpl() {
	// Values captured at the start of refresh.
	idx_t old_file_size = 0;
	vector<RemoteBlock> old_blocks;
	idx_t old_tail_start = 0;
	{
		const std::lock_guard<std::mutex> lck(mu);
		if (footer == nullptr) {
			throw InvalidInputException("Remote file cache for %s is not initialized", url);
		}
		old_file_size = file_size;
		old_blocks = blocks;
		old_tail_start = tail.start;
	}

	const auto file_info = fetcher->Head(url);
	if (!file_info.file_size.IsValid()) {
		throw IOException("Remote file %s doesn't report content length", url);
	}
	const idx_t new_file_size = file_info.file_size.GetIndex();
	{
		const std::lock_guard<std::mutex> lck(mu);
		last_modified = file_info.last_modified;
	}
	if (new_file_size == old_file_size) {
		return false;
	}

	// Suffix fetch starts where the last block begins, which covers the grown last block, new blocks and new footer.
	const idx_t suffix_start = old_blocks.empty() ? old_tail_start : old_blocks.back().start_byte;
	if (static_cast<double>(new_file_size) < config.restructure_min_size_ratio * static_cast<double>(old_file_size)) {
		RestructureReset(StringUtil::Format("file size dropped from %llu to %llu bytes", old_file_size, new_file_size));
		return true;
	}
	if (new_file_size <= suffix_start) {
		RestructureReset(StringUtil::Format("file size %llu is not beyond last block start %llu", new_file_size,
		                                    suffix_start));
		return true;
	}

	// Parse against the fetched suffix before installing it, so a failed parse leaves the cache as is and the next
	// refresh observes the size change again.
	auto content = make_shared_ptr<const string>(fetcher->FetchSuffix(url, suffix_start));
	const idx_t fetched_file_size = suffix_start + content->length();
	StagedTailProvider staged_provider {fetched_file_size, file_info.last_modified, suffix_start, content,
	                                    [this](idx_t start, idx_t end) { return FetchRange(start, end); }};
	auto new_footer = file_format->ParseFooter(staged_provider, suffix_start);
	auto new_blocks = ComputeRemoteBlocks(new_footer);

	const idx_t old_block_count = old_blocks.size();
	const idx_t new_block_count = new_blocks.size();
	const idx_t block_count_delta =
	    new_block_count > old_block_count ? new_block_count - old_block_count : old_block_count - new_block_count;
	if (block_count_delta > config.restructure_block_count_delta) {
		RestructureReset(StringUtil::Format("block count changed from %llu to %llu", old_block_count,
		                                    new_block_count));
		return true;
	}
	if (config.verify_immutable_blocks) {
		for (idx_t idx = 0; idx + 1 < old_block_count; ++idx) {
			if (idx >= new_block_count || !HasSameLayout(old_blocks[idx], new_blocks[idx])) {
				RestructureReset(StringUtil::Format("layout of immutable block %llu changed", idx));
				return true;
			}
		}
	}

	const std::lock_guard<std::mutex> lck(mu);
	if (!old_blocks.empty()) {
		block_cache.Delete(GetBlockCacheKey(old_blocks.back()));
	}
	file_size = fetched_file_size;
	tail = TailWindow {
	    .start = suffix_start,
	    .content = std::move(content),
	};
	footer = make_shared_ptr<const FileFooter>(std::move(new_footer));
	blocks = std::move(new_blocks);
	PromoteImmutableBlocks();
	TAILCACHE_LOG_DEBUG(instance, "Refresh remote file %s from %llu to %llu bytes, from %llu to %llu blocks", url,
	                    old_file_size, file_size, old_block_count, blocks.size());
	return true;
}

void RemoteFileCache::RestructureReset(const string &reason) {
	TAILCACHE_LOG_WARN(instance, "Remote file %s is restructured (%s), discard all cached bytes and reinitialize", url,
	                   reason);
	InitializeImpl();
	const std::lock_guard<std::mutex> lck(mu);
	++restructure_count;
}

//===--------------------------------------------------------------------===//
// Block fetch
//===--------------------------------------------------------------------===//

void RemoteFileCache::EnsureBlocksCached(const vector<idx_t> &indices) {
	const std::lock_guard<std::mutex> op_lck(op_mu);
	EnsureBlocksCachedImpl(indices);
}

void RemoteFileCache::EnsureBlocksCachedImpl(const vector<idx_t> &indices) {
	vector<RemoteBlock> missing_blocks;
	{
		const std::lock_guard<std::mutex> lck(mu);
		for (const idx_t cur_index : indices) {
			if (cur_index >= blocks.size()) {
				throw InvalidInputException("Block index %llu is out of range, %s has %llu blocks", cur_index, url,
				                            blocks.size());
			}
			const auto &cur_block = blocks[cur_index];
			if (!IsBlockCached(cur_block)) {
				missing_blocks.emplace_back(cur_block);
			}
		}
	}
	if (missing_blocks.empty()) {
		return;
	}

	std::sort(missing_blocks.begin(), missing_blocks.end(),
	          [](const RemoteBlock &lhs, const RemoteBlock &rhs) { return lhs.index < rhs.index; });
	missing_blocks.erase(std::unique(missing_blocks.begin(), missing_blocks.end(),
	                                 [](const RemoteBlock &lhs, const RemoteBlock &rhs) {
		                                 return lhs.index == rhs.index;
	                                 }),
	                     missing_blocks.end());

	// One request spans all missing blocks, including cached blocks in between.
	const idx_t fetch_start = missing_blocks.front().start_byte;
	const idx_t fetch_end = missing_blocks.back().end_byte;
	const auto content = FetchRange(fetch_start, fetch_end);

	const std::lock_guard<std::mutex> lck(mu);
	for (const auto &cur_block : missing_blocks) {
		auto blob =
		    make_shared_ptr<const string>(content.substr(cur_block.start_byte - fetch_start, cur_block.GetByteSize()));
		block_cache.Put(GetBlockCacheKey(cur_block), std::move(blob));
	}
	TAILCACHE_LOG_DEBUG(instance, "Fetch %llu blocks of %s with one request %s", missing_blocks.size(), url,
	                    FormatRangeHeader(fetch_start, fetch_end));
}

string RemoteFileCache::FetchRange(idx_t start, idx_t end) {
	if (start == end) {
		return string {};
	}
	auto content = fetcher->FetchRange(url, start, end);
	ValidateRangeResponse(url, start, end, content.length());
	return content;
}

void RemoteFileCache::PromoteImmutableBlocks() {
	if (blocks.empty()) {
		return;
	}
	// The last block may still grow, so it's never promoted.
	for (idx_t idx = 0; idx + 1 < blocks.size(); ++idx) {
		const auto &cur_block = blocks[idx];
		if (!tail.Contains(cur_block.start_byte, cur_block.end_byte)) {
			continue;
		}
		const auto cache_key = GetBlockCacheKey(cur_block);
		if (block_cache.Has(cache_key)) {
			continue;
		}
		auto blob = make_shared_ptr<const string>(
		    tail.content->substr(cur_block.start_byte - tail.start, cur_block.GetByteSize()));
		block_cache.Put(cache_key, std::move(blob));
	}
}

bool RemoteFileCache::IsBlockCached(const RemoteBlock &block) const {
	return tail.Contains(block.start_byte, block.end_byte) || block_cache.Has(GetBlockCacheKey(block));
}

//===--------------------------------------------------------------------===//
// Row read
//===--------------------------------------------------------------------===//

unique_ptr<duckdb::MaterializedQueryResult> RemoteFileCache::ReadRows(idx_t row_start, idx_t row_end) {
	if (row_end < row_start) {
		throw InvalidInputException("Invalid row range [%llu, %llu) for %s", row_start, row_end, url);
	}

	shared_ptr<const FileFooter> footer_snapshot;
	{
		const std::lock_guard<std::mutex> op_lck(op_mu);
		vector<idx_t> indices;
		{
			const std::lock_guard<std::mutex> lck(mu);
			if (footer == nullptr) {
				throw InvalidInputException("Remote file cache for %s is not initialized", url);
			}
			footer_snapshot = footer;
			indices = tailcache::GetBlockIndicesForRows(blocks, row_start, row_end);
		}
		EnsureBlocksCachedImpl(indices);
	}
	return file_format->DecodeRows(*this, *footer_snapshot, row_start, row_end);
}

//===--------------------------------------------------------------------===//
// Slice provider
//===--------------------------------------------------------------------===//

idx_t RemoteFileCache::GetFileSize() const {
	const std::lock_guard<std::mutex> lck(mu);
	return file_size;
}

std::optional<timestamp_t> RemoteFileCache::GetLastModified() const {
	const std::lock_guard<std::mutex> lck(mu);
	return last_modified;
}

string RemoteFileCache::ReadSlice(idx_t start, idx_t end) {
	if (end < start) {
		throw InvalidInputException("Invalid slice [%llu, %llu) for %s", start, end, url);
	}
	if (start == end) {
		return string {};
	}

	// Sources overlapping the requested range, tail window first.
	vector<CachedSource> sources;
	{
		const std::lock_guard<std::mutex> lck(mu);
		if (tail.Contains(start, end)) {
			return tail.content->substr(start - tail.start, end - start);
		}
		// Blocks don't overlap, so at most one block contains the whole range.
		for (const auto &cur_block : blocks) {
			if (cur_block.start_byte > start || cur_block.end_byte < end) {
				continue;
			}
			auto blob = block_cache.Get(GetBlockCacheKey(cur_block));
			if (blob != nullptr && cur_block.start_byte + blob->length() >= end) {
				return blob->substr(start - cur_block.start_byte, end - start);
			}
			break;
		}

		if (tail.content != nullptr && tail.start < end && tail.GetEnd() > start) {
			sources.emplace_back(CachedSource {
			    .start = tail.start,
			    .content = tail.content,
			});
		}
		for (const auto &cur_block : blocks) {
			if (cur_block.end_byte <= start || cur_block.start_byte >= end) {
				continue;
			}
			auto blob = block_cache.Get(GetBlockCacheKey(cur_block));
			if (blob != nullptr) {
				sources.emplace_back(CachedSource {
				    .start = cur_block.start_byte,
				    .content = std::move(blob),
				});
			}
		}
	}

	// Walk a cursor across sources, copying contiguous runs.
	string result;
	result.reserve(end - start);
	idx_t cursor = start;
	while (cursor < end) {
		auto iter = std::find_if(sources.begin(), sources.end(), [cursor](const CachedSource &source) {
			return source.start <= cursor && cursor < source.GetEnd();
		});
		if (iter == sources.end()) {
			break;
		}
		const idx_t run_end = MinValue<idx_t>(end, iter->GetEnd());
		result.append(iter->content->data() + (cursor - iter->start), run_end - cursor);
		cursor = run_end;
	}
	if (cursor == end) {
		return result;
	}

	TAILCACHE_LOG_WARN(instance, "Slice %s of %s has a gap at %llu after %llu cached bytes, fetch the whole range",
	                   FormatRangeHeader(start, end), url, cursor, cursor - start);
	return FetchRange(start, end);
}

//===--------------------------------------------------------------------===//
// Getters
//===--------------------------------------------------------------------===//

shared_ptr<const FileFooter> RemoteFileCache::GetFooter() const {
	const std::lock_guard<std::mutex> lck(mu);
	return footer;
}

vector<RemoteBlock> RemoteFileCache::GetBlocks() const {
	const std::lock_guard<std::mutex> lck(mu);
	return blocks;
}

vector<idx_t> RemoteFileCache::GetBlockIndicesForRows(idx_t row_start, idx_t row_end) const {
	const std::lock_guard<std::mutex> lck(mu);
	return tailcache::GetBlockIndicesForRows(blocks, row_start, row_end);
}

vector<RemoteBlock> RemoteFileCache::GetBlocksForTimeRange(timestamp_t from, timestamp_t to) const {
	const std::lock_guard<std::mutex> lck(mu);
	return tailcache::GetBlocksForTimeRange(blocks, from, to);
}

Blob RemoteFileCache::GetCachedBlock(idx_t index) const {
	const std::lock_guard<std::mutex> lck(mu);
	if (index >= blocks.size()) {
		return nullptr;
	}
	return block_cache.Peek(GetBlockCacheKey(blocks[index]));
}

RemoteFileCacheStats RemoteFileCache::GetStats() const {
	const std::lock_guard<std::mutex> lck(mu);
	RemoteFileCacheStats stats;
	stats.file_size = file_size;
	stats.metadata_size = footer == nullptr ? 0 : footer->metadata_length;
	stats.block_count = blocks.size();
	for (const auto &cur_block : blocks) {
		if (IsBlockCached(cur_block)) {
			++stats.cached_block_count;
		}
	}

	const auto block_cache_stats = block_cache.GetStats();
	stats.block_cache_bytes = block_cache_stats.total_bytes;
	stats.tail_window_bytes = tail.content == nullptr ? 0 : tail.content->length();
	stats.cache_bytes = stats.block_cache_bytes + stats.tail_window_bytes;
	stats.cache_budget = block_cache_stats.max_bytes;
	stats.cache_utilization = block_cache_stats.utilization;
	stats.restructure_count = restructure_count;
	return stats;
}

} // namespace tailcache
