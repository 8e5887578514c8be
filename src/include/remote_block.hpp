// A block is one row group of the remote file, reduced to its byte range, row count and leading column time range.

#pragma once

#include <optional>

#include "file_footer.hpp"
#include "tailcache_common.hpp"

namespace tailcache {

struct RemoteBlock {
	// Ordinal in file order, 0-based.
	idx_t index = 0;
	idx_t start_byte = 0;
	// Exclusive.
	idx_t end_byte = 0;
	idx_t num_rows = 0;
	// Leading column statistics, present only if they parse as timestamps.
	std::optional<timestamp_t> min_timestamp;
	std::optional<timestamp_t> max_timestamp;

	idx_t GetByteSize() const {
		return end_byte - start_byte;
	}
	// Whether the block lies entirely inside [start, end).
	bool IsWithin(idx_t start, idx_t end) const {
		return start_byte >= start && end_byte <= end;
	}
};

// Compute blocks from the given footer. A block spans from the smallest column chunk start offset to the largest
// column chunk end offset of its row group.
vector<RemoteBlock> ComputeRemoteBlocks(const FileFooter &footer);

// Get ordinals of blocks overlapping the row range [row_start, row_end); blocks are contiguous in row order.
vector<idx_t> GetBlockIndicesForRows(const vector<RemoteBlock> &blocks, idx_t row_start, idx_t row_end);

// Get blocks whose leading column time range overlaps [from, to]. A missing min is treated as unbounded below, a
// missing max as unbounded above.
vector<RemoteBlock> GetBlocksForTimeRange(const vector<RemoteBlock> &blocks, timestamp_t from, timestamp_t to);

// Whether the two blocks describe the same bytes and rows.
bool HasSameLayout(const RemoteBlock &lhs, const RemoteBlock &rhs);

} // namespace tailcache
