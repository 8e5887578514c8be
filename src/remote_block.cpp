#include "remote_block.hpp"

#include <limits>
#include <tuple>

#include "duckdb/common/types/value.hpp"

namespace tailcache {

namespace {

std::optional<timestamp_t> ParseTimestampStats(const std::optional<string> &stats) {
	if (!stats.has_value()) {
		return std::nullopt;
	}
	duckdb::Value value {*stats};
	if (!value.DefaultTryCastAs(duckdb::LogicalType::TIMESTAMP)) {
		return std::nullopt;
	}
	return value.GetValue<timestamp_t>();
}

} // namespace

vector<RemoteBlock> ComputeRemoteBlocks(const FileFooter &footer) {
	vector<RemoteBlock> blocks;
	blocks.reserve(footer.row_groups.size());
	for (idx_t idx = 0; idx < footer.row_groups.size(); ++idx) {
		const auto &row_group = footer.row_groups[idx];
		if (row_group.columns.empty()) {
			throw IOException("Row group %llu has no column chunk, cannot compute its byte range", idx);
		}

		idx_t start_byte = std::numeric_limits<idx_t>::max();
		idx_t end_byte = 0;
		for (const auto &column : row_group.columns) {
			start_byte = MinValue<idx_t>(start_byte, column.GetStartOffset());
			end_byte = MaxValue<idx_t>(end_byte, column.GetEndOffset());
		}

		// Time range statistics come from the leading column.
		const auto &leading_column = row_group.columns[0];
		blocks.emplace_back(RemoteBlock {
		    .index = idx,
		    .start_byte = start_byte,
		    .end_byte = end_byte,
		    .num_rows = row_group.num_rows,
		    .min_timestamp = ParseTimestampStats(leading_column.stats_min),
		    .max_timestamp = ParseTimestampStats(leading_column.stats_max),
		});
	}
	return blocks;
}

vector<idx_t> GetBlockIndicesForRows(const vector<RemoteBlock> &blocks, idx_t row_start, idx_t row_end) {
	vector<idx_t> indices;
	if (row_start >= row_end) {
		return indices;
	}
	idx_t cur_row = 0;
	for (const auto &cur_block : blocks) {
		if (cur_row >= row_end) {
			break;
		}
		const idx_t block_row_end = cur_row + cur_block.num_rows;
		if (block_row_end > row_start) {
			indices.emplace_back(cur_block.index);
		}
		cur_row = block_row_end;
	}
	return indices;
}

vector<RemoteBlock> GetBlocksForTimeRange(const vector<RemoteBlock> &blocks, timestamp_t from, timestamp_t to) {
	vector<RemoteBlock> overlapping;
	for (const auto &cur_block : blocks) {
		if (cur_block.max_timestamp.has_value() && *cur_block.max_timestamp < from) {
			continue;
		}
		if (cur_block.min_timestamp.has_value() && *cur_block.min_timestamp > to) {
			continue;
		}
		overlapping.emplace_back(cur_block);
	}
	return overlapping;
}

bool HasSameLayout(const RemoteBlock &lhs, const RemoteBlock &rhs) {
	return std::tie(lhs.index, lhs.start_byte, lhs.end_byte, lhs.num_rows) ==
	       std::tie(rhs.index, rhs.start_byte, rhs.end_byte, rhs.num_rows);
}

} // namespace tailcache
