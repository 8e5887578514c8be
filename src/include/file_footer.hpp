// Footer metadata of a remote columnar file, restricted to what the cache needs: row counts, per column chunk byte
// layout and leading statistics. Encoded row data is never represented here.

#pragma once

#include <optional>

#include "tailcache_common.hpp"

namespace tailcache {

struct ColumnChunkMetadata {
	// Dot-separated column path in schema.
	string path_in_schema;
	// Absent if the column chunk has no dictionary page.
	optional_idx dictionary_page_offset;
	idx_t data_page_offset = 0;
	idx_t total_compressed_size = 0;
	// Min/max statistics rendered as strings, absent if the writer didn't record them.
	std::optional<string> stats_min;
	std::optional<string> stats_max;

	// Byte offset of the first page of the column chunk.
	idx_t GetStartOffset() const {
		return dictionary_page_offset.IsValid() ? dictionary_page_offset.GetIndex() : data_page_offset;
	}
	idx_t GetEndOffset() const {
		return GetStartOffset() + total_compressed_size;
	}
};

struct RowGroupMetadata {
	idx_t num_rows = 0;
	vector<ColumnChunkMetadata> columns;
};

struct FileFooter {
	idx_t num_rows = 0;
	// Byte length of the serialized footer, excluding the fixed-size trailer.
	idx_t metadata_length = 0;
	string created_by;
	vector<RowGroupMetadata> row_groups;
};

} // namespace tailcache
