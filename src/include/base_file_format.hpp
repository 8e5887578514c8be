// This class is the base class for columnar file formats.
//
// A file format knows how to parse the footer of a file, and how to decode a row range into rows, both by reading
// bytes through a [SliceProvider] only.

#pragma once

#include "duckdb/main/materialized_query_result.hpp"
#include "file_footer.hpp"
#include "slice_provider.hpp"
#include "tailcache_common.hpp"

namespace tailcache {

class BaseFileFormat {
public:
	BaseFileFormat() = default;
	virtual ~BaseFileFormat() = default;
	BaseFileFormat(const BaseFileFormat &) = delete;
	BaseFileFormat &operator=(const BaseFileFormat &) = delete;

	// Parse the footer of the file served by [provider].
	// [suffix_start] is the smallest offset the caller has fetched recently; reads before it are served but may cost
	// another network request.
	virtual FileFooter ParseFooter(SliceProvider &provider, idx_t suffix_start) = 0;

	// Decode rows in [row_start, row_end) in file order.
	virtual unique_ptr<duckdb::MaterializedQueryResult> DecodeRows(SliceProvider &provider, const FileFooter &footer,
	                                                               idx_t row_start, idx_t row_end) = 0;

	// Get name for file format.
	virtual std::string GetName() const {
		throw NotImplementedException("Base file format doesn't implement GetName.");
	}
};

} // namespace tailcache
