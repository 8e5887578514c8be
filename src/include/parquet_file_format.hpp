// Parquet file format, which delegates footer parsing and row decoding to duckdb's parquet reader.
//
// Bytes are read through a [SliceProviderFileSystem] registered into the given duckdb instance; every call serves its
// provider under a fresh path, so nothing read by an earlier call (before the file grew) is reused.
// The file format must be destructed before the duckdb instance.

#pragma once

#include "base_file_format.hpp"
#include "slice_provider_filesystem.hpp"
#include "tailcache_common.hpp"

namespace tailcache {

// Magic bytes at both ends of a parquet file.
inline constexpr const char *PARQUET_MAGIC = "PAR1";
// Trailer consists of 4-byte little-endian footer length and the magic bytes.
inline constexpr idx_t PARQUET_TRAILER_SIZE = 8;

class ParquetFileFormat : public BaseFileFormat {
public:
	// Registers a private filesystem into [instance_p].
	// Note: duckdb external file cache is disabled for the whole [instance_p], since bytes are cached by remote file
	// cache already; it stays disabled after the file format is destroyed.
	explicit ParquetFileFormat(DatabaseInstance &instance_p);
	~ParquetFileFormat() override;

	FileFooter ParseFooter(SliceProvider &provider, idx_t suffix_start) override;
	unique_ptr<duckdb::MaterializedQueryResult> DecodeRows(SliceProvider &provider, const FileFooter &footer,
	                                                       idx_t row_start, idx_t row_end) override;
	std::string GetName() const override {
		return "parquet";
	}

	// Get the filesystem registered into duckdb instance, only exposed for testing.
	SliceProviderFileSystem &GetSliceProviderFileSystem() const {
		return slice_filesystem;
	}

private:
	DatabaseInstance &instance;
	// Owned by the virtual filesystem of [instance].
	SliceProviderFileSystem &slice_filesystem;
};

// Read footer length from the trailer of parquet file served by [provider]; throw [IOException] if it's not a
// parquet file.
idx_t ReadParquetFooterLength(SliceProvider &provider);

} // namespace tailcache
