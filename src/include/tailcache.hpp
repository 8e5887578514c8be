// Entry point to build a remote file cache for parquet files on top of a duckdb instance.

#pragma once

#include "parquet_file_format.hpp"
#include "remote_file_cache.hpp"
#include "tailcache_common.hpp"

namespace tailcache {

// Create a remote file cache for the parquet file at [url], which issues requests through filesystems registered to
// [instance] (i.e. httpfs for http urls), and reads config from current duckdb settings.
// [file_format] could be shared among caches of one instance; a new one is created if not given.
// The returned cache is not initialized yet.
// Note: creating a parquet file format disables duckdb external file cache for the whole [instance], which affects
// other queries on it as well.
unique_ptr<RemoteFileCache> CreateParquetRemoteFileCache(DatabaseInstance &instance, const string &url,
                                                         shared_ptr<ParquetFileFormat> file_format = nullptr);

} // namespace tailcache
