#include "tailcache.hpp"

#include "duckdb/main/database.hpp"
#include "filesystem_range_fetcher.hpp"
#include "tailcache_config.hpp"

namespace tailcache {

unique_ptr<RemoteFileCache> CreateParquetRemoteFileCache(DatabaseInstance &instance, const string &url,
                                                         shared_ptr<ParquetFileFormat> file_format) {
	if (file_format == nullptr) {
		file_format = make_shared_ptr<ParquetFileFormat>(instance);
	}
	auto fetcher = make_uniq<FileSystemRangeFetcher>(instance.GetFileSystem(), &instance);
	return make_uniq<RemoteFileCache>(url, std::move(fetcher), std::move(file_format),
	                                  GetRemoteFileCacheConfig(instance), &instance);
}

} // namespace tailcache
