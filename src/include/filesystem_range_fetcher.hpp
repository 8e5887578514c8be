// Range fetcher which issues requests through a duckdb filesystem; with httpfs loaded, metadata request maps to HTTP
// `HEAD` and range requests map to `GET` with a `Range` header.

#pragma once

#include "base_range_fetcher.hpp"
#include "duckdb/common/file_system.hpp"
#include "tailcache_common.hpp"

namespace tailcache {

class FileSystemRangeFetcher : public BaseRangeFetcher {
public:
	// Borrow [file_system_p], which must outlive the fetcher.
	explicit FileSystemRangeFetcher(duckdb::FileSystem &file_system_p,
	                                optional_ptr<DatabaseInstance> instance_p = nullptr);
	// Take ownership of [file_system_p].
	explicit FileSystemRangeFetcher(unique_ptr<duckdb::FileSystem> file_system_p,
	                                optional_ptr<DatabaseInstance> instance_p = nullptr);
	~FileSystemRangeFetcher() override = default;

	RemoteFileInfo Head(const string &url) override;
	string FetchRange(const string &url, idx_t start, idx_t end) override;
	string FetchSuffix(const string &url, idx_t start) override;
	std::string GetName() const override {
		return "filesystem_range_fetcher";
	}

private:
	unique_ptr<duckdb::FileHandle> OpenForRead(const string &url);
	// Read exactly bytes in [start, end) from the given [handle].
	string ReadExactly(duckdb::FileHandle &handle, const string &url, idx_t start, idx_t end);

	unique_ptr<duckdb::FileSystem> owned_file_system;
	duckdb::FileSystem &file_system;
	optional_ptr<DatabaseInstance> instance;
};

} // namespace tailcache
