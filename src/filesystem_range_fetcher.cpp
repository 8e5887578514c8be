#include "filesystem_range_fetcher.hpp"

#include "byte_range_utils.hpp"
#include "tailcache_logger.hpp"

namespace tailcache {

using duckdb::FileHandle;
using duckdb::FileOpenFlags;

FileSystemRangeFetcher::FileSystemRangeFetcher(duckdb::FileSystem &file_system_p,
                                               optional_ptr<DatabaseInstance> instance_p)
    : file_system(file_system_p), instance(instance_p) {
}

FileSystemRangeFetcher::FileSystemRangeFetcher(unique_ptr<duckdb::FileSystem> file_system_p,
                                               optional_ptr<DatabaseInstance> instance_p)
    : owned_file_system(std::move(file_system_p)), file_system(*owned_file_system), instance(instance_p) {
}

unique_ptr<FileHandle> FileSystemRangeFetcher::OpenForRead(const string &url) {
	auto handle = file_system.OpenFile(url, FileOpenFlags::FILE_FLAGS_READ | FileOpenFlags::FILE_FLAGS_PARALLEL_ACCESS);
	if (handle == nullptr) {
		throw IOException("Failed to open remote file %s", url);
	}
	return handle;
}

string FileSystemRangeFetcher::ReadExactly(FileHandle &handle, const string &url, idx_t start, idx_t end) {
	string content(end - start, '\0');
	if (content.empty()) {
		return content;
	}
	TAILCACHE_LOG_DEBUG(instance, "Fetch %s with range %s", url, FormatRangeHeader(start, end));
	file_system.Read(handle, content.data(), static_cast<int64_t>(content.length()), start);
	return content;
}

RemoteFileInfo FileSystemRangeFetcher::Head(const string &url) {
	auto handle = OpenForRead(url);
	RemoteFileInfo file_info;

	const int64_t file_size = file_system.GetFileSize(*handle);
	if (file_size >= 0) {
		file_info.file_size = static_cast<idx_t>(file_size);
	}

	// Filesystems which don't track modification time report epoch.
	const timestamp_t last_modified = file_system.GetLastModifiedTime(*handle);
	if (last_modified.value > 0) {
		file_info.last_modified = last_modified;
	}
	return file_info;
}

string FileSystemRangeFetcher::FetchRange(const string &url, idx_t start, idx_t end) {
	if (end < start) {
		throw InvalidInputException("Invalid fetch range [%llu, %llu) for %s", start, end, url);
	}
	auto handle = OpenForRead(url);
	const int64_t file_size = file_system.GetFileSize(*handle);
	if (file_size < 0 || end > static_cast<idx_t>(file_size)) {
		throw IOException("Range %s is not satisfiable for %s with %lld bytes", FormatRangeHeader(start, end), url,
		                  static_cast<long long>(file_size));
	}
	auto content = ReadExactly(*handle, url, start, end);
	ValidateRangeResponse(url, start, end, content.length());
	return content;
}

string FileSystemRangeFetcher::FetchSuffix(const string &url, idx_t start) {
	auto handle = OpenForRead(url);
	const int64_t file_size = file_system.GetFileSize(*handle);
	if (file_size < 0) {
		throw IOException("Remote file %s doesn't report content length", url);
	}
	const idx_t end = static_cast<idx_t>(file_size);
	if (start > end) {
		throw IOException("Range %s is not satisfiable for %s with %llu bytes", FormatRangeHeader(start), url, end);
	}
	return ReadExactly(*handle, url, start, end);
}

} // namespace tailcache
