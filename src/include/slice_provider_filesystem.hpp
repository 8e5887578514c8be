// A duckdb filesystem which serves registered [SliceProvider]s as read-only files, so duckdb readers (i.e. parquet
// reader) read remote file bytes through the cache instead of the network.
//
// Each provider is registered under a path with the filesystem's own prefix; reads against an unregistered path fail.
// The provider must outlive its registration.

#pragma once

#include <mutex>
#include <unordered_map>

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/open_file_info.hpp"
#include "slice_provider.hpp"
#include "tailcache_common.hpp"

namespace tailcache {

using duckdb::FileHandle;
using duckdb::FileOpener;
using duckdb::FileOpenFlags;
using duckdb::OpenFileInfo;

class SliceProviderFileHandle : public FileHandle {
public:
	SliceProviderFileHandle(duckdb::FileSystem &file_system, const string &path, FileOpenFlags flags,
	                        SliceProvider &provider_p);
	~SliceProviderFileHandle() override = default;
	void Close() override {
	}

	SliceProvider &provider;
	// Offset for sequential read.
	idx_t file_offset = 0;
};

class SliceProviderFileSystem : public duckdb::FileSystem {
public:
	// [name_p] must be unique among filesystems registered to one duckdb instance, and is used as path prefix.
	explicit SliceProviderFileSystem(string name_p);
	~SliceProviderFileSystem() override = default;

	// Register [provider] and return the path it's served under.
	string RegisterProvider(SliceProvider &provider);
	void UnregisterProvider(const string &path);

	unique_ptr<FileHandle> OpenFile(const string &path, FileOpenFlags flags,
	                                optional_ptr<FileOpener> opener = nullptr) override;
	void Read(FileHandle &handle, void *buffer, int64_t nr_bytes, idx_t location) override;
	int64_t Read(FileHandle &handle, void *buffer, int64_t nr_bytes) override;
	int64_t GetFileSize(FileHandle &handle) override;
	timestamp_t GetLastModifiedTime(FileHandle &handle) override;
	bool FileExists(const string &filename, optional_ptr<FileOpener> opener = nullptr) override;
	vector<OpenFileInfo> Glob(const string &path, FileOpener *opener = nullptr) override;
	void Seek(FileHandle &handle, idx_t location) override;
	idx_t SeekPosition(FileHandle &handle) override;
	void Reset(FileHandle &handle) override;
	bool CanSeek() override {
		return true;
	}
	bool OnDiskFile(FileHandle &handle) override {
		return false;
	}
	bool CanHandleFile(const string &fpath) override;
	std::string GetName() const override {
		return name;
	}

	// Get number of currently registered providers.
	idx_t GetProviderCount() const;

private:
	// Return nullptr if [path] isn't registered.
	SliceProvider *GetProvider(const string &path) const;

	const string name;
	// Path prefix, for example, "tailcache-slice-1://".
	const string path_prefix;

	mutable std::mutex mu;
	idx_t next_path_id = 0;
	std::unordered_map<string, SliceProvider *> providers;
};

} // namespace tailcache
