#include "slice_provider_filesystem.hpp"

#include <cstring>

namespace tailcache {

SliceProviderFileHandle::SliceProviderFileHandle(duckdb::FileSystem &file_system, const string &path,
                                                 FileOpenFlags flags, SliceProvider &provider_p)
    : FileHandle(file_system, path, flags), provider(provider_p) {
}

SliceProviderFileSystem::SliceProviderFileSystem(string name_p)
    : name(std::move(name_p)), path_prefix(StringUtil::Format("%s://", name)) {
}

string SliceProviderFileSystem::RegisterProvider(SliceProvider &provider) {
	const std::lock_guard<std::mutex> lck(mu);
	auto path = StringUtil::Format("%s%llu", path_prefix, next_path_id++);
	providers.emplace(path, &provider);
	return path;
}

void SliceProviderFileSystem::UnregisterProvider(const string &path) {
	const std::lock_guard<std::mutex> lck(mu);
	providers.erase(path);
}

idx_t SliceProviderFileSystem::GetProviderCount() const {
	const std::lock_guard<std::mutex> lck(mu);
	return providers.size();
}

SliceProvider *SliceProviderFileSystem::GetProvider(const string &path) const {
	const std::lock_guard<std::mutex> lck(mu);
	auto iter = providers.find(path);
	if (iter == providers.end()) {
		return nullptr;
	}
	return iter->second;
}

bool SliceProviderFileSystem::CanHandleFile(const string &fpath) {
	return StringUtil::StartsWith(fpath, path_prefix);
}

unique_ptr<FileHandle> SliceProviderFileSystem::OpenFile(const string &path, FileOpenFlags flags,
                                                         optional_ptr<FileOpener> opener) {
	if (flags.OpenForWriting()) {
		throw NotImplementedException("%s is read-only, cannot open %s for write", name, path);
	}
	auto *provider = GetProvider(path);
	if (provider == nullptr) {
		if (flags.ReturnNullIfNotExists()) {
			return nullptr;
		}
		throw IOException("No slice provider registered for %s", path);
	}
	return make_uniq<SliceProviderFileHandle>(*this, path, flags, *provider);
}

void SliceProviderFileSystem::Read(FileHandle &handle, void *buffer, int64_t nr_bytes, idx_t location) {
	auto &slice_handle = handle.Cast<SliceProviderFileHandle>();
	if (nr_bytes <= 0) {
		return;
	}
	const idx_t end = location + static_cast<idx_t>(nr_bytes);
	const idx_t file_size = slice_handle.provider.GetFileSize();
	if (end > file_size) {
		throw IOException("Cannot read bytes [%llu, %llu) of %s, which has %llu bytes", location, end,
		                  handle.GetPath(), file_size);
	}
	const auto content = slice_handle.provider.ReadSlice(location, end);
	D_ASSERT(content.length() == static_cast<idx_t>(nr_bytes));
	std::memcpy(buffer, content.data(), content.length());
}

int64_t SliceProviderFileSystem::Read(FileHandle &handle, void *buffer, int64_t nr_bytes) {
	auto &slice_handle = handle.Cast<SliceProviderFileHandle>();
	const idx_t file_size = slice_handle.provider.GetFileSize();
	if (slice_handle.file_offset >= file_size || nr_bytes <= 0) {
		return 0;
	}
	const idx_t bytes_to_read = MinValue<idx_t>(static_cast<idx_t>(nr_bytes), file_size - slice_handle.file_offset);
	Read(handle, buffer, static_cast<int64_t>(bytes_to_read), slice_handle.file_offset);
	slice_handle.file_offset += bytes_to_read;
	return static_cast<int64_t>(bytes_to_read);
}

int64_t SliceProviderFileSystem::GetFileSize(FileHandle &handle) {
	auto &slice_handle = handle.Cast<SliceProviderFileHandle>();
	return static_cast<int64_t>(slice_handle.provider.GetFileSize());
}

timestamp_t SliceProviderFileSystem::GetLastModifiedTime(FileHandle &handle) {
	auto &slice_handle = handle.Cast<SliceProviderFileHandle>();
	const auto last_modified = slice_handle.provider.GetLastModified();
	if (!last_modified.has_value()) {
		return timestamp_t {0};
	}
	return *last_modified;
}

bool SliceProviderFileSystem::FileExists(const string &filename, optional_ptr<FileOpener> opener) {
	return GetProvider(filename) != nullptr;
}

vector<OpenFileInfo> SliceProviderFileSystem::Glob(const string &path, FileOpener *opener) {
	vector<OpenFileInfo> file_infos;
	if (GetProvider(path) != nullptr) {
		file_infos.emplace_back(path);
	}
	return file_infos;
}

void SliceProviderFileSystem::Seek(FileHandle &handle, idx_t location) {
	auto &slice_handle = handle.Cast<SliceProviderFileHandle>();
	slice_handle.file_offset = location;
}

idx_t SliceProviderFileSystem::SeekPosition(FileHandle &handle) {
	auto &slice_handle = handle.Cast<SliceProviderFileHandle>();
	return slice_handle.file_offset;
}

void SliceProviderFileSystem::Reset(FileHandle &handle) {
	Seek(handle, /*location=*/0);
}

} // namespace tailcache
