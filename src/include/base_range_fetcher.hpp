// This class is the base class for remote byte range access.
//
// A range fetcher performs two kinds of requests against a remote file: a metadata-only request which reports its
// size and modification time, and range requests which return file content. Requests are never retried here; a
// failure is thrown to the caller.

#pragma once

#include <optional>

#include "tailcache_common.hpp"

namespace tailcache {

// Result of a metadata-only request.
struct RemoteFileInfo {
	// Invalid if the remote didn't report content length.
	optional_idx file_size;
	// Absent if the remote didn't report last modification time.
	std::optional<timestamp_t> last_modified;
};

class BaseRangeFetcher {
public:
	BaseRangeFetcher() = default;
	virtual ~BaseRangeFetcher() = default;
	BaseRangeFetcher(const BaseRangeFetcher &) = delete;
	BaseRangeFetcher &operator=(const BaseRangeFetcher &) = delete;

	// Metadata-only request for [url].
	virtual RemoteFileInfo Head(const string &url) = 0;

	// Closed range request for bytes in [start, end).
	virtual string FetchRange(const string &url, idx_t start, idx_t end) = 0;

	// Open-ended range request for bytes from [start] to the end of file.
	virtual string FetchSuffix(const string &url, idx_t start) = 0;

	// Get name for range fetcher.
	virtual std::string GetName() const {
		throw NotImplementedException("Base range fetcher doesn't implement GetName.");
	}
};

} // namespace tailcache
