// A slice provider serves arbitrary byte ranges of one file. Decoders and footer parsers read exclusively through it,
// without knowing whether bytes come from memory or from the network.

#pragma once

#include <optional>

#include "tailcache_common.hpp"

namespace tailcache {

class SliceProvider {
public:
	SliceProvider() = default;
	virtual ~SliceProvider() = default;
	SliceProvider(const SliceProvider &) = delete;
	SliceProvider &operator=(const SliceProvider &) = delete;

	// Total byte size of the file as currently known.
	virtual idx_t GetFileSize() const = 0;

	// Last modification timestamp as currently known, if the remote reported one.
	virtual std::optional<timestamp_t> GetLastModified() const = 0;

	// Read bytes in [start, end); [end] is capped by neither cache nor file size, caller is expected to stay in bounds.
	virtual string ReadSlice(idx_t start, idx_t end) = 0;
};

} // namespace tailcache
