// Utility functions for byte range arithmetic and formatting.

#pragma once

#include "tailcache_common.hpp"

namespace tailcache {

// Render the value of an HTTP `Range` header for bytes in [start, end); an invalid [end] renders the open-ended form.
// For example, (0, 10) renders "bytes=0-9", and (10, invalid) renders "bytes=10-".
string FormatRangeHeader(idx_t start, optional_idx end = optional_idx {});

// Start offset of a fetch covering the last [fetch_size] bytes of a file of [file_size] bytes.
idx_t GetTailFetchStart(idx_t file_size, idx_t fetch_size);

// Whether [start, end) lies entirely inside [outer_start, outer_end).
bool IsRangeWithin(idx_t start, idx_t end, idx_t outer_start, idx_t outer_end);

// Throw [IOException] if a range response for [start, end) of [url] carries a different number of bytes.
void ValidateRangeResponse(const string &url, idx_t start, idx_t end, idx_t actual_bytes);

} // namespace tailcache
