#include "byte_range_utils.hpp"

namespace tailcache {

string FormatRangeHeader(idx_t start, optional_idx end) {
	if (!end.IsValid()) {
		return StringUtil::Format("bytes=%llu-", start);
	}
	if (end.GetIndex() <= start) {
		throw InvalidInputException("Cannot format range header for empty range [%llu, %llu)", start, end.GetIndex());
	}
	return StringUtil::Format("bytes=%llu-%llu", start, end.GetIndex() - 1);
}

idx_t GetTailFetchStart(idx_t file_size, idx_t fetch_size) {
	return file_size > fetch_size ? file_size - fetch_size : 0;
}

bool IsRangeWithin(idx_t start, idx_t end, idx_t outer_start, idx_t outer_end) {
	return start >= outer_start && end <= outer_end;
}

void ValidateRangeResponse(const string &url, idx_t start, idx_t end, idx_t actual_bytes) {
	const idx_t expected_bytes = end - start;
	if (actual_bytes != expected_bytes) {
		throw IOException("Range request %s for %s returned %llu bytes, expected %llu bytes",
		                  FormatRangeHeader(start, end), url, actual_bytes, expected_bytes);
	}
}

} // namespace tailcache
