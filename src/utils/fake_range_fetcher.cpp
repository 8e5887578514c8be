#include "fake_range_fetcher.hpp"

#include "byte_range_utils.hpp"

namespace tailcache {

bool operator==(const FakeRangeFetcher::RangeRequest &lhs, const FakeRangeFetcher::RangeRequest &rhs) {
	if (lhs.start != rhs.start || lhs.end.IsValid() != rhs.end.IsValid()) {
		return false;
	}
	return !lhs.end.IsValid() || lhs.end.GetIndex() == rhs.end.GetIndex();
}

FakeRangeFetcher::FakeRangeFetcher(string content_p) : content(std::move(content_p)) {
}

void FakeRangeFetcher::MaybeFail(const string &operation) const {
	if (fail_requests) {
		throw IOException("Fake range fetcher: %s failed", operation);
	}
}

RemoteFileInfo FakeRangeFetcher::Head(const string &url) {
	const std::lock_guard<std::mutex> lck(mu);
	++head_count;
	MaybeFail(StringUtil::Format("HEAD %s", url));
	RemoteFileInfo file_info;
	if (report_content_length) {
		file_info.file_size = content.length();
	}
	file_info.last_modified = last_modified;
	return file_info;
}

string FakeRangeFetcher::FetchRange(const string &url, idx_t start, idx_t end) {
	const std::lock_guard<std::mutex> lck(mu);
	range_requests.emplace_back(RangeRequest {
	    .start = start,
	    .end = end,
	});
	MaybeFail(StringUtil::Format("GET %s with range %s", url, FormatRangeHeader(start, end)));
	if (start >= end || end > content.length()) {
		throw IOException("Fake range fetcher: range %s is not satisfiable for %llu bytes",
		                  FormatRangeHeader(start, end), content.length());
	}
	return content.substr(start, end - start);
}

string FakeRangeFetcher::FetchSuffix(const string &url, idx_t start) {
	const std::lock_guard<std::mutex> lck(mu);
	range_requests.emplace_back(RangeRequest {
	    .start = start,
	    .end = optional_idx {},
	});
	MaybeFail(StringUtil::Format("GET %s with range %s", url, FormatRangeHeader(start)));
	if (start >= content.length()) {
		throw IOException("Fake range fetcher: range %s is not satisfiable for %llu bytes", FormatRangeHeader(start),
		                  content.length());
	}
	return content.substr(start);
}

void FakeRangeFetcher::SetContent(string content_p) {
	const std::lock_guard<std::mutex> lck(mu);
	content = std::move(content_p);
}

void FakeRangeFetcher::SetLastModified(std::optional<timestamp_t> last_modified_p) {
	const std::lock_guard<std::mutex> lck(mu);
	last_modified = last_modified_p;
}

void FakeRangeFetcher::SetReportContentLength(bool report) {
	const std::lock_guard<std::mutex> lck(mu);
	report_content_length = report;
}

void FakeRangeFetcher::SetFailRequests(bool fail) {
	const std::lock_guard<std::mutex> lck(mu);
	fail_requests = fail;
}

idx_t FakeRangeFetcher::GetHeadCount() const {
	const std::lock_guard<std::mutex> lck(mu);
	return head_count;
}

vector<FakeRangeFetcher::RangeRequest> FakeRangeFetcher::GetRangeRequests() const {
	const std::lock_guard<std::mutex> lck(mu);
	return range_requests;
}

idx_t FakeRangeFetcher::GetRangeRequestCount() const {
	const std::lock_guard<std::mutex> lck(mu);
	return range_requests.size();
}

void FakeRangeFetcher::ClearRequests() {
	const std::lock_guard<std::mutex> lck(mu);
	head_count = 0;
	range_requests.clear();
}

} // namespace tailcache
