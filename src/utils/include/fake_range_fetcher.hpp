// This file defines a fake range fetcher, which is used for testing.
// It serves an in-memory file, and records every request so tests could check how requests are coalesced.

#pragma once

#include <mutex>
#include <optional>

#include "base_range_fetcher.hpp"
#include "tailcache_common.hpp"

namespace tailcache {

class FakeRangeFetcher : public BaseRangeFetcher {
public:
	struct RangeRequest {
		idx_t start = 0;
		// Invalid for open-ended requests.
		optional_idx end;
	};

	explicit FakeRangeFetcher(string content_p = "");
	~FakeRangeFetcher() override = default;

	RemoteFileInfo Head(const string &url) override;
	string FetchRange(const string &url, idx_t start, idx_t end) override;
	string FetchSuffix(const string &url, idx_t start) override;
	std::string GetName() const override {
		return "fake_range_fetcher";
	}

	// Replace file content, which simulates a remote write.
	void SetContent(string content_p);
	void SetLastModified(std::optional<timestamp_t> last_modified_p);
	// Simulate a remote which doesn't report content length.
	void SetReportContentLength(bool report);
	// Make all subsequent requests fail with [IOException].
	void SetFailRequests(bool fail);

	idx_t GetHeadCount() const;
	vector<RangeRequest> GetRangeRequests() const;
	idx_t GetRangeRequestCount() const;
	void ClearRequests();

private:
	void MaybeFail(const string &operation) const;

	mutable std::mutex mu;
	string content;
	std::optional<timestamp_t> last_modified;
	bool report_content_length = true;
	bool fail_requests = false;
	idx_t head_count = 0;
	vector<RangeRequest> range_requests;
};

bool operator==(const FakeRangeFetcher::RangeRequest &lhs, const FakeRangeFetcher::RangeRequest &rhs);

} // namespace tailcache
