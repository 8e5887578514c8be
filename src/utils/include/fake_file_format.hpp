// This file defines a fake columnar file format, which is used for testing.
//
// The layout mimics parquet, so byte layouts of test files could be chosen exactly:
// - 4-byte head magic "TCF1";
// - block bytes, where byte at offset i is (i * 131 + 7) % 251, so a file grown by appending keeps its prefix;
// - a text footer right before the trailer, with line "rows|<num_rows>", followed by one line per block
//   "block|<start>|<end>|<num_rows>|<min>|<max>", where empty min/max means absent statistics;
// - 4-byte little-endian footer length, and tail magic "TCF1".

#pragma once

#include <mutex>
#include <optional>
#include <utility>

#include "base_file_format.hpp"
#include "tailcache_common.hpp"

namespace tailcache {

inline constexpr const char *FAKE_FILE_MAGIC = "TCF1";
inline constexpr idx_t FAKE_FILE_TRAILER_SIZE = 8;

struct FakeBlockSpec {
	idx_t start_byte = 0;
	idx_t end_byte = 0;
	idx_t num_rows = 0;
	std::optional<string> min_stats;
	std::optional<string> max_stats;
};

// Build a fake file of exactly [file_size] bytes containing the given blocks; throw [InvalidInputException] if the
// blocks and footer don't fit.
string BuildFakeFile(const vector<FakeBlockSpec> &blocks, idx_t file_size);

// Get the byte at [offset] of any fake file, outside of footer and trailer.
char GetFakeFileByte(idx_t offset);

class FakeFileFormat : public BaseFileFormat {
public:
	FakeFileFormat() = default;
	~FakeFileFormat() override = default;

	FileFooter ParseFooter(SliceProvider &provider, idx_t suffix_start) override;
	// Read bytes of every block overlapping the row range through [provider], and record them; always return nullptr.
	unique_ptr<duckdb::MaterializedQueryResult> DecodeRows(SliceProvider &provider, const FileFooter &footer,
	                                                       idx_t row_start, idx_t row_end) override;
	std::string GetName() const override {
		return "fake_file_format";
	}

	idx_t GetParseCount() const;
	// Suffix start hint passed to the last footer parse.
	idx_t GetLastSuffixStart() const;
	// Byte ranges read by the last decode.
	vector<std::pair<idx_t, idx_t>> GetLastDecodeReads() const;
	// Bytes read by the last decode, concatenated.
	string GetLastDecodedBytes() const;

private:
	mutable std::mutex mu;
	idx_t parse_count = 0;
	idx_t last_suffix_start = 0;
	vector<std::pair<idx_t, idx_t>> last_decode_reads;
	string last_decoded_bytes;
};

} // namespace tailcache
