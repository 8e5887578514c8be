#include "fake_file_format.hpp"

#include <cstring>

#include "remote_block.hpp"

namespace tailcache {

namespace {

idx_t ParseNumber(const string &field) {
	if (field.empty()) {
		throw IOException("Fake file footer has an empty numeric field");
	}
	idx_t number = 0;
	for (const char cur_char : field) {
		if (cur_char < '0' || cur_char > '9') {
			throw IOException("Fake file footer field %s is not a number", field);
		}
		number = number * 10 + static_cast<idx_t>(cur_char - '0');
	}
	return number;
}

std::optional<string> ParseOptional(const string &field) {
	if (field.empty()) {
		return std::nullopt;
	}
	return field;
}

string EncodeLength(idx_t length) {
	string encoded(4, '\0');
	for (idx_t idx = 0; idx < 4; ++idx) {
		encoded[idx] = static_cast<char>((length >> (8 * idx)) & 0xFF);
	}
	return encoded;
}

idx_t DecodeLength(const char *data) {
	const auto *bytes = reinterpret_cast<const uint8_t *>(data);
	idx_t length = 0;
	for (idx_t idx = 0; idx < 4; ++idx) {
		length |= static_cast<idx_t>(bytes[idx]) << (8 * idx);
	}
	return length;
}

} // namespace

char GetFakeFileByte(idx_t offset) {
	return static_cast<char>((offset * 131 + 7) % 251);
}

string BuildFakeFile(const vector<FakeBlockSpec> &blocks, idx_t file_size) {
	idx_t num_rows = 0;
	for (const auto &cur_block : blocks) {
		num_rows += cur_block.num_rows;
	}
	string footer = StringUtil::Format("rows|%llu\n", num_rows);
	for (const auto &cur_block : blocks) {
		footer += StringUtil::Format("block|%llu|%llu|%llu|%s|%s\n", cur_block.start_byte, cur_block.end_byte,
		                             cur_block.num_rows, cur_block.min_stats.value_or(""),
		                             cur_block.max_stats.value_or(""));
	}

	const idx_t magic_size = std::strlen(FAKE_FILE_MAGIC);
	if (file_size < magic_size + footer.length() + FAKE_FILE_TRAILER_SIZE) {
		throw InvalidInputException("Fake file of %llu bytes cannot hold a footer of %llu bytes", file_size,
		                            footer.length());
	}
	const idx_t footer_start = file_size - FAKE_FILE_TRAILER_SIZE - footer.length();
	idx_t prev_end = magic_size;
	for (const auto &cur_block : blocks) {
		if (cur_block.start_byte < prev_end || cur_block.end_byte < cur_block.start_byte ||
		    cur_block.end_byte > footer_start) {
			throw InvalidInputException("Fake block [%llu, %llu) overlaps its neighbors or the footer at %llu",
			                            cur_block.start_byte, cur_block.end_byte, footer_start);
		}
		prev_end = cur_block.end_byte;
	}

	string content(file_size, '\0');
	for (idx_t offset = 0; offset < footer_start; ++offset) {
		content[offset] = GetFakeFileByte(offset);
	}
	content.replace(0, magic_size, FAKE_FILE_MAGIC);
	content.replace(footer_start, footer.length(), footer);
	content.replace(file_size - FAKE_FILE_TRAILER_SIZE, 4, EncodeLength(footer.length()));
	content.replace(file_size - magic_size, magic_size, FAKE_FILE_MAGIC);
	return content;
}

FileFooter FakeFileFormat::ParseFooter(SliceProvider &provider, idx_t suffix_start) {
	{
		const std::lock_guard<std::mutex> lck(mu);
		++parse_count;
		last_suffix_start = suffix_start;
	}

	const idx_t file_size = provider.GetFileSize();
	if (file_size < FAKE_FILE_TRAILER_SIZE) {
		throw IOException("Fake file of %llu bytes is too small", file_size);
	}
	const auto trailer = provider.ReadSlice(file_size - FAKE_FILE_TRAILER_SIZE, file_size);
	if (trailer.compare(4, 4, FAKE_FILE_MAGIC) != 0) {
		throw IOException("File doesn't end with fake file magic bytes");
	}
	const idx_t footer_length = DecodeLength(trailer.data());
	if (footer_length + FAKE_FILE_TRAILER_SIZE > file_size) {
		throw IOException("Fake file footer length %llu exceeds file size %llu", footer_length, file_size);
	}
	const idx_t footer_start = file_size - FAKE_FILE_TRAILER_SIZE - footer_length;
	const auto footer_text = provider.ReadSlice(footer_start, footer_start + footer_length);

	FileFooter footer;
	footer.metadata_length = footer_length;
	footer.created_by = "fake file writer";
	for (const auto &line : StringUtil::Split(footer_text, '\n')) {
		auto fields = StringUtil::Split(line, '|');
		// Split drops empty trailing fields.
		if (fields.empty()) {
			continue;
		}
		if (fields[0] == "rows") {
			if (fields.size() != 2) {
				throw IOException("Malformed fake file footer line: %s", line);
			}
			footer.num_rows = ParseNumber(fields[1]);
			continue;
		}
		if (fields[0] != "block" || fields.size() < 4) {
			throw IOException("Malformed fake file footer line: %s", line);
		}
		fields.resize(6);
		const idx_t start_byte = ParseNumber(fields[1]);
		const idx_t end_byte = ParseNumber(fields[2]);
		if (end_byte < start_byte) {
			throw IOException("Malformed fake file footer line: %s", line);
		}

		ColumnChunkMetadata column;
		column.path_in_schema = "ts";
		column.data_page_offset = start_byte;
		column.total_compressed_size = end_byte - start_byte;
		column.stats_min = ParseOptional(fields[4]);
		column.stats_max = ParseOptional(fields[5]);

		RowGroupMetadata row_group;
		row_group.num_rows = ParseNumber(fields[3]);
		row_group.columns.emplace_back(std::move(column));
		footer.row_groups.emplace_back(std::move(row_group));
	}
	return footer;
}

unique_ptr<duckdb::MaterializedQueryResult> FakeFileFormat::DecodeRows(SliceProvider &provider,
                                                                       const FileFooter &footer, idx_t row_start,
                                                                       idx_t row_end) {
	const auto blocks = ComputeRemoteBlocks(footer);
	vector<std::pair<idx_t, idx_t>> decode_reads;
	string decoded_bytes;
	for (const idx_t cur_index : GetBlockIndicesForRows(blocks, row_start, row_end)) {
		const auto &cur_block = blocks[cur_index];
		decode_reads.emplace_back(cur_block.start_byte, cur_block.end_byte);
		decoded_bytes += provider.ReadSlice(cur_block.start_byte, cur_block.end_byte);
	}

	const std::lock_guard<std::mutex> lck(mu);
	last_decode_reads = std::move(decode_reads);
	last_decoded_bytes = std::move(decoded_bytes);
	return nullptr;
}

idx_t FakeFileFormat::GetParseCount() const {
	const std::lock_guard<std::mutex> lck(mu);
	return parse_count;
}

idx_t FakeFileFormat::GetLastSuffixStart() const {
	const std::lock_guard<std::mutex> lck(mu);
	return last_suffix_start;
}

vector<std::pair<idx_t, idx_t>> FakeFileFormat::GetLastDecodeReads() const {
	const std::lock_guard<std::mutex> lck(mu);
	return last_decode_reads;
}

string FakeFileFormat::GetLastDecodedBytes() const {
	const std::lock_guard<std::mutex> lck(mu);
	return last_decoded_bytes;
}

} // namespace tailcache
