#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include "remote_block.hpp"

using namespace tailcache; // NOLINT

namespace {

ColumnChunkMetadata MakeColumn(optional_idx dictionary_page_offset, idx_t data_page_offset, idx_t compressed_size,
                               std::optional<string> stats_min = std::nullopt,
                               std::optional<string> stats_max = std::nullopt) {
	ColumnChunkMetadata column;
	column.path_in_schema = "col";
	column.dictionary_page_offset = dictionary_page_offset;
	column.data_page_offset = data_page_offset;
	column.total_compressed_size = compressed_size;
	column.stats_min = std::move(stats_min);
	column.stats_max = std::move(stats_max);
	return column;
}

RemoteBlock MakeBlock(idx_t index, idx_t num_rows, std::optional<string> min_ts, std::optional<string> max_ts) {
	RemoteBlock block;
	block.index = index;
	block.start_byte = index * 100;
	block.end_byte = (index + 1) * 100;
	block.num_rows = num_rows;
	if (min_ts.has_value()) {
		block.min_timestamp = duckdb::Timestamp::FromString(*min_ts);
	}
	if (max_ts.has_value()) {
		block.max_timestamp = duckdb::Timestamp::FromString(*max_ts);
	}
	return block;
}

} // namespace

TEST_CASE("Test block byte range from column chunks", "[remote block test]") {
	FileFooter footer;
	footer.num_rows = 30;

	RowGroupMetadata first_row_group;
	first_row_group.num_rows = 10;
	// Dictionary page comes before data page.
	first_row_group.columns.emplace_back(MakeColumn(/*dictionary_page_offset=*/4, /*data_page_offset=*/20, 50));
	first_row_group.columns.emplace_back(MakeColumn(optional_idx {}, /*data_page_offset=*/54, 46));
	footer.row_groups.emplace_back(std::move(first_row_group));

	RowGroupMetadata second_row_group;
	second_row_group.num_rows = 20;
	second_row_group.columns.emplace_back(MakeColumn(optional_idx {}, /*data_page_offset=*/100, 30));
	second_row_group.columns.emplace_back(MakeColumn(optional_idx {}, /*data_page_offset=*/130, 70));
	footer.row_groups.emplace_back(std::move(second_row_group));

	const auto blocks = ComputeRemoteBlocks(footer);
	REQUIRE(blocks.size() == 2);
	REQUIRE(blocks[0].index == 0);
	REQUIRE(blocks[0].start_byte == 4);
	REQUIRE(blocks[0].end_byte == 100);
	REQUIRE(blocks[0].num_rows == 10);
	REQUIRE(blocks[1].index == 1);
	REQUIRE(blocks[1].start_byte == 100);
	REQUIRE(blocks[1].end_byte == 200);
	REQUIRE(blocks[1].GetByteSize() == 100);
	REQUIRE(blocks[0].num_rows + blocks[1].num_rows == footer.num_rows);
}

TEST_CASE("Test block timestamps from leading column statistics", "[remote block test]") {
	FileFooter footer;
	RowGroupMetadata row_group;
	row_group.num_rows = 1;
	row_group.columns.emplace_back(
	    MakeColumn(optional_idx {}, 4, 10, "2024-01-01 00:00:00", "2024-01-01 01:00:00"));
	footer.row_groups.emplace_back(row_group);

	RowGroupMetadata non_timestamp_row_group;
	non_timestamp_row_group.num_rows = 1;
	non_timestamp_row_group.columns.emplace_back(MakeColumn(optional_idx {}, 14, 10, "apple", "banana"));
	footer.row_groups.emplace_back(non_timestamp_row_group);

	const auto blocks = ComputeRemoteBlocks(footer);
	REQUIRE(blocks.size() == 2);
	REQUIRE(blocks[0].min_timestamp == duckdb::Timestamp::FromString("2024-01-01 00:00:00"));
	REQUIRE(blocks[0].max_timestamp == duckdb::Timestamp::FromString("2024-01-01 01:00:00"));
	REQUIRE(!blocks[1].min_timestamp.has_value());
	REQUIRE(!blocks[1].max_timestamp.has_value());
}

TEST_CASE("Test row group without column is rejected", "[remote block test]") {
	FileFooter footer;
	footer.row_groups.emplace_back(RowGroupMetadata {});
	REQUIRE_THROWS_AS(ComputeRemoteBlocks(footer), IOException);
}

TEST_CASE("Test block indices for rows", "[remote block test]") {
	const vector<RemoteBlock> blocks {
	    MakeBlock(0, 100, std::nullopt, std::nullopt),
	    MakeBlock(1, 50, std::nullopt, std::nullopt),
	    MakeBlock(2, 100, std::nullopt, std::nullopt),
	};

	REQUIRE(GetBlockIndicesForRows(blocks, 0, 100) == vector<idx_t> {0});
	REQUIRE(GetBlockIndicesForRows(blocks, 99, 101) == vector<idx_t> {0, 1});
	REQUIRE(GetBlockIndicesForRows(blocks, 100, 150) == vector<idx_t> {1});
	REQUIRE(GetBlockIndicesForRows(blocks, 120, 250) == vector<idx_t> {1, 2});
	REQUIRE(GetBlockIndicesForRows(blocks, 0, 1000) == vector<idx_t> {0, 1, 2});
	REQUIRE(GetBlockIndicesForRows(blocks, 250, 300).empty());
	REQUIRE(GetBlockIndicesForRows(blocks, 10, 10).empty());
}

TEST_CASE("Test blocks for time range", "[remote block test]") {
	const vector<RemoteBlock> blocks {
	    MakeBlock(0, 1, "2024-01-01 00:00:00", "2024-01-01 00:59:59"),
	    MakeBlock(1, 1, "2024-01-01 01:00:00", "2024-01-01 01:59:59"),
	    // Missing statistics are unbounded.
	    MakeBlock(2, 1, std::nullopt, "2024-01-01 02:59:59"),
	    MakeBlock(3, 1, "2024-01-01 03:00:00", std::nullopt),
	};

	auto get_indices = [&blocks](const string &from, const string &to) {
		vector<idx_t> indices;
		for (const auto &cur_block : GetBlocksForTimeRange(blocks, duckdb::Timestamp::FromString(from),
		                                                   duckdb::Timestamp::FromString(to))) {
			indices.emplace_back(cur_block.index);
		}
		return indices;
	};

	REQUIRE(get_indices("2024-01-01 00:10:00", "2024-01-01 00:20:00") == vector<idx_t> {0, 2});
	REQUIRE(get_indices("2024-01-01 00:30:00", "2024-01-01 01:30:00") == vector<idx_t> {0, 1, 2});
	// Bounds are inclusive.
	REQUIRE(get_indices("2024-01-01 01:59:59", "2024-01-01 01:59:59") == vector<idx_t> {1, 2});
	REQUIRE(get_indices("2024-01-01 05:00:00", "2024-01-01 06:00:00") == vector<idx_t> {3});
}

TEST_CASE("Test block layout comparison", "[remote block test]") {
	auto block = MakeBlock(1, 10, "2024-01-01 00:00:00", "2024-01-01 00:59:59");
	auto same_layout = MakeBlock(1, 10, std::nullopt, std::nullopt);
	REQUIRE(HasSameLayout(block, same_layout));

	auto grown = block;
	grown.end_byte += 1;
	REQUIRE(!HasSameLayout(block, grown));

	auto more_rows = block;
	more_rows.num_rows += 1;
	REQUIRE(!HasSameLayout(block, more_rows));
}

int main(int argc, char **argv) {
	return Catch::Session().run(argc, argv);
}
