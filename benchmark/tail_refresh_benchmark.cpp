// Benchmark for the read pattern remote file cache is built for: a parquet file keeps growing, and readers poll for
// new rows at the tail after each refresh.
//
// Usage: tail_refresh_benchmark [<url>]
// Without url, a local parquet file is generated and rewritten with more rows between refreshes; with url (i.e. an
// http or s3 url served by httpfs), the given file is read as-is.

#include <chrono>
#include <csignal>
#include <iostream>

#include "duckdb/main/connection.hpp"
#include "duckdb/main/database.hpp"
#include "tailcache.hpp"
#include "test_utils.hpp"

namespace tailcache {

namespace {

constexpr idx_t BENCHMARK_ROW_GROUP_SIZE = 100000;
constexpr idx_t BENCHMARK_INITIAL_ROWS = 1000000;
constexpr idx_t BENCHMARK_APPEND_ROWS = 200000;
constexpr idx_t BENCHMARK_APPEND_ROUNDS = 5;
constexpr idx_t BENCHMARK_TAIL_ROWS = 1000;

template <typename Func>
double MeasureSeconds(Func &&func) {
	const auto now = std::chrono::steady_clock::now();
	func();
	const auto end = std::chrono::steady_clock::now();
	return std::chrono::duration_cast<std::chrono::duration<double>>(end - now).count();
}

void PrintStats(const RemoteFileCacheStats &stats) {
	std::cout << "file size = " << stats.file_size << ", blocks = " << stats.cached_block_count << "/"
	          << stats.block_count << " cached, cache bytes = " << stats.cache_bytes
	          << ", cache utilization = " << stats.cache_utilization
	          << ", restructures = " << stats.restructure_count << std::endl;
}

void ReadTailRows(RemoteFileCache &cache) {
	const idx_t num_rows = cache.GetFooter()->num_rows;
	const idx_t row_start = num_rows > BENCHMARK_TAIL_ROWS ? num_rows - BENCHMARK_TAIL_ROWS : 0;
	idx_t rows_read = 0;
	const double duration_sec = MeasureSeconds([&]() { rows_read = cache.ReadRows(row_start, num_rows)->RowCount(); });
	std::cout << "Read " << rows_read << " tail rows takes " << duration_sec << " seconds" << std::endl;
}

void BenchmarkGrowingLocalFile() {
	duckdb::DuckDB db(nullptr);
	duckdb::Connection con(db);
	const string filepath = GetTestFilePath(".parquet");
	WriteTestParquetFile(con, filepath, 0, BENCHMARK_INITIAL_ROWS, BENCHMARK_ROW_GROUP_SIZE);

	auto cache = CreateParquetRemoteFileCache(*db.instance, filepath);
	const double init_sec = MeasureSeconds([&]() { cache->Initialize(); });
	std::cout << "Initialize takes " << init_sec << " seconds" << std::endl;
	PrintStats(cache->GetStats());
	ReadTailRows(*cache);

	idx_t num_rows = BENCHMARK_INITIAL_ROWS;
	for (idx_t round = 0; round < BENCHMARK_APPEND_ROUNDS; ++round) {
		num_rows += BENCHMARK_APPEND_ROWS;
		WriteTestParquetFile(con, filepath, 0, num_rows, BENCHMARK_ROW_GROUP_SIZE);

		bool changed = false;
		const double refresh_sec = MeasureSeconds([&]() { changed = cache->Refresh(); });
		std::cout << "--------------------- Round " << round << " ---------------------" << std::endl;
		std::cout << "Refresh takes " << refresh_sec << " seconds, changed = " << changed << std::endl;
		PrintStats(cache->GetStats());
		ReadTailRows(*cache);
	}

	db.instance->GetFileSystem().RemoveFile(filepath);
}

void BenchmarkRemoteFile(const string &url) {
	duckdb::DuckDB db(nullptr);
	duckdb::Connection con(db);
	auto result = con.Query("LOAD httpfs");
	if (result->HasError()) {
		std::cerr << "Failed to load httpfs: " << result->GetError() << std::endl;
		return;
	}

	auto cache = CreateParquetRemoteFileCache(*db.instance, url);
	const double init_sec = MeasureSeconds([&]() { cache->Initialize(); });
	std::cout << "Initialize takes " << init_sec << " seconds" << std::endl;
	PrintStats(cache->GetStats());

	// Uncached read first, then cached read.
	ReadTailRows(*cache);
	ReadTailRows(*cache);

	const double refresh_sec = MeasureSeconds([&]() { cache->Refresh(); });
	std::cout << "Unchanged refresh takes " << refresh_sec << " seconds" << std::endl;
}

} // namespace

} // namespace tailcache

int main(int argc, char **argv) {
	std::signal(SIGPIPE, SIG_IGN);
	if (argc > 1) {
		tailcache::BenchmarkRemoteFile(argv[1]);
		return 0;
	}
	tailcache::BenchmarkGrowingLocalFile();
	return 0;
}
