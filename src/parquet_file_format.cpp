#include "parquet_file_format.hpp"

#include <atomic>
#include <cstring>

#include "duckdb/common/opener_file_system.hpp"
#include "duckdb/main/connection.hpp"
#include "duckdb/main/database.hpp"
#include "duckdb/parser/keyword_helper.hpp"
#include "duckdb/storage/external_file_cache.hpp"
#include "tailcache_logger.hpp"

namespace tailcache {

namespace {

using duckdb::MaterializedQueryResult;
using duckdb::Value;

// Used to generate a unique filesystem name for each file format.
std::atomic<idx_t> filesystem_id {0};

SliceProviderFileSystem &RegisterSliceProviderFileSystem(DatabaseInstance &instance) {
	auto slice_filesystem = make_uniq<SliceProviderFileSystem>(
	    StringUtil::Format("tailcache-slice-%llu", filesystem_id.fetch_add(1, std::memory_order_relaxed)));
	auto &slice_filesystem_ref = *slice_filesystem;

	// duckdb instance has a opener filesystem, which is a wrapper around virtual filesystem.
	auto &opener_filesystem = instance.GetFileSystem().Cast<duckdb::OpenerFileSystem>();
	auto &vfs = opener_filesystem.GetFileSystem();
	vfs.RegisterSubSystem(std::move(slice_filesystem));
	return slice_filesystem_ref;
}

// Registers a provider for the lifetime of one query.
class ScopedProviderPath {
public:
	ScopedProviderPath(SliceProviderFileSystem &filesystem_p, SliceProvider &provider)
	    : filesystem(filesystem_p), path(filesystem.RegisterProvider(provider)) {
	}
	~ScopedProviderPath() {
		filesystem.UnregisterProvider(path);
	}
	ScopedProviderPath(const ScopedProviderPath &) = delete;
	ScopedProviderPath &operator=(const ScopedProviderPath &) = delete;

	const string &GetPath() const {
		return path;
	}
	string GetQuotedPath() const {
		return duckdb::KeywordHelper::WriteQuoted(path, '\'');
	}

private:
	SliceProviderFileSystem &filesystem;
	const string path;
};

unique_ptr<MaterializedQueryResult> RunQuery(duckdb::Connection &con, const string &query) {
	auto result = con.Query(query);
	if (result->HasError()) {
		result->ThrowError();
	}
	return result;
}

optional_idx GetOptionalOffset(const Value &value) {
	if (value.IsNull()) {
		return optional_idx {};
	}
	// Writers use zero or negative offset for absent dictionary page.
	const auto offset = value.GetValue<int64_t>();
	if (offset <= 0) {
		return optional_idx {};
	}
	return static_cast<idx_t>(offset);
}

idx_t GetNonNegative(const Value &value, const char *field) {
	if (value.IsNull()) {
		throw IOException("Parquet metadata field %s is missing", field);
	}
	const auto number = value.GetValue<int64_t>();
	if (number < 0) {
		throw IOException("Parquet metadata field %s has negative value %lld", field, static_cast<long long>(number));
	}
	return static_cast<idx_t>(number);
}

std::optional<string> GetOptionalString(const Value &value) {
	if (value.IsNull()) {
		return std::nullopt;
	}
	return value.ToString();
}

} // namespace

idx_t ReadParquetFooterLength(SliceProvider &provider) {
	const idx_t file_size = provider.GetFileSize();
	// Leading magic, footer length and trailing magic.
	if (file_size < PARQUET_TRAILER_SIZE + 4) {
		throw IOException("File with %llu bytes is too small to be a parquet file", file_size);
	}
	const auto trailer = provider.ReadSlice(file_size - PARQUET_TRAILER_SIZE, file_size);
	if (std::memcmp(trailer.data() + 4, PARQUET_MAGIC, 4) != 0) {
		throw IOException("File doesn't end with parquet magic bytes");
	}
	const auto *length_bytes = reinterpret_cast<const uint8_t *>(trailer.data());
	const idx_t footer_length = static_cast<idx_t>(length_bytes[0]) | (static_cast<idx_t>(length_bytes[1]) << 8) |
	                            (static_cast<idx_t>(length_bytes[2]) << 16) |
	                            (static_cast<idx_t>(length_bytes[3]) << 24);
	if (footer_length + PARQUET_TRAILER_SIZE > file_size) {
		throw IOException("Parquet footer length %llu exceeds file size %llu", footer_length, file_size);
	}
	return footer_length;
}

ParquetFileFormat::ParquetFileFormat(DatabaseInstance &instance_p)
    : instance(instance_p), slice_filesystem(RegisterSliceProviderFileSystem(instance_p)) {
	// Bytes are already cached by the caller, external file cache only leads to double buffering.
	instance.config.options.enable_external_file_cache = false;
	instance.GetExternalFileCache().SetEnabled(false);
	WriteDebugLog(instance,
	              StringUtil::Format("Register filesystem %s for parquet file format.", slice_filesystem.GetName()));
}

ParquetFileFormat::~ParquetFileFormat() {
	auto &opener_filesystem = instance.GetFileSystem().Cast<duckdb::OpenerFileSystem>();
	auto &vfs = opener_filesystem.GetFileSystem();
	vfs.UnregisterSubSystem(slice_filesystem.GetName());
}

FileFooter ParquetFileFormat::ParseFooter(SliceProvider &provider, idx_t suffix_start) {
	FileFooter footer;
	footer.metadata_length = ReadParquetFooterLength(provider);
	const idx_t footer_start = provider.GetFileSize() - PARQUET_TRAILER_SIZE - footer.metadata_length;
	if (footer_start < suffix_start) {
		WriteDebugLog(instance, StringUtil::Format("Parquet footer starts at %llu, before fetched suffix at %llu",
		                                           footer_start, suffix_start));
	}

	const ScopedProviderPath scoped_path {slice_filesystem, provider};
	duckdb::Connection con {instance};

	auto file_metadata = RunQuery(con, StringUtil::Format("SELECT num_rows, created_by FROM parquet_file_metadata(%s)",
	                                                      scoped_path.GetQuotedPath()));
	if (file_metadata->RowCount() != 1) {
		throw IOException("Expect one row of parquet file metadata, but got %llu", file_metadata->RowCount());
	}
	footer.num_rows = GetNonNegative(file_metadata->GetValue(/*column=*/0, /*index=*/0), "num_rows");
	const auto created_by = file_metadata->GetValue(/*column=*/1, /*index=*/0);
	if (!created_by.IsNull()) {
		footer.created_by = created_by.ToString();
	}

	auto column_metadata = RunQuery(
	    con, StringUtil::Format("SELECT row_group_id, row_group_num_rows, path_in_schema, dictionary_page_offset, "
	                            "data_page_offset, total_compressed_size, stats_min_value, stats_max_value "
	                            "FROM parquet_metadata(%s) ORDER BY row_group_id, column_id",
	                            scoped_path.GetQuotedPath()));
	for (idx_t row_idx = 0; row_idx < column_metadata->RowCount(); ++row_idx) {
		const idx_t row_group_id = GetNonNegative(column_metadata->GetValue(0, row_idx), "row_group_id");
		if (row_group_id == footer.row_groups.size()) {
			footer.row_groups.emplace_back();
			footer.row_groups.back().num_rows =
			    GetNonNegative(column_metadata->GetValue(1, row_idx), "row_group_num_rows");
		} else if (row_group_id + 1 != footer.row_groups.size()) {
			throw IOException("Parquet row group id %llu is out of order", row_group_id);
		}

		ColumnChunkMetadata column;
		column.path_in_schema = column_metadata->GetValue(2, row_idx).ToString();
		column.dictionary_page_offset = GetOptionalOffset(column_metadata->GetValue(3, row_idx));
		column.data_page_offset = GetNonNegative(column_metadata->GetValue(4, row_idx), "data_page_offset");
		column.total_compressed_size =
		    GetNonNegative(column_metadata->GetValue(5, row_idx), "total_compressed_size");
		column.stats_min = GetOptionalString(column_metadata->GetValue(6, row_idx));
		column.stats_max = GetOptionalString(column_metadata->GetValue(7, row_idx));
		footer.row_groups.back().columns.emplace_back(std::move(column));
	}

	WriteDebugLog(instance, StringUtil::Format("Parsed parquet footer with %llu bytes, %llu rows and %llu row groups",
	                                           footer.metadata_length, footer.num_rows, footer.row_groups.size()));
	return footer;
}

unique_ptr<MaterializedQueryResult> ParquetFileFormat::DecodeRows(SliceProvider &provider, const FileFooter &footer,
                                                                  idx_t row_start, idx_t row_end) {
	if (row_end < row_start) {
		throw InvalidInputException("Invalid row range [%llu, %llu)", row_start, row_end);
	}
	const idx_t capped_row_end = MinValue<idx_t>(row_end, footer.num_rows);

	const ScopedProviderPath scoped_path {slice_filesystem, provider};
	duckdb::Connection con {instance};
	return RunQuery(con, StringUtil::Format("SELECT * EXCLUDE (file_row_number) FROM read_parquet(%s, "
	                                        "file_row_number = true) WHERE file_row_number >= %llu AND "
	                                        "file_row_number < %llu ORDER BY file_row_number",
	                                        scoped_path.GetQuotedPath(), row_start, capped_row_end));
}

} // namespace tailcache
