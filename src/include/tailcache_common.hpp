// Common DuckDB vocabulary types used across tailcache.

#pragma once

#include "duckdb/common/assert.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/optional_idx.hpp"
#include "duckdb/common/optional_ptr.hpp"
#include "duckdb/common/shared_ptr.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/typedefs.hpp"
#include "duckdb/common/types/timestamp.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/vector.hpp"

namespace duckdb {
class DatabaseInstance;
} // namespace duckdb

namespace tailcache {

using duckdb::DatabaseInstance;
using duckdb::idx_t;
using duckdb::make_shared_ptr;
using duckdb::make_uniq;
using duckdb::MaxValue;
using duckdb::MinValue;
using duckdb::optional_idx;
using duckdb::optional_ptr;
using duckdb::shared_ptr;
using duckdb::string;
using duckdb::StringUtil;
using duckdb::timestamp_t;
using duckdb::unique_ptr;
using duckdb::vector;

using duckdb::InternalException;
using duckdb::InvalidInputException;
using duckdb::IOException;
using duckdb::NotImplementedException;

// Immutable byte buffer shared between cache tiers and readers.
using Blob = shared_ptr<const string>;

} // namespace tailcache
