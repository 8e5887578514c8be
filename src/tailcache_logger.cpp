#include "tailcache_logger.hpp"

#include "duckdb/logging/logger.hpp"
#include "duckdb/main/database.hpp"

namespace tailcache {

void WriteDebugLog(DatabaseInstance &instance, const string &message) {
	using namespace duckdb; // NOLINT
	DUCKDB_LOG_DEBUG(instance, message);
}

void WriteWarnLog(DatabaseInstance &instance, const string &message) {
	using namespace duckdb; // NOLINT
	DUCKDB_LOG_WARN(instance, message);
}

} // namespace tailcache
