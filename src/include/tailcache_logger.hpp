#pragma once

#include "duckdb/common/string_util.hpp"
#include "tailcache_common.hpp"

namespace tailcache {

// Write a debug/warning message to the duckdb logger of the given [instance].
void WriteDebugLog(DatabaseInstance &instance, const string &message);
void WriteWarnLog(DatabaseInstance &instance, const string &message);

// Logging macros which take an optional pointer for duckdb instance; nothing is logged (and no message formatted) when
// no instance is attached.
#define TAILCACHE_LOG_DEBUG(INSTANCE_PTR, ...)                                                                         \
	do {                                                                                                               \
		if (INSTANCE_PTR) {                                                                                            \
			::tailcache::WriteDebugLog(*(INSTANCE_PTR), duckdb::StringUtil::Format(__VA_ARGS__));                      \
		}                                                                                                              \
	} while (0)

#define TAILCACHE_LOG_WARN(INSTANCE_PTR, ...)                                                                          \
	do {                                                                                                               \
		if (INSTANCE_PTR) {                                                                                            \
			::tailcache::WriteWarnLog(*(INSTANCE_PTR), duckdb::StringUtil::Format(__VA_ARGS__));                       \
		}                                                                                                              \
	} while (0)

} // namespace tailcache
