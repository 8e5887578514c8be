// Unit test for tailcache config and its duckdb settings.

#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include "duckdb/main/connection.hpp"
#include "duckdb/main/database.hpp"
#include "tailcache_config.hpp"

using namespace tailcache; // NOLINT

namespace {

void RequireDefaultConfig(const RemoteFileCacheConfig &config) {
	REQUIRE(config.initial_fetch_size == DEFAULT_INITIAL_FETCH_SIZE);
	REQUIRE(config.max_cache_bytes == DEFAULT_MAX_CACHE_BYTES);
	REQUIRE(config.restructure_block_count_delta == DEFAULT_RESTRUCTURE_BLOCK_COUNT_DELTA);
	REQUIRE(config.restructure_min_size_ratio == DEFAULT_RESTRUCTURE_MIN_SIZE_RATIO);
	REQUIRE(config.verify_immutable_blocks == DEFAULT_VERIFY_IMMUTABLE_BLOCKS);
}

} // namespace

TEST_CASE("Test default config", "[tailcache config test]") {
	REQUIRE(DEFAULT_INITIAL_FETCH_SIZE == 128 * 1024);
	REQUIRE(DEFAULT_MAX_CACHE_BYTES == 10 * 1024 * 1024);
	REQUIRE(DEFAULT_RESTRUCTURE_BLOCK_COUNT_DELTA == 5);
	REQUIRE(DEFAULT_RESTRUCTURE_MIN_SIZE_RATIO == Approx(0.8));
	RequireDefaultConfig(RemoteFileCacheConfig {});
	ValidateConfig(RemoteFileCacheConfig {});
}

TEST_CASE("Test config validation", "[tailcache config test]") {
	RemoteFileCacheConfig config;
	config.initial_fetch_size = 0;
	REQUIRE_THROWS_AS(ValidateConfig(config), InvalidInputException);

	config = RemoteFileCacheConfig {};
	config.max_cache_bytes = 0;
	REQUIRE_THROWS_AS(ValidateConfig(config), InvalidInputException);

	config = RemoteFileCacheConfig {};
	config.restructure_min_size_ratio = 0.0;
	REQUIRE_THROWS_AS(ValidateConfig(config), InvalidInputException);
	config.restructure_min_size_ratio = 1.5;
	REQUIRE_THROWS_AS(ValidateConfig(config), InvalidInputException);
	config.restructure_min_size_ratio = 1.0;
	ValidateConfig(config);
}

TEST_CASE("Test config without registered settings", "[tailcache config test]") {
	duckdb::DuckDB db(nullptr);
	RequireDefaultConfig(GetRemoteFileCacheConfig(*db.instance));
}

TEST_CASE("Test config from duckdb settings", "[tailcache config test]") {
	duckdb::DuckDB db(nullptr);
	RegisterRemoteFileCacheSettings(*db.instance);
	RequireDefaultConfig(GetRemoteFileCacheConfig(*db.instance));

	duckdb::Connection con(db);
	REQUIRE(!con.Query("SET GLOBAL tailcache_initial_fetch_size = 65536")->HasError());
	REQUIRE(!con.Query("SET GLOBAL tailcache_max_cache_bytes = 1048576")->HasError());
	REQUIRE(!con.Query("SET GLOBAL tailcache_restructure_block_count_delta = 2")->HasError());
	REQUIRE(!con.Query("SET GLOBAL tailcache_restructure_min_size_ratio = 0.5")->HasError());
	REQUIRE(!con.Query("SET GLOBAL tailcache_verify_immutable_blocks = false")->HasError());

	const auto config = GetRemoteFileCacheConfig(*db.instance);
	REQUIRE(config.initial_fetch_size == 65536);
	REQUIRE(config.max_cache_bytes == 1048576);
	REQUIRE(config.restructure_block_count_delta == 2);
	REQUIRE(config.restructure_min_size_ratio == Approx(0.5));
	REQUIRE(!config.verify_immutable_blocks);
}

TEST_CASE("Test invalid duckdb settings", "[tailcache config test]") {
	duckdb::DuckDB db(nullptr);
	RegisterRemoteFileCacheSettings(*db.instance);
	duckdb::Connection con(db);

	REQUIRE(con.Query("SET GLOBAL tailcache_initial_fetch_size = 0")->HasError());
	REQUIRE(con.Query("SET GLOBAL tailcache_max_cache_bytes = 0")->HasError());
	REQUIRE(con.Query("SET GLOBAL tailcache_restructure_min_size_ratio = 1.5")->HasError());
	REQUIRE(con.Query("SET GLOBAL tailcache_initial_fetch_size = 'hello'")->HasError());
	RequireDefaultConfig(GetRemoteFileCacheConfig(*db.instance));
}

int main(int argc, char **argv) {
	int result = Catch::Session().run(argc, argv);
	return result;
}
