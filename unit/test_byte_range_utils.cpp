#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include "byte_range_utils.hpp"

using namespace tailcache; // NOLINT

TEST_CASE("Test closed range header", "[byte range utils test]") {
	REQUIRE(FormatRangeHeader(0, 10) == "bytes=0-9");
	REQUIRE(FormatRangeHeader(368928, 500000) == "bytes=368928-499999");
	REQUIRE(FormatRangeHeader(7, 8) == "bytes=7-7");
}

TEST_CASE("Test open-ended range header", "[byte range utils test]") {
	REQUIRE(FormatRangeHeader(0) == "bytes=0-");
	REQUIRE(FormatRangeHeader(440000) == "bytes=440000-");
}

TEST_CASE("Test empty range header is rejected", "[byte range utils test]") {
	REQUIRE_THROWS_AS(FormatRangeHeader(10, 10), InvalidInputException);
	REQUIRE_THROWS_AS(FormatRangeHeader(10, 5), InvalidInputException);
}

TEST_CASE("Test tail fetch start", "[byte range utils test]") {
	REQUIRE(GetTailFetchStart(/*file_size=*/500000, /*fetch_size=*/131072) == 368928);
	// Whole file is fetched if it's smaller than fetch size.
	REQUIRE(GetTailFetchStart(/*file_size=*/1000, /*fetch_size=*/131072) == 0);
	REQUIRE(GetTailFetchStart(/*file_size=*/131072, /*fetch_size=*/131072) == 0);
}

TEST_CASE("Test range containment", "[byte range utils test]") {
	REQUIRE(IsRangeWithin(10, 20, 10, 20));
	REQUIRE(IsRangeWithin(12, 18, 10, 20));
	REQUIRE(!IsRangeWithin(9, 18, 10, 20));
	REQUIRE(!IsRangeWithin(12, 21, 10, 20));
}

TEST_CASE("Test range response validation", "[byte range utils test]") {
	ValidateRangeResponse("http://host/file", 0, 10, 10);
	REQUIRE_THROWS_AS(ValidateRangeResponse("http://host/file", 0, 10, 9), IOException);
	REQUIRE_THROWS_AS(ValidateRangeResponse("http://host/file", 0, 10, 11), IOException);
}

int main(int argc, char **argv) {
	return Catch::Session().run(argc, argv);
}
