#include <catch2/catch_test_macros.hpp>

#include <roadnet/core/types.hpp>

#include <sstream>
#include <string>

using namespace roadnet;

// ===========================================================================
// Vintage
// ===========================================================================

TEST_CASE("Vintage: accepts known tags and trims whitespace", "[types][vintage]") {
    auto v = Vintage::Create("  2021 ");
    REQUIRE(v.IsOk());
    CHECK(v.Value().Value() == "2021");

    CHECK(Vintage::Create("tomtom-2017.v2").IsOk());
}

TEST_CASE("Vintage: rejects empty, long and odd tags", "[types][vintage]") {
    CHECK(Vintage::Create("").IsErr());
    CHECK(Vintage::Create("   ").IsErr());
    CHECK(Vintage::Create("12345678901234567").IsErr());
    CHECK(Vintage::Create("20 21").IsErr());
    CHECK(Vintage::Create("2021/01").IsErr());
}

TEST_CASE("Vintage: FromYear matches text form", "[types][vintage]") {
    auto from_year = Vintage::FromYear(2017);
    REQUIRE(from_year.IsOk());
    CHECK(from_year.Value() == Vintage::Create("2017").Value());
    CHECK(Vintage::FromYear(0).IsErr());
    CHECK(Vintage::FromYear(-2021).IsErr());
}

// ===========================================================================
// CrsCode
// ===========================================================================

TEST_CASE("CrsCode: upper-cases the authority", "[types][crs]") {
    auto crs = CrsCode::Create("epsg:31467");
    REQUIRE(crs.IsOk());
    CHECK(crs.Value().Value() == "EPSG:31467");
}

TEST_CASE("CrsCode: rejects malformed codes", "[types][crs]") {
    CHECK(CrsCode::Create("4326").IsErr());
    CHECK(CrsCode::Create(":4326").IsErr());
    CHECK(CrsCode::Create("EPSG:").IsErr());
    CHECK(CrsCode::Create("EPSG1:4326").IsErr());
    CHECK(CrsCode::Create("EPSG:43 26").IsErr());
}

TEST_CASE("CrsCode: LatLon is EPSG:4326", "[types][crs]") {
    CHECK(CrsCode::LatLon().Value() == "EPSG:4326");
    CHECK(CrsCode::LatLon() == CrsCode::Create("EPSG:4326").Value());
}

// ===========================================================================
// RoadId
// ===========================================================================

TEST_CASE("RoadId: integer and text ids", "[types][road_id]") {
    RoadId numeric(std::int64_t{12345});
    RoadId text(std::string("00005a2b-f3"));

    CHECK(numeric.IsInteger());
    CHECK(numeric.AsInteger() == 12345);
    CHECK(numeric.ToString() == "12345");

    CHECK_FALSE(text.IsInteger());
    CHECK(text.AsString() == "00005a2b-f3");

    std::ostringstream oss;
    oss << numeric << " " << text;
    CHECK(oss.str() == "12345 00005a2b-f3");
}

TEST_CASE("RoadId: integers order before text", "[types][road_id]") {
    RoadId small(std::int64_t{-5});
    RoadId big(std::int64_t{9000000000});
    RoadId text(std::string("1"));

    CHECK(small < big);
    CHECK(big < text);
    CHECK_FALSE(text < small);
    CHECK(RoadId() == RoadId(std::int64_t{0}));
}
