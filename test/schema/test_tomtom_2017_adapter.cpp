#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <roadnet/schema/tomtom_2017_adapter.hpp>

#include "fixtures/road_records.hpp"

using namespace roadnet;
using namespace roadnet::fixtures;
using Catch::Matchers::WithinAbs;

// ===========================================================================
// Conversion
// ===========================================================================

TEST_CASE("TomTom2017: meters to km, minutes both ways", "[schema][2017]") {
    TomTom2017Adapter adapter;
    auto result = adapter.Normalize({Link2017(42, 7, 8, 1500.0, 2.5)});
    REQUIRE(result.IsOk());

    const auto& out = result.Value();
    REQUIRE(out.records.size() == 1);
    const auto& rec = out.records[0];
    CHECK(rec.from_node_id == 7);
    CHECK(rec.to_node_id == 8);
    CHECK(rec.road_id == RoadId(std::int64_t{42}));
    CHECK(rec.direction == Direction::Both);
    CHECK_THAT(rec.distance_km, WithinAbs(1.5, 1e-12));
    CHECK_THAT(rec.forward_minutes, WithinAbs(2.5, 1e-12));
    CHECK_THAT(rec.backward_minutes, WithinAbs(2.5, 1e-12));
    CHECK(out.filtered_count == 0);
    CHECK(out.zero_filled_records.empty());
    CHECK(out.defaulted_speed_records.empty());
}

TEST_CASE("TomTom2017: oneway codes", "[schema][2017]") {
    TomTom2017Adapter adapter;
    auto result = adapter.Normalize({
        Link2017(1, 1, 2, 100.0, 1.0, "FT"),
        Link2017(2, 2, 3, 100.0, 1.0, "TF"),
        Link2017(3, 3, 4, 100.0, 1.0),
        Link2017(4, 4, 5, 100.0, 1.0, "N"),
    });
    REQUIRE(result.IsOk());
    const auto& recs = result.Value().records;
    REQUIRE(recs.size() == 4);
    CHECK(recs[0].direction == Direction::Forward);
    CHECK(recs[1].direction == Direction::Backward);
    CHECK(recs[2].direction == Direction::Both);
    CHECK(recs[3].direction == Direction::Both);
}

// ===========================================================================
// Routability filter
// ===========================================================================

TEST_CASE("TomTom2017: rows with poor condition or class 8 are dropped", "[schema][2017]") {
    TomTom2017Adapter adapter;
    auto result = adapter.Normalize({
        Link2017(1, 1, 2, 100.0, 1.0, "", 1, 7),
        Link2017(2, 2, 3, 100.0, 1.0, "", 2, 3),
        Link2017(3, 3, 4, 100.0, 1.0, "", 1, 8),
        Link2017(4, 4, 5, 100.0, 1.0, "", 0, 0),
    });
    REQUIRE(result.IsOk());
    const auto& out = result.Value();
    CHECK(out.input_count == 4);
    CHECK(out.filtered_count == 2);
    REQUIRE(out.records.size() == 2);
    CHECK(out.records[0].road_id.AsInteger() == 1);
    CHECK(out.records[1].road_id.AsInteger() == 4);
}

TEST_CASE("TomTom2017: a row without rdcond or frc is dropped", "[schema][2017]") {
    TomTom2017Adapter adapter;
    auto no_rdcond = Link2017(1, 1, 2, 100.0, 1.0);
    no_rdcond.fields.erase("rdcond");
    auto null_frc = Link2017(2, 2, 3, 100.0, 1.0);
    null_frc.fields["frc"] = FieldValue::Null();

    auto result = adapter.Normalize({no_rdcond, null_frc, Link2017(3, 3, 4, 100.0, 1.0)});
    REQUIRE(result.IsOk());
    CHECK(result.Value().filtered_count == 2);
    REQUIRE(result.Value().records.size() == 1);
    CHECK(result.Value().records[0].road_id.AsInteger() == 3);
}

TEST_CASE("TomTom2017: everything filtered is EmptyInput", "[schema][2017]") {
    TomTom2017Adapter adapter;
    auto result = adapter.Normalize({Link2017(1, 1, 2, 100.0, 1.0, "", 3, 3)});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::EmptyInput);
    CHECK(result.Error().operation == "NormalizeTomTom2017");
}

TEST_CASE("TomTom2017: empty input is EmptyInput", "[schema][2017]") {
    TomTom2017Adapter adapter;
    auto result = adapter.Normalize({});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::EmptyInput);
}

// ===========================================================================
// Missing values
// ===========================================================================

TEST_CASE("TomTom2017: missing meters or minutes read as zero", "[schema][2017]") {
    TomTom2017Adapter adapter;
    auto no_meters = Link2017(1, 1, 2, 0.0, 4.0);
    no_meters.fields.erase("meters");
    auto null_minutes = Link2017(2, 2, 3, 250.0, 0.0);
    null_minutes.fields["minutes"] = FieldValue::Null();

    auto result = adapter.Normalize({Link2017(9, 9, 1, 10.0, 1.0), no_meters, null_minutes});
    REQUIRE(result.IsOk());
    const auto& out = result.Value();
    CHECK(out.zero_filled_records == std::vector<std::size_t>{1, 2});
    CHECK(out.records[1].distance_km == 0.0);
    CHECK_THAT(out.records[1].forward_minutes, WithinAbs(4.0, 1e-12));
    CHECK_THAT(out.records[2].distance_km, WithinAbs(0.25, 1e-12));
    CHECK(out.records[2].forward_minutes == 0.0);
    CHECK(out.records[2].backward_minutes == 0.0);
}

TEST_CASE("TomTom2017: missing junction is SchemaError", "[schema][2017]") {
    TomTom2017Adapter adapter;
    auto record = Link2017(1, 1, 2, 100.0, 1.0);
    record.fields.erase("f_jnctid");
    auto result = adapter.Normalize({record});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::SchemaError);
    CHECK(result.Error().context == "record 0, column 'f_jnctid'");
}

TEST_CASE("TomTom2017: junction id beyond int64 is SchemaError", "[schema][2017]") {
    TomTom2017Adapter adapter;
    auto record = Link2017(1, 1, 2, 100.0, 1.0);
    record.fields["t_jnctid"] = FieldValue(-1.0e19);
    auto result = adapter.Normalize({record});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::SchemaError);
    CHECK(result.Error().context == "record 0, column 't_jnctid'");
}

TEST_CASE("TomTom2017: negative minutes is SchemaError", "[schema][2017]") {
    TomTom2017Adapter adapter;
    auto result = adapter.Normalize({Link2017(1, 1, 2, 100.0, -1.0)});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::SchemaError);
    CHECK(result.Error().context == "record 0, column 'minutes'");
}

TEST_CASE("TomTom2017: non-numeric frc is SchemaError", "[schema][2017]") {
    TomTom2017Adapter adapter;
    auto record = Link2017(1, 1, 2, 100.0, 1.0);
    record.fields["frc"] = FieldValue("motorway");
    auto result = adapter.Normalize({record});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::SchemaError);
}
