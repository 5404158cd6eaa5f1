#include <catch2/catch_test_macros.hpp>

#include <roadnet/model/canonical_edge.hpp>
#include <roadnet/model/raw_segment.hpp>

using namespace roadnet;

TEST_CASE("FieldValue: kinds", "[model][field]") {
    CHECK(FieldValue().IsNull());
    CHECK(FieldValue::Null().IsNull());
    CHECK(FieldValue(3).IsInteger());
    CHECK(FieldValue(std::int64_t{3}).AsInteger() == 3);
    CHECK(FieldValue(2.5).IsReal());
    CHECK(FieldValue("FT").IsText());
    CHECK(FieldValue(std::string("TF")).AsText() == "TF");
}

TEST_CASE("FieldValue: ToString for error messages", "[model][field]") {
    CHECK(FieldValue().ToString() == "null");
    CHECK(FieldValue(42).ToString() == "42");
    CHECK(FieldValue(0.5).ToString() == "0.5");
    CHECK(FieldValue("abc").ToString() == "\"abc\"");
}

TEST_CASE("FieldValue: equality distinguishes kinds", "[model][field]") {
    CHECK(FieldValue(1) == FieldValue(std::int64_t{1}));
    CHECK(FieldValue(1) != FieldValue(1.0));
    CHECK(FieldValue("1") != FieldValue(1));
}

TEST_CASE("RawSegmentRecord: Find separates absent and null columns", "[model][record]") {
    RawSegmentRecord record;
    record.fields["frc"] = FieldValue(3);
    record.fields["speed"] = FieldValue::Null();

    REQUIRE(record.Find("frc") != nullptr);
    CHECK(record.Find("frc")->AsInteger() == 3);
    REQUIRE(record.Find("speed") != nullptr);
    CHECK(record.Find("speed")->IsNull());
    CHECK(record.Find("oneway") == nullptr);
}

TEST_CASE("DirectionName: lower-case names", "[model][direction]") {
    CHECK(DirectionName(Direction::Forward) == "forward");
    CHECK(DirectionName(Direction::Backward) == "backward");
    CHECK(DirectionName(Direction::Both) == "both");
}
