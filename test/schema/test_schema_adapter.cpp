#include <catch2/catch_test_macros.hpp>

#include <roadnet/schema/schema_adapter.hpp>
#include <roadnet/schema/tomtom_2021_adapter.hpp>

#include "fixtures/road_records.hpp"

#include <memory>

using namespace roadnet;
using namespace roadnet::fixtures;

namespace {

Vintage MakeVintage(const char* tag) {
    return Vintage::Create(tag).Value();
}

// Registers under its own tag and returns a fixed record.
class FakeAdapter : public ISchemaAdapter {
public:
    [[nodiscard]] std::string_view Tag() const noexcept override { return "test-1"; }
    [[nodiscard]] std::string_view Description() const noexcept override { return "fake"; }

    [[nodiscard]] Result<NormalizeResult, Error> Normalize(
        const std::vector<RawSegmentRecord>& records) const override {
        NormalizeResult result;
        result.input_count = records.size();
        CanonicalEdgeRecord rec;
        rec.from_node_id = 1;
        rec.to_node_id = 2;
        rec.geometry = LineBetween(1, 2);
        result.records.push_back(rec);
        return Result<NormalizeResult, Error>::Ok(std::move(result));
    }
};

} // namespace

// ===========================================================================
// Registry
// ===========================================================================

TEST_CASE("SchemaAdapterRegistry: builtin adapters", "[schema]") {
    auto registry = SchemaAdapterRegistry::WithBuiltinAdapters();
    CHECK(registry.Tags() == std::vector<std::string>{"2017", "2021"});

    const auto* a2021 = registry.Find(MakeVintage("2021"));
    REQUIRE(a2021 != nullptr);
    CHECK(a2021->Tag() == "2021");
    CHECK(registry.Find(MakeVintage("2017")) != nullptr);
    CHECK(registry.Find(MakeVintage("2019")) == nullptr);
}

TEST_CASE("SchemaAdapterRegistry: register custom adapter", "[schema]") {
    SchemaAdapterRegistry registry;
    CHECK(registry.Tags().empty());

    auto result = registry.Register(std::make_unique<FakeAdapter>());
    REQUIRE(result.IsOk());
    CHECK(registry.Find(MakeVintage("test-1")) != nullptr);
}

TEST_CASE("SchemaAdapterRegistry: duplicate tag is rejected", "[schema]") {
    auto registry = SchemaAdapterRegistry::WithBuiltinAdapters();
    auto result = registry.Register(std::make_unique<TomTom2021Adapter>());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Internal);
    CHECK(result.Error().context == "vintage 2021");
}

TEST_CASE("SchemaAdapterRegistry: null adapter is rejected", "[schema]") {
    SchemaAdapterRegistry registry;
    auto result = registry.Register(nullptr);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Internal);
}

// ===========================================================================
// Normalize dispatch
// ===========================================================================

TEST_CASE("Normalize: dispatches by vintage tag", "[schema]") {
    auto registry = SchemaAdapterRegistry::WithBuiltinAdapters();
    auto r2021 = Normalize(registry, {Link2021(1, 1, 2, 1000.0, 2)}, "2021");
    REQUIRE(r2021.IsOk());
    CHECK(r2021.Value().records[0].direction == Direction::Forward);

    auto r2017 = Normalize(registry, {Link2017(1, 1, 2, 10.0, 1.0, "FT")}, "2017");
    REQUIRE(r2017.IsOk());
    CHECK(r2017.Value().records[0].direction == Direction::Forward);
}

TEST_CASE("Normalize: same records, different vintage, different reading", "[schema]") {
    auto registry = SchemaAdapterRegistry::WithBuiltinAdapters();
    // 2021 columns read under the 2017 schema lack rdcond/frc: all filtered.
    auto result = Normalize(registry, {Link2021(1, 1, 2, 1000.0, 1)}, "2017");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::EmptyInput);
}

TEST_CASE("Normalize: integer year selects the same adapter as text", "[schema]") {
    auto registry = SchemaAdapterRegistry::WithBuiltinAdapters();
    const std::vector<RawSegmentRecord> records = {Link2021(1, 1, 2, 1000.0, 3)};

    auto by_year = Normalize(registry, records, 2021);
    auto by_tag = Normalize(registry, records, "2021");
    REQUIRE(by_year.IsOk());
    REQUIRE(by_tag.IsOk());
    CHECK(by_year.Value().records[0].direction == by_tag.Value().records[0].direction);

    auto unknown = Normalize(registry, records, 2019);
    REQUIRE(unknown.IsErr());
    CHECK(unknown.Error().category == ErrorCategory::UnsupportedVintage);

    auto negative = Normalize(registry, records, -1);
    REQUIRE(negative.IsErr());
    CHECK(negative.Error().category == ErrorCategory::UnsupportedVintage);
}

TEST_CASE("Normalize: unknown vintage is UnsupportedVintage", "[schema]") {
    auto registry = SchemaAdapterRegistry::WithBuiltinAdapters();
    auto result = Normalize(registry, {Link2021(1, 1, 2, 1000.0, 1)}, "2019");
    REQUIRE(result.IsErr());
    const auto& error = result.Error();
    CHECK(error.category == ErrorCategory::UnsupportedVintage);
    CHECK(error.operation == "Normalize");
    CHECK(error.context == "vintage '2019'");
    REQUIRE(error.hint.has_value());
    CHECK(*error.hint == "supported vintages: '2017', '2021'");
    CHECK(error.ExitCode() == 2);
}

TEST_CASE("Normalize: malformed vintage is UnsupportedVintage", "[schema]") {
    auto registry = SchemaAdapterRegistry::WithBuiltinAdapters();
    auto result = Normalize(registry, {Link2021(1, 1, 2, 1000.0, 1)}, "20 21");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UnsupportedVintage);

    auto empty = Normalize(registry, {Link2021(1, 1, 2, 1000.0, 1)}, "");
    REQUIRE(empty.IsErr());
    CHECK(empty.Error().category == ErrorCategory::UnsupportedVintage);
}

TEST_CASE("Normalize: unsupported vintage wins over empty input", "[schema]") {
    auto registry = SchemaAdapterRegistry::WithBuiltinAdapters();
    auto result = Normalize(registry, {}, "2019");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UnsupportedVintage);
}
