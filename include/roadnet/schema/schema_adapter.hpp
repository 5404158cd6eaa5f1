#pragma once

#include <roadnet/core/result.hpp>
#include <roadnet/core/types.hpp>
#include <roadnet/model/canonical_edge.hpp>
#include <roadnet/model/raw_segment.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace roadnet {

/// Speed assumed (km/h) when a record carries no usable speed.
constexpr double kDefaultSpeedKph = 20.0;

// ---------------------------------------------------------------------------
// NormalizeResult — canonical records plus what the adapter had to assume.
//
// Indices refer to positions in the raw input sequence.
// ---------------------------------------------------------------------------
struct NormalizeResult {
    std::vector<CanonicalEdgeRecord> records;
    std::size_t input_count = 0;
    std::size_t filtered_count = 0;                   // dropped as non-routable
    std::vector<std::size_t> defaulted_speed_records; // kDefaultSpeedKph applied
    std::vector<std::size_t> zero_filled_records;     // missing numerics set to 0
};

// ---------------------------------------------------------------------------
// ISchemaAdapter — maps one source schema vintage to CanonicalEdgeRecord.
//
// Implementations are stateless and never modify their input.
// ---------------------------------------------------------------------------
class ISchemaAdapter {
public:
    virtual ~ISchemaAdapter() = default;

    /// Registry tag, e.g. "2021".
    [[nodiscard]] virtual std::string_view Tag() const noexcept = 0;

    [[nodiscard]] virtual std::string_view Description() const noexcept = 0;

    /// Fails with SchemaError on a malformed record and with EmptyInput when
    /// the input (or what survives the variant's filter) is empty.
    [[nodiscard]] virtual Result<NormalizeResult, Error> Normalize(
        const std::vector<RawSegmentRecord>& records) const = 0;
};

// ---------------------------------------------------------------------------
// SchemaAdapterRegistry — adapters keyed by vintage tag. Selection is by
// explicit tag only.
// ---------------------------------------------------------------------------
class SchemaAdapterRegistry {
public:
    SchemaAdapterRegistry() = default;

    SchemaAdapterRegistry(const SchemaAdapterRegistry&) = delete;
    SchemaAdapterRegistry& operator=(const SchemaAdapterRegistry&) = delete;
    SchemaAdapterRegistry(SchemaAdapterRegistry&&) noexcept = default;
    SchemaAdapterRegistry& operator=(SchemaAdapterRegistry&&) noexcept = default;

    /// Registry holding the TomTom MultiNet 2017 and 2021 adapters.
    [[nodiscard]] static SchemaAdapterRegistry WithBuiltinAdapters();

    /// Fails with Internal if an adapter with the same tag is registered.
    [[nodiscard]] Result<void, Error> Register(std::unique_ptr<ISchemaAdapter> adapter);

    /// nullptr when no adapter carries the tag.
    [[nodiscard]] const ISchemaAdapter* Find(const Vintage& vintage) const;

    /// Registered tags in ascending order.
    [[nodiscard]] std::vector<std::string> Tags() const;

private:
    std::map<std::string, std::unique_ptr<ISchemaAdapter>, std::less<>> adapters_;
};

// ---------------------------------------------------------------------------
// Normalize — select the adapter for `vintage_tag` and run it.
//
// Fails with UnsupportedVintage if the tag is malformed or not registered,
// then with EmptyInput / SchemaError from the adapter.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<NormalizeResult, Error> Normalize(
    const SchemaAdapterRegistry& registry,
    const std::vector<RawSegmentRecord>& records,
    std::string_view vintage_tag);

/// Same, with the vintage given as a release year (2021 selects "2021").
[[nodiscard]] Result<NormalizeResult, Error> Normalize(
    const SchemaAdapterRegistry& registry,
    const std::vector<RawSegmentRecord>& records,
    int vintage_year);

} // namespace roadnet
