#pragma once

#include <roadnet/core/types.hpp>
#include <roadnet/model/geometry.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace roadnet {

// ---------------------------------------------------------------------------
// FieldValue — one loosely typed source column value (null, integer, real or
// text), as delivered by the record source before any schema is applied.
// ---------------------------------------------------------------------------
class FieldValue {
public:
    FieldValue() = default;
    FieldValue(std::int64_t v) : value_(v) {}
    FieldValue(int v) : value_(std::int64_t{v}) {}
    FieldValue(double v) : value_(v) {}
    FieldValue(std::string v) : value_(std::move(v)) {}
    FieldValue(const char* v) : value_(std::string(v)) {}

    static FieldValue Null() { return FieldValue(); }

    [[nodiscard]] bool IsNull() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsInteger() const noexcept { return value_.index() == 1; }
    [[nodiscard]] bool IsReal() const noexcept { return value_.index() == 2; }
    [[nodiscard]] bool IsText() const noexcept { return value_.index() == 3; }

    [[nodiscard]] std::int64_t AsInteger() const { return std::get<1>(value_); }
    [[nodiscard]] double AsReal() const { return std::get<2>(value_); }
    [[nodiscard]] const std::string& AsText() const { return std::get<3>(value_); }

    /// Human-readable rendering for error messages ("null" for null).
    [[nodiscard]] std::string ToString() const;

    bool operator==(const FieldValue& other) const { return value_ == other.value_; }
    bool operator!=(const FieldValue& other) const { return value_ != other.value_; }

private:
    std::variant<std::monostate, std::int64_t, double, std::string> value_;
};

// ---------------------------------------------------------------------------
// RawSegmentRecord — one road segment as produced by the record source.
// Column names and meaning are vintage-specific; only the owning schema
// adapter interprets them.
// ---------------------------------------------------------------------------
struct RawSegmentRecord {
    LineString geometry;
    std::map<std::string, FieldValue> fields;

    /// nullptr when the column is absent. A present-but-null column returns
    /// a FieldValue with IsNull() == true.
    [[nodiscard]] const FieldValue* Find(const std::string& column) const {
        auto it = fields.find(column);
        return it == fields.end() ? nullptr : &it->second;
    }
};

// ---------------------------------------------------------------------------
// RawSegmentBatch — the ordered record sequence handed to the pipeline,
// together with the CRS the source attached (if any).
// ---------------------------------------------------------------------------
struct RawSegmentBatch {
    std::optional<CrsCode> crs;
    std::vector<RawSegmentRecord> records;
};

} // namespace roadnet
