#pragma once

#include <roadnet/core/result.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace roadnet {

// Junction identifier as carried by the source network.
using NodeId = std::int64_t;

// ---------------------------------------------------------------------------
// Vintage — validated schema variant tag (e.g. "2017", "2021").
//
// Rules:
//   - Non-empty, max 16 characters
//   - ASCII letters, digits, '_', '-', '.'
// Surrounding whitespace is trimmed. Whether the tag is registered is the
// registry's concern, not this type's.
// ---------------------------------------------------------------------------
class Vintage {
public:
    static Result<Vintage, std::string> Create(std::string_view tag);
    static Result<Vintage, std::string> FromYear(int year);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const Vintage& other) const { return value_ == other.value_; }
    bool operator!=(const Vintage& other) const { return value_ != other.value_; }

    Vintage(const Vintage&) = default;
    Vintage& operator=(const Vintage&) = default;
    Vintage(Vintage&&) noexcept = default;
    Vintage& operator=(Vintage&&) noexcept = default;

private:
    explicit Vintage(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// CrsCode — coordinate reference descriptor in AUTHORITY:CODE form
// (e.g. "EPSG:4326"). The authority is upper-cased.
// ---------------------------------------------------------------------------
class CrsCode {
public:
    static Result<CrsCode, std::string> Create(std::string_view code);

    /// WGS84 lon/lat, assumed when the record source attaches no CRS.
    static CrsCode LatLon();

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const CrsCode& other) const { return value_ == other.value_; }
    bool operator!=(const CrsCode& other) const { return value_ != other.value_; }

    CrsCode(const CrsCode&) = default;
    CrsCode& operator=(const CrsCode&) = default;
    CrsCode(CrsCode&&) noexcept = default;
    CrsCode& operator=(CrsCode&&) noexcept = default;

private:
    explicit CrsCode(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// RoadId — road/segment identifier, integer or text depending on vintage.
// Integers order before strings.
// ---------------------------------------------------------------------------
class RoadId {
public:
    RoadId() : value_(std::int64_t{0}) {}
    explicit RoadId(std::int64_t id) : value_(id) {}
    explicit RoadId(std::string id) : value_(std::move(id)) {}

    [[nodiscard]] bool IsInteger() const noexcept { return value_.index() == 0; }
    [[nodiscard]] std::int64_t AsInteger() const { return std::get<0>(value_); }
    [[nodiscard]] const std::string& AsString() const { return std::get<1>(value_); }

    [[nodiscard]] std::string ToString() const;

    bool operator==(const RoadId& other) const { return value_ == other.value_; }
    bool operator!=(const RoadId& other) const { return value_ != other.value_; }
    bool operator<(const RoadId& other) const { return value_ < other.value_; }

    friend std::ostream& operator<<(std::ostream& os, const RoadId& id) {
        return os << id.ToString();
    }

private:
    std::variant<std::int64_t, std::string> value_;
};

} // namespace roadnet
