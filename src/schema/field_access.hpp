#pragma once

#include <roadnet/core/result.hpp>
#include <roadnet/core/types.hpp>
#include <roadnet/model/raw_segment.hpp>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace roadnet::field_access {

inline std::string RecordContext(std::size_t index, std::string_view column) {
    std::string ctx = "record " + std::to_string(index);
    if (!column.empty()) {
        ctx += ", column '";
        ctx += column;
        ctx += "'";
    }
    return ctx;
}

inline Error MakeSchemaError(std::string_view operation, std::size_t index,
                             std::string_view column, std::string message) {
    return Error::Make(ErrorCategory::SchemaError, std::string(operation),
                       std::move(message), RecordContext(index, column));
}

// Integral values above 2^53 no longer map one-to-one onto doubles.
constexpr double kMaxExactIntegralReal = 9007199254740992.0;

inline bool HasSurroundingSpace(const std::string& text) {
    return std::isspace(static_cast<unsigned char>(text.front())) != 0 ||
           std::isspace(static_cast<unsigned char>(text.back())) != 0;
}

// Whole-string integer parse; surrounding whitespace is not accepted.
inline std::optional<std::int64_t> ParseInteger(const std::string& text) {
    if (text.empty() || HasSurroundingSpace(text)) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(v);
}

inline std::optional<double> ParseReal(const std::string& text) {
    if (text.empty() || HasSurroundingSpace(text)) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return v;
}

// 12.0 -> 12; fractional, non-finite and out-of-range reals have no id.
inline std::optional<std::int64_t> IntegralReal(double d) {
    if (!std::isfinite(d) || std::floor(d) != d || std::fabs(d) > kMaxExactIntegralReal) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(d);
}

// Integral reals (e.g. 12.0 from a float column) are accepted; text is
// accepted when it spells an integer.
inline Result<std::int64_t, Error> RequireInteger(const RawSegmentRecord& record,
                                                  std::size_t index,
                                                  const std::string& column,
                                                  std::string_view operation) {
    const auto* value = record.Find(column);
    if (value == nullptr || value->IsNull()) {
        return Result<std::int64_t, Error>::Err(MakeSchemaError(
            operation, index, column, "required identifier is missing"));
    }
    if (value->IsInteger()) {
        return Result<std::int64_t, Error>::Ok(value->AsInteger());
    }
    if (value->IsReal()) {
        if (auto id = IntegralReal(value->AsReal())) {
            return Result<std::int64_t, Error>::Ok(*id);
        }
    } else if (auto parsed = ParseInteger(value->AsText())) {
        return Result<std::int64_t, Error>::Ok(*parsed);
    }
    return Result<std::int64_t, Error>::Err(MakeSchemaError(
        operation, index, column,
        "identifier is not an integer: " + value->ToString()));
}

// Missing, null and NaN all read as "absent".
inline Result<std::optional<double>, Error> OptionalReal(const RawSegmentRecord& record,
                                                         std::size_t index,
                                                         const std::string& column,
                                                         std::string_view operation) {
    using R = Result<std::optional<double>, Error>;
    const auto* value = record.Find(column);
    if (value == nullptr || value->IsNull()) {
        return R::Ok(std::nullopt);
    }

    double d = 0.0;
    if (value->IsInteger()) {
        d = static_cast<double>(value->AsInteger());
    } else if (value->IsReal()) {
        d = value->AsReal();
    } else if (auto parsed = ParseReal(value->AsText())) {
        d = *parsed;
    } else {
        return R::Err(MakeSchemaError(operation, index, column,
                                      "value is not numeric: " + value->ToString()));
    }

    if (std::isnan(d)) {
        return R::Ok(std::nullopt);
    }
    if (!std::isfinite(d)) {
        return R::Err(MakeSchemaError(operation, index, column,
                                      "value must be finite"));
    }
    return R::Ok(d);
}

inline Result<double, Error> RequireNonNegativeReal(const RawSegmentRecord& record,
                                                    std::size_t index,
                                                    const std::string& column,
                                                    std::string_view operation) {
    auto value = OptionalReal(record, index, column, operation);
    if (value.IsErr()) {
        return Result<double, Error>::Err(std::move(value).Error());
    }
    if (!value.Value().has_value()) {
        return Result<double, Error>::Err(MakeSchemaError(
            operation, index, column, "required value is missing"));
    }
    const double d = *value.Value();
    if (d < 0.0) {
        return Result<double, Error>::Err(MakeSchemaError(
            operation, index, column, "value must be >= 0, got " + FieldValue(d).ToString()));
    }
    return Result<double, Error>::Ok(d);
}

// Integer ids stay integers; text ids that spell an integer become integers,
// any other non-empty text is kept verbatim.
inline Result<RoadId, Error> RequireRoadId(const RawSegmentRecord& record,
                                           std::size_t index,
                                           const std::string& column,
                                           std::string_view operation) {
    const auto* value = record.Find(column);
    if (value == nullptr || value->IsNull()) {
        return Result<RoadId, Error>::Err(MakeSchemaError(
            operation, index, column, "required road id is missing"));
    }
    if (value->IsInteger()) {
        return Result<RoadId, Error>::Ok(RoadId(value->AsInteger()));
    }
    if (value->IsReal()) {
        if (auto id = IntegralReal(value->AsReal())) {
            return Result<RoadId, Error>::Ok(RoadId(*id));
        }
        return Result<RoadId, Error>::Err(MakeSchemaError(
            operation, index, column, "road id is not an integer: " + value->ToString()));
    }
    const auto& text = value->AsText();
    if (text.empty()) {
        return Result<RoadId, Error>::Err(MakeSchemaError(
            operation, index, column, "road id must not be empty"));
    }
    if (auto parsed = ParseInteger(text)) {
        return Result<RoadId, Error>::Ok(RoadId(*parsed));
    }
    return Result<RoadId, Error>::Ok(RoadId(text));
}

inline Result<void, Error> RequireGeometry(const RawSegmentRecord& record,
                                           std::size_t index,
                                           std::string_view operation) {
    if (record.geometry.Size() < 2) {
        return Result<void, Error>::Err(MakeSchemaError(
            operation, index, "geometry",
            "geometry needs at least 2 points, got " +
                std::to_string(record.geometry.Size())));
    }
    return Result<void, Error>::Ok();
}

inline double TravelMinutes(double distance_km, double speed_kph) {
    return (distance_km / speed_kph) * 60.0;
}

} // namespace roadnet::field_access
