#include <roadnet/schema/tomtom_2021_adapter.hpp>

#include "field_access.hpp"

#include <roadnet/core/log.hpp>

#include <optional>
#include <string>

namespace roadnet {

namespace {

constexpr const char* kOperation = "NormalizeTomTom2021";
constexpr double kKilometersPerCentimeter = 0.00001;

Result<Direction, Error> ClassifyTrafficDirection(const RawSegmentRecord& record,
                                                  std::size_t index) {
    const std::string column = "simple_traffic_direction";
    auto code = field_access::RequireInteger(record, index, column, kOperation);
    if (code.IsErr()) {
        return Result<Direction, Error>::Err(std::move(code).Error());
    }
    switch (code.Value()) {
        case 1:
        case 9:
            return Result<Direction, Error>::Ok(Direction::Both);
        case 2:
            return Result<Direction, Error>::Ok(Direction::Forward);
        case 3:
            return Result<Direction, Error>::Ok(Direction::Backward);
        default:
            return Result<Direction, Error>::Err(field_access::MakeSchemaError(
                kOperation, index, column,
                "unknown traffic direction code " + std::to_string(code.Value()) +
                    " (expected 1, 2, 3 or 9)"));
    }
}

// Returns the usable speed, or nullopt when the default has to be applied.
Result<std::optional<double>, Error> ReadSpeed(const RawSegmentRecord& record,
                                               std::size_t index,
                                               const std::string& column) {
    auto speed = field_access::OptionalReal(record, index, column, kOperation);
    if (speed.IsErr()) {
        return speed;
    }
    if (!speed.Value().has_value() || *speed.Value() <= 0.0) {
        return Result<std::optional<double>, Error>::Ok(std::nullopt);
    }
    return speed;
}

Result<CanonicalEdgeRecord, Error> NormalizeRecord(const RawSegmentRecord& record,
                                                   std::size_t index,
                                                   bool& speed_defaulted) {
    using R = Result<CanonicalEdgeRecord, Error>;

    if (auto geom = field_access::RequireGeometry(record, index, kOperation); geom.IsErr()) {
        return R::Err(std::move(geom).Error());
    }

    auto from = field_access::RequireInteger(record, index, "junction_id_from", kOperation);
    if (from.IsErr()) return R::Err(std::move(from).Error());
    auto to = field_access::RequireInteger(record, index, "junction_id_to", kOperation);
    if (to.IsErr()) return R::Err(std::move(to).Error());
    auto road = field_access::RequireRoadId(record, index, "netw_id", kOperation);
    if (road.IsErr()) return R::Err(std::move(road).Error());
    auto centimeters =
        field_access::RequireNonNegativeReal(record, index, "centimeters", kOperation);
    if (centimeters.IsErr()) return R::Err(std::move(centimeters).Error());
    auto direction = ClassifyTrafficDirection(record, index);
    if (direction.IsErr()) return R::Err(std::move(direction).Error());

    auto speed_pos = ReadSpeed(record, index, "speed_average_pos");
    if (speed_pos.IsErr()) return R::Err(std::move(speed_pos).Error());
    auto speed_neg = ReadSpeed(record, index, "speed_average_neg");
    if (speed_neg.IsErr()) return R::Err(std::move(speed_neg).Error());

    speed_defaulted = !speed_pos.Value().has_value() || !speed_neg.Value().has_value();
    const double pos_kph = speed_pos.Value().value_or(kDefaultSpeedKph);
    const double neg_kph = speed_neg.Value().value_or(kDefaultSpeedKph);

    CanonicalEdgeRecord out;
    out.from_node_id = from.Value();
    out.to_node_id = to.Value();
    out.road_id = std::move(road).Value();
    out.geometry = record.geometry;
    out.distance_km = centimeters.Value() * kKilometersPerCentimeter;
    out.forward_minutes = field_access::TravelMinutes(out.distance_km, pos_kph);
    out.backward_minutes = field_access::TravelMinutes(out.distance_km, neg_kph);
    out.direction = direction.Value();
    return R::Ok(std::move(out));
}

} // anonymous namespace

Result<NormalizeResult, Error> TomTom2021Adapter::Normalize(
    const std::vector<RawSegmentRecord>& records) const {
    if (records.empty()) {
        return Result<NormalizeResult, Error>::Err(
            Error::Make(ErrorCategory::EmptyInput, kOperation,
                        "road network has no links")
                .WithHint("check the query boundary"));
    }

    NormalizeResult result;
    result.input_count = records.size();
    result.records.reserve(records.size());

    for (std::size_t i = 0; i < records.size(); ++i) {
        bool speed_defaulted = false;
        auto canonical = NormalizeRecord(records[i], i, speed_defaulted);
        if (canonical.IsErr()) {
            return Result<NormalizeResult, Error>::Err(std::move(canonical).Error());
        }
        if (speed_defaulted) {
            result.defaulted_speed_records.push_back(i);
            if (GlobalLogger().IsEnabled(LogLevel::Debug)) {
                LogDebug("schema", "record " + std::to_string(i) + " (road " +
                                       canonical.Value().road_id.ToString() +
                                       "): missing speed, assuming 20 km/h");
            }
        }
        result.records.push_back(std::move(canonical).Value());
    }

    LogInfo("schema", "TomTom 2021: normalized " + std::to_string(result.records.size()) +
                          " records, " +
                          std::to_string(result.defaulted_speed_records.size()) +
                          " with default speed");
    return Result<NormalizeResult, Error>::Ok(std::move(result));
}

} // namespace roadnet
