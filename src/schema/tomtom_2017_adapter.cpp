#include <roadnet/schema/tomtom_2017_adapter.hpp>

#include "field_access.hpp"

#include <roadnet/core/log.hpp>

#include <optional>
#include <string>

namespace roadnet {

namespace {

constexpr const char* kOperation = "NormalizeTomTom2017";
constexpr double kMaxRoadCondition = 2.0;      // exclusive
constexpr double kMaxFunctionalClass = 8.0;    // exclusive

// Poor-condition and non-routable functional classes are dropped.
Result<bool, Error> IsRoutable(const RawSegmentRecord& record, std::size_t index) {
    auto rdcond = field_access::OptionalReal(record, index, "rdcond", kOperation);
    if (rdcond.IsErr()) return Result<bool, Error>::Err(std::move(rdcond).Error());
    auto frc = field_access::OptionalReal(record, index, "frc", kOperation);
    if (frc.IsErr()) return Result<bool, Error>::Err(std::move(frc).Error());

    if (!rdcond.Value().has_value() || !frc.Value().has_value()) {
        return Result<bool, Error>::Ok(false);
    }
    return Result<bool, Error>::Ok(*rdcond.Value() < kMaxRoadCondition &&
                                   *frc.Value() < kMaxFunctionalClass);
}

Direction ClassifyOneway(const RawSegmentRecord& record) {
    const auto* oneway = record.Find("oneway");
    if (oneway != nullptr && oneway->IsText()) {
        if (oneway->AsText() == "FT") return Direction::Forward;
        if (oneway->AsText() == "TF") return Direction::Backward;
    }
    return Direction::Both;
}

Result<double, Error> ReadZeroFilled(const RawSegmentRecord& record, std::size_t index,
                                     const std::string& column, bool& zero_filled) {
    auto value = field_access::OptionalReal(record, index, column, kOperation);
    if (value.IsErr()) {
        return Result<double, Error>::Err(std::move(value).Error());
    }
    if (!value.Value().has_value()) {
        zero_filled = true;
        return Result<double, Error>::Ok(0.0);
    }
    if (*value.Value() < 0.0) {
        return Result<double, Error>::Err(field_access::MakeSchemaError(
            kOperation, index, column, "value must be >= 0"));
    }
    return Result<double, Error>::Ok(*value.Value());
}

Result<CanonicalEdgeRecord, Error> NormalizeRecord(const RawSegmentRecord& record,
                                                   std::size_t index,
                                                   bool& zero_filled) {
    using R = Result<CanonicalEdgeRecord, Error>;

    if (auto geom = field_access::RequireGeometry(record, index, kOperation); geom.IsErr()) {
        return R::Err(std::move(geom).Error());
    }

    auto id = field_access::RequireInteger(record, index, "id", kOperation);
    if (id.IsErr()) return R::Err(std::move(id).Error());
    auto from = field_access::RequireInteger(record, index, "f_jnctid", kOperation);
    if (from.IsErr()) return R::Err(std::move(from).Error());
    auto to = field_access::RequireInteger(record, index, "t_jnctid", kOperation);
    if (to.IsErr()) return R::Err(std::move(to).Error());

    auto meters = ReadZeroFilled(record, index, "meters", zero_filled);
    if (meters.IsErr()) return R::Err(std::move(meters).Error());
    auto minutes = ReadZeroFilled(record, index, "minutes", zero_filled);
    if (minutes.IsErr()) return R::Err(std::move(minutes).Error());

    CanonicalEdgeRecord out;
    out.from_node_id = from.Value();
    out.to_node_id = to.Value();
    out.road_id = RoadId(id.Value());
    out.geometry = record.geometry;
    out.distance_km = meters.Value() / 1000.0;
    out.forward_minutes = minutes.Value();
    out.backward_minutes = minutes.Value();
    out.direction = ClassifyOneway(record);
    return R::Ok(std::move(out));
}

} // anonymous namespace

Result<NormalizeResult, Error> TomTom2017Adapter::Normalize(
    const std::vector<RawSegmentRecord>& records) const {
    if (records.empty()) {
        return Result<NormalizeResult, Error>::Err(
            Error::Make(ErrorCategory::EmptyInput, kOperation,
                        "road network has no links")
                .WithHint("check the query boundary"));
    }

    NormalizeResult result;
    result.input_count = records.size();

    for (std::size_t i = 0; i < records.size(); ++i) {
        auto routable = IsRoutable(records[i], i);
        if (routable.IsErr()) {
            return Result<NormalizeResult, Error>::Err(std::move(routable).Error());
        }
        if (!routable.Value()) {
            ++result.filtered_count;
            continue;
        }

        bool zero_filled = false;
        auto canonical = NormalizeRecord(records[i], i, zero_filled);
        if (canonical.IsErr()) {
            return Result<NormalizeResult, Error>::Err(std::move(canonical).Error());
        }
        if (zero_filled) {
            result.zero_filled_records.push_back(i);
        }
        result.records.push_back(std::move(canonical).Value());
    }

    if (result.records.empty()) {
        return Result<NormalizeResult, Error>::Err(
            Error::Make(ErrorCategory::EmptyInput, kOperation,
                        "all " + std::to_string(records.size()) +
                            " links were filtered out (rdcond >= 2 or frc >= 8)")
                .WithHint("check the query boundary"));
    }

    LogInfo("schema", "TomTom 2017: normalized " + std::to_string(result.records.size()) +
                          " of " + std::to_string(records.size()) + " records, " +
                          std::to_string(result.filtered_count) + " filtered, " +
                          std::to_string(result.zero_filled_records.size()) +
                          " zero-filled");
    return Result<NormalizeResult, Error>::Ok(std::move(result));
}

} // namespace roadnet
