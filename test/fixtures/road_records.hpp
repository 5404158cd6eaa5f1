#pragma once

#include <roadnet/model/raw_segment.hpp>

#include <cstdint>
#include <string>

namespace roadnet::fixtures {

// Straight two-point line from (from, 0) to (to, 0); node ids double as x.
inline LineString LineBetween(std::int64_t from, std::int64_t to) {
    return LineString{{static_cast<double>(from), 0.0}, {static_cast<double>(to), 0.0}};
}

// TomTom MultiNet 2021 link. Speeds are in km/h; pass FieldValue::Null() to
// leave one unset.
inline RawSegmentRecord Link2021(std::int64_t road, std::int64_t from, std::int64_t to,
                                 double centimeters, int direction,
                                 FieldValue speed_pos = FieldValue(60.0),
                                 FieldValue speed_neg = FieldValue(60.0)) {
    RawSegmentRecord record;
    record.geometry = LineBetween(from, to);
    record.fields["netw_id"] = FieldValue(road);
    record.fields["junction_id_from"] = FieldValue(from);
    record.fields["junction_id_to"] = FieldValue(to);
    record.fields["centimeters"] = FieldValue(centimeters);
    record.fields["simple_traffic_direction"] = FieldValue(direction);
    record.fields["speed_average_pos"] = std::move(speed_pos);
    record.fields["speed_average_neg"] = std::move(speed_neg);
    return record;
}

// TomTom MultiNet 2017 link, routable by default (rdcond 1, frc 3).
inline RawSegmentRecord Link2017(std::int64_t road, std::int64_t from, std::int64_t to,
                                 double meters, double minutes,
                                 const std::string& oneway = "",
                                 int rdcond = 1, int frc = 3) {
    RawSegmentRecord record;
    record.geometry = LineBetween(from, to);
    record.fields["id"] = FieldValue(road);
    record.fields["f_jnctid"] = FieldValue(from);
    record.fields["t_jnctid"] = FieldValue(to);
    record.fields["meters"] = FieldValue(meters);
    record.fields["minutes"] = FieldValue(minutes);
    record.fields["oneway"] = oneway.empty() ? FieldValue::Null() : FieldValue(oneway);
    record.fields["rdcond"] = FieldValue(rdcond);
    record.fields["frc"] = FieldValue(frc);
    return record;
}

} // namespace roadnet::fixtures
