#pragma once

#include <roadnet/schema/schema_adapter.hpp>

namespace roadnet {

// ---------------------------------------------------------------------------
// TomTom2021Adapter — TomTom MultiNet 2021 network links (tag "2021").
//
// Columns:
//   junction_id_from, junction_id_to   int, required
//   netw_id                            int or text, required
//   centimeters                        real, required (km = cm * 1e-5)
//   speed_average_pos                  real, optional (km/h, from -> to)
//   speed_average_neg                  real, optional (km/h, to -> from)
//   simple_traffic_direction           int, required:
//                                        1, 9 both ways
//                                        2    from -> to
//                                        3    to -> from
//
// A missing or non-positive speed is replaced by kDefaultSpeedKph.
// Every row is kept.
// ---------------------------------------------------------------------------
class TomTom2021Adapter : public ISchemaAdapter {
public:
    [[nodiscard]] std::string_view Tag() const noexcept override { return "2021"; }
    [[nodiscard]] std::string_view Description() const noexcept override {
        return "TomTom MultiNet 2021";
    }

    [[nodiscard]] Result<NormalizeResult, Error> Normalize(
        const std::vector<RawSegmentRecord>& records) const override;
};

} // namespace roadnet
