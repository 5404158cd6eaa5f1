#pragma once

#include <roadnet/schema/schema_adapter.hpp>

namespace roadnet {

// ---------------------------------------------------------------------------
// TomTom2017Adapter — TomTom MultiNet 2017 network (tag "2017").
//
// Columns:
//   id, f_jnctid, t_jnctid   int, required
//   meters                   real (km = m / 1000)
//   minutes                  real, precomputed travel time (both directions)
//   oneway                   text: "FT" from -> to, "TF" to -> from,
//                            anything else both ways
//   rdcond                   int, road condition
//   frc                      int, functional road class
//
// Rows are kept only when rdcond < 2 and frc < 8; a row missing either
// column is dropped. In kept rows a missing meters/minutes reads as 0.
// ---------------------------------------------------------------------------
class TomTom2017Adapter : public ISchemaAdapter {
public:
    [[nodiscard]] std::string_view Tag() const noexcept override { return "2017"; }
    [[nodiscard]] std::string_view Description() const noexcept override {
        return "TomTom MultiNet 2017";
    }

    [[nodiscard]] Result<NormalizeResult, Error> Normalize(
        const std::vector<RawSegmentRecord>& records) const override;
};

} // namespace roadnet
