#pragma once

#include <roadnet/core/result.hpp>
#include <roadnet/model/raw_segment.hpp>

#include <string>
#include <string_view>

namespace roadnet {

// ---------------------------------------------------------------------------
// GeoJSON record source.
//
// Accepts a FeatureCollection whose features carry LineString geometry.
// Feature properties become record fields:
//   null -> null, integer -> integer, number -> real, string -> text,
//   true/false -> 1/0, arrays and objects -> their JSON text.
// A legacy `crs.properties.name` member ("EPSG:31467",
// "urn:ogc:def:crs:EPSG::31467", "urn:ogc:def:crs:OGC:1.3:CRS84") sets the
// batch CRS. Every failure carries ErrorCategory::Io.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<RawSegmentBatch, Error> ParseGeoJsonBatch(std::string_view text);

[[nodiscard]] Result<RawSegmentBatch, Error> ReadGeoJsonBatch(const std::string& path);

} // namespace roadnet
