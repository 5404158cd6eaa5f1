#include <roadnet/io/geojson_reader.hpp>

#include <roadnet/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace roadnet {

namespace {

constexpr const char* kOperation = "ReadGeoJson";
constexpr std::string_view kOgcUrnPrefix = "urn:ogc:def:crs:";

Error MakeIoError(const std::string& message, const std::string& context = "") {
    return Error::Make(ErrorCategory::Io, kOperation, message, context);
}

std::string FeatureContext(std::size_t index) {
    return "feature " + std::to_string(index);
}

// "urn:ogc:def:crs:EPSG::31467" -> "EPSG:31467"; CRS84 is lon/lat WGS84.
std::string CrsNameToCode(const std::string& name) {
    if (name.compare(0, kOgcUrnPrefix.size(), kOgcUrnPrefix) != 0) {
        return name;
    }
    const std::string rest = name.substr(kOgcUrnPrefix.size());
    const auto last_colon = rest.rfind(':');
    const std::string code = last_colon == std::string::npos ? rest : rest.substr(last_colon + 1);
    if (code == "CRS84") {
        return CrsCode::LatLon().Value();
    }
    return rest.substr(0, rest.find(':')) + ":" + code;
}

Result<std::optional<CrsCode>, Error> ParseCrs(const nlohmann::json& root) {
    using R = Result<std::optional<CrsCode>, Error>;
    auto crs_it = root.find("crs");
    if (crs_it == root.end() || crs_it->is_null()) {
        return R::Ok(std::nullopt);
    }
    const auto& crs = *crs_it;
    if (!crs.is_object() || !crs.contains("properties") ||
        !crs["properties"].is_object() || !crs["properties"].contains("name") ||
        !crs["properties"]["name"].is_string()) {
        return R::Err(MakeIoError("unsupported crs member, expected crs.properties.name"));
    }
    const auto name = crs["properties"]["name"].get<std::string>();
    auto code = CrsCode::Create(CrsNameToCode(name));
    if (code.IsErr()) {
        return R::Err(MakeIoError("invalid crs name: " + code.Error(), name));
    }
    return R::Ok(std::move(code).Value());
}

Result<LineString, Error> ParseLineString(const nlohmann::json& geometry, std::size_t index) {
    using R = Result<LineString, Error>;
    if (!geometry.is_object()) {
        return R::Err(MakeIoError("feature has no geometry", FeatureContext(index)));
    }
    const auto type = geometry.value("type", std::string{});
    if (type != "LineString") {
        return R::Err(MakeIoError("unsupported geometry type '" + type +
                                      "', expected LineString",
                                  FeatureContext(index)));
    }
    auto coords_it = geometry.find("coordinates");
    if (coords_it == geometry.end() || !coords_it->is_array()) {
        return R::Err(MakeIoError("LineString has no coordinates array", FeatureContext(index)));
    }

    std::vector<Coordinate> points;
    points.reserve(coords_it->size());
    for (const auto& position : *coords_it) {
        if (!position.is_array() || position.size() < 2 || !position[0].is_number() ||
            !position[1].is_number()) {
            return R::Err(MakeIoError("malformed position in LineString", FeatureContext(index)));
        }
        points.push_back(Coordinate{position[0].get<double>(), position[1].get<double>()});
    }
    return R::Ok(LineString(std::move(points)));
}

FieldValue ToFieldValue(const nlohmann::json& value) {
    if (value.is_null()) {
        return FieldValue::Null();
    }
    if (value.is_boolean()) {
        return FieldValue(value.get<bool>() ? 1 : 0);
    }
    if (value.is_number_unsigned()) {
        const auto u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return FieldValue(static_cast<double>(u));
        }
        return FieldValue(static_cast<std::int64_t>(u));
    }
    if (value.is_number_integer()) {
        return FieldValue(value.get<std::int64_t>());
    }
    if (value.is_number_float()) {
        return FieldValue(value.get<double>());
    }
    if (value.is_string()) {
        return FieldValue(value.get<std::string>());
    }
    return FieldValue(value.dump());
}

Result<RawSegmentRecord, Error> ParseFeature(const nlohmann::json& feature, std::size_t index) {
    using R = Result<RawSegmentRecord, Error>;
    if (!feature.is_object() || feature.value("type", std::string{}) != "Feature") {
        return R::Err(MakeIoError("expected a Feature object", FeatureContext(index)));
    }

    auto geometry_it = feature.find("geometry");
    if (geometry_it == feature.end()) {
        return R::Err(MakeIoError("feature has no geometry", FeatureContext(index)));
    }
    auto line = ParseLineString(*geometry_it, index);
    if (line.IsErr()) {
        return R::Err(std::move(line).Error());
    }

    RawSegmentRecord record;
    record.geometry = std::move(line).Value();

    auto props_it = feature.find("properties");
    if (props_it != feature.end() && !props_it->is_null()) {
        if (!props_it->is_object()) {
            return R::Err(MakeIoError("feature properties must be an object",
                                      FeatureContext(index)));
        }
        for (const auto& [name, value] : props_it->items()) {
            record.fields.emplace(name, ToFieldValue(value));
        }
    }
    return R::Ok(std::move(record));
}

Result<RawSegmentBatch, Error> ParseDocument(const nlohmann::json& root) {
    using R = Result<RawSegmentBatch, Error>;

    if (!root.is_object() || root.value("type", std::string{}) != "FeatureCollection") {
        return R::Err(MakeIoError("expected a GeoJSON FeatureCollection"));
    }
    auto features_it = root.find("features");
    if (features_it == root.end() || !features_it->is_array()) {
        return R::Err(MakeIoError("FeatureCollection has no features array"));
    }

    RawSegmentBatch batch;
    auto crs = ParseCrs(root);
    if (crs.IsErr()) {
        return R::Err(std::move(crs).Error());
    }
    batch.crs = std::move(crs).Value();

    batch.records.reserve(features_it->size());
    for (std::size_t i = 0; i < features_it->size(); ++i) {
        auto record = ParseFeature((*features_it)[i], i);
        if (record.IsErr()) {
            return R::Err(std::move(record).Error());
        }
        batch.records.push_back(std::move(record).Value());
    }

    LogDebug("io", "read " + std::to_string(batch.records.size()) + " features" +
                       (batch.crs.has_value() ? ", crs " + batch.crs->Value() : std::string{}));
    return R::Ok(std::move(batch));
}

} // anonymous namespace

Result<RawSegmentBatch, Error> ParseGeoJsonBatch(std::string_view text) {
    using R = Result<RawSegmentBatch, Error>;

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        return R::Err(MakeIoError("malformed JSON: " + std::string(e.what())));
    }

    // Members of the wrong JSON type surface as type_error from value().
    try {
        return ParseDocument(root);
    } catch (const nlohmann::json::exception& e) {
        return R::Err(MakeIoError("unexpected GeoJSON member type: " + std::string(e.what())));
    }
}

Result<RawSegmentBatch, Error> ReadGeoJsonBatch(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return Result<RawSegmentBatch, Error>::Err(
            MakeIoError("cannot open input file", path)
                .WithHint("check the --input path"));
    }
    std::ostringstream content;
    content << ifs.rdbuf();

    auto batch = ParseGeoJsonBatch(content.str());
    if (batch.IsErr()) {
        auto error = std::move(batch).Error();
        error.context = error.context.empty() ? path : path + ", " + error.context;
        return Result<RawSegmentBatch, Error>::Err(std::move(error));
    }
    LogInfo("io", "loaded " + std::to_string(batch.Value().records.size()) +
                      " road segments from " + path);
    return batch;
}

} // namespace roadnet
