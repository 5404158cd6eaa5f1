#include <roadnet/graph/metadata_tagger.hpp>

#include <roadnet/core/log.hpp>

#include <string>
#include <variant>

namespace roadnet {

namespace {

constexpr const char* kOperation = "TagGraph";

// Check attribute kinds on a default edge; only the variant index matters.
template <typename T>
Result<void, Error> CheckKey(const std::string& role, const std::string& key) {
    const EdgeAttributes sample;
    auto value = sample.Lookup(key);
    if (!value.has_value()) {
        return Result<void, Error>::Err(
            Error::Make(ErrorCategory::Internal, kOperation,
                        role + " key '" + key + "' is not an edge attribute"));
    }
    if (!std::holds_alternative<T>(*value)) {
        return Result<void, Error>::Err(
            Error::Make(ErrorCategory::Internal, kOperation,
                        role + " key '" + key + "' names an attribute of the wrong kind"));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

GraphMetadata DefaultMetadata(CrsCode crs) {
    GraphMetadata metadata;
    metadata.crs = std::move(crs);
    return metadata;
}

Result<void, Error> ValidateMetadata(const GraphMetadata& metadata) {
    if (auto r = CheckKey<double>("distance", metadata.distance_key); r.IsErr()) return r;
    if (auto r = CheckKey<double>("travel time", metadata.time_key); r.IsErr()) return r;
    if (auto r = CheckKey<LineString>("geometry", metadata.geometry_key); r.IsErr()) return r;
    if (auto r = CheckKey<RoadId>("road id", metadata.road_id_key); r.IsErr()) return r;
    return Result<void, Error>::Ok();
}

Result<Graph, Error> TagGraph(Graph graph, const GraphMetadata& metadata) {
    if (auto valid = ValidateMetadata(metadata); valid.IsErr()) {
        return Result<Graph, Error>::Err(std::move(valid).Error());
    }
    LogDebug("graph", "tagging graph: crs=" + metadata.crs.Value() +
                          " distance=" + metadata.distance_key +
                          " time=" + metadata.time_key);
    return Result<Graph, Error>::Ok(std::move(graph).WithMetadata(metadata));
}

} // namespace roadnet
