#include <roadnet/graph/directed_edge.hpp>

namespace roadnet {

std::string EdgeKey::ToString() const {
    if (orientation == EdgeOrientation::Reverse) {
        return road_id.ToString() + ":rev";
    }
    return road_id.ToString();
}

std::optional<AttributeValue> EdgeAttributes::Lookup(std::string_view name) const {
    if (name == kKilometersAttribute) return AttributeValue(distance_km);
    if (name == kMinutesAttribute) return AttributeValue(minutes);
    if (name == kGeometryAttribute) return AttributeValue(geometry);
    if (name == kRoadIdAttribute) return AttributeValue(road_id);
    return std::nullopt;
}

const std::vector<std::string>& EdgeAttributes::Names() {
    static const std::vector<std::string> names = {
        kKilometersAttribute, kMinutesAttribute, kGeometryAttribute, kRoadIdAttribute};
    return names;
}

std::string EdgeId::ToString() const {
    return std::to_string(from) + "->" + std::to_string(to) + " [" + key.ToString() + "]";
}

} // namespace roadnet
