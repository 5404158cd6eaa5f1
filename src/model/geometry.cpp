#include <roadnet/model/geometry.hpp>

namespace roadnet {

LineString LineString::Reversed() const {
    return LineString(std::vector<Coordinate>(points_.rbegin(), points_.rend()));
}

std::ostream& operator<<(std::ostream& os, const LineString& line) {
    os << "LINESTRING(";
    for (std::size_t i = 0; i < line.points_.size(); ++i) {
        if (i > 0) os << ", ";
        os << line.points_[i].x << ' ' << line.points_[i].y;
    }
    return os << ')';
}

} // namespace roadnet
