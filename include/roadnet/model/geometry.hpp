#pragma once

#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <vector>

namespace roadnet {

struct Coordinate {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Coordinate& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Coordinate& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// LineString — ordered coordinate sequence of a road segment.
//
// No topological validation beyond what expansion needs: the adapters only
// require at least two points so that both endpoints exist.
// ---------------------------------------------------------------------------
class LineString {
public:
    LineString() = default;
    explicit LineString(std::vector<Coordinate> points) : points_(std::move(points)) {}
    LineString(std::initializer_list<Coordinate> points) : points_(points) {}

    [[nodiscard]] const std::vector<Coordinate>& Points() const noexcept { return points_; }
    [[nodiscard]] std::size_t Size() const noexcept { return points_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return points_.empty(); }

    // Precondition: !Empty().
    [[nodiscard]] const Coordinate& Front() const { return points_.front(); }
    [[nodiscard]] const Coordinate& Back() const { return points_.back(); }

    /// Same points in the opposite order.
    [[nodiscard]] LineString Reversed() const;

    bool operator==(const LineString& other) const { return points_ == other.points_; }
    bool operator!=(const LineString& other) const { return points_ != other.points_; }

    friend std::ostream& operator<<(std::ostream& os, const LineString& line);

private:
    std::vector<Coordinate> points_;
};

} // namespace roadnet
