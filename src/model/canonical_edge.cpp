#include <roadnet/model/canonical_edge.hpp>

namespace roadnet {

std::string_view DirectionName(Direction direction) noexcept {
    switch (direction) {
        case Direction::Forward:  return "forward";
        case Direction::Backward: return "backward";
        case Direction::Both:     return "both";
    }
    return "both";
}

} // namespace roadnet
