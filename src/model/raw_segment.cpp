#include <roadnet/model/raw_segment.hpp>

#include <sstream>

namespace roadnet {

std::string FieldValue::ToString() const {
    if (IsNull()) {
        return "null";
    }
    if (IsInteger()) {
        return std::to_string(AsInteger());
    }
    if (IsReal()) {
        std::ostringstream oss;
        oss << AsReal();
        return oss.str();
    }
    return "\"" + AsText() + "\"";
}

} // namespace roadnet
