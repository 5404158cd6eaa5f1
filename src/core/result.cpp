#include <roadnet/core/result.hpp>

#include <iomanip>
#include <sstream>

namespace roadnet {

void JsonEscape(std::ostream& out, std::string_view s) {
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::UnsupportedVintage: return 2;
        case ErrorCategory::SchemaError:        return 3;
        case ErrorCategory::EmptyInput:         return 4;
        case ErrorCategory::NotRoutable:        return 5;
        case ErrorCategory::KeyCollision:       return 6;
        case ErrorCategory::Config:             return 7;
        case ErrorCategory::Io:                 return 8;
        case ErrorCategory::Internal:           return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::UnsupportedVintage: return "unsupported_vintage";
        case ErrorCategory::SchemaError:        return "schema";
        case ErrorCategory::EmptyInput:         return "empty_input";
        case ErrorCategory::NotRoutable:        return "not_routable";
        case ErrorCategory::KeyCollision:       return "key_collision";
        case ErrorCategory::Config:             return "config";
        case ErrorCategory::Io:                 return "io";
        case ErrorCategory::Internal:           return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!context.empty()) {
        oss << " [" << context << "]";
    }
    oss << ": " << message;
    if (hint.has_value() && !hint->empty()) {
        oss << " (hint: " << *hint << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    std::ostringstream oss;
    oss << R"({"error":{)";
    oss << R"("category":")" << CategoryName() << R"(",)";
    oss << R"("operation":")";
    JsonEscape(oss, operation);
    oss << R"(",)";
    if (!context.empty()) {
        oss << R"("context":")";
        JsonEscape(oss, context);
        oss << R"(",)";
    }
    oss << R"("message":")";
    JsonEscape(oss, message);
    oss << R"(",)";
    if (hint.has_value() && !hint->empty()) {
        oss << R"("hint":")";
        JsonEscape(oss, *hint);
        oss << R"(",)";
    }
    oss << R"("exit_code":)" << ExitCode();
    oss << R"(}})";
    return oss.str();
}

} // namespace roadnet
