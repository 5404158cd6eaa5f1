#include <roadnet/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace roadnet {

namespace {

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

bool IsTagChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           c == '_' || c == '-' || c == '.';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Vintage
// ---------------------------------------------------------------------------
Result<Vintage, std::string> Vintage::Create(std::string_view tag) {
    auto trimmed = Trim(tag);
    if (trimmed.empty()) {
        return Result<Vintage, std::string>::Err("Vintage tag must not be empty");
    }
    if (trimmed.size() > 16) {
        return Result<Vintage, std::string>::Err(
            "Vintage tag must be at most 16 characters, got " +
            std::to_string(trimmed.size()));
    }
    if (!std::all_of(trimmed.begin(), trimmed.end(), IsTagChar)) {
        return Result<Vintage, std::string>::Err(
            "Vintage tag must contain only letters, digits, '_', '-' or '.'");
    }
    return Result<Vintage, std::string>::Ok(Vintage(std::string(trimmed)));
}

Result<Vintage, std::string> Vintage::FromYear(int year) {
    if (year <= 0) {
        return Result<Vintage, std::string>::Err(
            "Vintage year must be positive, got " + std::to_string(year));
    }
    return Create(std::to_string(year));
}

// ---------------------------------------------------------------------------
// CrsCode
// ---------------------------------------------------------------------------
Result<CrsCode, std::string> CrsCode::Create(std::string_view code) {
    auto trimmed = Trim(code);
    auto colon = trimmed.find(':');
    if (colon == std::string_view::npos) {
        return Result<CrsCode, std::string>::Err(
            "CRS must have the form AUTHORITY:CODE (e.g. EPSG:4326)");
    }
    auto authority = trimmed.substr(0, colon);
    auto identifier = trimmed.substr(colon + 1);
    if (authority.empty() || identifier.empty()) {
        return Result<CrsCode, std::string>::Err(
            "CRS authority and code must both be non-empty");
    }
    if (!std::all_of(authority.begin(), authority.end(), [](char c) {
            return std::isalpha(static_cast<unsigned char>(c)) != 0;
        })) {
        return Result<CrsCode, std::string>::Err(
            "CRS authority must contain only letters");
    }
    if (!std::all_of(identifier.begin(), identifier.end(), IsTagChar)) {
        return Result<CrsCode, std::string>::Err(
            "CRS code must contain only letters, digits, '_', '-' or '.'");
    }

    std::string value(authority);
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    value += ':';
    value += identifier;
    return Result<CrsCode, std::string>::Ok(CrsCode(std::move(value)));
}

CrsCode CrsCode::LatLon() {
    return CrsCode("EPSG:4326");
}

// ---------------------------------------------------------------------------
// RoadId
// ---------------------------------------------------------------------------
std::string RoadId::ToString() const {
    if (IsInteger()) {
        return std::to_string(AsInteger());
    }
    return AsString();
}

} // namespace roadnet
