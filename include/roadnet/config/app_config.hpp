#pragma once

#include <roadnet/core/log.hpp>
#include <roadnet/core/types.hpp>
#include <roadnet/graph/graph_builder.hpp>

#include <optional>
#include <string>

namespace roadnet {

constexpr const char* kDefaultVintage = "2021";

struct AppConfig {
    std::string input_path;
    std::optional<std::string> vintage;  // kDefaultVintage when unset
    std::optional<CrsCode> crs;
    std::optional<KeyCollisionPolicy> on_key_collision;  // Overwrite when unset
    std::optional<std::string> config_path;  // -c/--config, CLI only
    std::optional<std::string> log_file;
    std::optional<LogLevel> log_level;  // -v / -vv / -q take precedence
    bool json_output = false;
    bool verbose = false;
    bool debug = false;  // -vv
    bool quiet = false;
    std::optional<bool> color;  // nullopt: decide from the terminal

    [[nodiscard]] std::string VintageOrDefault() const {
        return vintage.value_or(kDefaultVintage);
    }
    [[nodiscard]] KeyCollisionPolicy CollisionPolicyOrDefault() const {
        return on_key_collision.value_or(KeyCollisionPolicy::Overwrite);
    }
};

} // namespace roadnet
