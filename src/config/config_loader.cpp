#include <roadnet/config/config_loader.hpp>

#include <roadnet/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <exception>
#include <string>

namespace roadnet {

namespace {

Error MakeConfigError(const std::string& message, const std::string& context = "") {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", message, context);
}

Result<CrsCode, Error> ParseCrs(const std::string& text, const std::string& source) {
    auto crs = CrsCode::Create(text);
    if (crs.IsErr()) {
        return Result<CrsCode, Error>::Err(
            MakeConfigError("Invalid " + source + ": " + crs.Error(), text));
    }
    return Result<CrsCode, Error>::Ok(std::move(crs).Value());
}

Result<KeyCollisionPolicy, Error> ParsePolicy(const std::string& text,
                                              const std::string& source) {
    auto policy = ParseKeyCollisionPolicy(text);
    if (policy.IsErr()) {
        return Result<KeyCollisionPolicy, Error>::Err(
            MakeConfigError("Invalid " + source + ": " + policy.Error(), text));
    }
    return Result<KeyCollisionPolicy, Error>::Ok(policy.Value());
}

Result<LogLevel, Error> ParseLevel(const std::string& text, const std::string& source) {
    LogLevel level = LogLevel::Warn;
    if (!ParseLogLevel(text, level)) {
        return Result<LogLevel, Error>::Err(
            MakeConfigError("Invalid " + source + ": expected debug, info, warn or error",
                            text));
    }
    return Result<LogLevel, Error>::Ok(level);
}

Result<AppConfig, Error> ParseYamlRoot(const YAML::Node& root) {
    AppConfig config;
    if (!root || root.IsNull()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Config root must be a mapping"));
    }

    try {
        // -- Input --
        if (root["input"]) {
            config.input_path = root["input"].as<std::string>();
        }
        // Scalars read as text, so `vintage: 2021` and `vintage: "2021"` agree.
        if (root["vintage"]) {
            config.vintage = root["vintage"].as<std::string>();
        }
        if (root["crs"]) {
            auto crs = ParseCrs(root["crs"].as<std::string>(), "crs");
            if (crs.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(crs).Error());
            }
            config.crs = std::move(crs).Value();
        }
        if (root["on_key_collision"]) {
            auto policy = ParsePolicy(root["on_key_collision"].as<std::string>(),
                                      "on_key_collision");
            if (policy.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(policy).Error());
            }
            config.on_key_collision = policy.Value();
        }

        // -- Options --
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_level"]) {
            auto level = ParseLevel(root["log_level"].as<std::string>(), "log_level");
            if (level.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(level).Error());
            }
            config.log_level = level.Value();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
        if (root["color"]) {
            config.color = root["color"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid config value: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what()),
                            std::string(file_path)));
    }
    return ParseYamlRoot(root);
}

Result<AppConfig, Error> LoadFromYamlString(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
    return ParseYamlRoot(root);
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("roadnet build", kVersion,
                                     argparse::default_arguments::help);
    program.add_description("Build a routable, strongly connected road graph.");

    // Input
    program.add_argument("-i", "--input")
        .help("GeoJSON FeatureCollection of road segments");
    program.add_argument("--vintage")
        .help("Source schema vintage (2017, 2021)");
    program.add_argument("--crs")
        .help("CRS of the input coordinates, e.g. EPSG:4326");
    program.add_argument("--on-collision")
        .help("Duplicate edge keys: overwrite or reject");

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Write JSON log lines to this file");
    program.add_argument("--log-level")
        .help("Minimum log level: debug, info, warn, error");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--input")) {
        config.input_path = *val;
    }
    if (auto val = program.present("--vintage")) {
        config.vintage = *val;
    }
    if (auto val = program.present("--crs")) {
        auto crs = ParseCrs(*val, "--crs");
        if (crs.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(crs).Error());
        }
        config.crs = std::move(crs).Value();
    }
    if (auto val = program.present("--on-collision")) {
        auto policy = ParsePolicy(*val, "--on-collision");
        if (policy.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(policy).Error());
        }
        config.on_key_collision = policy.Value();
    }

    if (auto val = program.present("--config")) {
        config.config_path = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLevel(*val, "--log-level");
        if (level.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(level).Error());
        }
        config.log_level = level.Value();
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("-vv")) {
        config.verbose = true;
        config.debug = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }
    if (program.get<bool>("--color") && program.get<bool>("--no-color")) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Cannot use both --color and --no-color"));
    }
    if (program.get<bool>("--color")) {
        config.color = true;
    }
    if (program.get<bool>("--no-color")) {
        config.color = false;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    if (!cli_overrides.input_path.empty()) {
        merged.input_path = cli_overrides.input_path;
    }
    if (cli_overrides.vintage.has_value()) {
        merged.vintage = cli_overrides.vintage;
    }
    if (cli_overrides.crs.has_value()) {
        merged.crs = cli_overrides.crs;
    }
    if (cli_overrides.on_key_collision.has_value()) {
        merged.on_key_collision = cli_overrides.on_key_collision;
    }
    if (cli_overrides.config_path.has_value()) {
        merged.config_path = cli_overrides.config_path;
    }

    // Options
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.debug) {
        merged.debug = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.color.has_value()) {
        merged.color = cli_overrides.color;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.log_level.has_value()) {
        merged.log_level = cli_overrides.log_level;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.input_path.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: input").WithHint(
                "pass --input FILE or set 'input' in the config file"));
    }
    if (config.vintage.has_value()) {
        auto vintage = Vintage::Create(*config.vintage);
        if (vintage.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid vintage: " + vintage.Error(), *config.vintage));
        }
    }
    if (config.log_file.has_value() && config.log_file->empty()) {
        return Result<void, Error>::Err(MakeConfigError("log_file must not be empty"));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace roadnet
