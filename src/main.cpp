#include <roadnet/cli/build_report.hpp>
#include <roadnet/cli/output_formatter.hpp>
#include <roadnet/config/config_loader.hpp>
#include <roadnet/core/ansi.hpp>
#include <roadnet/core/log.hpp>
#include <roadnet/core/terminal.hpp>
#include <roadnet/core/version.hpp>
#include <roadnet/io/geojson_reader.hpp>
#include <roadnet/schema/schema_adapter.hpp>
#include <roadnet/workflow/graph_build_workflow.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;

// Resolve color mode for help output (stdout-based, before config parsing).
bool ResolveColorForHelp(int argc, const char* const* argv) {
    std::optional<bool> choice;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--color") choice = true;
        if (arg == "--no-color") choice = false;
    }
    return roadnet::ResolveColor(choice, roadnet::IsStdoutTty());
}

void PrintTopLevelHelp(std::ostream& out, bool color) {
    using namespace roadnet::ansi;
    const char* bold = color ? kBold : "";
    const char* reset = color ? kReset : "";
    out << bold << "roadnet" << reset << " " << roadnet::kVersion
        << " - routable road graph construction\n\n"
        << bold << "Usage:" << reset << "\n"
        << "  roadnet build --input FILE [--vintage 2017|2021] [options]\n"
        << "  roadnet --version\n\n"
        << bold << "Build options:" << reset << "\n"
        << "  -i, --input FILE        GeoJSON FeatureCollection of road segments\n"
        << "  --vintage TAG           Source schema vintage (default 2021)\n"
        << "  --crs CODE              CRS of the input, e.g. EPSG:4326\n"
        << "  --on-collision POLICY   overwrite (default) or reject duplicate edge keys\n"
        << "  -c, --config FILE       YAML config file (command line wins)\n"
        << "  --json                  JSON output\n"
        << "  --log-file FILE         Also write JSON log lines to FILE\n"
        << "  --log-level LEVEL       debug, info, warn (default) or error\n"
        << "  -v, -vv, -q             Verbose, debug or quiet output\n"
        << "  --color, --no-color     Force or disable colored output\n";
}

// Check for --version / --help before the subcommand.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "roadnet " << roadnet::kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

bool HandleHelpFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--help" || arg == "-h") {
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

roadnet::LogLevel LogLevelFor(const roadnet::AppConfig& config) {
    if (config.debug) return roadnet::LogLevel::Debug;
    if (config.verbose) return roadnet::LogLevel::Info;
    if (config.quiet) return roadnet::LogLevel::Error;
    return config.log_level.value_or(roadnet::LogLevel::Warn);
}

// Console sink on stderr, plus a JSON file sink when log_file is set.
roadnet::Result<void, roadnet::Error> InitLogging(const roadnet::AppConfig& config) {
    using namespace roadnet;
    const bool use_color = ResolveColor(config.color, IsStderrTty());
    auto console = std::make_unique<ColorConsoleSink>(use_color);

    if (!config.log_file.has_value()) {
        InitGlobalLogger(std::move(console), LogLevelFor(config));
        return Result<void, Error>::Ok();
    }

    auto file = std::make_unique<JsonFileSink>(*config.log_file);
    if (!file->IsOpen()) {
        return Result<void, Error>::Err(
            Error::Make(ErrorCategory::Io, "InitLogging", "cannot open log file",
                        *config.log_file));
    }
    std::vector<std::unique_ptr<ILogSink>> sinks;
    sinks.push_back(std::move(console));
    sinks.push_back(std::move(file));
    InitGlobalLogger(std::make_unique<TeeSink>(std::move(sinks)), LogLevelFor(config));
    return Result<void, Error>::Ok();
}

// Drop the subcommand so the build parser sees only flags.
std::vector<const char*> StripSubcommand(int argc, const char* const* argv) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 2; i < argc; ++i) {
        stripped.push_back(argv[i]);
    }
    return stripped;
}

bool WantsJson(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") return true;
    }
    return false;
}

} // namespace

int main(int argc, const char* argv[]) {
    using namespace roadnet;

    if (argc == 1 || HandleHelpFlag(argc, argv)) {
        PrintTopLevelHelp(std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }
    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    const bool early_json = WantsJson(argc, argv);
    if (std::string_view{argv[1]} != "build") {
        OutputFormatter formatter(early_json);
        auto error = Error::Make(ErrorCategory::Config, "roadnet",
                                 "unknown command '" + std::string(argv[1]) + "'")
                         .WithHint("run 'roadnet --help' for usage");
        formatter.PrintError(error);
        return error.ExitCode();
    }

    // Step 1: Parse CLI args.
    auto stripped = StripSubcommand(argc, argv);
    auto cli_result = LoadFromCli(static_cast<int>(stripped.size()), stripped.data());
    if (cli_result.IsErr()) {
        OutputFormatter formatter(early_json);
        formatter.PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    auto cli_config = std::move(cli_result).Value();

    // Step 2: Load YAML config if -c/--config was given, merge with CLI.
    AppConfig config;
    if (cli_config.config_path.has_value()) {
        auto yaml_result = LoadFromYaml(*cli_config.config_path);
        if (yaml_result.IsErr()) {
            OutputFormatter formatter(cli_config.json_output);
            formatter.PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), cli_config);
    } else {
        config = std::move(cli_config);
    }

    OutputFormatter formatter(config.json_output, ResolveColor(config.color, IsStdoutTty()));

    // Step 3: Validate config.
    if (auto valid = ValidateConfig(config); valid.IsErr()) {
        formatter.PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    // Step 4: Logging.
    if (auto logging = InitLogging(config); logging.IsErr()) {
        formatter.PrintError(logging.Error());
        return logging.Error().ExitCode();
    }
    LogDebug("main", std::string("roadnet ") + kVersion + ", vintage " +
                         config.VintageOrDefault() + ", input " + config.input_path);

    // Step 5: Read the record batch.
    auto batch = ReadGeoJsonBatch(config.input_path);
    if (batch.IsErr()) {
        formatter.PrintError(batch.Error());
        return batch.Error().ExitCode();
    }

    // Step 6: Run the pipeline.
    GraphBuildOptions options;
    options.vintage = config.VintageOrDefault();
    options.crs = config.crs;
    options.on_key_collision = config.CollisionPolicyOrDefault();

    const auto registry = SchemaAdapterRegistry::WithBuiltinAdapters();
    GraphBuildWorkflow workflow(registry, options);
    auto result = workflow.Run(batch.Value());

    // Step 7: Output results and return exit code.
    if (result.IsErr()) {
        if (!config.quiet) {
            PrintFailedSteps(formatter, workflow.Steps());
        }
        formatter.PrintError(result.Error());
        return result.Error().ExitCode();
    }

    PrintBuildReport(formatter, result.Value(), config.quiet);
    return kExitSuccess;
}
