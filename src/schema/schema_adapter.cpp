#include <roadnet/schema/schema_adapter.hpp>

#include <roadnet/core/log.hpp>
#include <roadnet/schema/tomtom_2017_adapter.hpp>
#include <roadnet/schema/tomtom_2021_adapter.hpp>

#include <sstream>

namespace roadnet {

namespace {

std::string JoinTags(const std::vector<std::string>& tags) {
    std::ostringstream oss;
    for (size_t i = 0; i < tags.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "'" << tags[i] << "'";
    }
    return oss.str();
}

} // anonymous namespace

SchemaAdapterRegistry SchemaAdapterRegistry::WithBuiltinAdapters() {
    std::vector<std::unique_ptr<ISchemaAdapter>> builtins;
    builtins.push_back(std::make_unique<TomTom2017Adapter>());
    builtins.push_back(std::make_unique<TomTom2021Adapter>());

    SchemaAdapterRegistry registry;
    for (auto& adapter : builtins) {
        std::string tag(adapter->Tag());
        registry.adapters_.emplace(std::move(tag), std::move(adapter));
    }
    return registry;
}

Result<void, Error> SchemaAdapterRegistry::Register(
    std::unique_ptr<ISchemaAdapter> adapter) {
    if (!adapter) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Internal, "RegisterSchemaAdapter",
            "adapter must not be null"));
    }
    std::string tag(adapter->Tag());
    if (adapters_.count(tag) > 0) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Internal, "RegisterSchemaAdapter",
            "an adapter is already registered for this vintage", "vintage " + tag));
    }
    adapters_.emplace(std::move(tag), std::move(adapter));
    return Result<void, Error>::Ok();
}

const ISchemaAdapter* SchemaAdapterRegistry::Find(const Vintage& vintage) const {
    auto it = adapters_.find(vintage.Value());
    return it == adapters_.end() ? nullptr : it->second.get();
}

std::vector<std::string> SchemaAdapterRegistry::Tags() const {
    std::vector<std::string> tags;
    tags.reserve(adapters_.size());
    for (const auto& [tag, adapter] : adapters_) {
        tags.push_back(tag);
    }
    return tags;
}

Result<NormalizeResult, Error> Normalize(
    const SchemaAdapterRegistry& registry,
    const std::vector<RawSegmentRecord>& records,
    std::string_view vintage_tag) {
    auto unsupported = [&](const std::string& why) {
        return Result<NormalizeResult, Error>::Err(
            Error::Make(ErrorCategory::UnsupportedVintage, "Normalize", why,
                        "vintage '" + std::string(vintage_tag) + "'")
                .WithHint("supported vintages: " + JoinTags(registry.Tags())));
    };

    auto vintage = Vintage::Create(vintage_tag);
    if (vintage.IsErr()) {
        return unsupported(vintage.Error());
    }

    const auto* adapter = registry.Find(vintage.Value());
    if (adapter == nullptr) {
        return unsupported("vintage is not supported");
    }

    LogDebug("schema", "normalizing " + std::to_string(records.size()) +
                           " records with " + std::string(adapter->Description()));
    return adapter->Normalize(records);
}

Result<NormalizeResult, Error> Normalize(
    const SchemaAdapterRegistry& registry,
    const std::vector<RawSegmentRecord>& records,
    int vintage_year) {
    auto vintage = Vintage::FromYear(vintage_year);
    if (vintage.IsErr()) {
        return Result<NormalizeResult, Error>::Err(
            Error::Make(ErrorCategory::UnsupportedVintage, "Normalize", vintage.Error(),
                        "vintage " + std::to_string(vintage_year))
                .WithHint("supported vintages: " + JoinTags(registry.Tags())));
    }
    return Normalize(registry, records, vintage.Value().Value());
}

} // namespace roadnet
