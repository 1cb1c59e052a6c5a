#include "chroma/core/ConfigLoader.hh"

#include "chroma/core/Log.hh"

#include <limits>
#include <sstream>

namespace chroma {

ConfigLoader::ConfigLoader(toml::table tbl, std::string source)
    : table_(std::move(tbl)), sourceName_(std::move(source)) {}

Result<ConfigLoader> ConfigLoader::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Result<ConfigLoader>::error(ErrorCode::NotFound, "TOML file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        CHROMA_LOG_DEBUG("Loaded TOML: {}", path.string());
        return Result<ConfigLoader>::ok(ConfigLoader(std::move(tbl), path.string()));
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << path.string() << ":" << err.source().begin.line << ":" << err.source().begin.column << " - "
            << err.description();
        return Result<ConfigLoader>::error(ErrorCode::InvalidConfiguration, oss.str());
    }
}

Result<ConfigLoader> ConfigLoader::parse(std::string_view tomlContent, std::string_view sourceName) {
    try {
        auto tbl = toml::parse(tomlContent, sourceName);
        return Result<ConfigLoader>::ok(ConfigLoader(std::move(tbl), std::string(sourceName)));
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << sourceName << ":" << err.source().begin.line << ":" << err.source().begin.column << " - "
            << err.description();
        return Result<ConfigLoader>::error(ErrorCode::InvalidConfiguration, oss.str());
    }
}

const toml::node* ConfigLoader::resolve(std::string_view dottedKey) const {
    const toml::node* current = &table_;
    std::string_view remaining = dottedKey;

    while (!remaining.empty()) {
        auto dot = remaining.find('.');
        std::string_view segment = (dot == std::string_view::npos) ? remaining : remaining.substr(0, dot);

        if (!current->is_table()) {
            return nullptr;
        }
        current = current->as_table()->get(segment);
        if (!current) {
            return nullptr;
        }

        if (dot == std::string_view::npos) {
            break;
        }
        remaining = remaining.substr(dot + 1);
    }
    return current;
}

std::string ConfigLoader::formatError(std::string_view key, std::string_view expected) const {
    std::ostringstream oss;
    oss << sourceName_ << ": key '" << key << "' " << expected;
    return oss.str();
}

Result<std::string> ConfigLoader::getString(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<std::string>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    if (auto val = node->as_string()) {
        return Result<std::string>::ok(std::string(val->get()));
    }
    return Result<std::string>::error(ErrorCode::InvalidConfiguration, formatError(key, "is not a string"));
}

Result<int64_t> ConfigLoader::getInt(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<int64_t>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    if (auto val = node->as_integer()) {
        return Result<int64_t>::ok(val->get());
    }
    return Result<int64_t>::error(ErrorCode::InvalidConfiguration, formatError(key, "is not an integer"));
}

bool ConfigLoader::hasKey(std::string_view key) const {
    return resolve(key) != nullptr;
}

const std::string& ConfigLoader::sourceName() const {
    return sourceName_;
}

namespace {

// Integer key that must fit in an int. Absent keys leave `out` untouched.
Result<void> readIntKey(const ConfigLoader& loader, std::string_view key, int& out) {
    if (!loader.hasKey(key))
        return Result<void>::ok();
    auto value = loader.getInt(key);
    if (value.isError())
        return Result<void>::error(value.code(), value.message());
    if (value.value() < std::numeric_limits<int>::min() || value.value() > std::numeric_limits<int>::max()) {
        return Result<void>::error(ErrorCode::InvalidConfiguration,
                                   loader.sourceName() + ": key '" + std::string(key) + "' is out of range");
    }
    out = static_cast<int>(value.value());
    return Result<void>::ok();
}

} // namespace

Result<QuantizerConfig> readQuantizerConfig(const ConfigLoader& loader) {
    QuantizerConfig config;

    auto depth = readIntKey(loader, "quantizer.max_depth", config.maxDepth);
    if (depth.isError())
        return Result<QuantizerConfig>::error(depth.code(), depth.message());

    auto size = readIntKey(loader, "quantizer.palette_size", config.paletteSize);
    if (size.isError())
        return Result<QuantizerConfig>::error(size.code(), size.message());

    if (loader.hasKey("quantizer.lookup")) {
        auto name = loader.getString("quantizer.lookup");
        if (name.isError())
            return Result<QuantizerConfig>::error(name.code(), name.message());
        auto strategy = parseLookupStrategy(name.value());
        if (!strategy) {
            return Result<QuantizerConfig>::error(ErrorCode::InvalidConfiguration,
                                                  loader.sourceName() + ": unknown lookup strategy '" + name.value() +
                                                      "'");
        }
        config.lookup = *strategy;
    }

    if (loader.hasKey("log.level")) {
        auto level = loader.getString("log.level");
        if (level.isError())
            return Result<QuantizerConfig>::error(level.code(), level.message());
        config.logLevel = level.value();
    }

    auto valid = config.validate();
    if (valid.isError()) {
        return Result<QuantizerConfig>::error(valid.code(), loader.sourceName() + ": " + valid.message());
    }
    return Result<QuantizerConfig>::ok(std::move(config));
}

Result<QuantizerConfig> loadQuantizerConfig(const std::filesystem::path& path) {
    auto loader = ConfigLoader::load(path);
    if (loader.isError()) {
        return Result<QuantizerConfig>::error(loader.code(), loader.message());
    }
    return readQuantizerConfig(loader.value());
}

} // namespace chroma
