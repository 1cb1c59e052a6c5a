#pragma once

#include "chroma/core/QuantizerConfig.hh"
#include "chroma/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace chroma {

// Parsed TOML document with typed, dotted-key accessors ("quantizer.max_depth").
// Getters return NotFound for absent keys and InvalidConfiguration on type
// mismatch;
// messages are prefixed with the source name.
class ConfigLoader {
  public:
    static Result<ConfigLoader> load(const std::filesystem::path& path);
    static Result<ConfigLoader> parse(std::string_view tomlContent, std::string_view sourceName = "string");

    Result<std::string> getString(std::string_view key) const;
    Result<int64_t> getInt(std::string_view key) const;

    bool hasKey(std::string_view key) const;

    const std::string& sourceName() const;

  private:
    ConfigLoader(toml::table tbl, std::string source);

    const toml::node* resolve(std::string_view dottedKey) const;
    std::string formatError(std::string_view key, std::string_view expected) const;

    toml::table table_;
    std::string sourceName_;
};

// Reads the [quantizer] and [log] tables. Absent keys keep their defaults;
// the result is validated before it is returned.
Result<QuantizerConfig> readQuantizerConfig(const ConfigLoader& loader);

Result<QuantizerConfig> loadQuantizerConfig(const std::filesystem::path& path);

} // namespace chroma
