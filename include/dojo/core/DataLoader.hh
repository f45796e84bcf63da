#pragma once

#include "dojo/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace dojo {

// Parses a TOML file from disk and returns the root table.
// Error messages include the file path and toml++ source location on failure.
Result<toml::table> parseTomlFile(const std::filesystem::path& path);

// Parses a TOML string (useful for testing without disk I/O).
Result<toml::table> parseTomlString(std::string_view content, std::string_view sourceName = "string");

// Read-only view over a parsed TOML document with dotted-key lookup
// ("fighter.walk_speed"). Typed getters report NotFound for absent keys and
// InvalidState on type mismatch; the *Or variants only fail on mismatch.
class DataLoader {
  public:
    static Result<DataLoader> load(const std::filesystem::path& path);
    static Result<DataLoader> parse(std::string_view tomlContent, std::string_view sourceName = "string");

    Result<std::string> getString(std::string_view key) const;
    Result<int64_t> getInt(std::string_view key) const;
    Result<double> getFloat(std::string_view key) const;
    Result<bool> getBool(std::string_view key) const;

    Result<std::string> getStringOr(std::string_view key, std::string_view defaultValue) const;
    Result<int64_t> getIntOr(std::string_view key, int64_t defaultValue) const;
    Result<double> getFloatOr(std::string_view key, double defaultValue) const;
    Result<bool> getBoolOr(std::string_view key, bool defaultValue) const;

    // Array of tables ([[key]]); nullptr when absent or of another type.
    const toml::array* getTableArray(std::string_view key) const;

    bool hasKey(std::string_view key) const;

    const toml::table& table() const;
    const std::string& sourceName() const;

  private:
    DataLoader(toml::table tbl, std::string source);

    const toml::node* resolve(std::string_view dottedKey) const;
    std::string formatError(std::string_view key, std::string_view expected) const;

    toml::table table_;
    std::string sourceName_;
};

} // namespace dojo
