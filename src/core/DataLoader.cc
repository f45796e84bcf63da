#include "dojo/core/DataLoader.hh"

#include <sstream>

#include "dojo/core/Log.hh"

namespace dojo {

namespace {

std::string describeParseError(std::string_view source, const toml::parse_error& err) {
    std::ostringstream oss;
    oss << source << ":" << err.source().begin.line << ":" << err.source().begin.column << " - " << err.description();
    return oss.str();
}

} // namespace

Result<toml::table> parseTomlFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Result<toml::table>::error(ErrorCode::NotFound, "TOML file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        DOJO_LOG_DEBUG("Loaded TOML: {}", path.string());
        return Result<toml::table>::ok(std::move(tbl));
    } catch (const toml::parse_error& err) {
        return Result<toml::table>::error(ErrorCode::ParseError, describeParseError(path.string(), err));
    }
}

Result<toml::table> parseTomlString(std::string_view content, std::string_view sourceName) {
    try {
        return Result<toml::table>::ok(toml::parse(content, sourceName));
    } catch (const toml::parse_error& err) {
        return Result<toml::table>::error(ErrorCode::ParseError, describeParseError(sourceName, err));
    }
}

// -- DataLoader --

DataLoader::DataLoader(toml::table tbl, std::string source) : table_(std::move(tbl)), sourceName_(std::move(source)) {}

Result<DataLoader> DataLoader::load(const std::filesystem::path& path) {
    auto parsed = parseTomlFile(path);
    if (parsed.isError()) {
        return Result<DataLoader>::error(parsed.code(), parsed.message());
    }
    return Result<DataLoader>::ok(DataLoader(std::move(parsed.value()), path.string()));
}

Result<DataLoader> DataLoader::parse(std::string_view tomlContent, std::string_view sourceName) {
    auto parsed = parseTomlString(tomlContent, sourceName);
    if (parsed.isError()) {
        return Result<DataLoader>::error(parsed.code(), parsed.message());
    }
    return Result<DataLoader>::ok(DataLoader(std::move(parsed.value()), std::string(sourceName)));
}

const toml::node* DataLoader::resolve(std::string_view dottedKey) const {
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

std::string DataLoader::formatError(std::string_view key, std::string_view expected) const {
    std::ostringstream oss;
    oss << sourceName_ << ": key '" << key << "' " << expected;
    return oss.str();
}

Result<std::string> DataLoader::getString(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<std::string>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    if (auto val = node->as_string()) {
        return Result<std::string>::ok(std::string(val->get()));
    }
    return Result<std::string>::error(ErrorCode::InvalidState, formatError(key, "is not a string"));
}

Result<int64_t> DataLoader::getInt(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<int64_t>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    if (auto val = node->as_integer()) {
        return Result<int64_t>::ok(val->get());
    }
    return Result<int64_t>::error(ErrorCode::InvalidState, formatError(key, "is not an integer"));
}

Result<double> DataLoader::getFloat(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<double>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    // Accept both float and integer values for float extraction
    if (auto val = node->as_floating_point()) {
        return Result<double>::ok(val->get());
    }
    if (auto val = node->as_integer()) {
        return Result<double>::ok(static_cast<double>(val->get()));
    }
    return Result<double>::error(ErrorCode::InvalidState, formatError(key, "is not a number"));
}

Result<bool> DataLoader::getBool(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<bool>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    if (auto val = node->as_boolean()) {
        return Result<bool>::ok(val->get());
    }
    return Result<bool>::error(ErrorCode::InvalidState, formatError(key, "is not a boolean"));
}

Result<std::string> DataLoader::getStringOr(std::string_view key, std::string_view defaultValue) const {
    if (!hasKey(key))
        return Result<std::string>::ok(std::string(defaultValue));
    return getString(key);
}

Result<int64_t> DataLoader::getIntOr(std::string_view key, int64_t defaultValue) const {
    if (!hasKey(key))
        return Result<int64_t>::ok(defaultValue);
    return getInt(key);
}

Result<double> DataLoader::getFloatOr(std::string_view key, double defaultValue) const {
    if (!hasKey(key))
        return Result<double>::ok(defaultValue);
    return getFloat(key);
}

Result<bool> DataLoader::getBoolOr(std::string_view key, bool defaultValue) const {
    if (!hasKey(key))
        return Result<bool>::ok(defaultValue);
    return getBool(key);
}

const toml::array* DataLoader::getTableArray(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node)
        return nullptr;
    const auto* arr = node->as_array();
    if (!arr || !arr->is_array_of_tables())
        return nullptr;
    return arr;
}

bool DataLoader::hasKey(std::string_view key) const {
    return resolve(key) != nullptr;
}

const toml::table& DataLoader::table() const {
    return table_;
}

const std::string& DataLoader::sourceName() const {
    return sourceName_;
}

} // namespace dojo
