#include "Config.hpp"
#include "Log.hpp"

#include <sstream>

namespace verdant {

Config::Config(toml::table&& root) : m_Root(std::move(root)) {}

Result<Config, String> Config::Load(const std::filesystem::path& filePath) {
    if (!std::filesystem::exists(filePath)) {
        return Result<Config, String>::Err("Config file not found: " + filePath.string());
    }

    try {
        toml::table table = toml::parse_file(filePath.string());
        VD_LOG_INFO("Loaded configuration from: {}", filePath.string());
        return Config(std::move(table));
    }
    catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "TOML parse error: " << err.description()
            << " at line " << err.source().begin.line
            << ", column " << err.source().begin.column;
        return Result<Config, String>::Err(oss.str());
    }
    catch (const std::exception& ex) {
        return Result<Config, String>::Err(String("Failed to load config: ") + ex.what());
    }
}

Result<Config, String> Config::Parse(StringView content, StringView sourceName) {
    try {
        toml::table table = toml::parse(content, sourceName);
        return Config(std::move(table));
    }
    catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "TOML parse error in " << sourceName << ": " << err.description()
            << " at line " << err.source().begin.line
            << ", column " << err.source().begin.column;
        return Result<Config, String>::Err(oss.str());
    }
}

bool Config::Has(StringView key) const {
    return Navigate(key) != nullptr;
}

Result<Config, String> Config::GetTable(StringView key) const {
    const toml::node* node = Navigate(key);
    if (!node) {
        return Result<Config, String>::Err("Table not found: " + String(key));
    }

    if (!node->is_table()) {
        return Result<Config, String>::Err("Key is not a table: " + String(key));
    }

    toml::table clonedTable = *node->as_table();
    return Config(std::move(clonedTable));
}

Vector<Config> Config::GetTableArray(StringView key) const {
    Vector<Config> tables;
    const toml::node* node = Navigate(key);
    if (!node || !node->is_array_of_tables()) {
        return tables;
    }

    for (const auto& elem : *node->as_array()) {
        toml::table clonedTable = *elem.as_table();
        tables.push_back(Config(std::move(clonedTable)));
    }
    return tables;
}

void Config::Print() const {
    std::ostringstream oss;
    oss << m_Root;
    VD_LOG_INFO("Configuration:\n{}", oss.str());
}

const toml::node* Config::Navigate(StringView key) const {
    // Split key by '.' and traverse the hierarchy
    const toml::node* current = &m_Root;
    usize start = 0;

    while (start < key.size()) {
        usize end = key.find('.', start);
        if (end == StringView::npos) {
            end = key.size();
        }

        StringView segment = key.substr(start, end - start);

        if (const toml::table* table = current->as_table()) {
            const toml::node* next = table->get(segment);
            if (!next) {
                return nullptr;
            }
            current = next;
        } else {
            return nullptr;
        }

        start = end + 1;
    }

    return current;
}

} // namespace verdant
