#pragma once

#include "Platform.hpp"
#include "Types.hpp"

VD_DISABLE_WARNINGS_PUSH
#include <toml++/toml.h>
VD_DISABLE_WARNINGS_POP

#include <filesystem>
#include <type_traits>

// ============================================================================
// Configuration Loader (TOML)
// Parse TOML configuration files and look up values by dot-separated path
// ============================================================================

namespace verdant {

template<typename T>
inline constexpr bool kDependentFalse = false;

/// Configuration tree (reads TOML files)
class VD_API Config {
public:
    /// Load a TOML configuration file
    /// @param filePath Path to the .toml file
    /// @return Result containing parsed config or error
    static Result<Config, String> Load(const std::filesystem::path& filePath);

    /// Parse TOML text held in memory
    /// @param content TOML document
    /// @param sourceName Name used in error messages
    static Result<Config, String> Parse(StringView content, StringView sourceName = "<memory>");

    /// Create an empty configuration
    Config() = default;

    /// Check if a key exists in the configuration
    /// @param key Dot-separated key path (e.g., "query.max_cloud")
    bool Has(StringView key) const;

    /// Get a value from the configuration (with optional default)
    /// @tparam T Expected value type (i32, i64, u32, f32, f64, String, bool)
    /// @param key Dot-separated key path
    /// @param defaultValue Fallback value if key is missing or of another type
    template<typename T>
    T Get(StringView key, const T& defaultValue = T{}) const;

    /// Get a value, reporting a missing key or wrong type as an error
    template<typename T>
    Result<T, String> GetRequired(StringView key) const;

    /// Get a nested table as a Config object
    Result<Config, String> GetTable(StringView key) const;

    /// Get an array of values (elements of another type are skipped)
    template<typename T>
    Vector<T> GetArray(StringView key) const;

    /// Get an array of tables (e.g. [[scenes]])
    Vector<Config> GetTableArray(StringView key) const;

    /// Access the underlying toml::table
    const toml::table& GetRoot() const { return m_Root; }

    /// Log the entire config at info level
    void Print() const;

private:
    explicit Config(toml::table&& root);

    template<typename T>
    static Optional<T> Convert(const toml::node& node);

    toml::table m_Root;

    /// Navigate to a nested node by dot-separated path
    const toml::node* Navigate(StringView key) const;
};

// ============================================================================
// Template Implementation
// ============================================================================

template<typename T>
Optional<T> Config::Convert(const toml::node& node) {
    if constexpr (std::is_same_v<T, String>) {
        if (auto val = node.value<std::string>()) {
            return *val;
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (auto val = node.value<bool>()) {
            return *val;
        }
    } else if constexpr (std::is_same_v<T, i32> || std::is_same_v<T, i64> ||
                         std::is_same_v<T, u32> || std::is_same_v<T, u64>) {
        if (auto val = node.value<int64_t>()) {
            if constexpr (std::is_unsigned_v<T>) {
                if (*val < 0) {
                    return std::nullopt;
                }
            }
            return static_cast<T>(*val);
        }
    } else if constexpr (std::is_same_v<T, f32> || std::is_same_v<T, f64>) {
        // toml++ converts integer nodes to double losslessly
        if (auto val = node.value<double>()) {
            return static_cast<T>(*val);
        }
    } else {
        static_assert(kDependentFalse<T>, "Unsupported config value type");
    }
    return std::nullopt;
}

template<typename T>
T Config::Get(StringView key, const T& defaultValue) const {
    const toml::node* node = Navigate(key);
    if (!node) {
        return defaultValue;
    }

    if (auto val = Convert<T>(*node)) {
        return *val;
    }
    return defaultValue;
}

template<typename T>
Result<T, String> Config::GetRequired(StringView key) const {
    const toml::node* node = Navigate(key);
    if (!node) {
        return typename Result<T, String>::Err("Missing required key: " + String(key));
    }

    if (auto val = Convert<T>(*node)) {
        return std::move(*val);
    }
    return typename Result<T, String>::Err("Type mismatch for key: " + String(key));
}

template<typename T>
Vector<T> Config::GetArray(StringView key) const {
    const toml::node* node = Navigate(key);
    Vector<T> result;

    if (!node || !node->is_array()) {
        return result;
    }

    const toml::array* arr = node->as_array();
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        if (auto val = Convert<T>(elem)) {
            result.push_back(*val);
        }
    }

    return result;
}

} // namespace verdant
