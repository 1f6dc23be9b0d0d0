#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <span>
#include <array>
#include <vector>
#include <memory>
#include <optional>
#include <variant>
#include <concepts>

// ============================================================================
// Fundamental Type Aliases & C++20 Utilities
// ============================================================================

namespace verdant {

// ============================================================================
// Integer Types (explicit width)
// ============================================================================
using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using usize = std::size_t;
using isize = std::ptrdiff_t;

// ============================================================================
// Floating-Point Types
// ============================================================================
using f32 = float;
using f64 = double;

// ============================================================================
// String Types
// ============================================================================
using String = std::string;
using StringView = std::string_view;

// ============================================================================
// Container Type Aliases
// ============================================================================
template<typename T>
using Span = std::span<T>;

template<typename T, usize N>
using Array = std::array<T, N>;

template<typename T>
using Vector = std::vector<T>;

template<typename T>
using UniquePtr = std::unique_ptr<T>;

template<typename T>
using SharedPtr = std::shared_ptr<T>;

template<typename T>
using Optional = std::optional<T>;

// ============================================================================
// Error Handling (C++20-compatible Result type)
// ============================================================================

/// Simple Result type using std::variant
/// Usage: Result<T, E> func() { return T{...}; } or { return Result<T, E>::Err(msg); }
template<typename T, typename E = String>
class Result {
public:
    // Construct from success value
    Result(T&& value) : m_data(std::move(value)) {}
    Result(const T& value) : m_data(value) {}

    // Construct from error
    struct Err {
        E error;
        explicit Err(E&& e) : error(std::move(e)) {}
        explicit Err(const E& e) : error(e) {}
    };

    Result(Err&& err) : m_data(std::move(err.error)) {}

    // Check if result holds a value
    bool has_value() const { return std::holds_alternative<T>(m_data); }
    explicit operator bool() const { return has_value(); }

    // Access value (throws if error)
    T& value() & { return std::get<T>(m_data); }
    const T& value() const & { return std::get<T>(m_data); }
    T&& value() && { return std::get<T>(std::move(m_data)); }

    T& operator*() & { return value(); }
    const T& operator*() const & { return value(); }
    T&& operator*() && { return std::move(value()); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    // Access error (throws if value)
    const E& error() const & { return std::get<E>(m_data); }
    E& error() & { return std::get<E>(m_data); }
    E&& error() && { return std::get<E>(std::move(m_data)); }

private:
    std::variant<T, E> m_data;
};

/// Error codes for pipeline failures
enum class ErrorCode : u32 {
    Success = 0,

    // Configuration errors (100-199)
    ConfigurationError = 100,

    // Data source errors (200-299)
    DataSourceError = 200,
    FetchTimeout = 201,

    // Input errors (300-399)
    EmptyInput = 300,

    // Precondition violations (400-499)
    GridMismatch = 400,
    DimensionMismatch = 401,

    // Control flow (500-599)
    Cancelled = 500,

    Unknown = 9999
};

/// Process exit codes reported by the CLI
enum class ExitCode : int {
    Success = 0,
    InternalError = 1,
    ConfigurationError = 2,
    EmptyResult = 3,
    DataSourceFailure = 4,
    PreconditionViolation = 5,
    Cancelled = 6
};

// ============================================================================
// Utility Functions
// ============================================================================

/// Convert ErrorCode to human-readable string
constexpr const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:            return "Success";
        case ErrorCode::ConfigurationError: return "Configuration error";
        case ErrorCode::DataSourceError:    return "Data source error";
        case ErrorCode::FetchTimeout:       return "Fetch timed out";
        case ErrorCode::EmptyInput:         return "No input scenes";
        case ErrorCode::GridMismatch:       return "Grid mismatch";
        case ErrorCode::DimensionMismatch:  return "Dimension mismatch";
        case ErrorCode::Cancelled:          return "Cancelled";
        default:                            return "Unknown error";
    }
}

/// Map an error code onto the CLI exit code
constexpr ExitCode ExitCodeFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:            return ExitCode::Success;
        case ErrorCode::ConfigurationError: return ExitCode::ConfigurationError;
        case ErrorCode::DataSourceError:
        case ErrorCode::FetchTimeout:       return ExitCode::DataSourceFailure;
        case ErrorCode::EmptyInput:         return ExitCode::EmptyResult;
        case ErrorCode::GridMismatch:
        case ErrorCode::DimensionMismatch:  return ExitCode::PreconditionViolation;
        case ErrorCode::Cancelled:          return ExitCode::Cancelled;
        default:                            return ExitCode::InternalError;
    }
}

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    inline constexpr f64 PI = 3.14159265358979323846;
    inline constexpr f64 DEG_TO_RAD = PI / 180.0;

    // Authalic (equal-area) Earth radius for WGS84 (m)
    inline constexpr f64 EARTH_AUTHALIC_RADIUS_M = 6371007.181;

    // Area conversions (m^2 per unit)
    inline constexpr f64 M2_PER_HECTARE = 1.0e4;
    inline constexpr f64 M2_PER_KM2 = 1.0e6;
    inline constexpr f64 M2_PER_ACRE = 4046.8564224;
}

// ============================================================================
// CompensatedSum - Neumaier's improved Kahan summation
// ============================================================================
// Keeps the low-order bits that a naive running total drops when small terms
// are added to a large one.
// ============================================================================

class CompensatedSum {
public:
    void Add(f64 value) {
        const f64 t = m_sum + value;
        if (std::abs(m_sum) >= std::abs(value)) {
            m_compensation += (m_sum - t) + value;
        } else {
            m_compensation += (value - t) + m_sum;
        }
        m_sum = t;
    }

    f64 Total() const { return m_sum + m_compensation; }

private:
    f64 m_sum = 0.0;
    f64 m_compensation = 0.0;
};

} // namespace verdant
