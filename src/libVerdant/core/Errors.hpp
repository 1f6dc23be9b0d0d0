#pragma once

#include "Platform.hpp"
#include "Types.hpp"

#include <stdexcept>

// ============================================================================
// Pipeline Error Taxonomy
// ============================================================================
// Every stage failure is a PipelineError carrying an ErrorCode, so the CLI
// can map it to a distinguishing exit code with ExitCodeFor().
//
//   ConfigurationError      bad region/date/threshold input (before compute)
//   DataSourceError         catalog listing or band fetch failed
//     FetchTimeoutError     a fetch exceeded its deadline
//   EmptyInputError         nothing left to composite
//   GridMismatchError       rasters reduced together are not aligned
//   DimensionMismatchError  mask and pixel-area grids differ in size
//   CancelledError          the stop token was triggered
// ============================================================================

namespace verdant {

class VD_API PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorCode code, const String& message)
        : std::runtime_error(message), m_code(code) {}

    ErrorCode Code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

class VD_API ConfigurationError : public PipelineError {
public:
    explicit ConfigurationError(const String& message)
        : PipelineError(ErrorCode::ConfigurationError, message) {}
};

class VD_API DataSourceError : public PipelineError {
public:
    explicit DataSourceError(const String& message)
        : PipelineError(ErrorCode::DataSourceError, message) {}

protected:
    DataSourceError(ErrorCode code, const String& message)
        : PipelineError(code, message) {}
};

class VD_API FetchTimeoutError : public DataSourceError {
public:
    explicit FetchTimeoutError(const String& message)
        : DataSourceError(ErrorCode::FetchTimeout, message) {}
};

class VD_API EmptyInputError : public PipelineError {
public:
    explicit EmptyInputError(const String& message)
        : PipelineError(ErrorCode::EmptyInput, message) {}
};

class VD_API GridMismatchError : public PipelineError {
public:
    explicit GridMismatchError(const String& message)
        : PipelineError(ErrorCode::GridMismatch, message) {}
};

class VD_API DimensionMismatchError : public PipelineError {
public:
    explicit DimensionMismatchError(const String& message)
        : PipelineError(ErrorCode::DimensionMismatch, message) {}
};

class VD_API CancelledError : public PipelineError {
public:
    explicit CancelledError(const String& message)
        : PipelineError(ErrorCode::Cancelled, message) {}
};

} // namespace verdant
