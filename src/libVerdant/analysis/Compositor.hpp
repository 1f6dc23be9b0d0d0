#pragma once

#include "core/Platform.hpp"
#include "core/Raster.hpp"

// ============================================================================
// Compositor - Per-pixel temporal reduction of an index stack
// ============================================================================
// All inputs must share one grid; resampling (if any) happens before this
// step. Undefined inputs are skipped per pixel; a pixel undefined in every
// input stays undefined in the composite.
// ============================================================================

namespace verdant {

enum class Reducer : u8 {
    Median, // even count: mean of the two middle values
    Mean,
    Min,
    Max
};

VD_API Optional<Reducer> ParseReducer(StringView name);
VD_API const char* ReducerName(Reducer reducer);

class VD_API Compositor {
public:
    /// Reduce a stack of aligned rasters into one composite
    /// The stack is consumed.
    /// @throws EmptyInputError if the stack is empty
    /// @throws GridMismatchError if any raster is not aligned with the first
    static Raster Reduce(Vector<Raster>&& stack, Reducer reducer = Reducer::Median);
};

} // namespace verdant
