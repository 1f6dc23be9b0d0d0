#include "Compositor.hpp"
#include "core/Errors.hpp"
#include "core/Log.hpp"

#include <algorithm>

namespace verdant {

namespace {

f64 ReduceSamples(Vector<f32>& samples, Reducer reducer) {
    switch (reducer) {
        case Reducer::Mean: {
            CompensatedSum sum;
            for (f32 v : samples) sum.Add(v);
            return sum.Total() / static_cast<f64>(samples.size());
        }
        case Reducer::Min:
            return *std::min_element(samples.begin(), samples.end());
        case Reducer::Max:
            return *std::max_element(samples.begin(), samples.end());
        case Reducer::Median:
        default: {
            const usize mid = samples.size() / 2;
            std::nth_element(samples.begin(), samples.begin() + mid, samples.end());
            const f64 upper = samples[mid];
            if (samples.size() % 2 == 1) {
                return upper;
            }
            // Largest of the lower half sits left of mid after nth_element
            const f64 lower = *std::max_element(samples.begin(), samples.begin() + mid);
            return 0.5 * (lower + upper);
        }
    }
}

} // namespace

Optional<Reducer> ParseReducer(StringView name) {
    if (name == "median") return Reducer::Median;
    if (name == "mean")   return Reducer::Mean;
    if (name == "min")    return Reducer::Min;
    if (name == "max")    return Reducer::Max;
    return std::nullopt;
}

const char* ReducerName(Reducer reducer) {
    switch (reducer) {
        case Reducer::Median: return "median";
        case Reducer::Mean:   return "mean";
        case Reducer::Min:    return "min";
        case Reducer::Max:    return "max";
    }
    return "unknown";
}

Raster Compositor::Reduce(Vector<Raster>&& stack, Reducer reducer) {
    if (stack.empty()) {
        throw EmptyInputError("Cannot composite an empty raster stack");
    }

    const GridSpec grid = stack.front().grid;
    for (usize k = 1; k < stack.size(); ++k) {
        if (!stack[k].grid.IsAlignedWith(grid)) {
            throw GridMismatchError("Raster " + std::to_string(k) + " (" + stack[k].grid.Describe() +
                                    ") is not aligned with raster 0 (" + grid.Describe() + ")");
        }
    }

    Vector<Raster> inputs = std::move(stack);
    Raster composite(grid);
    composite.metadata["reducer"] = ReducerName(reducer);
    composite.metadata["inputs"] = std::to_string(inputs.size());

    Vector<f32> samples;
    samples.reserve(inputs.size());

    const usize n = grid.PixelCount();
    for (usize i = 0; i < n; ++i) {
        samples.clear();
        for (const Raster& r : inputs) {
            if (r.IsDefinedAt(i)) {
                samples.push_back(r.ValueAt(i));
            }
        }
        if (samples.empty()) {
            continue;
        }
        composite.SetAt(i, static_cast<f32>(ReduceSamples(samples, reducer)));
    }

    VD_LOG_INFO("Compositor: {} of {} rasters -> {}/{} pixels defined",
                ReducerName(reducer), inputs.size(), composite.DefinedCount(), n);
    return composite;
}

} // namespace verdant
