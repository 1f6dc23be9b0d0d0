#include "ImageIO.hpp"

#include <OpenEXR/ImfChannelList.h>
#include <OpenEXR/ImfFrameBuffer.h>
#include <OpenEXR/ImfHeader.h>
#include <OpenEXR/ImfInputFile.h>
#include <OpenEXR/ImfOutputFile.h>
#include <OpenEXR/ImfStringAttribute.h>

#include <filesystem>
#include <limits>
#include <sstream>
#include <vector>

namespace verdant {

// ============================================================================
// Helper: Build per-channel planes
// ============================================================================

struct ChannelPlane {
    std::string name;
    std::vector<float> values;
};

static std::vector<ChannelPlane> BuildPlanes(const Raster& composite, const Mask* mask) {
    const usize n = composite.PixelCount();
    std::vector<ChannelPlane> planes;

    ChannelPlane value{"value", std::vector<float>(n)};
    ChannelPlane valid{"valid", std::vector<float>(n)};
    for (usize i = 0; i < n; ++i) {
        const bool defined = composite.IsDefinedAt(i);
        value.values[i] = defined ? composite.ValueAt(i) : std::numeric_limits<float>::quiet_NaN();
        valid.values[i] = defined ? 1.0f : 0.0f;
    }
    planes.push_back(std::move(value));
    planes.push_back(std::move(valid));

    if (mask) {
        ChannelPlane maskPlane{"mask", std::vector<float>(n)};
        for (usize i = 0; i < n; ++i) {
            maskPlane.values[i] = mask->At(i) ? 1.0f : 0.0f;
        }
        planes.push_back(std::move(maskPlane));
    }
    return planes;
}

static std::string FormatDouble(f64 value) {
    std::ostringstream oss;
    oss.precision(std::numeric_limits<f64>::max_digits10);
    oss << value;
    return oss.str();
}

// ============================================================================
// Public API: WriteEXR
// ============================================================================

bool ImageIO::WriteEXR(const std::string& filepath, const Raster& composite, const Mask* mask) {
    if (!composite.IsValid()) {
        VD_LOG_ERROR("ImageIO::WriteEXR: Invalid raster");
        return false;
    }
    if (mask && mask->data.size() != composite.PixelCount()) {
        VD_LOG_ERROR("ImageIO::WriteEXR: Mask does not match composite grid");
        return false;
    }

    try {
        const GridSpec& grid = composite.grid;
        Imf::Header header(static_cast<int>(grid.width), static_cast<int>(grid.height));

        std::vector<ChannelPlane> planes = BuildPlanes(composite, mask);
        for (const ChannelPlane& plane : planes) {
            header.channels().insert(plane.name.c_str(), Imf::Channel(Imf::FLOAT));
        }

        header.insert("origin_x", Imf::StringAttribute(FormatDouble(grid.originX)));
        header.insert("origin_y", Imf::StringAttribute(FormatDouble(grid.originY)));
        header.insert("pixel_width", Imf::StringAttribute(FormatDouble(grid.pixelWidth)));
        header.insert("pixel_height", Imf::StringAttribute(FormatDouble(grid.pixelHeight)));
        header.insert("crs", Imf::StringAttribute(grid.crs));
        for (const auto& [key, value] : composite.metadata) {
            header.insert(key.c_str(), Imf::StringAttribute(value));
        }

        Imf::FrameBuffer fb;
        for (ChannelPlane& plane : planes) {
            fb.insert(plane.name.c_str(),
                      Imf::Slice(Imf::FLOAT,
                                 reinterpret_cast<char*>(plane.values.data()),
                                 sizeof(float),
                                 sizeof(float) * grid.width));
        }

        Imf::OutputFile file(filepath.c_str(), header);
        file.setFrameBuffer(fb);
        file.writePixels(static_cast<int>(grid.height));

        VD_LOG_INFO("ImageIO::WriteEXR: Wrote {}x{} raster with {} channels to {}",
                    grid.width, grid.height, planes.size(), filepath);
        return true;

    } catch (const std::exception& e) {
        VD_LOG_ERROR("ImageIO::WriteEXR: Failed to write {}: {}", filepath, e.what());
        return false;
    }
}

// ============================================================================
// Public API: GetDimensions
// ============================================================================

std::optional<std::tuple<u32, u32, u32>> ImageIO::GetDimensions(const std::string& filepath) {
    if (!std::filesystem::is_regular_file(filepath)) {
        return std::nullopt;
    }

    try {
        Imf::InputFile file(filepath.c_str());
        const Imf::Header& header = file.header();

        Imath::Box2i dw = header.dataWindow();
        u32 width = static_cast<u32>(dw.max.x - dw.min.x + 1);
        u32 height = static_cast<u32>(dw.max.y - dw.min.y + 1);

        u32 channels = 0;
        const Imf::ChannelList& channelList = header.channels();
        for (auto it = channelList.begin(); it != channelList.end(); ++it) {
            ++channels;
        }

        return std::make_tuple(width, height, channels);

    } catch (const std::exception& e) {
        VD_LOG_ERROR("ImageIO::GetDimensions: Failed: {}", e.what());
        return std::nullopt;
    }
}

} // namespace verdant
