#pragma once

#include "cs/core/types/Point.hpp"
#include "cs/core/types/VolumeShape.hpp"
#include "cs/core/util/BatchGenerator.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace cs::params {
struct GridParams;
}

namespace cs::tiling {

// Anchors low, low+stride, ... whose tile fits in [low, high), plus one
// anchor flush with high when the last regular tile stops short of it.
// Sorted, no duplicates. Throws InvalidRange if the range is shorter than
// the crop or stride/crop are not positive.
std::vector<int> make_axis_ticks(const AxisRange& range, int stride, int crop);

// How emitted anchors map back into a dense prediction array
struct GridInfo {
    std::string volume;
    std::shared_ptr<const VolumeShape> geometry;
    cv::Vec3i crop_shape{0, 0, 0};
    cv::Vec3i offsets{0, 0, 0};        // minimum anchor per axis
    cv::Vec3i predict_shape{0, 0, 0};  // high - low per axis
    std::array<AxisRange, 3> range{};
    std::vector<cv::Vec3i> grid_array;  // anchors minus offsets, emission order
};

struct Grid {
    BatchGenerator<CropLocation> batches;
    GridInfo info;
};

// Regular lattice over [low, high) on every axis; axis 0 varies slowest.
// Ranges must satisfy 0 <= low < high <= extent.
Grid make_grid(std::shared_ptr<const VolumeShape> volume,
               const cv::Vec3i& crop_shape,
               const std::array<AxisRange, 3>& ranges,
               const std::optional<cv::Vec3i>& strides = std::nullopt,
               int batch_size = 16);

// Unset ranges in the params cover the whole axis
Grid make_grid(const VolumeSet& volumes, const params::GridParams& p);

}  // namespace cs::tiling
