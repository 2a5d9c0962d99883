#include "cs/core/tiling/GridTiler.hpp"
#include "cs/core/params/CropParams.hpp"
#include "cs/core/types/Errors.hpp"
#include "cs/core/util/Logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace cs::tiling {

namespace {

const char* kAxisNames[3] = {"iline", "xline", "height"};

void validate_range(const AxisRange& r, int extent, int axis)
{
    if (r.low < 0 || r.high > extent || r.low >= r.high) {
        throw InvalidRange(std::string("Range [") + std::to_string(r.low) + ", " +
                           std::to_string(r.high) + ") on " + kAxisNames[axis] +
                           " axis must lie inside [0, " + std::to_string(extent) + ")");
    }
}

}  // namespace

std::vector<int> make_axis_ticks(const AxisRange& range, int stride, int crop)
{
    if (stride <= 0 || crop <= 0) {
        throw InvalidRange("Grid stride and crop size must be positive");
    }
    if (range.length() < crop) {
        throw InvalidRange("Range [" + std::to_string(range.low) + ", " + std::to_string(range.high) +
                           ") is shorter than crop size " + std::to_string(crop));
    }

    std::vector<int> ticks;
    int a = range.low;
    for (; a + crop <= range.high; a += stride)
        ticks.push_back(a);

    if (ticks.back() + crop < range.high)
        ticks.push_back(range.high - crop);

    std::sort(ticks.begin(), ticks.end());
    ticks.erase(std::unique(ticks.begin(), ticks.end()), ticks.end());
    return ticks;
}

Grid make_grid(std::shared_ptr<const VolumeShape> volume,
               const cv::Vec3i& crop_shape,
               const std::array<AxisRange, 3>& ranges,
               const std::optional<cv::Vec3i>& strides,
               int batch_size)
{
    if (!volume) {
        throw std::invalid_argument("make_grid needs a volume");
    }
    if (batch_size <= 0) {
        throw InvalidRange("batch_size must be positive");
    }
    const cv::Vec3i step = strides.value_or(crop_shape);

    // Validate everything before building anything
    std::array<std::vector<int>, 3> ticks;
    for (int a = 0; a < 3; ++a) {
        validate_range(ranges[a], volume->extent[a], a);
        ticks[a] = make_axis_ticks(ranges[a], step[a], crop_shape[a]);
    }

    const cv::Vec3i offsets{ticks[0].front(), ticks[1].front(), ticks[2].front()};

    std::vector<CropLocation> anchors;
    anchors.reserve(ticks[0].size() * ticks[1].size() * ticks[2].size());
    GridInfo info;
    info.grid_array.reserve(anchors.capacity());
    for (int i : ticks[0]) {
        for (int x : ticks[1]) {
            for (int h : ticks[2]) {
                anchors.push_back({volume->id, {i, x, h}, crop_shape, 0});
                info.grid_array.emplace_back(i - offsets[0], x - offsets[1], h - offsets[2]);
            }
        }
    }

    info.volume = volume->id;
    info.geometry = volume;
    info.crop_shape = crop_shape;
    info.offsets = offsets;
    info.predict_shape = {ranges[0].length(), ranges[1].length(), ranges[2].length()};
    info.range = ranges;

    Logger()->info("Grid over '{}': {}x{}x{} anchors, {} in total",
                   volume->id, ticks[0].size(), ticks[1].size(), ticks[2].size(), anchors.size());

    Grid grid{BatchGenerator<CropLocation>(std::move(anchors), static_cast<size_t>(batch_size)),
              std::move(info)};
    Logger()->debug("Grid over '{}' yields {} pages of {}", volume->id,
                    grid.batches.total_pages(), batch_size);
    return grid;
}

Grid make_grid(const VolumeSet& volumes, const params::GridParams& p)
{
    auto volume = volumes.get(p.volume);
    std::array<AxisRange, 3> ranges;
    for (int a = 0; a < 3; ++a)
        ranges[a] = p.ranges[a].value_or(AxisRange{0, volume->extent[a]});
    return make_grid(volume, p.crop_shape, ranges, p.strides, p.batch_size);
}

}  // namespace cs::tiling
