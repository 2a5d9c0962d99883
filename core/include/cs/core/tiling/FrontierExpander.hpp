#pragma once

#include "cs/core/types/Point.hpp"
#include "cs/core/types/VolumeShape.hpp"
#include "cs/core/util/BatchGenerator.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace cs::params {
struct FrontierParams;
}

namespace cs::tiling {

// Marker of cells without a known surface height
constexpr int32_t kFillValue = -999999;

// Labeled surface as a height map over (iline, xline). Cell (r, c) sits at
// absolute lateral position (i_min + r, x_min + c) of the cube.
struct HeightMap {
    cv::Mat_<int32_t> matrix;
    int i_min = 0;
    int x_min = 0;
    int32_t fill = kFillValue;

    [[nodiscard]] bool known(int r, int c) const { return matrix(r, c) != fill; }

    // Sub-map over absolute lateral ranges; throws InvalidRange outside the map
    [[nodiscard]] HeightMap subset(const AxisRange& ilines, const AxisRange& xlines) const;

    // Absolute (iline, xline, height) rows of every known cell
    [[nodiscard]] cv::Mat_<double> to_points() const;
};

// Known cells with at least one 4-neighbour that is unknown or off the map
cv::Mat_<uint8_t> boundary_mask(const HeightMap& map);

// 1 where a placed crop already covers the trace; extent0 x extent1
using CoverageMatrix = cv::Mat_<uint8_t>;

struct FrontierInfo {
    std::string volume;
    std::shared_ptr<const VolumeShape> geometry;
    cv::Vec3i crop_shape{0, 0, 0};
    cv::Vec3i offsets{0, 0, 0};        // minimum origin per axis
    cv::Vec3i predict_shape{0, 0, 0};
    std::array<AxisRange, 3> range{};  // [min origin, max origin + shape)
    std::vector<cv::Vec3i> grid_array;  // origins minus offsets
};

// Summary of one expansion step
struct FrontierCounters {
    size_t boundary_points = 0;
    size_t skipped_covered = 0;
    size_t skipped_unknown = 0;
    size_t rejected = 0;
    size_t accepted = 0;
};

struct FrontierGrid {
    BatchGenerator<CropLocation> batches;
    FrontierInfo info;
    CoverageMatrix coverage;  // input coverage plus every accepted footprint
    FrontierCounters counters;
};

// Crops of one orientation with their own reassembly metadata
struct ExpandedCrops {
    BatchGenerator<CropLocation> batches;
    FrontierInfo info;
};

// --------------------------------------------------------------------------
// FrontierExpander: one greedy growth step of a partially known surface
//
// crop_shape is (width, long side, height). Crops growing along the xline
// axis have shape (width, long, height), crops growing along the iline axis
// (long, width, height). A crop is placed so that it reaches `stride` traces
// past the boundary point into unknown territory. Its top is the known height
// minus half the crop height, clamped into [0, depth - height], so crops near
// the top or bottom of the volume sit off-centre. The lateral footprint must
// stay inside the volume and hold no empty trace. It never overlaps an
// earlier footprint.
//
// Boundary points are visited in row-major order and the preferred growth
// axis alternates between consecutive points. One expand() call is one
// growth step: feed the returned coverage and the extended surface into the
// next call to keep growing.
// --------------------------------------------------------------------------
class FrontierExpander final {
public:
    FrontierExpander(std::shared_ptr<const VolumeShape> volume,
                     const cv::Vec3i& crop_shape,
                     int stride,
                     int batch_size = 16);

    FrontierExpander(std::shared_ptr<const VolumeShape> volume, const params::FrontierParams& p);

    // An empty coverage matrix starts the step from scratch
    [[nodiscard]] FrontierGrid expand(const HeightMap& surface,
                                      const cv::Mat_<uint8_t>& boundary,
                                      const CoverageMatrix& coverage) const;

    // Fresh coverage, boundary taken from boundary_mask(surface)
    [[nodiscard]] FrontierGrid expand(const HeightMap& surface) const;

    [[nodiscard]] int overlap() const noexcept { return crop_shape_[1] - stride_; }
    [[nodiscard]] const cv::Vec3i& crop_shape() const noexcept { return crop_shape_; }
    [[nodiscard]] int stride() const noexcept { return stride_; }

private:
    struct Candidate {
        cv::Vec3i origin;
        cv::Vec3i shape;
    };

    std::optional<Candidate> place(const HeightMap& surface,
                                   const cv::Vec2i& local,
                                   int axis,
                                   int side,
                                   const CoverageMatrix& coverage) const;

    std::shared_ptr<const VolumeShape> volume_;
    cv::Vec3i crop_shape_;
    int stride_;
    int batch_size_;
};

// Line-scan expansion without coverage tracking. Every width-th column of
// the boundary yields an iline-growing crop at its lowest and highest
// boundary row; every width-th row yields an xline-growing crop at its
// first and last boundary column, limited by the usable traces of that row.
// Heights are centered and clamped as in FrontierExpander.
struct LineExpandGrid {
    ExpandedCrops iline_crops;  // shape (long, width, height)
    ExpandedCrops xline_crops;  // shape (width, long, height)
};

LineExpandGrid make_line_expand_grid(std::shared_ptr<const VolumeShape> volume,
                                     const HeightMap& surface,
                                     const cv::Mat_<uint8_t>& boundary,
                                     const cv::Vec3i& crop_shape,
                                     int stride,
                                     int batch_size = 16);

}  // namespace cs::tiling
