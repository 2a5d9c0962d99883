#include "cs/core/tiling/FrontierExpander.hpp"
#include "cs/core/params/CropParams.hpp"
#include "cs/core/types/Errors.hpp"
#include "cs/core/util/Logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <opencv2/core.hpp>

namespace cs::tiling {

namespace {

const char* kAxisNames[2] = {"iline", "xline"};

// First and last non-empty trace along `axis` on the line at `line` of the
// other lateral axis
std::optional<std::pair<int, int>> usable_span(const VolumeShape& volume, int axis, int line)
{
    int first = -1;
    int last = -1;
    for (int k = 0; k < volume.extent[axis]; ++k) {
        const bool empty = axis == 0 ? volume.is_empty_trace(k, line) : volume.is_empty_trace(line, k);
        if (empty)
            continue;
        if (first < 0)
            first = k;
        last = k;
    }
    if (first < 0)
        return std::nullopt;
    return std::make_pair(first, last);
}

// Centered on the surface, then clamped so the window stays inside [0, depth)
int centered_height(int32_t height, int crop_height, int depth)
{
    return std::clamp(static_cast<int>(height) - crop_height / 2, 0, depth - crop_height);
}

void validate_crop(const VolumeShape& volume, const cv::Vec3i& crop_shape, int batch_size)
{
    if (crop_shape[0] <= 0 || crop_shape[1] <= 0 || crop_shape[2] <= 0) {
        throw InvalidRange("Crop shape must be positive");
    }
    if (crop_shape[2] > volume.extent[2]) {
        throw InvalidRange("Crop height " + std::to_string(crop_shape[2]) + " exceeds depth of volume '" +
                           volume.id + "'");
    }
    if (batch_size <= 0) {
        throw InvalidRange("batch_size must be positive");
    }
}

void validate_surface(const VolumeShape& volume, const HeightMap& surface, const cv::Mat_<uint8_t>& boundary)
{
    if (boundary.rows != surface.matrix.rows || boundary.cols != surface.matrix.cols) {
        throw InvalidRange("Boundary mask does not match the height map");
    }
    if (surface.i_min < 0 || surface.x_min < 0 ||
        surface.i_min + surface.matrix.rows > volume.extent[0] ||
        surface.x_min + surface.matrix.cols > volume.extent[1]) {
        throw InvalidRange("Height map does not fit inside volume '" + volume.id + "'");
    }
}

FrontierInfo summarize(const std::shared_ptr<const VolumeShape>& volume,
                       const cv::Vec3i& crop_shape,
                       const std::vector<CropLocation>& crops)
{
    FrontierInfo info;
    info.volume = volume->id;
    info.geometry = volume;
    info.crop_shape = crop_shape;
    if (crops.empty())
        return info;

    cv::Vec3i lo = crops.front().origin;
    cv::Vec3i hi = crops.front().origin + crops.front().shape;
    for (const auto& crop : crops) {
        for (int a = 0; a < 3; ++a) {
            lo[a] = std::min(lo[a], crop.origin[a]);
            hi[a] = std::max(hi[a], crop.origin[a] + crop.shape[a]);
        }
    }

    info.offsets = lo;
    for (int a = 0; a < 3; ++a) {
        info.range[a] = {lo[a], hi[a]};
        info.predict_shape[a] = hi[a] - lo[a];
    }
    info.grid_array.reserve(crops.size());
    for (const auto& crop : crops)
        info.grid_array.push_back(crop.origin - lo);
    return info;
}

}  // namespace

HeightMap HeightMap::subset(const AxisRange& ilines, const AxisRange& xlines) const
{
    const int r0 = ilines.low - i_min;
    const int c0 = xlines.low - x_min;
    if (ilines.length() <= 0 || xlines.length() <= 0 || r0 < 0 || c0 < 0 ||
        r0 + ilines.length() > matrix.rows || c0 + xlines.length() > matrix.cols) {
        throw InvalidRange("Subset lies outside the height map");
    }

    HeightMap out;
    out.matrix = matrix(cv::Rect(c0, r0, xlines.length(), ilines.length())).clone();
    out.i_min = ilines.low;
    out.x_min = xlines.low;
    out.fill = fill;
    return out;
}

cv::Mat_<double> HeightMap::to_points() const
{
    cv::Mat_<double> points(0, 3);
    for (int r = 0; r < matrix.rows; ++r) {
        for (int c = 0; c < matrix.cols; ++c) {
            if (!known(r, c))
                continue;
            cv::Mat_<double> row = (cv::Mat_<double>(1, 3) << r + i_min, c + x_min, matrix(r, c));
            points.push_back(row);
        }
    }
    return points;
}

cv::Mat_<uint8_t> boundary_mask(const HeightMap& map)
{
    static const cv::Vec2i neighs4[] = {{1, 0}, {0, 1}, {-1, 0}, {0, -1}};

    cv::Mat_<uint8_t> mask(map.matrix.rows, map.matrix.cols, static_cast<uint8_t>(0));
    for (int r = 0; r < map.matrix.rows; ++r) {
        for (int c = 0; c < map.matrix.cols; ++c) {
            if (!map.known(r, c))
                continue;
            for (const auto& n : neighs4) {
                const int rr = r + n[0];
                const int cc = c + n[1];
                if (rr < 0 || cc < 0 || rr >= map.matrix.rows || cc >= map.matrix.cols || !map.known(rr, cc)) {
                    mask(r, c) = 1;
                    break;
                }
            }
        }
    }
    return mask;
}

FrontierExpander::FrontierExpander(std::shared_ptr<const VolumeShape> volume,
                                   const cv::Vec3i& crop_shape,
                                   int stride,
                                   int batch_size)
    : volume_(std::move(volume))
    , crop_shape_(crop_shape)
    , stride_(stride)
    , batch_size_(batch_size)
{
    if (!volume_) {
        throw std::invalid_argument("FrontierExpander needs a volume");
    }
    validate_crop(*volume_, crop_shape_, batch_size_);
    if (stride_ <= 0 || stride_ >= crop_shape_[1]) {
        throw InvalidRange("Stride " + std::to_string(stride_) + " must lie in (0, " +
                           std::to_string(crop_shape_[1]) + ")");
    }
}

FrontierExpander::FrontierExpander(std::shared_ptr<const VolumeShape> volume, const params::FrontierParams& p)
    : FrontierExpander(std::move(volume), p.crop_shape, p.stride, p.batch_size)
{
}

std::optional<FrontierExpander::Candidate> FrontierExpander::place(const HeightMap& surface,
                                                                   const cv::Vec2i& local,
                                                                   int axis,
                                                                   int side,
                                                                   const CoverageMatrix& coverage) const
{
    const int width = crop_shape_[0];
    const int length = crop_shape_[1];
    const int height = crop_shape_[2];
    const int other = 1 - axis;
    const cv::Vec2i point{local[0] + surface.i_min, local[1] + surface.x_min};

    Candidate cand;
    cand.shape = axis == 0 ? cv::Vec3i(length, width, height) : cv::Vec3i(width, length, height);
    cand.origin[axis] = side < 0 ? point[axis] + stride_ - length : point[axis] - stride_;
    cand.origin[other] = point[other];
    cand.origin[2] = centered_height(surface.matrix(local[0], local[1]), height, volume_->extent[2]);

    for (int a = 0; a < 2; ++a) {
        if (cand.origin[a] < 0 || cand.origin[a] + cand.shape[a] > volume_->extent[a]) {
            Logger()->debug("Rejected {} crop at ({}, {}): outside the volume", kAxisNames[axis],
                            point[0], point[1]);
            return std::nullopt;
        }
    }

    const cv::Rect footprint(cand.origin[1], cand.origin[0], cand.shape[1], cand.shape[0]);
    if (cv::countNonZero(volume_->empty_traces(footprint)) > 0) {
        Logger()->debug("Rejected {} crop at ({}, {}): footprint has empty traces", kAxisNames[axis],
                        point[0], point[1]);
        return std::nullopt;
    }
    if (cv::countNonZero(coverage(footprint)) > 0) {
        Logger()->debug("Rejected {} crop at ({}, {}): already covered", kAxisNames[axis],
                        point[0], point[1]);
        return std::nullopt;
    }
    return cand;
}

FrontierGrid FrontierExpander::expand(const HeightMap& surface,
                                      const cv::Mat_<uint8_t>& boundary,
                                      const CoverageMatrix& coverage) const
{
    validate_surface(*volume_, surface, boundary);

    CoverageMatrix covered;
    if (coverage.empty()) {
        covered = CoverageMatrix(volume_->extent[0], volume_->extent[1], static_cast<uint8_t>(0));
    } else if (coverage.rows != volume_->extent[0] || coverage.cols != volume_->extent[1]) {
        throw InvalidRange("Coverage matrix does not match the lateral extent of volume '" + volume_->id + "'");
    } else {
        covered = coverage.clone();
    }

    // Padding keeps neighbour look-ups of edge points inside the matrix
    const int pad = overlap();
    cv::Mat_<int32_t> padded;
    cv::copyMakeBorder(surface.matrix, padded, pad, pad, pad, pad, cv::BORDER_CONSTANT,
                       cv::Scalar(surface.fill));

    FrontierCounters counters;
    std::vector<CropLocation> crops;
    size_t processed = 0;

    for (int r = 0; r < boundary.rows; ++r) {
        for (int c = 0; c < boundary.cols; ++c) {
            if (!boundary(r, c))
                continue;
            ++counters.boundary_points;

            if (!surface.known(r, c)) {
                ++counters.skipped_unknown;
                continue;
            }
            if (covered(r + surface.i_min, c + surface.x_min)) {
                ++counters.skipped_covered;
                continue;
            }

            const int first_axis = (processed++ % 2 == 0) ? 1 : 0;
            for (int axis : {first_axis, 1 - first_axis}) {
                for (int side : {-1, 1}) {
                    const int nr = r + pad + (axis == 0 ? side : 0);
                    const int nc = c + pad + (axis == 1 ? side : 0);
                    if (padded(nr, nc) != surface.fill)
                        continue;

                    auto cand = place(surface, {r, c}, axis, side, covered);
                    if (!cand) {
                        ++counters.rejected;
                        continue;
                    }

                    covered(cv::Rect(cand->origin[1], cand->origin[0], cand->shape[1], cand->shape[0])).setTo(1);
                    crops.push_back({volume_->id, cand->origin, cand->shape, static_cast<int>(crops.size())});
                    ++counters.accepted;
                }
            }
        }
    }

    Logger()->info("Frontier step on '{}': {} boundary points, {} crops placed, {} rejected, {} already covered",
                   volume_->id, counters.boundary_points, counters.accepted, counters.rejected,
                   counters.skipped_covered);

    FrontierInfo info = summarize(volume_, crop_shape_, crops);
    return FrontierGrid{BatchGenerator<CropLocation>(std::move(crops), static_cast<size_t>(batch_size_)),
                        std::move(info), std::move(covered), counters};
}

FrontierGrid FrontierExpander::expand(const HeightMap& surface) const
{
    return expand(surface, boundary_mask(surface), CoverageMatrix());
}

LineExpandGrid make_line_expand_grid(std::shared_ptr<const VolumeShape> volume,
                                     const HeightMap& surface,
                                     const cv::Mat_<uint8_t>& boundary,
                                     const cv::Vec3i& crop_shape,
                                     int stride,
                                     int batch_size)
{
    if (!volume) {
        throw std::invalid_argument("make_line_expand_grid needs a volume");
    }
    validate_crop(*volume, crop_shape, batch_size);
    validate_surface(*volume, surface, boundary);
    if (stride <= 0) {
        throw InvalidRange("Stride must be positive");
    }

    const int width = crop_shape[0];
    const int length = crop_shape[1];
    const int height = crop_shape[2];
    const cv::Vec3i iline_shape{length, width, height};
    const cv::Vec3i xline_shape{width, length, height};

    std::vector<CropLocation> iline_crops;
    std::vector<CropLocation> xline_crops;

    std::vector<cv::Point> border;
    if (!boundary.empty())
        cv::findNonZero(boundary, border);

    if (!border.empty()) {
        int il_min = border.front().y, il_max = border.front().y;
        int xl_min = border.front().x, xl_max = border.front().x;
        for (const auto& p : border) {
            il_min = std::min(il_min, p.y);
            il_max = std::max(il_max, p.y);
            xl_min = std::min(xl_min, p.x);
            xl_max = std::max(xl_max, p.x);
        }

        // Columns: grow along the iline axis from both ends
        for (int c = xl_min; c <= xl_max; c += width) {
            int lower = -1, upper = -1;
            for (int r = il_min; r <= il_max; ++r) {
                if (!boundary(r, c))
                    continue;
                if (lower < 0)
                    lower = r;
                upper = r;
            }
            const int x = c + surface.x_min;
            if (lower < 0 || x + width > volume->extent[1])
                continue;

            for (auto [row, side] : {std::pair{lower, -1}, std::pair{upper, 1}}) {
                if (!surface.known(row, c))
                    continue;
                const int i = side < 0 ? row + surface.i_min + stride - length : row + surface.i_min - stride;
                if (i < 0 || i + length > volume->extent[0])
                    continue;
                const int h = centered_height(surface.matrix(row, c), height, volume->extent[2]);
                iline_crops.push_back({volume->id, {i, x, h}, iline_shape, static_cast<int>(iline_crops.size())});
            }
        }

        // Rows: grow along the xline axis within the usable traces of the row
        for (int r = il_min; r <= il_max; r += width) {
            int lower = -1, upper = -1;
            for (int c = xl_min; c <= xl_max; ++c) {
                if (!boundary(r, c))
                    continue;
                if (lower < 0)
                    lower = c;
                upper = c;
            }
            const int i = r + surface.i_min;
            if (lower < 0 || i + width > volume->extent[0])
                continue;
            const auto span = usable_span(*volume, 1, i);
            if (!span)
                continue;

            for (auto [col, side] : {std::pair{lower, -1}, std::pair{upper, 1}}) {
                if (!surface.known(r, col))
                    continue;
                const int x = side < 0 ? col + surface.x_min + stride - length : col + surface.x_min - stride;
                if (x < span->first || x + length > span->second + 1)
                    continue;
                const int h = centered_height(surface.matrix(r, col), height, volume->extent[2]);
                xline_crops.push_back({volume->id, {i, x, h}, xline_shape, static_cast<int>(xline_crops.size())});
            }
        }
    }

    Logger()->info("Line expansion on '{}': {} iline crops, {} xline crops", volume->id,
                   iline_crops.size(), xline_crops.size());

    FrontierInfo iline_info = summarize(volume, iline_shape, iline_crops);
    FrontierInfo xline_info = summarize(volume, xline_shape, xline_crops);
    const auto pages = static_cast<size_t>(batch_size);
    return LineExpandGrid{
        ExpandedCrops{BatchGenerator<CropLocation>(std::move(iline_crops), pages), std::move(iline_info)},
        ExpandedCrops{BatchGenerator<CropLocation>(std::move(xline_crops), pages), std::move(xline_info)}};
}

}  // namespace cs::tiling
