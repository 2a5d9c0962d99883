#include "test.hpp"

#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include "cs/core/params/CropParams.hpp"
#include "cs/core/tiling/FrontierExpander.hpp"
#include "cs/core/types/Errors.hpp"

using namespace cs;
using namespace cs::tiling;

namespace {

std::shared_ptr<const VolumeShape> cube(int i, int x, int h, cv::Mat_<uint8_t> empty = {})
{
    return std::make_shared<const VolumeShape>(make_volume_shape("cube", {i, x, h}, empty));
}

HeightMap unknown_map(int rows, int cols)
{
    HeightMap map;
    map.matrix = cv::Mat_<int32_t>(rows, cols, kFillValue);
    return map;
}

// Known square [lo, hi)^2 at the given height
HeightMap square_map(int size, int lo, int hi, int32_t height)
{
    HeightMap map = unknown_map(size, size);
    map.matrix(cv::Rect(lo, lo, hi - lo, hi - lo)).setTo(height);
    return map;
}

std::vector<CropLocation> drain(BatchGenerator<CropLocation>& batches)
{
    std::vector<CropLocation> all;
    while (batches.has_next()) {
        auto page = batches.next();
        all.insert(all.end(), page.begin(), page.end());
    }
    return all;
}

}  // namespace

// --- height map helpers ------------------------------------------------------

TEST(HeightMap, BoundaryIsRimOfKnownRegion)
{
    auto map = square_map(10, 3, 7, 5);
    auto mask = boundary_mask(map);
    EXPECT_EQ(cv::countNonZero(mask), 12);
    EXPECT_EQ(mask(3, 3), 1);
    EXPECT_EQ(mask(3, 5), 1);
    EXPECT_EQ(mask(4, 4), 0);
    EXPECT_EQ(mask(0, 0), 0);
}

TEST(HeightMap, MapEdgeCountsAsBoundary)
{
    HeightMap map;
    map.matrix = cv::Mat_<int32_t>(3, 3, 1);
    auto mask = boundary_mask(map);
    EXPECT_EQ(cv::countNonZero(mask), 8);
    EXPECT_EQ(mask(1, 1), 0);
}

TEST(HeightMap, SubsetUsesAbsoluteRanges)
{
    auto map = square_map(10, 3, 7, 5);
    map.i_min = 100;
    map.x_min = 200;
    auto sub = map.subset({102, 106}, {203, 205});
    EXPECT_EQ(sub.i_min, 102);
    EXPECT_EQ(sub.x_min, 203);
    EXPECT_EQ(sub.matrix.rows, 4);
    EXPECT_EQ(sub.matrix.cols, 2);
    EXPECT_FALSE(sub.known(0, 0));
    EXPECT_TRUE(sub.known(1, 0));
    EXPECT_THROW_AS((map.subset({95, 105}, {200, 210})), InvalidRange);
}

TEST(HeightMap, PointsAreAbsolute)
{
    auto map = square_map(5, 1, 2, 9);
    map.i_min = 10;
    map.x_min = 20;
    auto points = map.to_points();
    ASSERT_EQ(points.rows, 1);
    EXPECT_FLOAT_EQ(points(0, 0), 11.0);
    EXPECT_FLOAT_EQ(points(0, 1), 21.0);
    EXPECT_FLOAT_EQ(points(0, 2), 9.0);
}

// --- frontier expansion ------------------------------------------------------

TEST(FrontierExpander, PlacesCropPastIsolatedPoint)
{
    auto map = unknown_map(100, 100);
    map.matrix(50, 50) = 25;
    FrontierExpander expander(cube(100, 100, 50), {4, 20, 10}, 5);
    auto result = expander.expand(map);

    auto crops = drain(result.batches);
    ASSERT_EQ(crops.size(), size_t(1));
    // first point grows along xline toward lower indices
    EXPECT_TRUE(crops[0].origin == cv::Vec3i(50, 35, 20));
    EXPECT_TRUE(crops[0].shape == cv::Vec3i(4, 20, 10));
    EXPECT_EQ(crops[0].order, 0);
    EXPECT_EQ(result.counters.accepted, size_t(1));
    EXPECT_EQ(cv::countNonZero(result.coverage), 4 * 20);
}

TEST(FrontierExpander, GrowthAxisAlternatesBetweenPoints)
{
    auto map = unknown_map(100, 100);
    map.matrix(50, 50) = 25;
    map.matrix(50, 70) = 25;
    FrontierExpander expander(cube(100, 100, 50), {4, 20, 10}, 5);
    auto result = expander.expand(map);
    auto crops = drain(result.batches);

    ASSERT_EQ(crops.size(), size_t(2));
    EXPECT_TRUE(crops[0].shape == cv::Vec3i(4, 20, 10));
    EXPECT_TRUE(crops[1].shape == cv::Vec3i(20, 4, 10));
    EXPECT_TRUE(crops[1].origin == cv::Vec3i(35, 70, 20));
    EXPECT_EQ(crops[1].order, 1);
}

TEST(FrontierExpander, FootprintsNeverOverlap)
{
    auto map = square_map(120, 40, 80, 30);
    FrontierExpander expander(cube(120, 120, 60), {6, 24, 16}, 8, 5);
    auto result = expander.expand(map);
    auto crops = drain(result.batches);
    EXPECT_GT(crops.size(), size_t(4));

    cv::Mat_<int> hits = cv::Mat_<int>::zeros(120, 120);
    for (const auto& c : crops) {
        EXPECT_GE(c.origin[0], 0);
        EXPECT_GE(c.origin[1], 0);
        EXPECT_LE(c.origin[0] + c.shape[0], 120);
        EXPECT_LE(c.origin[1] + c.shape[1], 120);
        EXPECT_EQ(c.origin[2], 30 - 8);
        cv::Mat roi = hits(cv::Rect(c.origin[1], c.origin[0], c.shape[1], c.shape[0]));
        roi += cv::Scalar(1);
    }
    double max_hits = 0;
    cv::minMaxLoc(hits, nullptr, &max_hits);
    EXPECT_FLOAT_EQ(max_hits, 1.0);
    EXPECT_EQ(cv::countNonZero(hits), cv::countNonZero(result.coverage));
}

TEST(FrontierExpander, OffVolumeExtensionGivesNoCandidates)
{
    HeightMap map;
    map.matrix = cv::Mat_<int32_t>(30, 30, 10);
    FrontierExpander expander(cube(30, 30, 20), {4, 20, 10}, 5);
    auto result = expander.expand(map);
    EXPECT_EQ(result.batches.total(), size_t(0));
    EXPECT_EQ(result.batches.total_pages(), size_t(0));
    EXPECT_GT(result.counters.rejected, size_t(0));
    EXPECT_TRUE(result.info.offsets == cv::Vec3i(0, 0, 0));
}

TEST(FrontierExpander, SeededCoverageSkipsEveryPoint)
{
    auto map = square_map(60, 20, 40, 10);
    CoverageMatrix seeded(60, 60, static_cast<uint8_t>(1));
    FrontierExpander expander(cube(60, 60, 30), {4, 20, 10}, 5);
    auto result = expander.expand(map, boundary_mask(map), seeded);
    EXPECT_EQ(result.batches.total(), size_t(0));
    EXPECT_EQ(result.counters.skipped_covered, result.counters.boundary_points);
    EXPECT_EQ(seeded(0, 0), 1);
}

TEST(FrontierExpander, CallerCoverageIsNotMutated)
{
    auto map = unknown_map(100, 100);
    map.matrix(50, 50) = 25;
    CoverageMatrix seeded(100, 100, static_cast<uint8_t>(0));
    FrontierExpander expander(cube(100, 100, 50), {4, 20, 10}, 5);
    auto result = expander.expand(map, boundary_mask(map), seeded);
    EXPECT_EQ(cv::countNonZero(seeded), 0);
    EXPECT_GT(cv::countNonZero(result.coverage), 0);
}

TEST(FrontierExpander, EmptyTracesBlockPlacement)
{
    cv::Mat_<uint8_t> empty(100, 100, static_cast<uint8_t>(0));
    empty(cv::Rect(0, 0, 40, 100)).setTo(1);
    auto map = unknown_map(100, 100);
    map.matrix(50, 50) = 25;
    FrontierExpander expander(cube(100, 100, 50, empty), {4, 20, 10}, 5);
    auto result = expander.expand(map);
    auto crops = drain(result.batches);
    ASSERT_EQ(crops.size(), size_t(1));
    EXPECT_TRUE(crops[0].origin == cv::Vec3i(50, 45, 20));
}

TEST(FrontierExpander, InteriorMissingBandBlocksPlacement)
{
    cv::Mat_<uint8_t> empty(100, 100, static_cast<uint8_t>(0));
    empty(cv::Rect(30, 0, 15, 100)).setTo(1);
    auto volume = cube(100, 100, 50, empty);
    auto map = unknown_map(100, 100);
    map.matrix(50, 50) = 25;
    FrontierExpander expander(volume, {4, 20, 10}, 5);
    auto result = expander.expand(map);
    auto crops = drain(result.batches);

    ASSERT_EQ(crops.size(), size_t(1));
    EXPECT_TRUE(crops[0].origin == cv::Vec3i(50, 45, 20));
    EXPECT_GT(result.counters.rejected, size_t(0));
    for (const auto& crop : crops) {
        const cv::Rect footprint(crop.origin[1], crop.origin[0], crop.shape[1], crop.shape[0]);
        EXPECT_EQ(cv::countNonZero(volume->empty_traces(footprint)), 0);
    }
}

TEST(FrontierExpander, HeightIsClampedIntoVolume)
{
    auto map = unknown_map(100, 100);
    map.matrix(50, 50) = 2;
    FrontierExpander expander(cube(100, 100, 50), {4, 20, 10}, 5);
    auto result = expander.expand(map);
    auto crops = drain(result.batches);
    ASSERT_EQ(crops.size(), size_t(1));
    EXPECT_EQ(crops[0].origin[2], 0);
}

TEST(FrontierExpander, InfoDescribesPlacedCrops)
{
    auto map = unknown_map(100, 100);
    map.matrix(50, 50) = 25;
    map.matrix(50, 70) = 25;
    FrontierExpander expander(cube(100, 100, 50), {4, 20, 10}, 5);
    auto result = expander.expand(map);
    EXPECT_TRUE(result.info.offsets == cv::Vec3i(35, 35, 20));
    EXPECT_EQ(result.info.range[0].high, 55);
    EXPECT_EQ(result.info.range[1].high, 74);
    EXPECT_TRUE(result.info.predict_shape == cv::Vec3i(20, 39, 10));
    ASSERT_EQ(result.info.grid_array.size(), size_t(2));
    EXPECT_TRUE(result.info.grid_array[0] == cv::Vec3i(15, 0, 0));
}

TEST(FrontierExpander, RejectsInvalidConfiguration)
{
    auto volume = cube(50, 50, 20);
    EXPECT_THROW_AS((FrontierExpander(volume, {4, 20, 10}, 20)), InvalidRange);
    EXPECT_THROW_AS((FrontierExpander(volume, {4, 20, 10}, 0)), InvalidRange);
    EXPECT_THROW_AS((FrontierExpander(volume, {4, 20, 30}, 5)), InvalidRange);

    FrontierExpander expander(volume, {4, 20, 10}, 5);
    auto map = unknown_map(50, 50);
    EXPECT_THROW_AS((expander.expand(map, cv::Mat_<uint8_t>(10, 10, static_cast<uint8_t>(0)), CoverageMatrix())),
                    InvalidRange);
    EXPECT_THROW_AS((expander.expand(map, boundary_mask(map), CoverageMatrix(10, 10, static_cast<uint8_t>(0)))),
                    InvalidRange);

    auto big = unknown_map(60, 50);
    EXPECT_THROW_AS((expander.expand(big)), InvalidRange);
}

TEST(FrontierExpander, BuildsFromParams)
{
    params::FrontierParams p;
    p.crop_shape = {2, 16, 8};
    p.stride = 4;
    FrontierExpander expander(cube(40, 40, 20), p);
    EXPECT_EQ(expander.overlap(), 12);
    EXPECT_EQ(expander.stride(), 4);
}

// --- line expansion ----------------------------------------------------------

TEST(LineExpand, EmitsBothEndsOfEveryScannedLine)
{
    auto map = square_map(100, 40, 60, 25);
    auto grid = make_line_expand_grid(cube(100, 100, 50), map, boundary_mask(map), {10, 20, 10}, 5, 3);

    auto ilines = drain(grid.iline_crops.batches);
    auto xlines = drain(grid.xline_crops.batches);
    ASSERT_EQ(ilines.size(), size_t(4));
    ASSERT_EQ(xlines.size(), size_t(4));

    EXPECT_TRUE(ilines[0].origin == cv::Vec3i(25, 40, 20));
    EXPECT_TRUE(ilines[1].origin == cv::Vec3i(54, 40, 20));
    EXPECT_TRUE(ilines[0].shape == cv::Vec3i(20, 10, 10));
    EXPECT_TRUE(xlines[0].origin == cv::Vec3i(40, 25, 20));
    EXPECT_TRUE(xlines[1].origin == cv::Vec3i(40, 54, 20));
    EXPECT_TRUE(xlines[0].shape == cv::Vec3i(10, 20, 10));

    EXPECT_TRUE(grid.iline_crops.info.offsets == cv::Vec3i(25, 40, 20));
    EXPECT_TRUE(grid.iline_crops.info.predict_shape == cv::Vec3i(49, 20, 10));
    EXPECT_TRUE(grid.iline_crops.info.crop_shape == cv::Vec3i(20, 10, 10));
    EXPECT_EQ(grid.iline_crops.batches.total_pages(), size_t(2));
}

TEST(LineExpand, RespectsUsableTracesOfRow)
{
    cv::Mat_<uint8_t> empty(100, 100, static_cast<uint8_t>(0));
    empty(cv::Rect(0, 0, 30, 100)).setTo(1);
    auto map = square_map(100, 40, 60, 25);
    auto grid = make_line_expand_grid(cube(100, 100, 50, empty), map, boundary_mask(map), {10, 20, 10}, 5);

    auto xlines = drain(grid.xline_crops.batches);
    ASSERT_EQ(xlines.size(), size_t(2));
    for (const auto& c : xlines)
        EXPECT_EQ(c.origin[1], 54);
}

TEST(LineExpand, EmptyBoundaryGivesEmptyGenerators)
{
    auto map = unknown_map(50, 50);
    auto grid = make_line_expand_grid(cube(50, 50, 20), map, boundary_mask(map), {4, 10, 10}, 5);
    EXPECT_EQ(grid.iline_crops.batches.total(), size_t(0));
    EXPECT_EQ(grid.xline_crops.batches.total(), size_t(0));
}
