#pragma once

#include <string>

#include <opencv2/core.hpp>

namespace cs {

// A sampled location. coords are normalized [0,1] or absolute cube indices,
// depending on the stage that produced the point.
struct Point {
    std::string volume;
    cv::Vec3d coords{0, 0, 0};
};

// One crop to extract: origin is the absolute anchor in cube space,
// order is the placement order (0 for regular grids).
struct CropLocation {
    std::string volume;
    cv::Vec3i origin{0, 0, 0};
    cv::Vec3i shape{0, 0, 0};
    int order = 0;

    bool operator==(const CropLocation& o) const
    {
        return volume == o.volume && origin == o.origin && shape == o.shape && order == o.order;
    }
};

// Half-open interval [low, high) along one cube axis
struct AxisRange {
    int low = 0;
    int high = 0;

    [[nodiscard]] int length() const noexcept { return high - low; }
    bool operator==(const AxisRange& o) const = default;
};

}  // namespace cs
