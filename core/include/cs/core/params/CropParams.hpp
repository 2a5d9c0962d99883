#pragma once

#include "cs/core/types/Point.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace cs::params {

// Region restriction of a tagged sampler
struct RegionFilterParams {
    std::string axis = "iline";
    double low = 0.0;
    double high = 1.0;
    std::optional<int> each;         // keep every each-th tick
    std::optional<int> each_start;   // first tick, defaults to each
    bool to_cube = false;            // emit absolute cube coordinates
};

// Regular inference grid over one volume
struct GridParams {
    std::string volume;
    cv::Vec3i crop_shape{0, 0, 0};
    std::array<std::optional<AxisRange>, 3> ranges{};  // unset = whole axis
    std::optional<cv::Vec3i> strides;  // defaults to crop_shape
    int batch_size = 16;
};

// One surface-extension step; crop_shape is (width, long side, height)
struct FrontierParams {
    cv::Vec3i crop_shape{1, 64, 64};
    int stride = 10;
    int batch_size = 16;
};

// Dataset-level mixture
struct MixtureParams {
    std::string mode = "hist";          // hist | horizon | uniform
    std::vector<double> weights;        // empty = uniform over volumes
    cv::Vec3i bins{100, 100, 100};
    cv::Vec3d low{0, 0, 0};
    cv::Vec3d high{1, 1, 1};
};

}  // namespace cs::params
