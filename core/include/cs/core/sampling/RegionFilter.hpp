#pragma once

#include "cs/core/sampling/Sampler.hpp"
#include "cs/core/types/VolumeShape.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace cs::params {
struct RegionFilterParams;
}

namespace cs::sampling {

// Cube axes in (iline, xline, height) order
enum class Axis { ILine = 0, XLine = 1, Height = 2 };

// Accepts iline/ilines/i, xline/xlines/x, height/heights/h
Axis parse_axis(const std::string& name);
std::string axis_name(Axis axis);

// Nearest tick of start, start+step, ... below extent; ties go to the lower tick
int snap_to_tick(int value, int start, int step, int extent);

// Tagged-sampler helpers. They operate on 4-column draws
// (volume index, c0, c1, c2) in unit-cube coordinates and look volume
// extents up by index, so the VolumeSet must be the mixture's.
// decimate() throws InvalidRange when each_start is not below the axis
// extent of every volume in the set.
Sampler decimate(const Sampler& src, Axis axis, int each, int each_start,
                 std::shared_ptr<const VolumeSet> volumes);
Sampler to_cube(const Sampler& src, std::shared_ptr<const VolumeSet> volumes);

// --------------------------------------------------------------------------
// RegionFilter: reusable chain of output transformations for a
// tagged sampler
//
// Steps run in the order they were added. apply() never touches the source
// sampler: it returns a new one, so the same filter can derive train and
// test samplers from one mixture.
//
//   auto train = RegionFilter().truncate(Axis::ILine, 0.0, 0.8)
//                              .decimate(Axis::XLine, 50, 70)
//                              .to_cube()
//                              .apply(mixture.sampler(), mixture.volumes_ptr());
// --------------------------------------------------------------------------
class RegionFilter final {
public:
    struct Truncation {
        Axis axis;
        double low;
        double high;
    };
    struct Decimation {
        Axis axis;
        int each;
        int each_start;
    };
    struct ToCube {};
    struct Post {
        Transform fn;
    };
    using Step = std::variant<Truncation, Decimation, ToCube, Post>;

    RegionFilter() = default;

    // Same step order as the params describe: truncation (only when the
    // range is not the full [0,1]), decimation, cube rescale, post
    static RegionFilter from_params(const params::RegionFilterParams& p, Transform post = {});

    RegionFilter& truncate(Axis axis, double low, double high);
    RegionFilter& decimate(Axis axis, int each, int each_start);
    RegionFilter& to_cube();
    RegionFilter& post(Transform fn);

    [[nodiscard]] const std::vector<Step>& steps() const noexcept { return steps_; }

    [[nodiscard]] Sampler apply(const Sampler& src, std::shared_ptr<const VolumeSet> volumes) const;

private:
    std::vector<Step> steps_;
};

}  // namespace cs::sampling
