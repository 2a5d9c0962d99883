#pragma once

#include "cs/core/sampling/Sampler.hpp"
#include "cs/core/types/Point.hpp"
#include "cs/core/types/VolumeShape.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace cs::params {
struct MixtureParams;
}

namespace cs::sampling {

// Density estimated from labeled surfaces: one point cloud per surface,
// rows are absolute (iline, xline, height) cube coordinates.
struct HistogramSpec {
    std::vector<cv::Mat_<double>> surfaces;
    cv::Vec3i bins{100, 100, 100};
};

// Uniform density over a box of the unit cube
struct UniformSpec {
    cv::Vec3d low{0, 0, 0};
    cv::Vec3d high{1, 1, 1};
};

// Caller-built 3-D sampler in unit-cube coordinates
struct CustomSpec {
    Sampler sampler;
};

using SamplerSpec = std::variant<HistogramSpec, UniformSpec, CustomSpec>;

// Resolves one sampler kind into a 3-D unit-cube sampler for the given volume
Sampler make_volume_sampler(const SamplerSpec& spec, const VolumeShape& volume);

// Picks the sampler kind for a configured mode: "hist"/"horizon" build a histogram
// from the given surfaces, "uniform"/"numpy" a uniform box
SamplerSpec make_sampler_spec(const params::MixtureParams& p,
                              std::vector<cv::Mat_<double>> surfaces = {});

// --------------------------------------------------------------------------
// SamplerMixture: dataset-level sampler over every volume of a VolumeSet
//
// One sampler per volume, clipped to [0,1]^3, tagged with the volume index
// and mixed with weights summing to one (uniform unless given). The combined
// sampler draws 4-column rows: (volume index, c0, c1, c2). Immutable after
// construction, so it can be shared between readers.
// --------------------------------------------------------------------------
class SamplerMixture final {
public:
    using SpecMap = std::unordered_map<std::string, SamplerSpec>;
    using TransformMap = std::unordered_map<std::string, Transform>;

    // Same sampler kind for every volume
    SamplerMixture(std::shared_ptr<const VolumeSet> volumes,
                   const SamplerSpec& spec,
                   std::vector<double> weights = {},
                   const TransformMap& transforms = {});

    // One sampler kind per volume id; every volume must have an entry
    SamplerMixture(std::shared_ptr<const VolumeSet> volumes,
                   const SpecMap& specs,
                   std::vector<double> weights = {},
                   const TransformMap& transforms = {});

    [[nodiscard]] const Sampler& sampler() const noexcept { return combined_; }
    [[nodiscard]] const Sampler& volume_sampler(const std::string& id) const;
    [[nodiscard]] const std::vector<double>& weights() const noexcept { return weights_; }
    [[nodiscard]] const VolumeSet& volumes() const noexcept { return *volumes_; }
    [[nodiscard]] std::shared_ptr<const VolumeSet> volumes_ptr() const noexcept { return volumes_; }

    // Decode tagged rows into named points
    [[nodiscard]] std::vector<Point> to_points(const Draws& draws) const;

    [[nodiscard]] std::vector<Point> sample_points(int n, Random& rng) const;

private:
    static std::vector<Sampler> resolve(const VolumeSet& volumes,
                                        const SpecMap& specs,
                                        const TransformMap& transforms);
    static std::vector<double> normalize(std::vector<double> weights, size_t count);
    static Sampler mix(const std::vector<Sampler>& per_volume, const std::vector<double>& weights);

    std::shared_ptr<const VolumeSet> volumes_;
    std::vector<Sampler> samplers_;
    std::vector<double> weights_;
    Sampler combined_;
};

}  // namespace cs::sampling
