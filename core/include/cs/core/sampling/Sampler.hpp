#pragma once

#include "cs/core/util/Random.hpp"

#include <functional>
#include <memory>
#include <vector>

#include <opencv2/core.hpp>

namespace cs::sampling {

// Rows are points, columns are coordinates
using Draws = cv::Mat_<double>;

// Post-processing applied to a whole block of draws; must keep the shape
using Transform = std::function<Draws(Draws)>;

// Raw draw function of a caller-supplied sampler
using DrawFn = std::function<Draws(int n, Random& rng)>;

namespace detail {
class SamplerNode;
}

// --------------------------------------------------------------------------
// Sampler: immutable, composable distribution over fixed-width points
//
// A Sampler is a cheap handle to a shared, never-mutated node graph plus a
// mixture weight. Every combinator returns a new Sampler and leaves its
// operands untouched, so one Sampler can be reused in any number of
// compositions. Drawing is not re-entrant with respect to the random engine:
// give each thread its own Random.
// --------------------------------------------------------------------------
class Sampler {
public:
    static constexpr int kDefaultMaxIters = 1000;

    // ---- Leaf samplers ----
    static Sampler uniform(std::vector<double> low, std::vector<double> high);
    static Sampler uniform(int dim);  // [0,1)^dim
    static Sampler normal(std::vector<double> mean, std::vector<double> stddev);
    static Sampler normal(int dim);   // standard normal
    static Sampler constant(std::vector<double> value);

    // Histogram estimated from points (one row per point) over the box
    // [low, high); bins has one entry per column. Points outside the box
    // are ignored.
    static Sampler histogram(const Draws& points,
                             std::vector<int> bins,
                             std::vector<double> low,
                             std::vector<double> high);
    static Sampler histogram(const Draws& points, std::vector<int> bins);  // unit box

    static Sampler custom(int dim, DrawFn fn);

    // ---- Properties ----
    [[nodiscard]] int dim() const;
    [[nodiscard]] double weight() const noexcept { return weight_; }

    // ---- Drawing ----
    [[nodiscard]] Draws sample(int n, Random& rng) const;
    [[nodiscard]] Draws sample(int n) const;

    // ---- Algebra ----
    // Same distribution, new mixture weight
    [[nodiscard]] Sampler scale(double weight) const;

    // Mixture: draws come from *this with probability w/(w + other.w).
    // The result carries weight w + other.w, so chained mixtures are
    // associative.
    [[nodiscard]] Sampler combine_or(const Sampler& other) const;

    // Joint draw: columns of *this followed by columns of other
    [[nodiscard]] Sampler combine_and(const Sampler& other) const;

    // Restrict column `axis` to [low, high] by rejection
    [[nodiscard]] Sampler truncate(int axis, double low, double high,
                                   int max_iters = kDefaultMaxIters) const;

    // Restrict every column to [low[i], high[i]] by rejection
    [[nodiscard]] Sampler truncate(const std::vector<double>& low,
                                   const std::vector<double>& high,
                                   int max_iters = kDefaultMaxIters) const;

    // Post-process every draw; failures surface as TransformError on sample()
    [[nodiscard]] Sampler apply(Transform fn) const;

    static Sampler weighted_mixture(const Sampler& s1, double w1,
                                    const Sampler& s2, double w2);

private:
    explicit Sampler(std::shared_ptr<const detail::SamplerNode> node, double weight = 1.0);

    std::shared_ptr<const detail::SamplerNode> node_;
    double weight_ = 1.0;
};

}  // namespace cs::sampling
