#include "cs/core/sampling/SampledBatches.hpp"
#include "cs/core/types/Errors.hpp"
#include "cs/core/util/Logging.hpp"

#include <cstdint>
#include <limits>

namespace cs::sampling {

BatchGenerator<Point> make_sampled_batches(const SamplerMixture& mixture,
                                           const Sampler& sampler,
                                           int batch_size,
                                           int n_iters,
                                           Random& rng)
{
    if (batch_size <= 0 || n_iters <= 0) {
        throw InvalidRange("batch_size and n_iters must be positive");
    }

    const int64_t total = static_cast<int64_t>(batch_size) * n_iters;
    if (total > std::numeric_limits<int>::max()) {
        throw InvalidRange("Requested " + std::to_string(total) + " points, more than one draw can hold");
    }

    const Draws draws = sampler.sample(static_cast<int>(total), rng);
    auto points = mixture.to_points(draws);
    Logger()->debug("Drew {} points for {} batches of {}", points.size(), n_iters, batch_size);
    return BatchGenerator<Point>(std::move(points), static_cast<size_t>(batch_size));
}

BatchGenerator<Point> make_sampled_batches(const SamplerMixture& mixture,
                                           int batch_size,
                                           int n_iters,
                                           Random& rng)
{
    return make_sampled_batches(mixture, mixture.sampler(), batch_size, n_iters, rng);
}

}  // namespace cs::sampling
