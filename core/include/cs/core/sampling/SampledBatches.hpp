#pragma once

#include "cs/core/sampling/Sampler.hpp"
#include "cs/core/sampling/SamplerMixture.hpp"
#include "cs/core/types/Point.hpp"
#include "cs/core/util/BatchGenerator.hpp"
#include "cs/core/util/Random.hpp"

namespace cs::sampling {

// Draws batch_size * n_iters tagged points up front and pages them out in
// exactly n_iters batches. The sampler must draw 4-column rows tagged with
// indices of the mixture's volumes, e.g. a RegionFilter applied to
// mixture.sampler().
BatchGenerator<Point> make_sampled_batches(const SamplerMixture& mixture,
                                           const Sampler& sampler,
                                           int batch_size,
                                           int n_iters,
                                           Random& rng);

// Same, drawing from the mixture's own combined sampler
BatchGenerator<Point> make_sampled_batches(const SamplerMixture& mixture,
                                           int batch_size,
                                           int n_iters,
                                           Random& rng);

}  // namespace cs::sampling
