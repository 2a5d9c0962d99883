#include "cs/core/sampling/SamplerMixture.hpp"
#include "cs/core/params/CropParams.hpp"
#include "cs/core/types/Errors.hpp"
#include "cs/core/util/Logging.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace cs::sampling {

namespace {

SamplerMixture::SpecMap broadcast(const std::shared_ptr<const VolumeSet>& volumes, const SamplerSpec& spec)
{
    SamplerMixture::SpecMap specs;
    if (!volumes) {
        return specs;
    }
    for (const auto& id : volumes->ids()) {
        specs.emplace(id, spec);
    }
    return specs;
}

const std::shared_ptr<const VolumeSet>& require_volumes(const std::shared_ptr<const VolumeSet>& volumes)
{
    if (!volumes || volumes->empty()) {
        throw InvalidRange("Sampler mixture needs at least one volume");
    }
    return volumes;
}

Sampler histogram_sampler(const HistogramSpec& spec, const VolumeShape& volume)
{
    if (spec.surfaces.empty()) {
        throw InvalidRange("Volume '" + volume.id + "' has no labeled surfaces to build a histogram from");
    }

    std::vector<Sampler> parts;
    parts.reserve(spec.surfaces.size());
    for (const auto& surface : spec.surfaces) {
        if (surface.cols != 3) {
            throw InvalidRange("Labeled surface points must have three columns");
        }
        cv::Mat_<double> normalized(surface.rows, 3);
        for (int r = 0; r < surface.rows; ++r)
            for (int c = 0; c < 3; ++c)
                normalized(r, c) = surface(r, c) / volume.extent[c];
        parts.push_back(Sampler::histogram(normalized, {spec.bins[0], spec.bins[1], spec.bins[2]}));
    }

    // Every surface contributes with the same weight
    Sampler combined = parts.front();
    for (size_t i = 1; i < parts.size(); ++i)
        combined = combined.combine_or(parts[i]);
    return combined.scale(1.0);
}

}  // namespace

Sampler make_volume_sampler(const SamplerSpec& spec, const VolumeShape& volume)
{
    return std::visit([&](const auto& s) -> Sampler {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, HistogramSpec>) {
            return histogram_sampler(s, volume);
        } else if constexpr (std::is_same_v<T, UniformSpec>) {
            return Sampler::uniform({s.low[0], s.low[1], s.low[2]},
                                    {s.high[0], s.high[1], s.high[2]});
        } else {
            if (s.sampler.dim() != 3) {
                throw InvalidRange("Custom sampler for volume '" + volume.id + "' must draw 3-D points");
            }
            return s.sampler;
        }
    }, spec);
}

SamplerSpec make_sampler_spec(const params::MixtureParams& p, std::vector<cv::Mat_<double>> surfaces)
{
    if (p.mode == "hist" || p.mode == "horizon") {
        return HistogramSpec{std::move(surfaces), p.bins};
    }
    if (p.mode == "uniform" || p.mode == "numpy") {
        return UniformSpec{p.low, p.high};
    }
    throw std::invalid_argument("Unknown sampler mode '" + p.mode + "'");
}

SamplerMixture::SamplerMixture(std::shared_ptr<const VolumeSet> volumes,
                               const SamplerSpec& spec,
                               std::vector<double> weights,
                               const TransformMap& transforms)
    : SamplerMixture(volumes, broadcast(volumes, spec), std::move(weights), transforms)
{
}

SamplerMixture::SamplerMixture(std::shared_ptr<const VolumeSet> volumes,
                               const SpecMap& specs,
                               std::vector<double> weights,
                               const TransformMap& transforms)
    : volumes_(require_volumes(volumes))
    , samplers_(resolve(*volumes_, specs, transforms))
    , weights_(normalize(std::move(weights), volumes_->size()))
    , combined_(mix(samplers_, weights_))
{
    for (size_t i = 0; i < volumes_->size(); ++i) {
        Logger()->debug("Mixture weight for volume '{}': {}", volumes_->at(i).id, weights_[i]);
    }
    Logger()->info("Built sampler mixture over {} volumes", volumes_->size());
}

std::vector<Sampler> SamplerMixture::resolve(const VolumeSet& volumes,
                                             const SpecMap& specs,
                                             const TransformMap& transforms)
{
    std::vector<Sampler> samplers;
    samplers.reserve(volumes.size());
    for (size_t i = 0; i < volumes.size(); ++i) {
        const VolumeShape& volume = volumes.at(i);
        auto it = specs.find(volume.id);
        if (it == specs.end()) {
            throw std::invalid_argument("No sampler kind given for volume '" + volume.id + "'");
        }

        Sampler s = make_volume_sampler(it->second, volume).truncate({0.0, 0.0, 0.0}, {1.0, 1.0, 1.0});
        if (auto t = transforms.find(volume.id); t != transforms.end()) {
            s = s.apply(t->second);
        }
        samplers.push_back(s);
    }
    return samplers;
}

std::vector<double> SamplerMixture::normalize(std::vector<double> weights, size_t count)
{
    if (weights.empty()) {
        return std::vector<double>(count, 1.0 / static_cast<double>(count));
    }
    if (weights.size() != count) {
        throw InvalidRange("Expected " + std::to_string(count) + " mixture weights, got " +
                           std::to_string(weights.size()));
    }

    double total = 0.0;
    for (double w : weights) {
        if (!std::isfinite(w) || w < 0.0) {
            throw InvalidRange("Mixture weights must be finite and non-negative");
        }
        total += w;
    }
    if (!(total > 0.0)) {
        throw InvalidRange("Mixture weights must not all be zero");
    }
    for (double& w : weights)
        w /= total;
    return weights;
}

Sampler SamplerMixture::mix(const std::vector<Sampler>& per_volume, const std::vector<double>& weights)
{
    std::optional<Sampler> combined;
    for (size_t i = 0; i < per_volume.size(); ++i) {
        if (weights[i] <= 0.0)
            continue;
        Sampler tagged = Sampler::constant({static_cast<double>(i)})
                             .combine_and(per_volume[i])
                             .scale(weights[i]);
        combined = combined ? combined->combine_or(tagged) : tagged;
    }
    return *combined;
}

const Sampler& SamplerMixture::volume_sampler(const std::string& id) const
{
    auto index = volumes_->index_of(id);
    if (!index) {
        throw std::out_of_range("Unknown volume '" + id + "'");
    }
    return samplers_[*index];
}

std::vector<Point> SamplerMixture::to_points(const Draws& draws) const
{
    if (draws.rows > 0 && draws.cols != 4) {
        throw std::invalid_argument("Tagged draws must have four columns");
    }
    std::vector<Point> points;
    points.reserve(draws.rows);
    for (int r = 0; r < draws.rows; ++r) {
        const auto index = static_cast<size_t>(std::lround(draws(r, 0)));
        points.push_back({volumes_->at(index).id, {draws(r, 1), draws(r, 2), draws(r, 3)}});
    }
    return points;
}

std::vector<Point> SamplerMixture::sample_points(int n, Random& rng) const
{
    return to_points(combined_.sample(n, rng));
}

}  // namespace cs::sampling
