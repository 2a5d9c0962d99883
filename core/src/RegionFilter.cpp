#include "cs/core/sampling/RegionFilter.hpp"
#include "cs/core/params/CropParams.hpp"
#include "cs/core/types/Errors.hpp"

#include <cmath>
#include <stdexcept>
#include <type_traits>

namespace cs::sampling {

namespace {

int volume_extent(const VolumeSet& volumes, double tag, int axis)
{
    const auto index = static_cast<size_t>(std::lround(tag));
    return volumes.at(index).extent[axis];
}

void require_volume_set(const std::shared_ptr<const VolumeSet>& volumes)
{
    if (!volumes) {
        throw std::invalid_argument("Region filter needs the volume set of the sampler");
    }
}

void require_tagged(const Sampler& src)
{
    if (src.dim() != 4) {
        throw InvalidRange("Region filter expects tagged 4-column samplers, got dimension " +
                           std::to_string(src.dim()));
    }
}

}  // namespace

Axis parse_axis(const std::string& name)
{
    if (name == "iline" || name == "ilines" || name == "i")
        return Axis::ILine;
    if (name == "xline" || name == "xlines" || name == "x")
        return Axis::XLine;
    if (name == "height" || name == "heights" || name == "h")
        return Axis::Height;
    throw std::invalid_argument("Unknown axis '" + name + "'");
}

std::string axis_name(Axis axis)
{
    switch (axis) {
        case Axis::ILine: return "iline";
        case Axis::XLine: return "xline";
        case Axis::Height: return "height";
    }
    throw std::logic_error("Unhandled axis");
}

int snap_to_tick(int value, int start, int step, int extent)
{
    if (step <= 0 || start < 0) {
        throw InvalidRange("Tick progression needs a positive step and non-negative start");
    }
    if (start >= extent) {
        throw InvalidRange("First tick " + std::to_string(start) + " lies outside extent " +
                           std::to_string(extent));
    }
    const int last = start + ((extent - 1 - start) / step) * step;
    if (value <= start)
        return start;
    if (value >= last)
        return last;

    const int lower = start + ((value - start) / step) * step;
    const int upper = lower + step;
    return (value - lower <= upper - value) ? lower : upper;
}

Sampler decimate(const Sampler& src, Axis axis, int each, int each_start,
                 std::shared_ptr<const VolumeSet> volumes)
{
    require_volume_set(volumes);
    require_tagged(src);
    if (each <= 0 || each_start < 0) {
        throw InvalidRange("Decimation needs each > 0 and each_start >= 0");
    }

    const int a = static_cast<int>(axis);
    for (size_t v = 0; v < volumes->size(); ++v) {
        const auto& volume = volumes->at(v);
        if (each_start >= volume.extent[a]) {
            throw InvalidRange("First " + axis_name(axis) + " tick " + std::to_string(each_start) +
                               " lies outside volume '" + volume.id + "' of extent " +
                               std::to_string(volume.extent[a]));
        }
    }

    return src.apply([volumes, a, each, each_start](Draws draws) {
        for (int r = 0; r < draws.rows; ++r) {
            const int extent = volume_extent(*volumes, draws(r, 0), a);
            const int value = static_cast<int>(std::rint(draws(r, a + 1) * extent));
            draws(r, a + 1) = static_cast<double>(snap_to_tick(value, each_start, each, extent)) / extent;
        }
        return draws;
    });
}

Sampler to_cube(const Sampler& src, std::shared_ptr<const VolumeSet> volumes)
{
    require_volume_set(volumes);
    require_tagged(src);

    return src.apply([volumes](Draws draws) {
        for (int r = 0; r < draws.rows; ++r) {
            for (int a = 0; a < 3; ++a) {
                const int extent = volume_extent(*volumes, draws(r, 0), a);
                draws(r, a + 1) = std::rint(draws(r, a + 1) * extent);
            }
        }
        return draws;
    });
}

RegionFilter RegionFilter::from_params(const params::RegionFilterParams& p, Transform post)
{
    const Axis axis = parse_axis(p.axis);

    RegionFilter filter;
    if (p.low != 0.0 || p.high != 1.0) {
        filter.truncate(axis, p.low, p.high);
    }
    if (p.each) {
        filter.decimate(axis, *p.each, p.each_start.value_or(*p.each));
    }
    if (p.to_cube) {
        filter.to_cube();
    }
    if (post) {
        filter.post(std::move(post));
    }
    return filter;
}

RegionFilter& RegionFilter::truncate(Axis axis, double low, double high)
{
    if (std::isnan(low) || std::isnan(high) || !(high > low)) {
        throw InvalidRange("Region filter slab [" + std::to_string(low) + ", " +
                           std::to_string(high) + "] has zero width");
    }
    steps_.emplace_back(Truncation{axis, low, high});
    return *this;
}

RegionFilter& RegionFilter::decimate(Axis axis, int each, int each_start)
{
    if (each <= 0 || each_start < 0) {
        throw InvalidRange("Decimation needs each > 0 and each_start >= 0");
    }
    steps_.emplace_back(Decimation{axis, each, each_start});
    return *this;
}

RegionFilter& RegionFilter::to_cube()
{
    steps_.emplace_back(ToCube{});
    return *this;
}

RegionFilter& RegionFilter::post(Transform fn)
{
    if (!fn) {
        throw std::invalid_argument("Region filter post-processing must be callable");
    }
    steps_.emplace_back(Post{std::move(fn)});
    return *this;
}

Sampler RegionFilter::apply(const Sampler& src, std::shared_ptr<const VolumeSet> volumes) const
{
    Sampler out = src;
    for (const auto& step : steps_) {
        out = std::visit([&](const auto& s) -> Sampler {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, Truncation>) {
                return out.truncate(static_cast<int>(s.axis) + 1, s.low, s.high);
            } else if constexpr (std::is_same_v<T, Decimation>) {
                return sampling::decimate(out, s.axis, s.each, s.each_start, volumes);
            } else if constexpr (std::is_same_v<T, ToCube>) {
                return sampling::to_cube(out, volumes);
            } else {
                return out.apply(s.fn);
            }
        }, step);
    }
    return out;
}

}  // namespace cs::sampling
