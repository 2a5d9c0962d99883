#include "cs/core/sampling/Sampler.hpp"
#include "cs/core/types/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numeric>
#include <random>
#include <string>

namespace cs::sampling {

namespace detail {

class SamplerNode {
public:
    virtual ~SamplerNode() = default;
    virtual int dim() const = 0;
    // Called with n > 0 only; must return exactly n rows of dim() columns
    virtual Draws draw(int n, Random& rng) const = 0;
};

}  // namespace detail

namespace {

using detail::SamplerNode;
using NodePtr = std::shared_ptr<const SamplerNode>;

Draws draw_rows(const SamplerNode& node, int n, Random& rng)
{
    if (n <= 0) {
        return Draws(0, node.dim());
    }
    return node.draw(n, rng);
}

void require_weight(double w)
{
    if (!std::isfinite(w) || w < 0.0) {
        throw InvalidRange("Sampler weight must be finite and non-negative, got " + std::to_string(w));
    }
}

// ---- Leaves -----------------------------------------------------------------

class UniformNode final : public SamplerNode {
public:
    UniformNode(std::vector<double> low, std::vector<double> high)
        : low_(std::move(low)), high_(std::move(high)) {}

    int dim() const override { return static_cast<int>(low_.size()); }

    Draws draw(int n, Random& rng) const override
    {
        Draws out(n, dim());
        for (int r = 0; r < n; ++r)
            for (int c = 0; c < dim(); ++c)
                out(r, c) = rng.randDouble(low_[c], high_[c]);
        return out;
    }

private:
    std::vector<double> low_, high_;
};

class NormalNode final : public SamplerNode {
public:
    NormalNode(std::vector<double> mean, std::vector<double> stddev)
        : mean_(std::move(mean)), stddev_(std::move(stddev)) {}

    int dim() const override { return static_cast<int>(mean_.size()); }

    Draws draw(int n, Random& rng) const override
    {
        Draws out(n, dim());
        for (int c = 0; c < dim(); ++c) {
            std::normal_distribution<double> dist(mean_[c], stddev_[c]);
            for (int r = 0; r < n; ++r)
                out(r, c) = dist(rng);
        }
        return out;
    }

private:
    std::vector<double> mean_, stddev_;
};

class ConstantNode final : public SamplerNode {
public:
    explicit ConstantNode(std::vector<double> value) : value_(std::move(value)) {}

    int dim() const override { return static_cast<int>(value_.size()); }

    Draws draw(int n, Random&) const override
    {
        Draws out(n, dim());
        for (int r = 0; r < n; ++r)
            for (int c = 0; c < dim(); ++c)
                out(r, c) = value_[c];
        return out;
    }

private:
    std::vector<double> value_;
};

// Piecewise-uniform density: a bin is picked proportionally to its count,
// then a point is drawn uniformly inside it. Only occupied bins are stored.
class HistogramNode final : public SamplerNode {
public:
    HistogramNode(const Draws& points, std::vector<int> bins,
                  std::vector<double> low, std::vector<double> high)
        : bins_(std::move(bins)), low_(std::move(low)), high_(std::move(high))
    {
        const int d = static_cast<int>(bins_.size());

        std::vector<size_t> strides(d, 1);
        for (int c = d - 2; c >= 0; --c)
            strides[c] = strides[c + 1] * static_cast<size_t>(bins_[c + 1]);

        std::vector<size_t> ids;
        ids.reserve(points.rows);
        for (int r = 0; r < points.rows; ++r) {
            size_t flat = 0;
            bool inside = true;
            for (int c = 0; c < d; ++c) {
                const double v = points(r, c);
                if (!(v >= low_[c] && v <= high_[c])) {
                    inside = false;
                    break;
                }
                const double width = (high_[c] - low_[c]) / bins_[c];
                int b = static_cast<int>(std::floor((v - low_[c]) / width));
                b = std::clamp(b, 0, bins_[c] - 1);
                flat += static_cast<size_t>(b) * strides[c];
            }
            if (inside)
                ids.push_back(flat);
        }

        if (ids.empty()) {
            throw InvalidRange("Histogram sampler has no points inside its range");
        }

        std::sort(ids.begin(), ids.end());
        size_t running = 0;
        for (size_t i = 0; i < ids.size();) {
            size_t j = i;
            while (j < ids.size() && ids[j] == ids[i])
                ++j;
            running += j - i;
            bin_ids_.push_back(ids[i]);
            cumulative_.push_back(running);
            i = j;
        }
        strides_ = std::move(strides);
    }

    int dim() const override { return static_cast<int>(bins_.size()); }

    Draws draw(int n, Random& rng) const override
    {
        const size_t total = cumulative_.back();
        Draws out(n, dim());
        for (int r = 0; r < n; ++r) {
            const auto pick = static_cast<size_t>(rng.randDouble() * static_cast<double>(total));
            auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), pick);
            size_t flat = bin_ids_[static_cast<size_t>(it - cumulative_.begin())];
            for (int c = 0; c < dim(); ++c) {
                const size_t b = flat / strides_[c];
                flat %= strides_[c];
                const double width = (high_[c] - low_[c]) / bins_[c];
                const double lo = low_[c] + static_cast<double>(b) * width;
                out(r, c) = rng.randDouble(lo, lo + width);
            }
        }
        return out;
    }

private:
    std::vector<int> bins_;
    std::vector<double> low_, high_;
    std::vector<size_t> strides_;
    std::vector<size_t> bin_ids_;
    std::vector<size_t> cumulative_;
};

class CustomNode final : public SamplerNode {
public:
    CustomNode(int dim, DrawFn fn) : dim_(dim), fn_(std::move(fn)) {}

    int dim() const override { return dim_; }

    Draws draw(int n, Random& rng) const override
    {
        Draws out = fn_(n, rng);
        if (out.rows != n || out.cols != dim_) {
            throw SamplingError("Custom sampler returned " + std::to_string(out.rows) + "x" +
                                std::to_string(out.cols) + " draws, expected " +
                                std::to_string(n) + "x" + std::to_string(dim_));
        }
        return out;
    }

private:
    int dim_;
    DrawFn fn_;
};

// ---- Combinators ------------------------------------------------------------

class OrNode final : public SamplerNode {
public:
    OrNode(NodePtr first, NodePtr second, double p_first)
        : first_(std::move(first)), second_(std::move(second)), p_first_(p_first) {}

    int dim() const override { return first_->dim(); }

    Draws draw(int n, Random& rng) const override
    {
        std::vector<uint8_t> from_first(n);
        int n_first = 0;
        for (int r = 0; r < n; ++r) {
            from_first[r] = rng.randDouble() < p_first_ ? 1 : 0;
            n_first += from_first[r];
        }

        Draws a = draw_rows(*first_, n_first, rng);
        Draws b = draw_rows(*second_, n - n_first, rng);

        Draws out(n, dim());
        int ia = 0, ib = 0;
        for (int r = 0; r < n; ++r) {
            if (from_first[r])
                a.row(ia++).copyTo(out.row(r));
            else
                b.row(ib++).copyTo(out.row(r));
        }
        return out;
    }

private:
    NodePtr first_, second_;
    double p_first_;
};

class AndNode final : public SamplerNode {
public:
    AndNode(NodePtr left, NodePtr right) : left_(std::move(left)), right_(std::move(right)) {}

    int dim() const override { return left_->dim() + right_->dim(); }

    Draws draw(int n, Random& rng) const override
    {
        Draws a = left_->draw(n, rng);
        Draws b = right_->draw(n, rng);
        cv::Mat joined;
        cv::hconcat(a, b, joined);
        return joined;
    }

private:
    NodePtr left_, right_;
};

class TruncateNode final : public SamplerNode {
public:
    TruncateNode(NodePtr inner, std::vector<double> low, std::vector<double> high, int max_iters)
        : inner_(std::move(inner)), low_(std::move(low)), high_(std::move(high)), max_iters_(max_iters) {}

    int dim() const override { return inner_->dim(); }

    Draws draw(int n, Random& rng) const override
    {
        Draws out(n, dim());
        int collected = 0;
        double drawn_total = 0.0;
        double accepted_total = 0.0;

        for (int iter = 0; collected < n; ++iter) {
            if (iter >= max_iters_) {
                throw SamplingError("Truncated sampler accepted only " + std::to_string(collected) +
                                    " of " + std::to_string(n) + " draws after " +
                                    std::to_string(max_iters_) + " iterations");
            }

            const double rate = drawn_total > 0.0
                ? std::max(accepted_total / drawn_total, 1e-3)
                : 1.0;
            const double wanted = std::ceil((n - collected) / rate * 1.1);
            const int batch = static_cast<int>(std::clamp(wanted, 1.0, 1e6));

            Draws raw = inner_->draw(batch, rng);
            drawn_total += batch;
            for (int r = 0; r < raw.rows && collected < n; ++r) {
                if (!accepts(raw, r))
                    continue;
                raw.row(r).copyTo(out.row(collected++));
                accepted_total += 1.0;
            }
        }
        return out;
    }

private:
    bool accepts(const Draws& raw, int r) const
    {
        for (int c = 0; c < dim(); ++c) {
            const double v = raw(r, c);
            if (!(v >= low_[c] && v <= high_[c]))
                return false;
        }
        return true;
    }

    NodePtr inner_;
    std::vector<double> low_, high_;
    int max_iters_;
};

class ApplyNode final : public SamplerNode {
public:
    ApplyNode(NodePtr inner, Transform fn) : inner_(std::move(inner)), fn_(std::move(fn)) {}

    int dim() const override { return inner_->dim(); }

    Draws draw(int n, Random& rng) const override
    {
        Draws raw = inner_->draw(n, rng);
        Draws out;
        try {
            out = fn_(raw);
        } catch (const TransformError&) {
            throw;
        } catch (const std::exception& e) {
            throw TransformError(std::string("Sampler transform failed: ") + e.what());
        }
        if (out.rows != n || out.cols != dim()) {
            throw TransformError("Sampler transform returned " + std::to_string(out.rows) + "x" +
                                 std::to_string(out.cols) + " draws, expected " +
                                 std::to_string(n) + "x" + std::to_string(dim()));
        }
        return out;
    }

private:
    NodePtr inner_;
    Transform fn_;
};

}  // namespace

// ---- Sampler ----------------------------------------------------------------

Sampler::Sampler(std::shared_ptr<const detail::SamplerNode> node, double weight)
    : node_(std::move(node)), weight_(weight)
{
}

Sampler Sampler::uniform(std::vector<double> low, std::vector<double> high)
{
    if (low.empty() || low.size() != high.size()) {
        throw InvalidRange("Uniform sampler bounds must be non-empty and of equal length");
    }
    for (size_t i = 0; i < low.size(); ++i) {
        if (!(high[i] > low[i])) {
            throw InvalidRange("Uniform sampler needs high > low on every axis");
        }
    }
    return Sampler(std::make_shared<UniformNode>(std::move(low), std::move(high)));
}

Sampler Sampler::uniform(int dim)
{
    return uniform(std::vector<double>(dim, 0.0), std::vector<double>(dim, 1.0));
}

Sampler Sampler::normal(std::vector<double> mean, std::vector<double> stddev)
{
    if (mean.empty() || mean.size() != stddev.size()) {
        throw InvalidRange("Normal sampler parameters must be non-empty and of equal length");
    }
    for (double s : stddev) {
        if (!(s > 0.0)) {
            throw InvalidRange("Normal sampler needs positive standard deviations");
        }
    }
    return Sampler(std::make_shared<NormalNode>(std::move(mean), std::move(stddev)));
}

Sampler Sampler::normal(int dim)
{
    return normal(std::vector<double>(dim, 0.0), std::vector<double>(dim, 1.0));
}

Sampler Sampler::constant(std::vector<double> value)
{
    if (value.empty()) {
        throw InvalidRange("Constant sampler needs at least one coordinate");
    }
    return Sampler(std::make_shared<ConstantNode>(std::move(value)));
}

Sampler Sampler::histogram(const Draws& points,
                           std::vector<int> bins,
                           std::vector<double> low,
                           std::vector<double> high)
{
    if (bins.empty() || static_cast<int>(bins.size()) != points.cols ||
        low.size() != bins.size() || high.size() != bins.size()) {
        throw InvalidRange("Histogram sampler needs one bin count and bound pair per column");
    }
    for (size_t i = 0; i < bins.size(); ++i) {
        if (bins[i] <= 0 || !(high[i] > low[i])) {
            throw InvalidRange("Histogram sampler needs positive bins and high > low");
        }
    }
    return Sampler(std::make_shared<HistogramNode>(points, std::move(bins), std::move(low), std::move(high)));
}

Sampler Sampler::histogram(const Draws& points, std::vector<int> bins)
{
    const size_t d = bins.size();
    return histogram(points, std::move(bins), std::vector<double>(d, 0.0), std::vector<double>(d, 1.0));
}

Sampler Sampler::custom(int dim, DrawFn fn)
{
    if (dim <= 0 || !fn) {
        throw InvalidRange("Custom sampler needs a positive dimension and a draw function");
    }
    return Sampler(std::make_shared<CustomNode>(dim, std::move(fn)));
}

int Sampler::dim() const
{
    return node_->dim();
}

Draws Sampler::sample(int n, Random& rng) const
{
    return draw_rows(*node_, n, rng);
}

Draws Sampler::sample(int n) const
{
    return sample(n, Random::instance());
}

Sampler Sampler::scale(double weight) const
{
    require_weight(weight);
    return Sampler(node_, weight);
}

Sampler Sampler::combine_or(const Sampler& other) const
{
    if (dim() != other.dim()) {
        throw InvalidRange("Cannot mix samplers of dimension " + std::to_string(dim()) +
                           " and " + std::to_string(other.dim()));
    }
    const double total = weight_ + other.weight_;
    if (!(total > 0.0)) {
        throw InvalidRange("Mixture needs at least one branch with positive weight");
    }
    return Sampler(std::make_shared<OrNode>(node_, other.node_, weight_ / total), total);
}

Sampler Sampler::combine_and(const Sampler& other) const
{
    return Sampler(std::make_shared<AndNode>(node_, other.node_), weight_ * other.weight_);
}

Sampler Sampler::truncate(int axis, double low, double high, int max_iters) const
{
    if (axis < 0 || axis >= dim()) {
        throw InvalidRange("Truncation axis " + std::to_string(axis) + " outside sampler dimension");
    }
    std::vector<double> lows(dim(), -std::numeric_limits<double>::infinity());
    std::vector<double> highs(dim(), std::numeric_limits<double>::infinity());
    lows[axis] = low;
    highs[axis] = high;
    return truncate(lows, highs, max_iters);
}

Sampler Sampler::truncate(const std::vector<double>& low,
                          const std::vector<double>& high,
                          int max_iters) const
{
    if (static_cast<int>(low.size()) != dim() || static_cast<int>(high.size()) != dim()) {
        throw InvalidRange("Truncation bounds must have one entry per sampler column");
    }
    for (int c = 0; c < dim(); ++c) {
        if (std::isnan(low[c]) || std::isnan(high[c]) || !(high[c] > low[c])) {
            throw InvalidRange("Truncation slab on axis " + std::to_string(c) + " has zero width");
        }
    }
    if (max_iters <= 0) {
        throw InvalidRange("Truncation needs a positive iteration budget");
    }
    return Sampler(std::make_shared<TruncateNode>(node_, low, high, max_iters), weight_);
}

Sampler Sampler::apply(Transform fn) const
{
    if (!fn) {
        throw InvalidRange("Cannot apply an empty transform");
    }
    return Sampler(std::make_shared<ApplyNode>(node_, std::move(fn)), weight_);
}

Sampler Sampler::weighted_mixture(const Sampler& s1, double w1, const Sampler& s2, double w2)
{
    return s1.scale(w1).combine_or(s2.scale(w2));
}

}  // namespace cs::sampling
