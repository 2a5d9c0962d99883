#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>

namespace cs {

// Geometry of one cube as seen by the sampling code.
// extent is [len0, len1, len2] (iline, xline, depth).
// empty_traces is len0 x len1, nonzero where the trace carries no data.
struct VolumeShape {
    std::string id;
    cv::Vec3i extent{0, 0, 0};
    cv::Mat_<uint8_t> empty_traces;

    [[nodiscard]] bool is_empty_trace(int i, int x) const
    {
        return empty_traces(i, x) != 0;
    }
};

// Builds a VolumeShape, allocating an all-valid trace mask when none is given.
// Throws InvalidRange on non-positive extents or a mask of the wrong size.
VolumeShape make_volume_shape(std::string id,
                              const cv::Vec3i& extent,
                              cv::Mat_<uint8_t> empty_traces = {});

// Ordered, immutable-once-shared registry of volume geometries.
// Insertion order is dataset order; the index of a volume is the tag
// carried by mixture samplers.
class VolumeSet final {
public:
    VolumeSet() = default;

    void add(VolumeShape shape);

    [[nodiscard]] size_t size() const noexcept { return volumes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return volumes_.empty(); }

    [[nodiscard]] const VolumeShape& at(size_t index) const;
    [[nodiscard]] const VolumeShape& at(const std::string& id) const;
    [[nodiscard]] std::shared_ptr<const VolumeShape> get(const std::string& id) const;
    [[nodiscard]] std::optional<size_t> index_of(const std::string& id) const;
    [[nodiscard]] const std::vector<std::string>& ids() const noexcept { return ids_; }

private:
    std::vector<std::shared_ptr<const VolumeShape>> volumes_;
    std::vector<std::string> ids_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace cs
