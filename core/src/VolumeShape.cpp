#include "cs/core/types/VolumeShape.hpp"
#include "cs/core/types/Errors.hpp"

#include <stdexcept>

namespace cs {

VolumeShape make_volume_shape(std::string id,
                              const cv::Vec3i& extent,
                              cv::Mat_<uint8_t> empty_traces)
{
    if (extent[0] <= 0 || extent[1] <= 0 || extent[2] <= 0) {
        throw InvalidRange("Volume '" + id + "' must have positive extents");
    }
    if (empty_traces.empty()) {
        empty_traces = cv::Mat_<uint8_t>(extent[0], extent[1], static_cast<uint8_t>(0));
    } else if (empty_traces.rows != extent[0] || empty_traces.cols != extent[1]) {
        throw InvalidRange("Empty-trace mask of volume '" + id + "' does not match its lateral extent");
    }

    VolumeShape shape;
    shape.id = std::move(id);
    shape.extent = extent;
    shape.empty_traces = empty_traces;
    return shape;
}

void VolumeSet::add(VolumeShape shape)
{
    if (index_.contains(shape.id)) {
        throw std::invalid_argument("Volume '" + shape.id + "' already registered");
    }
    auto validated = make_volume_shape(shape.id, shape.extent, shape.empty_traces);
    index_[validated.id] = volumes_.size();
    ids_.push_back(validated.id);
    volumes_.push_back(std::make_shared<const VolumeShape>(std::move(validated)));
}

const VolumeShape& VolumeSet::at(size_t index) const
{
    if (index >= volumes_.size()) {
        throw std::out_of_range("Volume index " + std::to_string(index) + " outside volume set");
    }
    return *volumes_[index];
}

const VolumeShape& VolumeSet::at(const std::string& id) const
{
    return *get(id);
}

std::shared_ptr<const VolumeShape> VolumeSet::get(const std::string& id) const
{
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("Unknown volume '" + id + "'");
    }
    return volumes_[it->second];
}

std::optional<size_t> VolumeSet::index_of(const std::string& id) const
{
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace cs
