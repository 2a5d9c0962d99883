#include "cs/core/params/CropParamsIO.hpp"
#include "cs/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace cs::params {

namespace {

nlohmann::json to_array(const cv::Vec3i& v)
{
    return nlohmann::json::array({v[0], v[1], v[2]});
}

nlohmann::json to_array(const cv::Vec3d& v)
{
    return nlohmann::json::array({v[0], v[1], v[2]});
}

AxisRange parse_range(const nlohmann::json& j, const std::string& context)
{
    if (!j.is_array() || j.size() != 2 || !j[0].is_number_integer() || !j[1].is_number_integer()) {
        throw std::runtime_error(context + " must be a [low, high] integer pair");
    }
    return {j[0].get<int>(), j[1].get<int>()};
}

}  // namespace

RegionFilterParams parseRegionFilter(const nlohmann::json& j)
{
    RegionFilterParams p;
    p.axis = json::string_or(&j, "axis", p.axis);
    p.low = json::number_or(&j, "low", p.low);
    p.high = json::number_or(&j, "high", p.high);
    if (j.contains("each") && !j["each"].is_null())
        p.each = j["each"].get<int>();
    if (j.contains("each_start") && !j["each_start"].is_null())
        p.each_start = j["each_start"].get<int>();
    p.to_cube = j.value("to_cube", p.to_cube);
    return p;
}

GridParams parseGridParams(const nlohmann::json& j)
{
    json::require_fields(j, {"volume", "crop_shape"}, "Grid params");

    GridParams p;
    p.volume = j["volume"].get<std::string>();
    p.crop_shape = json::vec3i(j["crop_shape"], "crop_shape");

    // Missing ranges cover the whole axis once resolved against the volume
    if (j.contains("ilines"))
        p.ranges[0] = parse_range(j["ilines"], "ilines");
    if (j.contains("xlines"))
        p.ranges[1] = parse_range(j["xlines"], "xlines");
    if (j.contains("heights"))
        p.ranges[2] = parse_range(j["heights"], "heights");

    if (j.contains("strides") && !j["strides"].is_null())
        p.strides = json::vec3i(j["strides"], "strides");
    p.batch_size = j.value("batch_size", p.batch_size);
    return p;
}

FrontierParams parseFrontierParams(const nlohmann::json& j)
{
    FrontierParams p;
    if (j.contains("crop_shape"))
        p.crop_shape = json::vec3i(j["crop_shape"], "crop_shape");
    p.stride = j.value("stride", p.stride);
    p.batch_size = j.value("batch_size", p.batch_size);
    return p;
}

MixtureParams parseMixtureParams(const nlohmann::json& j)
{
    MixtureParams p;
    p.mode = json::string_or(&j, "mode", p.mode);
    if (j.contains("weights") && j["weights"].is_array()) {
        for (const auto& w : j["weights"])
            p.weights.push_back(w.get<double>());
    }
    if (j.contains("bins"))
        p.bins = json::vec3i(j["bins"], "bins");
    if (j.contains("low"))
        p.low = json::vec3d(j["low"], "low");
    if (j.contains("high"))
        p.high = json::vec3d(j["high"], "high");
    return p;
}

nlohmann::json toJson(const RegionFilterParams& p)
{
    nlohmann::json j;
    j["axis"] = p.axis;
    j["low"] = p.low;
    j["high"] = p.high;
    if (p.each)
        j["each"] = *p.each;
    if (p.each_start)
        j["each_start"] = *p.each_start;
    j["to_cube"] = p.to_cube;
    return j;
}

nlohmann::json toJson(const GridParams& p)
{
    nlohmann::json j;
    j["volume"] = p.volume;
    j["crop_shape"] = to_array(p.crop_shape);
    const char* keys[3] = {"ilines", "xlines", "heights"};
    for (int a = 0; a < 3; ++a) {
        if (p.ranges[a])
            j[keys[a]] = {p.ranges[a]->low, p.ranges[a]->high};
    }
    if (p.strides)
        j["strides"] = to_array(*p.strides);
    j["batch_size"] = p.batch_size;
    return j;
}

nlohmann::json toJson(const FrontierParams& p)
{
    nlohmann::json j;
    j["crop_shape"] = to_array(p.crop_shape);
    j["stride"] = p.stride;
    j["batch_size"] = p.batch_size;
    return j;
}

nlohmann::json toJson(const MixtureParams& p)
{
    nlohmann::json j;
    j["mode"] = p.mode;
    j["weights"] = p.weights;
    j["bins"] = to_array(p.bins);
    j["low"] = to_array(p.low);
    j["high"] = to_array(p.high);
    return j;
}

VolumeShape parseVolumeShape(const nlohmann::json& j)
{
    json::require_fields(j, {"id", "extent"}, "Volume");
    const auto id = j["id"].get<std::string>();
    const cv::Vec3i extent = json::vec3i(j["extent"], "Volume '" + id + "' extent");

    VolumeShape shape = make_volume_shape(id, extent);
    if (j.contains("empty_traces")) {
        for (const auto& trace : j["empty_traces"]) {
            if (!trace.is_array() || trace.size() != 2) {
                throw std::runtime_error("Volume '" + id + "' empty_traces entries must be [iline, xline]");
            }
            const int i = trace[0].get<int>();
            const int x = trace[1].get<int>();
            if (i < 0 || i >= extent[0] || x < 0 || x >= extent[1]) {
                throw std::runtime_error("Volume '" + id + "' empty trace outside the cube");
            }
            shape.empty_traces(i, x) = 1;
        }
    }
    return shape;
}

}  // namespace cs::params
