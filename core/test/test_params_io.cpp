#include "test.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "cs/core/params/CropParamsIO.hpp"
#include "cs/core/util/LoadJson.hpp"

using namespace cs;
using namespace cs::params;

TEST(ParamsIO, RegionFilterDefaults)
{
    auto p = parseRegionFilter(nlohmann::json::object());
    EXPECT_EQ(p.axis, std::string("iline"));
    EXPECT_FLOAT_EQ(p.low, 0.0);
    EXPECT_FLOAT_EQ(p.high, 1.0);
    EXPECT_FALSE(p.each.has_value());
    EXPECT_FALSE(p.to_cube);
}

TEST(ParamsIO, RegionFilterReadsEveryField)
{
    auto j = nlohmann::json::parse(R"({"axis": "x", "low": 0.1, "high": "0.9",
                                       "each": 50, "each_start": 70, "to_cube": true})");
    auto p = parseRegionFilter(j);
    EXPECT_EQ(p.axis, std::string("x"));
    EXPECT_FLOAT_EQ(p.low, 0.1);
    EXPECT_FLOAT_EQ(p.high, 0.9);
    ASSERT_TRUE(p.each.has_value());
    EXPECT_EQ(*p.each, 50);
    EXPECT_EQ(*p.each_start, 70);
    EXPECT_TRUE(p.to_cube);

    auto back = parseRegionFilter(toJson(p));
    EXPECT_EQ(*back.each_start, 70);
}

TEST(ParamsIO, GridRequiresVolumeAndCrop)
{
    EXPECT_THROW_AS((parseGridParams(nlohmann::json::parse(R"({"volume": "A"})"))), std::runtime_error);

    auto p = parseGridParams(nlohmann::json::parse(
        R"({"volume": "A", "crop_shape": [1, 64, 64], "xlines": [10, 90], "batch_size": 8})"));
    EXPECT_EQ(p.volume, std::string("A"));
    EXPECT_TRUE(p.crop_shape == cv::Vec3i(1, 64, 64));
    EXPECT_FALSE(p.ranges[0].has_value());
    ASSERT_TRUE(p.ranges[1].has_value());
    EXPECT_EQ(p.ranges[1]->low, 10);
    EXPECT_EQ(p.ranges[1]->high, 90);
    EXPECT_FALSE(p.strides.has_value());
    EXPECT_EQ(p.batch_size, 8);
}

TEST(ParamsIO, MalformedShapesAreRejected)
{
    EXPECT_THROW_AS((parseGridParams(nlohmann::json::parse(R"({"volume": "A", "crop_shape": [1, 64]})"))),
                    std::runtime_error);
    EXPECT_THROW_AS((parseGridParams(nlohmann::json::parse(
                        R"({"volume": "A", "crop_shape": [1, 2, 3], "ilines": [0]})"))),
                    std::runtime_error);
}

TEST(ParamsIO, FrontierAndMixture)
{
    auto f = parseFrontierParams(nlohmann::json::parse(R"({"crop_shape": [2, 32, 16], "stride": 6})"));
    EXPECT_TRUE(f.crop_shape == cv::Vec3i(2, 32, 16));
    EXPECT_EQ(f.stride, 6);
    EXPECT_EQ(f.batch_size, 16);

    auto m = parseMixtureParams(nlohmann::json::parse(R"({"mode": "uniform", "weights": [1, 3]})"));
    EXPECT_EQ(m.mode, std::string("uniform"));
    ASSERT_EQ(m.weights.size(), size_t(2));
    EXPECT_FLOAT_EQ(m.weights[1], 3.0);
    EXPECT_EQ(toJson(m)["bins"][0].get<int>(), 100);
}

TEST(ParamsIO, VolumeShapeWithEmptyTraces)
{
    auto v = parseVolumeShape(nlohmann::json::parse(
        R"({"id": "A", "extent": [10, 20, 30], "empty_traces": [[0, 0], [9, 19]]})"));
    EXPECT_EQ(v.id, std::string("A"));
    EXPECT_TRUE(v.extent == cv::Vec3i(10, 20, 30));
    EXPECT_TRUE(v.is_empty_trace(9, 19));
    EXPECT_FALSE(v.is_empty_trace(5, 5));

    EXPECT_THROW_AS((parseVolumeShape(nlohmann::json::parse(
                        R"({"id": "A", "extent": [10, 20, 30], "empty_traces": [[10, 0]]})"))),
                    std::runtime_error);
}

TEST(LoadJson, ReadsFileAndReportsMissing)
{
    const auto path = std::filesystem::temp_directory_path() / "cs_params_io_test.json";
    cs::json::write_json_file(path, nlohmann::json{{"volume", "A"}});
    auto j = cs::json::load_json_file(path);
    EXPECT_EQ(cs::json::string_or(&j, "volume", "none"), std::string("A"));
    EXPECT_FLOAT_EQ(cs::json::number_or(&j, "missing", 2.5), 2.5);
    std::filesystem::remove(path);

    EXPECT_THROW_AS((cs::json::load_json_file(path)), std::runtime_error);
}
