#include "cs/core/params/CropParamsIO.hpp"
#include "cs/core/tiling/GridTiler.hpp"
#include "cs/core/util/LoadJson.hpp"
#include "cs/core/util/Logging.hpp"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>

namespace po = boost::program_options;

namespace {

nlohmann::json vec_json(const cv::Vec3i& v)
{
    return nlohmann::json::array({v[0], v[1], v[2]});
}

}  // namespace

int main(int argc, char** argv)
{
    po::options_description desc("Tile a volume with a regular grid of crops.");
    desc.add_options()
        ("help,h", "Print help")
        ("config,c", po::value<std::string>(), "Grid config file (.json) with \"volumes\" and \"grid\"")
        ("output,o", po::value<std::string>(), "Output anchors file (.json)")
        ("log-level", po::value<std::string>()->default_value("info"), "debug, info, warn, error or off")
        ("log-file", po::value<std::string>(), "Also write the log to this file");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    if (!vm.count("config") || !vm.count("output")) {
        std::cerr << "Error: --config and --output are required." << std::endl;
        return 1;
    }

    const std::string config_path = vm["config"].as<std::string>();
    const std::string output_path = vm["output"].as<std::string>();

    try {
        cs::SetLogLevel(vm["log-level"].as<std::string>());
        if (vm.count("log-file"))
            cs::AddLogFile(vm["log-file"].as<std::string>());

        const nlohmann::json config = cs::json::load_json_file(config_path);
        cs::json::require_fields(config, {"volumes", "grid"}, config_path);

        cs::VolumeSet volumes;
        for (const auto& v : config["volumes"])
            volumes.add(cs::params::parseVolumeShape(v));

        const auto params = cs::params::parseGridParams(config["grid"]);
        auto grid = cs::tiling::make_grid(volumes, params);

        nlohmann::json out;
        out["volume"] = grid.info.volume;
        out["crop_shape"] = vec_json(grid.info.crop_shape);
        out["offsets"] = vec_json(grid.info.offsets);
        out["predict_shape"] = vec_json(grid.info.predict_shape);
        out["range"] = nlohmann::json::array();
        for (const auto& r : grid.info.range)
            out["range"].push_back({r.low, r.high});

        out["pages"] = nlohmann::json::array();
        while (grid.batches.has_next()) {
            nlohmann::json page = nlohmann::json::array();
            for (const auto& crop : grid.batches.next())
                page.push_back(vec_json(crop.origin));
            out["pages"].push_back(std::move(page));
        }

        cs::json::write_json_file(output_path, out);
        cs::Logger()->info("Wrote {} pages of anchors to {}", grid.batches.total_pages(), output_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
