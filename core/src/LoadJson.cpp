#include "cs/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace cs::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

void write_json_file(const std::filesystem::path& path, const nlohmann::json& j, int indent)
{
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write JSON file: " + path.string());
    }
    file << j.dump(indent) << '\n';
    if (!file) {
        throw std::runtime_error("Failed writing JSON file: " + path.string());
    }
}

void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context)
{
    for (const char* field : fields) {
        if (!json.contains(field)) {
            throw std::runtime_error(context + " missing required field: " + field);
        }
    }
}

double number_or(const nlohmann::json* m, const char* key, double def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_number_float())   return it->get<double>();
    if (it->is_number_integer()) return static_cast<double>(it->get<int64_t>());
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::logic_error&) {
            return def;
        }
    }
    return def;
}

std::string string_or(const nlohmann::json* m, const char* key, const std::string& def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it != m->end() && it->is_string()) return it->get<std::string>();
    return def;
}

cv::Vec3i vec3i(const nlohmann::json& value, const std::string& context)
{
    if (!value.is_array() || value.size() != 3) {
        throw std::runtime_error(context + " must be an array of three integers");
    }
    cv::Vec3i out;
    for (int i = 0; i < 3; ++i) {
        if (!value[i].is_number_integer()) {
            throw std::runtime_error(context + " must be an array of three integers");
        }
        out[i] = value[i].get<int>();
    }
    return out;
}

cv::Vec3d vec3d(const nlohmann::json& value, const std::string& context)
{
    if (!value.is_array() || value.size() != 3) {
        throw std::runtime_error(context + " must be an array of three numbers");
    }
    cv::Vec3d out;
    for (int i = 0; i < 3; ++i) {
        if (!value[i].is_number()) {
            throw std::runtime_error(context + " must be an array of three numbers");
        }
        out[i] = value[i].get<double>();
    }
    return out;
}

} // namespace cs::json
