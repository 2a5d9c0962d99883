// LoadJson.hpp - JSON loading and validation utilities for cubesampler
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <string>
#include <initializer_list>

#include <opencv2/core.hpp>

namespace cs::json {

nlohmann::json load_json_file(const std::filesystem::path& path);

void write_json_file(const std::filesystem::path& path, const nlohmann::json& j, int indent = 2);

// ============ VALIDATION ============

/**
 * Ensure all required fields exist in a JSON object.
 * @param json The JSON object to validate
 * @param fields List of required field names
 * @param context Description for error messages (e.g., file path)
 * @throws std::runtime_error listing the first missing field
 */
void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context);

// ============ SAFE ACCESS HELPERS ============

// Returns a number if present (float/int or string convertible), else def.
double number_or(const nlohmann::json* m, const char* key, double def);

// Returns a string if present and of string type, else def.
std::string string_or(const nlohmann::json* m, const char* key, const std::string& def);

// Reads a three-element integer array.
// @throws std::runtime_error if the value is not an array of three integers
cv::Vec3i vec3i(const nlohmann::json& value, const std::string& context);

// Reads a three-element number array.
cv::Vec3d vec3d(const nlohmann::json& value, const std::string& context);

} // namespace cs::json
