// LoadJson.hpp - JSON loading and field access helpers
#pragma once

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>

namespace stvox::json {

/**
 * Parse a JSON file.
 * @throws std::runtime_error if the file is missing, unreadable or invalid
 */
nlohmann::json load_json_file(const std::filesystem::path& path);

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

// Returns a number if present (float/int or string convertible), else def.
double number_or(const nlohmann::json* m, const char* key, double def);

// Returns a number if present (float/int or string convertible), else nullopt.
std::optional<double> optional_number(const nlohmann::json* m, const char* key);

// Returns a string if present and of string type, else def.
std::string string_or(const nlohmann::json* m, const char* key, const std::string& def);

// Returns a bool if present and of bool type, else def.
bool bool_or(const nlohmann::json* m, const char* key, bool def);

// First key of the list present in the object, else nullptr.
const nlohmann::json* find_any(const nlohmann::json& m, std::initializer_list<const char*> keys);

} // namespace stvox::json
