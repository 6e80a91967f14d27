/**
 * @file json_utils.h
 * @brief voxgate - JSON file helpers
 */

#ifndef VOXGATE_JSON_UTILS_H
#define VOXGATE_JSON_UTILS_H

#include <nlohmann/json.hpp>
#include <string>

#include "voxgate/core/vg_error.h"

namespace voxgate {
namespace util {

using Json = nlohmann::json;

/**
 * @brief Read and parse a JSON file
 *
 * @param path File to read
 * @param out Parsed document (untouched on failure)
 * @return VG_SUCCESS, VG_ERROR_FILE_NOT_FOUND, or VG_ERROR_PARSE
 */
vg_result_t read_json_file(const std::string& path, Json& out);

/**
 * @brief Write a JSON document so readers never see a partial file
 *
 * Writes to a uniquely named temporary file beside path and renames it over path.
 *
 * @return VG_SUCCESS or VG_ERROR_IO
 */
vg_result_t write_json_file_atomic(const std::string& path, const Json& document);

/// Value of key if present with a compatible type, otherwise fallback
template <typename T>
T json_value_or(const Json& object, const char* key, const T& fallback) {
    if (!object.is_object()) {
        return fallback;
    }
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->template get<T>();
    } catch (const Json::exception&) {
        return fallback;
    }
}

}  // namespace util
}  // namespace voxgate

#endif  // VOXGATE_JSON_UTILS_H
