/**
 * @file json_utils.cpp
 * @brief voxgate - JSON file helpers
 */

#include "voxgate/util/json_utils.h"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <sstream>

#include <unistd.h>

#include "voxgate/core/vg_logger.h"

#define LOG_TAG "Json"
#define LOGW(...) VG_LOG_WARNING(LOG_TAG, __VA_ARGS__)

namespace voxgate {
namespace util {

vg_result_t read_json_file(const std::string& path, Json& out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return VG_ERROR_FILE_NOT_FOUND;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    Json parsed = Json::parse(buffer.str(), nullptr, false);
    if (parsed.is_discarded()) {
        return VG_ERROR_PARSE;
    }
    out = std::move(parsed);
    return VG_SUCCESS;
}

vg_result_t write_json_file_atomic(const std::string& path, const Json& document) {
    static std::atomic<unsigned> counter{0};

    std::string tmp_path = path + ".tmp." + std::to_string(static_cast<long>(getpid())) + "." +
                           std::to_string(counter.fetch_add(1));
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            LOGW("Cannot open %s for writing", tmp_path.c_str());
            return VG_ERROR_IO;
        }
        out << document.dump(2);
        out.flush();
        if (!out.good()) {
            LOGW("Write to %s failed", tmp_path.c_str());
            std::remove(tmp_path.c_str());
            return VG_ERROR_IO;
        }
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        LOGW("Cannot rename %s to %s", tmp_path.c_str(), path.c_str());
        std::remove(tmp_path.c_str());
        return VG_ERROR_IO;
    }
    return VG_SUCCESS;
}

}  // namespace util
}  // namespace voxgate
