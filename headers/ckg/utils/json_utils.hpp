#ifndef CKG_JSON_UTILS_HPP
#define CKG_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief JSON helpers on top of nlohmann/json.
 *
 * Used by the exporter to hand snapshots to persistence collaborators.
 */

#include "ckg/result.hpp"
#include "ckg/error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>

namespace ckg::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * Parses a JSON string.
     */
    inline Result<json, Error> parse(std::string_view content) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    /**
     * Writes a JSON document to a file, creating parent directories.
     *
     * @param indent Indentation level (-1 for compact output).
     */
    inline Result<void, Error> write_file(
        const fs::path& path,
        const json& data,
        int indent = 2
    ) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        // source files are not guaranteed to be UTF-8
        file << data.dump(indent, ' ', false, json::error_handler_t::replace);

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write JSON file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Serializes without throwing on invalid UTF-8 (bytes are replaced).
     */
    inline std::string to_string(const json& data, const int indent = -1) {
        return data.dump(indent, ' ', false, json::error_handler_t::replace);
    }

}  // namespace ckg::json_utils

#endif //CKG_JSON_UTILS_HPP
