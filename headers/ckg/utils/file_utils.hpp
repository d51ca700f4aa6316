#ifndef CKG_FILE_UTILS_HPP
#define CKG_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system utilities.
 *
 * Provides file reading and file property queries used by discovery and
 * extraction. All operations use Result<T, Error> for error handling.
 */

#include "ckg/result.hpp"
#include "ckg/error.hpp"
#include "ckg/types.hpp"

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <chrono>

namespace ckg::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string.
     *
     * @param path Path to the file.
     * @return The file contents or an error.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Counts lines the way a text editor does: "" has one line, and a
     * trailing newline opens one more.
     */
    inline std::size_t count_lines(const std::string_view content) noexcept {
        return static_cast<std::size_t>(std::ranges::count(content, '\n')) + 1;
    }

    /**
     * Returns the 1-based line number of a byte offset into content.
     */
    inline std::size_t line_at(const std::string_view content, const std::size_t offset) noexcept {
        const auto end = std::min(offset, content.size());
        return static_cast<std::size_t>(std::count(content.begin(), content.begin() + static_cast<std::ptrdiff_t>(end), '\n')) + 1;
    }

    /**
     * Gets the size of a file in bytes.
     */
    inline Result<std::uintmax_t, Error> file_size(const fs::path& path) {
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        if (ec) {
            return Result<std::uintmax_t, Error>::failure(
                Error::io_error("Failed to get file size: " + ec.message(), path.string())
            );
        }
        return Result<std::uintmax_t, Error>::success(size);
    }

    /**
     * Gets the last modification time of a file as a system clock timestamp.
     */
    inline Result<Timestamp, Error> last_write_time(const fs::path& path) {
        std::error_code ec;
        const auto ftime = fs::last_write_time(path, ec);
        if (ec) {
            return Result<Timestamp, Error>::failure(
                Error::io_error("Failed to get modification time: " + ec.message(), path.string())
            );
        }
        const auto sys = std::chrono::file_clock::to_sys(ftime);
        return Result<Timestamp, Error>::success(
            std::chrono::time_point_cast<Timestamp::duration>(sys)
        );
    }

    /**
     * Returns the extension of a path including the dot (".ts"), lower-cased.
     */
    inline std::string extension_of(const fs::path& path) {
        std::string ext = path.extension().string();
        std::ranges::transform(ext, ext.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

}  // namespace ckg::file_utils

#endif //CKG_FILE_UTILS_HPP
