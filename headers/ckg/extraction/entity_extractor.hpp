#ifndef CKG_ENTITY_EXTRACTOR_HPP
#define CKG_ENTITY_EXTRACTOR_HPP

/**
 * @file entity_extractor.hpp
 * @brief File discovery and per-file entity extraction.
 *
 * The extraction phase of a build:
 * 1. discover_files() walks the root and applies the extension allow-list
 *    and the directory exclude-list.
 * 2. EntityExtractor::extract_file() reads one file, builds its File node
 *    and runs the language extractor and the usage pass over it.
 *
 * extract_file() touches no shared state, so files are extracted in
 * parallel and merged afterwards in discovery order.
 */

#include "ckg/core/config.hpp"
#include "ckg/extraction/language_extractor.hpp"
#include "ckg/result.hpp"
#include "ckg/error.hpp"
#include "ckg/types.hpp"
#include "ckg/utils/cancellation.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ckg::extraction {

    /**
     * Outcome of file discovery.
     */
    struct DiscoveryResult {
        std::vector<fs::path> files;   ///< sorted, absolute, lexically normal
        std::size_t skipped_dirs = 0;  ///< unlistable subdirectories
    };

    /**
     * Everything extracted from one file.
     */
    struct FileExtraction {
        fs::path path;
        Node file_node;
        std::string language;
        std::vector<EntityCandidate> entities;
        std::vector<DependencyRecord> dependencies;
        std::vector<UsageRecord> usages;
        std::size_t ambiguous = 0;
    };

    /**
     * Lists source files under root.
     *
     * @return NotFound if root does not exist, InvalidArgument if it is not
     *         a directory, IoError if it cannot be listed, Cancelled if the
     *         token fires. Unlistable subdirectories are logged and skipped.
     */
    [[nodiscard]] Result<DiscoveryResult, Error> discover_files(
        const fs::path& root,
        const DiscoveryConfig& config,
        const CancellationToken& cancel = {}
    );

    /**
     * Maps a file extension to a language name, or "unknown".
     */
    [[nodiscard]] std::string detect_language(const fs::path& path);

    /**
     * (functions + conditionals) / lines, counting declaration and
     * conditional keywords as whole words.
     */
    [[nodiscard]] double compute_file_complexity(std::string_view content);

    /**
     * 0.5 base; +0.3 for index./main.; +0.2 for config; +0.1 for
     * util/helper; +min(0.3, lines / 1000); capped at 1.
     *
     * @param relative_path Path relative to the build root, so that the
     *        root's own directory names do not count.
     */
    [[nodiscard]] double compute_file_importance(const std::string& relative_path, std::size_t line_count);

    class EntityExtractor {
    public:
        /**
         * Uses the built-in JavaScript, Python and C-family extractors.
         */
        EntityExtractor();
        explicit EntityExtractor(ExtractorRegistry registry);
        EntityExtractor(ExtractorRegistry registry, std::size_t max_line_length);

        /**
         * Reads and extracts one file.
         *
         * @return IoError if the file cannot be read or stat'ed,
         *         ExtractionError if a line is longer than the configured
         *         limit (minified or generated code); the caller skips the
         *         file.
         */
        [[nodiscard]] Result<FileExtraction, Error> extract_file(
            const fs::path& root,
            const fs::path& path
        ) const;

        [[nodiscard]] const ExtractorRegistry& registry() const noexcept {
            return registry_;
        }

    private:
        ExtractorRegistry registry_;
        std::size_t max_line_length_ = DiscoveryConfig{}.max_line_length;
    };

}  // namespace ckg::extraction

#endif //CKG_ENTITY_EXTRACTOR_HPP
