#ifndef CKG_CONFIG_HPP
#define CKG_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Engine configuration, loaded from TOML.
 *
 * Every tunable constant of the build and query pipelines lives here, with
 * defaults that reproduce the reference behaviour. A config file only needs
 * the keys it overrides:
 *
 * @code
 *     [discovery]
 *     exclude_dirs = [".git", "node_modules", "vendor"]
 *
 *     [query]
 *     max_results = 50
 *
 *     [logging]
 *     level = "debug"
 * @endcode
 */

#include "ckg/result.hpp"
#include "ckg/error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ckg {

    struct DiscoveryConfig {
        std::vector<std::string> extensions = {
            ".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs", ".py", ".java",
            ".cpp", ".cc", ".cxx", ".c", ".h", ".hpp", ".cs", ".go", ".rs"
        };
        std::vector<std::string> exclude_dirs = {
            ".git", "node_modules", "dist", "build", "coverage", ".next",
            "target", "__pycache__", ".venv"
        };
        std::uintmax_t max_file_size_bytes = 0;  // 0 = unlimited
        std::size_t max_line_length = 4096;      // longer lines mark generated or minified files
    };

    struct VectorizerConfig {
        std::size_t dimensions = 100;
        std::size_t min_token_length = 3;
        bool cache_enabled = true;
        std::size_t max_cache_entries = 10000;  // least recently used entries are evicted first
    };

    struct RelationshipConfig {
        double similarity_threshold = 0.7;
        double part_of_weight = 0.9;
        double depends_on_weight = 0.8;
        double calls_weight = 0.6;
        double inheritance_weight = 0.7;
        double default_confidence = 0.8;
        bool discover_similarities = true;
    };

    struct PatternConfig {
        bool seed_builtin_concepts = true;
        std::size_t god_object_line_threshold = 500;
        std::size_t microservice_min_services = 4;
        std::size_t domain_term_min_frequency = 3;
    };

    struct QueryConfig {
        double min_similarity = 0.3;
        std::size_t max_results = 20;
        std::size_t max_suggestions = 5;
    };

    struct InsightConfig {
        std::size_t hub_connection_threshold = 5;
        std::size_t max_cycles = 10;
    };

    struct PerformanceConfig {
        unsigned int num_threads = 0;  // 0 = hardware concurrency
    };

    struct LoggingConfig {
        std::string level = "info";
        std::string file;
        bool console = true;
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    };

    class EngineConfig {
    public:
        EngineConfig() = default;

        DiscoveryConfig discovery;
        VectorizerConfig vectorizer;
        RelationshipConfig relationships;
        PatternConfig patterns;
        QueryConfig query;
        InsightConfig insights;
        PerformanceConfig performance;
        LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         *
         * @return The validated config, NotFound/IoError if the file cannot
         *         be read, ParseError or ConfigError otherwise.
         */
        static Result<EngineConfig, Error> load_from_file(const std::string& path);

        /**
         * Load configuration from TOML text. Missing keys keep their defaults.
         */
        static Result<EngineConfig, Error> load_from_string(const std::string& content);

        static EngineConfig default_config();

        /**
         * Serialize the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Check thresholds, dimensions and the log level.
         */
        [[nodiscard]] Result<void, Error> validate() const;
    };

}  // namespace ckg

#endif //CKG_CONFIG_HPP
