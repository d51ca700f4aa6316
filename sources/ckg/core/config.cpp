#include "ckg/core/config.hpp"

#include "ckg/utils/file_utils.hpp"
#include "ckg/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <sstream>

namespace ckg {

    namespace {

        constexpr std::array<std::string_view, 7> kLogLevels = {
            "trace", "debug", "info", "warn", "error", "critical", "off"
        };

        /**
         * Reads an integer key that must not be negative. Negative values
         * are recorded in @p errors and the current value is kept.
         */
        template<typename T>
        void read_unsigned(
            const toml::table& section,
            const std::string_view key,
            T& target,
            std::vector<std::string>& errors
        ) {
            if (!section.contains(key)) {
                return;
            }
            const auto value = section[key].value<std::int64_t>();
            if (!value) {
                errors.emplace_back(std::string(key) + " must be an integer");
                return;
            }
            if (*value < 0) {
                errors.emplace_back(std::string(key) + " must be non-negative");
                return;
            }
            target = static_cast<T>(*value);
        }

        void read_double(const toml::table& section, const std::string_view key, double& target) {
            if (section.contains(key)) {
                target = section[key].value_or(target);
            }
        }

        void read_bool(const toml::table& section, const std::string_view key, bool& target) {
            if (section.contains(key)) {
                target = section[key].value_or(target);
            }
        }

        void read_string(const toml::table& section, const std::string_view key, std::string& target) {
            if (section.contains(key)) {
                target = section[key].value_or(target);
            }
        }

        void read_string_list(
            const toml::table& section,
            const std::string_view key,
            std::vector<std::string>& target
        ) {
            const auto* array = section[key].as_array();
            if (!array) {
                return;
            }
            target.clear();
            for (const auto& item : *array) {
                if (auto text = item.value<std::string>()) {
                    target.push_back(std::move(*text));
                }
            }
        }

        std::string quote(const std::string_view text) {
            std::string out = "\"";
            for (const char c : text) {
                if (c == '"' || c == '\\') {
                    out += '\\';
                }
                out += c;
            }
            out += '"';
            return out;
        }

        std::string quote_list(const std::vector<std::string>& items) {
            std::vector<std::string> quoted;
            quoted.reserve(items.size());
            for (const auto& item : items) {
                quoted.push_back(quote(item));
            }
            return "[" + string_utils::join(quoted, ", ") + "]";
        }

        bool in_unit_range(const double value) {
            return value >= 0.0 && value <= 1.0;
        }

    }  // namespace

    Result<EngineConfig, Error> EngineConfig::load_from_file(const std::string& path) {
        return file_utils::read_file(path).and_then(&EngineConfig::load_from_string);
    }

    Result<EngineConfig, Error> EngineConfig::load_from_string(const std::string& content) {
        EngineConfig config;
        std::vector<std::string> errors;

        try {
            const toml::table tbl = toml::parse(content);

            if (const auto* discovery = tbl["discovery"].as_table()) {
                read_string_list(*discovery, "extensions", config.discovery.extensions);
                read_string_list(*discovery, "exclude_dirs", config.discovery.exclude_dirs);
                read_unsigned(*discovery, "max_file_size_bytes", config.discovery.max_file_size_bytes, errors);
                read_unsigned(*discovery, "max_line_length", config.discovery.max_line_length, errors);
            }

            if (const auto* vectorizer = tbl["vectorizer"].as_table()) {
                read_unsigned(*vectorizer, "dimensions", config.vectorizer.dimensions, errors);
                read_unsigned(*vectorizer, "min_token_length", config.vectorizer.min_token_length, errors);
                read_unsigned(*vectorizer, "max_cache_entries", config.vectorizer.max_cache_entries, errors);
                read_bool(*vectorizer, "cache_enabled", config.vectorizer.cache_enabled);
            }

            if (const auto* rel = tbl["relationships"].as_table()) {
                read_double(*rel, "similarity_threshold", config.relationships.similarity_threshold);
                read_double(*rel, "part_of_weight", config.relationships.part_of_weight);
                read_double(*rel, "depends_on_weight", config.relationships.depends_on_weight);
                read_double(*rel, "calls_weight", config.relationships.calls_weight);
                read_double(*rel, "inheritance_weight", config.relationships.inheritance_weight);
                read_double(*rel, "default_confidence", config.relationships.default_confidence);
                read_bool(*rel, "discover_similarities", config.relationships.discover_similarities);
            }

            if (const auto* patterns = tbl["patterns"].as_table()) {
                read_bool(*patterns, "seed_builtin_concepts", config.patterns.seed_builtin_concepts);
                read_unsigned(*patterns, "god_object_line_threshold", config.patterns.god_object_line_threshold, errors);
                read_unsigned(*patterns, "microservice_min_services", config.patterns.microservice_min_services, errors);
                read_unsigned(*patterns, "domain_term_min_frequency", config.patterns.domain_term_min_frequency, errors);
            }

            if (const auto* query = tbl["query"].as_table()) {
                read_double(*query, "min_similarity", config.query.min_similarity);
                read_unsigned(*query, "max_results", config.query.max_results, errors);
                read_unsigned(*query, "max_suggestions", config.query.max_suggestions, errors);
            }

            if (const auto* insights = tbl["insights"].as_table()) {
                read_unsigned(*insights, "hub_connection_threshold", config.insights.hub_connection_threshold, errors);
                read_unsigned(*insights, "max_cycles", config.insights.max_cycles, errors);
            }

            if (const auto* perf = tbl["performance"].as_table()) {
                read_unsigned(*perf, "num_threads", config.performance.num_threads, errors);
            }

            if (const auto* log = tbl["logging"].as_table()) {
                read_string(*log, "level", config.logging.level);
                read_string(*log, "file", config.logging.file);
                read_bool(*log, "console", config.logging.console);
                read_string(*log, "pattern", config.logging.pattern);
                config.logging.level = string_utils::to_lower(config.logging.level);
            }
        } catch (const toml::parse_error& err) {
            return Result<EngineConfig, Error>::failure(
                Error::parse_error("Failed to parse TOML configuration", std::string(err.description()))
            );
        }

        if (!errors.empty()) {
            return Result<EngineConfig, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        if (auto validation = config.validate(); validation.is_err()) {
            return Result<EngineConfig, Error>::failure(validation.error());
        }

        return Result<EngineConfig, Error>::success(std::move(config));
    }

    EngineConfig EngineConfig::default_config() {
        return EngineConfig{};
    }

    std::string EngineConfig::to_string() const {
        std::ostringstream ss;
        auto flag = [](const bool b) { return b ? "true" : "false"; };

        ss << "[discovery]\n";
        ss << "extensions = " << quote_list(discovery.extensions) << "\n";
        ss << "exclude_dirs = " << quote_list(discovery.exclude_dirs) << "\n";
        ss << "max_file_size_bytes = " << discovery.max_file_size_bytes << "\n";
        ss << "max_line_length = " << discovery.max_line_length << "\n\n";

        ss << "[vectorizer]\n";
        ss << "dimensions = " << vectorizer.dimensions << "\n";
        ss << "min_token_length = " << vectorizer.min_token_length << "\n";
        ss << "cache_enabled = " << flag(vectorizer.cache_enabled) << "\n";
        ss << "max_cache_entries = " << vectorizer.max_cache_entries << "\n\n";

        ss << "[relationships]\n";
        ss << "similarity_threshold = " << relationships.similarity_threshold << "\n";
        ss << "part_of_weight = " << relationships.part_of_weight << "\n";
        ss << "depends_on_weight = " << relationships.depends_on_weight << "\n";
        ss << "calls_weight = " << relationships.calls_weight << "\n";
        ss << "inheritance_weight = " << relationships.inheritance_weight << "\n";
        ss << "default_confidence = " << relationships.default_confidence << "\n";
        ss << "discover_similarities = " << flag(relationships.discover_similarities) << "\n\n";

        ss << "[patterns]\n";
        ss << "seed_builtin_concepts = " << flag(patterns.seed_builtin_concepts) << "\n";
        ss << "god_object_line_threshold = " << patterns.god_object_line_threshold << "\n";
        ss << "microservice_min_services = " << patterns.microservice_min_services << "\n";
        ss << "domain_term_min_frequency = " << patterns.domain_term_min_frequency << "\n\n";

        ss << "[query]\n";
        ss << "min_similarity = " << query.min_similarity << "\n";
        ss << "max_results = " << query.max_results << "\n";
        ss << "max_suggestions = " << query.max_suggestions << "\n\n";

        ss << "[insights]\n";
        ss << "hub_connection_threshold = " << insights.hub_connection_threshold << "\n";
        ss << "max_cycles = " << insights.max_cycles << "\n\n";

        ss << "[performance]\n";
        ss << "num_threads = " << performance.num_threads << "\n\n";

        ss << "[logging]\n";
        ss << "level = " << quote(logging.level) << "\n";
        ss << "file = " << quote(logging.file) << "\n";
        ss << "console = " << flag(logging.console) << "\n";
        ss << "pattern = " << quote(logging.pattern) << "\n";

        return ss.str();
    }

    Result<void, Error> EngineConfig::validate() const {
        std::vector<std::string> errors;

        if (discovery.extensions.empty()) {
            errors.emplace_back("extensions must not be empty");
        }
        for (const auto& ext : discovery.extensions) {
            if (!string_utils::starts_with(ext, ".")) {
                errors.emplace_back("extension '" + ext + "' must start with '.'");
            }
        }

        if (discovery.max_line_length == 0) {
            errors.emplace_back("max_line_length must be positive");
        }

        if (vectorizer.dimensions == 0) {
            errors.emplace_back("dimensions must be positive");
        }
        if (vectorizer.min_token_length == 0) {
            errors.emplace_back("min_token_length must be positive");
        }

        if (!in_unit_range(relationships.similarity_threshold)) {
            errors.emplace_back("similarity_threshold must be between 0.0 and 1.0");
        }
        if (!in_unit_range(relationships.part_of_weight) ||
            !in_unit_range(relationships.depends_on_weight) ||
            !in_unit_range(relationships.calls_weight) ||
            !in_unit_range(relationships.inheritance_weight)) {
            errors.emplace_back("relationship weights must be between 0.0 and 1.0");
        }
        if (!in_unit_range(relationships.default_confidence)) {
            errors.emplace_back("default_confidence must be between 0.0 and 1.0");
        }

        if (!in_unit_range(query.min_similarity)) {
            errors.emplace_back("min_similarity must be between 0.0 and 1.0");
        }
        if (query.max_results == 0) {
            errors.emplace_back("max_results must be positive");
        }

        if (std::ranges::find(kLogLevels, logging.level) == kLogLevels.end()) {
            errors.emplace_back("unknown log level '" + logging.level + "'");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        return Result<void, Error>::success();
    }

}  // namespace ckg
