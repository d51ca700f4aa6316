#include "ckg/extraction/entity_extractor.hpp"
#include "ckg/extraction/lexical.hpp"

#include "ckg/core/logging.hpp"
#include "ckg/utils/file_utils.hpp"
#include "ckg/utils/hash_utils.hpp"
#include "ckg/utils/string_utils.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace ckg::extraction {

    namespace {

        fs::path normalize_root(const fs::path& root) {
            std::error_code ec;
            fs::path absolute = fs::absolute(root, ec);
            if (ec) {
                absolute = root;
            }
            absolute = absolute.lexically_normal();
            if (absolute.has_parent_path() && absolute.filename().empty()) {
                absolute = absolute.parent_path();
            }
            return absolute;
        }

        const std::unordered_set<std::string_view>& declaration_keywords() {
            static const std::unordered_set<std::string_view> keywords = {
                "function", "def", "class", "fn", "func"
            };
            return keywords;
        }

    }  // namespace

    Result<DiscoveryResult, Error> discover_files(
        const fs::path& root,
        const DiscoveryConfig& config,
        const CancellationToken& cancel
    ) {
        const fs::path base = normalize_root(root);

        std::error_code ec;
        if (!fs::exists(base, ec)) {
            return Result<DiscoveryResult, Error>::failure(
                Error::not_found("Root directory does not exist", base.string())
            );
        }
        if (!fs::is_directory(base, ec)) {
            return Result<DiscoveryResult, Error>::failure(
                Error::invalid_argument("Root is not a directory", base.string())
            );
        }

        const std::unordered_set<std::string> extensions(config.extensions.begin(), config.extensions.end());
        const std::unordered_set<std::string> excluded(config.exclude_dirs.begin(), config.exclude_dirs.end());

        DiscoveryResult result;
        std::vector<fs::path> pending = {base};

        while (!pending.empty()) {
            if (cancel.is_cancelled()) {
                return Result<DiscoveryResult, Error>::failure(
                    Error::cancelled("Build cancelled during discovery")
                );
            }

            const fs::path dir = std::move(pending.back());
            pending.pop_back();

            fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
            if (ec) {
                if (dir == base) {
                    return Result<DiscoveryResult, Error>::failure(
                        Error::io_error("Failed to list root directory: " + ec.message(), base.string())
                    );
                }
                logging::get()->warn("Skipping unlistable directory {}: {}", dir.string(), ec.message());
                ++result.skipped_dirs;
                ec.clear();
                continue;
            }

            for (const auto end = fs::end(it); it != end; it.increment(ec)) {
                if (ec) {
                    logging::get()->warn("Stopped listing {}: {}", dir.string(), ec.message());
                    ++result.skipped_dirs;
                    ec.clear();
                    break;
                }

                const auto& entry = *it;
                std::error_code entry_ec;

                if (entry.is_directory(entry_ec) && !entry.is_symlink(entry_ec)) {
                    if (!excluded.contains(entry.path().filename().string())) {
                        pending.push_back(entry.path());
                    }
                    continue;
                }

                if (!entry.is_regular_file(entry_ec)) {
                    continue;
                }

                if (!extensions.contains(file_utils::extension_of(entry.path()))) {
                    continue;
                }

                if (config.max_file_size_bytes > 0) {
                    const auto size = entry.file_size(entry_ec);
                    if (!entry_ec && size > config.max_file_size_bytes) {
                        logging::get()->debug("Skipping {} ({} bytes over the size limit)",
                                              entry.path().string(), size);
                        continue;
                    }
                }

                result.files.push_back(entry.path().lexically_normal());
            }
        }

        std::ranges::sort(result.files);
        return Result<DiscoveryResult, Error>::success(std::move(result));
    }

    std::string detect_language(const fs::path& path) {
        static const std::unordered_map<std::string, std::string> language_map = {
            {".ts", "typescript"}, {".tsx", "typescript"},
            {".js", "javascript"}, {".jsx", "javascript"}, {".mjs", "javascript"}, {".cjs", "javascript"},
            {".py", "python"},
            {".java", "java"},
            {".cpp", "cpp"}, {".cc", "cpp"}, {".cxx", "cpp"}, {".hpp", "cpp"}, {".h", "cpp"},
            {".c", "c"},
            {".cs", "csharp"},
            {".go", "go"},
            {".rs", "rust"}
        };

        const auto it = language_map.find(file_utils::extension_of(path));
        return it != language_map.end() ? it->second : "unknown";
    }

    double compute_file_complexity(const std::string_view content) {
        const auto lines = static_cast<double>(file_utils::count_lines(content));
        const auto functions = static_cast<double>(lexical::count_keywords(content, declaration_keywords()));
        const auto conditionals = static_cast<double>(lexical::count_keywords(content, lexical::conditional_keywords()));
        return (functions + conditionals) / lines;
    }

    double compute_file_importance(const std::string& relative_path, const std::size_t line_count) {
        const std::string path = string_utils::to_lower(relative_path);
        double importance = 0.5;

        if (string_utils::contains(path, "index.") || string_utils::contains(path, "main.")) importance += 0.3;
        if (string_utils::contains(path, "config")) importance += 0.2;
        if (string_utils::contains(path, "util") || string_utils::contains(path, "helper")) importance += 0.1;

        importance += std::min(0.3, static_cast<double>(line_count) / 1000.0);

        return std::min(1.0, importance);
    }

    EntityExtractor::EntityExtractor()
        : registry_(ExtractorRegistry::with_builtin()) {}

    EntityExtractor::EntityExtractor(ExtractorRegistry registry)
        : registry_(std::move(registry)) {}

    EntityExtractor::EntityExtractor(ExtractorRegistry registry, const std::size_t max_line_length)
        : registry_(std::move(registry))
        , max_line_length_(max_line_length) {}

    Result<FileExtraction, Error> EntityExtractor::extract_file(
        const fs::path& root,
        const fs::path& path
    ) const {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<FileExtraction, Error>::failure(content.error());
        }

        auto size = file_utils::file_size(path);
        if (size.is_err()) {
            return Result<FileExtraction, Error>::failure(size.error());
        }

        auto modified = file_utils::last_write_time(path);
        if (modified.is_err()) {
            return Result<FileExtraction, Error>::failure(modified.error());
        }

        const std::string& text = content.value();

        if (const auto longest = lexical::longest_line(text); longest > max_line_length_) {
            return Result<FileExtraction, Error>::failure(
                Error::extraction_error(
                    "Line of " + std::to_string(longest) + " characters exceeds the limit of " +
                        std::to_string(max_line_length_),
                    path.string()
                )
            );
        }

        FileExtraction extraction;
        extraction.path = path.lexically_normal();
        extraction.language = detect_language(path);

        if (const ILanguageExtractor* extractor = registry_.find(extraction.language)) {
            auto language_output = extractor->extract(text, extraction.language);
            extraction.entities = std::move(language_output.entities);
            extraction.dependencies = std::move(language_output.dependencies);
            extraction.ambiguous = language_output.ambiguous;
        }
        extraction.usages = extract_usages(text, extraction.entities);

        const std::string path_string = extraction.path.generic_string();
        const std::size_t line_count = file_utils::count_lines(text);

        Node& node = extraction.file_node;
        node.id = hash_utils::make_node_id(NodeType::File, path_string);
        node.type = NodeType::File;
        node.name = extraction.path.filename().string();
        node.location = SourceLocation{extraction.path, 1};
        node.importance = compute_file_importance(
            extraction.path.lexically_relative(normalize_root(root)).generic_string(),
            line_count
        );
        node.last_updated = std::chrono::system_clock::now();

        FileMetadata meta;
        meta.size_bytes = size.value();
        meta.extension = file_utils::extension_of(path);
        meta.modified = modified.value();
        meta.line_count = line_count;
        meta.language = extraction.language;
        meta.complexity = compute_file_complexity(text);
        meta.apply_to(node);

        return Result<FileExtraction, Error>::success(std::move(extraction));
    }

}  // namespace ckg::extraction
