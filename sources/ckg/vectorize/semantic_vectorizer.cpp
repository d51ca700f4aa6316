#include "ckg/vectorize/semantic_vectorizer.hpp"

#include "ckg/core/logging.hpp"
#include "ckg/utils/hash_utils.hpp"
#include "ckg/utils/string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>

namespace ckg::vectorize {

    SemanticVectorizer::SemanticVectorizer(VectorizerConfig config)
        : config_(std::move(config)) {}

    SemanticVector SemanticVectorizer::vectorize(const std::string_view text) const {
        if (!config_.cache_enabled || config_.max_cache_entries == 0) {
            return compute(text);
        }

        const std::string key = hash_utils::compute_sha256(text);
        {
            std::lock_guard lock(cache_mutex_);
            if (const auto it = cache_.find(key); it != cache_.end()) {
                lru_.splice(lru_.begin(), lru_, it->second);
                return it->second->second;
            }
        }

        SemanticVector vector = compute(text);
        {
            std::lock_guard lock(cache_mutex_);
            if (!cache_.contains(key)) {
                lru_.emplace_front(key, vector);
                cache_.emplace(key, lru_.begin());
                while (cache_.size() > config_.max_cache_entries) {
                    cache_.erase(lru_.back().first);
                    lru_.pop_back();
                }
            }
        }
        return vector;
    }

    SemanticVector SemanticVectorizer::vectorize_node(const Node& node) const {
        return vectorize(node_text(node));
    }

    std::unordered_set<std::string> SemanticVectorizer::terms(const std::string_view text) const {
        std::unordered_set<std::string> result;
        for (auto& word : string_utils::tokenize_words(text, config_.min_token_length)) {
            result.insert(std::move(word));
        }
        for (const auto& part : string_utils::split_identifier(text)) {
            if (part.size() >= config_.min_token_length) {
                result.insert(string_utils::to_lower(part));
            }
        }
        return result;
    }

    std::size_t SemanticVectorizer::cache_size() const {
        std::lock_guard lock(cache_mutex_);
        return cache_.size();
    }

    void SemanticVectorizer::clear_cache() {
        std::lock_guard lock(cache_mutex_);
        cache_.clear();
        lru_.clear();
    }

    SemanticVector SemanticVectorizer::compute(const std::string_view text) const {
        const std::size_t dims = config_.dimensions;
        SemanticVector vector(dims, 0.0f);

        const auto tokens = string_utils::tokenize_words(text, config_.min_token_length);
        if (tokens.empty() || dims == 0) {
            return vector;
        }

        std::map<std::string, std::size_t> counts;
        for (const auto& token : tokens) {
            ++counts[token];
        }

        // most frequent first; std::map iteration already orders ties by term
        std::vector<std::pair<std::string, std::size_t>> terms(counts.begin(), counts.end());
        std::ranges::stable_sort(terms, [](const auto& a, const auto& b) {
            return a.second > b.second;
        });
        if (terms.size() > dims) {
            terms.resize(dims);
        }

        const auto total = static_cast<double>(tokens.size());
        for (const auto& [term, count] : terms) {
            const std::size_t slot = hash_utils::fnv1a_hash(term) % dims;
            vector[slot] += static_cast<float>(static_cast<double>(count) / total);
        }

        return vector;
    }

    std::string node_text(const Node& node) {
        std::ostringstream text;
        text << node.name;

        const std::string file_name = node.location ? node.location->file.filename().string() : "";

        switch (node.type) {
            case NodeType::File:
                text << ' ' << file_name << ' ' << node.text(meta::LANGUAGE).value_or("");
                break;
            case NodeType::Function: {
                text << " function";
                if (const auto complexity = node.number(meta::COMPLEXITY)) {
                    text << ' ' << std::fixed << std::setprecision(1) << *complexity;
                }
                text << ' ' << file_name;
                break;
            }
            case NodeType::Class:
                text << " class " << node.text(meta::EXTENDS).value_or("") << ' ' << file_name;
                break;
            case NodeType::Interface:
                text << " interface " << file_name;
                break;
            case NodeType::Variable:
                text << " variable " << node.text(meta::DECLARATION_KIND).value_or("") << ' ' << file_name;
                break;
            case NodeType::Module:
                text << " module " << node.text(meta::IMPORT_TYPE).value_or("");
                break;
            case NodeType::Concept:
                text << " concept";
                break;
        }

        return text.str();
    }

    double cosine_similarity(const SemanticVector& a, const SemanticVector& b) {
        if (a.size() != b.size()) {
            logging::get()->debug("Cosine similarity of vectors with dimensions {} and {}", a.size(), b.size());
            return 0.0;
        }

        double dot = 0.0;
        double norm_a = 0.0;
        double norm_b = 0.0;
        for (std::size_t i = 0; i < a.size(); ++i) {
            const double x = a[i];
            const double y = b[i];
            dot += x * y;
            norm_a += x * x;
            norm_b += y * y;
        }

        if (norm_a == 0.0 || norm_b == 0.0) {
            return 0.0;
        }

        return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    }

}  // namespace ckg::vectorize
