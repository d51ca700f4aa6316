#include "ckg/vectorize/similarity_index.hpp"
#include "ckg/vectorize/semantic_vectorizer.hpp"

#include "ckg/utils/parallel.hpp"

#include <algorithm>
#include <atomic>
#include <iterator>

namespace ckg::vectorize {

    ExactSimilarityIndex::ExactSimilarityIndex(parallel::ThreadPool* pool)
        : pool_(pool) {}

    std::string_view ExactSimilarityIndex::name() const noexcept {
        return "exact";
    }

    void ExactSimilarityIndex::build(const std::vector<Node>& nodes) {
        ids_.clear();
        vectors_.clear();
        for (const auto& node : nodes) {
            if (node.is_vectorized()) {
                ids_.push_back(node.id);
                vectors_.push_back(node.semantic_vector);
            }
        }
    }

    std::size_t ExactSimilarityIndex::size() const noexcept {
        return ids_.size();
    }

    Result<std::vector<SimilarPair>, Error> ExactSimilarityIndex::pairs_above(
        const double threshold,
        const CancellationToken& cancel
    ) const {
        std::atomic<bool> cancelled = false;

        auto scan_rows = [&](const std::size_t begin, const std::size_t end) {
            std::vector<SimilarPair> pairs;
            for (std::size_t i = begin; i < end; ++i) {
                if (cancel.is_cancelled()) {
                    cancelled = true;
                    break;
                }
                for (std::size_t j = i + 1; j < vectors_.size(); ++j) {
                    if (const double similarity = cosine_similarity(vectors_[i], vectors_[j]); similarity > threshold) {
                        pairs.push_back(SimilarPair{ids_[i], ids_[j], similarity});
                    }
                }
            }
            return pairs;
        };

        std::vector<SimilarPair> result;
        if (pool_ != nullptr) {
            for (auto& chunk : parallel::map_chunks(vectors_.size(), scan_rows, *pool_)) {
                std::ranges::move(chunk, std::back_inserter(result));
            }
        } else {
            result = scan_rows(0, vectors_.size());
        }

        if (cancelled || cancel.is_cancelled()) {
            return Result<std::vector<SimilarPair>, Error>::failure(
                Error::cancelled("Build cancelled during similarity discovery")
            );
        }

        return Result<std::vector<SimilarPair>, Error>::success(std::move(result));
    }

    std::vector<SimilarityMatch> ExactSimilarityIndex::search(
        const SemanticVector& query,
        const double min_similarity,
        const std::size_t limit
    ) const {
        std::vector<SimilarityMatch> matches;
        for (std::size_t i = 0; i < vectors_.size(); ++i) {
            if (const double similarity = cosine_similarity(query, vectors_[i]); similarity > min_similarity) {
                matches.push_back(SimilarityMatch{ids_[i], similarity});
            }
        }

        std::ranges::sort(matches, [](const SimilarityMatch& a, const SimilarityMatch& b) {
            if (a.similarity != b.similarity) {
                return a.similarity > b.similarity;
            }
            return a.id < b.id;
        });

        if (limit > 0 && matches.size() > limit) {
            matches.resize(limit);
        }
        return matches;
    }

}  // namespace ckg::vectorize
