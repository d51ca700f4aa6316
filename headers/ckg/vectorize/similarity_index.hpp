#ifndef CKG_SIMILARITY_INDEX_HPP
#define CKG_SIMILARITY_INDEX_HPP

/**
 * @file similarity_index.hpp
 * @brief Nearest-neighbour search over node vectors.
 *
 * ExactSimilarityIndex compares every pair, so similarity discovery is
 * O(n^2) in the number of vectorized nodes and dominates build time on
 * large trees. An approximate index implements the same interface.
 */

#include "ckg/result.hpp"
#include "ckg/error.hpp"
#include "ckg/types.hpp"
#include "ckg/utils/cancellation.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ckg::parallel {
    class ThreadPool;
}

namespace ckg::vectorize {

    struct SimilarityMatch {
        std::string id;
        double similarity = 0.0;
    };

    struct SimilarPair {
        std::string first;
        std::string second;
        double similarity = 0.0;
    };

    /**
     * Base interface for similarity indexes.
     */
    class ISimilarityIndex {
    public:
        virtual ~ISimilarityIndex() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Replaces the indexed set with the vectorized nodes among @p nodes.
         */
        virtual void build(const std::vector<Node>& nodes) = 0;

        /**
         * Number of indexed vectors.
         */
        [[nodiscard]] virtual std::size_t size() const noexcept = 0;

        /**
         * Every unordered pair with similarity strictly above @p threshold,
         * each reported once with first indexed before second.
         *
         * @return Cancelled if the token fires.
         */
        [[nodiscard]] virtual Result<std::vector<SimilarPair>, Error> pairs_above(
            double threshold,
            const CancellationToken& cancel
        ) const = 0;

        /**
         * Indexed ids with similarity to @p query strictly above
         * @p min_similarity, best first, ties by id. A limit of 0 returns
         * every match.
         */
        [[nodiscard]] virtual std::vector<SimilarityMatch> search(
            const SemanticVector& query,
            double min_similarity,
            std::size_t limit = 0
        ) const = 0;
    };

    /**
     * Brute-force index. Pair discovery runs its rows on a thread pool when
     * one is given.
     */
    class ExactSimilarityIndex : public ISimilarityIndex {
    public:
        explicit ExactSimilarityIndex(parallel::ThreadPool* pool = nullptr);

        [[nodiscard]] std::string_view name() const noexcept override;

        void build(const std::vector<Node>& nodes) override;

        [[nodiscard]] std::size_t size() const noexcept override;

        [[nodiscard]] Result<std::vector<SimilarPair>, Error> pairs_above(
            double threshold,
            const CancellationToken& cancel
        ) const override;

        [[nodiscard]] std::vector<SimilarityMatch> search(
            const SemanticVector& query,
            double min_similarity,
            std::size_t limit = 0
        ) const override;

    private:
        parallel::ThreadPool* pool_;
        std::vector<std::string> ids_;
        std::vector<SemanticVector> vectors_;
    };

}  // namespace ckg::vectorize

#endif //CKG_SIMILARITY_INDEX_HPP
