#ifndef CKG_PATTERN_RECOGNIZER_HPP
#define CKG_PATTERN_RECOGNIZER_HPP

/**
 * @file pattern_recognizer.hpp
 * @brief Runs the pattern detectors over a built graph.
 */

#include "ckg/core/config.hpp"
#include "ckg/graph/graph_store.hpp"
#include "ckg/patterns/pattern_detector.hpp"
#include "ckg/result.hpp"
#include "ckg/error.hpp"
#include "ckg/utils/cancellation.hpp"

#include <memory>
#include <vector>

namespace ckg::patterns {

    class PatternRecognizer {
    public:
        /**
         * Recognizer with the six built-in detectors, configured from
         * @p config.
         */
        explicit PatternRecognizer(PatternConfig config = {});

        PatternRecognizer(PatternRecognizer&&) noexcept = default;
        PatternRecognizer& operator=(PatternRecognizer&&) noexcept = default;

        void add_detector(std::unique_ptr<IPatternDetector> detector);

        [[nodiscard]] std::vector<const IPatternDetector*> detectors() const;

        /**
         * Seeds the built-in concepts (if enabled) and adds the concepts of
         * every detector to the store. Detection reads the graph as it was
         * before this call.
         *
         * @return Number of new concepts, or Cancelled if the token fires
         *         between detectors.
         */
        [[nodiscard]] Result<std::size_t, Error> recognize(
            graph::GraphStore& store,
            const CancellationToken& cancel = {}
        ) const;

    private:
        PatternConfig config_;
        std::vector<std::unique_ptr<IPatternDetector>> detectors_;
    };

}  // namespace ckg::patterns

#endif //CKG_PATTERN_RECOGNIZER_HPP
