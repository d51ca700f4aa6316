#ifndef CKG_PATTERN_DETECTOR_HPP
#define CKG_PATTERN_DETECTOR_HPP

/**
 * @file pattern_detector.hpp
 * @brief Detectors that turn graph-wide naming and shape signals into
 *        Concepts.
 *
 * Detector types:
 * - MvcDetector: controller, model and view/component names together
 * - MicroservicesDetector: many "service" names
 * - SingletonDetector: classes named singleton or with a private constructor
 * - FactoryDetector: anything named factory
 * - GodObjectDetector: very long classes
 * - DomainConceptDetector: name terms that recur across the graph
 *
 * Detectors only read the store. Concept ids are derived from what was
 * detected, so running a detector twice over the same graph yields the same
 * concepts.
 */

#include "ckg/graph/graph_store.hpp"
#include "ckg/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ckg::patterns {

    /**
     * Base interface for all pattern detectors.
     */
    class IPatternDetector {
    public:
        virtual ~IPatternDetector() = default;

        /**
         * Returns the detector name.
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Returns the concepts found in the graph, in a stable order.
         */
        [[nodiscard]] virtual std::vector<Concept> detect(const graph::GraphStore& store) const = 0;
    };

    class MvcDetector : public IPatternDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "mvc"; }
        [[nodiscard]] std::vector<Concept> detect(const graph::GraphStore& store) const override;
    };

    class MicroservicesDetector : public IPatternDetector {
    public:
        /**
         * @param min_services Number of "service" names needed.
         */
        explicit MicroservicesDetector(std::size_t min_services = 4)
            : min_services_(min_services) {}

        [[nodiscard]] std::string_view name() const noexcept override { return "microservices"; }
        [[nodiscard]] std::vector<Concept> detect(const graph::GraphStore& store) const override;

    private:
        std::size_t min_services_;
    };

    class SingletonDetector : public IPatternDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "singleton"; }
        [[nodiscard]] std::vector<Concept> detect(const graph::GraphStore& store) const override;
    };

    class FactoryDetector : public IPatternDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "factory"; }
        [[nodiscard]] std::vector<Concept> detect(const graph::GraphStore& store) const override;
    };

    class GodObjectDetector : public IPatternDetector {
    public:
        /**
         * @param line_threshold Classes strictly longer than this are flagged.
         */
        explicit GodObjectDetector(std::size_t line_threshold = 500)
            : line_threshold_(line_threshold) {}

        [[nodiscard]] std::string_view name() const noexcept override { return "god_object"; }
        [[nodiscard]] std::vector<Concept> detect(const graph::GraphStore& store) const override;

    private:
        std::size_t line_threshold_;
    };

    /**
     * Splits every node name into terms (see domain_terms()) and promotes
     * terms seen at least min_frequency times to business-logic concepts
     * with confidence min(0.9, frequency / 10).
     */
    class DomainConceptDetector : public IPatternDetector {
    public:
        explicit DomainConceptDetector(std::size_t min_frequency = 3)
            : min_frequency_(min_frequency) {}

        [[nodiscard]] std::string_view name() const noexcept override { return "domain_concepts"; }
        [[nodiscard]] std::vector<Concept> detect(const graph::GraphStore& store) const override;

    private:
        std::size_t min_frequency_;
    };

    /**
     * Lower-cased terms of a name, split on case boundaries and separators.
     * Terms shorter than 3 characters are dropped.
     */
    [[nodiscard]] std::vector<std::string> domain_terms(std::string_view name);

    /**
     * The concepts every graph starts with: concept_mvc and concept_solid.
     */
    [[nodiscard]] std::vector<Concept> builtin_concepts();

}  // namespace ckg::patterns

#endif //CKG_PATTERN_DETECTOR_HPP
