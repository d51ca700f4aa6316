#ifndef CKG_INSIGHT_EXTRACTOR_HPP
#define CKG_INSIGHT_EXTRACTOR_HPP

/**
 * @file insight_extractor.hpp
 * @brief Structural findings over a query's result subgraph.
 *
 * Detectors are pure functions of (nodes, relationships): the result nodes
 * of a query and every relationship touching them. They keep no state, so
 * the same query result always yields the same insights.
 *
 * Detector types:
 * - ConnectivityDetector: result nodes with many incident relationships
 * - CycleDetector: directed cycles among the relationships
 * - IsolationDetector: result nodes with no relationships at all
 */

#include "ckg/core/config.hpp"
#include "ckg/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ckg::insights {

    enum class InsightType {
        Architecture,
        Vulnerability,
        Anomaly
    };

    [[nodiscard]] const char* to_string(InsightType type) noexcept;

    struct Insight {
        std::string id;
        InsightType type = InsightType::Anomaly;
        std::string title;
        std::string description;
        double confidence = 0.0;
        bool actionable = true;
        std::string suggestion;
        std::vector<std::string> affected_nodes;
    };

    /**
     * Base interface for all insight detectors.
     */
    class IInsightDetector {
    public:
        virtual ~IInsightDetector() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual std::vector<Insight> detect(
            const std::vector<Node>& nodes,
            const std::vector<Relationship>& relationships
        ) const = 0;
    };

    /**
     * One "Highly Connected Component" insight per node with more than
     * @p threshold incident relationships; confidence min(0.9, count / 20).
     */
    class ConnectivityDetector : public IInsightDetector {
    public:
        explicit ConnectivityDetector(std::size_t threshold = 5)
            : threshold_(threshold) {}

        [[nodiscard]] std::string_view name() const noexcept override { return "connectivity"; }

        [[nodiscard]] std::vector<Insight> detect(
            const std::vector<Node>& nodes,
            const std::vector<Relationship>& relationships
        ) const override;

    private:
        std::size_t threshold_;
    };

    /**
     * One "Circular Dependency Detected" insight per directed cycle, at most
     * @p max_cycles. Bidirectional and part_of edges are ignored.
     */
    class CycleDetector : public IInsightDetector {
    public:
        explicit CycleDetector(std::size_t max_cycles = 10)
            : max_cycles_(max_cycles) {}

        [[nodiscard]] std::string_view name() const noexcept override { return "cycles"; }

        [[nodiscard]] std::vector<Insight> detect(
            const std::vector<Node>& nodes,
            const std::vector<Relationship>& relationships
        ) const override;

    private:
        std::size_t max_cycles_;
    };

    /**
     * A single "Isolated Components" insight listing every node without
     * relationships, or nothing.
     */
    class IsolationDetector : public IInsightDetector {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "isolation"; }

        [[nodiscard]] std::vector<Insight> detect(
            const std::vector<Node>& nodes,
            const std::vector<Relationship>& relationships
        ) const override;
    };

    class InsightExtractor {
    public:
        /**
         * Extractor with the connectivity, cycle and isolation detectors.
         */
        explicit InsightExtractor(InsightConfig config = {});

        void add_detector(std::unique_ptr<IInsightDetector> detector);

        /**
         * Runs every detector in registration order and concatenates their
         * insights.
         */
        [[nodiscard]] std::vector<Insight> extract(
            const std::vector<Node>& nodes,
            const std::vector<Relationship>& relationships
        ) const;

    private:
        std::vector<std::unique_ptr<IInsightDetector>> detectors_;
    };

}  // namespace ckg::insights

#endif //CKG_INSIGHT_EXTRACTOR_HPP
