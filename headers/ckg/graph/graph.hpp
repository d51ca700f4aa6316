#ifndef CKG_GRAPH_HPP
#define CKG_GRAPH_HPP

/**
 * @file graph.hpp
 * @brief Directed dependency graph and cycle detection.
 *
 * Nodes and successors are kept in insertion order, so the cycles reported
 * for a given edge sequence are deterministic.
 */

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace ckg::graph {

    /**
     * A cycle in the graph. The first node is repeated at the end.
     */
    struct Cycle {
        std::vector<std::string> nodes;
    };

    struct CycleDetectionResult {
        bool has_cycles = false;
        std::vector<Cycle> cycles;
    };

    class DirectedGraph;

    /**
     * Depth-first search from every unvisited node in insertion order. An
     * edge into a node on the active path reports the path suffix starting
     * at that node. Stops after max_cycles cycles.
     */
    [[nodiscard]] CycleDetectionResult detect_cycles(const DirectedGraph& graph, std::size_t max_cycles = 10);

    class DirectedGraph {
    public:
        /**
         * Adds an edge, creating both nodes if needed. Repeated edges are
         * ignored.
         */
        void add_edge(const std::string& from, const std::string& to);

        [[nodiscard]] std::size_t node_count() const noexcept {
            return ids_.size();
        }

        [[nodiscard]] const std::vector<std::string>& nodes() const noexcept {
            return ids_;
        }

        [[nodiscard]] std::vector<std::string> successors(const std::string& node) const;

    private:
        friend CycleDetectionResult detect_cycles(const DirectedGraph& graph, std::size_t max_cycles);

        std::size_t intern(const std::string& node);

        std::vector<std::string> ids_;
        std::vector<std::vector<std::size_t>> adjacency_;
        std::unordered_map<std::string, std::size_t> index_;
    };

}  // namespace ckg::graph

#endif //CKG_GRAPH_HPP
