#include "ckg/graph/graph.hpp"

#include <algorithm>
#include <cstdint>

namespace ckg::graph {

    std::size_t DirectedGraph::intern(const std::string& node) {
        const auto [it, inserted] = index_.try_emplace(node, ids_.size());
        if (inserted) {
            ids_.push_back(node);
            adjacency_.emplace_back();
        }
        return it->second;
    }

    void DirectedGraph::add_edge(const std::string& from, const std::string& to) {
        const std::size_t source = intern(from);
        const std::size_t target = intern(to);

        auto& out = adjacency_[source];
        if (std::ranges::find(out, target) == out.end()) {
            out.push_back(target);
        }
    }

    std::vector<std::string> DirectedGraph::successors(const std::string& node) const {
        std::vector<std::string> result;
        if (const auto it = index_.find(node); it != index_.end()) {
            for (const std::size_t target : adjacency_[it->second]) {
                result.push_back(ids_[target]);
            }
        }
        return result;
    }

    CycleDetectionResult detect_cycles(const DirectedGraph& graph, const std::size_t max_cycles) {
        enum class Mark : std::uint8_t { Unvisited, OnPath, Done };

        struct Frame {
            std::size_t node;
            std::size_t next_edge = 0;
        };

        CycleDetectionResult result;
        const std::size_t count = graph.node_count();

        std::vector<Mark> marks(count, Mark::Unvisited);
        std::vector<std::size_t> depth(count, 0);
        std::vector<Frame> path;

        for (std::size_t start = 0; start < count && result.cycles.size() < max_cycles; ++start) {
            if (marks[start] != Mark::Unvisited) {
                continue;
            }

            marks[start] = Mark::OnPath;
            path.push_back(Frame{start});

            while (!path.empty() && result.cycles.size() < max_cycles) {
                Frame& top = path.back();
                const auto& out = graph.adjacency_[top.node];

                if (top.next_edge == out.size()) {
                    marks[top.node] = Mark::Done;
                    path.pop_back();
                    continue;
                }

                const std::size_t target = out[top.next_edge++];
                if (marks[target] == Mark::OnPath) {
                    Cycle cycle;
                    for (std::size_t i = depth[target]; i < path.size(); ++i) {
                        cycle.nodes.push_back(graph.ids_[path[i].node]);
                    }
                    cycle.nodes.push_back(graph.ids_[target]);
                    result.cycles.push_back(std::move(cycle));
                } else if (marks[target] == Mark::Unvisited) {
                    marks[target] = Mark::OnPath;
                    depth[target] = path.size();
                    path.push_back(Frame{target});
                }
            }
            path.clear();
        }

        result.has_cycles = !result.cycles.empty();
        return result;
    }

}  // namespace ckg::graph
