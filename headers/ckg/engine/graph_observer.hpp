#ifndef CKG_GRAPH_OBSERVER_HPP
#define CKG_GRAPH_OBSERVER_HPP

/**
 * @file graph_observer.hpp
 * @brief Build and query notifications.
 *
 * Observers are registered on one engine through add_observer(). They are
 * called synchronously on the thread that finished the build or query,
 * after the new graph is published, and must not call back into
 * build_graph().
 */

#include "ckg/types.hpp"

#include <string>

namespace ckg::engine {

    struct GraphBuiltEvent {
        fs::path root;
        std::size_t node_count = 0;
        std::size_t relationship_count = 0;
        std::size_t concept_count = 0;
        Duration duration = Duration::zero();
    };

    struct QueryExecutedEvent {
        std::string query_text;
        std::size_t result_count = 0;
        Duration duration = Duration::zero();
        double relevance_score = 0.0;
    };

    class IGraphObserver {
    public:
        virtual ~IGraphObserver() = default;

        virtual void on_graph_built(const GraphBuiltEvent& /*event*/) {}

        virtual void on_query_executed(const QueryExecutedEvent& /*event*/) {}
    };

}  // namespace ckg::engine

#endif //CKG_GRAPH_OBSERVER_HPP
