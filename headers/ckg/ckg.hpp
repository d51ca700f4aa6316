#ifndef CKG_CKG_HPP
#define CKG_CKG_HPP

/**
 * @file ckg.hpp
 * @brief Main header for the Code Knowledge Graph library.
 *
 * Includes the core types and the engine. Include specific headers for
 * more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "core/config.hpp"
#include "engine/knowledge_graph_engine.hpp"

#endif //CKG_CKG_HPP
