/**
 * @file FormulaWalker.hpp
 * @brief Bounded depth-first search over symbolic formula graphs
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 *
 * Formulas are externally owned DAGs of unknown depth. The walk uses an
 * explicit work list, visits each distinct node at most once and stops
 * after a hard cap of visited nodes.
 */

#pragma once

#ifndef VIGIL_CONCOLIC_FORMULA_WALKER_HPP
#define VIGIL_CONCOLIC_FORMULA_WALKER_HPP

#include <Vigil/Core/Types.hpp>
#include <z3++.h>
#include <functional>
#include <optional>

namespace Vigil::Concolic {

/**
 * @brief Outcome of a bounded walk
 */
enum class WalkResult : uint8_t {
    Found,       ///< A node satisfied the predicate
    NotFound,    ///< Whole graph visited, no match
    CapReached   ///< Node cap hit before the graph was exhausted
};

using NodePredicate = std::function<bool(const z3::expr&)>;

/**
 * @brief Search `root` for a node satisfying `match`
 * @param nodeCap Maximum number of distinct nodes to visit
 */
[[nodiscard]] WalkResult findNode(const z3::expr& root, const NodePredicate& match,
                                  size_t nodeCap = DEFAULT_FORMULA_NODE_CAP);

/**
 * @brief True if the formula contains a real or integer division node.
 *        Hitting the cap counts as no match.
 */
[[nodiscard]] bool containsDivision(const z3::expr& formula,
                                    size_t nodeCap = DEFAULT_FORMULA_NODE_CAP);

/**
 * @brief Whether the formula mentions an uninterpreted constant
 * @return std::nullopt when the cap was hit before an answer was known
 */
[[nodiscard]] std::optional<bool> containsVariable(const z3::expr& formula,
                                                   size_t nodeCap = DEFAULT_FORMULA_NODE_CAP);

} // namespace Vigil::Concolic

#endif // VIGIL_CONCOLIC_FORMULA_WALKER_HPP
