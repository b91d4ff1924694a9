/**
 * @file FormulaWalker.cpp
 * @brief Bounded formula search
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Concolic/FormulaWalker.hpp>
#include <unordered_set>
#include <vector>

namespace Vigil::Concolic {

WalkResult findNode(const z3::expr& root, const NodePredicate& match, size_t nodeCap) {
    std::vector<z3::expr> workList;
    std::unordered_set<unsigned> seen;
    workList.push_back(root);

    size_t visited = 0;
    while (!workList.empty()) {
        z3::expr node = workList.back();
        workList.pop_back();

        if (!seen.insert(node.id()).second) {
            continue;
        }
        if (++visited > nodeCap) {
            return WalkResult::CapReached;
        }
        if (match(node)) {
            return WalkResult::Found;
        }
        if (node.is_app()) {
            for (unsigned i = 0; i < node.num_args(); ++i) {
                workList.push_back(node.arg(i));
            }
        }
    }
    return WalkResult::NotFound;
}

bool containsDivision(const z3::expr& formula, size_t nodeCap) {
    WalkResult result = findNode(formula, [](const z3::expr& node) {
        if (!node.is_app()) {
            return false;
        }
        Z3_decl_kind kind = node.decl().decl_kind();
        return kind == Z3_OP_DIV || kind == Z3_OP_IDIV;
    }, nodeCap);
    return result == WalkResult::Found;
}

std::optional<bool> containsVariable(const z3::expr& formula, size_t nodeCap) {
    WalkResult result = findNode(formula, [](const z3::expr& node) {
        return node.is_const() && node.decl().decl_kind() == Z3_OP_UNINTERPRETED;
    }, nodeCap);
    switch (result) {
        case WalkResult::Found:      return true;
        case WalkResult::NotFound:   return false;
        case WalkResult::CapReached: return std::nullopt;
    }
    return std::nullopt;
}

} // namespace Vigil::Concolic
