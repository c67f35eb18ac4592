/**
 * @file PolicyClause.hpp
 * @brief Domain entity for one clause of a policy document.
 */

#pragma once
#include <string>
#include <vector>

namespace controlmapper::domain {

/**
 * @struct PolicyClause
 * @brief A sentence-like unit of policy text to be mapped to controls.
 */
struct PolicyClause {
    std::string policyId;  ///< Source policy (file stem).
    int clauseIndex = 0;   ///< Position within the policy.
    std::string text;
};

using ClauseList = std::vector<PolicyClause>;

} // namespace controlmapper::domain
