// constraint_report.hpp
#ifndef PASSCHECK_CONSTRAINT_REPORT_HPP
#define PASSCHECK_CONSTRAINT_REPORT_HPP

#include <algorithm>   // For std::ranges::all_of
#include <array>       // For std::array
#include <format>      // For std::format (C++20)
#include <ranges>      // For std::views, std::ranges::to (C++23)
#include <string>      // For std::string
#include <string_view> // For std::string_view
#include <vector>      // For std::vector

#include "passcheck/password_constraints.hpp"

namespace passcheck {

/// @brief Outcome of a single constraint for one candidate password.
struct ConstraintResult final {
    std::string_view name; ///< Name of the evaluated constraint.
    bool satisfied{false}; ///< Whether the password satisfied it.

    constexpr bool operator==(const ConstraintResult&) const noexcept = default;
};

/// @brief Per-constraint outcome of evaluating every rule against one password.
/// @intuition `is_valid` only answers yes or no; the report keeps the individual results
/// for diagnostics without changing that contract.
struct ConstraintReport final {
    std::array<ConstraintResult, PASSWORD_CONSTRAINTS.size()> results{}; ///< In `PASSWORD_CONSTRAINTS` order.

    /// @brief True when every constraint is satisfied.
    /// @complexity Time: O(C). Space: O(1).
    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool {
        return std::ranges::all_of(results, &ConstraintResult::satisfied);
    }

    /// @brief Names of the unsatisfied constraints, in evaluation order.
    /// @complexity Time: O(C). Space: O(C).
    [[nodiscard]] constexpr auto failed_constraints() const -> std::vector<std::string_view> {
        std::vector<std::string_view> failed;
        for (const auto& result : results) {
            if (!result.satisfied) {
                failed.push_back(result.name);
            }
        }
        return failed;
    }

    /// @brief Serializes the report into a single-line JSON object.
    /// @complexity Time: O(C). Space: O(JSON string length).
    [[nodiscard]] auto to_json() const -> std::string {
        // Constraint names are plain identifiers, no escaping is required
        const auto failed_names = failed_constraints()
            | std::views::transform([](std::string_view name) { return std::format(R"("{}")", name); })
            | std::views::join_with(std::string_view{", "})
            | std::ranges::to<std::string>();

        return std::format(R"({{"valid": {}, "failed": [{}]}})", is_valid(), failed_names);
    }
};

} // namespace passcheck

#endif // PASSCHECK_CONSTRAINT_REPORT_HPP
