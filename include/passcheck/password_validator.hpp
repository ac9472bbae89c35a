// password_validator.hpp
#ifndef PASSCHECK_PASSWORD_VALIDATOR_HPP
#define PASSCHECK_PASSWORD_VALIDATOR_HPP

#include <algorithm>   // For std::ranges::all_of
#include <array>       // For std::array
#include <string_view> // For std::string_view

#include "passcheck/constraint_report.hpp"
#include "passcheck/password_constraints.hpp"

namespace passcheck {

/**
 * @brief Decides whether a candidate password may be used to register an account.
 * @intuition A password is accepted only when every registration rule holds; shortfalls
 * such as an empty or too short input are ordinary negative results, never errors.
 * @approach Evaluates the fixed, ordered `PASSWORD_CONSTRAINTS` collection. `is_valid`
 * stops at the first failing rule, `evaluate` runs all of them and keeps the outcomes.
 * @complexity Time: O(N) per constraint, where N is password length. Space: O(1).
 */
class PasswordValidator final {
public:
    using ConstraintSet = std::array<Constraint, PASSWORD_CONSTRAINTS.size()>;

    /// @brief Returns the rules this validator enforces, in evaluation order.
    [[nodiscard]] static constexpr auto constraints() noexcept -> const ConstraintSet& {
        return PASSWORD_CONSTRAINTS;
    }

    /// @brief Returns true only if the password satisfies every constraint.
    /// @param password The candidate password, any text including empty.
    [[nodiscard]] constexpr auto is_valid(std::string_view password) const noexcept -> bool {
        return std::ranges::all_of(constraints(), [password](const Constraint& constraint) {
            return constraint.check(password);
        });
    }

    /// @brief Evaluates every constraint and records each outcome.
    /// @param password The candidate password.
    /// @return A `ConstraintReport` whose `is_valid()` equals `is_valid(password)`.
    [[nodiscard]] constexpr auto evaluate(std::string_view password) const noexcept -> ConstraintReport {
        ConstraintReport report;
        for (std::size_t i{0}; i < constraints().size(); ++i) {
            const auto& constraint = constraints()[i];
            report.results[i] = ConstraintResult{constraint.name, constraint.check(password)};
        }
        return report;
    }
};

/// @brief Free-function form of `PasswordValidator::is_valid`.
[[nodiscard]] constexpr auto is_valid(std::string_view password) noexcept -> bool {
    return PasswordValidator{}.is_valid(password);
}

} // namespace passcheck

#endif // PASSCHECK_PASSWORD_VALIDATOR_HPP
