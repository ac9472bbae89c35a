#include "test_helpers.hpp"
#include <passcheck/constraint_report.hpp>
#include <passcheck/password_validator.hpp>
#include <string_view>
#include <vector>

using namespace passcheck;

// ============================================================================
// Test: a valid password satisfies every entry
// ============================================================================

constexpr bool test_report_all_satisfied() {
    const auto report = PasswordValidator{}.evaluate("PythonR0cks!");
    if (!report.is_valid()) return false;
    if (!report.failed_constraints().empty()) return false;
    for (std::size_t i = 0; i < report.results.size(); ++i) {
        if (report.results[i].name != PASSWORD_CONSTRAINTS[i].name) return false;
        if (!report.results[i].satisfied) return false;
    }
    return true;
}
static_assert(test_report_all_satisfied(), "report of a valid password has no failures");

// ============================================================================
// Test: failures are listed in evaluation order, without short-circuit
// ============================================================================

constexpr bool test_report_empty_password() {
    const auto failed = PasswordValidator{}.evaluate("").failed_constraints();
    const std::vector<std::string_view> expected{
        "min_length", "has_lowercase", "has_uppercase", "has_digit", "has_special_char"};
    return failed == expected;
}
static_assert(test_report_empty_password(), "empty password fails every constraint");

constexpr bool test_report_multiple_failures() {
    const auto report = PasswordValidator{}.evaluate("abc");
    const std::vector<std::string_view> expected{
        "min_length", "has_uppercase", "has_digit", "has_special_char"};
    return !report.is_valid() && report.failed_constraints() == expected;
}
static_assert(test_report_multiple_failures(), "all failing constraints are reported in order");

static_assert(TestHelpers::FailsOnly("NoDigits!", "has_digit"), "only the digit rule fails");
static_assert(TestHelpers::FailsOnly("NoSpecial1A", "has_special_char"), "only the special rule fails");
static_assert(TestHelpers::FailsOnly("short1!", "has_uppercase"), "only the uppercase rule fails");

// ============================================================================
// Test: per-entry results
// ============================================================================

constexpr bool test_report_entries() {
    const auto report = PasswordValidator{}.evaluate("ABCDEF");
    return report.results[0] == ConstraintResult{"min_length", true}
        && report.results[1] == ConstraintResult{"has_lowercase", false}
        && report.results[2] == ConstraintResult{"has_uppercase", true}
        && report.results[3] == ConstraintResult{"has_digit", false}
        && report.results[4] == ConstraintResult{"has_special_char", false};
}
static_assert(test_report_entries(), "each entry records its own outcome");

// A default report has no satisfied constraints
static_assert(!ConstraintReport{}.is_valid(), "default report is not valid");
