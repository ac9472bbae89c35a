// password_constraints.hpp
#ifndef PASSCHECK_PASSWORD_CONSTRAINTS_HPP
#define PASSCHECK_PASSWORD_CONSTRAINTS_HPP

#include <algorithm>   // For std::ranges::any_of, std::ranges::count_if
#include <array>       // For std::array
#include <cstddef>     // For std::size_t
#include <string_view> // For std::string_view

namespace passcheck {

/// @brief Minimum number of characters a valid password must contain.
inline constexpr std::size_t MIN_PASSWORD_LENGTH{6};

/// @brief The fixed set of special characters, at least one of which must appear.
inline constexpr std::string_view SPECIAL_CHARACTERS{"!?&%*@"};

/// @brief Locale independent ASCII character classification.
/// @intuition `std::islower` and friends consult the C locale and are not `constexpr`;
/// the registration rules are defined over plain ASCII only.
namespace ascii {

[[nodiscard]] constexpr auto is_lower(char c) noexcept -> bool {
    return c >= 'a' && c <= 'z';
}

[[nodiscard]] constexpr auto is_upper(char c) noexcept -> bool {
    return c >= 'A' && c <= 'Z';
}

[[nodiscard]] constexpr auto is_digit(char c) noexcept -> bool {
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr auto is_special(char c) noexcept -> bool {
    return SPECIAL_CHARACTERS.find(c) != std::string_view::npos;
}

} // namespace ascii

/// @brief Number of characters in UTF-8 text, counting every byte that is not a continuation byte.
/// @complexity Time: O(N). Space: O(1).
[[nodiscard]] constexpr auto character_count(std::string_view text) noexcept -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(text, [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0U) != 0x80U;
    }));
}

/// @brief A single named rule a password has to satisfy.
struct Constraint final {
    std::string_view name;                          ///< Stable identifier used in reports.
    bool (*check)(std::string_view) noexcept;       ///< Pure predicate over the candidate password.
};

/// @brief Checks that the password has at least `MIN_PASSWORD_LENGTH` characters.
/// @intuition Counts characters, not bytes, so a multi-byte UTF-8 character counts once.
/// @complexity Time: O(N). Space: O(1).
[[nodiscard]] constexpr auto has_min_length(std::string_view password) noexcept -> bool {
    return password.length() >= MIN_PASSWORD_LENGTH && character_count(password) >= MIN_PASSWORD_LENGTH;
}

/// @brief Checks that the password contains a lowercase letter (`a`-`z`).
/// @complexity Time: O(N). Space: O(1).
[[nodiscard]] constexpr auto has_lowercase(std::string_view password) noexcept -> bool {
    return std::ranges::any_of(password, ascii::is_lower);
}

/// @brief Checks that the password contains an uppercase letter (`A`-`Z`).
/// @complexity Time: O(N). Space: O(1).
[[nodiscard]] constexpr auto has_uppercase(std::string_view password) noexcept -> bool {
    return std::ranges::any_of(password, ascii::is_upper);
}

/// @brief Checks that the password contains a decimal digit (`0`-`9`).
/// @complexity Time: O(N). Space: O(1).
[[nodiscard]] constexpr auto has_digit(std::string_view password) noexcept -> bool {
    return std::ranges::any_of(password, ascii::is_digit);
}

/// @brief Checks that the password contains one of `SPECIAL_CHARACTERS`.
/// @complexity Time: O(N * S) where S is the size of the special character set. Space: O(1).
[[nodiscard]] constexpr auto has_special_char(std::string_view password) noexcept -> bool {
    return std::ranges::any_of(password, ascii::is_special);
}

/// @brief The registration rules, in evaluation and reporting order.
inline constexpr std::array<Constraint, 5> PASSWORD_CONSTRAINTS{{
    {"min_length", has_min_length},
    {"has_lowercase", has_lowercase},
    {"has_uppercase", has_uppercase},
    {"has_digit", has_digit},
    {"has_special_char", has_special_char},
}};

} // namespace passcheck

#endif // PASSCHECK_PASSWORD_CONSTRAINTS_HPP
