// password.hpp
#ifndef PASSCHECK_PASSWORD_HPP
#define PASSCHECK_PASSWORD_HPP

#include <format>      // For std::formatter (C++20)
#include <ostream>     // For std::ostream
#include <string>      // For std::string
#include <string_view> // For std::string_view
#include <utility>     // For std::move

#include "passcheck/password_validator.hpp"

namespace passcheck {

/**
 * @brief A password value that knows whether it satisfies the registration rules.
 * @intuition Keeps the raw text and the validity check together, so callers pass a
 * `Password` around instead of a bare string plus a separate validator call.
 * @approach Owns an unmodified copy of the text; validity is computed on request.
 */
class Password final {
public:
    explicit Password(std::string text) : text_{std::move(text)} {}

    explicit Password(std::string_view text) : text_{text} {}

    /// @brief A null `text` is held as the empty password.
    explicit Password(const char* text) : text_{text != nullptr ? text : ""} {}

    /// @brief Read-only validity accessor.
    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return PasswordValidator{}.is_valid(text_);
    }

    [[nodiscard]] auto evaluate() const noexcept -> ConstraintReport {
        return PasswordValidator{}.evaluate(text_);
    }

    [[nodiscard]] auto str() const noexcept -> std::string_view { return text_; }

    [[nodiscard]] auto to_string() const -> std::string { return text_; }

    bool operator==(const Password&) const = default;

private:
    std::string text_;
};

inline auto operator<<(std::ostream& os, const Password& password) -> std::ostream& {
    return os << password.str();
}

} // namespace passcheck

/// @brief Formats a `Password` as its raw text, honouring string format specs.
template <>
struct std::formatter<passcheck::Password> : std::formatter<std::string_view> {
    auto format(const passcheck::Password& password, std::format_context& ctx) const {
        return std::formatter<std::string_view>::format(password.str(), ctx);
    }
};

#endif // PASSCHECK_PASSWORD_HPP
