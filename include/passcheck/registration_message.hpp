// registration_message.hpp
#ifndef PASSCHECK_REGISTRATION_MESSAGE_HPP
#define PASSCHECK_REGISTRATION_MESSAGE_HPP

#include <format>      // For std::format (C++20)
#include <string>      // For std::string
#include <string_view> // For std::string_view

#include "passcheck/password.hpp"
#include "passcheck/password_validator.hpp"

namespace passcheck {

/// @brief Builds the message shown to a user after submitting a password at registration.
/// @param password The submitted text.
/// @param valid The validator's verdict for it.
[[nodiscard]] inline auto registration_message(std::string_view password, bool valid) -> std::string {
    if (valid) {
        return std::format("Password {} is valid. Thank you for joining!", password);
    }
    return std::format("Password {} is not valid. Please try again.", password);
}

[[nodiscard]] inline auto registration_message(std::string_view password) -> std::string {
    return registration_message(password, is_valid(password));
}

[[nodiscard]] inline auto registration_message(const Password& password) -> std::string {
    return registration_message(password.str(), password.is_valid());
}

} // namespace passcheck

#endif // PASSCHECK_REGISTRATION_MESSAGE_HPP
