// command_line.hpp
#ifndef PASSCHECK_COMMAND_LINE_HPP
#define PASSCHECK_COMMAND_LINE_HPP

#include <array>       // For std::array
#include <expected>    // For std::expected, std::unexpected (C++23)
#include <format>      // For std::format (C++20)
#include <span>        // For std::span
#include <string>      // For std::string
#include <string_view> // For std::string_view
#include <vector>      // For std::vector

namespace passcheck {

/// @brief Passwords validated by the demo when none are given on the command line.
inline constexpr std::array<std::string_view, 2> DEFAULT_DEMO_PASSWORDS{"PythonR0cks!", "JavaR0cks!"};

/// @brief Settings of one `passcheck_demo` run.
struct DemoOptions final {
    bool print_report{false};          ///< Print the JSON constraint report below each message.
    bool show_help{false};             ///< Print usage and exit.
    std::vector<std::string> passwords; ///< Candidates in command-line order.
};

[[nodiscard]] inline auto usage(std::string_view program) -> std::string {
    return std::format(
        "Usage: {} [--report] [-h|--help] [--] [PASSWORD...]\n"
        "Checks each PASSWORD against the registration rules.\n"
        "Without PASSWORD arguments the built-in examples are checked.\n"
        "\n"
        "  --report    also print which rules each password failed, as JSON\n"
        "  -h, --help  show this message\n"
        "  --          treat every following argument as a password",
        program);
}

/// @brief Parses the demo's arguments, excluding the program name.
/// @return The parsed options, or a message naming the offending argument.
[[nodiscard]] inline auto parse_arguments(std::span<const std::string_view> args)
    -> std::expected<DemoOptions, std::string> {
    DemoOptions options;
    bool options_ended{false};

    for (const auto arg : args) {
        if (options_ended || !arg.starts_with('-') || arg == "-") {
            options.passwords.emplace_back(arg);
        } else if (arg == "--") {
            options_ended = true;
        } else if (arg == "--report") {
            options.print_report = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else {
            return std::unexpected(std::format("unknown option '{}'", arg));
        }
    }

    if (options.passwords.empty()) {
        options.passwords.assign(DEFAULT_DEMO_PASSWORDS.begin(), DEFAULT_DEMO_PASSWORDS.end());
    }
    return options;
}

[[nodiscard]] inline auto parse_arguments(int argc, const char* const* argv)
    -> std::expected<DemoOptions, std::string> {
    const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);
    return parse_arguments(std::span<const std::string_view>{args});
}

} // namespace passcheck

#endif // PASSCHECK_COMMAND_LINE_HPP
