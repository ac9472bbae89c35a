// main.cpp
#include <cstdio>  // For stderr
#include <print>   // For std::println (C++23)

#include "passcheck/command_line.hpp"
#include "passcheck/password.hpp"
#include "passcheck/registration_message.hpp"

auto main(int argc, char** argv) -> int {
    using namespace passcheck;

    const auto program{argc > 0 ? argv[0] : "passcheck_demo"};
    const auto options_expected{parse_arguments(argc, argv)};

    if (!options_expected.has_value()) {
        std::println(stderr, "error: {}", options_expected.error());
        std::println(stderr, "{}", usage(program));
        return 2;
    }

    const auto& options = options_expected.value();
    if (options.show_help) {
        std::println("{}", usage(program));
        return 0;
    }

    for (const auto& text : options.passwords) {
        const Password password{text};
        std::println("{}", registration_message(password));

        if (options.print_report) {
            std::println("  {}", password.evaluate().to_json());
        }
    }

    return 0;
}
