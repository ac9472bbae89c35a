// passcheck.hpp
#ifndef PASSCHECK_PASSCHECK_HPP
#define PASSCHECK_PASSCHECK_HPP

#include "passcheck/password_constraints.hpp"
#include "passcheck/constraint_report.hpp"
#include "passcheck/password_validator.hpp"
#include "passcheck/password.hpp"
#include "passcheck/registration_message.hpp"
#include "passcheck/command_line.hpp"

#endif // PASSCHECK_PASSCHECK_HPP
