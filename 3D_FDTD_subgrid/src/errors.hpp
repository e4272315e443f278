// errors.hpp - Fatal error types raised by model setup and the time loop

#pragma once

#include <stdexcept>
#include <string>

// Invalid model: unsupported sub-grid kind, no execution backend, bad geometry.
// Raised before the first time step.
struct ConfigurationError : public std::runtime_error {
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

// NaN/Inf found in a field array while stepping
struct NumericalDivergence : public std::runtime_error {
    explicit NumericalDivergence(const std::string& msg) : std::runtime_error(msg) {}
};
