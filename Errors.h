#pragma once

#include <stdexcept>
#include <string>

namespace wpa {

// Failures of a single replica evaluation. None of them is retried by the calculator.
class CalculatorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The metric's label selector could not be resolved, nothing was fetched.
class SelectorError : public CalculatorError {
public:
    using CalculatorError::CalculatorError;
};

class MetricsFetchError : public CalculatorError {
public:
    using CalculatorError::CalculatorError;
};

// Zero divisor or a result outside of the replica count range.
class DegenerateArithmeticError : public CalculatorError {
public:
    using CalculatorError::CalculatorError;
};

class QuantityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace wpa
